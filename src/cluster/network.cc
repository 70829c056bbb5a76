#include "network.h"

#include <algorithm>

#include <glog/logging.h>

namespace SyncBench {

ReplicaSet GenerateReplicaSet(size_t data_count, Rng& rng) {
    ReplicaSet out;
    out.reserve(data_count);
    for (size_t i = 0; i < data_count; ++i) {
        out.insert(Digest::Random(rng));
    }
    return out;
}

Node GenerateNode(size_t data_count, size_t net_fact, Rng& rng) {
    Node out;
    out.reserve(net_fact);
    for (size_t i = 0; i < net_fact; ++i) {
        out.push_back(GenerateReplicaSet(data_count, rng));
    }
    return out;
}

Network GenerateNetwork(size_t data_count, size_t net_fact, Rng& rng) {
    Network out;
    out.reserve(net_fact);
    for (size_t i = 0; i < net_fact; ++i) {
        out.push_back(GenerateNode(data_count, net_fact, rng));
    }
    return out;
}

bool IsNodeConsistent(const Node& node) {
    CHECK(!node.empty()) << "Consistency check on an empty node";
    const ReplicaSet& first = node.front();
    for (const auto& replica : node) {
        if (replica != first) {
            return false;
        }
    }
    return true;
}

bool IsNetworkConsistent(const Network& network) {
    CHECK(!network.empty() && !network.front().empty())
        << "Consistency check on an empty network";
    const ReplicaSet& first = network.front().front();
    for (const auto& node : network) {
        for (const auto& replica : node) {
            if (replica != first) {
                return false;
            }
        }
    }
    return true;
}

void ShuffleNetwork(Network& network, Rng& rng) {
    for (auto& node : network) {
        std::shuffle(node.begin(), node.end(), rng);
    }
    std::shuffle(network.begin(), network.end(), rng);
}

ReplicaSet UnionOf(const Node& node) {
    ReplicaSet merged;
    for (const auto& replica : node) {
        merged.insert(replica.begin(), replica.end());
    }
    return merged;
}

void SyncNode(Node& node) {
    if (node.empty()) {
        return;
    }
    ReplicaSet merged = UnionOf(node);
    for (size_t i = 0; i + 1 < node.size(); ++i) {
        node[i] = merged;
    }
    node.back() = std::move(merged);
}

void SyncNetwork(Network& network) {
    for (auto& node : network) {
        SyncNode(node);
    }
}

size_t TotalItems(const Network& network) {
    size_t total = 0;
    for (const auto& node : network) {
        for (const auto& replica : node) {
            total += replica.size();
        }
    }
    return total;
}

} // namespace SyncBench
