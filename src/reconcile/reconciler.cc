#include "reconciler.h"

#include <algorithm>
#include <cctype>

#include <glog/logging.h>

#include "digest_reconciler.h"
#include "filter_reconciler.h"

namespace SyncBench {

const char* StrategyName(Strategy strategy) {
    switch (strategy) {
        case Strategy::kBloom:
            return "bloom";
        case Strategy::kRehash:
            return "rehash";
    }
    return "unknown";
}

std::optional<Strategy> ParseStrategy(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "bloom" || lower == "filter") {
        return Strategy::kBloom;
    }
    if (lower == "rehash" || lower == "digest") {
        return Strategy::kRehash;
    }
    return std::nullopt;
}

std::unique_ptr<IReconciler> MakeReconciler(Strategy strategy,
                                            const ReconcilerOptions& options,
                                            Rng& rng) {
    switch (strategy) {
        case Strategy::kBloom:
            return std::make_unique<FilterReconciler>(options, rng);
        case Strategy::kRehash:
            return std::make_unique<DigestReconciler>();
    }
    LOG(FATAL) << "Unhandled strategy " << static_cast<int>(strategy);
    return nullptr;
}

BytesTransferred SyncWithHub(Network& network, IReconciler& reconciler) {
    CHECK_GE(network.size(), 2u) << "Hub exchange needs at least two nodes";

    BytesTransferred byte_tx = 0;

    Node hub = std::move(network.front());
    network.erase(network.begin());
    CHECK(!hub.empty());
    ReplicaSet& hub_replica = hub.front();

    for (auto& node : network) {
        CHECK(!node.empty());
        byte_tx += reconciler.SyncPair(node.front(), hub_replica);
    }

    network.push_back(std::move(hub));

    return byte_tx;
}

} // namespace SyncBench
