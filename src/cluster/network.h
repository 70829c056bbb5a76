#pragma once

#include <cstddef>
#include <vector>

#include "absl/container/flat_hash_set.h"
#include "../common/digest.h"
#include "../common/random.h"

namespace SyncBench {

// One shard's copy of the dataset. Grows only.
using ReplicaSet = absl::flat_hash_set<Digest>;
// Shards co-located on one cluster member.
using Node = std::vector<ReplicaSet>;
// The whole simulated cluster.
using Network = std::vector<Node>;

/**
 * Generation. Every ReplicaSet gets data_count independent random digests,
 * so a fresh Network starts as divergent as possible.
 */
ReplicaSet GenerateReplicaSet(size_t data_count, Rng& rng);
Node GenerateNode(size_t data_count, size_t net_fact, Rng& rng);
Network GenerateNetwork(size_t data_count, size_t net_fact, Rng& rng);

// True iff every ReplicaSet in the node equals the first one.
bool IsNodeConsistent(const Node& node);
// True iff every ReplicaSet in the network equals the first ReplicaSet of the first node.
bool IsNetworkConsistent(const Network& network);

/**
 * Permutes the shards within each node, then the nodes themselves.
 * The reconcilers always talk through slot 0, so this decides who speaks.
 */
void ShuffleNetwork(Network& network, Rng& rng);

ReplicaSet UnionOf(const Node& node);

// Replaces every ReplicaSet of the node with the union of all of them.
void SyncNode(Node& node);
void SyncNetwork(Network& network);

size_t TotalItems(const Network& network);

} // namespace SyncBench
