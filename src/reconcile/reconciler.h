#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "../cluster/network.h"
#include "../common/random.h"

namespace SyncBench {

using BytesTransferred = size_t;

enum class Strategy {
    kBloom,   // Bloom filter exchange
    kRehash,  // aggregate digest, full list on mismatch
};

const char* StrategyName(Strategy strategy);
std::optional<Strategy> ParseStrategy(const std::string& name);

struct ReconcilerOptions {
    double fp_rate = 0.01;
    // Non-zero forces every filter to this many bits with a single hash.
    size_t filter_bits_override = 0;
};

/**
 * Interface for inter-node set reconciliation
 */
class IReconciler {
public:
    virtual ~IReconciler() = default;

    virtual Strategy strategy() const = 0;

    /**
     * Exchanges missing items between two replicas. Never removes an item.
     * @param left Replica of the spoke node
     * @param right Replica of the hub node
     * @return Bytes that crossed the simulated wire
     */
    virtual BytesTransferred SyncPair(ReplicaSet& left, ReplicaSet& right) = 0;

    // Items inserted on either side since construction.
    virtual size_t items_sent() const = 0;
};

std::unique_ptr<IReconciler> MakeReconciler(Strategy strategy,
                                            const ReconcilerOptions& options,
                                            Rng& rng);

/**
 * Star exchange for one round. The first node is detached as hub; every other
 * node's first replica is reconciled against the hub's first replica, then the
 * hub is appended at the end.
 * @return Sum of bytes over all pairs
 */
BytesTransferred SyncWithHub(Network& network, IReconciler& reconciler);

} // namespace SyncBench
