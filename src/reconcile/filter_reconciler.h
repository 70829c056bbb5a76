#pragma once

#include "bloom_filter.h"
#include "reconciler.h"

namespace SyncBench {

/**
 * Each side ships a Bloom filter of its replica; the peer forwards every item
 * the filter does not recognize. A false positive only postpones an item to a
 * later round.
 */
class FilterReconciler : public IReconciler {
public:
    FilterReconciler(const ReconcilerOptions& options, Rng& rng);

    Strategy strategy() const override { return Strategy::kBloom; }
    BytesTransferred SyncPair(ReplicaSet& left, ReplicaSet& right) override;
    size_t items_sent() const override { return items_sent_; }

    BloomFilter BuildFilter(const ReplicaSet& replica);

private:
    BloomFilter MakeFixedFilter();

    ReconcilerOptions options_;
    Rng& rng_;
    size_t items_sent_ = 0;
};

} // namespace SyncBench
