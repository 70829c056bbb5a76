#include "filter_reconciler.h"

#include <glog/logging.h>

namespace SyncBench {

FilterReconciler::FilterReconciler(const ReconcilerOptions& options, Rng& rng)
    : options_(options), rng_(rng) {
    if (options_.filter_bits_override == 0) {
        CHECK(options_.fp_rate > 0.0 && options_.fp_rate < 1.0)
            << "Invalid filter fp_rate " << options_.fp_rate;
    }
}

BloomFilter FilterReconciler::MakeFixedFilter() {
    const uint64_t key0 = rng_();
    const uint64_t key1 = rng_();
    return BloomFilter(options_.filter_bits_override, 1, key0, key1);
}

BloomFilter FilterReconciler::BuildFilter(const ReplicaSet& replica) {
    BloomFilter filter = options_.filter_bits_override > 0
        ? MakeFixedFilter()
        : BloomFilter::ForFpRate(replica.size(), options_.fp_rate, rng_);
    for (const auto& d : replica) {
        filter.Insert(d);
    }
    return filter;
}

BytesTransferred FilterReconciler::SyncPair(ReplicaSet& left, ReplicaSet& right) {
    BytesTransferred byte_tx = 0;

    const BloomFilter left_filter = BuildFilter(left);
    const BloomFilter right_filter = BuildFilter(right);

    for (const auto& d : left) {
        if (!right_filter.MayContain(d)) {
            byte_tx += d.size();
            right.insert(d);
            ++items_sent_;
        }
    }

    // Items just forwarded from left are in left_filter, so they are never echoed back.
    for (const auto& d : right) {
        if (!left_filter.MayContain(d)) {
            byte_tx += d.size();
            left.insert(d);
            ++items_sent_;
        }
    }

    byte_tx += left_filter.wire_size();
    byte_tx += right_filter.wire_size();

    return byte_tx;
}

} // namespace SyncBench
