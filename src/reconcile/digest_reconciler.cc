#include "digest_reconciler.h"

#include <algorithm>
#include <vector>

namespace SyncBench {

Digest DigestReconciler::AggregateDigest(const ReplicaSet& replica) {
    std::vector<Digest> members(replica.begin(), replica.end());
    std::sort(members.begin(), members.end());

    std::vector<uint8_t> concat;
    concat.reserve(members.size() * kDigestSize);
    for (const auto& d : members) {
        concat.insert(concat.end(), d.bytes().begin(), d.bytes().end());
    }
    return Digest::Of(concat);
}

BytesTransferred DigestReconciler::SyncPair(ReplicaSet& left, ReplicaSet& right) {
    BytesTransferred byte_tx = kComparisonBytes;

    if (AggregateDigest(left) == AggregateDigest(right)) {
        return byte_tx;
    }

    // left sends its whole list
    byte_tx += left.size() * kDigestSize;

    // right requests what it lacks
    for (const auto& d : left) {
        if (!right.contains(d)) {
            byte_tx += d.size();
            right.insert(d);
            ++items_sent_;
        }
    }

    // right forwards what left lacks
    for (const auto& d : right) {
        if (!left.contains(d)) {
            byte_tx += d.size();
            left.insert(d);
            ++items_sent_;
        }
    }

    return byte_tx;
}

} // namespace SyncBench
