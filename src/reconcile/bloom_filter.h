#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../common/digest.h"
#include "../common/random.h"

namespace SyncBench {

/**
 * Approximate-membership filter over digests.
 * No false negatives; the false-positive rate is set by the sizing.
 */
class BloomFilter {
public:
    // What a peer needs besides the bitmap: bitmap length (8), hash count (4), two 128-bit hash keys (32).
    static constexpr size_t kWireOverheadBytes = 8 + 4 + (8 * 4);

    BloomFilter(size_t num_bits, uint32_t num_hashes, uint64_t key0, uint64_t key1);

    /**
     * Sizes a filter for expected_items entries at the target false-positive rate
     * @param expected_items Number of items that will be inserted (0 is treated as 1)
     * @param fp_rate Target false-positive probability in (0, 1)
     * @param rng Source of the per-filter hash keys
     */
    static BloomFilter ForFpRate(size_t expected_items, double fp_rate, Rng& rng);

    // Bitmap size in bytes for the given load and rate.
    static size_t BitmapBytesFor(size_t items, double fp_rate);
    static uint32_t OptimalNumHashes(size_t num_bits, size_t items);

    void Insert(const Digest& d);
    bool MayContain(const Digest& d) const;

    size_t num_bits() const { return num_bits_; }
    uint32_t num_hashes() const { return num_hashes_; }
    size_t bitmap_bytes() const { return bitmap_.size(); }
    size_t wire_size() const { return kWireOverheadBytes + bitmap_bytes(); }

private:
    size_t BitIndex(uint64_t h1, uint64_t h2, uint32_t i) const {
        return static_cast<size_t>((h1 + static_cast<uint64_t>(i) * h2) % num_bits_);
    }
    void BaseHashes(const Digest& d, uint64_t* h1, uint64_t* h2) const;

    std::vector<uint8_t> bitmap_;
    size_t num_bits_;
    uint32_t num_hashes_;
    uint64_t key0_;
    uint64_t key1_;
};

} // namespace SyncBench
