#include "bloom_filter.h"

#include <algorithm>
#include <cmath>

#include <glog/logging.h>

namespace SyncBench {

namespace {

// splitmix64 finalizer
inline uint64_t Mix64(uint64_t x) {
    x ^= x >> 30;
    x *= 0xbf58476d1ce4e5b9ULL;
    x ^= x >> 27;
    x *= 0x94d049bb133111ebULL;
    x ^= x >> 31;
    return x;
}

} // namespace

BloomFilter::BloomFilter(size_t num_bits, uint32_t num_hashes, uint64_t key0, uint64_t key1)
    : bitmap_((std::max<size_t>(num_bits, 1) + 7) / 8, 0),
      num_bits_(bitmap_.size() * 8),
      num_hashes_(std::max<uint32_t>(num_hashes, 1)),
      key0_(key0),
      key1_(key1) {}

size_t BloomFilter::BitmapBytesFor(size_t items, double fp_rate) {
    CHECK(fp_rate > 0.0 && fp_rate < 1.0) << "fp_rate out of range: " << fp_rate;
    const double n = static_cast<double>(std::max<size_t>(items, 1));
    const double ln2_sq = std::log(2.0) * std::log(2.0);
    return static_cast<size_t>(std::ceil(n * std::log(fp_rate) / (-8.0 * ln2_sq)));
}

uint32_t BloomFilter::OptimalNumHashes(size_t num_bits, size_t items) {
    const double m = static_cast<double>(num_bits);
    const double n = static_cast<double>(std::max<size_t>(items, 1));
    const uint32_t k = static_cast<uint32_t>(std::ceil(m / n * std::log(2.0)));
    return std::max<uint32_t>(k, 1);
}

BloomFilter BloomFilter::ForFpRate(size_t expected_items, double fp_rate, Rng& rng) {
    const size_t num_bits = BitmapBytesFor(expected_items, fp_rate) * 8;
    const uint32_t num_hashes = OptimalNumHashes(num_bits, expected_items);
    const uint64_t key0 = rng();
    const uint64_t key1 = rng();
    return BloomFilter(num_bits, num_hashes, key0, key1);
}

void BloomFilter::BaseHashes(const Digest& d, uint64_t* h1, uint64_t* h2) const {
    *h1 = Mix64(d.Word(0) ^ key0_ ^ Mix64(d.Word(1)));
    // Odd step so the probe sequence never collapses onto one bit.
    *h2 = Mix64(d.Word(2) ^ key1_ ^ Mix64(d.Word(3))) | 1;
}

void BloomFilter::Insert(const Digest& d) {
    uint64_t h1, h2;
    BaseHashes(d, &h1, &h2);
    for (uint32_t i = 0; i < num_hashes_; ++i) {
        size_t bit = BitIndex(h1, h2, i);
        bitmap_[bit >> 3] |= static_cast<uint8_t>(1u << (bit & 7));
    }
}

bool BloomFilter::MayContain(const Digest& d) const {
    uint64_t h1, h2;
    BaseHashes(d, &h1, &h2);
    for (uint32_t i = 0; i < num_hashes_; ++i) {
        size_t bit = BitIndex(h1, h2, i);
        if ((bitmap_[bit >> 3] & (1u << (bit & 7))) == 0) {
            return false;
        }
    }
    return true;
}

} // namespace SyncBench
