#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "absl/hash/hash.h"
#include "random.h"

namespace SyncBench {

constexpr size_t kDigestSize = 32;

/**
 * Fixed-length 256-bit content identifier.
 * Immutable once constructed; cheap to copy.
 */
class Digest {
public:
    using Bytes = std::array<uint8_t, kDigestSize>;

    Digest() : bytes_{} {}
    explicit Digest(const Bytes& bytes) : bytes_(bytes) {}

    /**
     * Uniformly random digest, standing in for a freshly written record
     * @param rng Random source owned by the caller
     */
    static Digest Random(Rng& rng);

    /**
     * SHA-256 of arbitrary content
     * @param data Pointer to the content
     * @param len Content length in bytes
     */
    static Digest Of(const uint8_t* data, size_t len);
    static Digest Of(const std::vector<uint8_t>& data) {
        return Of(data.data(), data.size());
    }

    const Bytes& bytes() const { return bytes_; }
    constexpr size_t size() const { return kDigestSize; }

    // Little-endian load of the i-th 64-bit word, i in [0, 4).
    uint64_t Word(size_t i) const;

    std::string ToHex() const;

    friend bool operator==(const Digest& a, const Digest& b) { return a.bytes_ == b.bytes_; }
    friend bool operator!=(const Digest& a, const Digest& b) { return a.bytes_ != b.bytes_; }
    friend bool operator<(const Digest& a, const Digest& b) { return a.bytes_ < b.bytes_; }

    template <typename H>
    friend H AbslHashValue(H h, const Digest& d) {
        return H::combine(std::move(h), d.bytes_);
    }

private:
    Bytes bytes_;
};

} // namespace SyncBench
