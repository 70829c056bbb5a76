#include "digest.h"

#include <cstring>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>
#include <openssl/evp.h>

namespace SyncBench {

Digest Digest::Random(Rng& rng) {
    Bytes out;
    for (size_t off = 0; off < kDigestSize; off += sizeof(uint64_t)) {
        uint64_t word = rng();
        memcpy(out.data() + off, &word, sizeof(word));
    }
    return Digest(out);
}

Digest Digest::Of(const uint8_t* data, size_t len) {
    Bytes out;
    unsigned int out_len = 0;
    if (EVP_Digest(data, len, out.data(), &out_len, EVP_sha256(), nullptr) != 1) {
        LOG(FATAL) << "EVP_Digest(sha256) failed on " << len << " bytes";
    }
    CHECK_EQ(out_len, kDigestSize);
    return Digest(out);
}

uint64_t Digest::Word(size_t i) const {
    DCHECK_LT(i, kDigestSize / sizeof(uint64_t));
    uint64_t word = 0;
    for (size_t b = 0; b < sizeof(uint64_t); ++b) {
        word |= static_cast<uint64_t>(bytes_[i * sizeof(uint64_t) + b]) << (8 * b);
    }
    return word;
}

std::string Digest::ToHex() const {
    std::ostringstream ss;
    ss << std::hex << std::setfill('0');
    for (uint8_t b : bytes_) {
        ss << std::setw(2) << static_cast<int>(b);
    }
    return ss.str();
}

} // namespace SyncBench
