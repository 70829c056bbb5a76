#pragma once

#include <cstdint>
#include <random>

namespace SyncBench {

// Every source of randomness in a simulation draws from one explicitly owned
// engine, so a trial is a pure function of its seed.
using Rng = std::mt19937_64;

inline uint64_t SeedFromDevice() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

}  // namespace SyncBench
