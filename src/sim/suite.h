#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include "../common/configuration.h"
#include "trial_aggregator.h"

namespace SyncBench {

struct SuiteOptions {
    TrialOptions trials;
    uint64_t seed = 0;
    bool record_results = false;
    std::string result_dir = "./results/";
};

/**
 * Builds suite options from the loaded configuration.
 * A zero seed is replaced by one drawn from std::random_device.
 */
SuiteOptions SuiteOptionsFromConfig(const SyncBenchConfig& config);

/**
 * Runs warm-up and measured trials of one strategy and prints the summary line
 * @return false if a trial did not converge within its round budget
 */
bool RunSuite(Strategy strategy, const SuiteOptions& options, std::ostream& out = std::cout);

// Same as RunSuite, with the configured defaults for everything but the cluster shape.
bool RunBloomSuite(size_t data_count, size_t net_fact, std::ostream& out = std::cout);
bool RunRehashSuite(size_t data_count, size_t net_fact, std::ostream& out = std::cout);

} // namespace SyncBench
