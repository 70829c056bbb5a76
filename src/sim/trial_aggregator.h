#pragma once

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "../common/random.h"
#include "../reconcile/reconciler.h"
#include "convergence_runner.h"
#include "trial_stats.h"

namespace SyncBench {

struct TrialOptions {
    RunnerOptions runner;
    ReconcilerOptions reconciler;
    size_t warmup_trials = 3;
    size_t measured_trials = 20;
};

struct TrialReport {
    Strategy strategy = Strategy::kBloom;
    uint64_t seed = 0;
    TrialStats::Summary rounds;
    TrialStats::Summary mib_transferred;
    TrialStats::Summary seconds;
};

/**
 * Runs warm-up trials (discarded) and measured trials of one strategy and
 * aggregates rounds, MiB transferred and elapsed seconds.
 */
class TrialAggregator {
public:
    /**
     * @param options Trial counts and per-trial parameters
     * @param seed Seed for the aggregator's random source
     * @param progress Sink for the progress dots
     */
    TrialAggregator(const TrialOptions& options, uint64_t seed, std::ostream& progress = std::cout);

    /**
     * Runs all trials of one strategy
     * @return Report, or std::nullopt if any trial exhausted its round budget
     */
    std::optional<TrialReport> Run(Strategy strategy);

    static std::string FormatSummary(const TrialReport& report);

private:
    std::optional<RunResult> RunTrial(IReconciler& reconciler);

    TrialOptions options_;
    uint64_t seed_;
    Rng rng_;
    std::ostream& progress_;
};

} // namespace SyncBench
