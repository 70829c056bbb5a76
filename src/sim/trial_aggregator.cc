#include "trial_aggregator.h"

#include <cstdio>

#include <glog/logging.h>

namespace SyncBench {

namespace {
constexpr double kBytesPerMiB = 1024.0 * 1024.0;
} // namespace

TrialAggregator::TrialAggregator(const TrialOptions& options, uint64_t seed, std::ostream& progress)
    : options_(options), seed_(seed), rng_(seed), progress_(progress) {}

std::optional<RunResult> TrialAggregator::RunTrial(IReconciler& reconciler) {
    ConvergenceRunner runner(options_.runner, reconciler, rng_);
    RunResult result = runner.Run();
    if (result.outcome != RunOutcome::kConverged) {
        LOG(ERROR) << StrategyName(reconciler.strategy()) << " trial ended with "
                   << RunOutcomeName(result.outcome) << " after " << result.rounds << " rounds";
        return std::nullopt;
    }
    VLOG(1) << StrategyName(reconciler.strategy()) << " trial: " << result.rounds << " rounds, "
            << result.bytes_transferred << " bytes, " << result.elapsed.count() << " s";
    return result;
}

std::optional<TrialReport> TrialAggregator::Run(Strategy strategy) {
    const char* name = StrategyName(strategy);
    std::unique_ptr<IReconciler> reconciler = MakeReconciler(strategy, options_.reconciler, rng_);

    progress_ << name << " warmup " << std::flush;
    for (size_t i = 0; i < options_.warmup_trials; ++i) {
        progress_ << "." << std::flush;
        if (!RunTrial(*reconciler)) {
            progress_ << std::endl;
            return std::nullopt;
        }
    }

    std::vector<double> rounds;
    std::vector<double> mib;
    std::vector<double> seconds;
    rounds.reserve(options_.measured_trials);
    mib.reserve(options_.measured_trials);
    seconds.reserve(options_.measured_trials);

    progress_ << name << " test " << std::flush;
    for (size_t i = 0; i < options_.measured_trials; ++i) {
        progress_ << "." << std::flush;
        std::optional<RunResult> result = RunTrial(*reconciler);
        if (!result) {
            progress_ << std::endl;
            return std::nullopt;
        }
        rounds.push_back(static_cast<double>(result->rounds));
        mib.push_back(static_cast<double>(result->bytes_transferred) / kBytesPerMiB);
        seconds.push_back(result->elapsed.count());
    }
    progress_ << "done." << std::endl;

    TrialReport report;
    report.strategy = strategy;
    report.seed = seed_;
    report.rounds = TrialStats::ComputeSummary(rounds);
    report.mib_transferred = TrialStats::ComputeSummary(mib);
    report.seconds = TrialStats::ComputeSummary(seconds);
    LOG(INFO) << name << " finished " << options_.measured_trials << " trials, "
              << reconciler->items_sent() << " items forwarded in total";
    return report;
}

std::string TrialAggregator::FormatSummary(const TrialReport& report) {
    char buf[256];
    snprintf(buf, sizeof(buf),
             "%s iterations: %.1f±%.4f, MiB transferred: %.4f±%.4f in %.4f±%.4f s",
             StrategyName(report.strategy),
             report.rounds.mean, report.rounds.stddev,
             report.mib_transferred.mean, report.mib_transferred.stddev,
             report.seconds.mean, report.seconds.stddev);
    return std::string(buf);
}

} // namespace SyncBench
