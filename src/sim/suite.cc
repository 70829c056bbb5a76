#include "suite.h"

#include <glog/logging.h>

#include "../common/random.h"
#include "result_writer.h"

namespace SyncBench {

SuiteOptions SuiteOptionsFromConfig(const SyncBenchConfig& config) {
    SuiteOptions options;
    options.trials.runner.data_count = config.simulation.data_count.get();
    options.trials.runner.net_fact = config.simulation.net_fact.get();
    options.trials.runner.max_rounds = config.simulation.max_rounds.get();
    options.trials.reconciler.fp_rate = config.filter.fp_rate.get();
    options.trials.warmup_trials = static_cast<size_t>(config.trials.warmup.get());
    options.trials.measured_trials = static_cast<size_t>(config.trials.measured.get());
    options.record_results = config.output.record_results.get();
    options.result_dir = config.output.result_dir.get();

    options.seed = config.simulation.seed.get();
    if (options.seed == 0) {
        options.seed = SeedFromDevice();
        LOG(INFO) << "No seed configured, using " << options.seed;
    }
    return options;
}

bool RunSuite(Strategy strategy, const SuiteOptions& options, std::ostream& out) {
    const RunnerOptions& runner = options.trials.runner;
    out << "running with " << runner.data_count << " ops / "
        << runner.net_fact << "x" << runner.net_fact << " nodes" << std::endl;

    ResultWriter writer(options.trials, options.record_results, options.result_dir);
    TrialAggregator aggregator(options.trials, options.seed, out);

    std::optional<TrialReport> report = aggregator.Run(strategy);
    if (!report) {
        LOG(ERROR) << StrategyName(strategy) << " suite aborted, no statistics recorded (seed "
                   << options.seed << ")";
        return false;
    }

    out << TrialAggregator::FormatSummary(*report) << std::endl;
    writer.SetReport(*report);
    return true;
}

namespace {

bool RunWithConfiguredDefaults(Strategy strategy, size_t data_count, size_t net_fact,
                               std::ostream& out) {
    SuiteOptions options = SuiteOptionsFromConfig(Configuration::getInstance().config());
    options.trials.runner.data_count = data_count;
    options.trials.runner.net_fact = net_fact;
    return RunSuite(strategy, options, out);
}

} // namespace

bool RunBloomSuite(size_t data_count, size_t net_fact, std::ostream& out) {
    return RunWithConfiguredDefaults(Strategy::kBloom, data_count, net_fact, out);
}

bool RunRehashSuite(size_t data_count, size_t net_fact, std::ostream& out) {
    return RunWithConfiguredDefaults(Strategy::kRehash, data_count, net_fact, out);
}

} // namespace SyncBench
