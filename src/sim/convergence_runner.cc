#include "convergence_runner.h"

#include <glog/logging.h>

namespace SyncBench {

const char* RunOutcomeName(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::kConverged:
            return "converged";
        case RunOutcome::kRoundLimitExceeded:
            return "round_limit_exceeded";
    }
    return "unknown";
}

ConvergenceRunner::ConvergenceRunner(const RunnerOptions& options, IReconciler& reconciler, Rng& rng)
    : options_(options), reconciler_(reconciler), rng_(rng) {}

RunResult ConvergenceRunner::Run() {
    Network network = GenerateNetwork(options_.data_count, options_.net_fact, rng_);
    return Converge(network);
}

void ConvergenceRunner::ConsolidateNodes(Network& network) {
    // A freshly generated network has to start out divergent, otherwise there is nothing to measure.
    CHECK(!IsNetworkConsistent(network)) << "Generated network is already consistent";

    for (auto& node : network) {
        CHECK(!IsNodeConsistent(node)) << "Generated node is already consistent";
        SyncNode(node);
        CHECK(IsNodeConsistent(node)) << "Node still inconsistent after consolidation";
    }

    CHECK(!IsNetworkConsistent(network)) << "Node consolidation alone made the network consistent";
    state_ = State::kNodesConsolidated;
}

BytesTransferred ConvergenceRunner::RunRound(Network& network) {
    ShuffleNetwork(network, rng_);
    BytesTransferred byte_tx = SyncWithHub(network, reconciler_);
    SyncNetwork(network);
    return byte_tx;
}

RunResult ConvergenceRunner::Converge(Network& network) {
    state_ = State::kGenerated;
    ConsolidateNodes(network);

    RunResult result;
    auto start = std::chrono::steady_clock::now();

    state_ = State::kRound;
    while (true) {
        if (options_.max_rounds > 0 && result.rounds >= options_.max_rounds) {
            state_ = State::kRoundLimitExceeded;
            result.outcome = RunOutcome::kRoundLimitExceeded;
            LOG(WARNING) << StrategyName(reconciler_.strategy()) << " did not converge within "
                         << options_.max_rounds << " rounds";
            break;
        }

        ++result.rounds;
        BytesTransferred byte_tx = RunRound(network);
        result.bytes_transferred += byte_tx;
        VLOG(2) << StrategyName(reconciler_.strategy()) << " round " << result.rounds
                << ": " << byte_tx << " bytes, " << network.front().front().size() << " items at hub";

        if (IsNetworkConsistent(network)) {
            state_ = State::kConverged;
            result.outcome = RunOutcome::kConverged;
            break;
        }
    }

    result.elapsed = std::chrono::steady_clock::now() - start;
    return result;
}

} // namespace SyncBench
