#pragma once

#include <chrono>
#include <cstddef>

#include "../cluster/network.h"
#include "../common/random.h"
#include "../reconcile/reconciler.h"

namespace SyncBench {

struct RunnerOptions {
    size_t data_count = 100;
    size_t net_fact = 10;
    // 0 lets the loop run until convergence, however long that takes.
    size_t max_rounds = 1000;
};

enum class RunOutcome {
    kConverged,
    kRoundLimitExceeded,
};

struct RunResult {
    RunOutcome outcome = RunOutcome::kConverged;
    size_t rounds = 0;
    BytesTransferred bytes_transferred = 0;
    std::chrono::duration<double> elapsed{0};
};

/**
 * Drives one trial: generate, consolidate every node, then repeat
 * {shuffle, hub exchange, consolidate} until the network is consistent.
 */
class ConvergenceRunner {
public:
    enum class State {
        kGenerated,
        kNodesConsolidated,
        kRound,
        kConverged,
        kRoundLimitExceeded,
    };

    ConvergenceRunner(const RunnerOptions& options, IReconciler& reconciler, Rng& rng);

    // Generates a fresh network and converges it.
    RunResult Run();

    /**
     * Converges a freshly generated network in place.
     * Aborts if the network or any node is already consistent.
     */
    RunResult Converge(Network& network);

    State state() const { return state_; }

private:
    void ConsolidateNodes(Network& network);
    BytesTransferred RunRound(Network& network);

    RunnerOptions options_;
    IReconciler& reconciler_;
    Rng& rng_;
    State state_ = State::kGenerated;
};

const char* RunOutcomeName(RunOutcome outcome);

} // namespace SyncBench
