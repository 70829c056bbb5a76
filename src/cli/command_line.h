#pragma once

#include <string>
#include <vector>

#include "../common/configuration.h"
#include "../reconcile/reconciler.h"

namespace SyncBench {

enum class ParseStatus {
    kRun,
    kHelp,
    kError,
};

struct CommandLine {
    ParseStatus status = ParseStatus::kError;
    std::vector<Strategy> strategies;
    int log_level = 0;
    std::string help;
};

/**
 * Parses `syncbench <data_count> <net_fact> [flags]` and applies the flags to
 * the configuration as explicit overrides. A --config file is loaded first, so
 * flags win over it.
 */
CommandLine ParseCommandLine(int argc, const char* const* argv, Configuration& config);

} // namespace SyncBench
