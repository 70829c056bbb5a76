#include <cstdlib>
#include <iostream>

#include <glog/logging.h>

#include "cli/command_line.h"
#include "common/configuration.h"
#include "common/random.h"
#include "sim/suite.h"

using namespace SyncBench;

int main(int argc, char* argv[]) {
    // Initialize logging
    google::InitGoogleLogging(argv[0]);
    google::InstallFailureSignalHandler();
    FLAGS_logtostderr = 1; // log only to console, no files.

    Configuration& config = Configuration::getInstance();
    CommandLine cmd = ParseCommandLine(argc, argv, config);
    if (cmd.status == ParseStatus::kHelp) {
        std::cout << cmd.help << std::endl;
        return 0;
    }
    if (cmd.status == ParseStatus::kError) {
        std::cerr << cmd.help << std::endl;
        return 1;
    }
    FLAGS_v = cmd.log_level;

    // Validate final configuration
    if (!config.validate()) {
        LOG(ERROR) << "Configuration validation failed";
        for (const auto& error : config.getValidationErrors()) {
            LOG(ERROR) << "Validation error: " << error;
        }
        return 1;
    }

    // Resolve the seed once so both strategies share it
    SyncBenchConfig& cfg = config.config();
    if (cfg.simulation.seed.get() == 0) {
        cfg.simulation.seed.set(SeedFromDevice());
    }
    const size_t data_count = cfg.simulation.data_count.get();
    const size_t net_fact = cfg.simulation.net_fact.get();
    LOG(INFO) << "data_count=" << data_count
              << " net_fact=" << net_fact
              << " seed=" << cfg.simulation.seed.get()
              << " max_rounds=" << cfg.simulation.max_rounds.get();

    for (Strategy strategy : cmd.strategies) {
        bool ok = strategy == Strategy::kBloom ? RunBloomSuite(data_count, net_fact)
                                               : RunRehashSuite(data_count, net_fact);
        if (!ok) {
            return 2;
        }
    }
    return 0;
}
