#include "command_line.h"

#include <exception>
#include <optional>

#include <cxxopts.hpp>
#include <glog/logging.h>

namespace SyncBench {

CommandLine ParseCommandLine(int argc, const char* const* argv, Configuration& config) {
    CommandLine cmd;

    cxxopts::Options options("syncbench", "Anti-entropy reconciliation benchmark (Bloom filter vs. aggregate digest)");
    options.positional_help("<data_count> <net_fact>");

    options.add_options()
        ("data_count", "Items seeded per replica", cxxopts::value<size_t>())
        ("net_fact", "Number of nodes, and of replicas per node", cxxopts::value<size_t>())
        ("s,strategy", "Strategy to run: bloom, rehash or all", cxxopts::value<std::string>()->default_value("all"))
        ("seed", "Seed for the random source (0 draws one)", cxxopts::value<size_t>())
        ("max_rounds", "Round ceiling per trial (0 disables it)", cxxopts::value<size_t>())
        ("warmup", "Discarded warm-up trials", cxxopts::value<int>())
        ("trials", "Measured trials", cxxopts::value<int>())
        ("fp_rate", "Bloom filter false-positive target", cxxopts::value<double>())
        ("c,config", "YAML configuration file", cxxopts::value<std::string>())
        ("l,log_level", "Log level", cxxopts::value<int>()->default_value("0"))
        ("record_results", "Record results in a csv file")
        ("h,help", "Print usage");
    options.parse_positional({"data_count", "net_fact"});
    cmd.help = options.help();

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            cmd.status = ParseStatus::kHelp;
            return cmd;
        }

        if (!result.unmatched().empty()) {
            LOG(ERROR) << "Expected exactly two positional arguments, got extra: " << result.unmatched().front();
            return cmd;
        }

        cmd.log_level = result["log_level"].as<int>();

        if (result.count("config") && !config.loadFromFile(result["config"].as<std::string>())) {
            LOG(ERROR) << "Failed to load configuration file " << result["config"].as<std::string>();
            for (const auto& error : config.getValidationErrors()) {
                LOG(ERROR) << "Config validation error: " << error;
            }
            return cmd;
        }

        if (!result.count("data_count") || !result.count("net_fact")) {
            LOG(ERROR) << "Both <data_count> and <net_fact> are required";
            return cmd;
        }

        // Override with command line arguments
        SyncBenchConfig& cfg = config.config();
        cfg.simulation.data_count.set(result["data_count"].as<size_t>());
        cfg.simulation.net_fact.set(result["net_fact"].as<size_t>());
        if (result.count("seed")) cfg.simulation.seed.set(result["seed"].as<size_t>());
        if (result.count("max_rounds")) cfg.simulation.max_rounds.set(result["max_rounds"].as<size_t>());
        if (result.count("warmup")) cfg.trials.warmup.set(result["warmup"].as<int>());
        if (result.count("trials")) cfg.trials.measured.set(result["trials"].as<int>());
        if (result.count("fp_rate")) cfg.filter.fp_rate.set(result["fp_rate"].as<double>());
        if (result.count("record_results")) cfg.output.record_results.set(true);

        std::string which = result["strategy"].as<std::string>();
        if (which == "all") {
            cmd.strategies = {Strategy::kBloom, Strategy::kRehash};
        } else {
            std::optional<Strategy> strategy = ParseStrategy(which);
            if (!strategy) {
                LOG(ERROR) << "Unknown strategy: " << which;
                return cmd;
            }
            cmd.strategies = {*strategy};
        }
    } catch (const std::exception& e) {
        LOG(ERROR) << "Invalid arguments: " << e.what();
        return cmd;
    }

    cmd.status = ParseStatus::kRun;
    return cmd;
}

} // namespace SyncBench
