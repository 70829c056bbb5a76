#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace SyncBench {

// Template specializations for environment variable parsing
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoi(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stoull(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return std::stod(env_val);
        } catch (const std::exception& e) {
            LOG(WARNING) << "Failed to parse env var " << env_var_ << ": " << e.what();
        }
    }
    return std::nullopt;
}

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        return std::string(env_val);
    }
    return std::nullopt;
}

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        std::string val(env_val);
        std::transform(val.begin(), val.end(), val.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (val == "true" || val == "1" || val == "yes" || val == "on") {
            return true;
        } else if (val == "false" || val == "0" || val == "no" || val == "off") {
            return false;
        }
        LOG(WARNING) << "Invalid boolean value for env var " << env_var_ << ": " << env_val;
    }
    return std::nullopt;
}

Configuration& Configuration::getInstance() {
    static Configuration instance;
    return instance;
}

void Configuration::parseRoot(const YAML::Node& root) {
    // Simulation
    if (root["simulation"]) {
        auto sim = root["simulation"];
        if (sim["data_count"]) config_.simulation.data_count.load(sim["data_count"].as<size_t>());
        if (sim["net_fact"]) config_.simulation.net_fact.load(sim["net_fact"].as<size_t>());
        if (sim["seed"]) config_.simulation.seed.load(sim["seed"].as<size_t>());
        if (sim["max_rounds"]) config_.simulation.max_rounds.load(sim["max_rounds"].as<size_t>());
    }

    // Trials
    if (root["trials"]) {
        auto trials = root["trials"];
        if (trials["warmup"]) config_.trials.warmup.load(trials["warmup"].as<int>());
        if (trials["measured"]) config_.trials.measured.load(trials["measured"].as<int>());
    }

    // Filter
    if (root["filter"]) {
        auto filter = root["filter"];
        if (filter["fp_rate"]) config_.filter.fp_rate.load(filter["fp_rate"].as<double>());
    }

    // Output
    if (root["output"]) {
        auto output = root["output"];
        if (output["record_results"]) config_.output.record_results.load(output["record_results"].as<bool>());
        if (output["result_dir"]) config_.output.result_dir.load(output["result_dir"].as<std::string>());
    }
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        if (yaml["syncbench"]) {
            parseRoot(yaml["syncbench"]);
        } else {
            LOG(WARNING) << "No 'syncbench' section in " << filename << ", using defaults";
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file: " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        if (yaml["syncbench"]) {
            parseRoot(yaml["syncbench"]);
        }
        return validate();
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

void Configuration::reset() {
    config_.simulation.data_count.reset();
    config_.simulation.net_fact.reset();
    config_.simulation.seed.reset();
    config_.simulation.max_rounds.reset();
    config_.trials.warmup.reset();
    config_.trials.measured.reset();
    config_.filter.fp_rate.reset();
    config_.output.record_results.reset();
    config_.output.result_dir.reset();
    validation_errors_.clear();
}

bool Configuration::validate() const {
    validation_errors_.clear();

    if (config_.simulation.data_count.get() < 1) {
        validation_errors_.push_back("data_count must be at least 1");
    }

    // A single node is trivially consistent; there is nothing to measure.
    if (config_.simulation.net_fact.get() < 2) {
        validation_errors_.push_back("net_fact must be at least 2");
    }

    double fp_rate = config_.filter.fp_rate.get();
    if (!(fp_rate > 0.0 && fp_rate < 1.0)) {
        validation_errors_.push_back("Filter false-positive rate must be in (0, 1)");
    }

    if (config_.trials.warmup.get() < 0) {
        validation_errors_.push_back("Warm-up trial count cannot be negative");
    }

    if (config_.trials.measured.get() < 1) {
        validation_errors_.push_back("Measured trial count must be at least 1");
    }

    if (config_.output.record_results.get() && config_.output.result_dir.get().empty()) {
        validation_errors_.push_back("result_dir must be set when recording results");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace SyncBench
