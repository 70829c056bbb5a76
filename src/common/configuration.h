#ifndef SYNCBENCH_CONFIGURATION_H_
#define SYNCBENCH_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

namespace YAML {
class Node;
}

namespace SyncBench {

/**
 * Configuration value that can be overridden by environment variables.
 * Precedence, lowest first: default, load() (YAML), environment, set().
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), default_(default_value), env_var_(env_var) {}

    T get() const {
        if (explicit_) {
            return value_;
        }
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    // Value from a config file; the environment still wins over it
    void load(T value) { value_ = value; }

    // Explicit override, e.g. from the command line
    void set(T value) {
        value_ = value;
        explicit_ = true;
    }
    void reset() {
        value_ = default_;
        explicit_ = false;
    }
    bool is_explicit() const { return explicit_; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    T default_;
    std::string env_var_;
    bool explicit_ = false;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct SyncBenchConfig {
    // Shape of the simulated cluster and the convergence loop
    struct Simulation {
        ConfigValue<size_t> data_count{100, "SYNCBENCH_DATA_COUNT"};
        ConfigValue<size_t> net_fact{10, "SYNCBENCH_NET_FACT"};
        // 0 draws a seed from std::random_device
        ConfigValue<size_t> seed{0, "SYNCBENCH_SEED"};
        // 0 disables the ceiling
        ConfigValue<size_t> max_rounds{1000, "SYNCBENCH_MAX_ROUNDS"};
    } simulation;

    struct Trials {
        ConfigValue<int> warmup{3, "SYNCBENCH_WARMUP_TRIALS"};
        ConfigValue<int> measured{20, "SYNCBENCH_MEASURED_TRIALS"};
    } trials;

    struct Filter {
        // 1% pretty much guarantees full sync after two exchanges; 0.1% costs ~2x the bitmap.
        ConfigValue<double> fp_rate{0.01, "SYNCBENCH_FILTER_FP_RATE"};
    } filter;

    struct Output {
        ConfigValue<bool> record_results{false, "SYNCBENCH_RECORD_RESULTS"};
        ConfigValue<std::string> result_dir{"./results/", "SYNCBENCH_RESULT_DIR"};
    } output;
};

/**
 * Configuration manager singleton
 */
class Configuration {
public:
    static Configuration& getInstance();

    // Load configuration from file
    bool loadFromFile(const std::string& filename);

    // Load configuration from YAML string
    bool loadFromString(const std::string& yaml_content);

    // Get the configuration
    const SyncBenchConfig& config() const { return config_; }
    SyncBenchConfig& config() { return config_; }

    // Restore every value to its compiled-in default
    void reset();

    // Helper methods for common access patterns
    size_t getDataCount() const { return config_.simulation.data_count.get(); }
    size_t getNetFact() const { return config_.simulation.net_fact.get(); }
    size_t getMaxRounds() const { return config_.simulation.max_rounds.get(); }
    double getFilterFpRate() const { return config_.filter.fp_rate.get(); }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SyncBenchConfig config_;
    mutable std::vector<std::string> validation_errors_;

    void parseRoot(const YAML::Node& root);
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace SyncBench

#endif // SYNCBENCH_CONFIGURATION_H_
