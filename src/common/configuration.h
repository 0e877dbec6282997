#ifndef CADENCE_CONFIGURATION_H_
#define CADENCE_CONFIGURATION_H_

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

#include "config.h"

namespace YAML {
class Node;
}

namespace cxxopts {
class ParseResult;
}

namespace Cadence {

struct RunConfig;

/**
 * Configuration value that can be overridden by environment variables.
 * A value set with pin() wins over the environment.
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), default_(default_value), env_var_(env_var) {}

    T get() const {
        if (!pinned_ && !env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    // Command-line values: highest precedence
    void pin(T value) { value_ = value; pinned_ = true; }
    void reset() { value_ = default_; pinned_ = false; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    T default_;
    std::string env_var_;
    bool pinned_ = false;

    std::optional<T> getEnvValue() const;
};

/**
 * Main configuration structure
 */
struct CadenceConfig {
    struct Run {
        ConfigValue<double> target_rate{kDefaultTargetRate, "CADENCE_TARGET_RATE"};
        // Alternative to target_rate; wins when positive
        ConfigValue<int64_t> interval_us{0, "CADENCE_INTERVAL_US"};
        ConfigValue<double> duration_s{static_cast<double>(kDefaultDurationSec), "CADENCE_DURATION_S"};
        ConfigValue<size_t> total_count{0, "CADENCE_TOTAL_COUNT"};
        ConfigValue<size_t> max_in_flight{static_cast<size_t>(kDefaultMaxInFlight), "CADENCE_MAX_IN_FLIGHT"};
        ConfigValue<int64_t> timeout_ms{kDefaultTimeoutMs, "CADENCE_TIMEOUT_MS"};
        ConfigValue<std::string> arrival_distribution{"constant", "CADENCE_ARRIVAL_DISTRIBUTION"};
        ConfigValue<std::string> load_shedding{"queue", "CADENCE_LOAD_SHEDDING"};
        ConfigValue<std::string> dispatch_model{"open_loop", "CADENCE_DISPATCH_MODEL"};
        ConfigValue<size_t> connections{static_cast<size_t>(kDefaultConnections), "CADENCE_CONNECTIONS"};
        ConfigValue<std::string> correction_mode{"none", "CADENCE_CORRECTION_MODE"};
        // 0 derives the interval from the rate
        ConfigValue<int64_t> expected_interval_us{0, "CADENCE_EXPECTED_INTERVAL_US"};
        ConfigValue<int64_t> grace_ms{kDefaultGraceMs, "CADENCE_GRACE_MS"};
        ConfigValue<int64_t> drift_tolerance_us{kDefaultDriftToleranceUs, "CADENCE_DRIFT_TOLERANCE_US"};
        ConfigValue<size_t> seed{0, "CADENCE_SEED"};
    } run;

    // Values in microseconds
    struct Histogram {
        ConfigValue<int64_t> lowest_trackable_us{kDefaultLowestTrackableUs, "CADENCE_LOWEST_TRACKABLE_US"};
        ConfigValue<int64_t> highest_trackable_us{kDefaultHighestTrackableUs, "CADENCE_HIGHEST_TRACKABLE_US"};
        ConfigValue<int> precision_digits{kDefaultPrecisionDigits, "CADENCE_PRECISION_DIGITS"};
        ConfigValue<bool> strict_range{false, "CADENCE_STRICT_RANGE"};
    } histogram;

    struct Report {
        ConfigValue<bool> record_results{false, "CADENCE_RECORD_RESULTS"};
        ConfigValue<std::string> result_dir{"./data/", "CADENCE_DATA_DIR"};
        ConfigValue<bool> percentile_distribution{false, "CADENCE_PERCENTILE_DISTRIBUTION"};
    } report;
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

    // Override with flags the user actually passed
    void overrideFromCommandLine(const cxxopts::ParseResult& result);

    // Back to built-in defaults, dropping file and command-line values
    void resetToDefaults();

    // Get the configuration
    const CadenceConfig& config() const { return config_; }
    CadenceConfig& config() { return config_; }

    // Helper methods for common access patterns
    double getTargetRate() const;
    bool recordResults() const { return config_.report.record_results.get(); }
    std::string getResultDir() const { return config_.report.result_dir.get(); }

    /**
     * Builds the engine configuration.
     * Throws ConfigurationError listing every validation error.
     */
    RunConfig toRunConfig() const;

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    CadenceConfig config_;
    mutable std::vector<std::string> validation_errors_;

    bool applyYAML(const YAML::Node& yaml);
    // Conversion without validation; appends name parse errors
    RunConfig buildRunConfig(std::vector<std::string>* errors) const;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const;

template<>
std::optional<size_t> ConfigValue<size_t>::getEnvValue() const;

template<>
std::optional<double> ConfigValue<double>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

} // namespace Cadence

#endif // CADENCE_CONFIGURATION_H_
