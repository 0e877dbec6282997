#include "configuration.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

#include "errors.h"
#include "../engine/load_engine.h"

namespace Cadence {

namespace {

template<typename T>
void readValue(const YAML::Node& section, const char* key, ConfigValue<T>& value) {
    if (section[key]) {
        value.set(section[key].as<T>());
    }
}

template<typename T>
void pinFromCommandLine(const cxxopts::ParseResult& result, const char* key, ConfigValue<T>& value) {
    if (result.count(key)) {
        value.pin(result[key].as<T>());
    }
}

} // namespace

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
std::optional<int64_t> ConfigValue<int64_t>::getEnvValue() const {
    const char* env_val = std::getenv(env_var_.c_str());
    if (env_val) {
        try {
            return static_cast<int64_t>(std::stoll(env_val));
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
            return static_cast<size_t>(std::stoull(env_val));
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
        std::transform(val.begin(), val.end(), val.begin(), ::tolower);
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

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        LOG(INFO) << "Loaded configuration from " << filename;
        return applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYAML(yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::applyYAML(const YAML::Node& yaml) {
    if (!yaml["cadence"]) {
        LOG(WARNING) << "Configuration has no 'cadence' root; nothing applied";
        return validate();
    }
    auto root = yaml["cadence"];

    // Run
    if (root["run"]) {
        auto run = root["run"];
        readValue(run, "target_rate", config_.run.target_rate);
        readValue(run, "interval_us", config_.run.interval_us);
        readValue(run, "duration_s", config_.run.duration_s);
        readValue(run, "total_count", config_.run.total_count);
        readValue(run, "max_in_flight", config_.run.max_in_flight);
        readValue(run, "timeout_ms", config_.run.timeout_ms);
        readValue(run, "arrival_distribution", config_.run.arrival_distribution);
        readValue(run, "load_shedding", config_.run.load_shedding);
        readValue(run, "dispatch_model", config_.run.dispatch_model);
        readValue(run, "connections", config_.run.connections);
        readValue(run, "correction_mode", config_.run.correction_mode);
        readValue(run, "expected_interval_us", config_.run.expected_interval_us);
        readValue(run, "grace_ms", config_.run.grace_ms);
        readValue(run, "drift_tolerance_us", config_.run.drift_tolerance_us);
        readValue(run, "seed", config_.run.seed);
    }

    // Histogram
    if (root["histogram"]) {
        auto histogram = root["histogram"];
        readValue(histogram, "lowest_trackable_us", config_.histogram.lowest_trackable_us);
        readValue(histogram, "highest_trackable_us", config_.histogram.highest_trackable_us);
        readValue(histogram, "precision_digits", config_.histogram.precision_digits);
        readValue(histogram, "strict_range", config_.histogram.strict_range);
    }

    // Report
    if (root["report"]) {
        auto report = root["report"];
        readValue(report, "record_results", config_.report.record_results);
        readValue(report, "result_dir", config_.report.result_dir);
        readValue(report, "percentile_distribution", config_.report.percentile_distribution);
    }

    return validate();
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& result) {
    pinFromCommandLine(result, "target_rate", config_.run.target_rate);
    pinFromCommandLine(result, "interval_us", config_.run.interval_us);
    pinFromCommandLine(result, "duration_s", config_.run.duration_s);
    pinFromCommandLine(result, "total_count", config_.run.total_count);
    pinFromCommandLine(result, "max_in_flight", config_.run.max_in_flight);
    pinFromCommandLine(result, "timeout_ms", config_.run.timeout_ms);
    pinFromCommandLine(result, "arrival_distribution", config_.run.arrival_distribution);
    pinFromCommandLine(result, "load_shedding", config_.run.load_shedding);
    pinFromCommandLine(result, "dispatch_model", config_.run.dispatch_model);
    pinFromCommandLine(result, "connections", config_.run.connections);
    pinFromCommandLine(result, "correction_mode", config_.run.correction_mode);
    pinFromCommandLine(result, "expected_interval_us", config_.run.expected_interval_us);
    pinFromCommandLine(result, "grace_ms", config_.run.grace_ms);
    pinFromCommandLine(result, "drift_tolerance_us", config_.run.drift_tolerance_us);
    pinFromCommandLine(result, "seed", config_.run.seed);

    pinFromCommandLine(result, "lowest_trackable_us", config_.histogram.lowest_trackable_us);
    pinFromCommandLine(result, "highest_trackable_us", config_.histogram.highest_trackable_us);
    pinFromCommandLine(result, "precision_digits", config_.histogram.precision_digits);
    pinFromCommandLine(result, "strict_range", config_.histogram.strict_range);

    pinFromCommandLine(result, "record_results", config_.report.record_results);
    pinFromCommandLine(result, "result_dir", config_.report.result_dir);
    pinFromCommandLine(result, "percentile_distribution", config_.report.percentile_distribution);
}

void Configuration::resetToDefaults() {
    config_ = CadenceConfig();
    validation_errors_.clear();
}

double Configuration::getTargetRate() const {
    const int64_t interval_us = config_.run.interval_us.get();
    if (interval_us > 0) {
        return 1e6 / static_cast<double>(interval_us);
    }
    return config_.run.target_rate.get();
}

RunConfig Configuration::buildRunConfig(std::vector<std::string>* errors) const {
    RunConfig run;
    run.target_rate = getTargetRate();
    if (config_.run.interval_us.get() < 0) {
        errors->push_back("interval_us must not be negative");
    }

    const double duration_s = config_.run.duration_s.get();
    if (duration_s < 0) {
        errors->push_back("duration_s must not be negative");
    } else {
        run.duration = std::chrono::duration_cast<Duration>(std::chrono::duration<double>(duration_s));
    }
    run.total_count = config_.run.total_count.get();
    run.max_in_flight = config_.run.max_in_flight.get();
    run.timeout = std::chrono::milliseconds(config_.run.timeout_ms.get());
    run.connections = config_.run.connections.get();
    run.expected_interval_us = config_.run.expected_interval_us.get();
    run.grace = std::chrono::milliseconds(config_.run.grace_ms.get());
    run.drift_tolerance = std::chrono::microseconds(config_.run.drift_tolerance_us.get());
    run.seed = config_.run.seed.get();

    run.histogram.lowest_trackable_value = config_.histogram.lowest_trackable_us.get();
    run.histogram.highest_trackable_value = config_.histogram.highest_trackable_us.get();
    run.histogram.precision_digits = config_.histogram.precision_digits.get();
    run.histogram.range_policy = config_.histogram.strict_range.get() ? RangePolicy::kStrict : RangePolicy::kSaturate;

    try {
        run.arrival_distribution = ParseArrivalDistribution(config_.run.arrival_distribution.get());
    } catch (const ConfigurationError& e) {
        errors->push_back(e.what());
    }
    try {
        run.overload_policy = ParseOverloadPolicy(config_.run.load_shedding.get());
    } catch (const ConfigurationError& e) {
        errors->push_back(e.what());
    }
    try {
        run.dispatch_model = ParseDispatchModel(config_.run.dispatch_model.get());
    } catch (const ConfigurationError& e) {
        errors->push_back(e.what());
    }
    try {
        run.correction_mode = ParseCorrectionMode(config_.run.correction_mode.get());
    } catch (const ConfigurationError& e) {
        errors->push_back(e.what());
    }
    return run;
}

RunConfig Configuration::toRunConfig() const {
    if (!validate()) {
        throw ConfigurationError("Invalid configuration", validation_errors_);
    }
    std::vector<std::string> ignored;
    return buildRunConfig(&ignored);
}

bool Configuration::validate() const {
    validation_errors_.clear();

    RunConfig run = buildRunConfig(&validation_errors_);
    std::vector<std::string> run_errors = ValidateRunConfig(run);
    validation_errors_.insert(validation_errors_.end(), run_errors.begin(), run_errors.end());

    if (config_.report.record_results.get() && config_.report.result_dir.get().empty()) {
        validation_errors_.push_back("result_dir must be set when record_results is on");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Cadence
