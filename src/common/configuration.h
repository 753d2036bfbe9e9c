#ifndef SPLITWATCH_CONFIGURATION_H_
#define SPLITWATCH_CONFIGURATION_H_

#include <string>
#include <memory>
#include <optional>
#include <vector>
#include <chrono>
#include <cstdint>

#include "../tracker/milestone.h"
#include "../tracker/pattern_table.h"
#include "../tracker/split_tracker.h"

namespace cxxopts {
class ParseResult;
}

namespace Splitwatch {

/**
 * Configuration value that can be overridden by environment variables
 */
template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;
    ConfigValue(T default_value, const std::string& env_var = "")
        : value_(default_value), env_var_(env_var) {}

    T get() const {
        if (!env_var_.empty()) {
            auto env_value = getEnvValue();
            if (env_value.has_value()) {
                return env_value.value();
            }
        }
        return value_;
    }

    void set(T value) { value_ = value; }
    const std::string& env_var() const { return env_var_; }

private:
    T value_;
    std::string env_var_;

    std::optional<T> getEnvValue() const;
};

// Template specializations for getEnvValue
template<>
std::optional<int> ConfigValue<int>::getEnvValue() const;

template<>
std::optional<std::string> ConfigValue<std::string>::getEnvValue() const;

template<>
std::optional<bool> ConfigValue<bool>::getEnvValue() const;

/**
 * Pattern rule as written in the config file, before validation.
 */
struct PatternConfig {
    std::string kind;       // reset | advance | display
    std::string milestone;
    std::string contains;
    std::string regex;
};

/**
 * Main configuration structure
 */
struct SplitwatchConfig {
    struct Tracker {
        ConfigValue<std::string> log_file{"", "SPLITWATCH_LOG_FILE"};
        ConfigValue<std::string> snapshot_root{"", "SPLITWATCH_SNAPSHOT_ROOT"};
        std::vector<std::string> snapshot_file_names = SnapshotReader::DefaultFileNames();
        ConfigValue<int> snapshot_max_depth{6, "SPLITWATCH_SNAPSHOT_MAX_DEPTH"};
        // 100ms keeps log latency low without spinning.
        ConfigValue<int> stream_poll_interval_ms{100, "SPLITWATCH_STREAM_POLL_MS"};
        ConfigValue<int> snapshot_poll_interval_ms{1000, "SPLITWATCH_SNAPSHOT_POLL_MS"};
        // Engine double-logs advancement lines; collapse repeats inside this window.
        ConfigValue<int> cooldown_ms{2000, "SPLITWATCH_COOLDOWN_MS"};

        struct DisplayBand {
            ConfigValue<std::string> from{"fortress", "SPLITWATCH_DISPLAY_BAND_FROM"};
            ConfigValue<std::string> until{"stronghold", "SPLITWATCH_DISPLAY_BAND_UNTIL"};
        } display_band;
    } tracker;

    // Empty means the built-in table.
    std::vector<PatternConfig> patterns;

    struct Presence {
        ConfigValue<bool> log_renders{true, "SPLITWATCH_PRESENCE_LOG"};
        ConfigValue<std::string> status_file{"", "SPLITWATCH_STATUS_FILE"};
    } presence;

    struct Logging {
        ConfigValue<int> verbosity{0, "SPLITWATCH_LOG_VERBOSITY"};
    } logging;
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

    // Override with parsed command line arguments
    void overrideFromCommandLine(const cxxopts::ParseResult& arguments);

    // Back to built-in defaults
    void reset();

    // Get the configuration
    const SplitwatchConfig& config() const { return config_; }
    SplitwatchConfig& config() { return config_; }

    // Helpers turning the raw values into component settings
    TrackerOptions getTrackerOptions() const;
    DisplayBand getDisplayBand() const;
    std::vector<PatternRule> getPatternRules() const;
    std::chrono::milliseconds getCooldown() const {
        return std::chrono::milliseconds(config_.tracker.cooldown_ms.get());
    }

    // Validation
    bool validate() const;
    std::vector<std::string> getValidationErrors() const;

private:
    Configuration() = default;
    Configuration(const Configuration&) = delete;
    Configuration& operator=(const Configuration&) = delete;

    SplitwatchConfig config_;
    mutable std::vector<std::string> validation_errors_;
    std::vector<std::string> parse_errors_;

    // Helper methods for parsing
    bool applyYAML(const void* node);
    static std::optional<PatternRule> toPatternRule(const PatternConfig& pattern, std::string* error);
};

} // namespace Splitwatch

#endif // SPLITWATCH_CONFIGURATION_H_
