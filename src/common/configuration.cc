#include "configuration.h"
#include <algorithm>
#include <cstdlib>
#include <cxxopts.hpp>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>

namespace Splitwatch {

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

void Configuration::reset() {
    config_ = SplitwatchConfig{};
    validation_errors_.clear();
    parse_errors_.clear();
}

bool Configuration::loadFromFile(const std::string& filename) {
    try {
        YAML::Node yaml = YAML::LoadFile(filename);
        return applyYAML(&yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration file " << filename << ": " << e.what();
        return false;
    }
}

bool Configuration::loadFromString(const std::string& yaml_content) {
    try {
        YAML::Node yaml = YAML::Load(yaml_content);
        return applyYAML(&yaml);
    } catch (const YAML::Exception& e) {
        LOG(ERROR) << "Failed to parse configuration string: " << e.what();
        return false;
    }
}

bool Configuration::applyYAML(const void* node) {
    const YAML::Node& yaml = *static_cast<const YAML::Node*>(node);
    parse_errors_.clear();

    if (yaml["splitwatch"]) {
        auto root = yaml["splitwatch"];

        // Tracker
        if (root["tracker"]) {
            auto tracker = root["tracker"];
            if (tracker["log_file"]) config_.tracker.log_file.set(tracker["log_file"].as<std::string>());
            if (tracker["snapshot_root"]) config_.tracker.snapshot_root.set(tracker["snapshot_root"].as<std::string>());
            if (tracker["snapshot_file_names"]) {
                config_.tracker.snapshot_file_names.clear();
                for (const auto& name : tracker["snapshot_file_names"]) {
                    config_.tracker.snapshot_file_names.push_back(name.as<std::string>());
                }
            }
            if (tracker["snapshot_max_depth"]) config_.tracker.snapshot_max_depth.set(tracker["snapshot_max_depth"].as<int>());
            if (tracker["stream_poll_interval_ms"]) config_.tracker.stream_poll_interval_ms.set(tracker["stream_poll_interval_ms"].as<int>());
            if (tracker["snapshot_poll_interval_ms"]) config_.tracker.snapshot_poll_interval_ms.set(tracker["snapshot_poll_interval_ms"].as<int>());
            if (tracker["cooldown_ms"]) config_.tracker.cooldown_ms.set(tracker["cooldown_ms"].as<int>());

            if (tracker["display_band"]) {
                auto band = tracker["display_band"];
                if (band["from"]) config_.tracker.display_band.from.set(band["from"].as<std::string>());
                if (band["until"]) config_.tracker.display_band.until.set(band["until"].as<std::string>());
            }
        }

        // Patterns replace the built-in table as a whole
        if (root["patterns"]) {
            config_.patterns.clear();
            for (const auto& entry : root["patterns"]) {
                PatternConfig pattern;
                if (entry["kind"]) pattern.kind = entry["kind"].as<std::string>();
                if (entry["milestone"]) pattern.milestone = entry["milestone"].as<std::string>();
                if (entry["contains"]) pattern.contains = entry["contains"].as<std::string>();
                if (entry["regex"]) pattern.regex = entry["regex"].as<std::string>();
                config_.patterns.push_back(pattern);
            }
        }

        // Presence
        if (root["presence"]) {
            auto presence = root["presence"];
            if (presence["log_renders"]) config_.presence.log_renders.set(presence["log_renders"].as<bool>());
            if (presence["status_file"]) config_.presence.status_file.set(presence["status_file"].as<std::string>());
        }

        // Logging
        if (root["logging"]) {
            auto logging = root["logging"];
            if (logging["verbosity"]) config_.logging.verbosity.set(logging["verbosity"].as<int>());
        }
    }

    for (const auto& pattern : config_.patterns) {
        std::string error;
        if (!toPatternRule(pattern, &error)) {
            parse_errors_.push_back(error);
        }
    }

    // Semantic checks are left to validate(), after command line overrides.
    return true;
}

void Configuration::overrideFromCommandLine(const cxxopts::ParseResult& arguments) {
    if (arguments.count("log_file")) {
        config_.tracker.log_file.set(arguments["log_file"].as<std::string>());
    }
    if (arguments.count("snapshot_root")) {
        config_.tracker.snapshot_root.set(arguments["snapshot_root"].as<std::string>());
    }
    if (arguments.count("status_file")) {
        config_.presence.status_file.set(arguments["status_file"].as<std::string>());
    }
    if (arguments.count("log_level")) {
        config_.logging.verbosity.set(arguments["log_level"].as<int>());
    }
}

std::optional<PatternRule> Configuration::toPatternRule(const PatternConfig& pattern, std::string* error) {
    PatternRule rule;
    if (pattern.kind == "reset") {
        rule.kind = EventKind::kReset;
    } else if (pattern.kind == "advance") {
        rule.kind = EventKind::kAdvance;
    } else if (pattern.kind == "display") {
        rule.kind = EventKind::kDisplay;
    } else {
        *error = "Pattern kind must be reset, advance or display, got '" + pattern.kind + "'";
        return std::nullopt;
    }

    if (rule.kind == EventKind::kReset) {
        rule.milestone = Milestone::kNone;
    } else {
        auto milestone = ParseMilestone(pattern.milestone);
        if (!milestone) {
            *error = "Unknown pattern milestone '" + pattern.milestone + "'";
            return std::nullopt;
        }
        rule.milestone = *milestone;
    }

    if (!pattern.contains.empty() && !pattern.regex.empty()) {
        *error = "Pattern for '" + pattern.milestone + "' sets both contains and regex";
        return std::nullopt;
    }
    if (!pattern.regex.empty()) {
        rule.match_type = MatchType::kRegex;
        rule.pattern = pattern.regex;
    } else {
        rule.match_type = MatchType::kContains;
        rule.pattern = pattern.contains;
    }

    std::string problem = PatternTable::CheckRule(rule);
    if (!problem.empty()) {
        *error = "Pattern '" + rule.pattern + "': " + problem;
        return std::nullopt;
    }
    return rule;
}

TrackerOptions Configuration::getTrackerOptions() const {
    TrackerOptions options;
    options.log_file = config_.tracker.log_file.get();
    options.snapshot_root = config_.tracker.snapshot_root.get();
    options.snapshot_file_names = config_.tracker.snapshot_file_names;
    options.snapshot_max_depth = config_.tracker.snapshot_max_depth.get();
    options.stream_poll_interval = std::chrono::milliseconds(config_.tracker.stream_poll_interval_ms.get());
    options.snapshot_poll_interval = std::chrono::milliseconds(config_.tracker.snapshot_poll_interval_ms.get());
    return options;
}

DisplayBand Configuration::getDisplayBand() const {
    DisplayBand band;
    auto from = ParseMilestone(config_.tracker.display_band.from.get());
    auto until = ParseMilestone(config_.tracker.display_band.until.get());
    if (from) band.from = *from;
    if (until) band.until = *until;
    return band;
}

std::vector<PatternRule> Configuration::getPatternRules() const {
    if (config_.patterns.empty()) {
        return PatternTable::DefaultRules();
    }
    std::vector<PatternRule> rules;
    for (const auto& pattern : config_.patterns) {
        std::string error;
        auto rule = toPatternRule(pattern, &error);
        if (rule) {
            rules.push_back(*rule);
        }
    }
    return rules;
}

bool Configuration::validate() const {
    validation_errors_ = parse_errors_;

    // At least one source to watch
    if (config_.tracker.log_file.get().empty() && config_.tracker.snapshot_root.get().empty()) {
        validation_errors_.push_back("Either tracker.log_file or tracker.snapshot_root must be set");
    }

    // Poll cadence
    if (config_.tracker.stream_poll_interval_ms.get() < 10) {
        validation_errors_.push_back("Stream poll interval must be at least 10ms");
    }
    if (config_.tracker.snapshot_poll_interval_ms.get() < 10) {
        validation_errors_.push_back("Snapshot poll interval must be at least 10ms");
    }
    if (config_.tracker.cooldown_ms.get() < 0) {
        validation_errors_.push_back("Cooldown cannot be negative");
    }
    if (config_.tracker.snapshot_max_depth.get() < 0) {
        validation_errors_.push_back("Snapshot max depth cannot be negative");
    }
    if (config_.tracker.snapshot_file_names.empty()) {
        validation_errors_.push_back("At least one snapshot file name is required");
    }

    // Display band
    auto from = ParseMilestone(config_.tracker.display_band.from.get());
    auto until = ParseMilestone(config_.tracker.display_band.until.get());
    if (!from || !IsRankBearing(*from)) {
        validation_errors_.push_back("Display band start '" + config_.tracker.display_band.from.get() +
                "' is not a split milestone");
    }
    if (!until || !IsRankBearing(*until)) {
        validation_errors_.push_back("Display band end '" + config_.tracker.display_band.until.get() +
                "' is not a split milestone");
    }
    if (from && until && IsRankBearing(*from) && IsRankBearing(*until) && Rank(*from) >= Rank(*until)) {
        validation_errors_.push_back("Display band start must come before its end");
    }

    return validation_errors_.empty();
}

std::vector<std::string> Configuration::getValidationErrors() const {
    return validation_errors_;
}

} // namespace Splitwatch
