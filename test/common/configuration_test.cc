#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/common/configuration.h"

#include <cstdlib>

using namespace Splitwatch;
using ::testing::Contains;
using ::testing::HasSubstr;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.reset();
    }

    void TearDown() override {
        unsetenv("SPLITWATCH_COOLDOWN_MS");
        unsetenv("SPLITWATCH_LOG_FILE");
        unsetenv("SPLITWATCH_PRESENCE_LOG");
        config_.reset();
    }

    Configuration& config_ = Configuration::getInstance();
};

TEST_F(ConfigurationTest, Defaults) {
    const SplitwatchConfig& c = config_.config();
    EXPECT_EQ(c.tracker.stream_poll_interval_ms.get(), 100);
    EXPECT_EQ(c.tracker.snapshot_poll_interval_ms.get(), 1000);
    EXPECT_EQ(c.tracker.cooldown_ms.get(), 2000);
    EXPECT_EQ(c.tracker.snapshot_max_depth.get(), 6);
    EXPECT_TRUE(c.presence.log_renders.get());

    DisplayBand band = config_.getDisplayBand();
    EXPECT_EQ(band.from, Milestone::kFortress);
    EXPECT_EQ(band.until, Milestone::kStronghold);
    EXPECT_EQ(config_.getPatternRules().size(), PatternTable::DefaultRules().size());

    // Nothing to watch yet.
    EXPECT_FALSE(config_.validate());
}

TEST_F(ConfigurationTest, LoadsYaml) {
    const char* yaml = R"(
splitwatch:
  tracker:
    log_file: "/tmp/latest.log"
    snapshot_root: "/tmp/saves"
    snapshot_file_names: ["record.json"]
    stream_poll_interval_ms: 50
    cooldown_ms: 1500
    display_band:
      from: bastion
      until: first_portal
  presence:
    log_renders: false
    status_file: "/tmp/status.txt"
  logging:
    verbosity: 2
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    ASSERT_TRUE(config_.validate());

    TrackerOptions options = config_.getTrackerOptions();
    EXPECT_EQ(options.log_file, "/tmp/latest.log");
    EXPECT_EQ(options.snapshot_root, "/tmp/saves");
    EXPECT_EQ(options.snapshot_file_names, std::vector<std::string>{"record.json"});
    EXPECT_EQ(options.stream_poll_interval, std::chrono::milliseconds(50));
    EXPECT_EQ(options.snapshot_poll_interval, std::chrono::milliseconds(1000));
    EXPECT_EQ(config_.getCooldown(), std::chrono::milliseconds(1500));

    DisplayBand band = config_.getDisplayBand();
    EXPECT_EQ(band.from, Milestone::kBastion);
    EXPECT_EQ(band.until, Milestone::kFirstPortal);

    EXPECT_FALSE(config_.config().presence.log_renders.get());
    EXPECT_EQ(config_.config().presence.status_file.get(), "/tmp/status.txt");
    EXPECT_EQ(config_.config().logging.verbosity.get(), 2);
}

TEST_F(ConfigurationTest, EnvironmentOverridesFile) {
    ASSERT_TRUE(config_.loadFromString("splitwatch:\n  tracker:\n    cooldown_ms: 1500\n    log_file: a.log\n"));
    setenv("SPLITWATCH_COOLDOWN_MS", "500", 1);
    setenv("SPLITWATCH_LOG_FILE", "b.log", 1);
    setenv("SPLITWATCH_PRESENCE_LOG", "off", 1);
    EXPECT_EQ(config_.getCooldown(), std::chrono::milliseconds(500));
    EXPECT_EQ(config_.getTrackerOptions().log_file, "b.log");
    EXPECT_FALSE(config_.config().presence.log_renders.get());
}

TEST_F(ConfigurationTest, UnparsableEnvironmentFallsBack) {
    setenv("SPLITWATCH_COOLDOWN_MS", "soon", 1);
    EXPECT_EQ(config_.getCooldown(), std::chrono::milliseconds(2000));
}

TEST_F(ConfigurationTest, CustomPatterns) {
    const char* yaml = R"(
splitwatch:
  tracker:
    log_file: latest.log
  patterns:
    - { kind: advance, milestone: nether, contains: "entered the nether" }
    - { kind: reset, regex: "^Loaded [0-9]+ advancements$" }
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    ASSERT_TRUE(config_.validate());
    std::vector<PatternRule> rules = config_.getPatternRules();
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].kind, EventKind::kAdvance);
    EXPECT_EQ(rules[0].milestone, Milestone::kNether);
    EXPECT_EQ(rules[1].kind, EventKind::kReset);
    EXPECT_EQ(rules[1].match_type, MatchType::kRegex);

    PatternTable table(rules);
    auto event = table.Match("Loaded 12 advancements", std::chrono::steady_clock::now());
    ASSERT_TRUE(event.has_value());
    EXPECT_EQ(event->kind, EventKind::kReset);
}

TEST_F(ConfigurationTest, BadPatternsFailValidation) {
    const char* yaml = R"(
splitwatch:
  tracker:
    log_file: latest.log
  patterns:
    - { kind: teleport, milestone: nether, contains: "x" }
    - { kind: advance, milestone: moon, contains: "x" }
    - { kind: advance, milestone: end, contains: "x", regex: "y" }
    - { kind: advance, milestone: end, regex: "(" }
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    EXPECT_FALSE(config_.validate());
    EXPECT_EQ(config_.getValidationErrors().size(), 4u);
    EXPECT_TRUE(config_.getPatternRules().empty());
}

TEST_F(ConfigurationTest, SemanticValidation) {
    const char* yaml = R"(
splitwatch:
  tracker:
    snapshot_root: saves
    stream_poll_interval_ms: 1
    cooldown_ms: -1
    display_band:
      from: stronghold
      until: fortress
)";
    ASSERT_TRUE(config_.loadFromString(yaml));
    EXPECT_FALSE(config_.validate());
    auto errors = config_.getValidationErrors();
    EXPECT_THAT(errors, Contains(HasSubstr("Stream poll interval")));
    EXPECT_THAT(errors, Contains(HasSubstr("Cooldown")));
    EXPECT_THAT(errors, Contains(HasSubstr("before its end")));
}

TEST_F(ConfigurationTest, SoftMilestoneCannotBoundTheBand) {
    ASSERT_TRUE(config_.loadFromString(
        "splitwatch:\n  tracker:\n    log_file: l\n    display_band:\n      from: searching\n"));
    EXPECT_FALSE(config_.validate());
    EXPECT_THAT(config_.getValidationErrors(), Contains(HasSubstr("not a split milestone")));
}

TEST_F(ConfigurationTest, MalformedYamlIsRejected) {
    EXPECT_FALSE(config_.loadFromString("splitwatch: [unclosed"));
    EXPECT_FALSE(config_.loadFromFile("/nonexistent/splitwatch.yaml"));
}
