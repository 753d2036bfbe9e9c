#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/presence/presence_publisher.h"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <unistd.h>

using namespace Splitwatch;
using ::testing::_;
using ::testing::Field;
using ::testing::HasSubstr;
using ::testing::Return;

namespace fs = std::filesystem;

class MockPresenceSink : public IPresenceSink {
public:
    MOCK_METHOD(bool, Update, (const PresenceInfo& info), (override));
    MOCK_METHOD(void, Clear, (), (override));
    const char* name() const override { return "mock"; }
};

class PresencePublisherTest : public ::testing::Test {
protected:
    void SetUp() override {
        sink_ = std::make_shared<MockPresenceSink>();
        publisher_ = std::make_unique<PresencePublisher>(
            std::vector<std::shared_ptr<IPresenceSink>>{sink_});
    }

    RunSnapshot Make(Milestone current, Milestone display, int64_t elapsed, bool is_new_run) {
        RunSnapshot s;
        s.current = current;
        s.display = display;
        s.elapsed_ms = elapsed;
        s.is_new_run = is_new_run;
        s.sequence = ++sequence_;
        return s;
    }

    std::shared_ptr<MockPresenceSink> sink_;
    std::unique_ptr<PresencePublisher> publisher_;
    uint64_t sequence_ = 0;
};

TEST_F(PresencePublisherTest, RendersEachDistinctState) {
    EXPECT_CALL(*sink_, Update(_)).Times(2).WillRepeatedly(Return(true));
    publisher_->Publish(Make(Milestone::kNone, Milestone::kNone, 0, true));
    publisher_->Publish(Make(Milestone::kNether, Milestone::kNether, 0, false));
    EXPECT_EQ(publisher_->renders(), 2u);
}

TEST_F(PresencePublisherTest, IdenticalTupleIsNotRenderedTwice) {
    EXPECT_CALL(*sink_, Update(_)).Times(1).WillOnce(Return(true));
    publisher_->Publish(Make(Milestone::kNether, Milestone::kNether, 145000, false));
    publisher_->Publish(Make(Milestone::kNether, Milestone::kNether, 145000, false));
    EXPECT_EQ(publisher_->renders(), 1u);
}

TEST_F(PresencePublisherTest, StaleSequenceIsDropped) {
    RunSnapshot first = Make(Milestone::kNether, Milestone::kNether, 0, false);
    RunSnapshot second = Make(Milestone::kBastion, Milestone::kBastion, 0, false);
    EXPECT_CALL(*sink_, Update(Field(&PresenceInfo::large_text, "The Nether"))).Times(1).WillOnce(Return(true));
    publisher_->Publish(second);
    publisher_->Publish(first);
    EXPECT_EQ(publisher_->renders(), 1u);
}

TEST_F(PresencePublisherTest, FailedRenderIsRetried) {
    EXPECT_CALL(*sink_, Update(_))
        .WillOnce(Return(false))
        .WillOnce(Return(true));
    publisher_->Publish(Make(Milestone::kFortress, Milestone::kFortress, 0, false));
    EXPECT_EQ(publisher_->renders(), 0u);
    publisher_->Publish(Make(Milestone::kFortress, Milestone::kFortress, 0, false));
    EXPECT_EQ(publisher_->renders(), 1u);
}

TEST_F(PresencePublisherTest, ClearReachesEverySink) {
    auto other = std::make_shared<MockPresenceSink>();
    PresencePublisher publisher({sink_, other});
    EXPECT_CALL(*sink_, Clear()).Times(1);
    EXPECT_CALL(*other, Clear()).Times(1);
    publisher.Clear();
}

TEST_F(PresencePublisherTest, RerendersAfterClear) {
    EXPECT_CALL(*sink_, Update(_)).Times(2).WillRepeatedly(Return(true));
    EXPECT_CALL(*sink_, Clear()).Times(1);
    publisher_->Publish(Make(Milestone::kEnd, Milestone::kEnd, 900000, false));
    publisher_->Clear();
    publisher_->Publish(Make(Milestone::kEnd, Milestone::kEnd, 900000, false));
}

TEST(FormatIgtTest, Formats) {
    EXPECT_EQ(FormatIgt(0), "0:00.000");
    EXPECT_EQ(FormatIgt(-5), "0:00.000");
    EXPECT_EQ(FormatIgt(1), "0:00.001");
    EXPECT_EQ(FormatIgt(145000), "2:25.000");
    EXPECT_EQ(FormatIgt(754321), "12:34.321");
    EXPECT_EQ(FormatIgt(3600000), "60:00.000");
}

TEST(RenderPresenceTest, FreshRunShowsTimer) {
    RunSnapshot s;
    s.is_new_run = true;
    s.run_epoch_start = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
    PresenceInfo info = RenderPresence(s);
    EXPECT_EQ(info.state, "Starting a new run (0/7 splits)");
    EXPECT_EQ(info.details, "Grinding the overworld...");
    ASSERT_TRUE(info.start_timestamp.has_value());
    EXPECT_EQ(*info.start_timestamp, 1700000000);
}

TEST(RenderPresenceTest, SplitWithElapsedTime) {
    RunSnapshot s;
    s.current = Milestone::kFortress;
    s.display = Milestone::kFortress;
    s.elapsed_ms = 410000;
    PresenceInfo info = RenderPresence(s);
    EXPECT_EQ(info.state, "In Nether Fortress (3/7 splits)");
    EXPECT_EQ(info.details, "Collecting blaze rods... | IGT: 6:50.000");
    EXPECT_EQ(info.small_image, "fortress");
    EXPECT_FALSE(info.start_timestamp.has_value());
}

TEST(RenderPresenceTest, UnknownElapsedHasNoIgt) {
    RunSnapshot s;
    s.current = Milestone::kNether;
    s.display = Milestone::kNether;
    PresenceInfo info = RenderPresence(s);
    EXPECT_EQ(info.details, "Trading piglins / looting bastion...");
}

TEST(RenderPresenceTest, SoftDisplayKeepsRankCount) {
    RunSnapshot s;
    s.current = Milestone::kFortress;
    s.display = Milestone::kSearching;
    PresenceInfo info = RenderPresence(s);
    EXPECT_THAT(info.state, HasSubstr("Searching for Stronghold"));
    EXPECT_THAT(info.state, HasSubstr("(3/7 splits)"));
}

TEST(RenderPresenceTest, Finished) {
    RunSnapshot s;
    s.current = Milestone::kFinish;
    s.display = Milestone::kFinish;
    s.elapsed_ms = 1234567;
    PresenceInfo info = RenderPresence(s);
    EXPECT_EQ(info.state, "FINISHED! IGT: 20:34.567");
    EXPECT_EQ(info.large_text, "Finished!");
}

class StatusFileSinkTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
            ("splitwatch_status_" + std::to_string(::getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static std::string ReadAll(const fs::path& path) {
        std::ifstream in(path);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    fs::path dir_;
};

TEST_F(StatusFileSinkTest, WritesAndClears) {
    fs::path path = dir_ / "status.txt";
    StatusFileSink sink(path.string());
    PresenceInfo info;
    info.state = "Entered the Nether (1/7 splits)";
    info.details = "Trading piglins / looting bastion... | IGT: 2:25.000";
    info.large_text = "The Nether";
    info.small_text = "Nether entered";
    ASSERT_TRUE(sink.Update(info));
    EXPECT_EQ(ReadAll(path),
        "Entered the Nether (1/7 splits)\n"
        "Trading piglins / looting bastion... | IGT: 2:25.000\n"
        "The Nether\n"
        "Nether entered\n");
    EXPECT_FALSE(fs::exists(path.string() + ".tmp"));

    sink.Clear();
    EXPECT_EQ(ReadAll(path), "");
}

TEST_F(StatusFileSinkTest, UnwritableDirectoryFails) {
    StatusFileSink sink((dir_ / "missing" / "status.txt").string());
    EXPECT_FALSE(sink.Update(PresenceInfo{}));
}
