#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/tracker/line_stream_reader.h"

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace Splitwatch;
using ::testing::ElementsAre;
using ::testing::IsEmpty;

namespace fs = std::filesystem;

class LineStreamReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() /
            ("splitwatch_lsr_" + std::to_string(::getpid()) + "_" +
             ::testing::UnitTest::GetInstance()->current_test_info()->name());
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        path_ = (dir_ / "latest.log").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    void Append(const std::string& text) {
        std::ofstream out(path_, std::ios::binary | std::ios::app);
        out << text;
    }

    void Overwrite(const std::string& text) {
        std::ofstream out(path_, std::ios::binary | std::ios::trunc);
        out << text;
    }

    fs::path dir_;
    std::string path_;
};

TEST_F(LineStreamReaderTest, StartsAtEndOfExistingFile) {
    Append("old line 1\nold line 2\n");
    LineStreamReader reader(path_);
    EXPECT_EQ(reader.offset(), 22u);
    EXPECT_THAT(reader.Poll(), IsEmpty());

    Append("new line\n");
    EXPECT_THAT(reader.Poll(), ElementsAre("new line"));
    EXPECT_THAT(reader.Poll(), IsEmpty());
}

TEST_F(LineStreamReaderTest, FromStartReplaysExistingLines) {
    Append("a\nb\n");
    LineStreamReader reader(path_, true);
    EXPECT_THAT(reader.Poll(), ElementsAre("a", "b"));
}

TEST_F(LineStreamReaderTest, MissingFileIsReadFromItsStartOnceCreated) {
    LineStreamReader reader(path_);
    EXPECT_THAT(reader.Poll(), IsEmpty());
    Append("first\n");
    EXPECT_THAT(reader.Poll(), ElementsAre("first"));
}

TEST_F(LineStreamReaderTest, PartialLineWaitsForItsNewline) {
    LineStreamReader reader(path_);
    Append("complete\npart");
    EXPECT_THAT(reader.Poll(), ElementsAre("complete"));
    EXPECT_EQ(reader.offset(), 9u);
    Append("ial\n");
    EXPECT_THAT(reader.Poll(), ElementsAre("partial"));
}

TEST_F(LineStreamReaderTest, SkipsBlankLinesAndStripsCarriageReturns) {
    LineStreamReader reader(path_);
    Append("one\r\n\n   \r\ntwo\n");
    EXPECT_THAT(reader.Poll(), ElementsAre("one", "two"));
}

TEST_F(LineStreamReaderTest, TruncationRestartsFromZero) {
    Append("a fairly long line that is already in the file\n");
    LineStreamReader reader(path_);
    Overwrite("short\n");
    EXPECT_THAT(reader.Poll(), ElementsAre("short"));
    EXPECT_EQ(reader.rotations(), 1u);

    // Lines appended after the restart are not lost.
    Append("next\n");
    EXPECT_THAT(reader.Poll(), ElementsAre("next"));
    EXPECT_EQ(reader.rotations(), 1u);
}

TEST_F(LineStreamReaderTest, ReplacedFileIsReadFromItsStart) {
    Append("x\n");
    LineStreamReader reader(path_);

    // A rotated log: new inode, already larger than the old offset.
    std::string rotated = path_ + ".new";
    {
        std::ofstream out(rotated, std::ios::binary);
        out << "line one of the new file\nline two\n";
    }
    fs::rename(rotated, path_);
    EXPECT_THAT(reader.Poll(), ElementsAre("line one of the new file", "line two"));
    EXPECT_EQ(reader.rotations(), 1u);
}

TEST_F(LineStreamReaderTest, FileRemovedIsNoData) {
    Append("a line longer than the one written after removal\n");
    LineStreamReader reader(path_);
    fs::remove(path_);
    EXPECT_THAT(reader.Poll(), IsEmpty());
    Append("back\n");
    EXPECT_THAT(reader.Poll(), ElementsAre("back"));
}

TEST_F(LineStreamReaderTest, MalformedUtf8IsReplaced) {
    LineStreamReader reader(path_);
    Append(std::string("bad \xff byte\n"));
    EXPECT_THAT(reader.Poll(), ElementsAre("bad \xEF\xBF\xBD byte"));
}

TEST(SanitizeUtf8Test, KeepsValidSequences) {
    EXPECT_EQ(SanitizeUtf8("plain"), "plain");
    EXPECT_EQ(SanitizeUtf8("caf\xC3\xA9"), "caf\xC3\xA9");
    EXPECT_EQ(SanitizeUtf8("\xF0\x9F\x98\x80"), "\xF0\x9F\x98\x80");
}

TEST(SanitizeUtf8Test, ReplacesInvalidSequences) {
    // Truncated sequence at the end.
    EXPECT_EQ(SanitizeUtf8("a\xC3"), "a\xEF\xBF\xBD");
    // Overlong encoding of '/'.
    EXPECT_EQ(SanitizeUtf8("\xC0\xAF"), "\xEF\xBF\xBD\xEF\xBF\xBD");
    // UTF-16 surrogate.
    EXPECT_EQ(SanitizeUtf8("\xED\xA0\x80"), "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
}
