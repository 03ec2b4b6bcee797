#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>

#include "history.hpp"
#include "test_helpers.hpp"

namespace fs = std::filesystem;

TEST(HistoryTest, EvictsOldestPastCapacity) {
    History history(3);
    for (int i = 0; i < 5; i++) history.append({"cmd" + std::to_string(i), NOW});

    ASSERT_EQ(history.size(), 3u);
    EXPECT_EQ(commands_of({history.entries().begin(), history.entries().end()}),
              (std::vector<std::string>{"cmd2", "cmd3", "cmd4"}));
}

TEST(HistoryTest, ZeroCapacityStaysEmpty) {
    History history(0);
    history.append({"ls", NOW});
    EXPECT_TRUE(history.empty());
}

TEST(HistoryParseTest, ParsesExtendedHistoryLine) {
    auto entry = parse_history_line(": 1700000000:0;git status");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->command, "git status");
    EXPECT_EQ(entry->timestamp, NOW);
}

TEST(HistoryParseTest, TrimsTrailingWhitespace) {
    auto entry = parse_history_line(": 1700000000:3;ls -la   ");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->command, "ls -la");
}

TEST(HistoryParseTest, KeepsSemicolonsInCommand) {
    auto entry = parse_history_line(": 1700000000:0;cd /tmp; ls");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->command, "cd /tmp; ls");
}

TEST(HistoryParseTest, RejectsMalformedLines) {
    EXPECT_FALSE(parse_history_line("git status").has_value());
    EXPECT_FALSE(parse_history_line(": abc:0;ls").has_value());
    EXPECT_FALSE(parse_history_line(": 1700000000:0;").has_value());
    EXPECT_FALSE(parse_history_line(": 1700000000:0;   ").has_value());
    EXPECT_FALSE(parse_history_line("").has_value());
}

TEST(HistoryParseTest, RejectsEpochOutsideClockRange) {
    EXPECT_FALSE(parse_history_line(": 99999999999:0;ls").has_value());
    EXPECT_FALSE(parse_history_line(": 99999999999999999999:0;ls").has_value());
    EXPECT_TRUE(parse_history_line(": 9000000000:0;ls").has_value());
}

class HistoryFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() / "termsearch_history_test";
        std::ofstream out(path_);
        out << ": 1699999990:0;ls\n"
            << "not a history line\n"
            << ": 1699999995:0;git status\n"
            << ": 1699999999:0;make\n";
    }

    void TearDown() override { fs::remove(path_); }

    fs::path path_;
};

TEST_F(HistoryFileTest, ReadsOnlyValidLinesInOrder) {
    History history = read_zsh_history(path_.string(), 100);
    EXPECT_EQ(commands_of({history.entries().begin(), history.entries().end()}),
              (std::vector<std::string>{"ls", "git status", "make"}));
}

TEST_F(HistoryFileTest, KeepsMostRecentEntriesUpToMax) {
    History history = read_zsh_history(path_.string(), 2);
    EXPECT_EQ(commands_of({history.entries().begin(), history.entries().end()}),
              (std::vector<std::string>{"git status", "make"}));
}

TEST_F(HistoryFileTest, HistfileEnvironmentTakesPrecedence) {
    setenv("HISTFILE", path_.c_str(), 1);
    EXPECT_EQ(get_history_path(), path_.string());
    unsetenv("HISTFILE");
}

TEST(HistoryFileErrorTest, MissingFileThrows) {
    EXPECT_THROW(read_zsh_history("/nonexistent/termsearch/.zsh_history", 10), HistoryError);
}
