#include <spanner/core/level.hpp>

#include <gtest/gtest.h>

using namespace spanner::core;

TEST(LevelTest, Labels) {
    EXPECT_EQ(to_string(Level::Trace), "TRACE");
    EXPECT_EQ(to_string(Level::Debug), "DEBUG");
    EXPECT_EQ(to_string(Level::Info), "INFO");
    EXPECT_EQ(to_string(Level::Warn), "WARN");
    EXPECT_EQ(to_string(Level::Error), "ERROR");
}

TEST(LevelTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(level_from_string("error"), Level::Error);
    EXPECT_EQ(level_from_string("Info"), Level::Info);
    EXPECT_EQ(level_from_string("TRACE"), Level::Trace);
}

TEST(LevelTest, ParseAcceptsWarningAlias) {
    EXPECT_EQ(level_from_string("WARN"), Level::Warn);
    EXPECT_EQ(level_from_string("warning"), Level::Warn);
}

TEST(LevelTest, ParseRejectsUnknown) {
    EXPECT_FALSE(level_from_string("").has_value());
    EXPECT_FALSE(level_from_string("fatal").has_value());
    EXPECT_FALSE(level_from_string("warnings").has_value());
    EXPECT_FALSE(level_from_string("verbose").has_value());
}

TEST(LevelTest, SeverityOrdering) {
    EXPECT_LT(Level::Trace, Level::Debug);
    EXPECT_LT(Level::Debug, Level::Info);
    EXPECT_LT(Level::Info, Level::Warn);
    EXPECT_LT(Level::Warn, Level::Error);
}

TEST(LevelTest, AllLevelsMostSevereFirst) {
    auto levels = all_levels();
    ASSERT_EQ(levels.size(), 5u);
    EXPECT_EQ(levels.front(), Level::Error);
    EXPECT_EQ(levels.back(), Level::Trace);
}
