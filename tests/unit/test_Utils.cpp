#include <gtest/gtest.h>
#include <scratchpad/core/utils.hpp>

#include <string>
#include <vector>

using namespace scratchpad;

TEST(UtilsTest, JoinHandlesEmptyAndSingle) {
    EXPECT_EQ(join(std::vector<std::string>(), ", "), "");
    EXPECT_EQ(join(std::vector<std::string>(1, "only"), ", "), "only");
}

TEST(UtilsTest, JoinKeepsOrderAndEmptyParts) {
    std::vector<std::string> parts;
    parts.push_back("a");
    parts.push_back("");
    parts.push_back("c");
    EXPECT_EQ(join(parts, "\n"), "a\n\nc");
}

TEST(UtilsTest, JoinLargeListing) {
    std::vector<std::string> parts(20000, "dir/file.txt");
    std::string joined = join(parts, "\n");
    EXPECT_EQ(joined.size(), parts.size() * 12 + (parts.size() - 1));
    EXPECT_EQ(joined.substr(0, 25), "dir/file.txt\ndir/file.txt");
}

TEST(UtilsTest, SplitAndTrim) {
    std::vector<std::string> parts = split("log.level.name", '.');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[1], "level");
    EXPECT_EQ(trim(" \t x y \n"), "x y");
}

TEST(UtilsTest, ParseBoolString) {
    EXPECT_TRUE(parse_bool_string("true"));
    EXPECT_TRUE(parse_bool_string(" YES "));
    EXPECT_TRUE(parse_bool_string("1"));
    EXPECT_FALSE(parse_bool_string("false"));
    EXPECT_FALSE(parse_bool_string("maybe"));
}
