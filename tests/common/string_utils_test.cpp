#include <gtest/gtest.h>
#include "common/string_utils.hpp"

namespace {

using namespace common::utils;

// Test delimiter splitting with and without empty parts
TEST(StringUtilsTest, SplitsOnDelimiter) {
    EXPECT_EQ(split_string("a,b,,c", ','), (std::vector<std::string>{"a", "b", "", "c"}));
    EXPECT_EQ(split_string("a,b,,c", ',', true), (std::vector<std::string>{"a", "b", "c"}));
}

TEST(StringUtilsTest, SplitsOnWhitespaceRuns) {
    EXPECT_EQ(split_whitespace("  NOT\tNULL \n UNIQUE "),
              (std::vector<std::string>{"NOT", "NULL", "UNIQUE"}));
    EXPECT_TRUE(split_whitespace("   ").empty());
}

TEST(StringUtilsTest, TrimsAndJoins) {
    EXPECT_EQ(trim("  users \n"), "users");
    EXPECT_EQ(trim("   "), "");
    EXPECT_EQ(join({"a", "b", "c"}, ", "), "a, b, c");
    EXPECT_EQ(join({}, ", "), "");
}

TEST(StringUtilsTest, TrimsTrailingCharacter) {
    EXPECT_EQ(trim_right("DROP TABLE t;;;", ';'), "DROP TABLE t");
    EXPECT_EQ(trim_right("no semicolon", ';'), "no semicolon");
}

TEST(StringUtilsTest, ComparesIgnoringCase) {
    EXPECT_TRUE(iequals("Users", "USERS"));
    EXPECT_FALSE(iequals("users", "user"));
    EXPECT_TRUE(contains_ci("varchar(255) not null", "NOT NULL"));
    EXPECT_FALSE(contains_ci("varchar(255)", "DEFAULT"));
}

TEST(StringUtilsTest, CountsAndMatchesSuffix) {
    EXPECT_EQ(count_char("numeric(10, 2", '('), 1u);
    EXPECT_TRUE(ends_with("001_init.down.sql", ".down.sql"));
    EXPECT_FALSE(ends_with("sql", ".sql"));
    EXPECT_EQ(remove_whitespace(" email , name "), "email,name");
}

} // namespace
