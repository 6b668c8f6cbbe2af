#include <gtest/gtest.h>
#include "Shell/Lexer.hpp"

using Shell::Token;
using Shell::tokenize;

TEST(tokenize, empty) {
    EXPECT_TRUE(tokenize("").empty());
    EXPECT_TRUE(tokenize(" \t\r\n\v\f").empty());
}

TEST(tokenize, positions) {
    const auto tokens = tokenize("  scan\t 10 ");
    ASSERT_EQ(2u, tokens.size());
    EXPECT_EQ((Token{"scan", 2}), tokens[0]);
    EXPECT_EQ((Token{"10", 8}), tokens[1]);
}

TEST(tokenize, single) {
    const auto tokens = tokenize("list");
    ASSERT_EQ(1u, tokens.size());
    EXPECT_EQ((Token{"list", 0}), tokens[0]);
}

TEST(tokenize, non_ascii_is_part_of_token) {
    const auto tokens = tokenize("t\xc3\xa9st 1");
    ASSERT_EQ(2u, tokens.size());
    EXPECT_EQ("t\xc3\xa9st", tokens[0].text);
    EXPECT_EQ(6u, tokens[1].pos);
}

TEST(tokenize, tokens_view_the_line) {
    const std::string line = "exit now";
    const auto tokens = tokenize(line);
    ASSERT_EQ(2u, tokens.size());
    EXPECT_EQ(line.data() + 5, tokens[1].text.data());
}

TEST(is_digit_run, accepts) {
    EXPECT_TRUE(Shell::is_digit_run("0"));
    EXPECT_TRUE(Shell::is_digit_run("007"));
    EXPECT_TRUE(Shell::is_digit_run("18446744073709551616"));
}

TEST(is_digit_run, rejects) {
    EXPECT_FALSE(Shell::is_digit_run(""));
    EXPECT_FALSE(Shell::is_digit_run("-1"));
    EXPECT_FALSE(Shell::is_digit_run("+1"));
    EXPECT_FALSE(Shell::is_digit_run("1 2"));
    EXPECT_FALSE(Shell::is_digit_run("1e3"));
}
