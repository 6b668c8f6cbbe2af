#include <gtest/gtest.h>
#include "Shell/Completion.hpp"
#include "test_utils.hpp"

using Shell::candidates;
using Shell::complete;

TEST(complete, unique_prefix) {
    EXPECT_EQ("exit", complete("e"));
    EXPECT_EQ("quit", complete("q"));
    EXPECT_EQ("help", complete("h"));
    EXPECT_EQ("list", complete("li"));
    EXPECT_EQ("scan", complete("s"));
    EXPECT_EQ("test", complete("t"));
}

TEST(complete, full_keyword) {
    EXPECT_EQ("scan", complete("scan"));
    EXPECT_EQ("quit", complete("quit"));
}

TEST(complete, empty_is_ambiguous) {
    EXPECT_FALSE(complete("").has_value());
}

TEST(complete, no_match) {
    EXPECT_FALSE(complete("x").has_value());
    EXPECT_FALSE(complete("scan 5").has_value());
    EXPECT_FALSE(complete("scanner").has_value());
    EXPECT_FALSE(complete("E").has_value());
}

TEST(candidates, in_grammar_order) {
    const std::vector<std::string> all {"scan", "exit", "quit", "help", "list", "test"};
    EXPECT_EQ(all, candidates(""));
    EXPECT_EQ(std::vector<std::string>{"list"}, candidates("l"));
    EXPECT_TRUE(candidates("z").empty());
}

TEST(help_text, lists_commands_and_syntaxes) {
    const std::string text = Shell::help_text();
    EXPECT_THAT(text, HasSubstr("Available commands: scan, exit, quit, help, list, test"));
    EXPECT_THAT(text, HasSubstr("scan <number_of_seconds>"));
    EXPECT_THAT(text, HasSubstr("test <list_device_index>"));
}
