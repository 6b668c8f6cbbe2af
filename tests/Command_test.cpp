#include <gtest/gtest.h>
#include "Shell/Command.hpp"

#include <limits>

using namespace Shell;

TEST(keyword, canonical) {
    EXPECT_EQ("scan", keyword(Kind::Scan));
    EXPECT_EQ("exit", keyword(Kind::Exit));
    EXPECT_EQ("help", keyword(Kind::Help));
    EXPECT_EQ("list", keyword(Kind::List));
    EXPECT_EQ("test", keyword(Kind::Test));
}

TEST(all_strings, grammar_order) {
    const std::vector<std::string> expected {"scan", "exit", "quit", "help", "list", "test"};
    EXPECT_EQ(expected, all_strings());
}

TEST(kind_of, matches_alternative) {
    EXPECT_EQ(Kind::Scan, kind_of(Scan{Seconds{1}}));
    EXPECT_EQ(Kind::Exit, kind_of(Exit{}));
    EXPECT_EQ(Kind::Help, kind_of(Help{}));
    EXPECT_EQ(Kind::List, kind_of(List{}));
    EXPECT_EQ(Kind::Test, kind_of(Shell::Test{1}));
}

TEST(takes_argument, scan_and_test_only) {
    EXPECT_TRUE(takes_argument(Kind::Scan));
    EXPECT_TRUE(takes_argument(Kind::Test));
    EXPECT_FALSE(takes_argument(Kind::Exit));
    EXPECT_FALSE(takes_argument(Kind::Help));
    EXPECT_FALSE(takes_argument(Kind::List));
}

TEST(to_string, canonical_text) {
    EXPECT_EQ("scan 90", to_string(Scan{Seconds{90}}));
    EXPECT_EQ("scan 18446744073709551615", to_string(Scan{Seconds{std::numeric_limits<uint64_t>::max()}}));
    EXPECT_EQ("exit", to_string(Exit{}));
    EXPECT_EQ("help", to_string(Help{}));
    EXPECT_EQ("list", to_string(List{}));
    EXPECT_EQ("test 0", to_string(Shell::Test{0}));
}

TEST(equality, compares_payload) {
    EXPECT_EQ(Command{Scan{Seconds{5}}}, Command{Scan{Seconds{5}}});
    EXPECT_NE(Command{Scan{Seconds{5}}}, Command{Scan{Seconds{6}}});
    EXPECT_NE(Command{Scan{Seconds{5}}}, Command{Shell::Test{5}});
    EXPECT_EQ(Command{Exit{}}, Command{Exit{}});
    EXPECT_NE(Command{Help{}}, Command{List{}});
}

TEST(formatter, command_and_kind) {
    EXPECT_EQ("scan 3", fmt::format("{}", Command{Scan{Seconds{3}}}));
    EXPECT_EQ("[test 4]", fmt::format("[{}]", Command{Shell::Test{4}}));
    EXPECT_EQ("Exit", fmt::format("{}", Kind::Exit));
}
