#include <gtest/gtest.h>
#include "utils/text.hpp"

TEST(filter_unprintable, printable_unchanged) {
    EXPECT_EQ("scan 5 ~!@#", filter_unprintable("scan 5 ~!@#"));
}

TEST(filter_unprintable, control_and_non_ascii) {
    EXPECT_EQ("a.b..c.", filter_unprintable("a\tb\xc3\xa9" "c\x7f"));
}

TEST(filter_unprintable, embedded_nul) {
    using namespace std::string_view_literals;
    EXPECT_EQ("scan.5", filter_unprintable("scan\0" "5"sv));
}

TEST(filter_unprintable, empty) {
    EXPECT_EQ("", filter_unprintable(""));
}
