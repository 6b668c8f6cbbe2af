#include <gtest/gtest.h>
#include "commands/CompleteCommand.hpp"
#include "test_utils.hpp"

class CompleteCommandTest : public CmdTestBase<CompleteCommand> {
};

TEST_F(CompleteCommandTest, registers_itself) {
    ASSERT_NE(Command::registry()["complete"], nullptr);
}

TEST_F(CompleteCommandTest, unique_prefix) {
    EXPECT_EQ("quit\n", run_cmd({"unused", "q"}));
    EXPECT_EQ("list\n", run_cmd({"unused", "lis"}));
}

TEST_F(CompleteCommandTest, no_match) {
    EXPECT_EQ("", run_cmd({"unused", "x"}, 1));
}

TEST_F(CompleteCommandTest, empty_prefix_is_ambiguous) {
    EXPECT_EQ("", run_cmd({"unused"}, 1));
}
