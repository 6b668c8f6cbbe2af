#include <gtest/gtest.h>
#include "commands/TestCommand.hpp"
#include "test_utils.hpp"

class TestCommandTest : public CmdTestBase<TestCommand> {
};

TEST_F(TestCommandTest, registers_itself) {
    EXPECT_EQ(TEST_CMD_NAME, Command::get(TEST_CMD_NAME).name());
}

TEST_F(TestCommandTest, self_test_passes) {
    run_cmd({"unused"});
}

TEST(registry, all_subcommands) {
    for (const char* name : {"parse", "complete", "syntax", TEST_CMD_NAME}) {
        EXPECT_EQ(1u, Command::registry().count(name)) << name;
        EXPECT_EQ(name, Command::get(name).name());
    }
}

TEST(registry, unknown_subcommand_throws) {
    EXPECT_THROW(Command::get("test"), std::runtime_error);
    EXPECT_EQ(0u, Command::registry().count("test"));
}
