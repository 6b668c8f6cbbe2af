#pragma once
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/common.hpp"

using testing::HasSubstr;

std::string capture_stdout(const std::function<void()>& func);
std::vector<std::string> split(const std::string& str, const char delimiter);
std::string trim(const std::string& str);
void for_each_line(const std::string& str, const std::function<void(const std::string& line)>& func);
std::filesystem::path write_temp_file(const std::string& name, const std::string& content);

template <typename TCmd>
class CmdTestBase : public ::testing::Test {
    protected:

    void SetUp() override {
        g_force = false; // set by any -f seen earlier in this process
    }

    // args[0] is the program name, as in argv; returns what the command printed
    std::string run_cmd(const std::vector<std::string>& args, int expected_code = 0) {
        TCmd cmd;
        logger->set_arguments(args);
        cmd.parser().parse_args(args);
        int code = -1;
        std::string output = capture_stdout([&](){
            code = cmd.run();
        });
        EXPECT_EQ(expected_code, code);
        return output;
    }
};
