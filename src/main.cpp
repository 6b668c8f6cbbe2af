/**
 * @file main.cpp
 * @brief Main entry point for the testshell tool.
 *
 * Parses the command line, selects the registered subcommand, initializes logging
 * and runs a silent self-test of the command grammar before the subcommand itself.
 */

#include <argparse/argparse.hpp>
#include <iostream>

#include "utils/common.hpp"
#include "dist/version.h"

#include "commands/TestCommand.hpp"

int main(int argc, char*argv[]) {
    signal(SIGSEGV, signal_handler);
    signal(SIGABRT, signal_handler);

    register_program_args(program);

    for (const auto& [name, cmd] : Command::registry()) {
        program.add_subparser(cmd->parser());
    }

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    logger->set_arguments(argc, argv);
    logger->set_banner(APP_NAME " " APP_VERSION);
    logger->set_verbosity(verbosity); // should be before logger->add_file() call

    Command& selfTestCmd = Command::get(TEST_CMD_NAME);
    for (const auto& [name, cmd] : Command::registry()) {
        if (!program.is_subcommand_used(name)) {
            continue;
        }

        argparse::ArgumentParser& sub = cmd->parser();
        logger->set_dedup_limit(sub.is_used("--log-dedup-limit") ? sub.get<int>("--log-dedup-limit") : program.get<int>("--log-dedup-limit"));

        std::string log_fname;
        if( sub.is_used("--log") ){
            log_fname = sub.get<std::string>("--log");
        } else if( program.is_used("--log") ){
            log_fname = program.get<std::string>("--log");
        }
        if( !init_log(log_fname) ){
            return 1;
        }

        if( name == TEST_CMD_NAME ){
            // explicit self-test, make it visible
            logger->set_verbosity(9);
        } else {
            // implicit self-test, make it silent
            if( selfTestCmd.run() != 0 ){
                logger->critical("self-test failed, exiting");
                return 1;
            }
        }

        // warning: only use if all your loggers are thread-safe ("_mt" loggers)
        spdlog::flush_every(std::chrono::seconds(5));

        try {
            return cmd->run();
        } catch (const std::exception& e) {
            logger->critical("{} failed: {}", cmd->name(), e.what());
            return 1;
        }
    }

    std::cout << program;
    return 0;
}
