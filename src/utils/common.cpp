/**
 * @file common.cpp
 * @brief Global state and utilities shared by all subcommands.
 *
 * Defines the global logger and argument parser, the options every subcommand
 * accepts, log initialization, and the crash handler that prints a stack trace
 * through libbacktrace.
 */

#include "common.hpp"
#include "dist/version.h"

#include <cstdlib>
#include <unistd.h>
#include <spdlog/sinks/stdout_color_sinks.h>

int verbosity = 0;
bool g_force = false;

// stdout carries parse results, diagnostics go to stderr
static std::shared_ptr<spdlog::logger> make_console_logger() {
    auto console = spdlog::stderr_color_mt(APP_NAME);
    spdlog::set_default_logger(console);
    return console;
}

std::shared_ptr<Logger> logger = std::make_shared<Logger>(make_console_logger());
argparse::ArgumentParser program(APP_NAME, APP_VERSION, argparse::default_arguments::help);

// begin stack trace generation on error
#include <backtrace.h>

static void backtrace_error_cb(void *, const char *msg, int errnum) {
    logger->critical("Error: {} (Error number: {})", msg, errnum);
}

static int backtrace_full_cb(void *, uintptr_t pc, const char *filename, int lineno, const char *function) {
    logger->critical("     {} {}:{} ({})", (void *)pc, filename ? filename : "??", lineno, function ? function : "??");
    return 0;  // Continue processing the backtrace
}

void signal_handler(int sig) {
    logger->critical("Signal {} received, printing backtrace...", sig);

    backtrace_state *state = backtrace_create_state(NULL, 0, backtrace_error_cb, NULL);
    backtrace_full(state, 0, backtrace_full_cb, backtrace_error_cb, NULL);

    _exit(1);
}
// end stack trace generation on error

bool use_color(FILE* stream){
    return isatty(fileno(stream)) != 0;
}

/**
 * @brief Initializes logging once per process.
 *
 * With an explicit log pathname the file must be writable, otherwise there is
 * nothing to add and the session start is logged to the console only.
 *
 * @param log_fname Log pathname from --log, may be empty.
 * @return False if an explicit log file could not be opened.
 */
bool init_log(const std::string& log_fname){
    static bool inited = false;
    if( inited ){
        return true;
    }

    inited = true;
    if( !log_fname.empty() && !logger->add_file(log_fname) ){
        logger->critical("explicit log pathname is set, refusing to continue without log");
        return false;
    }
    logger->start();
    return true;
}

void register_common_args(argparse::ArgumentParser &parser) {
    parser.add_argument("-v", "--verbose")
        .help("increase verbosity")
        .action([&](const auto &) { ++verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-q", "--quiet")
        .help("decrease verbosity")
        .action([&](const auto &) { --verbosity; })
        .append()
        .implicit_value(true)
        .nargs(0);

    parser.add_argument("-f", "--force")
        .implicit_value(true)
        .store_into(g_force)
        .help("continue after lines that fail to parse");

    parser.add_argument("-L", "--log")
        .help("log pathname [default: console only]");
    parser.add_argument("--log-dedup-limit")
        .default_value(100)
        .scan<'i', int>()
        .help("limit duplicate log messages, 0 = no limit");
}

void register_program_args(argparse::ArgumentParser &parser) {
    register_common_args(parser);

    parser.add_argument("--version")
        .action([&](const auto & /*unused*/) {
            fmt::print("{}\n", APP_VERSION);
            std::exit(0);
        })
        .default_value(false)
        .help("print version information and exit")
        .implicit_value(true)
        .nargs(0);
}
