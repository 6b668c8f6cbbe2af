#pragma once
#include "io/Logger.hpp"
#include "text.hpp"
#include "units.hpp"

#include <cstdio>
#include <memory>
#include <string>
#include <signal.h>

#include <argparse/argparse.hpp>

#define APP_NAME "TestShell"

#define ANSI_COLOR_GREEN   "\x1b[32m"
#define ANSI_COLOR_RED     "\x1b[31m"
#define ANSI_COLOR_RESET   "\x1b[0m"

extern std::shared_ptr<Logger> logger;
extern argparse::ArgumentParser program;
extern int verbosity;
extern bool g_force;

bool init_log(const std::string& log_fname = "");
void register_program_args(argparse::ArgumentParser &parser);
void register_common_args(argparse::ArgumentParser &parser);
void signal_handler(int sig);

// colorize only when writing to a terminal
bool use_color(FILE* stream = stdout);
