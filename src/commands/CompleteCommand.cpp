/**
 * @file CompleteCommand.cpp
 * @brief Implementation of the CompleteCommand for shell keyword completion.
 *
 * Exposes the completion used by the interactive prompt: a prefix completes only
 * when exactly one keyword starts with it.
 */

#include "CompleteCommand.hpp"
#include "utils/common.hpp"
#include "Shell/Completion.hpp"

#include <spdlog/fmt/ranges.h> // for fmt::join()

REGISTER_COMMAND(CompleteCommand);

/**
 * @brief Constructs a CompleteCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
CompleteCommand::CompleteCommand(bool reg) : Command(reg, "complete", "complete a command keyword") {
    m_parser.add_argument("prefix").help("keyword prefix").nargs(argparse::nargs_pattern::optional).default_value(std::string{});
}

/**
 * @brief Prints the unique completion of the prefix.
 *
 * @return EXIT_SUCCESS (0) if the prefix completes, EXIT_FAILURE (1) if it is
 *         ambiguous or matches nothing.
 */
int CompleteCommand::run() {
    const std::string prefix = m_parser.get("prefix");
    const auto completion = Shell::complete(prefix);
    if (completion) {
        fmt::print("{}\n", *completion);
        return 0;
    }

    const auto matches = Shell::candidates(prefix);
    if (matches.empty()) {
        logger->warn("no command starts with \"{}\"", filter_unprintable(prefix));
    } else {
        logger->warn("\"{}\" is ambiguous: {}", filter_unprintable(prefix), fmt::join(matches, ", "));
    }
    return 1;
}
