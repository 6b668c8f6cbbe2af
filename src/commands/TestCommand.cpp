/**
 * @file TestCommand.cpp
 * @brief Implementation of the TestCommand for grammar self-testing.
 *
 * Runs the command parser over a fixed table of lines covering every production,
 * the integer boundaries and each failure kind, and checks the outcome. main()
 * runs it silently before any other subcommand, so a miscompiled parser is caught
 * before it is trusted with real input.
 */

#include "TestCommand.hpp"
#include "utils/common.hpp"
#include "Shell/CommandParser.hpp"

#include <cstdint>
#include <optional>
#include <variant>

REGISTER_COMMAND(TestCommand);

namespace {

struct SelfTestCase {
    const char* line;
    std::variant<Shell::Command, Shell::ErrorKind> expected;
};

const SelfTestCase SELF_TEST_CASES[] = {
    {"scan 0",                     Shell::Command{Shell::Scan{Shell::Seconds{0}}}},
    {"scan 10",                    Shell::Command{Shell::Scan{Shell::Seconds{10}}}},
    {"scan 007",                   Shell::Command{Shell::Scan{Shell::Seconds{7}}}},
    {"scan 18446744073709551615",  Shell::Command{Shell::Scan{Shell::Seconds{UINT64_MAX}}}},
    {"  test\t3 ",                 Shell::Command{Shell::Test{3}}},
    {"test 18446744073709551615",  Shell::Command{Shell::Test{UINT64_MAX}}},
    {"exit",                       Shell::Command{Shell::Exit{}}},
    {"quit",                       Shell::Command{Shell::Exit{}}},
    {"help",                       Shell::Command{Shell::Help{}}},
    {"list",                       Shell::Command{Shell::List{}}},
    {"",                           Shell::ErrorKind::UnrecognizedCommand},
    {"scanner 5",                  Shell::ErrorKind::UnrecognizedCommand},
    {"SCAN 5",                     Shell::ErrorKind::UnrecognizedCommand},
    {"scan",                       Shell::ErrorKind::MalformedArgument},
    {"scan abc",                   Shell::ErrorKind::MalformedArgument},
    {"scan -1",                    Shell::ErrorKind::MalformedArgument},
    {"scan 5 6",                   Shell::ErrorKind::MalformedArgument},
    {"scan 18446744073709551616",  Shell::ErrorKind::ArgumentOverflow},
    {"test 99999999999999999999",  Shell::ErrorKind::ArgumentOverflow},
    {"exit now",                   Shell::ErrorKind::TrailingInput},
    {"list 1",                     Shell::ErrorKind::TrailingInput},
};

} // namespace

/**
 * @brief Constructs a TestCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
TestCommand::TestCommand(bool reg) : Command(reg, TEST_CMD_NAME, "self-test") {
}

/**
 * @brief Executes the grammar self-test.
 *
 * @return EXIT_SUCCESS (0) if all cases pass, EXIT_FAILURE (1) on the first failing case.
 */
int TestCommand::run() {
    const Shell::CommandParser parser{};

    for (const auto& tc : SELF_TEST_CASES) {
        std::optional<Shell::Command> result;
        std::optional<Shell::ErrorKind> error;
        try {
            result = parser.parse(tc.line);
        } catch (const Shell::ParseError& e) {
            error = e.kind();
        }

        if (const auto* expected = std::get_if<Shell::Command>(&tc.expected)) {
            if (!result || *result != *expected) {
                logger->critical("selftest: \"{}\": expected {}, got {}", tc.line, *expected,
                    result ? fmt::format("{}", *result) : fmt::format("{}", *error));
                return 1;
            }
            // canonical text must parse back to the same value
            if (parser.parse(Shell::to_string(*result)) != *result) {
                logger->critical("selftest: \"{}\" does not round-trip", Shell::to_string(*result));
                return 1;
            }
        } else {
            const auto expected_error = std::get<Shell::ErrorKind>(tc.expected);
            if (!error || *error != expected_error) {
                logger->critical("selftest: \"{}\": expected {}, got {}", tc.line, expected_error,
                    error ? fmt::format("{}", *error) : fmt::format("{}", *result));
                return 1;
            }
        }
        logger->trace("selftest: \"{}\" OK", tc.line);
    }

    logger->trace("selftest: OK");
    return 0;
}
