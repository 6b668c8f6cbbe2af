/**
 * @file CommandParser.cpp
 * @brief Single-pass parser for shell command lines.
 *
 * A line is tokenized on ASCII whitespace and fed through a three-state machine:
 * the first token selects the production by keyword, "scan" and "test" consume
 * exactly one digit-run argument, and any token left after that rejects the line.
 * Every rejection is reported as a ParseError carrying the offending token.
 */

#include "CommandParser.hpp"
#include "utils/text.hpp"

#include <charconv>
#include <limits>
#include <optional>
#include <system_error>

namespace Shell {

std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnrecognizedCommand: return "UnrecognizedCommand";
        case ErrorKind::MalformedArgument:   return "MalformedArgument";
        case ErrorKind::ArgumentOverflow:    return "ArgumentOverflow";
        case ErrorKind::TrailingInput:       return "TrailingInput";
    }
    return "Unknown ErrorKind";
}

Kind CommandParser::match_keyword(const Token& token) {
    for (const auto& kw : KEYWORDS) {
        if (kw.text == token.text) {
            return kw.kind;
        }
    }
    throw ParseError(ErrorKind::UnrecognizedCommand, std::string(token.text), token.pos,
        fmt::format("unrecognized command \"{}\" at {}", filter_unprintable(token.text), token.pos));
}

/**
 * @brief Converts a digit-run token to an unsigned 64-bit integer.
 *
 * Leading zeros are accepted ("007" is 7). Signs, hex prefixes and embedded
 * non-digits are rejected, as is anything larger than UINT64_MAX.
 *
 * @param token Argument token.
 * @return Numeric value of the token.
 * @throws ParseError MalformedArgument if the token is not a digit-run,
 *                    ArgumentOverflow if the value does not fit.
 */
uint64_t CommandParser::parse_number(const Token& token) {
    if (!is_digit_run(token.text)) {
        throw ParseError(ErrorKind::MalformedArgument, std::string(token.text), token.pos,
            fmt::format("invalid argument \"{}\" at {}: expected a non-negative integer", filter_unprintable(token.text), token.pos));
    }

    uint64_t value = 0;
    const char* first = token.text.data();
    const char* last = first + token.text.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec == std::errc::result_out_of_range) {
        throw ParseError(ErrorKind::ArgumentOverflow, std::string(token.text), token.pos,
            fmt::format("argument \"{}\" at {} is out of range (max {})", token.text, token.pos, std::numeric_limits<uint64_t>::max()));
    }
    if (ec != std::errc() || ptr != last) {
        // unreachable for a digit-run, kept so a bad conversion never yields a value
        throw ParseError(ErrorKind::MalformedArgument, std::string(token.text), token.pos,
            fmt::format("invalid argument \"{}\" at {}", token.text, token.pos));
    }
    return value;
}

Command CommandParser::make_command(Kind kind, uint64_t argument) {
    switch (kind) {
        case Kind::Scan: return Scan{Seconds{argument}};
        case Kind::Exit: return Exit{};
        case Kind::Help: return Help{};
        case Kind::List: return List{};
        case Kind::Test: return Test{argument};
    }
    throw std::logic_error(fmt::format("unhandled command kind {}", static_cast<int>(kind)));
}

/**
 * @brief Parses one line into a command value.
 *
 * Errors are reported at the first offending token, scanning left to right:
 * "scan abc 6" fails on "abc", "scan 5 6" fails on "6".
 *
 * @param line One input line, without or with the trailing newline.
 * @return Parsed command.
 * @throws ParseError on any line that does not match one production exactly.
 */
Command CommandParser::parse(std::string_view line) const {
    const std::vector<Token> tokens = tokenize(line);

    State state = State::AwaitingKeyword;
    Kind kind = Kind::Exit;
    std::string_view kw;
    std::optional<uint64_t> argument;

    for (const Token& token : tokens) {
        switch (state) {
            case State::AwaitingKeyword:
                kind = match_keyword(token);
                kw = token.text;
                state = takes_argument(kind) ? State::AwaitingArgument : State::Done;
                break;

            case State::AwaitingArgument:
                argument = parse_number(token);
                state = State::Done;
                break;

            case State::Done:
                if (takes_argument(kind)) {
                    throw ParseError(ErrorKind::MalformedArgument, std::string(token.text), token.pos,
                        fmt::format("unexpected \"{}\" at {}: \"{}\" takes exactly one argument", filter_unprintable(token.text), token.pos, kw));
                }
                throw ParseError(ErrorKind::TrailingInput, std::string(token.text), token.pos,
                    fmt::format("unexpected \"{}\" at {}: \"{}\" takes no arguments", filter_unprintable(token.text), token.pos, kw));
        }
    }

    switch (state) {
        case State::AwaitingKeyword:
            throw ParseError(ErrorKind::UnrecognizedCommand, "", line.size(), "empty command");
        case State::AwaitingArgument:
            throw ParseError(ErrorKind::MalformedArgument, "", line.size(),
                fmt::format("\"{}\" expects an argument: {} <N>", kw, kw));
        case State::Done:
            break;
    }

    return make_command(kind, argument.value_or(0));
}

} // namespace Shell
