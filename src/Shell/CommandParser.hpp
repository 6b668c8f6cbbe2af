#pragma once
#include <cstdint>
#include <string_view>

#include "Command.hpp"
#include "Lexer.hpp"
#include "ParseError.hpp"

namespace Shell {

/*
 * Grammar, one command per line, whitespace-delimited, case-sensitive:
 *
 *   scan <N>    Scan, N seconds
 *   exit        Exit
 *   quit        Exit
 *   help        Help
 *   list        List
 *   test <N>    Test, N as is
 *
 *   N := [0-9]+, must fit in uint64_t
 *
 * Stateless, one instance may be shared between threads.
 */
class CommandParser {
public:
    enum class State {
        AwaitingKeyword,
        AwaitingArgument,
        Done,
    };

    // throws ParseError, never returns a partial match
    Command parse(std::string_view line) const;

    // converts a digit-run token, throws MalformedArgument / ArgumentOverflow
    static uint64_t parse_number(const Token& token);

private:
    static Kind match_keyword(const Token& token);
    static Command make_command(Kind kind, uint64_t argument);
};

} // namespace Shell
