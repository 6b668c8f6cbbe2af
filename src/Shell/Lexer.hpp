#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace Shell {

struct Token {
    std::string_view text; // points into the tokenized line
    size_t pos;            // byte offset in the line

    bool operator==(const Token&) const = default;
};

// ASCII whitespace only: space, \t, \n, \v, \f, \r
constexpr bool is_space(char c) {
    return c == ' ' || (c >= '\t' && c <= '\r');
}

constexpr bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

// one or more ASCII digits, nothing else
bool is_digit_run(std::string_view text);

// the returned tokens reference `line`, which must outlive them
std::vector<Token> tokenize(std::string_view line);

} // namespace Shell
