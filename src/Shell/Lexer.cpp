#include "Lexer.hpp"

namespace Shell {

bool is_digit_run(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        if (!is_digit(c)) {
            return false;
        }
    }
    return true;
}

/**
 * @brief Splits a line into whitespace-delimited tokens.
 *
 * Runs of whitespace separate tokens; leading and trailing whitespace produce no
 * empty tokens. Anything that is not ASCII whitespace (including UTF-8 sequences)
 * belongs to a token.
 *
 * @param line Input line.
 * @return Tokens in order of appearance, each with its byte offset.
 */
std::vector<Token> tokenize(std::string_view line) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < line.size()) {
        while (i < line.size() && is_space(line[i])) {
            i++;
        }
        if (i == line.size()) {
            break;
        }
        const size_t start = i;
        while (i < line.size() && !is_space(line[i])) {
            i++;
        }
        tokens.push_back(Token{line.substr(start, i - start), start});
    }
    return tokens;
}

} // namespace Shell
