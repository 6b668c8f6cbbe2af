/**
 * @file Command.cpp
 * @brief Keywords and canonical text form of shell command values.
 */

#include "Command.hpp"

namespace Shell {

/**
 * @brief Returns the canonical keyword of a command kind.
 *
 * Exit always maps to "exit", the "quit" spelling is not recoverable from a value.
 */
std::string_view keyword(Kind kind) {
    for (const auto& kw : KEYWORDS) {
        if (kw.kind == kind) {
            return kw.text;
        }
    }
    return "";
}

/**
 * @brief Returns every recognized keyword, synonyms included, in grammar order.
 */
const std::vector<std::string>& all_strings() {
    static const std::vector<std::string> strings = [] {
        std::vector<std::string> result;
        result.reserve(KEYWORDS.size());
        for (const auto& kw : KEYWORDS) {
            result.emplace_back(kw.text);
        }
        return result;
    }();
    return strings;
}

std::string to_string(const Command& cmd) {
    const std::string_view kw = keyword(kind_of(cmd));
    if (const auto* scan = std::get_if<Scan>(&cmd)) {
        return fmt::format("{} {}", kw, scan->duration.count());
    }
    if (const auto* test = std::get_if<Test>(&cmd)) {
        return fmt::format("{} {}", kw, test->count);
    }
    return std::string(kw);
}

} // namespace Shell
