/**
 * @file Completion.cpp
 * @brief Keyword completion and help text for the interactive shell prompt.
 */

#include "Completion.hpp"
#include "Command.hpp"

#include <spdlog/fmt/ranges.h> // for fmt::join()

namespace Shell {

std::vector<std::string> candidates(std::string_view input) {
    std::vector<std::string> result;
    for (const auto& kw : all_strings()) {
        if (std::string_view(kw).substr(0, input.size()) == input) {
            result.push_back(kw);
        }
    }
    return result;
}

/**
 * @brief Completes a partially typed keyword.
 *
 * Only a unique match completes: "e" gives "exit", while "" (all keywords) and
 * "x" (none) give nothing. A full keyword completes to itself.
 *
 * @param input Text typed so far.
 * @return The completed keyword, or std::nullopt.
 */
std::optional<std::string> complete(std::string_view input) {
    std::vector<std::string> matches = candidates(input);
    if (matches.size() == 1) {
        return matches.front();
    }
    return std::nullopt;
}

std::string help_text() {
    std::string text = fmt::format("Available commands: {}\n", fmt::join(all_strings(), ", "));
    text += "Some specific syntaxes:\n";
    text += "   scan <number_of_seconds>\n";
    text += "   test <list_device_index>\n";
    return text;
}

} // namespace Shell
