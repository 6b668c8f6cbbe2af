#pragma once
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Shell {

// keywords starting with `input`, in grammar order
std::vector<std::string> candidates(std::string_view input);

// the keyword, if exactly one starts with `input`
std::optional<std::string> complete(std::string_view input);

std::string help_text();

} // namespace Shell
