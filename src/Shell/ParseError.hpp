#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <spdlog/fmt/fmt.h>

namespace Shell {

enum class ErrorKind : int {
    UnrecognizedCommand = 1,
    MalformedArgument   = 2,
    ArgumentOverflow    = 3,
    TrailingInput       = 4,
};

std::string_view to_string(ErrorKind kind);

// thrown by CommandParser::parse(), the line is rejected as a whole
class ParseError : public std::runtime_error {
public:
    ParseError(ErrorKind kind, std::string token, size_t position, const std::string& message)
        : std::runtime_error(message), m_kind(kind), m_token(std::move(token)), m_position(position) {}

    ErrorKind kind() const { return m_kind; }

    // offending token, empty when the line ended too early
    const std::string& token() const { return m_token; }

    // byte offset of the token in the line, line length when the line ended too early
    size_t position() const { return m_position; }

private:
    ErrorKind m_kind;
    std::string m_token;
    size_t m_position;
};

} // namespace Shell

template <>
struct fmt::formatter<Shell::ErrorKind> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const Shell::ErrorKind& kind, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(Shell::to_string(kind), ctx);
    }
};
