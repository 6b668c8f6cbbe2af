#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <spdlog/fmt/fmt.h>

namespace Shell {

// std::chrono::seconds is signed, scan durations use the full u64 range
using Seconds = std::chrono::duration<uint64_t>;

enum class Kind : int {
    Scan = 0,
    Exit = 1,
    Help = 2,
    List = 3,
    Test = 4,
};

struct Scan {
    Seconds duration{0};
    bool operator==(const Scan&) const = default;
};

struct Exit {
    bool operator==(const Exit&) const = default;
};

struct Help {
    bool operator==(const Help&) const = default;
};

struct List {
    bool operator==(const List&) const = default;
};

// count is an opaque index, not a duration
struct Test {
    uint64_t count = 0;
    bool operator==(const Test&) const = default;
};

// alternatives are ordered as Kind
using Command = std::variant<Scan, Exit, Help, List, Test>;

struct Keyword {
    std::string_view text;
    Kind kind;
};

// grammar order, "quit" is a synonym of "exit"
constexpr std::array<Keyword, 6> KEYWORDS {{
    {"scan", Kind::Scan},
    {"exit", Kind::Exit},
    {"quit", Kind::Exit},
    {"help", Kind::Help},
    {"list", Kind::List},
    {"test", Kind::Test},
}};

constexpr bool takes_argument(Kind kind) {
    return kind == Kind::Scan || kind == Kind::Test;
}

inline Kind kind_of(const Command& cmd) {
    return static_cast<Kind>(cmd.index());
}

std::string_view keyword(Kind kind);
const std::vector<std::string>& all_strings();

// canonical text form, parses back to an equal value
std::string to_string(const Command& cmd);

} // namespace Shell

template <>
struct fmt::formatter<Shell::Kind> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const Shell::Kind& kind, FormatContext& ctx) const {
        std::string_view name;
        switch (kind) {
            case Shell::Kind::Scan: name = "Scan"; break;
            case Shell::Kind::Exit: name = "Exit"; break;
            case Shell::Kind::Help: name = "Help"; break;
            case Shell::Kind::List: name = "List"; break;
            case Shell::Kind::Test: name = "Test"; break;
            default: name = "Unknown Kind"; break;
        }
        return fmt::formatter<std::string_view>::format(name, ctx);
    }
};

template <>
struct fmt::formatter<Shell::Command> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const Shell::Command& cmd, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(Shell::to_string(cmd), ctx);
    }
};
