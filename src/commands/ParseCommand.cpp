/**
 * @file ParseCommand.cpp
 * @brief Implementation of the ParseCommand for checking shell command lines.
 *
 * Runs the shell grammar over lines taken from the command line, a file or
 * stdin and reports, for every line, either the parsed command value or the
 * structured parse failure. Nothing is executed: this is the batch front end
 * of the grammar, used to validate scripts and to inspect parser behaviour.
 */

#include "ParseCommand.hpp"
#include "utils/common.hpp"

#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

REGISTER_COMMAND(ParseCommand);

/**
 * @brief Constructs a ParseCommand with the specified registration status.
 * @param reg Boolean indicating whether to register this command with the command registry.
 */
ParseCommand::ParseCommand(bool reg) : Command(reg, "parse", "parse shell command lines") {
    m_parser.add_argument("lines")
        .help("lines to parse, one argument per line [default: read stdin]")
        .nargs(argparse::nargs_pattern::any)
        .default_value(std::vector<std::string>{});
    m_parser.add_argument("-i", "--input").help("read lines from file, \"-\" for stdin");
    m_parser.add_argument("--json").help("print one JSON object per line").default_value(false).implicit_value(true);
    m_parser.add_argument("--canonical").help("print only the canonical form of accepted lines").default_value(false).implicit_value(true);
}

static std::string quoted(const std::string& line) {
    return "\"" + filter_unprintable(line) + "\"";
}

static bool is_blank(const std::string& line) {
    for (char c : line) {
        if (!Shell::is_space(c)) {
            return false;
        }
    }
    return true;
}

std::string ParseCommand::to_text(const std::string& line, const Shell::Command& cmd) const {
    std::string desc = Shell::to_string(cmd);
    if (const auto* scan = std::get_if<Shell::Scan>(&cmd)) {
        desc += fmt::format(" ({})", seconds2human(scan->duration.count()));
    }
    return fmt::format("{}OK{}   {:<28} {}",
        m_color ? ANSI_COLOR_GREEN : "", m_color ? ANSI_COLOR_RESET : "", quoted(line), desc);
}

std::string ParseCommand::to_text(const std::string& line, const Shell::ParseError& err) const {
    return fmt::format("{}ERR{}  {:<28} {}: {}",
        m_color ? ANSI_COLOR_RED : "", m_color ? ANSI_COLOR_RESET : "", quoted(line), err.kind(), err.what());
}

std::string ParseCommand::to_json(const std::string& line, const Shell::Command& cmd) const {
    auto j = nlohmann::ordered_json{
        {"line", line},
        {"ok", true},
        {"command", std::string(Shell::keyword(Shell::kind_of(cmd)))},
    };
    if (const auto* scan = std::get_if<Shell::Scan>(&cmd)) {
        j["seconds"] = scan->duration.count();
    } else if (const auto* test = std::get_if<Shell::Test>(&cmd)) {
        j["count"] = test->count;
    }
    // user input is not guaranteed to be valid UTF-8
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string ParseCommand::to_json(const std::string& line, const Shell::ParseError& err) const {
    const auto j = nlohmann::ordered_json{
        {"line", line},
        {"ok", false},
        {"error", std::string(Shell::to_string(err.kind()))},
        {"token", err.token()},
        {"position", err.position()},
        {"message", err.what()},
    };
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

/**
 * @brief Parses one line and prints the outcome in the selected format.
 *
 * In --canonical mode rejected lines produce no output, they are only logged.
 *
 * @param line Input line.
 * @return True if the line was accepted.
 */
bool ParseCommand::process_line(const std::string& line) {
    m_nLines++;
    try {
        const Shell::Command cmd = m_cmd_parser.parse(line);
        logger->debug("line {}: {} -> {}", m_nLines, quoted(line), cmd);
        if (m_json) {
            fmt::print("{}\n", to_json(line, cmd));
        } else if (m_canonical) {
            fmt::print("{}\n", cmd);
        } else {
            fmt::print("{}\n", to_text(line, cmd));
        }
        return true;
    } catch (const Shell::ParseError& e) {
        m_nErrors++;
        if (m_json) {
            fmt::print("{}\n", to_json(line, e));
        } else if (m_canonical) {
            logger->error("line {}: {}", m_nLines, e.what());
        } else {
            fmt::print("{}\n", to_text(line, e));
        }
        return false;
    }
}

void ParseCommand::process_stream(std::istream& is) {
    std::string line;
    while (std::getline(is, line)) {
        if (is_blank(line)) {
            continue;
        }
        if (!process_line(line) && !m_force) {
            return;
        }
    }
}

/**
 * @brief Executes the parse command.
 *
 * Positional lines are parsed first, then the --input file; stdin is read only
 * when neither is given. Stops at the first rejected line unless --force.
 *
 * @return EXIT_SUCCESS (0) if every line was accepted, EXIT_FAILURE (1) otherwise.
 */
int ParseCommand::run() {
    m_json = m_parser.get<bool>("--json");
    m_canonical = m_parser.get<bool>("--canonical");
    m_force = g_force || m_parser.is_used("--force");
    m_color = !m_json && use_color(stdout);
    m_nLines = 0;
    m_nErrors = 0;

    const auto lines = m_parser.get<std::vector<std::string>>("lines");
    bool go_on = true;
    for (const auto& line : lines) {
        if (!process_line(line) && !m_force) {
            go_on = false;
            break;
        }
    }

    if (go_on && m_parser.is_used("--input")) {
        const std::string fname = m_parser.get("--input");
        if (fname == "-") {
            process_stream(std::cin);
        } else {
            std::ifstream f(fname);
            if (!f.is_open()) {
                logger->error("Cannot open input file {}", fname);
                return 1;
            }
            process_stream(f);
        }
    } else if (go_on && lines.empty()) {
        process_stream(std::cin);
    }

    std::fflush(stdout);
    logger->debug("parsed {} lines, {} rejected", m_nLines, m_nErrors);
    return m_nErrors == 0 ? 0 : 1;
}
