#include "Command.hpp"
#include "Shell/CommandParser.hpp"

#include <istream>

class ParseCommand : public Command {
public:
    int run() override;

private:
    static ParseCommand instance; // Static instance to trigger registration
    ParseCommand(bool reg=false);

    // returns false if the line was rejected
    bool process_line(const std::string& line);
    // blank lines are skipped
    void process_stream(std::istream& is);

    std::string to_text(const std::string& line, const Shell::Command& cmd) const;
    std::string to_text(const std::string& line, const Shell::ParseError& err) const;
    std::string to_json(const std::string& line, const Shell::Command& cmd) const;
    std::string to_json(const std::string& line, const Shell::ParseError& err) const;

    Shell::CommandParser m_cmd_parser;
    bool m_json = false;
    bool m_canonical = false;
    bool m_color = false;
    bool m_force = false;
    size_t m_nLines = 0;
    size_t m_nErrors = 0;

    friend class CmdTestBase<ParseCommand>;
};
