#include "SyntaxCommand.hpp"
#include "utils/common.hpp"
#include "Shell/Completion.hpp"

REGISTER_COMMAND(SyntaxCommand);

SyntaxCommand::SyntaxCommand(bool reg) : Command(reg, "syntax", "show the shell command syntax") {
}

int SyntaxCommand::run() {
    fmt::print("{}", Shell::help_text());
    return 0;
}
