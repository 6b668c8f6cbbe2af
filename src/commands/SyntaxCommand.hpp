#include "Command.hpp"

class SyntaxCommand : public Command {
public:
    int run() override;

private:
    static SyntaxCommand instance; // Static instance to trigger registration
    SyntaxCommand(bool reg=false);

    friend class CmdTestBase<SyntaxCommand>;
};
