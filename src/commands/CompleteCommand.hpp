#include "Command.hpp"

class CompleteCommand : public Command {
public:
    int run() override;

private:
    static CompleteCommand instance; // Static instance to trigger registration
    CompleteCommand(bool reg=false);

    friend class CmdTestBase<CompleteCommand>;
};
