#pragma once
#include "Command.hpp"

class IterateCommand : public Command {
public:
    int run() override;

private:
    static IterateCommand instance; // Static instance to trigger registration
    IterateCommand(bool reg=false);

    friend class CmdTestBase<IterateCommand>;
};
