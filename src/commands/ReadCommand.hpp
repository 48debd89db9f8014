#pragma once
#include "Command.hpp"

class ReadCommand : public Command {
public:
    int run() override;

private:
    static ReadCommand instance; // Static instance to trigger registration
    ReadCommand(bool reg=false);

    friend class CmdTestBase<ReadCommand>;
};
