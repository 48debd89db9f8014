#pragma once
#include "Command.hpp"

class IndexCommand : public Command {
public:
    int run() override;

private:
    static IndexCommand instance; // Static instance to trigger registration
    IndexCommand(bool reg=false);

    friend class CmdTestBase<IndexCommand>;
};
