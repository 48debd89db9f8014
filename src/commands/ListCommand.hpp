#pragma once
#include "Command.hpp"

class ListCommand : public Command {
public:
    int run() override;

private:
    static ListCommand instance; // Static instance to trigger registration
    ListCommand(bool reg=false);

    friend class CmdTestBase<ListCommand>;
};
