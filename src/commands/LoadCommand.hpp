#pragma once
#include "Command.hpp"

class LoadCommand : public Command {
public:
    int run() override;

private:
    static LoadCommand instance; // Static instance to trigger registration
    LoadCommand(bool reg = false);

    int load(const std::vector<std::string>& args);
    void stat_bak(const std::string& path);

    friend class CmdTestBase<LoadCommand>;
};
