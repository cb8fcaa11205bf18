#pragma once
#include <memory>

#include "scout/cli/command.hpp"

namespace scout::cli {

class RootCommand : public Command {
public:
    RootCommand();

    int run(CommandContext& ctx) override;

private:
    void register_commands();
};

}  // namespace scout::cli
