#pragma once
#include "scout/cli/command.hpp"

namespace scout::commands {

class ListenersCommand : public scout::cli::Command {
public:
    ListenersCommand();
    int run(scout::cli::CommandContext& ctx) override;
};

}  // namespace scout::commands
