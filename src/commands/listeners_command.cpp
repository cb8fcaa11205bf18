#include "scout/commands/listeners_command.hpp"

#include <iostream>

#include "scout/commands/app_context.hpp"
#include "scout/config/config.hpp"

namespace scout::commands {

ListenersCommand::ListenersCommand()
    : scout::cli::Command("listeners", "List the registered listeners") {
    add_flag_with_short("config", "c", "Configuration file path",
                        scout::config::ConfigPaths::DEFAULT_CONFIG_FILE);
    set_usage("scout listeners [--config FILE]");
}

int ListenersCommand::run(scout::cli::CommandContext& ctx) {
    auto app = bootstrap(ctx.get_flag("config"),
                         ctx.is_user_provided("config"));

    for (const auto& name : app->registry.names()) {
        std::cout << name;
        if (app->listeners_config->is_enabled(name)) {
            std::cout << " (enabled)";
        }
        std::cout << std::endl;
    }
    return 0;
}

}  // namespace scout::commands
