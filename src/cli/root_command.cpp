#include "scout/cli/root_command.hpp"

#include <iostream>

#include "scout/commands/discover_command.hpp"
#include "scout/commands/listeners_command.hpp"
#include "scout/version.hpp"

namespace scout::cli {

RootCommand::RootCommand()
    : Command("scout", "Service discovery for monitoring checks") {
    set_long_description(
        "scout watches a static services file and the process table "
        "(/proc), and streams the services it finds as add/delete events.")
        .set_usage("scout [--version] <COMMAND> [COMMAND_OPTIONS]")
        .set_example(
            "  scout listeners\n"
            "  scout discover --config config/scout.yaml\n"
            "  scout discover --listeners static,process --duration 30");

    add_bool_flag_with_short("version", "v", "Show version information");

    register_commands();
}

void RootCommand::register_commands() {
    add_command(std::make_shared<scout::commands::DiscoverCommand>());
    add_command(std::make_shared<scout::commands::ListenersCommand>());
}

int RootCommand::run(CommandContext& ctx) {
    if (ctx.get_bool_flag("version")) {
        scout::print_version();
        return 0;
    }

    print_help();
    return 1;
}

}  // namespace scout::cli
