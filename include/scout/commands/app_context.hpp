#pragma once

#include <memory>
#include <string>

#include "scout/config/config.hpp"
#include "scout/listeners/listener_registry.hpp"
#include "scout/listeners/listeners_config.hpp"
#include "scout/log/log_config.hpp"

namespace scout::commands {

// Composition root shared by the subcommands
struct AppContext {
    config::ConfigManager config_manager;
    std::shared_ptr<log::LogConfig> log_config;
    std::shared_ptr<listeners::ListenersConfig> listeners_config;
    listeners::ListenerRegistry registry;
};

// Loads the configuration, starts logging and registers the builtin
// listeners. A missing file is only an error when @p required is set,
// otherwise defaults are used.
std::unique_ptr<AppContext> bootstrap(const std::string& config_file,
                                      bool required);

}  // namespace scout::commands
