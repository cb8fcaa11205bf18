#include "scout/commands/app_context.hpp"

#include <filesystem>
#include <stdexcept>

#include "scout/listeners/builtin_listeners.hpp"
#include "scout/log/logger.hpp"

namespace scout::commands {

std::unique_ptr<AppContext> bootstrap(const std::string& config_file,
                                      bool required) {
    auto app = std::make_unique<AppContext>();
    app->log_config = std::make_shared<log::LogConfig>();
    app->listeners_config = std::make_shared<listeners::ListenersConfig>();
    app->config_manager.register_configuration_properties(app->log_config);
    app->config_manager.register_configuration_properties(
        app->listeners_config);

    bool loaded = false;
    if (std::filesystem::exists(config_file)) {
        app->config_manager.load_config(config_file,
                                        config::format_from_path(config_file));
        loaded = true;
    } else if (required) {
        throw std::runtime_error("Config file not found: " + config_file);
    }

    log::Logger::init(*app->log_config);
    if (!loaded) {
        SCOUT_LOG_INFO << "No config file at " << config_file
                       << ", using defaults";
    }

    listeners::register_builtin_listeners(app->registry,
                                          *app->listeners_config);
    return app;
}

}  // namespace scout::commands
