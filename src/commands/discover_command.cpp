#include "scout/commands/discover_command.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <sstream>
#include <thread>
#include <vector>

#include "nlohmann/json.hpp"
#include "scout/commands/app_context.hpp"
#include "scout/config/config.hpp"
#include "scout/listeners/errors.hpp"
#include "scout/listeners/listener_manager.hpp"
#include "scout/listeners/service_snapshot.hpp"
#include "scout/log/logger.hpp"

namespace scout::commands {

namespace {

volatile std::sig_atomic_t g_signal_status = 0;

extern "C" void handle_signal(int signal) { g_signal_status = signal; }

constexpr auto POLL_INTERVAL = std::chrono::milliseconds(100);

std::vector<std::string> split_names(const std::string& list) {
    std::vector<std::string> names;
    std::istringstream stream(list);
    std::string name;
    while (std::getline(stream, name, ',')) {
        if (!name.empty()) {
            names.push_back(name);
        }
    }
    return names;
}

void print_event(EventKind kind,
                 const std::shared_ptr<listeners::Service>& service) {
    nlohmann::json event;
    if (kind == EventKind::Added) {
        event["event"] = "add";
        event["service"] = listeners::capture(*service);
    } else {
        // The entity may already be gone, only the id is reliable
        event["event"] = "delete";
        event["id"] = service->get_id();
    }
    std::cout << event.dump() << std::endl;
}

}  // namespace

EventDrain::EventDrain(listeners::ServiceChannel& added,
                       listeners::ServiceChannel& removed)
    : added_(added), removed_(removed) {}

size_t EventDrain::drain(const EventHandler& handler) {
    // Deletions first: the add of each one is then either already reported
    // or queued on the add channel
    std::vector<std::shared_ptr<listeners::Service>> deletions;
    while (auto service = removed_.try_receive()) {
        deletions.push_back(std::move(*service));
    }
    std::vector<bool> reported(deletions.size(), false);

    auto find_pending = [&](const listeners::ID& id) -> std::optional<size_t> {
        for (size_t i = 0; i < deletions.size(); ++i) {
            if (!reported[i] && deletions[i]->get_id() == id) {
                return i;
            }
        }
        return std::nullopt;
    };

    size_t handled = 0;
    while (auto service = added_.try_receive()) {
        const auto id = (*service)->get_id();
        if (live_.count(id)) {
            auto pending = find_pending(id);
            if (!pending) {
                // Re-added after the deletions were read: its delete was
                // queued before the add, so it is on the channel by now
                while (auto late = removed_.try_receive()) {
                    deletions.push_back(std::move(*late));
                    reported.push_back(false);
                }
                pending = find_pending(id);
            }
            if (pending) {
                emit(EventKind::Removed, deletions[*pending], handler);
                reported[*pending] = true;
                ++handled;
            }
        }
        emit(EventKind::Added, *service, handler);
        ++handled;
    }

    for (size_t i = 0; i < deletions.size(); ++i) {
        if (!reported[i]) {
            emit(EventKind::Removed, deletions[i], handler);
            ++handled;
        }
    }
    return handled;
}

void EventDrain::emit(EventKind kind,
                      const std::shared_ptr<listeners::Service>& service,
                      const EventHandler& handler) {
    if (kind == EventKind::Added) {
        live_.insert(service->get_id());
    } else {
        live_.erase(service->get_id());
    }
    handler(kind, service);
}

DiscoverCommand::DiscoverCommand()
    : scout::cli::Command("discover",
                          "Run listeners and print service events") {
    setup_flags();
    set_long_description(
        "Starts the selected listeners and prints one JSON document per "
        "line for every service added or deleted, until interrupted or "
        "until --duration elapses.")
        .set_usage("scout discover [OPTIONS]")
        .set_example(
            "  scout discover\n"
            "  scout discover --listeners static --duration 10");
}

void DiscoverCommand::setup_flags() {
    add_flag_with_short("config", "c", "Configuration file path",
                        scout::config::ConfigPaths::DEFAULT_CONFIG_FILE);
    add_flag_with_short("listeners", "l",
                        "Comma separated listener names, overrides "
                        "listeners.enabled",
                        "");
    add_int_flag("duration", "Seconds to run, 0 runs until interrupted", 0);
}

int DiscoverCommand::run(scout::cli::CommandContext& ctx) {
    auto app = bootstrap(ctx.get_flag("config"),
                         ctx.is_user_provided("config"));

    std::vector<std::string> names = app->listeners_config->enabled;
    if (ctx.is_user_provided("listeners")) {
        names = split_names(ctx.get_flag("listeners"));
    }
    if (names.empty()) {
        SCOUT_LOG_ERROR << "No listener selected, set listeners.enabled or "
                           "pass --listeners";
        return 1;
    }

    const int duration = ctx.get_int_flag("duration");
    if (duration < 0) {
        SCOUT_LOG_ERROR << "--duration must not be negative";
        return 1;
    }

    const size_t capacity =
        static_cast<size_t>(app->listeners_config->channel_capacity);
    auto added = std::make_shared<listeners::ServiceChannel>(capacity);
    auto removed = std::make_shared<listeners::ServiceChannel>(capacity);

    listeners::ListenerManager manager(app->registry, added, removed);
    if (manager.start(names).empty()) {
        SCOUT_LOG_ERROR << "None of the selected listeners could be started";
        return 1;
    }

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::seconds(duration);
    EventDrain events(*added, *removed);
    while (g_signal_status == 0 &&
           (duration == 0 || std::chrono::steady_clock::now() < deadline)) {
        if (events.drain(print_event) == 0) {
            std::this_thread::sleep_for(POLL_INTERVAL);
        }
    }

    SCOUT_LOG_INFO << "Stopping listeners";
    int status = 0;
    try {
        manager.stop_all();
    } catch (const listeners::ListenerError& e) {
        SCOUT_LOG_ERROR << e.what();
        status = 2;
    }

    // Events sent before the listeners stopped
    events.drain(print_event);
    added->close();
    removed->close();

    log::Logger::shutdown();
    return status;
}

}  // namespace scout::commands
