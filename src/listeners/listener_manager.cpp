#include "scout/listeners/listener_manager.hpp"

#include "scout/listeners/errors.hpp"
#include "scout/log/logger.hpp"

namespace scout::listeners {

ListenerManager::ListenerManager(const ListenerRegistry& registry,
                                 std::shared_ptr<ServiceChannel> new_services,
                                 std::shared_ptr<ServiceChannel> del_services)
    : registry_(registry),
      new_services_(std::move(new_services)),
      del_services_(std::move(del_services)) {}

ListenerManager::~ListenerManager() {
    try {
        stop_all();
    } catch (const std::exception& e) {
        SCOUT_LOG_ERROR << "Error while stopping listeners: " << e.what();
    }
}

std::vector<std::string> ListenerManager::start(
    const std::vector<std::string>& names) {
    std::vector<std::string> started;

    for (const auto& name : names) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (listeners_.count(name)) {
                SCOUT_LOG_WARN << "Listener " << name
                               << " is already active, skipping";
                continue;
            }
        }

        auto factory = registry_.find(name);
        if (!factory) {
            SCOUT_LOG_ERROR << "Listener " << name << " was not registered";
            continue;
        }

        std::unique_ptr<ServiceListener> listener;
        try {
            listener = (*factory)();
        } catch (const std::exception& e) {
            SCOUT_LOG_ERROR << "Failed to create listener " << name << ": "
                            << e.what();
            continue;
        }
        if (!listener) {
            SCOUT_LOG_ERROR << "Factory for listener " << name
                            << " returned no listener";
            continue;
        }

        try {
            listener->listen(new_services_, del_services_);
        } catch (const std::exception& e) {
            SCOUT_LOG_ERROR << "Listener " << name
                            << " failed to start: " << e.what();
            continue;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.emplace(name, std::move(listener));
        started.push_back(name);
    }

    return started;
}

void ListenerManager::stop_all() {
    std::map<std::string, std::unique_ptr<ServiceListener>> listeners;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners.swap(listeners_);
    }

    std::string failures;
    for (auto& [name, listener] : listeners) {
        try {
            listener->stop();
        } catch (const std::exception& e) {
            SCOUT_LOG_ERROR << "Listener " << name
                            << " reported an error on stop: " << e.what();
            if (!failures.empty()) {
                failures += "; ";
            }
            failures += name + ": " + e.what();
        }
    }

    if (!failures.empty()) {
        throw ListenerError("Listeners failed: " + failures);
    }
}

std::vector<std::string> ListenerManager::active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(listeners_.size());
    for (const auto& [name, listener] : listeners_) {
        names.push_back(name);
    }
    return names;
}

}  // namespace scout::listeners
