#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "scout/listeners/listener_registry.hpp"
#include "scout/listeners/types.hpp"

namespace scout::listeners {

/// @brief Activates registered listeners and feeds them a shared pair of
/// channels.
class ListenerManager {
public:
    ListenerManager(const ListenerRegistry& registry,
                    std::shared_ptr<ServiceChannel> new_services,
                    std::shared_ptr<ServiceChannel> del_services);
    ~ListenerManager();

    ListenerManager(const ListenerManager&) = delete;
    ListenerManager& operator=(const ListenerManager&) = delete;

    /// @brief Builds and starts the listeners named in @p names.
    /// Unknown names, failing factories and failing listen() calls are
    /// logged and skipped, so one broken backend does not stop the others.
    /// @return The names that were started.
    std::vector<std::string> start(const std::vector<std::string>& names);

    /// @brief Stops every active listener.
    /// @throws ListenerError naming each listener whose discovery failed,
    /// once all of them are stopped.
    void stop_all();

    std::vector<std::string> active() const;

private:
    const ListenerRegistry& registry_;
    std::shared_ptr<ServiceChannel> new_services_;
    std::shared_ptr<ServiceChannel> del_services_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<ServiceListener>> listeners_;
};

}  // namespace scout::listeners
