#include "scout/listeners/listener_registry.hpp"

#include <mutex>

#include "scout/log/logger.hpp"

namespace scout::listeners {

void ListenerRegistry::register_listener(const std::string& name,
                                         ServiceListenerFactory factory) {
    if (!factory) {
        SCOUT_LOG_WARN << "Service listener factory " << name
                       << " does not exist, not registering it.";
        return;
    }
    if (name.empty()) {
        SCOUT_LOG_WARN
            << "Service listener factory registered without a name, ignoring.";
        return;
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = factories_.try_emplace(name, factory);
    if (!inserted) {
        SCOUT_LOG_ERROR << "Service listener factory " << name
                        << " already registered, replacing it.";
        it->second = std::move(factory);
    }
}

bool ListenerRegistry::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return factories_.count(name) > 0;
}

std::optional<ServiceListenerFactory> ListenerRegistry::find(
    const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> ListenerRegistry::names() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> result;
    result.reserve(factories_.size());
    for (const auto& [name, factory] : factories_) {
        result.push_back(name);
    }
    return result;
}

size_t ListenerRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return factories_.size();
}

void ListenerRegistry::for_each(
    const std::function<void(const std::string&,
                             const ServiceListenerFactory&)>& fn) const {
    std::map<std::string, ServiceListenerFactory> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot = factories_;
    }
    for (const auto& [name, factory] : snapshot) {
        fn(name, factory);
    }
}

}  // namespace scout::listeners
