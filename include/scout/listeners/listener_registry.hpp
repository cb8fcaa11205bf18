#pragma once

#include <functional>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "scout/listeners/types.hpp"

namespace scout::listeners {

/// @brief Table of listener factories keyed by listener name.
///
/// Backends register themselves at startup; the orchestrator then looks
/// names up and builds the listeners it needs. The registry never builds a
/// listener itself. Registration and lookup may run concurrently.
class ListenerRegistry {
public:
    /// @brief Registers @p factory under @p name.
    ///
    /// An empty factory or an empty name is logged as a warning and ignored.
    /// A name that is already registered is logged as an error and its
    /// factory is replaced by @p factory.
    void register_listener(const std::string& name,
                           ServiceListenerFactory factory);

    bool contains(const std::string& name) const;
    std::optional<ServiceListenerFactory> find(const std::string& name) const;

    /// @brief Registered names in lexical order.
    std::vector<std::string> names() const;
    size_t size() const;

    /// @brief Calls @p fn on a snapshot of the entries, so @p fn may itself
    /// register listeners.
    void for_each(const std::function<void(const std::string&,
                                           const ServiceListenerFactory&)>& fn)
        const;

private:
    mutable std::shared_mutex mutex_;
    std::map<std::string, ServiceListenerFactory> factories_;
};

}  // namespace scout::listeners
