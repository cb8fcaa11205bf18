#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "scout/listeners/channel.hpp"

namespace scout::listeners {

/// @brief Unique identifier of one discovered service instance.
/// Stable for the lifetime of the instance and never handed to a different
/// instance while the old one may still be referenced.
using ID = std::string;

/// @brief One exposed network port of a service.
struct ContainerPort {
    uint16_t port = 0;
    /// @brief Port name, possibly empty.
    std::string name;

    bool operator==(const ContainerPort& other) const {
        return port == other.port && name == other.name;
    }
};

/// @brief A running entity a check can be attached to.
///
/// Backends expose what they know through the accessors below. Every
/// accessor except get_id() throws NotSupportedError when the backend has no
/// way to provide the datum; a failing accessor never affects the others.
/// The discovery core never looks at the concrete type.
class Service {
public:
    virtual ~Service() = default;

    virtual ID get_id() const = 0;
    /// @brief Identifiers matched against check templates, may be empty.
    virtual std::vector<std::string> get_ad_identifiers() const = 0;
    /// @brief Network name to address.
    virtual std::map<std::string, std::string> get_hosts() const = 0;
    virtual std::vector<ContainerPort> get_ports() const = 0;
    virtual std::vector<std::string> get_tags() const = 0;
    virtual int get_pid() const = 0;
    /// @brief hostname.domainname of the entity.
    virtual std::string get_hostname() const = 0;
};

using ServiceChannel = Channel<std::shared_ptr<Service>>;

/// @brief Watches one backend and reports services as they come and go.
///
/// Lifecycle: constructed -> listening -> stopped, never back.
class ServiceListener {
public:
    virtual ~ServiceListener() = default;

    /// @brief Starts discovery in the background and returns.
    /// New services are sent on @p new_services, vanished ones on
    /// @p del_services. For a given ID the add event always comes before the
    /// delete event.
    /// @throws ListenerStateError if the listener already listened or was
    /// stopped.
    virtual void listen(std::shared_ptr<ServiceChannel> new_services,
                        std::shared_ptr<ServiceChannel> del_services) = 0;

    /// @brief Stops discovery and releases backend resources. No event is
    /// sent once this returns. Safe to call more than once and never blocks
    /// on a consumer that stopped draining the channels.
    /// @throws ListenerError if the background discovery failed.
    virtual void stop() = 0;
};

/// @brief Builds a listener, throws on failure.
using ServiceListenerFactory =
    std::function<std::unique_ptr<ServiceListener>()>;

}  // namespace scout::listeners
