#pragma once

#include "scout/listeners/listener_registry.hpp"
#include "scout/listeners/listeners_config.hpp"

namespace scout::listeners {

/// @brief Registers the listeners shipped with scout ("static", "process").
/// The factories copy @p config, later changes to it are not seen.
void register_builtin_listeners(ListenerRegistry& registry,
                                const ListenersConfig& config);

}  // namespace scout::listeners
