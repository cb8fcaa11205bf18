#include "scout/listeners/builtin_listeners.hpp"

#include "scout/listeners/process_listener.hpp"
#include "scout/listeners/static_listener.hpp"

namespace scout::listeners {

void register_builtin_listeners(ListenerRegistry& registry,
                                const ListenersConfig& config) {
    registry.register_listener(
        StaticListener::NAME,
        [static_config = config.static_file,
         interval = config.static_poll_interval()]()
            -> std::unique_ptr<ServiceListener> {
            return std::make_unique<StaticListener>(static_config.path,
                                                    interval);
        });

    registry.register_listener(
        ProcessListener::NAME,
        [process_config = config.process,
         interval = config.process_poll_interval()]()
            -> std::unique_ptr<ServiceListener> {
            return std::make_unique<ProcessListener>(
                process_config.proc_root, interval, process_config.match);
        });
}

}  // namespace scout::listeners
