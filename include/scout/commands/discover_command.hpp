#pragma once
#include <functional>
#include <memory>
#include <string>
#include <unordered_set>

#include "scout/cli/command.hpp"
#include "scout/listeners/types.hpp"

namespace scout::commands {

enum class EventKind { Added, Removed };

using EventHandler = std::function<void(
    EventKind, const std::shared_ptr<listeners::Service>&)>;

/// @brief Merges the add and delete channels into one ordered event stream.
///
/// The channels are independent queues, so a consumer can find a delete and
/// the add it follows waiting at the same time. The drain remembers which
/// ids it has reported as added and uses that to put every delete right
/// after the add it belongs to, also when an id is deleted and added again
/// between two drains.
class EventDrain {
public:
    EventDrain(listeners::ServiceChannel& added,
               listeners::ServiceChannel& removed);

    /// @brief Hands every queued event to @p handler without blocking.
    /// @return Number of events handled.
    size_t drain(const EventHandler& handler);

    size_t live_count() const { return live_.size(); }

private:
    void emit(EventKind kind, const std::shared_ptr<listeners::Service>& service,
              const EventHandler& handler);

    listeners::ServiceChannel& added_;
    listeners::ServiceChannel& removed_;
    std::unordered_set<listeners::ID> live_;
};

class DiscoverCommand : public scout::cli::Command {
public:
    DiscoverCommand();
    int run(scout::cli::CommandContext& ctx) override;

private:
    void setup_flags();
};

}  // namespace scout::commands
