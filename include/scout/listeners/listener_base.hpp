#pragma once

#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "scout/listeners/types.hpp"

namespace scout::listeners {

enum class ListenerState { Constructed, Listening, Stopped };

const char* to_string(ListenerState state);

/// @brief Lifecycle plumbing shared by the bundled listeners.
///
/// Runs run() on a worker thread between listen() and stop(), keeps the table
/// of live services so that an ID is only ever added once before it is
/// deleted, and turns a failing worker into an error returned by stop().
///
/// Derived classes must call shutdown() from their own destructor so that the
/// worker is joined before their members are destroyed.
class ListenerBase : public ServiceListener {
public:
    explicit ListenerBase(std::string name);
    ~ListenerBase() override;

    ListenerBase(const ListenerBase&) = delete;
    ListenerBase& operator=(const ListenerBase&) = delete;

    void listen(std::shared_ptr<ServiceChannel> new_services,
                std::shared_ptr<ServiceChannel> del_services) override;
    void stop() override;

    const std::string& name() const { return name_; }
    ListenerState state() const;
    bool is_live(const ID& id) const;
    size_t live_count() const;

protected:
    /// @brief Discovery loop, runs on the worker thread until @p token is
    /// stopped. Exceptions escaping it are recorded as a listener failure.
    virtual void run(std::stop_token token) = 0;

    /// @brief Sends @p service on the add channel and marks it live.
    /// @return false if the ID is already live or if the listener is stopping.
    bool publish_added(std::shared_ptr<Service> service, std::stop_token token);

    /// @brief Sends the live service with @p id on the delete channel and
    /// forgets it.
    /// @return false if the ID is not live or if the listener is stopping.
    bool publish_removed(const ID& id, std::stop_token token);

    std::vector<ID> live_ids() const;

    /// @brief Sleeps for @p interval, waking early on stop.
    /// @return false when the listener is stopping.
    bool wait_for(std::chrono::milliseconds interval, std::stop_token token);

    /// @brief Stops and joins the worker. Never throws. Called from the
    /// worker itself it only requests the stop.
    void shutdown() noexcept;

private:
    void worker_main(std::stop_token token);

    const std::string name_;

    mutable std::mutex state_mutex_;
    ListenerState state_ = ListenerState::Constructed;
    std::exception_ptr failure_;

    std::shared_ptr<ServiceChannel> new_services_;
    std::shared_ptr<ServiceChannel> del_services_;

    mutable std::mutex live_mutex_;
    std::unordered_map<ID, std::shared_ptr<Service>> live_;

    std::mutex wait_mutex_;
    std::condition_variable_any wait_cv_;

    std::mutex join_mutex_;
    std::stop_source stop_source_;
    std::thread worker_;
};

}  // namespace scout::listeners
