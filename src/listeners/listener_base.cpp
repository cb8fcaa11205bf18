#include "scout/listeners/listener_base.hpp"

#include <system_error>
#include <utility>

#include "scout/listeners/errors.hpp"
#include "scout/log/logger.hpp"

namespace scout::listeners {

const char* to_string(ListenerState state) {
    switch (state) {
        case ListenerState::Constructed:
            return "constructed";
        case ListenerState::Listening:
            return "listening";
        case ListenerState::Stopped:
            return "stopped";
    }
    return "unknown";
}

ListenerBase::ListenerBase(std::string name) : name_(std::move(name)) {}

ListenerBase::~ListenerBase() { shutdown(); }

void ListenerBase::listen(std::shared_ptr<ServiceChannel> new_services,
                          std::shared_ptr<ServiceChannel> del_services) {
    if (!new_services || !del_services) {
        throw ListenerError("Listener " + name_ +
                            " needs both an add and a delete channel");
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != ListenerState::Constructed) {
        throw ListenerStateError("Listener " + name_ + " cannot listen, it is " +
                                 to_string(state_));
    }

    new_services_ = std::move(new_services);
    del_services_ = std::move(del_services);

    try {
        worker_ = std::thread(&ListenerBase::worker_main, this,
                              stop_source_.get_token());
    } catch (const std::system_error& e) {
        state_ = ListenerState::Stopped;
        throw ListenerError("Listener " + name_ +
                            " failed to start its worker: " + e.what());
    }
    state_ = ListenerState::Listening;
    SCOUT_LOG_INFO << "Listener " << name_ << " started";
}

void ListenerBase::stop() {
    shutdown();

    std::exception_ptr failure;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        failure = std::exchange(failure_, nullptr);
    }
    if (!failure) {
        return;
    }

    try {
        std::rethrow_exception(failure);
    } catch (const ListenerError&) {
        throw;
    } catch (const std::exception& e) {
        throw ListenerError("Listener " + name_ + " failed: " + e.what());
    } catch (...) {
        throw ListenerError("Listener " + name_ +
                            " failed with an unknown error");
    }
}

void ListenerBase::shutdown() noexcept {
    bool was_listening = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        was_listening = state_ == ListenerState::Listening;
        state_ = ListenerState::Stopped;
    }

    stop_source_.request_stop();

    {
        std::lock_guard<std::mutex> lock(join_mutex_);
        // stop() called from run(): the loop still uses the channels, the
        // join is left to a stop from another thread or to the destructor
        const bool self_stop = worker_.joinable() &&
                               worker_.get_id() == std::this_thread::get_id();
        if (!self_stop) {
            if (worker_.joinable()) {
                worker_.join();
            }
            new_services_.reset();
            del_services_.reset();
        }
    }

    if (was_listening) {
        SCOUT_LOG_INFO << "Listener " << name_ << " stopped";
    }
}

ListenerState ListenerBase::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool ListenerBase::is_live(const ID& id) const {
    std::lock_guard<std::mutex> lock(live_mutex_);
    return live_.count(id) > 0;
}

size_t ListenerBase::live_count() const {
    std::lock_guard<std::mutex> lock(live_mutex_);
    return live_.size();
}

std::vector<ID> ListenerBase::live_ids() const {
    std::lock_guard<std::mutex> lock(live_mutex_);
    std::vector<ID> ids;
    ids.reserve(live_.size());
    for (const auto& [id, service] : live_) {
        ids.push_back(id);
    }
    return ids;
}

bool ListenerBase::publish_added(std::shared_ptr<Service> service,
                                 std::stop_token token) {
    if (!service || token.stop_requested()) {
        return false;
    }

    const ID id = service->get_id();
    {
        std::lock_guard<std::mutex> lock(live_mutex_);
        if (live_.count(id)) {
            SCOUT_LOG_DEBUG << "Listener " << name_ << ": service " << id
                            << " is already live, not adding it again";
            return false;
        }
    }

    if (!new_services_->send(service, token)) {
        if (new_services_->closed()) {
            SCOUT_LOG_WARN << "Listener " << name_
                           << ": add channel is closed, dropping service "
                           << id;
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(live_mutex_);
        live_.emplace(id, std::move(service));
    }
    SCOUT_LOG_DEBUG << "Listener " << name_ << ": added service " << id;
    return true;
}

bool ListenerBase::publish_removed(const ID& id, std::stop_token token) {
    if (token.stop_requested()) {
        return false;
    }

    std::shared_ptr<Service> service;
    {
        std::lock_guard<std::mutex> lock(live_mutex_);
        auto it = live_.find(id);
        if (it == live_.end()) {
            SCOUT_LOG_DEBUG << "Listener " << name_ << ": service " << id
                            << " is not live, nothing to delete";
            return false;
        }
        service = it->second;
    }

    if (!del_services_->send(service, token)) {
        if (del_services_->closed()) {
            SCOUT_LOG_WARN << "Listener " << name_
                           << ": delete channel is closed, keeping service "
                           << id;
        }
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(live_mutex_);
        live_.erase(id);
    }
    SCOUT_LOG_DEBUG << "Listener " << name_ << ": removed service " << id;
    return true;
}

bool ListenerBase::wait_for(std::chrono::milliseconds interval,
                            std::stop_token token) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, token, interval, [] { return false; });
    return !token.stop_requested();
}

void ListenerBase::worker_main(std::stop_token token) {
    try {
        run(token);
    } catch (const std::exception& e) {
        SCOUT_LOG_ERROR << "Listener " << name_ << " failed: " << e.what();
        std::lock_guard<std::mutex> lock(state_mutex_);
        failure_ = std::current_exception();
    } catch (...) {
        SCOUT_LOG_ERROR << "Listener " << name_ << " failed with an unknown error";
        std::lock_guard<std::mutex> lock(state_mutex_);
        failure_ = std::current_exception();
    }
}

}  // namespace scout::listeners
