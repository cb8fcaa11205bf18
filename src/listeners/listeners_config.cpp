#include "scout/listeners/listeners_config.hpp"

#include <algorithm>
#include <stdexcept>

namespace scout::listeners {

void ListenersConfig::from_ptree(const boost::property_tree::ptree& pt) {
    if (pt.get_child_optional("enabled")) {
        load_vector(pt, "enabled", enabled);
    }
    channel_capacity = get_value(pt, "channel_capacity", channel_capacity);

    if (auto static_pt = pt.get_child_optional("static")) {
        static_file.path = get_value(*static_pt, "path", static_file.path);
        static_file.poll_interval_ms = get_value(
            *static_pt, "poll_interval_ms", static_file.poll_interval_ms);
    }

    if (auto process_pt = pt.get_child_optional("process")) {
        process.proc_root =
            get_value(*process_pt, "proc_root", process.proc_root);
        process.poll_interval_ms = get_value(
            *process_pt, "poll_interval_ms", process.poll_interval_ms);
        load_vector(*process_pt, "match", process.match);
    }
}

void ListenersConfig::validate() const {
    for (const auto& name : enabled) {
        if (name.empty()) {
            throw std::invalid_argument(
                "listeners.enabled must not contain empty names");
        }
    }
    if (channel_capacity < 0) {
        throw std::invalid_argument(
            "listeners.channel_capacity must be >= 0");
    }

    if (static_file.poll_interval_ms <= 0) {
        throw std::invalid_argument(
            "listeners.static.poll_interval_ms must be > 0");
    }
    if (is_enabled("static") && static_file.path.empty()) {
        throw std::invalid_argument(
            "listeners.static.path must not be empty when the static listener "
            "is enabled");
    }

    if (process.poll_interval_ms <= 0) {
        throw std::invalid_argument(
            "listeners.process.poll_interval_ms must be > 0");
    }
    if (process.proc_root.empty()) {
        throw std::invalid_argument(
            "listeners.process.proc_root must not be empty");
    }
    if (is_enabled("process") && process.match.empty()) {
        throw std::invalid_argument(
            "listeners.process.match must list at least one command name when "
            "the process listener is enabled");
    }
}

bool ListenersConfig::is_enabled(const std::string& name) const {
    return std::find(enabled.begin(), enabled.end(), name) != enabled.end();
}

std::chrono::milliseconds ListenersConfig::static_poll_interval() const {
    return std::chrono::milliseconds(static_file.poll_interval_ms);
}

std::chrono::milliseconds ListenersConfig::process_poll_interval() const {
    return std::chrono::milliseconds(process.poll_interval_ms);
}

}  // namespace scout::listeners
