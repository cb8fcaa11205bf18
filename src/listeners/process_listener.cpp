#include "scout/listeners/process_listener.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <climits>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "scout/listeners/errors.hpp"
#include "scout/log/logger.hpp"

namespace scout::listeners {

namespace {

constexpr size_t STAT_START_TIME_FIELD = 22;

std::optional<std::string> local_hostname() {
    char buffer[HOST_NAME_MAX + 1] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        SCOUT_LOG_WARN << "gethostname failed, process hostnames unavailable";
        return std::nullopt;
    }
    return std::string(buffer);
}

bool is_pid_name(const std::string& name) {
    return !name.empty() &&
           std::all_of(name.begin(), name.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

}  // namespace

std::optional<ProcessInfo> read_process(const std::filesystem::path& proc_root,
                                        int pid) {
    const auto dir = proc_root / std::to_string(pid);

    ProcessInfo info;
    info.pid = pid;

    std::ifstream comm_file(dir / "comm");
    if (!comm_file.is_open() || !std::getline(comm_file, info.comm)) {
        return std::nullopt;
    }

    std::ifstream stat_file(dir / "stat");
    std::string stat;
    if (!stat_file.is_open() || !std::getline(stat_file, stat)) {
        return std::nullopt;
    }

    // "pid (comm) state ppid ...": comm may hold spaces and parentheses
    auto rparen = stat.rfind(')');
    if (rparen == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream fields(stat.substr(rparen + 1));
    std::string field;
    // The first field after the command is field 3
    for (size_t index = 3; index <= STAT_START_TIME_FIELD; ++index) {
        if (!(fields >> field)) {
            return std::nullopt;
        }
    }
    try {
        info.start_time = std::stoull(field);
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return info;
}

// ProcessService

ProcessService::ProcessService(ProcessInfo info,
                               std::optional<std::string> hostname)
    : info_(std::move(info)),
      id_(make_id(info_)),
      hostname_(std::move(hostname)) {}

ID ProcessService::make_id(const ProcessInfo& info) {
    return "process://" + std::to_string(info.pid) + ":" +
           std::to_string(info.start_time);
}

ID ProcessService::get_id() const { return id_; }

std::vector<std::string> ProcessService::get_ad_identifiers() const {
    return {info_.comm};
}

std::map<std::string, std::string> ProcessService::get_hosts() const {
    throw NotSupportedError("hosts of " + id_);
}

std::vector<ContainerPort> ProcessService::get_ports() const {
    throw NotSupportedError("ports of " + id_);
}

std::vector<std::string> ProcessService::get_tags() const {
    return {"process:" + info_.comm};
}

int ProcessService::get_pid() const { return info_.pid; }

std::string ProcessService::get_hostname() const {
    if (!hostname_) {
        throw NotSupportedError("hostname of " + id_);
    }
    return *hostname_;
}

// ProcessListener

ProcessListener::ProcessListener(std::filesystem::path proc_root,
                                 std::chrono::milliseconds poll_interval,
                                 std::vector<std::string> match)
    : ListenerBase(NAME),
      proc_root_(std::move(proc_root)),
      poll_interval_(poll_interval),
      match_(match.begin(), match.end()),
      hostname_(local_hostname()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(proc_root_, ec)) {
        throw ListenerError("Process listener: " + proc_root_.string() +
                            " is not a directory");
    }
    if (match_.empty()) {
        throw ListenerError("Process listener needs at least one command name");
    }
}

ProcessListener::~ProcessListener() { shutdown(); }

std::vector<ProcessInfo> ProcessListener::scan() const {
    std::vector<ProcessInfo> found;
    for (const auto& entry :
         std::filesystem::directory_iterator(proc_root_)) {
        const auto name = entry.path().filename().string();
        if (!is_pid_name(name)) {
            continue;
        }
        int pid = 0;
        try {
            pid = std::stoi(name);
        } catch (const std::out_of_range&) {
            continue;
        }
        // Entries disappear while we read them, skip those quietly
        auto info = read_process(proc_root_, pid);
        if (info && match_.count(info->comm)) {
            found.push_back(std::move(*info));
        }
    }
    return found;
}

void ProcessListener::run(std::stop_token token) {
    SCOUT_LOG_INFO << "Process listener scanning " << proc_root_.string()
                   << " every " << poll_interval_.count() << "ms";
    do {
        std::unordered_set<ID> seen;
        for (auto& info : scan()) {
            auto service =
                std::make_shared<ProcessService>(std::move(info), hostname_);
            const ID id = service->get_id();
            seen.insert(id);
            if (!is_live(id) && !publish_added(std::move(service), token) &&
                token.stop_requested()) {
                return;
            }
        }

        for (const auto& id : live_ids()) {
            if (seen.count(id)) {
                continue;
            }
            if (!publish_removed(id, token) && token.stop_requested()) {
                return;
            }
        }
    } while (wait_for(poll_interval_, token));
}

}  // namespace scout::listeners
