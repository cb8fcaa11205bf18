#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "scout/listeners/listener_base.hpp"

namespace scout::listeners {

struct ProcessInfo {
    int pid = 0;
    std::string comm;
    // Clock ticks since boot, field 22 of /proc/<pid>/stat
    uint64_t start_time = 0;
};

/// @brief Reads one process entry below @p proc_root. Returns std::nullopt if
/// the process is gone or its entry cannot be parsed.
std::optional<ProcessInfo> read_process(const std::filesystem::path& proc_root,
                                        int pid);

/// @brief A local process. Network attributes are not available.
class ProcessService : public Service {
public:
    ProcessService(ProcessInfo info, std::optional<std::string> hostname);

    /// @brief "process://<pid>:<start_time>", the start time keeps a
    /// recycled pid from reusing the id of an earlier process.
    static ID make_id(const ProcessInfo& info);

    ID get_id() const override;
    std::vector<std::string> get_ad_identifiers() const override;
    std::map<std::string, std::string> get_hosts() const override;
    std::vector<ContainerPort> get_ports() const override;
    std::vector<std::string> get_tags() const override;
    int get_pid() const override;
    std::string get_hostname() const override;

private:
    const ProcessInfo info_;
    const ID id_;
    const std::optional<std::string> hostname_;
};

/// @brief Reports processes whose command name is in the match list.
class ProcessListener : public ListenerBase {
public:
    static constexpr const char* NAME = "process";

    ProcessListener(std::filesystem::path proc_root,
                    std::chrono::milliseconds poll_interval,
                    std::vector<std::string> match);
    ~ProcessListener() override;

    /// @brief One pass over the proc root.
    std::vector<ProcessInfo> scan() const;

protected:
    void run(std::stop_token token) override;

private:
    const std::filesystem::path proc_root_;
    const std::chrono::milliseconds poll_interval_;
    const std::set<std::string> match_;
    const std::optional<std::string> hostname_;
};

}  // namespace scout::listeners
