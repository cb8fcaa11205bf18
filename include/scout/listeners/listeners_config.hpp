#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "scout/config/config.hpp"

namespace scout::listeners {

class ListenersConfig : public config::ConfigurationProperties {
public:
    struct StaticConfig {
        std::string path = "config/services.yaml";
        int poll_interval_ms = 1000;
    };

    struct ProcessConfig {
        std::string proc_root = "/proc";
        int poll_interval_ms = 2000;
        // Command names (as in /proc/<pid>/comm) to report
        std::vector<std::string> match;
    };

    std::vector<std::string> enabled;
    // 0 means unbounded
    int channel_capacity = 64;
    StaticConfig static_file;
    ProcessConfig process;

    void from_ptree(const boost::property_tree::ptree& pt) override;
    void validate() const override;
    std::string properties_name() const override { return "listeners"; }

    bool is_enabled(const std::string& name) const;
    std::chrono::milliseconds static_poll_interval() const;
    std::chrono::milliseconds process_poll_interval() const;
};

}  // namespace scout::listeners
