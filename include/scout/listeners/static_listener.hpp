#pragma once

#include <yaml-cpp/yaml.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "scout/listeners/listener_base.hpp"

namespace scout::listeners {

/// @brief One entry of a static services file. Attributes left out of the
/// file are reported as unsupported by the matching accessor.
struct StaticServiceDefinition {
    ID id;
    std::optional<std::vector<std::string>> ad_identifiers;
    std::optional<std::map<std::string, std::string>> hosts;
    std::optional<std::vector<ContainerPort>> ports;
    std::optional<std::vector<std::string>> tags;
    std::optional<int> pid;
    std::optional<std::string> hostname;

    bool operator==(const StaticServiceDefinition& other) const = default;
};

class StaticService : public Service {
public:
    explicit StaticService(StaticServiceDefinition definition);

    ID get_id() const override;
    std::vector<std::string> get_ad_identifiers() const override;
    std::map<std::string, std::string> get_hosts() const override;
    std::vector<ContainerPort> get_ports() const override;
    std::vector<std::string> get_tags() const override;
    int get_pid() const override;
    std::string get_hostname() const override;

    const StaticServiceDefinition& definition() const { return definition_; }

private:
    const StaticServiceDefinition definition_;
};

/// @brief Reads the "services" list of a static services document. Invalid
/// or duplicate entries are logged and skipped.
std::vector<StaticServiceDefinition> parse_static_services(
    const YAML::Node& root);

/// @brief Reports the services listed in a YAML file and follows the
/// changes made to it.
class StaticListener : public ListenerBase {
public:
    static constexpr const char* NAME = "static";

    StaticListener(std::string path, std::chrono::milliseconds poll_interval);
    ~StaticListener() override;

protected:
    void run(std::stop_token token) override;

private:
    // Returns false when the listener is stopping or a channel is closed
    bool sync(const std::vector<StaticServiceDefinition>& definitions,
              std::stop_token token);
    void poll(std::stop_token token);

    const std::string path_;
    const std::chrono::milliseconds poll_interval_;

    bool loaded_ = false;
    bool missing_reported_ = false;
    std::optional<std::string> last_content_;
    std::unordered_map<ID, StaticServiceDefinition> current_;
};

}  // namespace scout::listeners
