#include "scout/listeners/static_listener.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

#include "scout/listeners/errors.hpp"
#include "scout/log/logger.hpp"

namespace scout::listeners {

// StaticService

StaticService::StaticService(StaticServiceDefinition definition)
    : definition_(std::move(definition)) {}

ID StaticService::get_id() const { return definition_.id; }

std::vector<std::string> StaticService::get_ad_identifiers() const {
    if (!definition_.ad_identifiers) {
        throw NotSupportedError("ad_identifiers of " + definition_.id);
    }
    return *definition_.ad_identifiers;
}

std::map<std::string, std::string> StaticService::get_hosts() const {
    if (!definition_.hosts) {
        throw NotSupportedError("hosts of " + definition_.id);
    }
    return *definition_.hosts;
}

std::vector<ContainerPort> StaticService::get_ports() const {
    if (!definition_.ports) {
        throw NotSupportedError("ports of " + definition_.id);
    }
    return *definition_.ports;
}

std::vector<std::string> StaticService::get_tags() const {
    if (!definition_.tags) {
        throw NotSupportedError("tags of " + definition_.id);
    }
    return *definition_.tags;
}

int StaticService::get_pid() const {
    if (!definition_.pid) {
        throw NotSupportedError("pid of " + definition_.id);
    }
    return *definition_.pid;
}

std::string StaticService::get_hostname() const {
    if (!definition_.hostname) {
        throw NotSupportedError("hostname of " + definition_.id);
    }
    return *definition_.hostname;
}

// Parsing

namespace {

ContainerPort parse_port(const YAML::Node& node) {
    int number = 0;
    ContainerPort port;
    if (node.IsMap()) {
        number = node["port"].as<int>();
        if (node["name"]) {
            port.name = node["name"].as<std::string>();
        }
    } else {
        number = node.as<int>();
    }
    if (number < 0 || number > 65535) {
        throw std::out_of_range("port " + std::to_string(number) +
                                " is outside 0-65535");
    }
    port.port = static_cast<uint16_t>(number);
    return port;
}

StaticServiceDefinition parse_definition(const YAML::Node& node) {
    StaticServiceDefinition definition;
    if (!node.IsMap() || !node["id"]) {
        throw std::invalid_argument("entry has no id");
    }
    definition.id = node["id"].as<std::string>();
    if (definition.id.empty()) {
        throw std::invalid_argument("entry has an empty id");
    }

    if (node["ad_identifiers"]) {
        definition.ad_identifiers =
            node["ad_identifiers"].as<std::vector<std::string>>();
    }
    if (node["hosts"]) {
        definition.hosts =
            node["hosts"].as<std::map<std::string, std::string>>();
    }
    if (auto ports = node["ports"]) {
        std::vector<ContainerPort> parsed;
        for (const auto& port : ports) {
            parsed.push_back(parse_port(port));
        }
        definition.ports = std::move(parsed);
    }
    if (node["tags"]) {
        definition.tags = node["tags"].as<std::vector<std::string>>();
    }
    if (node["pid"]) {
        definition.pid = node["pid"].as<int>();
    }
    if (node["hostname"]) {
        definition.hostname = node["hostname"].as<std::string>();
    }
    return definition;
}

std::optional<std::string> read_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return buffer.str();
}

}  // namespace

std::vector<StaticServiceDefinition> parse_static_services(
    const YAML::Node& root) {
    std::vector<StaticServiceDefinition> definitions;
    if (!root || root.IsNull()) {
        return definitions;
    }

    auto services = root["services"];
    if (!services || services.IsNull()) {
        return definitions;
    }
    if (!services.IsSequence()) {
        throw std::invalid_argument("\"services\" must be a list");
    }

    std::unordered_set<ID> seen;
    size_t index = 0;
    for (const auto& node : services) {
        try {
            auto definition = parse_definition(node);
            if (!seen.insert(definition.id).second) {
                SCOUT_LOG_WARN << "Static service " << definition.id
                               << " is listed twice, keeping the first entry";
                ++index;
                continue;
            }
            definitions.push_back(std::move(definition));
        } catch (const std::exception& e) {
            SCOUT_LOG_WARN << "Skipping static service entry #" << index
                           << ": " << e.what();
        }
        ++index;
    }
    return definitions;
}

// StaticListener

StaticListener::StaticListener(std::string path,
                               std::chrono::milliseconds poll_interval)
    : ListenerBase(NAME),
      path_(std::move(path)),
      poll_interval_(poll_interval) {
    if (path_.empty()) {
        throw ListenerError("Static listener needs a services file path");
    }
}

StaticListener::~StaticListener() { shutdown(); }

void StaticListener::run(std::stop_token token) {
    SCOUT_LOG_INFO << "Static listener watching " << path_ << " every "
                   << poll_interval_.count() << "ms";
    do {
        poll(token);
    } while (wait_for(poll_interval_, token));
}

void StaticListener::poll(std::stop_token token) {
    auto content = read_file(path_);
    if (loaded_ && content == last_content_) {
        return;
    }

    std::vector<StaticServiceDefinition> definitions;
    if (!content) {
        if (!missing_reported_) {
            SCOUT_LOG_WARN << "Static services file " << path_
                           << " not found, reporting no services";
            missing_reported_ = true;
        }
    } else {
        missing_reported_ = false;
        try {
            definitions = parse_static_services(YAML::Load(*content));
        } catch (const std::exception& e) {
            // Keep what is already reported until the file is fixed
            SCOUT_LOG_ERROR << "Failed to parse static services file "
                            << path_ << ": " << e.what();
            last_content_ = std::move(content);
            loaded_ = true;
            return;
        }
    }

    if (sync(definitions, token)) {
        last_content_ = std::move(content);
        loaded_ = true;
    }
}

bool StaticListener::sync(
    const std::vector<StaticServiceDefinition>& definitions,
    std::stop_token token) {
    std::unordered_map<ID, const StaticServiceDefinition*> wanted;
    for (const auto& definition : definitions) {
        wanted.emplace(definition.id, &definition);
    }

    // Deletions first, so that a changed entry is deleted before its
    // replacement is added under the same id
    for (auto it = current_.begin(); it != current_.end();) {
        auto match = wanted.find(it->first);
        if (match != wanted.end() && *match->second == it->second) {
            ++it;
            continue;
        }
        if (!publish_removed(it->first, token)) {
            return false;
        }
        it = current_.erase(it);
    }

    for (const auto& definition : definitions) {
        if (current_.count(definition.id)) {
            continue;
        }
        if (!publish_added(std::make_shared<StaticService>(definition),
                           token)) {
            return false;
        }
        current_.emplace(definition.id, definition);
    }
    return true;
}

}  // namespace scout::listeners
