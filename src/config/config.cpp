#include "scout/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>

#include "scout/log/logger.hpp"

namespace scout::config {

ConfigFormat format_from_path(const std::string& path) {
    auto ext = std::filesystem::path(path).extension().string();
    if (ext == ".json") return ConfigFormat::JSON;
    if (ext == ".ini") return ConfigFormat::INI;
    return ConfigFormat::YAML;
}

boost::property_tree::ptree ConfigManager::yaml_to_ptree(
    const YAML::Node& node) {
    boost::property_tree::ptree pt;
    if (node.IsMap()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.add_child(it->first.as<std::string>(),
                         yaml_to_ptree(it->second));
        }
    } else if (node.IsSequence()) {
        for (YAML::const_iterator it = node.begin(); it != node.end(); ++it) {
            pt.push_back({"", yaml_to_ptree(*it)});  // array element
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    SCOUT_LOG_INFO << "Loading config file: " << config_file;

    if (!std::filesystem::exists(config_file)) {
        throw std::runtime_error("Config file not found: " + config_file);
    }

    boost::property_tree::ptree tree;
    try {
        switch (format) {
            case ConfigFormat::YAML: {
                tree = yaml_to_ptree(YAML::LoadFile(config_file));
                break;
            }
            case ConfigFormat::JSON: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_json(ifs, tree);
                break;
            }
            case ConfigFormat::INI: {
                std::ifstream ifs(config_file);
                boost::property_tree::read_ini(ifs, tree);
                break;
            }
        }
    } catch (const std::exception& e) {
        SCOUT_LOG_ERROR << "Failed to parse config file: " << config_file
                        << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = std::move(tree);
    }
    load_component_configs();
    SCOUT_LOG_INFO << "Successfully loaded config file: " << config_file;
}

void ConfigManager::reset() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    configs_.clear();
    config_tree_ = boost::property_tree::ptree();
}

void ConfigManager::load_component_configs() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();

        auto section = config_tree_.get_child_optional(properties_name);
        if (!section) {
            SCOUT_LOG_DEBUG << "No configuration found for properties: "
                            << properties_name << ", using defaults";
            config->validate();
            continue;
        }

        try {
            config->from_ptree(*section);
            config->validate();
            SCOUT_LOG_DEBUG << "Loaded configuration for properties: "
                            << properties_name;
        } catch (const std::exception& e) {
            SCOUT_LOG_ERROR << "Failed to load configuration for properties "
                            << properties_name << ": " << e.what();
            throw;
        }
    }
}

}  // namespace scout::config
