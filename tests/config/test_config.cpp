// tests/config/test_config.cpp
#define BOOST_TEST_MODULE ConfigTests
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>

#include "scout/config/config.hpp"
#include "scout/listeners/listeners_config.hpp"
#include "scout/log/log_config.hpp"

namespace fs = boost::filesystem;

using scout::config::ConfigFormat;
using scout::config::ConfigManager;
using scout::listeners::ListenersConfig;
using scout::log::LogConfig;

// Creates a scratch directory and a ConfigManager with both sections
// registered
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / fs::unique_path("scout_test_configs_%%%%");
    ConfigManager manager;
    std::shared_ptr<LogConfig> log_config = std::make_shared<LogConfig>();
    std::shared_ptr<ListenersConfig> listeners_config =
        std::make_shared<ListenersConfig>();

    ConfigFixture() {
        fs::create_directories(temp_dir);
        manager.register_configuration_properties(log_config);
        manager.register_configuration_properties(listeners_config);
    }

    ~ConfigFixture() { fs::remove_all(temp_dir); }

    fs::path create_temp_file(const std::string& filename,
                              const std::string& content) {
        fs::path file_path = temp_dir / filename;
        std::ofstream ofs(file_path.string());
        ofs << content;
        ofs.close();
        return file_path;
    }
};

BOOST_FIXTURE_TEST_SUITE(ConfigTestSuite, ConfigFixture)

BOOST_AUTO_TEST_CASE(test_load_full_config) {
    auto path = create_temp_file("scout.yaml", R"(
log:
  global_level: debug
  console:
    enabled: false
  file:
    enabled: true
    log_file: /tmp/scout-test.log
    max_files: 3
listeners:
  enabled: [static, process]
  channel_capacity: 0
  static:
    path: /etc/scout/services.yaml
    poll_interval_ms: 250
  process:
    proc_root: /host/proc
    match: [nginx, postgres]
)");

    BOOST_CHECK_NO_THROW(manager.load_config(path.string()));

    BOOST_CHECK(log_config->global_level == LogConfig::LogLevel::DEBUG);
    BOOST_CHECK(!log_config->console.enabled);
    BOOST_CHECK(log_config->file.enabled);
    BOOST_CHECK_EQUAL(log_config->file.log_file, "/tmp/scout-test.log");
    BOOST_CHECK_EQUAL(log_config->file.max_files, 3);

    BOOST_CHECK((listeners_config->enabled ==
                 std::vector<std::string>{"static", "process"}));
    BOOST_CHECK_EQUAL(listeners_config->channel_capacity, 0);
    BOOST_CHECK_EQUAL(listeners_config->static_file.path,
                      "/etc/scout/services.yaml");
    BOOST_CHECK(listeners_config->static_poll_interval() ==
                std::chrono::milliseconds(250));
    BOOST_CHECK_EQUAL(listeners_config->process.proc_root, "/host/proc");
    BOOST_CHECK_EQUAL(listeners_config->process.poll_interval_ms, 2000);
    BOOST_CHECK_EQUAL(listeners_config->process.match.size(), 2u);
    BOOST_CHECK(listeners_config->is_enabled("process"));
    BOOST_CHECK(!listeners_config->is_enabled("docker"));

    const auto& tree = manager.get_config_tree();
    BOOST_CHECK_EQUAL(tree.get<std::string>("listeners.process.proc_root"),
                      "/host/proc");
}

BOOST_AUTO_TEST_CASE(test_missing_sections_keep_defaults) {
    auto path = create_temp_file("empty.yaml", "other:\n  key: value\n");
    BOOST_CHECK_NO_THROW(manager.load_config(path.string()));

    BOOST_CHECK(log_config->global_level == LogConfig::LogLevel::INFO);
    BOOST_CHECK(log_config->console.enabled);
    BOOST_CHECK(listeners_config->enabled.empty());
    BOOST_CHECK_EQUAL(listeners_config->channel_capacity, 64);
    BOOST_CHECK_EQUAL(listeners_config->static_file.path,
                      "config/services.yaml");
    BOOST_CHECK_EQUAL(listeners_config->process.proc_root, "/proc");
}

BOOST_AUTO_TEST_CASE(test_json_config) {
    auto path = create_temp_file("scout.json", R"({
  "log": { "global_level": "warn" },
  "listeners": { "enabled": ["static"], "channel_capacity": 8 }
})");
    BOOST_CHECK(scout::config::format_from_path(path.string()) ==
                ConfigFormat::JSON);
    BOOST_CHECK_NO_THROW(manager.load_config(
        path.string(), scout::config::format_from_path(path.string())));

    BOOST_CHECK(log_config->global_level == LogConfig::LogLevel::WARN);
    BOOST_CHECK_EQUAL(listeners_config->channel_capacity, 8);
    BOOST_CHECK((listeners_config->enabled ==
                 std::vector<std::string>{"static"}));
}

BOOST_AUTO_TEST_CASE(test_format_from_path) {
    BOOST_CHECK(scout::config::format_from_path("a.yaml") == ConfigFormat::YAML);
    BOOST_CHECK(scout::config::format_from_path("a.ini") == ConfigFormat::INI);
    BOOST_CHECK(scout::config::format_from_path("noext") == ConfigFormat::YAML);
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    BOOST_CHECK_THROW(manager.load_config("non_existent_file.yaml"),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_malformed_yaml) {
    auto path = create_temp_file("broken.yaml", "log: [unclosed\n");
    BOOST_CHECK_THROW(manager.load_config(path.string()), std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_invalid_log_level) {
    auto path = create_temp_file("level.yaml", "log:\n  global_level: loud\n");
    BOOST_CHECK_THROW(manager.load_config(path.string()),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_process_listener_needs_match) {
    auto path = create_temp_file("process.yaml", R"(
listeners:
  enabled: [process]
)");
    BOOST_CHECK_THROW(manager.load_config(path.string()),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_poll_interval_must_be_positive) {
    auto path = create_temp_file("interval.yaml", R"(
listeners:
  static:
    poll_interval_ms: 0
)");
    BOOST_CHECK_THROW(manager.load_config(path.string()),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_negative_channel_capacity) {
    auto path = create_temp_file("capacity.yaml", R"(
listeners:
  channel_capacity: -1
)");
    BOOST_CHECK_THROW(manager.load_config(path.string()),
                      std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_empty_listener_name) {
    ListenersConfig config;
    config.enabled = {"static", ""};
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_file_logging_validation) {
    LogConfig config;
    config.file.enabled = true;
    config.file.max_files = 0;
    BOOST_CHECK_THROW(config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_level_names) {
    BOOST_CHECK(LogConfig::level_from_string("WARNING") ==
                LogConfig::LogLevel::WARN);
    BOOST_CHECK(LogConfig::level_from_string("critical") ==
                LogConfig::LogLevel::FATAL);
    BOOST_CHECK_EQUAL(LogConfig::level_to_string(LogConfig::LogLevel::TRACE),
                      "trace");
}

BOOST_AUTO_TEST_CASE(test_registered_properties_lookup) {
    BOOST_CHECK(manager.get_configuration_properties<LogConfig>() == log_config);
    manager.reset();
    BOOST_CHECK(!manager.get_configuration_properties<LogConfig>());
}

BOOST_AUTO_TEST_SUITE_END()
