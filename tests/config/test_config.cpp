// tests/config/test_config.cpp
#define BOOST_TEST_MODULE ConfigTests
#include <boost/filesystem.hpp>  // for file operations
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <memory>
#include <stdexcept>

#include "butterfly/config/config.hpp"
#include "butterfly/di/container_config.hpp"
#include "butterfly/log/log_config.hpp"
#include "butterfly/log/logger.hpp"

namespace fs = boost::filesystem;

using butterfly::config::ConfigFormat;
using butterfly::config::ConfigManager;
using butterfly::di::ContainerConfig;
using butterfly::di::ReplacePolicy;
using butterfly::log::LogConfig;
using butterfly::log::Logger;

// Test fixture: create and cleanup temporary config files
struct ConfigFixture {
    const fs::path temp_dir =
        fs::temp_directory_path() / "butterfly_test_configs";

    ConfigFixture() {
        fs::create_directories(temp_dir);
        ConfigManager::instance().reset();
    }

    ~ConfigFixture() {
        ConfigManager::instance().reset();
        fs::remove_all(temp_dir);
    }

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

BOOST_AUTO_TEST_CASE(test_load_nested_config) {
    const std::string yaml_content = R"(
log:
  global_level: debug
  file:
    enabled: true
    log_file: /var/log/app.log
container:
  default_replace_policy: deferred
)";
    fs::path config_path = create_temp_file("nested.yaml", yaml_content);

    auto& config_manager = ConfigManager::instance();
    BOOST_CHECK_NO_THROW(
        config_manager.load_config(config_path.string(), ConfigFormat::YAML));

    const auto& config_tree = config_manager.get_config_tree();
    BOOST_CHECK_EQUAL(config_tree.get<std::string>("log.global_level"),
                      "debug");
    BOOST_CHECK_EQUAL(config_tree.get<bool>("log.file.enabled"), true);
    BOOST_CHECK_EQUAL(config_tree.get<std::string>("log.file.log_file"),
                      "/var/log/app.log");
    BOOST_CHECK_EQUAL(
        config_tree.get<std::string>("container.default_replace_policy"),
        "deferred");
}

BOOST_AUTO_TEST_CASE(test_invalid_file_path) {
    BOOST_CHECK_THROW(ConfigManager::instance().load_config(
                          "non_existent_file.yaml", ConfigFormat::YAML),
                      std::runtime_error);
}

BOOST_AUTO_TEST_CASE(test_config_manager_singleton) {
    auto& config1 = ConfigManager::instance();
    auto& config2 = ConfigManager::instance();
    BOOST_CHECK_EQUAL(&config1, &config2);
}

BOOST_AUTO_TEST_CASE(test_json_format) {
    fs::path json_path = create_temp_file(
        "config.json",
        R"({"container": {"eager_singletons": true, "trace_resolution": true}})");

    auto container_config = std::make_shared<ContainerConfig>();
    auto& config_manager = ConfigManager::instance();
    config_manager.register_configuration_properties(container_config);
    config_manager.load_config(json_path.string(), ConfigFormat::JSON);

    BOOST_CHECK(container_config->eager_singletons);
    BOOST_CHECK(container_config->trace_resolution);
    BOOST_CHECK(container_config->default_replace_policy ==
                ReplacePolicy::IMMEDIATE);
}

BOOST_AUTO_TEST_CASE(test_sections_loaded_into_properties) {
    const std::string yaml_content = R"(
log:
  global_level: warning
  console:
    enabled: false
  file:
    enabled: true
    max_files: 3
container:
  default_replace_policy: Deferred
  eager_singletons: true
)";
    fs::path config_path = create_temp_file("sections.yaml", yaml_content);

    auto log_config = std::make_shared<LogConfig>();
    auto container_config = std::make_shared<ContainerConfig>();
    auto& config_manager = ConfigManager::instance();
    config_manager.register_configuration_properties(log_config);
    config_manager.register_configuration_properties(container_config);
    config_manager.load_config(config_path.string());

    BOOST_CHECK(log_config->global_level == LogConfig::LogLevel::WARN);
    BOOST_CHECK(!log_config->console.enabled);
    BOOST_CHECK(log_config->file.enabled);
    BOOST_CHECK_EQUAL(log_config->file.max_files, 3);
    BOOST_CHECK_EQUAL(log_config->file.log_file, "logs/butterfly.log");

    BOOST_CHECK(container_config->default_replace_policy ==
                ReplacePolicy::DEFERRED);
    BOOST_CHECK(container_config->eager_singletons);
    BOOST_CHECK(!container_config->trace_resolution);

    BOOST_CHECK(config_manager.get_configuration_properties<ContainerConfig>() ==
                container_config);
    BOOST_CHECK(config_manager.get_config_by_name("log") == log_config);
}

BOOST_AUTO_TEST_CASE(test_invalid_values_rejected) {
    fs::path bad_policy = create_temp_file(
        "bad_policy.yaml", "container:\n  default_replace_policy: sometimes\n");

    auto& config_manager = ConfigManager::instance();
    config_manager.register_configuration_properties(
        std::make_shared<ContainerConfig>());
    BOOST_CHECK_THROW(config_manager.load_config(bad_policy.string()),
                      std::runtime_error);

    BOOST_CHECK_THROW(ContainerConfig::policy_from_string("later"),
                      std::invalid_argument);
    BOOST_CHECK_THROW(LogConfig::level_from_string("loud"),
                      std::invalid_argument);

    LogConfig log_config;
    log_config.file.enabled = true;
    log_config.file.log_file = "";
    BOOST_CHECK_THROW(log_config.validate(), std::invalid_argument);

    ContainerConfig container_config;
    BOOST_CHECK_NO_THROW(container_config.validate());
    container_config.default_replace_policy = static_cast<ReplacePolicy>(7);
    BOOST_CHECK_THROW(container_config.validate(), std::invalid_argument);
}

BOOST_AUTO_TEST_CASE(test_reload_notifies_subscribers) {
    fs::path config_path = create_temp_file(
        "reload.yaml", "container:\n  default_replace_policy: immediate\n");

    auto& config_manager = ConfigManager::instance();
    config_manager.register_configuration_properties(
        std::make_shared<ContainerConfig>());
    config_manager.load_config(config_path.string());

    ReplacePolicy seen = ReplacePolicy::IMMEDIATE;
    int notifications = 0;
    config_manager.subscribe_to_reloads<ContainerConfig>(
        [&](const ContainerConfig& config) {
            seen = config.default_replace_policy;
            ++notifications;
        });

    create_temp_file("reload.yaml",
                     "container:\n  default_replace_policy: deferred\n");
    BOOST_CHECK(config_manager.reload_config(config_path.string()));
    BOOST_CHECK_EQUAL(notifications, 1);
    BOOST_CHECK(seen == ReplacePolicy::DEFERRED);
    BOOST_CHECK(config_manager.get_configuration_properties<ContainerConfig>()
                    ->default_replace_policy == ReplacePolicy::DEFERRED);

    // An invalid section leaves the previous values in place
    create_temp_file("reload.yaml",
                     "container:\n  default_replace_policy: never\n");
    BOOST_CHECK(!config_manager.reload_config(config_path.string()));
    BOOST_CHECK_EQUAL(notifications, 1);
    BOOST_CHECK(config_manager.get_configuration_properties<ContainerConfig>()
                    ->default_replace_policy == ReplacePolicy::DEFERRED);
}

BOOST_AUTO_TEST_CASE(test_rejected_reload_leaves_log_level_alone) {
    fs::path config_path = create_temp_file(
        "levels.yaml",
        "log:\n  global_level: debug\ncontainer:\n  default_replace_policy: "
        "immediate\n");

    auto log_config = std::make_shared<LogConfig>();
    auto& config_manager = ConfigManager::instance();
    config_manager.register_configuration_properties(log_config);
    config_manager.register_configuration_properties(
        std::make_shared<ContainerConfig>());

    Logger::set_level(LogConfig::LogLevel::INFO);
    config_manager.load_config(config_path.string());

    // Loading a section only fills in its properties
    BOOST_CHECK(log_config->global_level == LogConfig::LogLevel::DEBUG);
    BOOST_CHECK(Logger::level() == LogConfig::LogLevel::INFO);

    int notifications = 0;
    config_manager.subscribe_to_reloads<LogConfig>(
        [&notifications](const LogConfig& config) {
            Logger::set_level(config.global_level);
            ++notifications;
        });

    // The log section is valid, the container section is not
    create_temp_file("levels.yaml",
                     "log:\n  global_level: error\ncontainer:\n  "
                     "default_replace_policy: never\n");
    BOOST_CHECK(!config_manager.reload_config(config_path.string()));
    BOOST_CHECK_EQUAL(notifications, 0);
    BOOST_CHECK(Logger::level() == LogConfig::LogLevel::INFO);
    BOOST_CHECK(config_manager.get_configuration_properties<LogConfig>()
                    ->global_level == LogConfig::LogLevel::DEBUG);

    create_temp_file("levels.yaml",
                     "log:\n  global_level: error\ncontainer:\n  "
                     "default_replace_policy: deferred\n");
    BOOST_CHECK(config_manager.reload_config(config_path.string()));
    BOOST_CHECK_EQUAL(notifications, 1);
    BOOST_CHECK(Logger::level() == LogConfig::LogLevel::ERROR);

    Logger::set_level(LogConfig::LogLevel::INFO);
}

BOOST_AUTO_TEST_CASE(test_config_reset) {
    fs::path config_path = create_temp_file(
        "reset_test.yaml", "temp:\n  data: should_be_reset\n");
    auto& config_manager = ConfigManager::instance();

    config_manager.load_config(config_path.string(), ConfigFormat::YAML);
    BOOST_CHECK_EQUAL(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        "should_be_reset");

    config_manager.reset();
    BOOST_CHECK_THROW(
        config_manager.get_config_tree().get<std::string>("temp.data"),
        boost::property_tree::ptree_bad_path);
}

BOOST_AUTO_TEST_SUITE_END()
