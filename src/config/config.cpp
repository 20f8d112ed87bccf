#include "butterfly/config/config.hpp"

#include <boost/property_tree/ini_parser.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <filesystem>
#include <fstream>

#include "butterfly/log/logger.hpp"

namespace butterfly::config {

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
            pt.push_back(std::make_pair("", yaml_to_ptree(*it)));
        }
    } else if (node.IsScalar()) {
        pt.put_value(node.as<std::string>());
    }
    return pt;
}

boost::property_tree::ptree ConfigManager::read_tree(
    const std::string& config_file, ConfigFormat format) {
    if (!std::filesystem::exists(config_file)) {
        throw std::runtime_error("Config file not found: " + config_file);
    }

    boost::property_tree::ptree tree;
    switch (format) {
        case ConfigFormat::YAML: {
            YAML::Node yaml_node = YAML::LoadFile(config_file);
            tree = yaml_to_ptree(yaml_node);
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
    return tree;
}

void ConfigManager::load_config(const std::string& config_file,
                                ConfigFormat format) {
    BUTTERFLY_LOG_INFO << "Loading config file: " << config_file;

    try {
        auto tree = read_tree(config_file, format);
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_tree_ = std::move(tree);
        }
        load_component_configs();
        BUTTERFLY_LOG_INFO << "Successfully loaded config file: "
                           << config_file;
    } catch (const std::exception& e) {
        BUTTERFLY_LOG_ERROR << "Failed to load config file: " << config_file
                            << ", Error: " << e.what();
        throw std::runtime_error("Failed to load config file: " + config_file +
                                 ", Error: " + e.what());
    }
}

void ConfigManager::load_component_configs() {
    std::lock_guard<std::mutex> lock(config_mutex_);
    for (auto& [type_id, config] : configs_) {
        const std::string properties_name = config->properties_name();
        auto section = config_tree_.get_child_optional(properties_name);
        if (!section) {
            BUTTERFLY_LOG_WARN << "No configuration found for properties: "
                               << properties_name << ", using defaults";
            continue;
        }

        try {
            config->from_ptree(*section);
            config->validate();
            BUTTERFLY_LOG_DEBUG << "Loaded configuration for properties: "
                                << properties_name;
        } catch (const std::exception& e) {
            BUTTERFLY_LOG_ERROR
                << "Failed to load configuration for properties "
                << properties_name << ": " << e.what();
            throw;
        }
    }
}

bool ConfigManager::reload_config(const std::string& config_file,
                                  ConfigFormat format) {
    BUTTERFLY_LOG_INFO << "Attempting to reload config from: " << config_file;

    boost::property_tree::ptree new_config_tree;
    try {
        new_config_tree = read_tree(config_file, format);
    } catch (const std::exception& e) {
        BUTTERFLY_LOG_ERROR
            << "Failed to parse new config file, aborting reload: "
            << e.what();
        return false;
    }

    // Clones are validated first; a bad section leaves the old values active
    std::unordered_map<std::type_index,
                       std::shared_ptr<ConfigurationProperties>>
        validated_new_configs;
    try {
        std::lock_guard<std::mutex> lock(config_mutex_);
        for (const auto& [type_id, current_config] : configs_) {
            if (!current_config->supports_hot_reload()) {
                continue;
            }
            auto section = new_config_tree.get_child_optional(
                current_config->properties_name());
            if (!section) {
                continue;
            }

            std::shared_ptr<ConfigurationProperties> new_config_clone =
                current_config->clone();
            new_config_clone->from_ptree(*section);
            new_config_clone->validate();
            validated_new_configs[type_id] = std::move(new_config_clone);
        }
    } catch (const std::exception& e) {
        BUTTERFLY_LOG_ERROR
            << "Failed to validate new configuration, aborting reload: "
            << e.what();
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_tree_ = new_config_tree;
        for (const auto& [type_id, new_config] : validated_new_configs) {
            configs_[type_id] = new_config;
            config_by_name_[new_config->properties_name()] = new_config;
        }
    }
    BUTTERFLY_LOG_INFO << "Successfully applied new configuration";

    std::vector<std::pair<ReloadCallback,
                          std::shared_ptr<const ConfigurationProperties>>>
        callbacks_to_run;
    {
        std::lock_guard<std::mutex> lock(subscribers_mutex_);
        for (const auto& [type_id, new_config] : validated_new_configs) {
            auto it = reload_subscribers_.find(type_id);
            if (it != reload_subscribers_.end()) {
                for (const auto& callback : it->second) {
                    callbacks_to_run.push_back({callback, new_config});
                }
            }
        }
    }

    // Subscriber failures are logged; the remaining subscribers still run
    for (const auto& [callback, config_ptr] : callbacks_to_run) {
        try {
            callback(*config_ptr);
        } catch (const std::exception& e) {
            BUTTERFLY_LOG_ERROR
                << "Exception in config reload callback for properties '"
                << config_ptr->properties_name() << "': " << e.what();
        }
    }
    return true;
}

}  // namespace butterfly::config
