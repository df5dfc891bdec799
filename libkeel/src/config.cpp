//
// Created by cv2 on 10/7/25.
//

#include "libkeel/config.h"
#include "libkeel/logging.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>

namespace keel {

    std::string to_string(ConfigError error) {
        switch (error) {
            case ConfigError::FileNotFound: return "file not found";
            case ConfigError::InvalidFormat: return "invalid format";
            case ConfigError::InvalidValue: return "invalid value";
        }
        return "unknown error";
    }

    static std::expected<ModuleSettings, ConfigError> parse_module_section(const std::string& name, const YAML::Node& node) {
        ModuleSettings settings;
        settings.name = name;

        if (node.IsNull()) {
            return settings; // "docker:" alone enables the module with no settings
        }
        if (node.IsScalar()) {
            // Shorthand: "docker: false"
            settings.enabled = node.as<bool>();
            return settings;
        }
        if (!node.IsMap()) {
            log::error("Module section '" + name + "' must be a mapping.");
            return std::unexpected(ConfigError::InvalidFormat);
        }

        for (const auto& item : node) {
            const auto key = item.first.as<std::string>();
            if (key == "enabled") {
                settings.enabled = item.second.as<bool>();
            } else if (item.second.IsScalar()) {
                settings.values[key] = item.second.as<std::string>();
            } else {
                log::debug("Ignoring non-scalar setting '" + key + "' of module '" + name + "'.");
            }
        }
        return settings;
    }

    static std::expected<Config, ConfigError> parse_config_node(const YAML::Node& root) {
        Config config;
        if (root.IsNull()) {
            return config;
        }
        if (!root.IsMap()) {
            log::error("Configuration root must be a YAML mapping.");
            return std::unexpected(ConfigError::InvalidFormat);
        }

        if (root["profile"]) {
            config.profile = root["profile"].as<std::string>();
        }
        if (root["verbose"]) {
            config.verbose = root["verbose"].as<bool>();
        }

        if (const auto performance = root["performance"]; performance && performance["max_workers"]) {
            const auto workers = performance["max_workers"].as<long long>();
            if (workers < 1) {
                log::error("performance.max_workers must be at least 1 (got " + std::to_string(workers) + ").");
                return std::unexpected(ConfigError::InvalidValue);
            }
            config.max_workers = static_cast<std::size_t>(workers);
        }

        if (const auto state = root["state"]; state && state["db_path"]) {
            config.db_path = state["db_path"].as<std::string>();
        }

        if (const auto rollback = root["rollback"]; rollback) {
            if (rollback["state_file"]) {
                config.rollback_state_file = rollback["state_file"].as<std::string>();
            }
            if (rollback["auto_rollback"]) {
                config.auto_rollback = rollback["auto_rollback"].as<bool>();
            }
        }

        if (const auto modules = root["modules"]; modules) {
            if (!modules.IsMap()) {
                log::error("'modules' must be a mapping of module name to settings.");
                return std::unexpected(ConfigError::InvalidFormat);
            }
            for (const auto& item : modules) {
                auto settings = parse_module_section(item.first.as<std::string>(), item.second);
                if (!settings) return std::unexpected(settings.error());
                config.modules.push_back(std::move(*settings));
            }
        }

        return config;
    }

    std::expected<Config, ConfigError> Config::load(const std::filesystem::path& file_path) {
        if (!std::filesystem::exists(file_path)) {
            return std::unexpected(ConfigError::FileNotFound);
        }
        try {
            YAML::Node root = YAML::LoadFile(file_path.string());
            return parse_config_node(root);
        } catch (const YAML::BadConversion& e) {
            log::error("Invalid value in config file " + file_path.string() + ": " + e.what());
            return std::unexpected(ConfigError::InvalidValue);
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse config file " + file_path.string() + ": " + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
    }

    std::expected<Config, ConfigError> Config::parse_from_string(const std::string& content) {
        try {
            YAML::Node root = YAML::Load(content);
            return parse_config_node(root);
        } catch (const YAML::BadConversion& e) {
            log::error(std::string("Invalid value in config: ") + e.what());
            return std::unexpected(ConfigError::InvalidValue);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse config from string: ") + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
    }

    std::vector<std::string> Config::enabled_modules() const {
        std::vector<std::string> names;
        for (const auto& settings : modules) {
            if (settings.enabled) {
                names.push_back(settings.name);
            }
        }
        return names;
    }

    const ModuleSettings* Config::module(const std::string& name) const {
        auto it = std::find_if(modules.begin(), modules.end(), [&](const auto& m) { return m.name == name; });
        return it == modules.end() ? nullptr : &*it;
    }

    ModuleConfig Config::module_config(const std::string& name) const {
        const auto* settings = module(name);
        return settings ? settings->values : ModuleConfig{};
    }

} // namespace keel
