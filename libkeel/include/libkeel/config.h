//
// Created by cv2 on 10/7/25.
//

#pragma once

#include "module.h"
#include "parallel_executor.h"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace keel {

    enum class ConfigError {
        FileNotFound,
        InvalidFormat,
        InvalidValue
    };

    std::string to_string(ConfigError error);

    struct ModuleSettings {
        std::string name;
        bool enabled = true;
        ModuleConfig values; // every scalar of the module's section except `enabled`
    };

    // Run configuration, read from YAML.
    struct Config {
        std::string profile = "default";
        bool verbose = false;
        std::size_t max_workers = kDefaultMaxWorkers;
        std::optional<std::filesystem::path> db_path;             // StateManager default when unset
        std::optional<std::filesystem::path> rollback_state_file; // RollbackManager default when unset
        bool auto_rollback = true;
        std::vector<ModuleSettings> modules; // in document order

        // Names of the enabled modules, in document order.
        std::vector<std::string> enabled_modules() const;
        const ModuleSettings* module(const std::string& name) const;
        ModuleConfig module_config(const std::string& name) const;

        static std::expected<Config, ConfigError> load(const std::filesystem::path& file_path);
        static std::expected<Config, ConfigError> parse_from_string(const std::string& content);
    };

} // namespace keel
