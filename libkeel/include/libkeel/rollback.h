//
// Created by cv2 on 10/5/25.
//

#pragma once

#include "time_util.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace keel {

    enum class RollbackActionType {
        Command,
        FileRestore,
        PackageRemove,
        ServiceStop
    };

    std::string to_string(RollbackActionType type);
    std::optional<RollbackActionType> rollback_action_type_from_string(const std::string& text);

    // One recorded, reversible side effect. `data` holds the type-specific payload:
    //   command:        {"command": "..."}
    //   file_restore:   {"backup_path": "...", "original_path": "..."}
    //   package_remove: {"packages": ["a", "b"]}
    //   service_stop:   {"service": "..."}
    struct RollbackAction {
        RollbackActionType type = RollbackActionType::Command;
        std::string description;
        nlohmann::json data = nlohmann::json::object();
        TimePoint timestamp{};

        bool operator==(const RollbackAction&) const = default;
    };

    // {"action_type", "description", "data", "timestamp"}
    void to_json(nlohmann::json& j, const RollbackAction& action);
    // Throws nlohmann::json::exception or std::invalid_argument on malformed input.
    void from_json(const nlohmann::json& j, RollbackAction& action);

} // namespace keel
