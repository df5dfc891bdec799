//
// Created by cv2 on 10/5/25.
//

#include "libkeel/rollback.h"

#include <stdexcept>

namespace keel {

    std::string to_string(RollbackActionType type) {
        switch (type) {
            case RollbackActionType::Command: return "command";
            case RollbackActionType::FileRestore: return "file_restore";
            case RollbackActionType::PackageRemove: return "package_remove";
            case RollbackActionType::ServiceStop: return "service_stop";
        }
        return "unknown";
    }

    std::optional<RollbackActionType> rollback_action_type_from_string(const std::string& text) {
        if (text == "command") return RollbackActionType::Command;
        if (text == "file_restore") return RollbackActionType::FileRestore;
        if (text == "package_remove") return RollbackActionType::PackageRemove;
        if (text == "service_stop") return RollbackActionType::ServiceStop;
        return std::nullopt;
    }

    void to_json(nlohmann::json& j, const RollbackAction& action) {
        j = nlohmann::json{
                {"action_type", to_string(action.type)},
                {"description", action.description},
                {"data", action.data},
                {"timestamp", to_iso8601(action.timestamp)}
        };
    }

    void from_json(const nlohmann::json& j, RollbackAction& action) {
        const auto type_name = j.at("action_type").get<std::string>();
        auto type = rollback_action_type_from_string(type_name);
        if (!type) {
            throw std::invalid_argument("unknown rollback action type '" + type_name + "'");
        }
        action.type = *type;
        action.description = j.value("description", std::string{});
        action.data = j.contains("data") ? j.at("data") : nlohmann::json::object();

        const auto stamp = j.value("timestamp", std::string{});
        auto parsed = from_iso8601(stamp);
        if (!parsed) {
            throw std::invalid_argument("invalid rollback timestamp '" + stamp + "'");
        }
        action.timestamp = *parsed;
    }

} // namespace keel
