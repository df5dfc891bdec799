//
// Created by cv2 on 10/6/25.
//

#include "libkeel/state.h"

#include <stdexcept>

namespace keel {

    std::string to_string(ModuleStatus status) {
        switch (status) {
            case ModuleStatus::Pending: return "pending";
            case ModuleStatus::Running: return "running";
            case ModuleStatus::Completed: return "completed";
            case ModuleStatus::Failed: return "failed";
        }
        return "unknown";
    }

    std::optional<ModuleStatus> module_status_from_string(const std::string& text) {
        if (text == "pending") return ModuleStatus::Pending;
        if (text == "running") return ModuleStatus::Running;
        if (text == "completed") return ModuleStatus::Completed;
        if (text == "failed") return ModuleStatus::Failed;
        return std::nullopt;
    }

    std::string to_string(InstallationStatus status) {
        switch (status) {
            case InstallationStatus::InProgress: return "in_progress";
            case InstallationStatus::Success: return "success";
            case InstallationStatus::Failed: return "failed";
        }
        return "unknown";
    }

    std::optional<InstallationStatus> installation_status_from_string(const std::string& text) {
        if (text == "in_progress") return InstallationStatus::InProgress;
        if (text == "success") return InstallationStatus::Success;
        if (text == "failed") return InstallationStatus::Failed;
        return std::nullopt;
    }

    namespace {
        nlohmann::json optional_time(const std::optional<TimePoint>& tp) {
            return tp ? nlohmann::json(to_iso8601(*tp)) : nlohmann::json(nullptr);
        }

        std::optional<TimePoint> read_optional_time(const nlohmann::json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) {
                return std::nullopt;
            }
            const auto text = j.at(key).get<std::string>();
            auto tp = from_iso8601(text);
            if (!tp) {
                throw std::invalid_argument(std::string("invalid timestamp in '") + key + "': " + text);
            }
            return tp;
        }

        template<typename T>
        std::optional<T> read_optional(const nlohmann::json& j, const char* key) {
            if (!j.contains(key) || j.at(key).is_null()) {
                return std::nullopt;
            }
            return j.at(key).get<T>();
        }
    }

    void to_json(nlohmann::json& j, const ModuleState& state) {
        j = nlohmann::json{
                {"name", state.name},
                {"status", to_string(state.status)},
                {"started_at", optional_time(state.started_at)},
                {"completed_at", optional_time(state.completed_at)},
                {"duration_seconds", state.duration_seconds ? nlohmann::json(*state.duration_seconds) : nlohmann::json(nullptr)},
                {"progress_percent", state.progress_percent},
                {"current_step", state.current_step},
                {"error_message", state.error_message ? nlohmann::json(*state.error_message) : nlohmann::json(nullptr)},
                {"checkpoint", state.checkpoint ? nlohmann::json(*state.checkpoint) : nlohmann::json(nullptr)},
                {"rollback_actions", state.rollback_actions}
        };
    }

    void from_json(const nlohmann::json& j, ModuleState& state) {
        state.name = j.at("name").get<std::string>();

        const auto status_text = j.at("status").get<std::string>();
        auto status = module_status_from_string(status_text);
        if (!status) {
            throw std::invalid_argument("unknown module status '" + status_text + "'");
        }
        state.status = *status;

        state.started_at = read_optional_time(j, "started_at");
        state.completed_at = read_optional_time(j, "completed_at");
        state.duration_seconds = read_optional<double>(j, "duration_seconds");
        state.progress_percent = j.value("progress_percent", 0);
        state.current_step = j.value("current_step", std::string{});
        state.error_message = read_optional<std::string>(j, "error_message");
        state.checkpoint = read_optional<std::string>(j, "checkpoint");
        state.rollback_actions = j.contains("rollback_actions")
                ? j.at("rollback_actions").get<std::vector<RollbackAction>>()
                : std::vector<RollbackAction>{};
    }

} // namespace keel
