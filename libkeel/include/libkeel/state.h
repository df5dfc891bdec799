//
// Created by cv2 on 10/6/25.
//

#pragma once

#include "rollback.h"
#include "time_util.h"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace keel {

    enum class ModuleStatus {
        Pending,
        Running,
        Completed,
        Failed
    };

    enum class InstallationStatus {
        InProgress,
        Success,
        Failed
    };

    std::string to_string(ModuleStatus status);
    std::optional<ModuleStatus> module_status_from_string(const std::string& text);

    std::string to_string(InstallationStatus status);
    std::optional<InstallationStatus> installation_status_from_string(const std::string& text);

    struct ModuleState {
        std::string name;
        ModuleStatus status = ModuleStatus::Pending;
        std::optional<TimePoint> started_at;
        std::optional<TimePoint> completed_at;
        std::optional<double> duration_seconds;
        int progress_percent = 0; // always within 0..100
        std::string current_step;
        std::optional<std::string> error_message;
        std::optional<std::string> checkpoint;
        std::vector<RollbackAction> rollback_actions;

        bool operator==(const ModuleState&) const = default;
    };

    struct InstallationState {
        std::string installation_id; // "inst-" + 12 hex digits
        TimePoint started_at{};
        std::string profile;
        InstallationStatus overall_status = InstallationStatus::InProgress;
        std::optional<TimePoint> completed_at;
        nlohmann::json metadata = nlohmann::json::object();
        std::map<std::string, ModuleState> modules;

        bool is_resumable() const {
            return overall_status == InstallationStatus::InProgress && !completed_at.has_value();
        }

        bool operator==(const InstallationState&) const = default;
    };

    // Immutable snapshot row; created by StateManager::create_checkpoint().
    struct CheckpointRecord {
        long long id = 0;
        std::string installation_id;
        std::string module_name;
        std::string checkpoint_name;
        ModuleState snapshot;
        TimePoint created_at{};
    };

    // Snapshot format used for checkpoints.
    void to_json(nlohmann::json& j, const ModuleState& state);
    void from_json(const nlohmann::json& j, ModuleState& state);

} // namespace keel
