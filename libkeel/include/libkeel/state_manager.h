//
// Created by cv2 on 10/6/25.
//

#pragma once

#include "state.h"

#include <expected>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace keel {

    enum class StateError {
        DatabaseError,        // SQLite/ORM failure
        CorruptRecord,        // a stored row could not be decoded
        NoActiveInstallation  // only ever carried by StateException
    };

    class StateException : public std::runtime_error {
    public:
        StateException(StateError error, const std::string& what_arg)
            : std::runtime_error(what_arg), m_error(error) {}

        StateError get_error() const {
            return m_error;
        }

    private:
        StateError m_error;
    };

    // Durable record of installations and their modules, backing resume-after-crash.
    // Every public method is serialised on one mutex.
    class StateManager {
    public:
        static constexpr const char* kInMemory = ":memory:";

        // Opens (and creates or migrates) the database. Throws StateException
        // if the file cannot be opened.
        explicit StateManager(const std::filesystem::path& db_path = default_db_path());
        ~StateManager();

        StateManager(const StateManager&) = delete;
        StateManager& operator=(const StateManager&) = delete;

        static std::filesystem::path default_db_path();

        // --- Installation lifecycle ---
        std::expected<InstallationState, StateError> start_installation(
                const std::string& profile,
                const nlohmann::json& metadata = nlohmann::json::object());

        // Marks the active installation success or failed. Throws StateException
        // if there is none.
        std::expected<void, StateError> complete_installation(bool success);

        // --- Module updates (best effort, write failures are only logged) ---

        // Applies only the given fields. Throws StateException without an active installation.
        void update_module(const std::string& module_name,
                           std::optional<ModuleStatus> status = std::nullopt,
                           std::optional<int> progress = std::nullopt,
                           std::optional<std::string> current_step = std::nullopt,
                           std::optional<std::string> error = std::nullopt);

        void add_rollback_action(const std::string& module_name, const RollbackAction& action);

        // Unknown modules only produce a warning.
        void create_checkpoint(const std::string& module_name, const std::string& checkpoint_name);

        // --- Resume ---
        bool can_resume() const;

        // The most recently started in-progress installation with all its
        // module rows, or nullopt if there is nothing to resume.
        std::expected<std::optional<InstallationState>, StateError> resume_installation();

        // --- Queries ---
        std::optional<InstallationState> current_state() const;
        std::optional<ModuleState> module_state(const std::string& module_name) const;

        // Most recent first; module maps are not populated.
        std::vector<InstallationState> get_installation_history(std::size_t limit = 10) const;

        // In creation order. An empty module name lists every module's checkpoints.
        std::vector<CheckpointRecord> list_checkpoints(const std::string& installation_id,
                                                       const std::string& module_name = "") const;

    private:
        ModuleState& module_entry(const std::string& module_name); // caller holds m_mutex
        void persist_module(const ModuleState& state);             // caller holds m_mutex

        // PIMPL idiom to hide the sqlite_orm implementation details
        struct Impl;
        std::unique_ptr<Impl> pimpl;

        mutable std::mutex m_mutex;
        std::optional<InstallationState> m_current;
    };

} // namespace keel
