//
// Created by cv2 on 10/5/25.
//

#pragma once

#include "process.h"
#include "rollback.h"

#include <expected>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace keel {

    // A single undo that did not go through during rollback().
    struct RollbackFailure {
        RollbackAction action;
        std::string reason;
    };

    // Append-only log of reversible actions, mirrored to a JSON state file after
    // every change so a crashed run can still be undone later.
    class RollbackManager {
    public:
        explicit RollbackManager(std::filesystem::path state_file = default_state_file(),
                                 CommandRunner runner = run_command);

        // --- Registration (each call rewrites the state file) ---
        RollbackAction add_command(const std::string& command, const std::string& description = "");
        RollbackAction add_file_restore(const std::filesystem::path& backup_path,
                                        const std::filesystem::path& original_path,
                                        const std::string& description = "");
        RollbackAction add_package_remove(const std::vector<std::string>& packages, const std::string& description = "");
        RollbackAction add_service_stop(const std::string& service, const std::string& description = "");

        // Undoes every action, newest first. Returns true only if all of them
        // succeeded, in which case the log and the state file are cleared.
        // Otherwise only the failed actions remain (in their original order).
        // A dry run executes nothing and changes nothing.
        bool rollback(bool dry_run = false);

        // Replaces the in-memory log with the actions in the state file.
        // Returns false if the file is missing or unreadable.
        bool load_state();

        std::string get_summary() const;
        std::vector<RollbackAction> actions() const;
        std::size_t size() const;
        bool empty() const { return size() == 0; }

        // Failures from the most recent rollback() call.
        std::vector<RollbackFailure> last_failures() const;

        const std::filesystem::path& state_file() const { return m_state_file; }

        static std::filesystem::path default_state_file();

    private:
        RollbackAction append(RollbackActionType type, std::string description, nlohmann::json data);
        std::expected<void, std::string> execute(const RollbackAction& action) const;
        void save_state() const; // caller holds m_mutex
        void clear_state_file() const;

        std::filesystem::path m_state_file;
        CommandRunner m_runner;

        mutable std::mutex m_mutex;
        std::vector<RollbackAction> m_actions;
        std::vector<RollbackFailure> m_last_failures;
    };

} // namespace keel
