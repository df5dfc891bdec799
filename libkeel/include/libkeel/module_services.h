//
// Created by cv2 on 10/7/25.
//

#pragma once

#include "rollback_manager.h"
#include "state_manager.h"

#include <string>

namespace keel {

    // What a running module may do besides its own work: report progress,
    // checkpoint, and register how to undo what it changed. One per module per run.
    // Either collaborator may be null (dry runs, tests).
    class ModuleServices {
    public:
        ModuleServices(std::string module_name, StateManager* state, RollbackManager* rollback);

        const std::string& module_name() const { return m_module_name; }

        void report_progress(int percent, const std::string& step);
        void checkpoint(const std::string& name);

        // Each undo goes to the rollback log and is mirrored into the module's persisted state.
        void add_command(const std::string& command, const std::string& description = "");
        void add_file_restore(const std::filesystem::path& backup_path,
                              const std::filesystem::path& original_path,
                              const std::string& description = "");
        void add_package_remove(const std::vector<std::string>& packages, const std::string& description = "");
        void add_service_stop(const std::string& service, const std::string& description = "");

    private:
        void mirror(const RollbackAction& action);

        std::string m_module_name;
        StateManager* m_state;
        RollbackManager* m_rollback;
    };

} // namespace keel
