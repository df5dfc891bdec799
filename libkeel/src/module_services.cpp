//
// Created by cv2 on 10/7/25.
//

#include "libkeel/module_services.h"
#include "libkeel/logging.h"

namespace keel {

    ModuleServices::ModuleServices(std::string module_name, StateManager* state, RollbackManager* rollback)
        : m_module_name(std::move(module_name)), m_state(state), m_rollback(rollback) {}

    void ModuleServices::report_progress(int percent, const std::string& step) {
        log::debug(m_module_name + ": " + step + " (" + std::to_string(percent) + "%)");
        if (m_state) {
            m_state->update_module(m_module_name, std::nullopt, percent, step);
        }
    }

    void ModuleServices::checkpoint(const std::string& name) {
        if (m_state) {
            m_state->create_checkpoint(m_module_name, name);
        }
    }

    void ModuleServices::mirror(const RollbackAction& action) {
        if (m_state) {
            m_state->add_rollback_action(m_module_name, action);
        }
    }

    void ModuleServices::add_command(const std::string& command, const std::string& description) {
        if (!m_rollback) return;
        mirror(m_rollback->add_command(command, description));
    }

    void ModuleServices::add_file_restore(const std::filesystem::path& backup_path,
                                          const std::filesystem::path& original_path,
                                          const std::string& description) {
        if (!m_rollback) return;
        mirror(m_rollback->add_file_restore(backup_path, original_path, description));
    }

    void ModuleServices::add_package_remove(const std::vector<std::string>& packages, const std::string& description) {
        if (!m_rollback) return;
        mirror(m_rollback->add_package_remove(packages, description));
    }

    void ModuleServices::add_service_stop(const std::string& service, const std::string& description) {
        if (!m_rollback) return;
        mirror(m_rollback->add_service_stop(service, description));
    }

} // namespace keel
