//
// Created by cv2 on 10/8/25.
//

#pragma once

#include "module.h"
#include "process.h"

#include <optional>
#include <string>

namespace keel {

    // A module described entirely by its config section. Recognised keys:
    //   validate, pre_configure, configure, post_configure, verify   shell commands per stage
    //   undo          command registered for rollback once configure succeeded
    //   packages      space separated; removed on rollback
    //   service       stopped and disabled on rollback
    //   backup_file   copied aside before configure, restored on rollback
    //   force_sequential, large_module   "true" to set the scheduling hints
    class CommandModule : public Module {
    public:
        CommandModule(std::string name, ModuleConfig config, CommandRunner runner = run_command);

        ModuleCapabilities capabilities() const override;

        StageResult validate(const ExecutionContext& ctx) override;
        StageResult pre_configure(const ExecutionContext& ctx) override;
        StageResult configure(const ExecutionContext& ctx) override;
        StageResult post_configure(const ExecutionContext& ctx) override;
        StageResult verify(const ExecutionContext& ctx) override;

    private:
        std::optional<std::string> setting(const std::string& key) const;
        bool flag(const std::string& key) const;
        StageResult run_stage(const ExecutionContext& ctx, Stage stage);
        void register_undo(const ExecutionContext& ctx) const;

        std::string m_name;
        ModuleConfig m_config;
        CommandRunner m_runner;
    };

} // namespace keel
