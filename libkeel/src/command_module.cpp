//
// Created by cv2 on 10/8/25.
//

#include "libkeel/command_module.h"
#include "libkeel/execution.h"
#include "libkeel/logging.h"
#include "libkeel/module_services.h"

#include <filesystem>
#include <sstream>

namespace keel {

    namespace {
        std::vector<std::string> split_words(const std::string& text) {
            std::vector<std::string> words;
            std::istringstream stream(text);
            std::string word;
            while (stream >> word) {
                words.push_back(word);
            }
            return words;
        }
    }

    CommandModule::CommandModule(std::string name, ModuleConfig config, CommandRunner runner)
        : m_name(std::move(name)), m_config(std::move(config)), m_runner(std::move(runner)) {}

    std::optional<std::string> CommandModule::setting(const std::string& key) const {
        auto it = m_config.find(key);
        if (it == m_config.end() || it->second.empty()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool CommandModule::flag(const std::string& key) const {
        auto value = setting(key);
        return value && (*value == "true" || *value == "yes" || *value == "1");
    }

    ModuleCapabilities CommandModule::capabilities() const {
        ModuleCapabilities caps;
        caps.validate = setting("validate").has_value();
        caps.pre_configure = setting("pre_configure").has_value() || setting("backup_file").has_value();
        caps.configure = setting("configure").has_value();
        caps.post_configure = setting("post_configure").has_value();
        caps.verify = setting("verify").has_value();
        caps.force_sequential = flag("force_sequential");
        caps.large_module = flag("large_module");
        return caps;
    }

    StageResult CommandModule::run_stage(const ExecutionContext& ctx, Stage stage) {
        auto command = setting(to_string(stage));
        if (!command) {
            return {};
        }

        if (ctx.dry_run) {
            log::info("[dry-run] " + m_name + " " + to_string(stage) + ": " + *command);
            return {};
        }

        log::debug(m_name + " " + to_string(stage) + ": " + *command);
        const auto outcome = m_runner(*command);
        if (!outcome.ok()) {
            std::string reason = "command '" + *command + "' exited with status " + std::to_string(outcome.exit_code);
            if (!outcome.output.empty()) {
                reason += ": " + outcome.output;
            }
            return stage_failed(reason);
        }
        return {};
    }

    StageResult CommandModule::validate(const ExecutionContext& ctx) {
        return run_stage(ctx, Stage::Validate);
    }

    StageResult CommandModule::pre_configure(const ExecutionContext& ctx) {
        if (auto file = setting("backup_file"); file && !ctx.dry_run) {
            const std::filesystem::path original = *file;
            std::filesystem::path backup = original;
            backup += ".keel-bak";

            std::error_code ec;
            if (std::filesystem::exists(original, ec)) {
                std::filesystem::copy_file(original, backup, std::filesystem::copy_options::overwrite_existing, ec);
                if (ec) {
                    return stage_failed("cannot back up " + original.string() + ": " + ec.message());
                }
                if (ctx.services) {
                    ctx.services->add_file_restore(backup, original);
                }
            }
        }
        return run_stage(ctx, Stage::PreConfigure);
    }

    StageResult CommandModule::configure(const ExecutionContext& ctx) {
        auto result = run_stage(ctx, Stage::Configure);
        if (result && !ctx.dry_run) {
            register_undo(ctx);
            if (ctx.services) {
                ctx.services->checkpoint("configured");
            }
        }
        return result;
    }

    StageResult CommandModule::post_configure(const ExecutionContext& ctx) {
        return run_stage(ctx, Stage::PostConfigure);
    }

    StageResult CommandModule::verify(const ExecutionContext& ctx) {
        return run_stage(ctx, Stage::Verify);
    }

    void CommandModule::register_undo(const ExecutionContext& ctx) const {
        if (!ctx.services) {
            return;
        }
        if (auto packages = setting("packages")) {
            ctx.services->add_package_remove(split_words(*packages));
        }
        if (auto service = setting("service")) {
            ctx.services->add_service_stop(*service);
        }
        if (auto undo = setting("undo")) {
            ctx.services->add_command(*undo);
        }
    }

} // namespace keel
