//
// Created by cv2 on 10/8/25.
//

#include "libkeel/installer.h"
#include "libkeel/hybrid_executor.h"
#include "libkeel/logging.h"
#include "libkeel/module_services.h"

#include <set>

namespace keel {

    namespace {
        std::string join(const std::vector<std::string>& vec, const char* delim = ", ") {
            std::string out;
            for (size_t i = 0; i < vec.size(); ++i) {
                out += vec[i];
                if (i < vec.size() - 1) {
                    out += delim;
                }
            }
            return out;
        }
    }

    int progress_for(ProgressEvent event) {
        switch (event) {
            case ProgressEvent::Started: return 0;
            case ProgressEvent::Validating: return 10;
            case ProgressEvent::PreConfigure: return 25;
            case ProgressEvent::Configuring: return 40;
            case ProgressEvent::PostConfigure: return 70;
            case ProgressEvent::Verifying: return 85;
            case ProgressEvent::Completed: return 100;
            case ProgressEvent::Failed: return 0;
        }
        return 0;
    }

    Installer::Installer(Config config, Manifest manifest, ModuleRegistry registry,
                         StateManager& state, RollbackManager& rollback)
        : m_config(std::move(config)),
          m_manifest(std::move(manifest)),
          m_registry(std::move(registry)),
          m_state(state),
          m_rollback(rollback) {}

    std::vector<std::string> Installer::selection() const {
        const auto enabled = m_config.enabled_modules();
        const std::set<std::string> wanted(enabled.begin(), enabled.end());

        std::vector<std::string> ordered;
        for (const auto& entry : m_manifest.entries()) {
            if (wanted.count(entry.name)) {
                ordered.push_back(entry.name);
            }
        }
        for (const auto& name : enabled) {
            if (!m_manifest.contains(name)) {
                ordered.push_back(name);
            }
        }
        return ordered;
    }

    // --- Planning ---

    std::expected<std::vector<ModuleDescriptor>, InstallError> Installer::prepare() const {
        if (auto valid = m_manifest.validate(); !valid) {
            log::error("Module manifest is invalid: " + to_string(valid.error()));
            return std::unexpected(InstallError::InvalidManifest);
        }

        const auto selected = selection();
        if (selected.empty()) {
            log::warn("No modules are enabled in the configuration.");
        }

        const auto conflicts = m_manifest.detect_conflicts(selected);
        if (!conflicts.empty()) {
            for (const auto& conflict : conflicts) {
                log::error("Conflict: " + conflict.reason);
            }
            return std::unexpected(InstallError::ConflictDetected);
        }

        const auto missing = m_manifest.validate_selection(selected);
        if (!missing.empty()) {
            for (const auto& message : missing) {
                log::error(message);
            }
            return std::unexpected(InstallError::UnsatisfiedDependency);
        }

        std::vector<ModuleDescriptor> descriptors;
        descriptors.reserve(selected.size());
        for (const auto& name : selected) {
            const auto* entry = m_manifest.find(name);
            auto descriptor = m_registry.describe(entry ? *entry : ManifestEntry{name}, m_config.module_config(name));
            if (!descriptor) {
                return std::unexpected(InstallError::UnknownModule);
            }
            descriptors.push_back(std::move(*descriptor));
        }
        return descriptors;
    }

    std::expected<BatchList, InstallError> Installer::batches_for(const std::vector<ModuleDescriptor>& descriptors) const {
        std::set<std::string> selected;
        for (const auto& d : descriptors) {
            selected.insert(d.name);
        }

        // Dependencies on known but unselected modules are assumed satisfied.
        DependencyGraph graph;
        for (const auto& d : descriptors) {
            std::vector<std::string> deps;
            for (const auto& dep : d.depends_on) {
                if (selected.count(dep)) {
                    deps.push_back(dep);
                }
            }
            graph.add_module(d.name, deps, d.force_sequential);
        }

        if (auto valid = graph.validate(); !valid) {
            return std::unexpected(InstallError::InvalidGraph);
        }
        auto batches = graph.get_parallel_batches();
        if (!batches) {
            return std::unexpected(InstallError::InvalidGraph);
        }
        return *batches;
    }

    std::expected<BatchList, InstallError> Installer::plan() const {
        auto descriptors = prepare();
        if (!descriptors) {
            return std::unexpected(descriptors.error());
        }
        return batches_for(*descriptors);
    }

    // --- Execution ---

    ProgressCallback Installer::make_state_bridge() {
        return [this](const std::string& name, ProgressEvent event, const EventData& data) {
            switch (event) {
                case ProgressEvent::Started:
                    m_state.update_module(name, ModuleStatus::Running, progress_for(event), to_string(event));
                    break;
                case ProgressEvent::Completed:
                    m_state.update_module(name, ModuleStatus::Completed, progress_for(event), to_string(event));
                    break;
                case ProgressEvent::Failed: {
                    auto it = data.find("error");
                    m_state.update_module(name, ModuleStatus::Failed, std::nullopt, to_string(event),
                                          it != data.end() ? it->second : std::string("unknown error"));
                    break;
                }
                default:
                    m_state.update_module(name, std::nullopt, progress_for(event), to_string(event));
                    break;
            }

            fire_module_hooks(name, event, data);

            if (m_user_callback) {
                m_user_callback(name, event, data);
            }
        };
    }

    void Installer::fire_module_hooks(const std::string& name, ProgressEvent event, const EventData& data) const {
        switch (event) {
            case ProgressEvent::Validating:
                m_hooks.execute(HookEvent::BeforeModuleValidate, name, data);
                break;
            case ProgressEvent::Configuring:
                // Reaching configure means validation passed.
                m_hooks.execute(HookEvent::AfterModuleValidate, name, data);
                m_hooks.execute(HookEvent::BeforeModuleConfigure, name, data);
                break;
            case ProgressEvent::Completed:
                m_hooks.execute(HookEvent::AfterModuleConfigure, name, data);
                break;
            case ProgressEvent::Failed:
                m_hooks.execute(HookEvent::OnModuleError, name, data);
                break;
            default:
                break;
        }
    }

    std::expected<InstallReport, InstallError> Installer::install(const InstallOptions& options) {
        const auto started = timestamp_now();

        auto abort_with = [this](InstallError error, const std::string& stage) {
            m_hooks.execute(HookEvent::OnInstallationError, "", {{"stage", stage}});
            return std::unexpected(error);
        };

        auto descriptors = prepare();
        if (!descriptors) {
            return abort_with(descriptors.error(), "planning");
        }
        auto batches = batches_for(*descriptors);
        if (!batches) {
            return abort_with(batches.error(), "planning");
        }

        InstallReport report;
        report.batches = *batches;

        // --- Start or resume the installation record ---
        std::optional<InstallationState> previous;
        if (options.resume) {
            auto resumed = m_state.resume_installation();
            if (!resumed) {
                return abort_with(InstallError::StateUnavailable, "state");
            }
            previous = std::move(*resumed);
            if (previous) {
                report.resumed = true;
                report.installation_id = previous->installation_id;
                if (!m_rollback.load_state()) {
                    log::debug("No rollback log from the interrupted run.");
                }
            } else {
                log::warn("No interrupted installation found; starting a new one.");
            }
        }
        if (!previous) {
            const nlohmann::json metadata = {{"dry_run", options.dry_run}, {"modules", selection()}};
            auto fresh = m_state.start_installation(options.profile, metadata);
            if (!fresh) {
                return abort_with(InstallError::StateUnavailable, "state");
            }
            report.installation_id = fresh->installation_id;
        }

        m_hooks.execute(HookEvent::BeforeInstallation, "", {{"installation_id", report.installation_id},
                                                             {"profile", options.profile},
                                                             {"dry_run", options.dry_run ? "true" : "false"},
                                                             {"resumed", report.resumed ? "true" : "false"}});

        auto completed_before = [&previous](const std::string& name) {
            if (!previous) {
                return false;
            }
            auto it = previous->modules.find(name);
            return it != previous->modules.end() && it->second.status == ModuleStatus::Completed;
        };

        std::map<std::string, const ModuleDescriptor*> by_name;
        std::map<std::string, ModuleServices> services;
        for (const auto& d : *descriptors) {
            by_name[d.name] = &d;
            services.try_emplace(d.name, d.name, &m_state, options.dry_run ? nullptr : &m_rollback);
        }

        // --- Run the batches, strictly one after another ---
        ExecutionSession session;
        HybridExecutor executor(m_config.max_workers);
        const auto bridge = make_state_bridge();

        std::size_t batch_index = 0;
        for (; batch_index < report.batches.size(); ++batch_index) {
            const auto& batch = report.batches[batch_index];

            std::vector<ExecutionContext> contexts;
            for (const auto& name : batch) {
                if (completed_before(name)) {
                    log::info("Skipping " + name + " (already completed).");
                    report.skipped.push_back(name);
                    continue;
                }
                const auto& d = *by_name.at(name);
                contexts.push_back(ExecutionContext{d.name, d.module, d.capabilities, d.config,
                                                    options.dry_run, d.depends_on, &services.at(name)});
            }
            if (contexts.empty()) {
                continue;
            }

            log::info("Batch " + std::to_string(batch_index + 1) + "/" + std::to_string(report.batches.size())
                      + ": " + join(batch));
            auto results = executor.execute(contexts, session, bridge);

            bool batch_failed = false;
            for (auto& [name, result] : results) {
                if (!result.success) {
                    batch_failed = true;
                    (result.cancelled ? report.cancelled : report.failed).push_back(name);
                }
                report.results[name] = std::move(result);
            }
            if (batch_failed) {
                log::error("Batch " + std::to_string(batch_index + 1) + " failed; stopping the installation.");
                ++batch_index;
                break;
            }
        }

        // Modules of batches that never started.
        for (; batch_index < report.batches.size(); ++batch_index) {
            for (const auto& name : report.batches[batch_index]) {
                if (completed_before(name)) {
                    report.skipped.push_back(name);
                } else {
                    report.cancelled.push_back(name);
                }
            }
        }

        report.success = report.failed.empty() && report.cancelled.empty();
        if (auto completed = m_state.complete_installation(report.success); !completed) {
            log::error("Could not record the outcome of installation " + report.installation_id + ".");
        }

        if (report.success) {
            log::ok("Installation " + report.installation_id + " completed successfully.");
        } else {
            log::error("Installation " + report.installation_id + " failed: " + join(report.failed));
            if (options.auto_rollback && !options.dry_run) {
                report.rollback_summary = m_rollback.get_summary();
                log::info(report.rollback_summary);
                report.rolled_back = true;
                report.rollback_succeeded = m_rollback.rollback(false);
            }
        }

        if (report.success) {
            m_hooks.execute(HookEvent::AfterInstallation, "", {{"installation_id", report.installation_id}});
        } else {
            m_hooks.execute(HookEvent::OnInstallationError, "", {{"installation_id", report.installation_id},
                                                                  {"stage", "execution"},
                                                                  {"failed", join(report.failed)},
                                                                  {"cancelled", join(report.cancelled)},
                                                                  {"rolled_back", report.rolled_back ? "true" : "false"}});
        }

        report.duration_seconds = seconds_between(started, timestamp_now());
        return report;
    }

    bool Installer::rollback(bool dry_run) {
        if (m_rollback.empty() && !m_rollback.load_state()) {
            log::debug("No persisted rollback log at " + m_rollback.state_file().string());
        }
        log::info(m_rollback.get_summary());
        return m_rollback.rollback(dry_run);
    }

    std::expected<std::map<std::string, bool>, InstallError> Installer::verify() {
        auto descriptors = prepare();
        if (!descriptors) {
            return std::unexpected(descriptors.error());
        }

        std::map<std::string, bool> outcome;
        for (const auto& d : *descriptors) {
            if (!d.capabilities.verify) {
                outcome[d.name] = true;
                continue;
            }

            ExecutionContext ctx{d.name, d.module, d.capabilities, d.config, false, d.depends_on, nullptr};
            try {
                auto verified = d.module->verify(ctx);
                outcome[d.name] = verified.has_value();
                if (!verified) {
                    log::error("Verification of " + d.name + " failed: " + verified.error());
                }
            } catch (const std::exception& e) {
                log::error("Verification of " + d.name + " threw: " + e.what());
                outcome[d.name] = false;
            }
        }
        return outcome;
    }

    std::vector<InstallationState> Installer::history(std::size_t limit) const {
        return m_state.get_installation_history(limit);
    }

} // namespace keel
