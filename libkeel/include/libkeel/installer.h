//
// Created by cv2 on 10/8/25.
//

#pragma once

#include "config.h"
#include "dependency_graph.h"
#include "execution.h"
#include "hooks.h"
#include "manifest.h"
#include "module_registry.h"
#include "rollback_manager.h"
#include "state_manager.h"

#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace keel {

    enum class InstallError {
        // Planning errors (nothing has run yet)
        InvalidManifest,
        ConflictDetected,
        UnsatisfiedDependency,
        UnknownModule,
        InvalidGraph,
        // Persistence errors
        StateUnavailable
    };

    struct InstallOptions {
        bool dry_run = false;
        bool resume = false;
        bool auto_rollback = true;
        std::string profile = "default";
    };

    struct InstallReport {
        std::string installation_id;
        bool success = false;
        bool resumed = false;
        BatchList batches;
        ExecutionResults results;
        std::vector<std::string> skipped;   // already completed in the resumed run
        std::vector<std::string> failed;
        std::vector<std::string> cancelled;
        bool rolled_back = false;
        bool rollback_succeeded = false;
        std::string rollback_summary;
        double duration_seconds = 0.0;
    };

    // Percent reported to the state store when a module reaches `event`.
    int progress_for(ProgressEvent event);

    // Ties manifest, registry, graph, executor, state and rollback together.
    class Installer {
    public:
        Installer(Config config, Manifest manifest, ModuleRegistry registry,
                  StateManager& state, RollbackManager& rollback);

        // Forwarded every event after the state store has been updated.
        void set_progress_callback(ProgressCallback callback) { m_user_callback = std::move(callback); }

        // Installation and module lifecycle hooks fired by install().
        HooksManager& hooks() { return m_hooks; }

        // The enabled modules, in manifest order, then any extra config sections.
        std::vector<std::string> selection() const;

        std::expected<BatchList, InstallError> plan() const;
        std::expected<InstallReport, InstallError> install(const InstallOptions& options);

        // Replays the rollback log, loading it from disk first if nothing is in memory.
        bool rollback(bool dry_run = false);

        // Runs only the verify stage of every enabled module.
        std::expected<std::map<std::string, bool>, InstallError> verify();

        std::vector<InstallationState> history(std::size_t limit = 10) const;

        const Config& config() const { return m_config; }
        const Manifest& manifest() const { return m_manifest; }

    private:
        std::expected<std::vector<ModuleDescriptor>, InstallError> prepare() const;
        std::expected<BatchList, InstallError> batches_for(const std::vector<ModuleDescriptor>& descriptors) const;
        ProgressCallback make_state_bridge();
        void fire_module_hooks(const std::string& name, ProgressEvent event, const EventData& data) const;

        Config m_config;
        Manifest m_manifest;
        ModuleRegistry m_registry;
        StateManager& m_state;
        RollbackManager& m_rollback;
        ProgressCallback m_user_callback;
        HooksManager m_hooks;
    };

} // namespace keel
