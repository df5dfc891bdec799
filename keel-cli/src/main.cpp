#include <iostream>
#include <vector>
#include <string>
#include <filesystem>
#include <memory>
#include <optional>
#include <unistd.h> // For geteuid()

#include <cxxopts.hpp>

// Our library and UI helpers
#include "ui_helpers.h"
#include <libkeel/command_module.h>
#include <libkeel/config.h>
#include <libkeel/installer.h>
#include <libkeel/logging.h>
#include <libkeel/manifest.h>
#include <libkeel/module_registry.h>
#include <libkeel/rollback_manager.h>
#include <libkeel/state_manager.h>

namespace {
    const std::filesystem::path kSystemConfig = "/etc/keel/config.yaml";
}

std::string error_to_string(keel::InstallError err) {
    switch (err) {
        case keel::InstallError::InvalidManifest: return "The module manifest is invalid.";
        case keel::InstallError::ConflictDetected: return "Two enabled modules conflict with each other.";
        case keel::InstallError::UnsatisfiedDependency: return "An enabled module depends on an unknown module.";
        case keel::InstallError::UnknownModule: return "A module could not be instantiated.";
        case keel::InstallError::InvalidGraph: return "The dependency graph contains a cycle or a missing module.";
        case keel::InstallError::StateUnavailable: return "The installation state database could not be updated.";
        default: return "An unknown installation error occurred.";
    }
}

void warn_if_not_root(bool dry_run) {
    if (!dry_run && geteuid() != 0) {
        ui::warning("Not running as root; modules that change the system are likely to fail.");
    }
}

// Without a configuration file every manifest module is selected.
std::optional<keel::Config> load_config(const cxxopts::ParseResult& result, const keel::Manifest& manifest) {
    std::filesystem::path path;
    if (result.count("config")) {
        path = result["config"].as<std::string>();
    } else if (std::filesystem::exists(kSystemConfig)) {
        path = kSystemConfig;
    }

    if (path.empty()) {
        keel::Config config;
        for (const auto& name : manifest.names()) {
            config.modules.push_back(keel::ModuleSettings{name, true, {}});
        }
        return config;
    }

    auto config = keel::Config::load(path);
    if (!config) {
        ui::error("Failed to load " + path.string() + ": " + keel::to_string(config.error()));
        return std::nullopt;
    }
    return *config;
}

std::optional<keel::Manifest> load_manifest(const cxxopts::ParseResult& result) {
    if (!result.count("manifest")) {
        return keel::Manifest::builtin();
    }
    const auto path = result["manifest"].as<std::string>();
    auto manifest = keel::Manifest::load(path);
    if (!manifest) {
        ui::error("Failed to load manifest " + path + ": " + keel::to_string(manifest.error()));
        return std::nullopt;
    }
    return *manifest;
}

keel::ModuleRegistry make_registry() {
    keel::ModuleRegistry registry;
    registry.set_fallback([](const std::string& name, const keel::ModuleConfig& config) {
        return std::make_shared<keel::CommandModule>(name, config);
    });
    return registry;
}

void print_event(const std::string& name, keel::ProgressEvent event, const keel::EventData& data) {
    switch (event) {
        case keel::ProgressEvent::Started:
            keel::log::info(name + ": started");
            break;
        case keel::ProgressEvent::Completed: {
            auto it = data.find("duration");
            keel::log::ok(name + ": completed" + (it != data.end() ? " in " + it->second + "s" : ""));
            break;
        }
        case keel::ProgressEvent::Failed:
            // The stage runner already logged the failure.
            break;
        default:
            keel::log::debug(name + ": " + keel::to_string(event));
            break;
    }
}

// --- COMMAND HANDLERS ---

int do_plan(keel::Installer& installer) {
    ui::action("Resolving module dependencies...");
    auto plan = installer.plan();
    if (!plan) {
        ui::error(error_to_string(plan.error()) + " (see details above)");
        return 1;
    }
    if (plan->empty()) {
        ui::header("Nothing to do.");
        return 0;
    }
    ui::print_plan(*plan);
    return 0;
}

int do_install(keel::Installer& installer, const keel::InstallOptions& options, bool assume_yes) {
    ui::action(options.resume ? "Resuming interrupted installation..." : "Resolving module dependencies...");
    if (options.dry_run) ui::warning("Dry run: no module will change the system.");
    warn_if_not_root(options.dry_run);

    auto plan = installer.plan();
    if (!plan) {
        ui::error(error_to_string(plan.error()) + " (see details above)");
        return 1;
    }
    if (plan->empty()) {
        ui::header("Nothing to do.");
        return 0;
    }

    ui::print_plan(*plan);
    if (!assume_yes && !options.dry_run && !ui::confirm("Proceed with installation?")) {
        ui::warning("Installation aborted by user.");
        return 0;
    }

    auto report = installer.install(options);
    if (!report) {
        ui::error(error_to_string(report.error()) + " (see details above)");
        return 1;
    }

    ui::print_report(*report);
    if (report->success) {
        ui::header("Installation completed successfully.");
        return 0;
    }
    if (!report->rolled_back) {
        ui::warning("Changes were not rolled back; run 'keel rollback' to undo them.");
    } else if (!report->rollback_succeeded) {
        ui::warning("Some rollback actions failed; run 'keel rollback' to retry them.");
    }
    ui::error("Installation failed.");
    return 1;
}

int do_resume(keel::Installer& installer, keel::StateManager& state, keel::InstallOptions options, bool assume_yes) {
    if (!state.can_resume()) {
        ui::header("No interrupted installation to resume.");
        return 0;
    }
    options.resume = true;
    return do_install(installer, options, assume_yes);
}

int do_rollback(keel::Installer& installer, bool dry_run, bool assume_yes) {
    ui::action("Rolling back recorded changes...");
    warn_if_not_root(dry_run);
    if (!assume_yes && !dry_run && !ui::confirm("Undo every recorded change?")) {
        ui::warning("Rollback aborted by user.");
        return 0;
    }
    if (installer.rollback(dry_run)) {
        ui::header(dry_run ? "Rollback dry run finished." : "Rollback completed successfully.");
        return 0;
    }
    ui::error("Rollback finished with failures; the failed actions are kept for another attempt.");
    return 1;
}

int do_status(keel::Installer& installer, keel::StateManager& state, keel::RollbackManager& rollback) {
    ui::action("Recent installations");
    const auto history = installer.history(10);
    if (history.empty()) {
        ui::item("none recorded");
    }
    for (const auto& inst : history) {
        std::string line = inst.installation_id + "  " + keel::to_iso8601(inst.started_at) + "  "
                           + inst.profile + "  " + keel::to_string(inst.overall_status);
        ui::item(line);
    }

    if (state.can_resume()) {
        ui::warning("An interrupted installation can be resumed with 'keel resume'.");
    }

    if (rollback.empty() && !rollback.load_state()) {
        keel::log::debug("No rollback log at " + rollback.state_file().string());
    }
    ui::header(rollback.get_summary());
    return 0;
}

int do_verify(keel::Installer& installer) {
    ui::action("Verifying enabled modules...");
    auto outcome = installer.verify();
    if (!outcome) {
        ui::error(error_to_string(outcome.error()) + " (see details above)");
        return 1;
    }

    bool all_ok = true;
    for (const auto& [name, ok] : *outcome) {
        ui::item(name + ": " + (ok ? "ok" : "FAILED"));
        all_ok = all_ok && ok;
    }
    if (all_ok) {
        ui::header("All modules verified.");
        return 0;
    }
    ui::error("Verification failed for one or more modules.");
    return 1;
}

// --- Main Function ---

int main(int argc, char* argv[]) {
    cxxopts::Options options("keel", "Installs a stack of modules in dependency order, with resume and rollback");
    options.positional_help("<plan|install|resume|rollback|status|verify>");
    options.add_options()
            ("c,config", "Configuration file", cxxopts::value<std::string>())
            ("m,manifest", "Module manifest (defaults to the built-in stack)", cxxopts::value<std::string>())
            ("v,verbose", "Print debug output")
            ("n,dry-run", "Show what would run without changing the system")
            ("resume", "Continue the last interrupted installation")
            ("no-rollback", "Keep changes of a failed installation")
            ("p,profile", "Profile name recorded with the installation", cxxopts::value<std::string>())
            ("y,yes", "Do not ask for confirmation")
            ("h,help", "Show this help")
            ("command", "Command to run", cxxopts::value<std::string>())
            ;
    options.parse_positional({"command"});

    std::optional<cxxopts::ParseResult> parsed;
    try {
        parsed.emplace(options.parse(argc, argv));
    } catch (const std::exception& e) {
        ui::error(std::string("Invalid usage: ") + e.what());
        std::cerr << options.help() << std::endl;
        return 1;
    }
    const auto& result = *parsed;

    if (result.count("help") || !result.count("command")) {
        std::cout << options.help() << std::endl;
        return result.count("help") ? 0 : 1;
    }

    const std::string command = result["command"].as<std::string>();

    auto manifest = load_manifest(result);
    if (!manifest) {
        return 1;
    }
    auto config = load_config(result, *manifest);
    if (!config) {
        return 1;
    }
    keel::log::set_verbose(config->verbose || result.count("verbose") > 0);

    std::unique_ptr<keel::StateManager> state;
    try {
        state = std::make_unique<keel::StateManager>(config->db_path.value_or(keel::StateManager::default_db_path()));
    } catch (const keel::StateException& e) {
        ui::error(std::string("Cannot open the state database: ") + e.what());
        return 1;
    }
    keel::RollbackManager rollback(config->rollback_state_file.value_or(keel::RollbackManager::default_state_file()));

    keel::InstallOptions install_options;
    install_options.dry_run = result.count("dry-run") > 0;
    install_options.resume = result.count("resume") > 0;
    install_options.auto_rollback = config->auto_rollback && !result.count("no-rollback");
    install_options.profile = result.count("profile") ? result["profile"].as<std::string>() : config->profile;
    const bool assume_yes = result.count("yes") > 0 || !keel::ui::is_interactive();

    keel::Installer installer(*config, *manifest, make_registry(), *state, rollback);
    installer.set_progress_callback(print_event);

    // Command dispatch.
    if (command == "plan") {
        return do_plan(installer);
    } else if (command == "install") {
        return do_install(installer, install_options, assume_yes);
    } else if (command == "resume") {
        return do_resume(installer, *state, install_options, assume_yes);
    } else if (command == "rollback") {
        return do_rollback(installer, install_options.dry_run, assume_yes);
    } else if (command == "status") {
        return do_status(installer, *state, rollback);
    } else if (command == "verify") {
        return do_verify(installer);
    }

    ui::error("Unknown command '" + command + "'.");
    std::cerr << options.help() << std::endl;
    return 1;
}
