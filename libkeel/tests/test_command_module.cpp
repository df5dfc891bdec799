//
// Created by cv2 on 10/8/25.
//

#include "libkeel/command_module.h"
#include "libkeel/module_registry.h"
#include "libkeel/module_services.h"
#include "libkeel/stage_runner.h"
#include "libkeel/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>

const std::filesystem::path TEST_DIR = std::filesystem::temp_directory_path() / "keel_command_module_test";

struct RecordingRunner {
    std::vector<std::string> commands;
    std::string failing;

    keel::CommandRunner runner() {
        return [this](const std::string& command) {
            commands.push_back(command);
            keel::CommandOutcome outcome;
            outcome.exit_code = (!failing.empty() && command == failing) ? 3 : 0;
            if (outcome.exit_code != 0) {
                outcome.output = "E: unable to locate package";
            }
            return outcome;
        };
    }
};

keel::ExecutionContext context_for(const std::string& name, const std::shared_ptr<keel::Module>& module,
                                   keel::ModuleServices* services, bool dry_run = false) {
    keel::ExecutionContext ctx;
    ctx.module_name = name;
    ctx.module = module;
    ctx.capabilities = module->capabilities();
    ctx.dry_run = dry_run;
    ctx.services = services;
    return ctx;
}

void test_capabilities_from_config() {
    keel::log::info("Running test: Capabilities follow the config keys...");
    keel::CommandModule empty("empty", {});
    auto none = empty.capabilities();
    assert(!none.validate && !none.pre_configure && !none.configure && !none.post_configure && !none.verify);
    assert(!none.force_sequential && !none.large_module);

    keel::CommandModule full("full", {{"validate", "true"},
                                      {"configure", "apt-get install -y git"},
                                      {"verify", "git --version"},
                                      {"backup_file", "/etc/gitconfig"},
                                      {"force_sequential", "yes"},
                                      {"large_module", "no"},
                                      {"post_configure", ""}});
    auto caps = full.capabilities();
    assert(caps.validate && caps.configure && caps.verify);
    assert(caps.pre_configure);   // implied by backup_file
    assert(!caps.post_configure); // empty commands do not count
    assert(caps.force_sequential);
    assert(!caps.large_module);

    keel::log::ok("Test Passed: Capabilities follow the config keys");
}

void test_stages_run_in_order() {
    keel::log::info("Running test: Stage commands run in lifecycle order...");
    RecordingRunner recorder;
    auto module = std::make_shared<keel::CommandModule>("tools", keel::ModuleConfig{
            {"verify", "check"}, {"configure", "install"}, {"validate", "probe"},
            {"pre_configure", "prepare"}, {"post_configure", "finish"}}, recorder.runner());

    keel::ExecutionSession session;
    auto result = keel::run_module(context_for("tools", module, nullptr), session, {});
    assert(result.success);
    assert((recorder.commands == std::vector<std::string>{"probe", "prepare", "install", "finish", "check"}));

    keel::log::ok("Test Passed: Stage commands run in lifecycle order");
}

void test_failing_command() {
    keel::log::info("Running test: A failing command fails the stage...");
    RecordingRunner recorder;
    recorder.failing = "apt-get install -y nosuchpkg";
    auto module = std::make_shared<keel::CommandModule>("broken", keel::ModuleConfig{
            {"configure", "apt-get install -y nosuchpkg"}, {"verify", "true"}}, recorder.runner());

    keel::ExecutionSession session;
    auto result = keel::run_module(context_for("broken", module, nullptr), session, {});
    assert(!result.success);
    assert(result.failed_stage == "configure");
    assert(result.error->find("exited with status 3") != std::string::npos);
    assert(result.error->find("unable to locate package") != std::string::npos);
    assert(recorder.commands.size() == 1); // verify never ran

    keel::log::ok("Test Passed: A failing command fails the stage");
}

void test_dry_run_runs_nothing() {
    keel::log::info("Running test: Dry run only prints commands...");
    RecordingRunner recorder;
    keel::StateManager state(keel::StateManager::kInMemory);
    auto started = state.start_installation("default");
    assert(started.has_value());
    keel::ModuleServices services("docker", &state, nullptr);

    auto module = std::make_shared<keel::CommandModule>("docker", keel::ModuleConfig{
            {"configure", "apt-get install -y docker.io"}, {"packages", "docker.io"}}, recorder.runner());

    keel::ExecutionSession session;
    auto result = keel::run_module(context_for("docker", module, &services, true), session, {});
    assert(result.success);
    assert(result.metadata.at("dry_run") == "true");
    assert(recorder.commands.empty());
    assert(state.list_checkpoints(started->installation_id).empty());

    keel::log::ok("Test Passed: Dry run only prints commands");
}

void test_undo_registration() {
    keel::log::info("Running test: Configure registers undo actions...");
    std::filesystem::remove_all(TEST_DIR);
    std::filesystem::create_directories(TEST_DIR);
    const auto config_file = TEST_DIR / "daemon.json";
    {
        std::ofstream out(config_file);
        out << "{\"log-driver\": \"json-file\"}\n";
    }

    RecordingRunner recorder;
    keel::StateManager state(keel::StateManager::kInMemory);
    auto started = state.start_installation("default");
    assert(started.has_value());
    keel::RollbackManager rollback(TEST_DIR / "rollback-state.json", recorder.runner());
    keel::ModuleServices services("docker", &state, &rollback);
    state.update_module("docker", keel::ModuleStatus::Running);

    auto module = std::make_shared<keel::CommandModule>("docker", keel::ModuleConfig{
            {"configure", "apt-get install -y docker.io docker-compose"},
            {"packages", "docker.io  docker-compose"},
            {"service", "docker"},
            {"undo", "rm -rf /etc/docker"},
            {"backup_file", config_file.string()}}, recorder.runner());

    keel::ExecutionSession session;
    auto result = keel::run_module(context_for("docker", module, &services), session, {});
    assert(result.success);

    auto backup = config_file;
    backup += ".keel-bak";
    assert(std::filesystem::exists(backup));

    // Backup first (pre_configure), then the undo set after configure.
    const auto actions = rollback.actions();
    assert(actions.size() == 4);
    assert(actions[0].type == keel::RollbackActionType::FileRestore);
    assert(actions[1].type == keel::RollbackActionType::PackageRemove);
    assert((actions[1].data["packages"] == nlohmann::json::array({"docker.io", "docker-compose"})));
    assert(actions[2].type == keel::RollbackActionType::ServiceStop);
    assert(actions[3].type == keel::RollbackActionType::Command);

    // Mirrored into the module's persisted state, with a checkpoint.
    auto module_state = state.module_state("docker");
    assert(module_state.has_value());
    assert(module_state->rollback_actions == actions);
    assert(module_state->checkpoint == "configured");
    assert(state.list_checkpoints(started->installation_id, "docker").size() == 1);

    services.report_progress(55, "tuning");
    assert(state.module_state("docker")->progress_percent == 55);
    assert(state.module_state("docker")->current_step == "tuning");

    // Undo restores the original file.
    {
        std::ofstream out(config_file);
        out << "changed\n";
    }
    recorder.commands.clear();
    assert(rollback.rollback());
    assert((recorder.commands == std::vector<std::string>{
            "rm -rf /etc/docker", "systemctl stop 'docker'", "systemctl disable 'docker'",
            "apt-get remove -y 'docker.io' 'docker-compose'"}));
    std::ifstream restored(config_file);
    std::string line;
    std::getline(restored, line);
    assert(line == "{\"log-driver\": \"json-file\"}");

    std::filesystem::remove_all(TEST_DIR);
    keel::log::ok("Test Passed: Configure registers undo actions");
}

void test_failed_configure_registers_nothing() {
    keel::log::info("Running test: A failed configure registers no undo...");
    std::filesystem::remove_all(TEST_DIR);
    RecordingRunner recorder;
    recorder.failing = "install";
    keel::RollbackManager rollback(TEST_DIR / "rollback-state.json", recorder.runner());
    keel::ModuleServices services("php", nullptr, &rollback);

    auto module = std::make_shared<keel::CommandModule>("php", keel::ModuleConfig{
            {"configure", "install"}, {"packages", "php"}}, recorder.runner());
    keel::ExecutionSession session;
    auto result = keel::run_module(context_for("php", module, &services), session, {});
    assert(!result.success);
    assert(rollback.empty());

    std::filesystem::remove_all(TEST_DIR);
    keel::log::ok("Test Passed: A failed configure registers no undo");
}

void test_registry() {
    keel::log::info("Running test: Module registry...");
    keel::ModuleRegistry registry;
    assert(!registry.contains("git"));

    auto unknown = registry.describe(keel::ManifestEntry{"git"}, {});
    assert(!unknown.has_value());
    assert(unknown.error() == keel::RegistryError::UnknownModule);

    int created = 0;
    registry.add("git", [&created](const std::string& name, const keel::ModuleConfig& config) {
        ++created;
        return std::make_shared<keel::CommandModule>(name, config);
    });
    registry.add("bad", [](const std::string&, const keel::ModuleConfig&) -> std::shared_ptr<keel::Module> {
        throw std::runtime_error("cannot build");
    });
    registry.add("null", [](const std::string&, const keel::ModuleConfig&) -> std::shared_ptr<keel::Module> {
        return nullptr;
    });
    assert((registry.names() == std::vector<std::string>{"bad", "git", "null"}));

    keel::ManifestEntry entry{"git", {"system"}, {}, 40, false, true};
    auto descriptor = registry.describe(entry, {{"configure", "apt-get install -y git"}, {"force_sequential", "true"}});
    assert(descriptor.has_value());
    assert(created == 1);
    assert(descriptor->name == "git");
    assert((descriptor->depends_on == std::vector<std::string>{"system"}));
    // Hints from the manifest and from the module are combined.
    assert(descriptor->force_sequential && descriptor->capabilities.force_sequential);
    assert(descriptor->large_module && descriptor->capabilities.large_module);
    assert(descriptor->capabilities.configure);
    assert(descriptor->config.at("configure") == "apt-get install -y git");
    assert(descriptor->module != nullptr);

    assert(registry.describe(keel::ManifestEntry{"bad"}, {}).error() == keel::RegistryError::FactoryFailed);
    assert(registry.describe(keel::ManifestEntry{"null"}, {}).error() == keel::RegistryError::FactoryFailed);

    registry.set_fallback([](const std::string& name, const keel::ModuleConfig& config) {
        return std::make_shared<keel::CommandModule>(name, config);
    });
    assert(registry.contains("anything"));
    assert(registry.describe(keel::ManifestEntry{"anything"}, {}).has_value());

    keel::log::ok("Test Passed: Module registry");
}

int main() {
    try {
        test_capabilities_from_config();
        test_stages_run_in_order();
        test_failing_command();
        test_dry_run_runs_nothing();
        test_undo_registration();
        test_failed_configure_registers_nothing();
        test_registry();
    } catch (const std::exception& e) {
        keel::log::error(std::string("A command module test failed: ") + e.what());
        std::filesystem::remove_all(TEST_DIR);
        return 1;
    }

    std::filesystem::remove_all(TEST_DIR);
    keel::log::ok("All command module tests completed successfully!");
    return 0;
}
