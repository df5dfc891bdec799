//
// Created by cv2 on 10/5/25.
//

#include "libkeel/rollback_manager.h"
#include "libkeel/logging.h"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>

const std::filesystem::path TEST_DIR = std::filesystem::temp_directory_path() / "keel_rollback_test";
const std::filesystem::path TEST_STATE_FILE = TEST_DIR / "rollback-state.json";

// Records every command instead of running it. Commands containing one of
// `failing` exit with status 1.
struct RecordingRunner {
    std::vector<std::string> commands;
    std::vector<std::string> failing;

    keel::CommandRunner runner() {
        return [this](const std::string& command) {
            commands.push_back(command);
            keel::CommandOutcome outcome;
            outcome.exit_code = 0;
            for (const auto& marker : failing) {
                if (command.find(marker) != std::string::npos) {
                    outcome.exit_code = 1;
                    outcome.output = "simulated failure";
                }
            }
            return outcome;
        };
    }
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

void reset_test_dir() {
    std::filesystem::remove_all(TEST_DIR);
    std::filesystem::create_directories(TEST_DIR);
}

void test_reverse_order() {
    keel::log::info("Running test: Rollback runs newest first...");
    reset_test_dir();
    RecordingRunner recorder;
    keel::RollbackManager manager(TEST_STATE_FILE, recorder.runner());

    manager.add_command("undo A");
    manager.add_command("undo B");
    auto c = manager.add_command("undo C", "custom description");
    assert(c.description == "custom description");
    assert(manager.size() == 3);
    assert(std::filesystem::exists(TEST_STATE_FILE));

    assert(manager.rollback());
    assert((recorder.commands == std::vector<std::string>{"undo C", "undo B", "undo A"}));
    assert(manager.empty());
    assert(manager.last_failures().empty());
    assert(!std::filesystem::exists(TEST_STATE_FILE));

    // Nothing left: a second rollback is a successful no-op.
    assert(manager.rollback());
    assert(recorder.commands.size() == 3);

    keel::log::ok("Test Passed: Rollback runs newest first");
}

void test_state_file_format() {
    keel::log::info("Running test: Rollback state file format...");
    reset_test_dir();
    RecordingRunner recorder;
    keel::RollbackManager manager(TEST_STATE_FILE, recorder.runner());

    manager.add_package_remove({"docker.io", "containerd"});
    manager.add_file_restore(TEST_DIR / "sshd_config.bak", TEST_DIR / "sshd_config");

    const auto doc = nlohmann::json::parse(read_file(TEST_STATE_FILE));
    assert(doc.contains("saved_at"));
    assert(doc["actions"].size() == 2);

    const auto& first = doc["actions"][0];
    assert(first["action_type"] == "package_remove");
    assert(first["description"] == "Remove packages: docker.io, containerd");
    assert((first["data"]["packages"] == nlohmann::json::array({"docker.io", "containerd"})));
    assert(first["timestamp"].get<std::string>().size() == 27);

    const auto& second = doc["actions"][1];
    assert(second["action_type"] == "file_restore");
    assert(second["description"] == "Restore: " + (TEST_DIR / "sshd_config").string());
    assert(second["data"]["backup_path"] == (TEST_DIR / "sshd_config.bak").string());

    // No temp file is left behind.
    auto tmp = TEST_STATE_FILE;
    tmp += ".tmp";
    assert(!std::filesystem::exists(tmp));

    keel::log::ok("Test Passed: Rollback state file format");
}

void test_partial_failure_keeps_failed_actions() {
    keel::log::info("Running test: Partial failure keeps only the failed actions...");
    reset_test_dir();
    RecordingRunner recorder;
    recorder.failing = {"undo B", "undo D"};
    keel::RollbackManager manager(TEST_STATE_FILE, recorder.runner());

    manager.add_command("undo A");
    auto b = manager.add_command("undo B");
    manager.add_command("undo C");
    auto d = manager.add_command("undo D");

    assert(!manager.rollback());
    // Every action was attempted despite the failures.
    assert((recorder.commands == std::vector<std::string>{"undo D", "undo C", "undo B", "undo A"}));

    // Remaining actions keep their original order.
    const auto remaining = manager.actions();
    assert(remaining.size() == 2);
    assert(remaining[0] == b);
    assert(remaining[1] == d);

    const auto failures = manager.last_failures();
    assert(failures.size() == 2);
    assert(failures[0].action == d);
    assert(failures[0].reason.find("exited with status 1") != std::string::npos);

    // The persisted file mirrors the remaining subset.
    keel::RollbackManager reloaded(TEST_STATE_FILE, recorder.runner());
    assert(reloaded.load_state());
    assert(reloaded.actions() == remaining);

    // A retry once the cause is fixed clears everything.
    recorder.failing.clear();
    recorder.commands.clear();
    assert(manager.rollback());
    assert((recorder.commands == std::vector<std::string>{"undo D", "undo B"}));
    assert(manager.empty());
    assert(!std::filesystem::exists(TEST_STATE_FILE));

    keel::log::ok("Test Passed: Partial failure keeps only the failed actions");
}

void test_dry_run() {
    keel::log::info("Running test: Dry run executes nothing...");
    reset_test_dir();
    RecordingRunner recorder;
    keel::RollbackManager manager(TEST_STATE_FILE, recorder.runner());
    manager.add_command("undo A");
    manager.add_service_stop("nginx");

    const auto before = manager.actions();
    assert(manager.rollback(true));
    assert(recorder.commands.empty());
    assert(manager.actions() == before);
    assert(std::filesystem::exists(TEST_STATE_FILE));

    keel::log::ok("Test Passed: Dry run executes nothing");
}

void test_load_state() {
    keel::log::info("Running test: Load persisted actions after a crash...");
    reset_test_dir();
    RecordingRunner recorder;

    std::vector<keel::RollbackAction> written;
    {
        keel::RollbackManager crashed(TEST_STATE_FILE, recorder.runner());
        crashed.add_command("rm -rf /opt/tool");
        crashed.add_service_stop("tool");
        written = crashed.actions();
    }

    keel::RollbackManager recovered(TEST_STATE_FILE, recorder.runner());
    assert(recovered.empty());
    assert(recovered.load_state());
    assert(recovered.actions() == written);

    assert(recovered.rollback());
    assert((recorder.commands == std::vector<std::string>{
            "systemctl stop 'tool'", "systemctl disable 'tool'", "rm -rf /opt/tool"}));

    // Missing and corrupt files are reported, not thrown.
    keel::RollbackManager missing(TEST_DIR / "absent.json", recorder.runner());
    assert(!missing.load_state());

    const auto corrupt_path = TEST_DIR / "corrupt.json";
    {
        std::ofstream out(corrupt_path);
        out << "{\"actions\": [{\"action_type\": \"reboot\"}]}";
    }
    keel::RollbackManager corrupt(corrupt_path, recorder.runner());
    assert(!corrupt.load_state());
    assert(corrupt.empty());

    keel::log::ok("Test Passed: Load persisted actions after a crash");
}

void test_summary() {
    keel::log::info("Running test: Rollback summary...");
    reset_test_dir();
    RecordingRunner recorder;
    keel::RollbackManager manager(TEST_STATE_FILE, recorder.runner());
    assert(manager.get_summary() == "No rollback actions pending");

    manager.add_command("a");
    manager.add_package_remove({"vim"});
    manager.add_command("b");
    manager.add_service_stop("ssh");
    assert(manager.get_summary() == "Rollback actions: 2 command, 1 package_remove, 1 service_stop");

    keel::log::ok("Test Passed: Rollback summary");
}

void test_system_actions() {
    keel::log::info("Running test: Package and service undo commands...");
    reset_test_dir();
    RecordingRunner recorder;
    recorder.failing = {"systemctl stop"};
    keel::RollbackManager manager(TEST_STATE_FILE, recorder.runner());

    manager.add_package_remove({"docker.io", "docker-compose"});
    manager.add_service_stop("docker");

    assert(!manager.rollback());
    assert((recorder.commands == std::vector<std::string>{
            "systemctl stop 'docker'",
            "systemctl disable 'docker'", // still attempted after stop failed
            "apt-get remove -y 'docker.io' 'docker-compose'"}));
    assert(manager.size() == 1);
    assert(manager.actions()[0].type == keel::RollbackActionType::ServiceStop);

    keel::log::ok("Test Passed: Package and service undo commands");
}

void test_file_restore() {
    keel::log::info("Running test: File restore...");
    reset_test_dir();
    const auto original = TEST_DIR / "etc" / "app.conf";
    const auto backup = TEST_DIR / "app.conf.keel-bak";
    {
        std::ofstream out(backup);
        out << "port = 80\n";
    }
    std::filesystem::create_directories(original.parent_path());
    {
        std::ofstream out(original);
        out << "port = 8080\n";
    }

    RecordingRunner recorder;
    keel::RollbackManager manager(TEST_STATE_FILE, recorder.runner());
    manager.add_file_restore(backup, original);
    manager.add_file_restore(TEST_DIR / "missing.bak", TEST_DIR / "other.conf");

    assert(!manager.rollback());
    assert(read_file(original) == "port = 80\n");
    assert(recorder.commands.empty());

    const auto failures = manager.last_failures();
    assert(failures.size() == 1);
    assert(failures[0].reason.find("does not exist") != std::string::npos);

    keel::log::ok("Test Passed: File restore");
}

int main() {
    try {
        test_reverse_order();
        test_state_file_format();
        test_partial_failure_keeps_failed_actions();
        test_dry_run();
        test_load_state();
        test_summary();
        test_system_actions();
        test_file_restore();
    } catch (const std::exception& e) {
        keel::log::error(std::string("A rollback manager test failed: ") + e.what());
        std::filesystem::remove_all(TEST_DIR);
        return 1;
    }

    std::filesystem::remove_all(TEST_DIR);
    keel::log::ok("All rollback manager tests completed successfully!");
    return 0;
}
