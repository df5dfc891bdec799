//
// Created by cv2 on 10/5/25.
//

#include "libkeel/rollback_manager.h"
#include "libkeel/logging.h"
#include "libkeel/paths.h"

#include <algorithm>
#include <fstream>
#include <utility>

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

        std::expected<void, std::string> check(const CommandOutcome& outcome, const std::string& command) {
            if (outcome.ok()) {
                return {};
            }
            std::string reason = "'" + command + "' exited with status " + std::to_string(outcome.exit_code);
            if (!outcome.output.empty()) {
                reason += ": " + outcome.output;
            }
            return std::unexpected(reason);
        }
    }

    RollbackManager::RollbackManager(std::filesystem::path state_file, CommandRunner runner)
        : m_state_file(std::move(state_file)), m_runner(std::move(runner)) {}

    std::filesystem::path RollbackManager::default_state_file() {
        return default_data_path("rollback-state.json");
    }

    // --- Registration ---

    RollbackAction RollbackManager::append(RollbackActionType type, std::string description, nlohmann::json data) {
        RollbackAction action{type, std::move(description), std::move(data), timestamp_now()};

        std::lock_guard<std::mutex> lock(m_mutex);
        m_actions.push_back(action);
        save_state();
        log::debug("Registered rollback action: " + action.description);
        return action;
    }

    RollbackAction RollbackManager::add_command(const std::string& command, const std::string& description) {
        return append(RollbackActionType::Command,
                      description.empty() ? "Run: " + command : description,
                      {{"command", command}});
    }

    RollbackAction RollbackManager::add_file_restore(const std::filesystem::path& backup_path,
                                                     const std::filesystem::path& original_path,
                                                     const std::string& description) {
        return append(RollbackActionType::FileRestore,
                      description.empty() ? "Restore: " + original_path.string() : description,
                      {{"backup_path", backup_path.string()}, {"original_path", original_path.string()}});
    }

    RollbackAction RollbackManager::add_package_remove(const std::vector<std::string>& packages,
                                                       const std::string& description) {
        return append(RollbackActionType::PackageRemove,
                      description.empty() ? "Remove packages: " + join(packages) : description,
                      {{"packages", packages}});
    }

    RollbackAction RollbackManager::add_service_stop(const std::string& service, const std::string& description) {
        return append(RollbackActionType::ServiceStop,
                      description.empty() ? "Stop service: " + service : description,
                      {{"service", service}});
    }

    // --- Replay ---

    std::expected<void, std::string> RollbackManager::execute(const RollbackAction& action) const {
        try {
            switch (action.type) {
                case RollbackActionType::Command: {
                    const auto command = action.data.at("command").get<std::string>();
                    return check(m_runner(command), command);
                }
                case RollbackActionType::FileRestore: {
                    const std::filesystem::path backup = action.data.at("backup_path").get<std::string>();
                    const std::filesystem::path original = action.data.at("original_path").get<std::string>();
                    if (!std::filesystem::exists(backup)) {
                        return std::unexpected("backup " + backup.string() + " does not exist");
                    }
                    std::error_code ec;
                    if (original.has_parent_path()) {
                        std::filesystem::create_directories(original.parent_path(), ec);
                    }
                    std::filesystem::copy_file(backup, original, std::filesystem::copy_options::overwrite_existing, ec);
                    if (ec) {
                        return std::unexpected("cannot restore " + original.string() + ": " + ec.message());
                    }
                    return {};
                }
                case RollbackActionType::PackageRemove: {
                    const auto packages = action.data.at("packages").get<std::vector<std::string>>();
                    const auto command = "apt-get remove -y " + shell_join(packages);
                    return check(m_runner(command), command);
                }
                case RollbackActionType::ServiceStop: {
                    const auto service = shell_quote(action.data.at("service").get<std::string>());
                    // disable is attempted even when stop fails
                    const auto stopped = check(m_runner("systemctl stop " + service), "systemctl stop " + service);
                    const auto disabled = check(m_runner("systemctl disable " + service), "systemctl disable " + service);
                    if (!stopped) return stopped;
                    return disabled;
                }
            }
        } catch (const std::exception& e) {
            return std::unexpected(std::string("malformed action: ") + e.what());
        }
        return std::unexpected("unknown action type");
    }

    bool RollbackManager::rollback(bool dry_run) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_last_failures.clear();

        if (m_actions.empty()) {
            log::info("No rollback actions to perform.");
            return true;
        }

        log::info("Rolling back " + std::to_string(m_actions.size()) + " action(s)...");

        if (dry_run) {
            for (auto it = m_actions.rbegin(); it != m_actions.rend(); ++it) {
                log::info("[dry-run] Would undo: " + it->description);
            }
            return true;
        }

        std::vector<bool> failed(m_actions.size(), false);
        for (std::size_t i = m_actions.size(); i-- > 0;) {
            const auto& action = m_actions[i];
            log::progress("Undo: " + action.description);
            auto outcome = execute(action);
            if (outcome) {
                log::progress_ok();
                continue;
            }
            log::error("\nRollback action failed (" + action.description + "): " + outcome.error());
            failed[i] = true;
            m_last_failures.push_back(RollbackFailure{action, outcome.error()});
        }

        if (m_last_failures.empty()) {
            m_actions.clear();
            clear_state_file();
            log::ok("Rollback completed successfully.");
            return true;
        }

        std::vector<RollbackAction> remaining;
        for (std::size_t i = 0; i < m_actions.size(); ++i) {
            if (failed[i]) {
                remaining.push_back(m_actions[i]);
            }
        }
        m_actions = std::move(remaining);
        save_state();

        log::warn("Rollback incomplete: " + std::to_string(m_actions.size()) + " action(s) left for a retry.");
        return false;
    }

    // --- Persistence ---

    void RollbackManager::save_state() const {
        try {
            nlohmann::json doc;
            doc["actions"] = m_actions;
            doc["saved_at"] = to_iso8601(timestamp_now());

            std::error_code ec;
            if (m_state_file.has_parent_path()) {
                std::filesystem::create_directories(m_state_file.parent_path(), ec);
            }

            // Write the whole list to a sibling file, then swap it in.
            auto tmp_path = m_state_file;
            tmp_path += ".tmp";
            {
                std::ofstream out(tmp_path, std::ios::trunc);
                if (!out) {
                    log::error("Failed to open rollback state file for writing: " + tmp_path.string());
                    return;
                }
                out << doc.dump(2);
                if (!out) {
                    log::error("Failed to write rollback state to " + tmp_path.string());
                    return;
                }
            }

            std::filesystem::rename(tmp_path, m_state_file, ec);
            if (ec) {
                log::error("Failed to replace rollback state file " + m_state_file.string() + ": " + ec.message());
            }
        } catch (const nlohmann::json::exception& e) {
            log::error(std::string("Failed to serialise rollback state: ") + e.what());
        }
    }

    void RollbackManager::clear_state_file() const {
        std::error_code ec;
        std::filesystem::remove(m_state_file, ec);
        if (ec) {
            log::warn("Could not remove rollback state file " + m_state_file.string() + ": " + ec.message());
        }
    }

    bool RollbackManager::load_state() {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!std::filesystem::exists(m_state_file)) {
            return false;
        }

        std::ifstream in(m_state_file);
        if (!in) {
            log::error("Failed to open rollback state file: " + m_state_file.string());
            return false;
        }

        try {
            const auto doc = nlohmann::json::parse(in);
            m_actions = doc.at("actions").get<std::vector<RollbackAction>>();
        } catch (const std::exception& e) {
            log::error("Failed to load rollback state from " + m_state_file.string() + ": " + e.what());
            return false;
        }

        log::info("Loaded " + std::to_string(m_actions.size()) + " pending rollback action(s).");
        return true;
    }

    // --- Queries ---

    std::string RollbackManager::get_summary() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_actions.empty()) {
            return "No rollback actions pending";
        }

        std::vector<std::pair<RollbackActionType, std::size_t>> counts;
        for (const auto& action : m_actions) {
            auto it = std::find_if(counts.begin(), counts.end(),
                                   [&](const auto& entry) { return entry.first == action.type; });
            if (it == counts.end()) {
                counts.emplace_back(action.type, 1);
            } else {
                ++it->second;
            }
        }

        std::vector<std::string> parts;
        for (const auto& [type, count] : counts) {
            parts.push_back(std::to_string(count) + " " + to_string(type));
        }
        return "Rollback actions: " + join(parts);
    }

    std::vector<RollbackAction> RollbackManager::actions() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_actions;
    }

    std::size_t RollbackManager::size() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_actions.size();
    }

    std::vector<RollbackFailure> RollbackManager::last_failures() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_last_failures;
    }

} // namespace keel
