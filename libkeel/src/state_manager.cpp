//
// Created by cv2 on 10/6/25.
//

#include "libkeel/state_manager.h"
#include "libkeel/logging.h"
#include "libkeel/paths.h"

#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>
#include <system_error>

// This is a big header, so we include it only in the .cpp file.
#define SQLITE_ORM_OMITS_CODECVT // Avoids deprecation warnings with C++17 and later
#include <sqlite_orm/sqlite_orm.h>

namespace keel {

// --- ORM Table Definitions ---
// These structs represent the DB schema. Timestamps are ISO-8601 strings,
// JSON columns are stored as text.
    namespace db_schema {
        struct Installation {
            std::string installation_id;
            std::string started_at;
            std::string profile;
            std::optional<std::string> completed_at;
            std::string overall_status;
            std::string metadata_json;
        };

        struct Module {
            std::string installation_id;
            std::string module_name;
            std::string status;
            std::optional<std::string> started_at;
            std::optional<std::string> completed_at;
            std::optional<double> duration_seconds;
            int progress_percent = 0;
            std::string current_step;
            std::optional<std::string> error_message;
            std::optional<std::string> checkpoint;
            std::string rollback_actions_json;
        };

        struct Checkpoint {
            int64_t id = 0;
            std::string installation_id;
            std::string module_name;
            std::string checkpoint_name;
            std::string state_snapshot_json;
            std::string created_at;
        };
    }

// --- ORM Storage Factory ---
    auto create_storage(const std::string& db_path) {
        using namespace sqlite_orm;
        return make_storage(db_path,
            make_table("installations",
               make_column("installation_id", &db_schema::Installation::installation_id, primary_key()),
               make_column("started_at", &db_schema::Installation::started_at),
               make_column("profile", &db_schema::Installation::profile),
               make_column("completed_at", &db_schema::Installation::completed_at),
               make_column("overall_status", &db_schema::Installation::overall_status),
               make_column("metadata_json", &db_schema::Installation::metadata_json)
            ),
            make_table("modules",
               make_column("installation_id", &db_schema::Module::installation_id),
               make_column("module_name", &db_schema::Module::module_name),
               make_column("status", &db_schema::Module::status),
               make_column("started_at", &db_schema::Module::started_at),
               make_column("completed_at", &db_schema::Module::completed_at),
               make_column("duration_seconds", &db_schema::Module::duration_seconds),
               make_column("progress_percent", &db_schema::Module::progress_percent),
               make_column("current_step", &db_schema::Module::current_step),
               make_column("error_message", &db_schema::Module::error_message),
               make_column("checkpoint", &db_schema::Module::checkpoint),
               make_column("rollback_actions_json", &db_schema::Module::rollback_actions_json),
               primary_key(&db_schema::Module::installation_id, &db_schema::Module::module_name)
            ),
            make_table("checkpoints",
               make_column("id", &db_schema::Checkpoint::id, primary_key().autoincrement()),
               make_column("installation_id", &db_schema::Checkpoint::installation_id),
               make_column("module_name", &db_schema::Checkpoint::module_name),
               make_column("checkpoint_name", &db_schema::Checkpoint::checkpoint_name),
               make_column("state_snapshot_json", &db_schema::Checkpoint::state_snapshot_json),
               make_column("created_at", &db_schema::Checkpoint::created_at)
            )
        );
    }

// --- The PIMPL Implementation ---
    struct StateManager::Impl {
        using Storage = decltype(create_storage(""));
        Storage storage;

        explicit Impl(const std::string& db_path) : storage(create_storage(db_path)) {
            storage.open_forever(); // one connection for the manager's lifetime (required for :memory:)
            storage.sync_schema(true);
        }
    };

// --- Conversion Functions ---
    namespace {
        std::optional<std::string> to_text(const std::optional<TimePoint>& tp) {
            if (!tp) return std::nullopt;
            return to_iso8601(*tp);
        }

        TimePoint parse_time(const std::string& text) {
            auto tp = from_iso8601(text);
            if (!tp) {
                throw std::invalid_argument("invalid timestamp '" + text + "'");
            }
            return *tp;
        }

        std::optional<TimePoint> parse_time(const std::optional<std::string>& text) {
            if (!text) return std::nullopt;
            return parse_time(*text);
        }

        std::string generate_installation_id() {
            static std::mt19937_64 engine{std::random_device{}()};
            static std::mutex engine_mutex;
            std::uniform_int_distribution<std::uint64_t> dist(0, 0xFFFFFFFFFFFFULL);

            std::uint64_t value;
            {
                std::lock_guard<std::mutex> lock(engine_mutex);
                value = dist(engine);
            }
            std::stringstream ss;
            ss << "inst-" << std::hex << std::setw(12) << std::setfill('0') << value;
            return ss.str();
        }

        db_schema::Installation to_db(const InstallationState& state) {
            return {
                    state.installation_id,
                    to_iso8601(state.started_at),
                    state.profile,
                    to_text(state.completed_at),
                    to_string(state.overall_status),
                    state.metadata.dump()
            };
        }

        InstallationState from_db(const db_schema::Installation& row) {
            InstallationState state;
            state.installation_id = row.installation_id;
            state.started_at = parse_time(row.started_at);
            state.profile = row.profile;
            state.completed_at = parse_time(row.completed_at);

            auto status = installation_status_from_string(row.overall_status);
            if (!status) {
                throw std::invalid_argument("unknown installation status '" + row.overall_status + "'");
            }
            state.overall_status = *status;
            state.metadata = row.metadata_json.empty() ? nlohmann::json::object()
                                                       : nlohmann::json::parse(row.metadata_json);
            return state;
        }

        db_schema::Module to_db(const std::string& installation_id, const ModuleState& state) {
            return {
                    installation_id,
                    state.name,
                    to_string(state.status),
                    to_text(state.started_at),
                    to_text(state.completed_at),
                    state.duration_seconds,
                    state.progress_percent,
                    state.current_step,
                    state.error_message,
                    state.checkpoint,
                    nlohmann::json(state.rollback_actions).dump()
            };
        }

        ModuleState from_db(const db_schema::Module& row) {
            ModuleState state;
            state.name = row.module_name;

            auto status = module_status_from_string(row.status);
            if (!status) {
                throw std::invalid_argument("unknown module status '" + row.status + "'");
            }
            state.status = *status;
            state.started_at = parse_time(row.started_at);
            state.completed_at = parse_time(row.completed_at);
            state.duration_seconds = row.duration_seconds;
            state.progress_percent = row.progress_percent;
            state.current_step = row.current_step;
            state.error_message = row.error_message;
            state.checkpoint = row.checkpoint;
            if (!row.rollback_actions_json.empty()) {
                state.rollback_actions = nlohmann::json::parse(row.rollback_actions_json)
                        .get<std::vector<RollbackAction>>();
            }
            return state;
        }

        CheckpointRecord from_db(const db_schema::Checkpoint& row) {
            CheckpointRecord record;
            record.id = row.id;
            record.installation_id = row.installation_id;
            record.module_name = row.module_name;
            record.checkpoint_name = row.checkpoint_name;
            record.snapshot = nlohmann::json::parse(row.state_snapshot_json).get<ModuleState>();
            record.created_at = parse_time(row.created_at);
            return record;
        }

        auto resumable_condition() {
            using namespace sqlite_orm;
            return and_(c(&db_schema::Installation::overall_status) == to_string(InstallationStatus::InProgress),
                        is_null(&db_schema::Installation::completed_at));
        }
    }

// --- Public Method Implementations ---

    StateManager::StateManager(const std::filesystem::path& db_path) {
        if (db_path != kInMemory && db_path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(db_path.parent_path(), ec);
            if (ec) {
                log::warn("Could not create " + db_path.parent_path().string() + ": " + ec.message());
            }
        }

        try {
            pimpl = std::make_unique<Impl>(db_path.string());
        } catch (const std::exception& e) {
            throw StateException(StateError::DatabaseError,
                                 "Failed to open state database " + db_path.string() + ": " + e.what());
        }
        log::debug("State database ready: " + db_path.string());
    }

    StateManager::~StateManager() = default; // Important for unique_ptr with incomplete type

    std::filesystem::path StateManager::default_db_path() {
        return default_data_path("state.db");
    }

    std::expected<InstallationState, StateError> StateManager::start_installation(const std::string& profile,
                                                                                 const nlohmann::json& metadata) {
        std::lock_guard<std::mutex> lock(m_mutex);

        InstallationState state;
        state.installation_id = generate_installation_id();
        state.started_at = timestamp_now();
        state.profile = profile;
        state.metadata = metadata.is_null() ? nlohmann::json::object() : metadata;

        try {
            pimpl->storage.replace(to_db(state));
        } catch (const std::exception& e) {
            log::error(std::string("Failed to record new installation: ") + e.what());
            return std::unexpected(StateError::DatabaseError);
        }

        m_current = state;
        log::info("Started installation " + state.installation_id + " with profile " + profile);
        return state;
    }

    std::expected<void, StateError> StateManager::complete_installation(bool success) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_current) {
            throw StateException(StateError::NoActiveInstallation, "No active installation");
        }

        m_current->completed_at = timestamp_now();
        m_current->overall_status = success ? InstallationStatus::Success : InstallationStatus::Failed;

        try {
            pimpl->storage.replace(to_db(*m_current));
        } catch (const std::exception& e) {
            log::error("Failed to complete installation " + m_current->installation_id + ": " + e.what());
            return std::unexpected(StateError::DatabaseError);
        }

        log::info("Installation " + m_current->installation_id + " completed with status: "
                  + to_string(m_current->overall_status));
        return {};
    }

    ModuleState& StateManager::module_entry(const std::string& module_name) {
        if (!m_current) {
            throw StateException(StateError::NoActiveInstallation, "No active installation");
        }
        auto [it, inserted] = m_current->modules.try_emplace(module_name);
        if (inserted) {
            it->second.name = module_name;
        }
        return it->second;
    }

    void StateManager::persist_module(const ModuleState& state) {
        try {
            pimpl->storage.replace(to_db(m_current->installation_id, state));
        } catch (const std::exception& e) {
            log::error("Failed to persist state of module '" + state.name + "': " + e.what());
        }
    }

    void StateManager::update_module(const std::string& module_name,
                                     std::optional<ModuleStatus> status,
                                     std::optional<int> progress,
                                     std::optional<std::string> current_step,
                                     std::optional<std::string> error) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ModuleState& state = module_entry(module_name);

        if (status) {
            state.status = *status;
            if (*status == ModuleStatus::Running && !state.started_at) {
                state.started_at = timestamp_now();
            } else if (*status == ModuleStatus::Completed || *status == ModuleStatus::Failed) {
                state.completed_at = timestamp_now();
                if (state.started_at) {
                    state.duration_seconds = seconds_between(*state.started_at, *state.completed_at);
                }
            }
        }
        if (progress) {
            state.progress_percent = std::clamp(*progress, 0, 100);
        }
        if (current_step) {
            state.current_step = std::move(*current_step);
        }
        if (error) {
            state.error_message = std::move(*error);
        }

        persist_module(state);
        log::debug("Updated module " + module_name + (status ? ": " + to_string(*status) : std::string{}));
    }

    void StateManager::add_rollback_action(const std::string& module_name, const RollbackAction& action) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ModuleState& state = module_entry(module_name);
        state.rollback_actions.push_back(action);
        persist_module(state);
    }

    void StateManager::create_checkpoint(const std::string& module_name, const std::string& checkpoint_name) {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_current) {
            throw StateException(StateError::NoActiveInstallation, "No active installation");
        }

        auto it = m_current->modules.find(module_name);
        if (it == m_current->modules.end()) {
            log::warn("Cannot create checkpoint for unknown module: " + module_name);
            return;
        }

        ModuleState& state = it->second;
        state.checkpoint = checkpoint_name;
        persist_module(state);

        try {
            db_schema::Checkpoint row;
            row.installation_id = m_current->installation_id;
            row.module_name = module_name;
            row.checkpoint_name = checkpoint_name;
            row.state_snapshot_json = nlohmann::json(state).dump();
            row.created_at = to_iso8601(timestamp_now());
            pimpl->storage.insert(row);
        } catch (const std::exception& e) {
            log::error("Failed to save checkpoint '" + checkpoint_name + "' for " + module_name + ": " + e.what());
            return;
        }

        log::info("Created checkpoint '" + checkpoint_name + "' for " + module_name);
    }

    bool StateManager::can_resume() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        try {
            return pimpl->storage.count<db_schema::Installation>(sqlite_orm::where(resumable_condition())) > 0;
        } catch (const std::exception& e) {
            log::error(std::string("Failed to query resumable installations: ") + e.what());
            return false;
        }
    }

    std::expected<std::optional<InstallationState>, StateError> StateManager::resume_installation() {
        using namespace sqlite_orm;
        std::lock_guard<std::mutex> lock(m_mutex);

        InstallationState state;
        try {
            auto rows = pimpl->storage.get_all<db_schema::Installation>(
                    where(resumable_condition()),
                    order_by(&db_schema::Installation::started_at).desc(),
                    limit(1));
            if (rows.empty()) {
                return std::optional<InstallationState>{};
            }
            state = from_db(rows.front());

            auto module_rows = pimpl->storage.get_all<db_schema::Module>(
                    where(c(&db_schema::Module::installation_id) == state.installation_id));
            for (const auto& row : module_rows) {
                state.modules[row.module_name] = from_db(row);
            }
        } catch (const std::system_error& e) {
            log::error(std::string("Failed to load resumable installation: ") + e.what());
            return std::unexpected(StateError::DatabaseError);
        } catch (const std::exception& e) {
            log::error(std::string("Stored installation is corrupt: ") + e.what());
            return std::unexpected(StateError::CorruptRecord);
        }

        m_current = state;
        log::info("Resumed installation " + state.installation_id);
        return std::optional<InstallationState>{std::move(state)};
    }

    std::optional<InstallationState> StateManager::current_state() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_current;
    }

    std::optional<ModuleState> StateManager::module_state(const std::string& module_name) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (!m_current) {
            return std::nullopt;
        }
        auto it = m_current->modules.find(module_name);
        if (it == m_current->modules.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<InstallationState> StateManager::get_installation_history(std::size_t max_rows) const {
        using namespace sqlite_orm;
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<InstallationState> history;
        try {
            auto rows = pimpl->storage.get_all<db_schema::Installation>(
                    order_by(&db_schema::Installation::started_at).desc(),
                    limit(static_cast<int>(max_rows)));
            history.reserve(rows.size());
            for (const auto& row : rows) {
                try {
                    history.push_back(from_db(row));
                } catch (const std::exception& e) {
                    log::warn("Skipping unreadable installation " + row.installation_id + ": " + e.what());
                }
            }
        } catch (const std::system_error& e) {
            log::error(std::string("Failed to read installation history: ") + e.what());
        }
        return history;
    }

    std::vector<CheckpointRecord> StateManager::list_checkpoints(const std::string& installation_id,
                                                                 const std::string& module_name) const {
        using namespace sqlite_orm;
        std::lock_guard<std::mutex> lock(m_mutex);

        std::vector<CheckpointRecord> records;
        try {
            auto rows = pimpl->storage.get_all<db_schema::Checkpoint>(
                    where(c(&db_schema::Checkpoint::installation_id) == installation_id),
                    order_by(&db_schema::Checkpoint::id));
            for (const auto& row : rows) {
                if (!module_name.empty() && row.module_name != module_name) {
                    continue;
                }
                records.push_back(from_db(row));
            }
        } catch (const std::exception& e) {
            log::error("Failed to list checkpoints for " + installation_id + ": " + e.what());
        }
        return records;
    }

} // namespace keel
