//
// Created by cv2 on 10/4/25.
//

#pragma once

#include "module.h"
#include "time_util.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace keel {

    class ModuleServices;

    enum class ProgressEvent {
        Started,
        Validating,
        PreConfigure,
        Configuring,
        PostConfigure,
        Verifying,
        Completed,
        Failed
    };

    std::string to_string(ProgressEvent event);

    // Free-form payload attached to an event ("skipped" -> "true", "error" -> ...).
    using EventData = std::map<std::string, std::string>;

    // Invoked synchronously on whichever thread is running the module.
    using ProgressCallback = std::function<void(const std::string& module_name,
                                                ProgressEvent event,
                                                const EventData& data)>;

    struct ExecutionContext {
        std::string module_name;
        std::shared_ptr<Module> module;
        ModuleCapabilities capabilities;
        ModuleConfig config;
        bool dry_run = false;
        std::vector<std::string> dependencies;
        ModuleServices* services = nullptr; // not owned, may be null
    };

    struct ExecutionResult {
        std::string module_name;
        bool success = false;
        bool cancelled = false;
        TimePoint started_at{};
        TimePoint completed_at{};
        double duration_seconds = 0.0;
        std::optional<std::string> error;
        std::string failed_stage; // empty unless a stage failed
        std::map<std::string, std::string> metadata;
    };

    using ExecutionResults = std::map<std::string, ExecutionResult>;

    struct ModuleTiming {
        TimePoint started_at{};
        TimePoint completed_at{};
        double duration_seconds = 0.0;
    };

    // All run-wide mutable state shared between worker threads. One per run,
    // owned by the caller and passed by reference into every executor call.
    class ExecutionSession {
    public:
        ExecutionSession() = default;
        ExecutionSession(const ExecutionSession&) = delete;
        ExecutionSession& operator=(const ExecutionSession&) = delete;

        bool is_cancelled() const { return m_cancelled.load(); }
        void cancel() { m_cancelled.store(true); }

        // Clears the cancellation flag only; collected results are kept.
        void reset() { m_cancelled.store(false); }

        void record_start(const std::string& module_name, TimePoint at);
        void record_result(const ExecutionResult& result);

        std::optional<ExecutionResult> result(const std::string& module_name) const;
        ExecutionResults results() const;
        std::vector<std::string> completion_order() const;

        // Timing of every module that has finished (start, end, duration).
        std::map<std::string, ModuleTiming> stats() const;

    private:
        std::atomic<bool> m_cancelled{false};

        mutable std::mutex m_mutex;
        ExecutionResults m_results;
        std::vector<std::string> m_completion_order;
        std::map<std::string, TimePoint> m_start_times;
        std::map<std::string, TimePoint> m_end_times;
    };

    // One execution strategy. Implementations must not throw out of execute().
    class Executor {
    public:
        virtual ~Executor() = default;

        virtual ExecutionResults execute(const std::vector<ExecutionContext>& contexts,
                                         ExecutionSession& session,
                                         const ProgressCallback& callback) = 0;

        virtual bool can_handle(const std::vector<ExecutionContext>& contexts) const = 0;
        virtual std::string name() const = 0;
    };

} // namespace keel
