//
// Created by cv2 on 10/4/25.
//

#include "libkeel/execution.h"

namespace keel {

    std::string to_string(ProgressEvent event) {
        switch (event) {
            case ProgressEvent::Started: return "started";
            case ProgressEvent::Validating: return "validating";
            case ProgressEvent::PreConfigure: return "pre_configure";
            case ProgressEvent::Configuring: return "configuring";
            case ProgressEvent::PostConfigure: return "post_configure";
            case ProgressEvent::Verifying: return "verifying";
            case ProgressEvent::Completed: return "completed";
            case ProgressEvent::Failed: return "failed";
        }
        return "unknown";
    }

    void ExecutionSession::record_start(const std::string& module_name, TimePoint at) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_start_times[module_name] = at;
    }

    void ExecutionSession::record_result(const ExecutionResult& result) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_results[result.module_name] = result;
        m_completion_order.push_back(result.module_name);
        m_end_times[result.module_name] = result.completed_at;
    }

    std::optional<ExecutionResult> ExecutionSession::result(const std::string& module_name) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_results.find(module_name);
        if (it == m_results.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    ExecutionResults ExecutionSession::results() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_results;
    }

    std::vector<std::string> ExecutionSession::completion_order() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_completion_order;
    }

    std::map<std::string, ModuleTiming> ExecutionSession::stats() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::map<std::string, ModuleTiming> out;
        for (const auto& [name, end] : m_end_times) {
            auto start_it = m_start_times.find(name);
            if (start_it == m_start_times.end()) {
                continue; // cancelled before it ever started
            }
            out[name] = ModuleTiming{start_it->second, end, seconds_between(start_it->second, end)};
        }
        return out;
    }

} // namespace keel
