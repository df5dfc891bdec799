//
// Created by cv2 on 10/4/25.
//

#include "libkeel/parallel_executor.h"
#include "libkeel/stage_runner.h"
#include "libkeel/worker_pool.h"
#include "libkeel/logging.h"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>

namespace keel {

    namespace {
        // Workers push finished results; the submitting thread pops them in
        // the order they complete.
        class CompletionQueue {
        public:
            void push(ExecutionResult result) {
                {
                    std::lock_guard<std::mutex> lock(m_mutex);
                    m_results.push_back(std::move(result));
                }
                m_condition.notify_one();
            }

            ExecutionResult pop() {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_condition.wait(lock, [this] { return !m_results.empty(); });
                ExecutionResult result = std::move(m_results.front());
                m_results.pop_front();
                return result;
            }

        private:
            std::mutex m_mutex;
            std::condition_variable m_condition;
            std::deque<ExecutionResult> m_results;
        };

        ExecutionResult internal_failure(const ExecutionContext& ctx, ExecutionSession& session, const std::string& what) {
            session.cancel();
            ExecutionResult result;
            result.module_name = ctx.module_name;
            result.started_at = timestamp_now();
            result.completed_at = result.started_at;
            result.error = "executor failure: " + what;
            log::error("Module '" + ctx.module_name + "' could not be executed: " + what);
            session.record_result(result);
            return result;
        }
    }

    ParallelExecutor::ParallelExecutor(std::size_t max_workers)
        : m_max_workers(std::max<std::size_t>(1, max_workers)) {}

    bool ParallelExecutor::can_handle(const std::vector<ExecutionContext>& contexts) const {
        return std::none_of(contexts.begin(), contexts.end(), [](const auto& ctx) {
            return ctx.capabilities.force_sequential;
        });
    }

    ExecutionResults ParallelExecutor::execute(const std::vector<ExecutionContext>& contexts,
                                               ExecutionSession& session,
                                               const ProgressCallback& callback) {
        ExecutionResults results;
        if (contexts.empty()) {
            return results;
        }

        const auto workers = std::min(m_max_workers, contexts.size());
        log::debug("Running " + std::to_string(contexts.size()) + " module(s) on "
                   + std::to_string(workers) + " worker(s).");

        // Declared before the pool so it outlives every worker.
        CompletionQueue completed;
        WorkerPool pool(workers);

        for (const auto& ctx : contexts) {
            const ExecutionContext* item = &ctx;
            pool.enqueue(
                    [item, &session, &callback, &completed] {
                        try {
                            completed.push(run_module(*item, session, callback));
                        } catch (const std::exception& e) {
                            completed.push(internal_failure(*item, session, e.what()));
                        }
                    },
                    [item, &session, &completed] {
                        completed.push(cancel_module(*item, session));
                    });
        }

        bool withdrawn = false;
        for (std::size_t received = 0; received < contexts.size(); ++received) {
            ExecutionResult result = completed.pop();

            if (!result.success && !withdrawn && session.is_cancelled()) {
                // Stop queued work from starting at all; running modules finish normally.
                withdrawn = true;
                const auto dropped = pool.cancel_pending();
                if (dropped > 0) {
                    log::warn("Cancelled " + std::to_string(dropped) + " queued module(s) after a failure.");
                }
            }

            results[result.module_name] = std::move(result);
        }

        return results;
    }

} // namespace keel
