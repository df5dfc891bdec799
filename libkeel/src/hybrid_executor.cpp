//
// Created by cv2 on 10/4/25.
//

#include "libkeel/hybrid_executor.h"
#include "libkeel/logging.h"

namespace keel {

    HybridExecutor::HybridExecutor(std::size_t max_workers) : m_parallel(max_workers) {}

    bool HybridExecutor::needs_pipeline(const ExecutionContext& ctx) {
        return ctx.capabilities.force_sequential || ctx.capabilities.large_module;
    }

    ExecutionResults HybridExecutor::execute(const std::vector<ExecutionContext>& contexts,
                                             ExecutionSession& session,
                                             const ProgressCallback& callback) {
        std::vector<ExecutionContext> sequential;
        std::vector<ExecutionContext> concurrent;
        for (const auto& ctx : contexts) {
            (needs_pipeline(ctx) ? sequential : concurrent).push_back(ctx);
        }

        ExecutionResults results;
        if (!sequential.empty()) {
            log::debug("Routing " + std::to_string(sequential.size()) + " module(s) to the " + m_pipeline.name() + " executor.");
            results.merge(m_pipeline.execute(sequential, session, callback));
        }
        if (!concurrent.empty()) {
            log::debug("Routing " + std::to_string(concurrent.size()) + " module(s) to the " + m_parallel.name() + " executor.");
            auto parallel_results = m_parallel.execute(concurrent, session, callback);
            for (auto& [name, result] : parallel_results) {
                results[name] = std::move(result);
            }
        }
        return results;
    }

} // namespace keel
