//
// Created by cv2 on 10/4/25.
//

#include "libkeel/pipeline_executor.h"
#include "libkeel/stage_runner.h"
#include "libkeel/logging.h"

#include <algorithm>

namespace keel {

    bool PipelineExecutor::can_handle(const std::vector<ExecutionContext>& contexts) const {
        if (contexts.size() == 1) {
            return true;
        }
        return std::any_of(contexts.begin(), contexts.end(), [](const auto& ctx) {
            return ctx.capabilities.force_sequential || ctx.capabilities.large_module;
        });
    }

    ExecutionResults PipelineExecutor::execute(const std::vector<ExecutionContext>& contexts,
                                               ExecutionSession& session,
                                               const ProgressCallback& callback) {
        ExecutionResults results;
        for (const auto& ctx : contexts) {
            log::debug("Pipeline: " + ctx.module_name);
            results[ctx.module_name] = run_module(ctx, session, callback);
        }
        return results;
    }

} // namespace keel
