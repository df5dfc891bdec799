//
// Created by cv2 on 10/4/25.
//

#pragma once

#include "parallel_executor.h"
#include "pipeline_executor.h"

namespace keel {

    // Router. Force-sequential and large modules go through the pipeline first,
    // one at a time in the order given; everything else then runs as a single
    // parallel sub-batch. Both result maps are merged.
    class HybridExecutor : public Executor {
    public:
        explicit HybridExecutor(std::size_t max_workers = kDefaultMaxWorkers);

        ExecutionResults execute(const std::vector<ExecutionContext>& contexts,
                                 ExecutionSession& session,
                                 const ProgressCallback& callback) override;

        bool can_handle(const std::vector<ExecutionContext>&) const override { return true; }
        std::string name() const override { return "hybrid"; }

        static bool needs_pipeline(const ExecutionContext& ctx);

    private:
        ParallelExecutor m_parallel;
        PipelineExecutor m_pipeline;
    };

} // namespace keel
