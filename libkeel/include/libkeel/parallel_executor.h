//
// Created by cv2 on 10/4/25.
//

#pragma once

#include "execution.h"

namespace keel {

    inline constexpr std::size_t kDefaultMaxWorkers = 4;

    // Runs a batch on a bounded worker pool created for this call only.
    // Blocks until every context has a result; results arrive in completion order.
    class ParallelExecutor : public Executor {
    public:
        explicit ParallelExecutor(std::size_t max_workers = kDefaultMaxWorkers);

        ExecutionResults execute(const std::vector<ExecutionContext>& contexts,
                                 ExecutionSession& session,
                                 const ProgressCallback& callback) override;

        bool can_handle(const std::vector<ExecutionContext>& contexts) const override;
        std::string name() const override { return "parallel"; }

        std::size_t max_workers() const { return m_max_workers; }

    private:
        std::size_t m_max_workers;
    };

} // namespace keel
