//
// Created by cv2 on 10/4/25.
//

#pragma once

#include "execution.h"

namespace keel {

    // Strictly sequential: one module at a time, in the order given. A failed
    // stage aborts that module's remaining stages and cancels the session.
    class PipelineExecutor : public Executor {
    public:
        ExecutionResults execute(const std::vector<ExecutionContext>& contexts,
                                 ExecutionSession& session,
                                 const ProgressCallback& callback) override;

        bool can_handle(const std::vector<ExecutionContext>& contexts) const override;
        std::string name() const override { return "pipeline"; }
    };

} // namespace keel
