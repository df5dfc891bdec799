//
// Created by cv2 on 10/4/25.
//

#pragma once

#include "execution.h"

namespace keel {

    // Runs one module through validate -> [pre_configure] -> configure ->
    // [post_configure] -> verify, reporting each event before its stage.
    // Shared by every executor. Never throws; the result is also recorded in
    // the session.
    //
    // If the session is already cancelled nothing is invoked (neither the
    // lifecycle nor the callback) and a cancelled result is returned.
    // On failure the session is cancelled before anything else happens.
    ExecutionResult run_module(const ExecutionContext& ctx,
                               ExecutionSession& session,
                               const ProgressCallback& callback);

    // Records and returns the synthetic result for work that never started.
    ExecutionResult cancel_module(const ExecutionContext& ctx, ExecutionSession& session);

    // Maps a lifecycle stage to the event announced just before it runs.
    ProgressEvent event_for(Stage stage);

} // namespace keel
