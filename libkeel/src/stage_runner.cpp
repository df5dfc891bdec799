//
// Created by cv2 on 10/4/25.
//

#include "libkeel/stage_runner.h"
#include "libkeel/logging.h"

namespace keel {

    namespace {
        void notify(const ProgressCallback& callback, const std::string& module_name,
                    ProgressEvent event, const EventData& data = {}) {
            if (!callback) {
                return;
            }
            try {
                callback(module_name, event, data);
            } catch (const std::exception& e) {
                // A broken observer must not change the module's outcome.
                log::warn("Progress callback failed for '" + module_name + "' (" + to_string(event) + "): " + e.what());
            } catch (...) {
                log::warn("Progress callback failed for '" + module_name + "' (" + to_string(event)
                          + ") with a non-standard exception");
            }
        }

        bool is_hook(Stage stage) {
            return stage == Stage::PreConfigure || stage == Stage::PostConfigure;
        }

        StageResult invoke_guarded(const ExecutionContext& ctx, Stage stage) {
            try {
                return invoke_stage(*ctx.module, stage, ctx);
            } catch (const std::exception& e) {
                return stage_failed(std::string("unhandled exception: ") + e.what());
            } catch (...) {
                return stage_failed("unhandled non-standard exception");
            }
        }
    }

    ProgressEvent event_for(Stage stage) {
        switch (stage) {
            case Stage::Validate: return ProgressEvent::Validating;
            case Stage::PreConfigure: return ProgressEvent::PreConfigure;
            case Stage::Configure: return ProgressEvent::Configuring;
            case Stage::PostConfigure: return ProgressEvent::PostConfigure;
            case Stage::Verify: return ProgressEvent::Verifying;
        }
        return ProgressEvent::Failed;
    }

    ExecutionResult cancel_module(const ExecutionContext& ctx, ExecutionSession& session) {
        ExecutionResult result;
        result.module_name = ctx.module_name;
        result.success = false;
        result.cancelled = true;
        result.started_at = timestamp_now();
        result.completed_at = result.started_at;
        result.error = "cancelled";

        log::debug("Skipping '" + ctx.module_name + "': run was cancelled.");
        session.record_result(result);
        return result;
    }

    ExecutionResult run_module(const ExecutionContext& ctx,
                               ExecutionSession& session,
                               const ProgressCallback& callback) {
        if (session.is_cancelled()) {
            return cancel_module(ctx, session);
        }

        ExecutionResult result;
        result.module_name = ctx.module_name;
        result.started_at = timestamp_now();
        if (ctx.dry_run) {
            result.metadata["dry_run"] = "true";
        }
        session.record_start(ctx.module_name, result.started_at);

        auto finish = [&](bool success) {
            result.success = success;
            result.completed_at = timestamp_now();
            result.duration_seconds = seconds_between(result.started_at, result.completed_at);
        };

        auto fail = [&](const std::string& stage, const std::string& message) {
            // Siblings must see the flag before anyone else hears about the failure.
            session.cancel();
            finish(false);
            result.error = message;
            result.failed_stage = stage;

            log::error("Module '" + ctx.module_name + "' failed during " + stage + ": " + message);
            notify(callback, ctx.module_name, ProgressEvent::Failed, {{"stage", stage}, {"error", message}});
            session.record_result(result);
            return result;
        };

        notify(callback, ctx.module_name, ProgressEvent::Started);
        log::debug("Starting module '" + ctx.module_name + "'.");

        if (!ctx.module) {
            return fail(to_string(Stage::Validate), "no lifecycle object registered");
        }

        for (const Stage stage : kStageSequence) {
            const auto event = event_for(stage);
            if (!ctx.capabilities.provides(stage)) {
                // Missing hooks are silent; missing core stages count as passed.
                if (!is_hook(stage)) {
                    notify(callback, ctx.module_name, event, {{"skipped", "true"}});
                }
                continue;
            }

            notify(callback, ctx.module_name, event);
            auto outcome = invoke_guarded(ctx, stage);
            if (!outcome) {
                return fail(to_string(stage), outcome.error());
            }
        }

        finish(true);
        notify(callback, ctx.module_name, ProgressEvent::Completed,
               {{"duration", std::to_string(result.duration_seconds)}});
        log::debug("Module '" + ctx.module_name + "' completed in " + std::to_string(result.duration_seconds) + "s.");
        session.record_result(result);
        return result;
    }

} // namespace keel
