//
// Created by cv2 on 10/5/25.
//

#include "libkeel/hybrid_executor.h"
#include "libkeel/parallel_executor.h"
#include "libkeel/pipeline_executor.h"
#include "libkeel/stage_runner.h"
#include "libkeel/logging.h"
#include <cassert>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

// A module whose behaviour is fixed up front: how long configure takes,
// which stage fails (or throws), and which stages it provides at all.
class ScriptedModule : public keel::Module {
public:
    explicit ScriptedModule(keel::ModuleCapabilities caps) : m_caps(caps) {}

    keel::ModuleCapabilities capabilities() const override { return m_caps; }

    keel::StageResult validate(const keel::ExecutionContext&) override { return step(keel::Stage::Validate); }
    keel::StageResult pre_configure(const keel::ExecutionContext&) override { return step(keel::Stage::PreConfigure); }
    keel::StageResult configure(const keel::ExecutionContext&) override {
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return step(keel::Stage::Configure);
    }
    keel::StageResult post_configure(const keel::ExecutionContext&) override { return step(keel::Stage::PostConfigure); }
    keel::StageResult verify(const keel::ExecutionContext&) override { return step(keel::Stage::Verify); }

    std::chrono::milliseconds delay{0};
    std::optional<keel::Stage> fail_at;
    std::optional<keel::Stage> throw_at;
    std::atomic<int> invocations{0};

private:
    keel::StageResult step(keel::Stage stage) {
        ++invocations;
        if (throw_at == stage) {
            throw std::runtime_error("boom");
        }
        if (fail_at == stage) {
            return keel::stage_failed(keel::to_string(stage) + " went wrong");
        }
        return {};
    }

    keel::ModuleCapabilities m_caps;
};

keel::ModuleCapabilities core_stages() {
    keel::ModuleCapabilities caps;
    caps.validate = true;
    caps.configure = true;
    caps.verify = true;
    return caps;
}

keel::ExecutionContext make_context(const std::string& name, const std::shared_ptr<ScriptedModule>& module) {
    keel::ExecutionContext ctx;
    ctx.module_name = name;
    ctx.module = module;
    ctx.capabilities = module->capabilities();
    return ctx;
}

// Thread-safe recording of every callback invocation.
struct EventLog {
    struct Entry {
        std::string module;
        keel::ProgressEvent event;
        keel::EventData data;
    };

    keel::ProgressCallback callback() {
        return [this](const std::string& module, keel::ProgressEvent event, const keel::EventData& data) {
            std::lock_guard<std::mutex> lock(mutex);
            entries.push_back({module, event, data});
        };
    }

    std::vector<keel::ProgressEvent> events_for(const std::string& module) {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<keel::ProgressEvent> out;
        for (const auto& e : entries) {
            if (e.module == module) out.push_back(e.event);
        }
        return out;
    }

    size_t count_for(const std::string& module) { return events_for(module).size(); }

    std::mutex mutex;
    std::vector<Entry> entries;
};

void test_stage_sequence_and_events() {
    keel::log::info("Running test: Stage sequence and events...");
    auto caps = core_stages();
    caps.pre_configure = true;
    caps.post_configure = true;
    auto full = std::make_shared<ScriptedModule>(caps);

    keel::ModuleCapabilities configure_only;
    configure_only.configure = true;
    auto minimal = std::make_shared<ScriptedModule>(configure_only);

    keel::ExecutionSession session;
    EventLog log;
    keel::PipelineExecutor pipeline;
    auto results = pipeline.execute({make_context("full", full), make_context("minimal", minimal)},
                                    session, log.callback());

    assert(results.size() == 2);
    assert(results.at("full").success);
    assert(results.at("minimal").success);
    assert(full->invocations == 5);
    assert(minimal->invocations == 1);

    using E = keel::ProgressEvent;
    assert((log.events_for("full") == std::vector<E>{E::Started, E::Validating, E::PreConfigure, E::Configuring,
                                                     E::PostConfigure, E::Verifying, E::Completed}));
    // Missing hooks are silent, missing core stages are reported as skipped.
    assert((log.events_for("minimal") == std::vector<E>{E::Started, E::Validating, E::Configuring,
                                                        E::Verifying, E::Completed}));
    for (const auto& entry : log.entries) {
        if (entry.module == "minimal" && (entry.event == E::Validating || entry.event == E::Verifying)) {
            assert(entry.data.at("skipped") == "true");
        }
        if (entry.module == "full" && entry.event == E::Validating) {
            assert(entry.data.count("skipped") == 0);
        }
    }
    assert((session.completion_order() == std::vector<std::string>{"full", "minimal"}));

    keel::log::ok("Test Passed: Stage sequence and events");
}

void test_pipeline_failure_stops_everything() {
    keel::log::info("Running test: Pipeline failure aborts remaining work...");
    auto failing = std::make_shared<ScriptedModule>(core_stages());
    failing->fail_at = keel::Stage::Configure;
    auto after = std::make_shared<ScriptedModule>(core_stages());

    keel::ExecutionSession session;
    EventLog log;
    keel::PipelineExecutor pipeline;
    auto results = pipeline.execute({make_context("failing", failing), make_context("after", after)},
                                    session, log.callback());

    const auto& failed = results.at("failing");
    assert(!failed.success);
    assert(!failed.cancelled);
    assert(failed.failed_stage == "configure");
    assert(failed.error == "configure went wrong");
    assert(failing->invocations == 2); // validate + configure, never verify
    assert(session.is_cancelled());

    using E = keel::ProgressEvent;
    assert(log.events_for("failing").back() == E::Failed);
    for (const auto& entry : log.entries) {
        if (entry.event == E::Failed) {
            assert(entry.data.at("stage") == "configure");
            assert(entry.data.at("error") == "configure went wrong");
        }
    }

    // The next module never ran and was never reported.
    const auto& skipped = results.at("after");
    assert(!skipped.success);
    assert(skipped.cancelled);
    assert(skipped.error == "cancelled");
    assert(after->invocations == 0);
    assert(log.count_for("after") == 0);

    keel::log::ok("Test Passed: Pipeline failure aborts remaining work");
}

void test_parallel_is_faster_than_serial() {
    keel::log::info("Running test: Parallel wall time...");
    const int modules = 8;
    const auto per_module = std::chrono::milliseconds(100);

    std::vector<std::shared_ptr<ScriptedModule>> owned;
    std::vector<keel::ExecutionContext> contexts;
    for (int i = 0; i < modules; ++i) {
        auto m = std::make_shared<ScriptedModule>(core_stages());
        m->delay = per_module;
        owned.push_back(m);
        contexts.push_back(make_context("mod" + std::to_string(i), m));
    }

    keel::ExecutionSession session;
    keel::ParallelExecutor parallel(4);
    assert(parallel.max_workers() == 4);

    const auto start = std::chrono::steady_clock::now();
    auto results = parallel.execute(contexts, session, {});
    const auto elapsed = std::chrono::steady_clock::now() - start;

    assert(results.size() == static_cast<size_t>(modules));
    for (const auto& [name, result] : results) {
        assert(result.success);
        assert(result.duration_seconds >= 0.09);
    }
    // ceil(8 / 4) * 100ms, far below the 800ms a serial run needs.
    assert(elapsed >= 2 * per_module);
    assert(elapsed < modules * per_module);
    assert(session.stats().size() == static_cast<size_t>(modules));

    keel::log::ok("Test Passed: Parallel wall time");
}

void test_parallel_completion_order() {
    keel::log::info("Running test: Results are collected in completion order...");
    auto slow = std::make_shared<ScriptedModule>(core_stages());
    slow->delay = std::chrono::milliseconds(300);
    auto fast = std::make_shared<ScriptedModule>(core_stages());
    fast->delay = std::chrono::milliseconds(10);

    keel::ExecutionSession session;
    keel::ParallelExecutor parallel(2);
    auto results = parallel.execute({make_context("slow", slow), make_context("fast", fast)}, session, {});

    assert(results.at("slow").success && results.at("fast").success);
    assert((session.completion_order() == std::vector<std::string>{"fast", "slow"}));

    auto stats = session.stats();
    assert(stats.at("slow").duration_seconds > stats.at("fast").duration_seconds);

    keel::log::ok("Test Passed: Results are collected in completion order");
}

void test_parallel_exception_becomes_failure() {
    keel::log::info("Running test: A throwing module becomes a failed result...");
    auto thrower = std::make_shared<ScriptedModule>(core_stages());
    thrower->throw_at = keel::Stage::Verify;

    keel::ExecutionSession session;
    keel::ParallelExecutor parallel(2);
    auto results = parallel.execute({make_context("thrower", thrower)}, session, {});

    const auto& failed = results.at("thrower");
    assert(!failed.success);
    assert(failed.failed_stage == "verify");
    assert(failed.error.has_value());
    assert(failed.error->find("boom") != std::string::npos);
    assert(session.is_cancelled());

    // The same executor keeps working for a fresh run.
    session.reset();
    auto healthy = std::make_shared<ScriptedModule>(core_stages());
    auto again = parallel.execute({make_context("healthy", healthy)}, session, {});
    assert(again.at("healthy").success);
    // Results of the earlier call are kept by reset().
    assert(session.result("thrower").has_value());

    keel::log::ok("Test Passed: A throwing module becomes a failed result");
}

void test_parallel_failure_cancels_queued_work() {
    keel::log::info("Running test: A failure cancels queued modules...");
    auto failing = std::make_shared<ScriptedModule>(core_stages());
    failing->fail_at = keel::Stage::Validate;

    std::vector<std::shared_ptr<ScriptedModule>> queued;
    std::vector<keel::ExecutionContext> contexts = {make_context("failing", failing)};
    for (int i = 0; i < 5; ++i) {
        auto m = std::make_shared<ScriptedModule>(core_stages());
        queued.push_back(m);
        contexts.push_back(make_context("queued" + std::to_string(i), m));
    }

    // One worker: everything after the first module is still queued when it fails.
    keel::ExecutionSession session;
    EventLog log;
    keel::ParallelExecutor parallel(1);
    auto results = parallel.execute(contexts, session, log.callback());

    assert(results.size() == contexts.size());
    assert(results.at("failing").failed_stage == "validate");
    for (int i = 0; i < 5; ++i) {
        const auto name = "queued" + std::to_string(i);
        assert(results.at(name).cancelled);
        assert(queued[i]->invocations == 0);
        assert(log.count_for(name) == 0);
    }

    keel::log::ok("Test Passed: A failure cancels queued modules");
}

void test_cancelled_session_runs_nothing() {
    keel::log::info("Running test: A cancelled session runs nothing...");
    auto a = std::make_shared<ScriptedModule>(core_stages());
    auto b = std::make_shared<ScriptedModule>(core_stages());

    keel::ExecutionSession session;
    session.cancel();
    EventLog log;

    keel::ParallelExecutor parallel(2);
    auto results = parallel.execute({make_context("a", a), make_context("b", b)}, session, log.callback());
    assert(results.at("a").cancelled && results.at("b").cancelled);
    assert(a->invocations == 0 && b->invocations == 0);
    assert(log.entries.empty());
    // Cancelled modules never started, so they have no timing entry.
    assert(session.stats().empty());

    keel::log::ok("Test Passed: A cancelled session runs nothing");
}

void test_missing_lifecycle_and_bad_callback() {
    keel::log::info("Running test: Missing lifecycle object and throwing callback...");
    keel::ExecutionSession session;

    keel::ExecutionContext orphan;
    orphan.module_name = "orphan";
    orphan.capabilities = core_stages();
    auto result = keel::run_module(orphan, session, {});
    assert(!result.success);
    assert(result.failed_stage == "validate");
    assert(session.is_cancelled());

    // An observer that throws does not change the outcome.
    session.reset();
    auto fine = std::make_shared<ScriptedModule>(core_stages());
    auto ok = keel::run_module(make_context("fine", fine), session,
                               [](const std::string&, keel::ProgressEvent, const keel::EventData&) {
                                   throw std::runtime_error("observer broke");
                               });
    assert(ok.success);
    assert(fine->invocations == 3);

    // Same for one that throws something that is not a std::exception,
    // including on a pool worker thread.
    auto odd = std::make_shared<ScriptedModule>(core_stages());
    keel::ParallelExecutor parallel(2);
    auto results = parallel.execute({make_context("odd", odd)}, session,
                                    [](const std::string&, keel::ProgressEvent, const keel::EventData&) {
                                        throw 42;
                                    });
    assert(results.at("odd").success);
    assert(odd->invocations == 3);

    keel::log::ok("Test Passed: Missing lifecycle object and throwing callback");
}

void test_can_handle() {
    keel::log::info("Running test: Executor routing predicates...");
    auto plain = std::make_shared<ScriptedModule>(core_stages());
    auto sequential_caps = core_stages();
    sequential_caps.force_sequential = true;
    auto sequential = std::make_shared<ScriptedModule>(sequential_caps);
    auto large_caps = core_stages();
    large_caps.large_module = true;
    auto large = std::make_shared<ScriptedModule>(large_caps);

    keel::ParallelExecutor parallel;
    keel::PipelineExecutor pipeline;
    keel::HybridExecutor hybrid;

    auto a = make_context("a", plain);
    auto b = make_context("b", plain);
    auto s = make_context("s", sequential);
    auto l = make_context("l", large);

    assert(parallel.can_handle({a, b}));
    assert(!parallel.can_handle({a, s}));
    assert(pipeline.can_handle({a}));
    assert(!pipeline.can_handle({a, b}));
    assert(pipeline.can_handle({a, l}));
    assert(hybrid.can_handle({a, s, l}));
    assert(keel::HybridExecutor::needs_pipeline(s));
    assert(keel::HybridExecutor::needs_pipeline(l));
    assert(!keel::HybridExecutor::needs_pipeline(a));
    assert(parallel.name() == "parallel" && pipeline.name() == "pipeline" && hybrid.name() == "hybrid");

    keel::log::ok("Test Passed: Executor routing predicates");
}

void test_hybrid_routes_pipeline_first() {
    keel::log::info("Running test: Hybrid runs pipeline modules before the parallel rest...");
    auto large_caps = core_stages();
    large_caps.large_module = true;
    auto big = std::make_shared<ScriptedModule>(large_caps);
    big->delay = std::chrono::milliseconds(50);

    auto solo_caps = core_stages();
    solo_caps.force_sequential = true;
    auto solo = std::make_shared<ScriptedModule>(solo_caps);
    solo->delay = std::chrono::milliseconds(50);

    auto a = std::make_shared<ScriptedModule>(core_stages());
    auto b = std::make_shared<ScriptedModule>(core_stages());

    keel::ExecutionSession session;
    keel::HybridExecutor hybrid(4);
    auto results = hybrid.execute({make_context("a", a), make_context("big", big),
                                   make_context("b", b), make_context("solo", solo)}, session, {});

    assert(results.size() == 4);
    for (const auto& [name, result] : results) {
        assert(result.success);
    }

    const auto order = session.completion_order();
    assert(order.size() == 4);
    assert(order[0] == "big");
    assert(order[1] == "solo");

    auto stats = session.stats();
    assert(stats.at("solo").started_at >= stats.at("big").completed_at);
    assert(stats.at("a").started_at >= stats.at("solo").completed_at);
    assert(stats.at("b").started_at >= stats.at("solo").completed_at);

    keel::log::ok("Test Passed: Hybrid runs pipeline modules before the parallel rest");
}

void test_hybrid_sequential_failure_cancels_rest() {
    keel::log::info("Running test: A failing sequential module cancels the parallel rest...");
    auto solo_caps = core_stages();
    solo_caps.force_sequential = true;
    auto solo = std::make_shared<ScriptedModule>(solo_caps);
    solo->fail_at = keel::Stage::Configure;

    auto a = std::make_shared<ScriptedModule>(core_stages());
    auto b = std::make_shared<ScriptedModule>(core_stages());

    keel::ExecutionSession session;
    keel::HybridExecutor hybrid(2);
    auto results = hybrid.execute({make_context("solo", solo), make_context("a", a), make_context("b", b)},
                                  session, {});

    assert(!results.at("solo").success && !results.at("solo").cancelled);
    assert(results.at("a").cancelled && results.at("b").cancelled);
    assert(a->invocations == 0 && b->invocations == 0);

    keel::log::ok("Test Passed: A failing sequential module cancels the parallel rest");
}

int main() {
    try {
        test_stage_sequence_and_events();
        test_pipeline_failure_stops_everything();
        test_parallel_is_faster_than_serial();
        test_parallel_completion_order();
        test_parallel_exception_becomes_failure();
        test_parallel_failure_cancels_queued_work();
        test_cancelled_session_runs_nothing();
        test_missing_lifecycle_and_bad_callback();
        test_can_handle();
        test_hybrid_routes_pipeline_first();
        test_hybrid_sequential_failure_cancels_rest();
    } catch (const std::exception& e) {
        keel::log::error(std::string("An executor test failed: ") + e.what());
        return 1;
    }

    keel::log::ok("All executor tests completed successfully!");
    return 0;
}
