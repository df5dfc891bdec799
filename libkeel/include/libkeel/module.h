//
// Created by cv2 on 10/2/25.
//

#pragma once

#include <expected>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace keel {

    struct ExecutionContext;

    // Every lifecycle stage reports success or a human-readable error.
    // Exceptions are only caught at the executor boundary.
    using StageResult = std::expected<void, std::string>;

    inline StageResult stage_failed(std::string reason) {
        return std::unexpected(std::move(reason));
    }

    // Flat "key -> value" view of a module's section in the run config.
    using ModuleConfig = std::map<std::string, std::string>;

    enum class Stage {
        Validate,
        PreConfigure,
        Configure,
        PostConfigure,
        Verify
    };

    // The order every module goes through, regardless of executor.
    inline constexpr Stage kStageSequence[] = {
        Stage::Validate, Stage::PreConfigure, Stage::Configure, Stage::PostConfigure, Stage::Verify
    };

    std::string to_string(Stage stage);

    // What a module provides, captured once when it is registered.
    struct ModuleCapabilities {
        bool validate = false;
        bool pre_configure = false;
        bool configure = false;
        bool post_configure = false;
        bool verify = false;

        // --- Scheduling hints ---
        bool force_sequential = false; // must run alone in its batch
        bool large_module = false;     // routed to the pipeline executor

        bool provides(Stage stage) const;
    };

    // The lifecycle contract. Modules override the stages they implement and
    // advertise them through capabilities(); the defaults are never called for
    // stages a module does not advertise.
    class Module {
    public:
        virtual ~Module() = default;

        virtual ModuleCapabilities capabilities() const = 0;

        virtual StageResult validate(const ExecutionContext&) { return {}; }
        virtual StageResult pre_configure(const ExecutionContext&) { return {}; }
        virtual StageResult configure(const ExecutionContext&) { return {}; }
        virtual StageResult post_configure(const ExecutionContext&) { return {}; }
        virtual StageResult verify(const ExecutionContext&) { return {}; }
    };

    // Dispatches to the matching Module member.
    StageResult invoke_stage(Module& module, Stage stage, const ExecutionContext& ctx);

    // Built once per run from the manifest entry and the module instance.
    struct ModuleDescriptor {
        std::string name;
        std::vector<std::string> depends_on;
        bool force_sequential = false;
        bool large_module = false;
        ModuleCapabilities capabilities;
        std::shared_ptr<Module> module;
        ModuleConfig config;
    };

} // namespace keel
