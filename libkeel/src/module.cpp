//
// Created by cv2 on 10/2/25.
//

#include "libkeel/module.h"

namespace keel {

    std::string to_string(Stage stage) {
        switch (stage) {
            case Stage::Validate: return "validate";
            case Stage::PreConfigure: return "pre_configure";
            case Stage::Configure: return "configure";
            case Stage::PostConfigure: return "post_configure";
            case Stage::Verify: return "verify";
        }
        return "unknown";
    }

    bool ModuleCapabilities::provides(Stage stage) const {
        switch (stage) {
            case Stage::Validate: return validate;
            case Stage::PreConfigure: return pre_configure;
            case Stage::Configure: return configure;
            case Stage::PostConfigure: return post_configure;
            case Stage::Verify: return verify;
        }
        return false;
    }

    StageResult invoke_stage(Module& module, Stage stage, const ExecutionContext& ctx) {
        switch (stage) {
            case Stage::Validate: return module.validate(ctx);
            case Stage::PreConfigure: return module.pre_configure(ctx);
            case Stage::Configure: return module.configure(ctx);
            case Stage::PostConfigure: return module.post_configure(ctx);
            case Stage::Verify: return module.verify(ctx);
        }
        return stage_failed("unknown stage");
    }

} // namespace keel
