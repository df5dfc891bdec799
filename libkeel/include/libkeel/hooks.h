//
// Created by cv2 on 10/20/25.
//

#pragma once

#include "execution.h"
#include "time_util.h"

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace keel {

    enum class HookEvent {
        // Installation level
        BeforeInstallation,
        AfterInstallation,
        OnInstallationError,
        // Module level
        BeforeModuleValidate,
        AfterModuleValidate,
        BeforeModuleConfigure,
        AfterModuleConfigure,
        OnModuleError
    };

    // Lower runs first.
    enum class HookPriority : int {
        First = 0,
        High = 25,
        Normal = 50,
        Low = 75,
        Last = 100
    };

    std::string to_string(HookEvent event);

    struct HookContext {
        HookEvent event = HookEvent::BeforeInstallation;
        std::string module_name; // empty for installation-level events
        EventData data;
        TimePoint timestamp{};
    };

    using HookCallback = std::function<void(const HookContext&)>;
    using HookId = std::uint64_t;

    /**
     * @class HooksManager
     * @brief Ordered observers for installation and module lifecycle events.
     *
     * Handlers of one event run by priority, then in registration order. A
     * handler that throws is logged and skipped; the rest still run and the
     * installation carries on. Safe to fire from several worker threads.
     */
    class HooksManager {
    public:
        HookId register_hook(HookEvent event, HookCallback callback, HookPriority priority = HookPriority::Normal);
        bool unregister_hook(HookId id);

        void execute(HookEvent event, const std::string& module_name = "", const EventData& data = {}) const;

        std::size_t count(HookEvent event) const;
        void clear();

    private:
        struct Handler {
            HookId id;
            HookPriority priority;
            HookCallback callback;
        };

        mutable std::mutex m_mutex;
        std::map<HookEvent, std::vector<Handler>> m_handlers;
        HookId m_next_id = 1;
    };

} // namespace keel
