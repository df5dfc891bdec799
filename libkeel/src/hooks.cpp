//
// Created by cv2 on 10/20/25.
//

#include "libkeel/hooks.h"
#include "libkeel/logging.h"

#include <algorithm>

namespace keel {

    std::string to_string(HookEvent event) {
        switch (event) {
            case HookEvent::BeforeInstallation: return "before_installation";
            case HookEvent::AfterInstallation: return "after_installation";
            case HookEvent::OnInstallationError: return "on_installation_error";
            case HookEvent::BeforeModuleValidate: return "before_module_validate";
            case HookEvent::AfterModuleValidate: return "after_module_validate";
            case HookEvent::BeforeModuleConfigure: return "before_module_configure";
            case HookEvent::AfterModuleConfigure: return "after_module_configure";
            case HookEvent::OnModuleError: return "on_module_error";
        }
        return "unknown";
    }

    HookId HooksManager::register_hook(HookEvent event, HookCallback callback, HookPriority priority) {
        std::lock_guard<std::mutex> lock(m_mutex);
        const HookId id = m_next_id++;
        auto& handlers = m_handlers[event];
        handlers.push_back({id, priority, std::move(callback)});
        std::stable_sort(handlers.begin(), handlers.end(), [](const Handler& a, const Handler& b) {
            return static_cast<int>(a.priority) < static_cast<int>(b.priority);
        });
        log::debug("Registered hook " + std::to_string(id) + " for " + to_string(event));
        return id;
    }

    bool HooksManager::unregister_hook(HookId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto& [event, handlers] : m_handlers) {
            auto it = std::find_if(handlers.begin(), handlers.end(), [id](const Handler& h) { return h.id == id; });
            if (it != handlers.end()) {
                handlers.erase(it);
                return true;
            }
        }
        return false;
    }

    void HooksManager::execute(HookEvent event, const std::string& module_name, const EventData& data) const {
        // Handlers run outside the lock so they may register further hooks.
        std::vector<Handler> handlers;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            auto it = m_handlers.find(event);
            if (it == m_handlers.end() || it->second.empty()) {
                return;
            }
            handlers = it->second;
        }

        const HookContext context{event, module_name, data, timestamp_now()};
        for (const auto& handler : handlers) {
            try {
                handler.callback(context);
            } catch (const std::exception& e) {
                log::error("Hook " + std::to_string(handler.id) + " for " + to_string(event) + " failed: " + e.what());
            } catch (...) {
                log::error("Hook " + std::to_string(handler.id) + " for " + to_string(event)
                           + " failed with a non-standard exception");
            }
        }
    }

    std::size_t HooksManager::count(HookEvent event) const {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_handlers.find(event);
        return it == m_handlers.end() ? 0 : it->second.size();
    }

    void HooksManager::clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_handlers.clear();
    }

} // namespace keel
