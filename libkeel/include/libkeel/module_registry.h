//
// Created by cv2 on 10/7/25.
//

#pragma once

#include "manifest.h"
#include "module.h"

#include <expected>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace keel {

    enum class RegistryError {
        UnknownModule, // no factory and no fallback
        FactoryFailed  // the factory threw or returned nothing
    };

    using ModuleFactory = std::function<std::shared_ptr<Module>(const std::string& name, const ModuleConfig& config)>;

    // Maps module names to factories. Each module is instantiated once per run
    // by describe(), which also reads its capabilities once.
    class ModuleRegistry {
    public:
        void add(const std::string& name, ModuleFactory factory);

        // Used for any name without its own factory.
        void set_fallback(ModuleFactory factory) { m_fallback = std::move(factory); }

        bool contains(const std::string& name) const;
        std::vector<std::string> names() const;

        // Scheduling hints are the OR of the manifest's and the module's own.
        std::expected<ModuleDescriptor, RegistryError> describe(const ManifestEntry& entry,
                                                                const ModuleConfig& config) const;

    private:
        std::map<std::string, ModuleFactory> m_factories;
        ModuleFactory m_fallback;
    };

} // namespace keel
