//
// Created by cv2 on 10/7/25.
//

#include "libkeel/module_registry.h"
#include "libkeel/logging.h"

namespace keel {

    void ModuleRegistry::add(const std::string& name, ModuleFactory factory) {
        m_factories[name] = std::move(factory);
    }

    bool ModuleRegistry::contains(const std::string& name) const {
        return m_factories.count(name) > 0 || static_cast<bool>(m_fallback);
    }

    std::vector<std::string> ModuleRegistry::names() const {
        std::vector<std::string> out;
        out.reserve(m_factories.size());
        for (const auto& [name, factory] : m_factories) {
            out.push_back(name);
        }
        return out;
    }

    std::expected<ModuleDescriptor, RegistryError> ModuleRegistry::describe(const ManifestEntry& entry,
                                                                            const ModuleConfig& config) const {
        const ModuleFactory* factory = nullptr;
        if (auto it = m_factories.find(entry.name); it != m_factories.end()) {
            factory = &it->second;
        } else if (m_fallback) {
            factory = &m_fallback;
        } else {
            log::error("No module registered under the name '" + entry.name + "'.");
            return std::unexpected(RegistryError::UnknownModule);
        }

        std::shared_ptr<Module> instance;
        try {
            instance = (*factory)(entry.name, config);
        } catch (const std::exception& e) {
            log::error("Failed to create module '" + entry.name + "': " + e.what());
            return std::unexpected(RegistryError::FactoryFailed);
        }
        if (!instance) {
            log::error("Factory for module '" + entry.name + "' returned nothing.");
            return std::unexpected(RegistryError::FactoryFailed);
        }

        ModuleDescriptor descriptor;
        descriptor.name = entry.name;
        descriptor.depends_on = entry.depends_on;
        descriptor.capabilities = instance->capabilities();
        descriptor.capabilities.force_sequential = descriptor.capabilities.force_sequential || entry.force_sequential;
        descriptor.capabilities.large_module = descriptor.capabilities.large_module || entry.large_module;
        descriptor.force_sequential = descriptor.capabilities.force_sequential;
        descriptor.large_module = descriptor.capabilities.large_module;
        descriptor.module = std::move(instance);
        descriptor.config = config;
        return descriptor;
    }

} // namespace keel
