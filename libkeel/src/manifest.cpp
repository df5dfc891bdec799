//
// Created by cv2 on 10/7/25.
//

#include "libkeel/manifest.h"
#include "libkeel/logging.h"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <set>

namespace keel {

    std::string to_string(ManifestError error) {
        switch (error) {
            case ManifestError::FileNotFound: return "file not found";
            case ManifestError::InvalidFormat: return "invalid format";
            case ManifestError::MissingRequiredField: return "missing required field";
            case ManifestError::SelfDependency: return "self dependency";
            case ManifestError::ConflictingDeclaration: return "conflicting declaration";
            case ManifestError::MissingDependency: return "missing dependency";
            case ManifestError::CircularDependency: return "circular dependency";
        }
        return "unknown error";
    }

    // --- YAML helpers ---

    static std::vector<std::string> get_optional_sequence(const YAML::Node& node, const std::string& key) {
        std::vector<std::string> result;
        if (node[key] && node[key].IsSequence()) {
            for (const auto& item : node[key]) {
                result.push_back(item.as<std::string>());
            }
        }
        return result;
    }

    static std::expected<ManifestEntry, ManifestError> parse_entry_node(const YAML::Node& node, const std::string& key_name) {
        if (!node.IsMap() && !node.IsNull()) {
            log::error("Manifest entry is not a mapping" + (key_name.empty() ? std::string{} : ": " + key_name));
            return std::unexpected(ManifestError::InvalidFormat);
        }

        ManifestEntry entry;
        if (node["name"] && node["name"].IsScalar()) {
            entry.name = node["name"].as<std::string>();
        } else if (!key_name.empty()) {
            entry.name = key_name;
        } else {
            log::error("Missing required field: 'name'");
            return std::unexpected(ManifestError::MissingRequiredField);
        }

        entry.depends_on = get_optional_sequence(node, "depends_on");
        entry.conflicts_with = get_optional_sequence(node, "conflicts_with");
        if (node["priority"]) {
            entry.priority = node["priority"].as<int>();
        }
        if (node["force_sequential"]) {
            entry.force_sequential = node["force_sequential"].as<bool>();
        }
        if (node["large_module"]) {
            entry.large_module = node["large_module"].as<bool>();
        }
        return entry;
    }

    static std::expected<Manifest, ManifestError> parse_root(const YAML::Node& root) {
        Manifest manifest;
        if (root.IsSequence()) {
            for (const auto& node : root) {
                auto entry = parse_entry_node(node, "");
                if (!entry) return std::unexpected(entry.error());
                manifest.add(std::move(*entry));
            }
        } else if (root.IsMap()) {
            for (const auto& item : root) {
                auto entry = parse_entry_node(item.second, item.first.as<std::string>());
                if (!entry) return std::unexpected(entry.error());
                manifest.add(std::move(*entry));
            }
        } else {
            log::error("Manifest must be a YAML sequence or mapping.");
            return std::unexpected(ManifestError::InvalidFormat);
        }
        return manifest;
    }

    // --- Construction ---

    Manifest Manifest::builtin() {
        Manifest m;
        // Priorities: system (10) -> security (20) -> core apps (30-40) -> user apps (50) -> UI (60) -> monitoring (90)
        m.add({"system", {}, {}, 10});
        m.add({"security", {"system"}, {}, 20});
        m.add({"rbac", {"system", "security"}, {}, 25});
        m.add({"desktop", {"system", "security"}, {}, 30, true, true});
        m.add({"python", {"system"}, {}, 50});
        m.add({"nodejs", {"system"}, {}, 50});
        m.add({"golang", {"system"}, {}, 50});
        m.add({"rust", {"system"}, {}, 50});
        m.add({"java", {"system"}, {}, 50});
        m.add({"php", {"system"}, {}, 50});
        m.add({"docker", {"system", "security"}, {}, 40});
        m.add({"git", {"system"}, {}, 40});
        m.add({"databases", {"system"}, {}, 50});
        m.add({"devops", {"system", "docker"}, {}, 50});
        m.add({"utilities", {"system"}, {}, 50});
        m.add({"vscode", {"system"}, {}, 60});
        m.add({"cursor", {"system"}, {}, 60});
        m.add({"neovim", {"system"}, {}, 50});
        m.add({"wireguard", {"system", "security"}, {}, 30});
        m.add({"caddy", {"system", "security"}, {}, 30});
        m.add({"netdata", {"system"}, {}, 90});
        return m;
    }

    std::expected<Manifest, ManifestError> Manifest::load(const std::filesystem::path& file_path) {
        if (!std::filesystem::exists(file_path)) {
            return std::unexpected(ManifestError::FileNotFound);
        }
        try {
            YAML::Node root = YAML::LoadFile(file_path.string());
            return parse_root(root);
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse manifest " + file_path.string() + ": " + e.what());
            return std::unexpected(ManifestError::InvalidFormat);
        }
    }

    std::expected<Manifest, ManifestError> Manifest::parse_from_string(const std::string& content) {
        try {
            YAML::Node root = YAML::Load(content);
            return parse_root(root);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse manifest from string: ") + e.what());
            return std::unexpected(ManifestError::InvalidFormat);
        }
    }

    void Manifest::add(ManifestEntry entry) {
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
                               [&](const auto& e) { return e.name == entry.name; });
        if (it != m_entries.end()) {
            *it = std::move(entry);
        } else {
            m_entries.push_back(std::move(entry));
        }
    }

    // --- Queries ---

    const ManifestEntry* Manifest::find(const std::string& name) const {
        auto it = std::find_if(m_entries.begin(), m_entries.end(),
                               [&](const auto& e) { return e.name == name; });
        return it == m_entries.end() ? nullptr : &*it;
    }

    std::vector<std::string> Manifest::names() const {
        std::vector<std::string> out;
        out.reserve(m_entries.size());
        for (const auto& entry : m_entries) {
            out.push_back(entry.name);
        }
        return out;
    }

    int Manifest::priority_of(const std::string& name) const {
        const auto* entry = find(name);
        return entry ? entry->priority : kDefaultPriority;
    }

    std::expected<void, ManifestError> Manifest::validate() const {
        DependencyGraph graph;
        for (const auto& entry : m_entries) {
            if (std::find(entry.depends_on.begin(), entry.depends_on.end(), entry.name) != entry.depends_on.end()) {
                log::error("Module " + entry.name + " cannot depend on itself");
                return std::unexpected(ManifestError::SelfDependency);
            }

            const std::set<std::string> deps(entry.depends_on.begin(), entry.depends_on.end());
            for (const auto& conflict : entry.conflicts_with) {
                if (deps.count(conflict)) {
                    log::error("Module " + entry.name + " both depends on and conflicts with " + conflict);
                    return std::unexpected(ManifestError::ConflictingDeclaration);
                }
            }

            graph.add_module(entry.name, entry.depends_on, entry.force_sequential);
        }

        auto checked = graph.validate();
        if (!checked) {
            return std::unexpected(checked.error().code == GraphErrorCode::CircularDependency
                                   ? ManifestError::CircularDependency
                                   : ManifestError::MissingDependency);
        }
        return {};
    }

    std::vector<ConflictRule> Manifest::detect_conflicts(const std::vector<std::string>& selection) const {
        std::vector<ConflictRule> conflicts;
        const std::set<std::string> selected(selection.begin(), selection.end());
        for (const auto& name : selection) {
            const auto* entry = find(name);
            if (!entry) continue;
            for (const auto& other : entry->conflicts_with) {
                if (selected.count(other)) {
                    conflicts.push_back({name, other, name + " conflicts with " + other});
                }
            }
        }
        return conflicts;
    }

    std::vector<std::string> Manifest::validate_selection(const std::vector<std::string>& selection) const {
        std::vector<std::string> errors;
        const std::set<std::string> selected(selection.begin(), selection.end());
        for (const auto& name : selection) {
            const auto* entry = find(name);
            if (!entry) continue;
            for (const auto& dep : entry->depends_on) {
                if (!selected.count(dep) && !contains(dep)) {
                    errors.push_back("Module '" + name + "' requires '" + dep + "' which is not selected");
                }
            }
        }
        return errors;
    }

    DependencyGraph Manifest::build_graph(const std::vector<std::string>& selection) const {
        DependencyGraph graph;
        const std::set<std::string> selected(selection.begin(), selection.end());
        for (const auto& name : selection) {
            const auto* entry = find(name);
            if (!entry) {
                graph.add_module(name);
                continue;
            }
            std::vector<std::string> deps;
            for (const auto& dep : entry->depends_on) {
                if (selected.count(dep)) {
                    deps.push_back(dep);
                }
            }
            graph.add_module(name, deps, entry->force_sequential);
        }
        return graph;
    }

    std::expected<std::vector<std::string>, GraphError> Manifest::resolve_order(const std::vector<std::string>& selection) const {
        auto batches = build_graph(selection).get_parallel_batches();
        if (!batches) {
            return std::unexpected(batches.error());
        }

        std::vector<std::string> order;
        for (auto& batch : *batches) {
            std::stable_sort(batch.begin(), batch.end(), [this](const auto& a, const auto& b) {
                return priority_of(a) < priority_of(b);
            });
            order.insert(order.end(), batch.begin(), batch.end());
        }
        return order;
    }

} // namespace keel
