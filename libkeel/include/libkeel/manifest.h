//
// Created by cv2 on 10/7/25.
//

#pragma once

#include "dependency_graph.h"

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

namespace keel {

    enum class ManifestError {
        FileNotFound,
        InvalidFormat,
        MissingRequiredField,
        SelfDependency,
        ConflictingDeclaration, // a module both depends on and conflicts with another
        MissingDependency,
        CircularDependency
    };

    std::string to_string(ManifestError error);

    inline constexpr int kDefaultPriority = 50;

    struct ManifestEntry {
        std::string name;
        std::vector<std::string> depends_on;
        std::vector<std::string> conflicts_with;
        int priority = kDefaultPriority; // lower runs earlier within a batch
        bool force_sequential = false;
        bool large_module = false;
    };

    struct ConflictRule {
        std::string module_a;
        std::string module_b;
        std::string reason;
    };

    // Static description of every module the tool knows about.
    class Manifest {
    public:
        Manifest() = default;

        // The default provisioning stack.
        static Manifest builtin();

        // Accepts either a sequence of entries (each with a `name`) or a
        // mapping of name -> entry.
        static std::expected<Manifest, ManifestError> load(const std::filesystem::path& file_path);
        static std::expected<Manifest, ManifestError> parse_from_string(const std::string& content);

        // Adds an entry, replacing any existing entry of the same name.
        void add(ManifestEntry entry);

        const ManifestEntry* find(const std::string& name) const;
        bool contains(const std::string& name) const { return find(name) != nullptr; }
        const std::vector<ManifestEntry>& entries() const { return m_entries; }
        std::vector<std::string> names() const;
        std::size_t size() const { return m_entries.size(); }

        // Whole-manifest sanity check, run before any graph is built.
        std::expected<void, ManifestError> validate() const;

        std::vector<ConflictRule> detect_conflicts(const std::vector<std::string>& selection) const;

        // Human-readable errors for selected modules whose dependencies are
        // neither selected nor known to the manifest.
        std::vector<std::string> validate_selection(const std::vector<std::string>& selection) const;

        // Flattened batch order, each batch sorted by priority.
        std::expected<std::vector<std::string>, GraphError> resolve_order(const std::vector<std::string>& selection) const;

        // Graph over `selection` only; dependencies outside the selection are dropped.
        DependencyGraph build_graph(const std::vector<std::string>& selection) const;

        int priority_of(const std::string& name) const;

    private:
        std::vector<ManifestEntry> m_entries;
    };

} // namespace keel
