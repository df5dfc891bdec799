//
// Created by cv2 on 10/3/25.
//

#pragma once

#include <expected>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace keel {

    enum class GraphErrorCode {
        CircularDependency,
        MissingDependency
    };

    struct GraphError {
        GraphErrorCode code;
        std::string message;
        // The cycle path, the stuck set, or the offending (module, dependency) pair.
        std::vector<std::string> modules;
    };

    using Batch = std::vector<std::string>;
    using BatchList = std::vector<Batch>;

    class DependencyGraph {
    public:
        DependencyGraph() = default;

        // Adds (or re-declares) a module. Dependencies that were never added are
        // inserted as placeholder nodes so edges always have both ends.
        void add_module(const std::string& name,
                        const std::vector<std::string>& depends_on = {},
                        bool force_sequential = false);

        // Cycle and missing-dependency check. Warns (only) on a disconnected graph.
        std::expected<void, GraphError> validate() const;

        // Kahn's algorithm, level by level. Force-sequential modules get a batch each.
        std::expected<BatchList, GraphError> get_parallel_batches() const;

        bool contains(const std::string& name) const;
        bool is_declared(const std::string& name) const;
        bool is_force_sequential(const std::string& name) const;
        std::vector<std::string> dependencies_of(const std::string& name) const;
        const std::vector<std::string>& modules() const { return m_order; }
        std::size_t size() const { return m_order.size(); }

    private:
        struct Node {
            std::vector<std::string> depends_on; // as declared
            std::set<std::string> successors;    // modules that depend on this one
            bool declared = false;               // false for auto-inserted placeholders
            bool force_sequential = false;
        };

        Node& ensure_node(const std::string& name);

        std::expected<void, GraphError> find_cycle() const;
        bool dfs_visit(const std::string& name,
                       std::set<std::string>& visiting,
                       std::set<std::string>& visited,
                       std::vector<std::string>& path) const;
        std::size_t count_components() const;

        std::map<std::string, Node> m_nodes;
        std::vector<std::string> m_order; // discovery order
    };

} // namespace keel
