//
// Created by cv2 on 10/3/25.
//

#include "libkeel/dependency_graph.h"
#include "libkeel/logging.h"

#include <algorithm>
#include <queue>

namespace keel {

    namespace {
        std::string join_names(const std::vector<std::string>& names, const char* delim = ", ") {
            std::string out;
            for (size_t i = 0; i < names.size(); ++i) {
                out += names[i];
                if (i < names.size() - 1) {
                    out += delim;
                }
            }
            return out;
        }
    }

    DependencyGraph::Node& DependencyGraph::ensure_node(const std::string& name) {
        auto it = m_nodes.find(name);
        if (it == m_nodes.end()) {
            it = m_nodes.emplace(name, Node{}).first;
            m_order.push_back(name);
        }
        return it->second;
    }

    void DependencyGraph::add_module(const std::string& name,
                                     const std::vector<std::string>& depends_on,
                                     bool force_sequential) {
        Node& node = ensure_node(name);

        // A re-declaration replaces the previous edge set.
        for (const auto& old_dep : node.depends_on) {
            m_nodes[old_dep].successors.erase(name);
        }
        node.depends_on.clear();

        for (const auto& dep : depends_on) {
            if (std::find(node.depends_on.begin(), node.depends_on.end(), dep) != node.depends_on.end()) {
                continue;
            }
            node.depends_on.push_back(dep);
        }
        node.declared = true;
        node.force_sequential = force_sequential;

        // Fail-open: a dependency we have not seen yet becomes a placeholder node.
        // ensure_node() never invalidates `node` (std::map references are stable).
        for (const auto& dep : node.depends_on) {
            ensure_node(dep).successors.insert(name);
        }
    }

    bool DependencyGraph::contains(const std::string& name) const {
        return m_nodes.count(name) > 0;
    }

    bool DependencyGraph::is_declared(const std::string& name) const {
        auto it = m_nodes.find(name);
        return it != m_nodes.end() && it->second.declared;
    }

    bool DependencyGraph::is_force_sequential(const std::string& name) const {
        auto it = m_nodes.find(name);
        return it != m_nodes.end() && it->second.force_sequential;
    }

    std::vector<std::string> DependencyGraph::dependencies_of(const std::string& name) const {
        auto it = m_nodes.find(name);
        if (it == m_nodes.end()) {
            return {};
        }
        return it->second.depends_on;
    }

    bool DependencyGraph::dfs_visit(const std::string& name,
                                    std::set<std::string>& visiting,
                                    std::set<std::string>& visited,
                                    std::vector<std::string>& path) const {
        if (visited.count(name)) { return false; }
        if (visiting.count(name)) {
            // Trim the path down to the cycle itself and close it.
            auto start = std::find(path.begin(), path.end(), name);
            path.erase(path.begin(), start);
            path.push_back(name);
            return true;
        }

        visiting.insert(name);
        path.push_back(name);
        for (const auto& dep : m_nodes.at(name).depends_on) {
            if (dfs_visit(dep, visiting, visited, path)) {
                return true;
            }
        }
        path.pop_back();
        visiting.erase(name);
        visited.insert(name);
        return false;
    }

    std::expected<void, GraphError> DependencyGraph::find_cycle() const {
        std::set<std::string> visiting; // Gray set: for detecting cycles
        std::set<std::string> visited;  // Black set: for nodes already processed

        for (const auto& name : m_order) {
            std::vector<std::string> path;
            if (dfs_visit(name, visiting, visited, path)) {
                // The walk follows "depends on" edges; report in execution direction.
                std::reverse(path.begin(), path.end());
                return std::unexpected(GraphError{
                        GraphErrorCode::CircularDependency,
                        "Circular dependency detected: " + join_names(path, " -> "),
                        path});
            }
        }
        return {};
    }

    std::size_t DependencyGraph::count_components() const {
        std::set<std::string> seen;
        std::size_t components = 0;

        for (const auto& start : m_order) {
            if (seen.count(start)) { continue; }
            ++components;

            std::queue<std::string> bfs;
            bfs.push(start);
            seen.insert(start);
            while (!bfs.empty()) {
                const auto current = bfs.front();
                bfs.pop();
                const Node& node = m_nodes.at(current);
                for (const auto& next : node.depends_on) {
                    if (seen.insert(next).second) { bfs.push(next); }
                }
                for (const auto& next : node.successors) {
                    if (seen.insert(next).second) { bfs.push(next); }
                }
            }
        }
        return components;
    }

    std::expected<void, GraphError> DependencyGraph::validate() const {
        if (auto cycle = find_cycle(); !cycle) {
            log::error(cycle.error().message);
            return cycle;
        }

        for (const auto& name : m_order) {
            const Node& node = m_nodes.at(name);
            if (!node.declared) { continue; }
            for (const auto& dep : node.depends_on) {
                if (!is_declared(dep)) {
                    std::string msg = "Module '" + name + "' depends on '" + dep + "' which doesn't exist";
                    log::error(msg);
                    return std::unexpected(GraphError{GraphErrorCode::MissingDependency, msg, {name, dep}});
                }
            }
        }

        if (const auto components = count_components(); components > 1) {
            log::warn("Dependency graph is disconnected (" + std::to_string(components) + " independent groups).");
        }
        return {};
    }

    std::expected<BatchList, GraphError> DependencyGraph::get_parallel_batches() const {
        BatchList batches;

        // Working copy of in-degrees, keyed by name; iteration uses m_order so the
        // frontier always comes out in discovery order.
        std::map<std::string, std::size_t> in_degree;
        for (const auto& name : m_order) {
            in_degree[name] = m_nodes.at(name).depends_on.size();
        }

        auto remove_node = [&](const std::string& name) {
            in_degree.erase(name);
            for (const auto& successor : m_nodes.at(name).successors) {
                auto it = in_degree.find(successor);
                if (it != in_degree.end()) {
                    --it->second;
                }
            }
        };

        while (!in_degree.empty()) {
            std::vector<std::string> frontier;
            for (const auto& name : m_order) {
                auto it = in_degree.find(name);
                if (it != in_degree.end() && it->second == 0) {
                    frontier.push_back(name);
                }
            }

            if (frontier.empty()) {
                std::vector<std::string> stuck;
                for (const auto& name : m_order) {
                    if (in_degree.count(name)) { stuck.push_back(name); }
                }
                std::string msg = "Circular dependency detected among: " + join_names(stuck);
                log::error(msg);
                return std::unexpected(GraphError{GraphErrorCode::CircularDependency, msg, stuck});
            }

            Batch parallel;
            for (const auto& name : frontier) {
                if (m_nodes.at(name).force_sequential) {
                    batches.push_back({name});
                } else {
                    parallel.push_back(name);
                }
            }
            if (!parallel.empty()) {
                batches.push_back(std::move(parallel));
            }

            for (const auto& name : frontier) {
                remove_node(name);
            }
        }

        return batches;
    }

} // namespace keel
