#pragma once

#include <strata/result.hpp>
#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <queue>
#include <functional>
#include <sstream>

namespace strata {

// ---------------------------------------------------------------------------
// Graph<NodeData> — directed graph with adjacency list. Edges keep their
// insertion order, which callers rely on for declaration order.
// ---------------------------------------------------------------------------

template<typename NodeData>
class Graph {
public:
    using NodeId = size_t;

    NodeId add_node(NodeData data) {
        NodeId id = nodes_.size();
        nodes_.push_back(std::move(data));
        adj_.push_back({});
        in_degree_.push_back(0);
        return id;
    }

    void add_edge(NodeId from, NodeId to) {
        adj_[from].push_back(to);
        ++in_degree_[to];
    }

    bool has_edge(NodeId from, NodeId to) const {
        for (NodeId t : adj_[from]) {
            if (t == to) return true;
        }
        return false;
    }

    size_t node_count() const { return nodes_.size(); }

    const NodeData& node(NodeId id) const { return nodes_[id]; }

    const std::vector<NodeId>& successors(NodeId id) const { return adj_[id]; }

    // Kahn's algorithm: every node comes before its successors.
    // Returns a Cycle error naming one node left on a cycle.
    Result<std::vector<NodeId>> topological_sort() const {
        size_t n = nodes_.size();
        std::vector<size_t> in_deg = in_degree_;

        std::queue<NodeId> q;
        for (NodeId i = 0; i < n; ++i) {
            if (in_deg[i] == 0) q.push(i);
        }

        std::vector<NodeId> order;
        order.reserve(n);
        while (!q.empty()) {
            NodeId u = q.front();
            q.pop();
            order.push_back(u);
            for (NodeId v : adj_[u]) {
                if (--in_deg[v] == 0) q.push(v);
            }
        }

        if (order.size() != n) {
            NodeId stuck = 0;
            while (in_deg[stuck] == 0) ++stuck;
            std::ostringstream msg;
            msg << "graph contains a cycle through '" << nodes_[stuck] << "'";
            return StrataError{StrataError::Cycle, msg.str()};
        }
        return Result<std::vector<NodeId>>::ok(std::move(order));
    }

    // Render the subgraph reachable from root as an indented tree. Nodes
    // already printed are marked with (*) and not expanded again.
    std::string tree_display(
        NodeId root,
        const std::function<std::string(const NodeData&)>& to_string_fn) const
    {
        std::ostringstream out;
        std::unordered_set<NodeId> visited;
        tree_display_impl(root, "", true, visited, to_string_fn, out);
        return out.str();
    }

private:
    std::vector<NodeData> nodes_;
    std::vector<std::vector<NodeId>> adj_;
    std::vector<size_t> in_degree_;

    void tree_display_impl(
        NodeId u,
        const std::string& prefix,
        bool is_last,
        std::unordered_set<NodeId>& visited,
        const std::function<std::string(const NodeData&)>& to_string_fn,
        std::ostringstream& out) const
    {
        out << prefix;
        if (!prefix.empty()) {
            out << (is_last ? "└── " : "├── ");
        }
        out << to_string_fn(nodes_[u]);

        if (!visited.insert(u).second) {
            out << " (*)\n";
            return;
        }
        out << "\n";

        const auto& next = adj_[u];
        for (size_t i = 0; i < next.size(); ++i) {
            std::string child_prefix = prefix.empty() ? "  " : prefix;
            if (!prefix.empty()) {
                child_prefix += (is_last ? "    " : "│   ");
            }
            tree_display_impl(next[i], child_prefix, i == next.size() - 1,
                              visited, to_string_fn, out);
        }
    }
};

// ---------------------------------------------------------------------------
// GraphMap — string-keyed convenience wrapper
// ---------------------------------------------------------------------------

class GraphMap {
public:
    using NodeId = Graph<std::string>::NodeId;

    NodeId add_node(const std::string& name) {
        auto it = name_to_id_.find(name);
        if (it != name_to_id_.end()) return it->second;
        NodeId id = graph_.add_node(name);
        name_to_id_[name] = id;
        return id;
    }

    bool has_node(const std::string& name) const {
        return name_to_id_.count(name) > 0;
    }

    void add_edge(const std::string& from, const std::string& to) {
        NodeId f = add_node(from);
        NodeId t = add_node(to);
        graph_.add_edge(f, t);
    }

    Result<std::vector<std::string>> topological_sort() const {
        auto r = graph_.topological_sort();
        if (r.is_err()) return std::move(r).error();
        std::vector<std::string> names;
        names.reserve(r.value().size());
        for (auto id : r.value()) {
            names.push_back(graph_.node(id));
        }
        return Result<std::vector<std::string>>::ok(std::move(names));
    }

    size_t node_count() const { return graph_.node_count(); }

    std::string tree_display(const std::string& root) const {
        auto it = name_to_id_.find(root);
        if (it == name_to_id_.end()) return "";
        return graph_.tree_display(it->second,
            [](const std::string& s) { return s; });
    }

    const Graph<std::string>& inner() const { return graph_; }

private:
    Graph<std::string> graph_;
    std::unordered_map<std::string, NodeId> name_to_id_;
};

} // namespace strata
