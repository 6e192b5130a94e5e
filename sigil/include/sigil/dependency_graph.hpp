#pragma once
// Dependency graph: variables, conditions, effects and entities wired
// together by what reads and writes what
//
// Flat arena: nodes and edges live in vectors, string ids map to indices.
// An edge A -> B means A depends on B. The graph may be cyclic; cycles are
// what it exists to find.

#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace sigil {

using json = nlohmann::json;

enum class NodeType : uint8_t {
    Variable = 0,
    Condition = 1,
    Effect = 2,
    Entity = 3,
};

inline const char* to_string(NodeType type) {
    switch (type) {
        case NodeType::Variable: return "VARIABLE";
        case NodeType::Condition: return "CONDITION";
        case NodeType::Effect: return "EFFECT";
        case NodeType::Entity: return "ENTITY";
    }
    return "UNKNOWN";
}

enum class EdgeType : uint8_t {
    Reads = 0,
    Writes = 1,
    DependsOn = 2,
};

inline const char* to_string(EdgeType type) {
    switch (type) {
        case EdgeType::Reads: return "READS";
        case EdgeType::Writes: return "WRITES";
        case EdgeType::DependsOn: return "DEPENDS_ON";
    }
    return "UNKNOWN";
}

inline std::optional<NodeType> parse_node_type(const std::string& s) {
    if (s == "VARIABLE") return NodeType::Variable;
    if (s == "CONDITION") return NodeType::Condition;
    if (s == "EFFECT") return NodeType::Effect;
    if (s == "ENTITY") return NodeType::Entity;
    return std::nullopt;
}

struct DependencyNode {
    std::string id;
    NodeType type = NodeType::Variable;
    std::string entity_id;
    std::string label;
    json metadata = json::object();
    bool in_cycle = false;

    json to_json() const {
        return {
            {"id", id},
            {"type", to_string(type)},
            {"entityId", entity_id.empty() ? json() : json(entity_id)},
            {"label", label},
            {"metadata", metadata},
            {"inCycle", in_cycle}
        };
    }
};

struct DependencyEdge {
    std::string from;
    std::string to;
    EdgeType type = EdgeType::Reads;
    json metadata = json::object();

    json to_json() const {
        return {
            {"fromId", from},
            {"toId", to},
            {"type", to_string(type)},
            {"metadata", metadata}
        };
    }
};

struct CycleInfo {
    std::vector<std::string> path;  // first id repeated at the end

    std::string description() const {
        std::string out = "Cycle detected: ";
        for (size_t i = 0; i < path.size(); ++i) {
            if (i) out += " -> ";
            out += path[i];
        }
        return out;
    }

    json to_json() const {
        return {{"path", path}, {"description", description()}};
    }
};

struct CycleReport {
    std::vector<CycleInfo> cycles;

    bool has_cycles() const { return !cycles.empty(); }

    json to_json() const {
        json arr = json::array();
        for (const auto& c : cycles) arr.push_back(c.to_json());
        return {{"hasCycles", has_cycles()}, {"cycleCount", cycles.size()}, {"cycles", arr}};
    }
};

struct TopologicalOrder {
    bool success = true;
    std::vector<std::string> order;      // dependencies first
    std::vector<std::string> remaining;  // nodes stuck behind a cycle

    json to_json() const {
        json j = {{"success", success}, {"order", order}, {"remainingNodes", remaining}};
        j["error"] = success ? json()
            : json("Cycle detected: " + std::to_string(remaining.size()) +
                   " nodes could not be sorted");
        return j;
    }
};

struct GraphStats {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t variable_count = 0;
    size_t condition_count = 0;
    size_t effect_count = 0;
    size_t entity_count = 0;
    size_t cycle_node_count = 0;

    json to_json() const {
        return {
            {"nodeCount", node_count},
            {"edgeCount", edge_count},
            {"variableCount", variable_count},
            {"conditionCount", condition_count},
            {"effectCount", effect_count},
            {"entityCount", entity_count},
            {"cycleNodeCount", cycle_node_count},
            {"hasCycles", cycle_node_count > 0}
        };
    }
};

// Upstream and downstream closure of a set of selected nodes
struct Selection {
    std::vector<std::string> selected;
    std::vector<std::string> upstream;
    std::vector<std::string> downstream;

    json to_json() const {
        return {
            {"selected", selected},
            {"upstream", upstream},
            {"downstream", downstream}
        };
    }
};

class DependencyGraph {
public:
    // Returns false when the id is already taken
    bool add_node(DependencyNode node) {
        if (index_.count(node.id)) return false;
        index_.emplace(node.id, nodes_.size());
        nodes_.push_back(std::move(node));
        out_.emplace_back();
        in_.emplace_back();
        return true;
    }

    // Removes the node and every edge touching it
    bool remove_node(const std::string& id) {
        auto it = index_.find(id);
        if (it == index_.end()) return false;

        size_t victim = it->second;
        nodes_.erase(nodes_.begin() + static_cast<std::ptrdiff_t>(victim));
        edges_.erase(std::remove_if(edges_.begin(), edges_.end(),
                                    [&](const DependencyEdge& e) { return e.from == id || e.to == id; }),
                     edges_.end());
        rebuild_index();
        return true;
    }

    // Same (from, to, type) twice is stored once. Both ends must exist.
    bool add_edge(DependencyEdge edge) {
        auto from = index_.find(edge.from);
        auto to = index_.find(edge.to);
        if (from == index_.end() || to == index_.end()) return false;
        if (has_edge(edge.from, edge.to, edge.type)) return false;

        size_t e = edges_.size();
        out_[from->second].push_back(e);
        in_[to->second].push_back(e);
        edges_.push_back(std::move(edge));
        return true;
    }

    // Removes every edge from -> to, or only those of the given type
    size_t remove_edge(const std::string& from, const std::string& to,
                       std::optional<EdgeType> type = std::nullopt) {
        size_t before = edges_.size();
        edges_.erase(std::remove_if(edges_.begin(), edges_.end(),
                                    [&](const DependencyEdge& e) {
                                        return e.from == from && e.to == to &&
                                               (!type || e.type == *type);
                                    }),
                     edges_.end());
        size_t removed = before - edges_.size();
        if (removed) rebuild_index();
        return removed;
    }

    void clear() {
        nodes_.clear();
        edges_.clear();
        index_.clear();
        out_.clear();
        in_.clear();
    }

    const DependencyNode* node(const std::string& id) const {
        auto it = index_.find(id);
        return it != index_.end() ? &nodes_[it->second] : nullptr;
    }

    DependencyNode* node(const std::string& id) {
        auto it = index_.find(id);
        return it != index_.end() ? &nodes_[it->second] : nullptr;
    }

    bool has_node(const std::string& id) const { return index_.count(id) > 0; }

    bool has_edge(const std::string& from, const std::string& to,
                  std::optional<EdgeType> type = std::nullopt) const {
        auto it = index_.find(from);
        if (it == index_.end()) return false;
        for (size_t e : out_[it->second]) {
            if (edges_[e].to == to && (!type || edges_[e].type == *type)) return true;
        }
        return false;
    }

    const std::vector<DependencyNode>& nodes() const { return nodes_; }
    const std::vector<DependencyEdge>& edges() const { return edges_; }
    size_t node_count() const { return nodes_.size(); }
    size_t edge_count() const { return edges_.size(); }

    std::vector<DependencyEdge> outgoing_edges(const std::string& id) const {
        std::vector<DependencyEdge> result;
        auto it = index_.find(id);
        if (it == index_.end()) return result;
        for (size_t e : out_[it->second]) result.push_back(edges_[e]);
        return result;
    }

    // Direct out-neighbors: what this node depends on
    std::vector<std::string> dependencies_of(const std::string& id) const {
        return neighbors(id, true);
    }

    // Direct in-neighbors: what depends on this node
    std::vector<std::string> dependents(const std::string& id) const {
        return neighbors(id, false);
    }

    bool has_path(const std::string& source, const std::string& target) const {
        auto s = index_.find(source);
        auto t = index_.find(target);
        if (s == index_.end() || t == index_.end()) return false;
        if (s->second == t->second) return true;

        std::vector<bool> visited(nodes_.size(), false);
        std::deque<size_t> queue{s->second};
        visited[s->second] = true;
        while (!queue.empty()) {
            size_t current = queue.front();
            queue.pop_front();
            for (size_t e : out_[current]) {
                size_t next = index_.at(edges_[e].to);
                if (next == t->second) return true;
                if (!visited[next]) {
                    visited[next] = true;
                    queue.push_back(next);
                }
            }
        }
        return false;
    }

    // Adding from -> to closes a loop iff to already reaches from
    bool would_create_cycle(const std::string& from, const std::string& to) const {
        return has_path(to, from);
    }

    // Three-color DFS. Every back edge yields one cycle path, reconstructed
    // from the DFS parent chain.
    CycleReport detect_cycles() const {
        enum class Color : uint8_t { White, Gray, Black };
        std::vector<Color> color(nodes_.size(), Color::White);
        std::vector<size_t> parent(nodes_.size(), SIZE_MAX);
        CycleReport report;

        std::function<void(size_t)> visit = [&](size_t u) {
            color[u] = Color::Gray;
            for (size_t e : out_[u]) {
                size_t v = index_.at(edges_[e].to);
                if (color[v] == Color::White) {
                    parent[v] = u;
                    visit(v);
                } else if (color[v] == Color::Gray) {
                    CycleInfo cycle;
                    for (size_t cur = u; cur != SIZE_MAX && cur != v; cur = parent[cur]) {
                        cycle.path.push_back(nodes_[cur].id);
                    }
                    cycle.path.push_back(nodes_[v].id);
                    std::reverse(cycle.path.begin(), cycle.path.end());
                    cycle.path.push_back(nodes_[v].id);
                    report.cycles.push_back(std::move(cycle));
                }
            }
            color[u] = Color::Black;
        };

        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (color[i] == Color::White) visit(i);
        }
        return report;
    }

    // Ids of every node that lies on some cycle: members of a strongly
    // connected component larger than one, or nodes with a self-loop
    std::set<std::string> cycle_members() const {
        std::set<std::string> members;
        for (const auto& scc : strongly_connected_components()) {
            if (scc.size() > 1) {
                for (size_t i : scc) members.insert(nodes_[i].id);
            } else if (has_edge(nodes_[scc[0]].id, nodes_[scc[0]].id)) {
                members.insert(nodes_[scc[0]].id);
            }
        }
        return members;
    }

    // Sets in_cycle on every node; returns how many are on a cycle
    size_t mark_cycles() {
        auto members = cycle_members();
        for (auto& n : nodes_) {
            n.in_cycle = members.count(n.id) > 0;
        }
        return members.size();
    }

    // Kahn's algorithm, lexical tie-break. The result lists dependencies
    // before their dependents; nodes left behind by a cycle are reported.
    TopologicalOrder topological_sort() const {
        std::vector<size_t> in_degree(nodes_.size(), 0);
        for (size_t i = 0; i < nodes_.size(); ++i) {
            in_degree[i] = in_[i].size();
        }

        std::set<std::string> ready;
        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (in_degree[i] == 0) ready.insert(nodes_[i].id);
        }

        TopologicalOrder result;
        while (!ready.empty()) {
            std::string id = *ready.begin();
            ready.erase(ready.begin());
            result.order.push_back(id);

            for (size_t e : out_[index_.at(id)]) {
                size_t next = index_.at(edges_[e].to);
                if (--in_degree[next] == 0) ready.insert(nodes_[next].id);
            }
        }

        for (size_t i = 0; i < nodes_.size(); ++i) {
            if (in_degree[i] > 0) result.remaining.push_back(nodes_[i].id);
        }
        std::sort(result.remaining.begin(), result.remaining.end());
        result.success = result.remaining.empty();

        // Kahn emits dependents first since edges point at dependencies
        std::reverse(result.order.begin(), result.order.end());
        return result;
    }

    // BFS against edge direction: everything that depends on id
    std::vector<std::string> upstream(const std::string& id,
                                      std::optional<size_t> max_depth = std::nullopt) const {
        return traverse({id}, false, max_depth);
    }

    // BFS along edges: everything id depends on
    std::vector<std::string> downstream(const std::string& id,
                                        std::optional<size_t> max_depth = std::nullopt) const {
        return traverse({id}, true, max_depth);
    }

    // Union of upstream and downstream closures, selected ids excluded
    Selection selection(const std::vector<std::string>& ids,
                        std::optional<size_t> max_depth = std::nullopt) const {
        Selection s;
        for (const auto& id : ids) {
            if (has_node(id)) s.selected.push_back(id);
        }
        s.upstream = traverse(s.selected, false, max_depth);
        s.downstream = traverse(s.selected, true, max_depth);
        return s;
    }

    GraphStats stats() const {
        GraphStats s;
        s.node_count = nodes_.size();
        s.edge_count = edges_.size();
        for (const auto& n : nodes_) {
            switch (n.type) {
                case NodeType::Variable: ++s.variable_count; break;
                case NodeType::Condition: ++s.condition_count; break;
                case NodeType::Effect: ++s.effect_count; break;
                case NodeType::Entity: ++s.entity_count; break;
            }
            if (n.in_cycle) ++s.cycle_node_count;
        }
        return s;
    }

    json to_json() const {
        json nodes = json::array();
        for (const auto& n : nodes_) nodes.push_back(n.to_json());
        json edges = json::array();
        for (const auto& e : edges_) edges.push_back(e.to_json());
        return {{"nodes", nodes}, {"edges", edges}, {"stats", stats().to_json()}};
    }

private:
    std::vector<DependencyNode> nodes_;
    std::vector<DependencyEdge> edges_;
    std::unordered_map<std::string, size_t> index_;
    std::vector<std::vector<size_t>> out_;  // node index -> edge indices
    std::vector<std::vector<size_t>> in_;

    void rebuild_index() {
        index_.clear();
        out_.assign(nodes_.size(), {});
        in_.assign(nodes_.size(), {});
        for (size_t i = 0; i < nodes_.size(); ++i) {
            index_.emplace(nodes_[i].id, i);
        }
        for (size_t e = 0; e < edges_.size(); ++e) {
            out_[index_.at(edges_[e].from)].push_back(e);
            in_[index_.at(edges_[e].to)].push_back(e);
        }
    }

    std::vector<std::string> neighbors(const std::string& id, bool outgoing) const {
        std::vector<std::string> result;
        auto it = index_.find(id);
        if (it == index_.end()) return result;

        std::unordered_set<std::string> seen;
        const auto& list = outgoing ? out_[it->second] : in_[it->second];
        for (size_t e : list) {
            const std::string& other = outgoing ? edges_[e].to : edges_[e].from;
            if (seen.insert(other).second) result.push_back(other);
        }
        return result;
    }

    std::vector<std::string> traverse(const std::vector<std::string>& origins, bool outgoing,
                                      std::optional<size_t> max_depth) const {
        std::vector<std::string> result;
        std::vector<bool> visited(nodes_.size(), false);
        std::deque<std::pair<size_t, size_t>> queue;  // node, depth

        for (const auto& id : origins) {
            auto it = index_.find(id);
            if (it == index_.end() || visited[it->second]) continue;
            visited[it->second] = true;
            queue.emplace_back(it->second, 0);
        }

        while (!queue.empty()) {
            auto [current, depth] = queue.front();
            queue.pop_front();
            if (max_depth && depth >= *max_depth) continue;

            const auto& list = outgoing ? out_[current] : in_[current];
            for (size_t e : list) {
                size_t next = index_.at(outgoing ? edges_[e].to : edges_[e].from);
                if (visited[next]) continue;
                visited[next] = true;
                result.push_back(nodes_[next].id);
                queue.emplace_back(next, depth + 1);
            }
        }
        return result;
    }

    // Tarjan's algorithm
    std::vector<std::vector<size_t>> strongly_connected_components() const {
        const size_t n = nodes_.size();
        std::vector<size_t> index(n, SIZE_MAX), low(n, 0);
        std::vector<bool> on_stack(n, false);
        std::vector<size_t> stack;
        std::vector<std::vector<size_t>> components;
        size_t counter = 0;

        std::function<void(size_t)> connect = [&](size_t u) {
            index[u] = low[u] = counter++;
            stack.push_back(u);
            on_stack[u] = true;

            for (size_t e : out_[u]) {
                size_t v = index_.at(edges_[e].to);
                if (index[v] == SIZE_MAX) {
                    connect(v);
                    low[u] = std::min(low[u], low[v]);
                } else if (on_stack[v]) {
                    low[u] = std::min(low[u], index[v]);
                }
            }

            if (low[u] == index[u]) {
                std::vector<size_t> component;
                size_t w;
                do {
                    w = stack.back();
                    stack.pop_back();
                    on_stack[w] = false;
                    component.push_back(w);
                } while (w != u);
                components.push_back(std::move(component));
            }
        };

        for (size_t i = 0; i < n; ++i) {
            if (index[i] == SIZE_MAX) connect(i);
        }
        return components;
    }
};

} // namespace sigil
