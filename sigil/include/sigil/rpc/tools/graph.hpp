#pragma once
// RPC Graph Tools: dependency_graph, graph_upstream, graph_downstream,
// graph_selection, evaluation_order, detect_cycles, invalidate_graph
//
// campaignId and branchId fall back to the engine's configured defaults.

#include "../protocol.hpp"
#include "../types.hpp"
#include "../../engine.hpp"
#include <sstream>
#include <unordered_map>
#include <vector>

namespace sigil::rpc::tools::graph {

using json = nlohmann::json;

inline json scope_properties() {
    return {
        {"campaignId", {{"type", "string"}, {"description", "Campaign scope (default from config)"}}},
        {"branchId", {{"type", "string"}, {"description", "Branch scope (default from config)"}}}
    };
}

inline json traversal_schema(bool many) {
    json props = scope_properties();
    if (many) {
        props["nodeIds"] = {{"type", "array"}, {"items", {{"type", "string"}}},
                            {"description", "Selected node ids"}};
    } else {
        props["nodeId"] = {{"type", "string"}, {"description", "Node id, e.g. VARIABLE:gold"}};
    }
    props["maxDepth"] = {{"type", "integer"}, {"minimum", 0},
                         {"description", "Stop after this many hops (unbounded if omitted)"}};
    return {
        {"type", "object"},
        {"properties", props},
        {"required", json::array({many ? "nodeIds" : "nodeId"})}
    };
}

inline void register_schemas(std::vector<ToolSchema>& tools) {
    json scope_only = {
        {"type", "object"},
        {"properties", scope_properties()},
        {"required", json::array()}
    };

    tools.push_back({
        "dependency_graph",
        "Build (or fetch cached) the variable/condition/effect dependency graph for a campaign branch.",
        scope_only
    });
    tools.push_back({
        "graph_upstream",
        "Nodes with edges leading into the given node, e.g. the readers and writers of a variable.",
        traversal_schema(false)
    });
    tools.push_back({
        "graph_downstream",
        "Nodes reachable along edges out of the given node, e.g. the variables a condition reads.",
        traversal_schema(false)
    });
    tools.push_back({
        "graph_selection",
        "Upstream and downstream closure of a set of nodes.",
        traversal_schema(true)
    });
    tools.push_back({
        "evaluation_order",
        "Topological order of the graph, dependencies first. Fails when cycles exist.",
        scope_only
    });
    tools.push_back({
        "detect_cycles",
        "Report every dependency cycle in the graph.",
        scope_only
    });
    tools.push_back({
        "invalidate_graph",
        "Drop the cached graph so the next request rebuilds it.",
        scope_only
    });
}

struct Scope {
    std::string campaign;
    std::string branch;
};

inline Scope scope_of(const json& params) {
    return {get_param<std::string>(params, "campaignId", ""),
            get_param<std::string>(params, "branchId", "")};
}

inline json id_list(const std::vector<std::string>& ids) {
    json arr = json::array();
    for (const auto& id : ids) arr.push_back(id);
    return arr;
}

inline ToolResult dependency_graph(Engine& engine, const json& params) {
    auto s = scope_of(params);
    auto build = engine.dependency_graph(s.campaign, s.branch);
    auto stats = build->graph.stats();

    std::ostringstream ss;
    ss << "Graph: " << stats.node_count << " nodes, " << stats.edge_count << " edges";
    if (stats.cycle_node_count > 0) ss << ", " << stats.cycle_node_count << " nodes in cycles";
    if (!build->warnings.empty()) ss << ", " << build->warnings.size() << " warning(s)";
    return ToolResult::ok(ss.str(), build->to_json());
}

inline ToolResult upstream(Engine& engine, const json& params) {
    auto s = scope_of(params);
    std::string node = params.at("nodeId");
    auto ids = engine.upstream(s.campaign, s.branch, node, get_depth(params));
    return ToolResult::ok(std::to_string(ids.size()) + " upstream of " + node,
                          {{"nodeId", node}, {"upstream", id_list(ids)}});
}

inline ToolResult downstream(Engine& engine, const json& params) {
    auto s = scope_of(params);
    std::string node = params.at("nodeId");
    auto ids = engine.downstream(s.campaign, s.branch, node, get_depth(params));
    return ToolResult::ok(std::to_string(ids.size()) + " downstream of " + node,
                          {{"nodeId", node}, {"downstream", id_list(ids)}});
}

inline ToolResult selection(Engine& engine, const json& params) {
    auto s = scope_of(params);
    auto ids = get_string_list(params, "nodeIds");
    auto sel = engine.selection(s.campaign, s.branch, ids, get_depth(params));
    std::ostringstream ss;
    ss << sel.selected.size() << " selected, " << sel.upstream.size() << " upstream, "
       << sel.downstream.size() << " downstream";
    return ToolResult::ok(ss.str(), sel.to_json());
}

inline ToolResult evaluation_order(Engine& engine, const json& params) {
    auto s = scope_of(params);
    auto order = engine.evaluation_order(s.campaign, s.branch);
    if (!order.success) {
        return ToolResult::error("Cycle detected: " + std::to_string(order.remaining.size()) +
                                 " nodes could not be ordered", order.to_json());
    }
    return ToolResult::ok(std::to_string(order.order.size()) + " nodes ordered", order.to_json());
}

inline ToolResult detect_cycles(Engine& engine, const json& params) {
    auto s = scope_of(params);
    auto report = engine.validate_no_cycles(s.campaign, s.branch);
    if (!report.has_cycles()) return ToolResult::ok("No cycles", report.to_json());

    std::ostringstream ss;
    ss << report.cycles.size() << " cycle(s):";
    for (const auto& c : report.cycles) ss << "\n  " << c.description();
    return ToolResult::ok(ss.str(), report.to_json());
}

inline ToolResult invalidate(Engine& engine, const json& params) {
    auto s = scope_of(params);
    bool dropped = engine.invalidate_graph(s.campaign, s.branch);
    return ToolResult::ok(dropped ? "Graph invalidated" : "No cached graph",
                          {{"invalidated", dropped}});
}

inline void register_handlers(Engine& engine,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["dependency_graph"] = [&engine](const json& p) { return dependency_graph(engine, p); };
    handlers["graph_upstream"] = [&engine](const json& p) { return upstream(engine, p); };
    handlers["graph_downstream"] = [&engine](const json& p) { return downstream(engine, p); };
    handlers["graph_selection"] = [&engine](const json& p) { return selection(engine, p); };
    handlers["evaluation_order"] = [&engine](const json& p) { return evaluation_order(engine, p); };
    handlers["detect_cycles"] = [&engine](const json& p) { return detect_cycles(engine, p); };
    handlers["invalidate_graph"] = [&engine](const json& p) { return invalidate(engine, p); };
}

} // namespace sigil::rpc::tools::graph
