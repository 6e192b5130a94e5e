#pragma once
// Graph builder: turns condition and effect records into a DependencyGraph
//
// Node ids:  VARIABLE:<name>  CONDITION:<id>  EFFECT:<id>  ENTITY:<type>:<id|*>
// Edges:
//   CONDITION -READS->      VARIABLE   expression reads
//   EFFECT    -READS->      VARIABLE   guard reads and patch reads
//   EFFECT    -WRITES->     VARIABLE   patch targets
//   ENTITY    -DEPENDS_ON-> CONDITION / EFFECT it owns
//   EFFECT    -DEPENDS_ON-> EFFECT     reader -> writer of a shared variable
//
// The last kind is derived from the READS / WRITES edges already in the
// graph, so write feedback loops show up as ordinary cycles.

#include "dependency_extractor.hpp"
#include "dependency_graph.hpp"
#include "expression.hpp"
#include "log.hpp"
#include "patch.hpp"
#include "types.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sigil {

struct GraphBuildOptions {
    bool link_write_chains = true;
};

struct GraphBuild {
    DependencyGraph graph;
    std::vector<std::string> warnings;

    json to_json() const {
        json j = graph.to_json();
        j["warnings"] = warnings;
        return j;
    }
};

class GraphBuilder {
public:
    explicit GraphBuilder(GraphBuildOptions options = {}) : options_(options) {}

    static std::string variable_node_id(const std::string& name) { return "VARIABLE:" + name; }
    static std::string condition_node_id(const std::string& id) { return "CONDITION:" + id; }
    static std::string effect_node_id(const std::string& id) { return "EFFECT:" + id; }
    static std::string entity_node_id(const EntityRef& ref) { return "ENTITY:" + ref.key(); }

    GraphBuild build(const std::vector<Condition>& conditions,
                     const std::vector<Effect>& effects,
                     const std::vector<EntitySnapshot>& entities = {}) const {
        GraphBuild result;
        std::map<std::string, std::string> entity_labels;
        for (const auto& e : entities) {
            auto name = e.document.find("name");
            if (name != e.document.end() && name->is_string()) {
                entity_labels[e.ref.key()] = name->get<std::string>();
            }
        }

        std::map<std::string, const Condition*> by_id;
        for (const auto& c : conditions) {
            if (!c.id.empty()) by_id[c.id] = &c;
        }

        for (const auto& c : conditions) {
            if (!c.is_active) continue;
            add_condition(result.graph, c, entity_labels, result.warnings);
        }

        for (const auto& e : effects) {
            if (!e.is_active) continue;
            const Condition* guard = nullptr;
            if (e.condition_id) {
                auto it = by_id.find(*e.condition_id);
                if (it == by_id.end()) {
                    result.warnings.push_back("Effect " + e.id + " references unknown condition " +
                                              *e.condition_id);
                } else if (it->second->is_active) {
                    guard = it->second;
                }
            }
            add_effect(result.graph, e, guard, entity_labels, result.warnings);
        }

        if (options_.link_write_chains) link_write_chains(result.graph);
        size_t in_cycle = result.graph.mark_cycles();

        log::debug("graph", "Built dependency graph: %zu nodes, %zu edges, %zu in cycles, %zu warnings",
                   result.graph.node_count(), result.graph.edge_count(), in_cycle,
                   result.warnings.size());
        for (const auto& w : result.warnings) {
            log::warn("graph", "%s", w.c_str());
        }
        return result;
    }

    // Replace one condition's node and edges in place. Effects guarded by
    // it have their guard reads refreshed. Inactive conditions are removed.
    void update_condition(DependencyGraph& graph, const Condition& condition,
                          std::vector<std::string>& warnings) const {
        const std::string node_id = condition_node_id(condition.id);
        graph.remove_node(node_id);
        if (condition.is_active) {
            add_condition(graph, condition, {}, warnings);
        }

        std::set<std::string> guard_reads;
        if (condition.is_active) {
            try {
                guard_reads = extractor_.extract_reads(*Expression::parse(condition.expression));
            } catch (const Error&) {
                // add_condition already recorded the warning
            }
        }

        std::vector<std::string> guarded;
        for (const auto& node : graph.nodes()) {
            if (node.type != NodeType::Effect) continue;
            auto cid = node.metadata.find("conditionId");
            if (cid != node.metadata.end() && cid->is_string() && *cid == condition.id) {
                guarded.push_back(node.id);
            }
        }

        for (const auto& effect_id : guarded) {
            for (const auto& edge : graph.outgoing_edges(effect_id)) {
                if (edge.type == EdgeType::Reads && edge.metadata.value("source", "") == "guard") {
                    graph.remove_edge(edge.from, edge.to, EdgeType::Reads);
                }
            }
            for (const auto& name : guard_reads) {
                ensure_variable(graph, name);
                graph.add_edge({effect_id, variable_node_id(name), EdgeType::Reads,
                                {{"variable", name}, {"source", "guard"}}});
            }
            // A removed guard edge may have shadowed a patch read
            json patch_reads = graph.node(effect_id)->metadata.value("patchReads", json::array());
            for (const auto& name : patch_reads) {
                graph.add_edge({effect_id, variable_node_id(name.get<std::string>()), EdgeType::Reads,
                                {{"variable", name}, {"source", "patch"}}});
            }
        }

        refresh_derived(graph);
    }

    // Drop a condition, effect or entity node by record id
    bool remove_record(DependencyGraph& graph, const std::string& node_id) const {
        if (!graph.remove_node(node_id)) return false;
        refresh_derived(graph);
        return true;
    }

    // Effect ids that sit on a write feedback loop
    static std::set<std::string> cyclic_effects(const DependencyGraph& graph) {
        std::set<std::string> result;
        for (const auto& id : graph.cycle_members()) {
            const DependencyNode* n = graph.node(id);
            if (n && n->type == NodeType::Effect) {
                result.insert(n->metadata.value("effectId", ""));
            }
        }
        return result;
    }

    // Rebuild every EFFECT -> EFFECT edge from the READS / WRITES edges
    static void link_write_chains(DependencyGraph& graph) {
        std::vector<std::pair<std::string, std::string>> stale;
        for (const auto& e : graph.edges()) {
            if (e.type == EdgeType::DependsOn && is_effect(graph, e.from) && is_effect(graph, e.to)) {
                stale.emplace_back(e.from, e.to);
            }
        }
        for (const auto& [from, to] : stale) graph.remove_edge(from, to, EdgeType::DependsOn);

        // variable node -> effects writing it
        std::map<std::string, std::vector<std::string>> writers;
        for (const auto& e : graph.edges()) {
            if (e.type == EdgeType::Writes && is_effect(graph, e.from)) {
                writers[e.to].push_back(e.from);
            }
        }

        std::vector<DependencyEdge> links;
        for (const auto& e : graph.edges()) {
            if (e.type != EdgeType::Reads || !is_effect(graph, e.from)) continue;
            auto it = writers.find(e.to);
            if (it == writers.end()) continue;
            for (const auto& writer : it->second) {
                if (writer == e.from) continue;
                links.push_back({e.from, writer, EdgeType::DependsOn,
                                 {{"via", e.metadata.value("variable", "")}}});
            }
        }
        for (auto& link : links) graph.add_edge(std::move(link));
    }

private:
    GraphBuildOptions options_;
    DependencyExtractor extractor_;
    PatchEngine patch_;

    static bool is_effect(const DependencyGraph& graph, const std::string& id) {
        const DependencyNode* n = graph.node(id);
        return n && n->type == NodeType::Effect;
    }

    void refresh_derived(DependencyGraph& graph) const {
        if (options_.link_write_chains) link_write_chains(graph);
        graph.mark_cycles();
    }

    static void ensure_variable(DependencyGraph& graph, const std::string& name) {
        DependencyNode node;
        node.id = variable_node_id(name);
        node.type = NodeType::Variable;
        node.label = name;
        node.metadata = {{"name", name}};
        graph.add_node(std::move(node));
    }

    static std::string ensure_entity(DependencyGraph& graph, const EntityRef& ref,
                                     const std::map<std::string, std::string>& labels) {
        DependencyNode node;
        node.id = entity_node_id(ref);
        node.type = NodeType::Entity;
        node.entity_id = ref.type_level() ? "*" : ref.id;
        auto label = labels.find(ref.key());
        node.label = label != labels.end() ? label->second : ref.key();
        node.metadata = {{"entityType", ref.type}, {"entityId", node.entity_id}};
        std::string id = node.id;
        graph.add_node(std::move(node));
        return id;
    }

    void add_condition(DependencyGraph& graph, const Condition& c,
                       const std::map<std::string, std::string>& labels,
                       std::vector<std::string>& warnings) const {
        if (c.id.empty() || c.entity_type.empty()) {
            warnings.push_back("Skipping condition with missing id or entity type");
            return;
        }

        std::set<std::string> reads;
        try {
            reads = extractor_.extract_reads(*Expression::parse(c.expression));
        } catch (const Error& e) {
            warnings.push_back("Skipping condition " + c.id + ": " + e.what());
            return;
        }

        DependencyNode node;
        node.id = condition_node_id(c.id);
        node.type = NodeType::Condition;
        node.entity_id = c.entity_id.value_or("*");
        node.label = c.entity_type + "." + c.field;
        node.metadata = {
            {"conditionId", c.id},
            {"entityType", c.entity_type},
            {"field", c.field},
            {"priority", c.priority},
            {"description", c.description}
        };
        if (!graph.add_node(std::move(node))) {
            warnings.push_back("Duplicate condition id " + c.id);
            return;
        }

        for (const auto& name : reads) {
            ensure_variable(graph, name);
            graph.add_edge({condition_node_id(c.id), variable_node_id(name), EdgeType::Reads,
                            {{"variable", name}, {"source", "expression"}}});
        }

        std::string owner = ensure_entity(graph, c.owner(), labels);
        graph.add_edge({owner, condition_node_id(c.id), EdgeType::DependsOn, json::object()});
    }

    void add_effect(DependencyGraph& graph, const Effect& e, const Condition* guard,
                    const std::map<std::string, std::string>& labels,
                    std::vector<std::string>& warnings) const {
        if (e.id.empty() || e.entity_type.empty() || e.entity_id.empty()) {
            warnings.push_back("Skipping effect with missing id or owner");
            return;
        }
        auto validation = patch_.validate(e.payload, e.entity_type);
        if (!validation.valid) {
            warnings.push_back("Skipping effect " + e.id + ": " + validation.errors.front());
            return;
        }

        std::set<std::string> guard_reads;
        if (guard) {
            try {
                guard_reads = extractor_.extract_reads(*Expression::parse(guard->expression));
            } catch (const Error& err) {
                warnings.push_back("Effect " + e.id + " guard " + guard->id + " is malformed: " +
                                   err.what());
            }
        }
        auto patch_reads = extractor_.extract_patch_reads(e);
        auto writes = extractor_.extract_writes(e);

        DependencyNode node;
        node.id = effect_node_id(e.id);
        node.type = NodeType::Effect;
        node.entity_id = e.entity_id;
        node.label = e.name;
        node.metadata = {
            {"effectId", e.id},
            {"entityType", e.entity_type},
            {"timing", to_string(e.timing)},
            {"priority", e.priority},
            {"conditionId", e.condition_id ? json(*e.condition_id) : json()},
            {"patchReads", patch_reads},
            {"writes", writes}
        };
        if (!graph.add_node(std::move(node))) {
            warnings.push_back("Duplicate effect id " + e.id);
            return;
        }

        const std::string id = effect_node_id(e.id);
        for (const auto& name : guard_reads) {
            ensure_variable(graph, name);
            graph.add_edge({id, variable_node_id(name), EdgeType::Reads,
                            {{"variable", name}, {"source", "guard"}}});
        }
        for (const auto& name : patch_reads) {
            ensure_variable(graph, name);
            graph.add_edge({id, variable_node_id(name), EdgeType::Reads,
                            {{"variable", name}, {"source", "patch"}}});
        }
        for (const auto& name : writes) {
            ensure_variable(graph, name);
            graph.add_edge({id, variable_node_id(name), EdgeType::Writes, {{"variable", name}}});
        }

        std::string owner = ensure_entity(graph, e.owner(), labels);
        graph.add_edge({owner, id, EdgeType::DependsOn, json::object()});
    }
};

} // namespace sigil
