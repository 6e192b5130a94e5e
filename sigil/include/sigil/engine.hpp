#pragma once
// Engine: the query surface over a RecordSource
//
// Every entry point returns a structured result; sigil::Error never escapes.
// resolve_* hands back the mutated entity and leaves persisting it to the
// caller.

#include "config.hpp"
#include "dependency_extractor.hpp"
#include "errors.hpp"
#include "evaluator.hpp"
#include "expression.hpp"
#include "graph_builder.hpp"
#include "graph_cache.hpp"
#include "log.hpp"
#include "patch.hpp"
#include "pipeline.hpp"
#include "record_source.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sigil {

struct ConditionEvaluation {
    bool success = false;
    json value;
    ExecutionTrace trace;
    std::string error;
    std::string error_kind;

    json to_json() const {
        json j = {
            {"success", success},
            {"value", value},
            {"trace", trace_to_json(trace)}
        };
        j["error"] = success ? json() : json(error);
        if (!success) j["errorKind"] = error_kind;
        return j;
    }
};

class Engine {
public:
    Engine(RecordSource& source, EngineConfig config, OperatorRegistry registry = {})
        : source_(source),
          config_(std::move(config)),
          registry_(std::move(registry)),
          evaluator_(&registry_),
          builder_(GraphBuildOptions{config_.link_write_chains}) {}

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // ═══════════════════════════════════════════════════════════════════
    // Conditions
    // ═══════════════════════════════════════════════════════════════════

    ConditionEvaluation evaluate_condition(const std::string& condition_id, const json& context) const {
        ConditionEvaluation result;
        auto condition = source_.condition(condition_id);
        if (!condition) {
            result.error = "Condition " + condition_id + " not found";
            result.error_kind = to_string(ErrorKind::RecordNotFound);
            return result;
        }
        if (!condition->is_active) {
            result.error = "Condition " + condition_id + " is inactive";
            result.error_kind = to_string(ErrorKind::RecordNotFound);
            return result;
        }
        return evaluate_expression(condition->expression, context);
    }

    // Parse and evaluate; failures come back with whatever trace was
    // recorded up to the failing node
    ConditionEvaluation evaluate_expression(const json& expression, const json& context) const {
        ConditionEvaluation result;
        try {
            auto expr = Expression::parse(expression);
            result.value = evaluator_.evaluate(*expr, context, result.trace);
            result.success = true;
        } catch (const Error& e) {
            result.value = json();
            result.error = e.what();
            result.error_kind = e.kind_name();
            log::debug("engine", "Evaluation failed: %s", e.what());
        }
        return result;
    }

    ExpressionValidation validate_expression(const json& expression) const {
        return sigil::validate_expression(expression, &registry_, config_.max_expression_depth);
    }

    std::set<std::string> extract_reads(const json& expression) const {
        return extractor_.extract_reads(expression);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Patches
    // ═══════════════════════════════════════════════════════════════════

    ValidationResult validate_patch(const json& payload, const std::string& type = "") const {
        return patch_.validate(payload, type);
    }

    PatchPreview preview_patch(const json& document, const json& payload,
                               const std::string& type = "") const {
        return patch_.preview(document, payload, type);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Resolution
    // ═══════════════════════════════════════════════════════════════════

    ResolutionResult resolve_encounter(const std::string& id, const json& extra_context = json::object()) {
        return resolve(entity_type::ENCOUNTER, id, Pipeline::resolve_encounter_action(), extra_context);
    }

    ResolutionResult resolve_event(const std::string& id, const json& extra_context = json::object()) {
        return resolve(entity_type::EVENT, id, Pipeline::complete_event_action(), extra_context);
    }

    // Any entity type with a caller-supplied core action
    ResolutionResult resolve(const std::string& type, const std::string& id,
                             const CoreAction& action, const json& extra_context = json::object()) {
        auto entity = source_.entity(type, id);
        if (!entity) {
            ResolutionResult result;
            result.ok = false;
            result.error = type + " with ID " + id + " not found";
            result.error_kind = to_string(ErrorKind::RecordNotFound);
            result.entity.ref = {type, id};
            return result;
        }

        auto effects = source_.effects_for(entity->ref);
        std::vector<Condition> guards;
        std::set<std::string> seen;
        for (const auto& e : effects) {
            if (!e.condition_id || !seen.insert(*e.condition_id).second) continue;
            if (auto c = source_.condition(*e.condition_id)) guards.push_back(std::move(*c));
        }

        std::set<std::string> cyclic;
        if (config_.refuse_cyclic_writes) {
            auto build = dependency_graph(entity->campaign_id, entity->branch_id);
            cyclic = GraphBuilder::cyclic_effects(build->graph);
        }

        PipelineOptions options;
        options.refuse_cyclic_writes = config_.refuse_cyclic_writes;
        options.extra_context = extra_context.is_object() ? extra_context : json::object();
        Pipeline pipeline(evaluator_, patch_, std::move(options));
        return pipeline.resolve(*entity, effects, guards, action, cyclic);
    }

    // ═══════════════════════════════════════════════════════════════════
    // Dependency graph
    // ═══════════════════════════════════════════════════════════════════

    std::shared_ptr<const GraphBuild> dependency_graph(const std::string& campaign,
                                                       const std::string& branch) {
        const std::string c = campaign.empty() ? config_.default_campaign : campaign;
        const std::string b = branch.empty() ? config_.default_branch : branch;
        return cache_.get_or_build(c, b, [this](const std::string& cc, const std::string& bb) {
            return builder_.build(source_.conditions(cc, bb), source_.effects(cc, bb),
                                  source_.entities(cc, bb));
        });
    }

    std::vector<std::string> upstream(const std::string& campaign, const std::string& branch,
                                      const std::string& node_id,
                                      std::optional<size_t> max_depth = std::nullopt) {
        return dependency_graph(campaign, branch)->graph.upstream(node_id, max_depth);
    }

    std::vector<std::string> downstream(const std::string& campaign, const std::string& branch,
                                        const std::string& node_id,
                                        std::optional<size_t> max_depth = std::nullopt) {
        return dependency_graph(campaign, branch)->graph.downstream(node_id, max_depth);
    }

    Selection selection(const std::string& campaign, const std::string& branch,
                        const std::vector<std::string>& node_ids,
                        std::optional<size_t> max_depth = std::nullopt) {
        return dependency_graph(campaign, branch)->graph.selection(node_ids, max_depth);
    }

    TopologicalOrder evaluation_order(const std::string& campaign, const std::string& branch) {
        return dependency_graph(campaign, branch)->graph.topological_sort();
    }

    CycleReport validate_no_cycles(const std::string& campaign, const std::string& branch) {
        return dependency_graph(campaign, branch)->graph.detect_cycles();
    }

    bool invalidate_graph(const std::string& campaign, const std::string& branch) {
        const std::string c = campaign.empty() ? config_.default_campaign : campaign;
        const std::string b = branch.empty() ? config_.default_branch : branch;
        return cache_.invalidate(c, b);
    }

    const EngineConfig& config() const { return config_; }
    const OperatorRegistry& registry() const { return registry_; }
    const GraphCache& cache() const { return cache_; }
    const RecordSource& source() const { return source_; }

private:
    RecordSource& source_;
    EngineConfig config_;
    OperatorRegistry registry_;
    Evaluator evaluator_;
    PatchEngine patch_;
    DependencyExtractor extractor_;
    GraphBuilder builder_;
    GraphCache cache_;
};

} // namespace sigil
