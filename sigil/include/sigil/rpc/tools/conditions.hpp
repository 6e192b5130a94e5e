#pragma once
// RPC Condition Tools: evaluate_condition, evaluate_expression,
// validate_expression, extract_reads

#include "../protocol.hpp"
#include "../types.hpp"
#include "../../engine.hpp"
#include <sstream>
#include <unordered_map>
#include <vector>

namespace sigil::rpc::tools::conditions {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "evaluate_condition",
        "Evaluate a stored condition against a context object. Returns the value "
        "and the pre-order execution trace.",
        {
            {"type", "object"},
            {"properties", {
                {"conditionId", {{"type", "string"}, {"description", "Condition record id"}}},
                {"context", {{"type", "object"}, {"description", "Evaluation data"}}}
            }},
            {"required", {"conditionId"}}
        }
    });

    tools.push_back({
        "evaluate_expression",
        "Evaluate an inline expression against a context object.",
        {
            {"type", "object"},
            {"properties", {
                {"expression", {{"description", "Expression tree"}}},
                {"context", {{"type", "object"}, {"description", "Evaluation data"}}}
            }},
            {"required", {"expression"}}
        }
    });

    tools.push_back({
        "validate_expression",
        "Check an expression for unknown operators, malformed nodes and excessive depth.",
        {
            {"type", "object"},
            {"properties", {
                {"expression", {{"description", "Expression tree"}}}
            }},
            {"required", {"expression"}}
        }
    });

    tools.push_back({
        "extract_reads",
        "List the base variable names an expression reads.",
        {
            {"type", "object"},
            {"properties", {
                {"expression", {{"description", "Expression tree"}}}
            }},
            {"required", {"expression"}}
        }
    });
}

inline ToolResult evaluate_condition(Engine& engine, const json& params) {
    std::string id = params.at("conditionId");
    json context = params.value("context", json::object());

    auto result = engine.evaluate_condition(id, context);
    if (!result.success) {
        return ToolResult::error(result.error_kind + ": " + result.error, result.to_json());
    }
    return ToolResult::ok("Condition " + id + " = " + result.value.dump(), result.to_json());
}

inline ToolResult evaluate_expression(Engine& engine, const json& params) {
    json context = params.value("context", json::object());

    auto result = engine.evaluate_expression(params.at("expression"), context);
    if (!result.success) {
        return ToolResult::error(result.error_kind + ": " + result.error, result.to_json());
    }
    return ToolResult::ok(result.value.dump(), result.to_json());
}

inline ToolResult validate_expression(Engine& engine, const json& params) {
    auto result = engine.validate_expression(params.at("expression"));
    if (result.valid) {
        return ToolResult::ok("Expression is valid", result.to_json());
    }
    std::ostringstream ss;
    ss << "Expression has " << result.errors.size() << " error(s):";
    for (const auto& e : result.errors) ss << "\n  - " << e;
    return ToolResult::ok(ss.str(), result.to_json());
}

inline ToolResult extract_reads(Engine& engine, const json& params) {
    auto reads = engine.extract_reads(params.at("expression"));
    json vars = json::array();
    std::ostringstream ss;
    for (const auto& name : reads) {
        if (!vars.empty()) ss << ", ";
        ss << name;
        vars.push_back(name);
    }
    return ToolResult::ok(reads.empty() ? "No variables read" : ss.str(),
                          {{"variables", vars}});
}

inline void register_handlers(Engine& engine,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["evaluate_condition"] = [&engine](const json& p) { return evaluate_condition(engine, p); };
    handlers["evaluate_expression"] = [&engine](const json& p) { return evaluate_expression(engine, p); };
    handlers["validate_expression"] = [&engine](const json& p) { return validate_expression(engine, p); };
    handlers["extract_reads"] = [&engine](const json& p) { return extract_reads(engine, p); };
}

} // namespace sigil::rpc::tools::conditions
