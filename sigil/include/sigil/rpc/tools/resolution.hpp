#pragma once
// RPC Resolution Tools: resolve_encounter, resolve_event
//
// The resolved entity comes back in the structured result; the caller
// persists it.

#include "../protocol.hpp"
#include "../types.hpp"
#include "../../engine.hpp"
#include <sstream>
#include <unordered_map>
#include <vector>

namespace sigil::rpc::tools::resolution {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "resolve_encounter",
        "Run PRE, ON_RESOLVE and POST effects around marking an encounter resolved.",
        {
            {"type", "object"},
            {"properties", {
                {"encounterId", {{"type", "string"}, {"description", "Encounter record id"}}},
                {"extraContext", {{"type", "object"}, {"description", "Merged into guard context"}}}
            }},
            {"required", {"encounterId"}}
        }
    });

    tools.push_back({
        "resolve_event",
        "Run PRE, ON_RESOLVE and POST effects around marking an event completed.",
        {
            {"type", "object"},
            {"properties", {
                {"eventId", {{"type", "string"}, {"description", "Event record id"}}},
                {"extraContext", {{"type", "object"}, {"description", "Merged into guard context"}}}
            }},
            {"required", {"eventId"}}
        }
    });
}

inline std::string summarize(const ResolutionResult& result) {
    std::ostringstream ss;
    if (!result.ok) {
        ss << "Resolution of " << result.entity.ref.type << " " << result.entity.ref.id
           << " failed: " << result.error;
        return ss.str();
    }
    ss << "Resolved " << result.entity.ref.type << " " << result.entity.ref.id;
    for (size_t i = 0; i < result.phases.size(); ++i) {
        if (!result.ran[i]) continue;
        const auto& s = result.phases[i];
        ss << "\n  " << to_string(s.phase) << ": " << to_string(s.status())
           << " (" << s.succeeded << " applied, " << s.skipped << " skipped, "
           << s.failed << " failed)";
    }
    return ss.str();
}

inline ToolResult resolve_encounter(Engine& engine, const json& params) {
    std::string id = params.at("encounterId");
    auto result = engine.resolve_encounter(id, params.value("extraContext", json::object()));
    if (!result.ok) return ToolResult::error(summarize(result), result.to_json());
    return ToolResult::ok(summarize(result), result.to_json());
}

inline ToolResult resolve_event(Engine& engine, const json& params) {
    std::string id = params.at("eventId");
    auto result = engine.resolve_event(id, params.value("extraContext", json::object()));
    if (!result.ok) return ToolResult::error(summarize(result), result.to_json());
    return ToolResult::ok(summarize(result), result.to_json());
}

inline void register_handlers(Engine& engine,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["resolve_encounter"] = [&engine](const json& p) { return resolve_encounter(engine, p); };
    handlers["resolve_event"] = [&engine](const json& p) { return resolve_event(engine, p); };
}

} // namespace sigil::rpc::tools::resolution
