#pragma once
// RPC Patch Tools: validate_patch, preview_patch

#include "../protocol.hpp"
#include "../types.hpp"
#include "../../engine.hpp"
#include <sstream>
#include <unordered_map>
#include <vector>

namespace sigil::rpc::tools::patches {

using json = nlohmann::json;

inline void register_schemas(std::vector<ToolSchema>& tools) {
    tools.push_back({
        "validate_patch",
        "Check a JSON Patch payload before it is stored on an effect. Protected "
        "fields and malformed pointers are errors; unknown fields are warnings.",
        {
            {"type", "object"},
            {"properties", {
                {"payload", {{"type", "array"}, {"description", "RFC 6902 operations"}}},
                {"entityType", {{"type", "string"}, {"description", "Target entity type (optional)"}}}
            }},
            {"required", {"payload"}}
        }
    });

    tools.push_back({
        "preview_patch",
        "Apply a patch to a copy of a document and report the result and variable diff.",
        {
            {"type", "object"},
            {"properties", {
                {"document", {{"type", "object"}, {"description", "Entity document"}}},
                {"payload", {{"type", "array"}, {"description", "RFC 6902 operations"}}},
                {"entityType", {{"type", "string"}, {"description", "Target entity type (optional)"}}}
            }},
            {"required", {"document", "payload"}}
        }
    });
}

inline void append_messages(std::ostringstream& ss, const char* label,
                            const std::vector<std::string>& messages) {
    for (const auto& m : messages) ss << "\n  " << label << ": " << m;
}

inline ToolResult validate_patch(Engine& engine, const json& params) {
    std::string type = get_param<std::string>(params, "entityType", "");
    auto result = engine.validate_patch(params.at("payload"), type);

    std::ostringstream ss;
    ss << (result.valid ? "Patch is valid" : "Patch is invalid");
    append_messages(ss, "error", result.errors);
    append_messages(ss, "warning", result.warnings);
    return ToolResult::ok(ss.str(), result.to_json());
}

inline ToolResult preview_patch(Engine& engine, const json& params) {
    std::string type = get_param<std::string>(params, "entityType", "");
    auto preview = engine.preview_patch(params.at("document"), params.at("payload"), type);

    std::ostringstream ss;
    if (preview.success) {
        ss << "Patch applies: " << preview.diff.added.size() << " added, "
           << preview.diff.modified.size() << " modified, "
           << preview.diff.removed.size() << " removed";
    } else {
        ss << "Patch fails";
    }
    append_messages(ss, "error", preview.errors);
    append_messages(ss, "warning", preview.warnings);

    if (!preview.success) return ToolResult::error(ss.str(), preview.to_json());
    return ToolResult::ok(ss.str(), preview.to_json());
}

inline void register_handlers(Engine& engine,
                              std::unordered_map<std::string, ToolHandler>& handlers) {
    handlers["validate_patch"] = [&engine](const json& p) { return validate_patch(engine, p); };
    handlers["preview_patch"] = [&engine](const json& p) { return preview_patch(engine, p); };
}

} // namespace sigil::rpc::tools::patches
