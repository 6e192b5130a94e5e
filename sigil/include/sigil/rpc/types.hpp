#pragma once
// RPC Types: tool schema and result types

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

namespace sigil::rpc {

using json = nlohmann::json;

// Tool schema definition for tools/list
struct ToolSchema {
    std::string name;
    std::string description;
    json input_schema;
};

// Tool execution result
struct ToolResult {
    bool is_error = false;
    std::string content;      // Human-readable text response
    json structured;          // Structured JSON data

    static ToolResult ok(const std::string& text, const json& data = json()) {
        return {false, text, data};
    }

    static ToolResult error(const std::string& message, const json& data = json()) {
        return {true, message, data};
    }
};

using ToolHandler = std::function<ToolResult(const json&)>;

} // namespace sigil::rpc
