#pragma once
// RPC Protocol: JSON-RPC 2.0 framing, error codes and parameter access

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigil::rpc {

using json = nlohmann::json;

// JSON-RPC 2.0 error codes
namespace error {
    constexpr int PARSE_ERROR = -32700;
    constexpr int INVALID_REQUEST = -32600;
    constexpr int METHOD_NOT_FOUND = -32601;
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    // Engine-specific errors
    constexpr int TOOL_NOT_FOUND = -32001;
    constexpr int TOOL_EXECUTION_ERROR = -32002;
}

inline json make_result(const json& id, const json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

inline json make_error(const json& id, int code, const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

// Tool call response: one text block plus optional structured data
inline json make_tool_response(const std::string& text, bool is_error = false,
                               const json& structured = json()) {
    json response = {
        {"content", json::array({{{"type", "text"}, {"text", text}}})},
        {"isError", is_error}
    };
    if (!structured.is_null()) {
        response["structured"] = structured;
    }
    return response;
}

inline bool validate_request(const json& request, std::string& error_msg) {
    if (!request.is_object()) {
        error_msg = "Request must be a JSON object";
        return false;
    }
    if (!request.contains("jsonrpc") || request["jsonrpc"] != "2.0") {
        error_msg = "Missing or invalid jsonrpc version";
        return false;
    }
    if (!request.contains("method") || !request["method"].is_string()) {
        error_msg = "Missing or invalid method";
        return false;
    }
    return true;
}

struct RequestInfo {
    std::string method;
    json params;
    json id;
};

inline RequestInfo parse_request(const json& request) {
    return {
        request["method"].get<std::string>(),
        request.value("params", json::object()),
        request.value("id", json())
    };
}

// Empty string when every required parameter is present
inline std::string validate_required(const json& params, const std::vector<std::string>& required) {
    for (const auto& key : required) {
        if (!params.contains(key) || params[key].is_null()) {
            return "Missing required parameter: " + key;
        }
    }
    return "";
}

// Parameter with default; a value of the wrong type falls back too
template<typename T>
inline T get_param(const json& params, const char* key, T default_val) {
    auto it = params.find(key);
    if (it == params.end() || it->is_null()) return default_val;
    try {
        return it->template get<T>();
    } catch (const json::type_error&) {
        return default_val;
    }
}

inline std::optional<size_t> get_depth(const json& params, const char* key = "maxDepth") {
    auto it = params.find(key);
    if (it == params.end() || !it->is_number_integer() || it->get<int64_t>() < 0) {
        return std::nullopt;
    }
    return static_cast<size_t>(it->get<int64_t>());
}

// JSON arrays of strings; a bare string counts as one element
inline std::vector<std::string> get_string_list(const json& params, const char* key) {
    std::vector<std::string> out;
    auto it = params.find(key);
    if (it == params.end()) return out;
    if (it->is_string()) {
        out.push_back(it->get<std::string>());
    } else if (it->is_array()) {
        for (const auto& v : *it) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

} // namespace sigil::rpc
