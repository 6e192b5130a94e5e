#pragma once
// RPC Handler: JSON-RPC 2.0 dispatch over the engine's tools
//
// Used by the stdio server loop and by the one-shot CLI mode, which calls
// call_tool() directly.

#include "protocol.hpp"
#include "types.hpp"
#include "tools/conditions.hpp"
#include "tools/graph.hpp"
#include "tools/patches.hpp"
#include "tools/resolution.hpp"
#include "../engine.hpp"
#include "../log.hpp"
#include "../version.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace sigil::rpc {

using json = nlohmann::json;

class Handler {
public:
    explicit Handler(Engine& engine) : engine_(engine) {
        register_all_tools();
    }

    // Deepest JSON nesting accepted in a request. Expressions are capped
    // lower, at Expression::max_nesting.
    static constexpr int max_request_depth = 512;

    // Process a JSON-RPC request string, return response string
    std::string handle(const std::string& request_str) {
        json response;
        try {
            bool too_deep = false;
            json request = json::parse(request_str,
                [&too_deep](int depth, json::parse_event_t, json&) {
                    if (depth > max_request_depth) too_deep = true;
                    return !too_deep;
                });
            if (too_deep) {
                response = make_error(json(), error::INVALID_REQUEST,
                                      "Request nesting exceeds " +
                                      std::to_string(max_request_depth) + " levels");
            } else {
                response = handle_request(request);
            }
        } catch (const json::parse_error& e) {
            response = make_error(json(), error::PARSE_ERROR,
                                  std::string("JSON parse error: ") + e.what());
        } catch (const std::exception& e) {
            response = make_error(json(), error::INTERNAL_ERROR,
                                  std::string("Internal error: ") + e.what());
        }
        // Record text is not guaranteed to be valid UTF-8
        return response.dump(-1, ' ', false, json::error_handler_t::replace);
    }

    json handle_request(const json& request) {
        std::string error_msg;
        if (!validate_request(request, error_msg)) {
            json id = request.is_object() ? request.value("id", json()) : json();
            return make_error(id, error::INVALID_REQUEST, error_msg);
        }

        auto info = parse_request(request);

        if (info.method == "initialize") {
            return handle_initialize(info.id);
        } else if (info.method == "tools/list") {
            return handle_tools_list(info.id);
        } else if (info.method == "tools/call") {
            return handle_tools_call(info.params, info.id);
        } else if (info.method == "shutdown") {
            shutdown_ = true;
            return make_result(info.id, {{"status", "ok"}});
        }
        return make_error(info.id, error::METHOD_NOT_FOUND, "Unknown method: " + info.method);
    }

    // Run one tool. Missing required arguments and engine errors come back
    // as error results; an unknown tool throws std::out_of_range.
    ToolResult call_tool(const std::string& name, const json& arguments) {
        auto it = handlers_.find(name);
        if (it == handlers_.end()) {
            throw std::out_of_range("Unknown tool: " + name);
        }
        if (!arguments.is_object()) {
            return ToolResult::error("Tool arguments must be an object");
        }
        std::string missing = validate_required(arguments, required_.at(name));
        if (!missing.empty()) {
            return ToolResult::error(missing);
        }

        try {
            return it->second(arguments);
        } catch (const Error& e) {
            log::warn("rpc", "%s failed: %s", name.c_str(), e.what());
            return ToolResult::error(std::string(e.kind_name()) + ": " + e.what(),
                                     {{"error", e.what()}, {"errorKind", e.kind_name()}});
        } catch (const json::exception& e) {
            return ToolResult::error(std::string("Invalid arguments: ") + e.what());
        }
    }

    bool has_tool(const std::string& name) const { return handlers_.count(name) > 0; }
    const std::vector<ToolSchema>& tools() const { return tools_; }
    bool shutdown_requested() const { return shutdown_; }

private:
    Engine& engine_;
    std::vector<ToolSchema> tools_;
    std::unordered_map<std::string, ToolHandler> handlers_;
    std::unordered_map<std::string, std::vector<std::string>> required_;
    bool shutdown_ = false;

    void register_all_tools() {
        // Conditions (evaluate, validate, extract reads)
        tools::conditions::register_schemas(tools_);
        tools::conditions::register_handlers(engine_, handlers_);

        // Patches (validate, preview)
        tools::patches::register_schemas(tools_);
        tools::patches::register_handlers(engine_, handlers_);

        // Resolution (encounters, events)
        tools::resolution::register_schemas(tools_);
        tools::resolution::register_handlers(engine_, handlers_);

        // Dependency graph
        tools::graph::register_schemas(tools_);
        tools::graph::register_handlers(engine_, handlers_);

        for (const auto& tool : tools_) {
            auto& req = required_[tool.name];
            auto it = tool.input_schema.find("required");
            if (it == tool.input_schema.end()) continue;
            for (const auto& key : *it) req.push_back(key.get<std::string>());
        }
    }

    json handle_initialize(const json& id) {
        return make_result(id, {
            {"protocolVersion", "2024-11-05"},
            {"serverInfo", {
                {"name", "sigil"},
                {"version", SIGIL_VERSION}
            }},
            {"capabilities", {{"tools", {{"listChanged", false}}}}}
        });
    }

    json handle_tools_list(const json& id) {
        json tools_array = json::array();
        for (const auto& tool : tools_) {
            tools_array.push_back({
                {"name", tool.name},
                {"description", tool.description},
                {"inputSchema", tool.input_schema}
            });
        }
        return make_result(id, {{"tools", tools_array}});
    }

    json handle_tools_call(const json& params, const json& id) {
        if (!params.contains("name") || !params["name"].is_string()) {
            return make_error(id, error::INVALID_PARAMS, "Missing tool name");
        }

        std::string name = params["name"];
        json arguments = params.value("arguments", json::object());

        if (!has_tool(name)) {
            return make_error(id, error::TOOL_NOT_FOUND, "Unknown tool: " + name);
        }

        try {
            ToolResult result = call_tool(name, arguments);
            return make_result(id, make_tool_response(result.content, result.is_error, result.structured));
        } catch (const std::exception& e) {
            return make_error(id, error::TOOL_EXECUTION_ERROR,
                              std::string("Tool execution failed: ") + e.what());
        }
    }
};

} // namespace sigil::rpc
