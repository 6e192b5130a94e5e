#pragma once
// Expression: the condition language as a closed tree
//
// Every node is exactly one of:
//   Literal    - string / number / boolean / null, or an array of expressions
//   Var        - {"var": "a.b"} or {"var": ["a.b", default]}
//   Operation  - {"op": [args...]}
//
// Trees are built once by parse() and never mutated afterwards.

#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace sigil {

using json = nlohmann::json;

struct Expression;
using ExpressionPtr = std::shared_ptr<const Expression>;

struct Expression {
    enum class Kind : uint8_t { Literal, Var, Operation };

    Kind kind = Kind::Literal;

    // Literal: scalar value (ignored when is_array)
    json value;
    bool is_array = false;

    // Var: dotted path. Operation: operator name.
    std::string name;

    // Literal array elements or operation arguments
    std::vector<ExpressionPtr> children;

    // Var default, evaluated only when the path does not resolve
    ExpressionPtr fallback;

    static ExpressionPtr literal(json v) {
        auto e = std::make_shared<Expression>();
        e->kind = Kind::Literal;
        e->value = std::move(v);
        return e;
    }

    static ExpressionPtr array(std::vector<ExpressionPtr> items) {
        auto e = std::make_shared<Expression>();
        e->kind = Kind::Literal;
        e->is_array = true;
        e->children = std::move(items);
        return e;
    }

    static ExpressionPtr var(std::string path, ExpressionPtr default_value = nullptr) {
        auto e = std::make_shared<Expression>();
        e->kind = Kind::Var;
        e->name = std::move(path);
        e->fallback = std::move(default_value);
        return e;
    }

    static ExpressionPtr operation(std::string op, std::vector<ExpressionPtr> args) {
        auto e = std::make_shared<Expression>();
        e->kind = Kind::Operation;
        e->name = std::move(op);
        e->children = std::move(args);
        return e;
    }

    // Deepest wire-form nesting parse() accepts
    static constexpr size_t max_nesting = 256;

    // Build a tree from its JSON wire form. Operator names are not checked
    // here: an unknown operator only fails if evaluation reaches it.
    static ExpressionPtr parse(const json& j) {
        return parse_node(j, 1);
    }

    // Wire form; parse(to_json()) yields an equivalent tree
    json to_json() const {
        switch (kind) {
            case Kind::Literal: {
                if (!is_array) return value;
                json arr = json::array();
                for (const auto& child : children) {
                    arr.push_back(child->to_json());
                }
                return arr;
            }
            case Kind::Var:
                if (fallback) {
                    return {{"var", json::array({name, fallback->to_json()})}};
                }
                return {{"var", name}};
            case Kind::Operation: {
                json args = json::array();
                for (const auto& child : children) {
                    args.push_back(child->to_json());
                }
                return {{name, args}};
            }
        }
        return json();
    }

    // Number of levels in the tree (a single literal is depth 1)
    size_t depth() const {
        size_t deepest = 0;
        for (const auto& child : children) {
            deepest = std::max(deepest, child->depth());
        }
        if (fallback) deepest = std::max(deepest, fallback->depth());
        return deepest + 1;
    }

    bool is_literal() const { return kind == Kind::Literal; }
    bool is_var() const { return kind == Kind::Var; }
    bool is_operation() const { return kind == Kind::Operation; }

private:
    static ExpressionPtr parse_node(const json& j, size_t level) {
        if (level > max_nesting) {
            throw MalformedExpressionError("Expression nesting exceeds " +
                                           std::to_string(max_nesting) + " levels");
        }
        switch (j.type()) {
            case json::value_t::null:
            case json::value_t::boolean:
            case json::value_t::number_integer:
            case json::value_t::number_unsigned:
            case json::value_t::number_float:
            case json::value_t::string:
                return literal(j);

            case json::value_t::array: {
                std::vector<ExpressionPtr> items;
                items.reserve(j.size());
                for (const auto& item : j) {
                    items.push_back(parse_node(item, level + 1));
                }
                return array(std::move(items));
            }

            case json::value_t::object:
                return parse_object(j, level);

            case json::value_t::binary:
            case json::value_t::discarded:
                break;
        }
        throw MalformedExpressionError("Unsupported JSON value in expression");
    }

    static ExpressionPtr parse_object(const json& j, size_t level) {
        if (j.size() != 1) {
            throw MalformedExpressionError(
                "Expression object must have exactly one operator key, found " +
                std::to_string(j.size()));
        }

        auto it = j.begin();
        const std::string& key = it.key();
        const json& arg = it.value();

        if (key == "var") {
            return parse_var(arg, level);
        }

        std::vector<ExpressionPtr> args;
        if (arg.is_array()) {
            args.reserve(arg.size());
            for (const auto& item : arg) {
                args.push_back(parse_node(item, level + 1));
            }
        } else {
            // {"!": x} is shorthand for {"!": [x]}
            args.push_back(parse_node(arg, level + 1));
        }
        return operation(key, std::move(args));
    }

    static std::string var_path(const json& p) {
        if (p.is_null()) return "";
        if (p.is_string()) return p.get<std::string>();
        if (p.is_number_integer() || p.is_number_unsigned()) return p.dump();
        throw MalformedExpressionError("var path must be a string or an integer index, got " +
                                       std::string(p.type_name()));
    }

    static ExpressionPtr parse_var(const json& arg, size_t level) {
        if (!arg.is_array()) {
            return var(var_path(arg));
        }
        if (arg.empty()) {
            return var("");
        }
        if (arg.size() > 2) {
            throw MalformedExpressionError("var takes a path and an optional default, got " +
                                           std::to_string(arg.size()) + " arguments");
        }
        ExpressionPtr default_value = arg.size() == 2 ? parse_node(arg[1], level + 1) : nullptr;
        return var(var_path(arg[0]), std::move(default_value));
    }
};

// Operators the evaluator implements natively
inline const std::vector<std::string>& standard_operators() {
    static const std::vector<std::string> ops = {
        "var", "missing", "missing_some",
        "if", "?:",
        "==", "===", "!=", "!==", ">", ">=", "<", "<=",
        "!", "!!", "not", "and", "or",
        "+", "-", "*", "/", "%", "min", "max",
        "in", "cat", "substr", "merge",
        "map", "filter", "reduce", "all", "none", "some",
    };
    return ops;
}

inline bool is_standard_operator(const std::string& op) {
    const auto& ops = standard_operators();
    return std::find(ops.begin(), ops.end(), op) != ops.end();
}

} // namespace sigil
