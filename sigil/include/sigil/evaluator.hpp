#pragma once
// Evaluator: runs condition expressions against a variable context
//
// Pure. Strict left-to-right, depth-first. and / or / if short-circuit and
// branches they skip never reach the trace. Every visited node records one
// trace step, numbered in visit order, so the API layer can explain why a
// condition came out the way it did.
//
// Coercion rules:
//   falsy:      null, false, 0, "", []
//   == / !=     JS scalar coercion (number <-> numeric string, bool -> number,
//               null equals only null). Arrays and objects: TypeMismatchError.
//   === / !==   type-strict structural equality, never throws
//   < <= > >=   strings compare lexically, otherwise numerically
//   + - * / %   numbers and fully numeric strings only
//   x / 0       null

#include "errors.hpp"
#include "expression.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace sigil {

using json = nlohmann::json;

// One node visit during evaluation
struct TraceStep {
    size_t step = 0;
    std::string operation;   // "literal", "var" or the operator name
    json input;
    json output;
    size_t span = 1;         // Steps in this node's subtree, itself included

    json to_json() const {
        return {
            {"step", step},
            {"operation", operation},
            {"input", input},
            {"output", output}
        };
    }
};

using ExecutionTrace = std::vector<TraceStep>;

inline json trace_to_json(const ExecutionTrace& trace) {
    json arr = json::array();
    for (const auto& step : trace) {
        arr.push_back(step.to_json());
    }
    return arr;
}

struct Evaluation {
    json value;
    ExecutionTrace trace;
};

// ═══════════════════════════════════════════════════════════════════════════
// Custom operators
// ═══════════════════════════════════════════════════════════════════════════

// Receives its arguments already evaluated, plus the data in scope
using OperatorFn = std::function<json(const std::vector<json>& args, const json& data)>;

struct CustomOperator {
    std::string name;
    std::string description;
    OperatorFn implementation;
};

// Named operators beyond the standard set. Owned by the caller and handed
// to each Evaluator; there is no process-wide instance.
class OperatorRegistry {
public:
    // Throws std::invalid_argument for empty names, standard operator names
    // or a missing implementation
    void add(CustomOperator op) {
        if (op.name.empty()) {
            throw std::invalid_argument("Custom operator name cannot be empty");
        }
        if (is_standard_operator(op.name)) {
            throw std::invalid_argument("Cannot override standard operator: " + op.name);
        }
        if (!op.implementation) {
            throw std::invalid_argument("Custom operator " + op.name + " has no implementation");
        }
        std::string name = op.name;
        operators_[name] = std::move(op);
    }

    bool remove(const std::string& name) {
        return operators_.erase(name) > 0;
    }

    const CustomOperator* find(const std::string& name) const {
        auto it = operators_.find(name);
        return it != operators_.end() ? &it->second : nullptr;
    }

    bool has(const std::string& name) const { return operators_.count(name) > 0; }

    std::vector<std::string> names() const {
        std::vector<std::string> result;
        result.reserve(operators_.size());
        for (const auto& [name, _] : operators_) {
            result.push_back(name);
        }
        return result;
    }

    size_t size() const { return operators_.size(); }
    bool empty() const { return operators_.empty(); }

private:
    std::map<std::string, CustomOperator> operators_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Value semantics
// ═══════════════════════════════════════════════════════════════════════════

namespace logic {

inline bool truthy(const json& v) {
    switch (v.type()) {
        case json::value_t::null: return false;
        case json::value_t::boolean: return v.get<bool>();
        case json::value_t::number_integer: return v.get<int64_t>() != 0;
        case json::value_t::number_unsigned: return v.get<uint64_t>() != 0;
        case json::value_t::number_float: {
            double d = v.get<double>();
            return d != 0.0 && !std::isnan(d);
        }
        case json::value_t::string: return !v.get_ref<const std::string&>().empty();
        case json::value_t::array: return !v.empty();
        case json::value_t::object: return true;
        case json::value_t::binary: return true;
        case json::value_t::discarded: return false;
    }
    return false;
}

inline bool is_container(const json& v) {
    return v.is_array() || v.is_object();
}

// Whole-string numeric parse; "" and whitespace-only count as 0 like JS
inline std::optional<double> parse_number(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\n\r");
    if (begin == std::string::npos) return 0.0;
    size_t end = s.find_last_not_of(" \t\n\r");
    std::string trimmed = s.substr(begin, end - begin + 1);

    const char* start = trimmed.c_str();
    char* stop = nullptr;
    double d = std::strtod(start, &stop);
    if (stop != start + trimmed.size()) return std::nullopt;
    return d;
}

// JS ToNumber over scalars; nullopt stands for NaN
inline std::optional<double> to_number(const json& v) {
    switch (v.type()) {
        case json::value_t::null: return 0.0;
        case json::value_t::boolean: return v.get<bool>() ? 1.0 : 0.0;
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float: {
            double d = v.get<double>();
            if (std::isnan(d)) return std::nullopt;
            return d;
        }
        case json::value_t::string: return parse_number(v.get_ref<const std::string&>());
        default:
            throw TypeMismatchError(std::string("Cannot convert ") + v.type_name() + " to a number");
    }
}

// Integral results stay integers so they compare and print naturally
inline json make_number(double d) {
    if (!std::isfinite(d)) return json();
    if (std::floor(d) == d &&
        d >= static_cast<double>(std::numeric_limits<int64_t>::min()) &&
        d <= static_cast<double>(std::numeric_limits<int64_t>::max())) {
        return json(static_cast<int64_t>(d));
    }
    return json(d);
}

inline std::string number_to_string(const json& v) {
    if (v.is_number_integer() || v.is_number_unsigned()) return v.dump();
    double d = v.get<double>();
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    if (std::floor(d) == d && std::fabs(d) < 1e21) {
        std::ostringstream oss;
        oss.precision(0);
        oss << std::fixed << d;
        return oss.str();
    }
    return v.dump();
}

// JS String() conversion, used by cat / substr / in
inline std::string to_js_string(const json& v) {
    switch (v.type()) {
        case json::value_t::null: return "null";
        case json::value_t::boolean: return v.get<bool>() ? "true" : "false";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
        case json::value_t::number_float:
            return number_to_string(v);
        case json::value_t::string: return v.get<std::string>();
        case json::value_t::array: {
            std::string out;
            bool first = true;
            for (const auto& item : v) {
                if (!first) out += ",";
                first = false;
                if (!item.is_null()) out += to_js_string(item);
            }
            return out;
        }
        case json::value_t::object: return "[object Object]";
        default: return "";
    }
}

inline bool strict_equals(const json& a, const json& b) {
    if (a.is_number() && b.is_number()) {
        return a.get<double>() == b.get<double>();
    }
    if (a.type() != b.type()) return false;
    return a == b;
}

inline bool loose_equals(const json& a, const json& b) {
    if (is_container(a) || is_container(b)) {
        throw TypeMismatchError(std::string("Cannot compare ") + a.type_name() + " with " +
                                b.type_name() + " using loose equality");
    }
    if (a.is_null() || b.is_null()) return a.is_null() && b.is_null();
    if (a.is_string() && b.is_string()) return a == b;
    if (a.is_boolean() && b.is_boolean()) return a == b;
    auto x = to_number(a);
    auto y = to_number(b);
    if (!x || !y) return false;
    return *x == *y;
}

// JS abstract relational comparison: returns a < b
inline bool less_than(const json& a, const json& b) {
    if (is_container(a) || is_container(b)) {
        throw TypeMismatchError(std::string("Cannot order ") + a.type_name() + " and " +
                                b.type_name());
    }
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string&>() < b.get_ref<const std::string&>();
    }
    auto x = to_number(a);
    auto y = to_number(b);
    if (!x || !y) return false;
    return *x < *y;
}

inline bool less_or_equal(const json& a, const json& b) {
    if (is_container(a) || is_container(b)) {
        throw TypeMismatchError(std::string("Cannot order ") + a.type_name() + " and " +
                                b.type_name());
    }
    if (a.is_string() && b.is_string()) {
        return a.get_ref<const std::string&>() <= b.get_ref<const std::string&>();
    }
    auto x = to_number(a);
    auto y = to_number(b);
    if (!x || !y) return false;
    return *x <= *y;
}

// Operand for + - * / % min max
inline double arithmetic_operand(const json& v, const std::string& op) {
    if (v.is_number()) return v.get<double>();
    if (v.is_string()) {
        const auto& s = v.get_ref<const std::string&>();
        if (s.find_first_not_of(" \t\n\r") != std::string::npos) {
            if (auto d = parse_number(s)) return *d;
        }
    }
    throw TypeMismatchError("Operator " + op + " expects numeric operands, got " +
                            (v.is_string() ? "\"" + v.get<std::string>() + "\"" :
                                             std::string(v.type_name())));
}

// Walk a dotted path. Numeric segments index arrays. Returns nullptr when
// any segment is missing; an explicitly stored null is returned as found.
inline const json* resolve_path(const json& data, const std::string& path) {
    const json* current = &data;
    size_t start = 0;
    while (start <= path.size()) {
        size_t dot = path.find('.', start);
        std::string segment = path.substr(start, dot == std::string::npos ? std::string::npos
                                                                          : dot - start);
        if (current->is_object()) {
            auto it = current->find(segment);
            if (it == current->end()) return nullptr;
            current = &*it;
        } else if (current->is_array()) {
            if (segment.empty() ||
                segment.find_first_not_of("0123456789") != std::string::npos) {
                return nullptr;
            }
            size_t index = std::strtoull(segment.c_str(), nullptr, 10);
            if (index >= current->size()) return nullptr;
            current = &(*current)[index];
        } else {
            return nullptr;
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return current;
}

} // namespace logic

// ═══════════════════════════════════════════════════════════════════════════
// Evaluator
// ═══════════════════════════════════════════════════════════════════════════

class Evaluator {
public:
    explicit Evaluator(const OperatorRegistry* registry = nullptr)
        : registry_(registry) {}

    // Evaluate with a full trace
    Evaluation evaluate(const Expression& expr, const json& context) const {
        Evaluation result;
        Scope scope{context, false};
        result.value = eval(expr, scope, &result.trace);
        return result;
    }

    // Evaluate, keeping whatever trace was produced when an error escapes
    json evaluate(const Expression& expr, const json& context, ExecutionTrace& trace) const {
        Scope scope{context, false};
        return eval(expr, scope, &trace);
    }

    // Evaluate without recording a trace
    json value_of(const Expression& expr, const json& context) const {
        Scope scope{context, false};
        return eval(expr, scope, nullptr);
    }

    bool test(const Expression& expr, const json& context) const {
        return logic::truthy(value_of(expr, context));
    }

    const OperatorRegistry* registry() const { return registry_; }

private:
    // Data in scope. Inside map / filter / reduce / all / none / some the
    // scope is the current element, and an empty var path names it.
    struct Scope {
        const json& data;
        bool iteration;
    };

    using Args = std::vector<ExpressionPtr>;

    const OperatorRegistry* registry_;

    json eval(const Expression& expr, const Scope& scope, ExecutionTrace* trace) const {
        size_t slot = 0;
        if (trace) {
            slot = trace->size();
            TraceStep step;
            step.step = slot;
            switch (expr.kind) {
                case Expression::Kind::Literal:
                    step.operation = "literal";
                    step.input = expr.is_array ? json::array() : expr.value;
                    break;
                case Expression::Kind::Var:
                    step.operation = "var";
                    step.input = expr.name;
                    break;
                case Expression::Kind::Operation:
                    step.operation = expr.name;
                    step.input = json::array();
                    break;
            }
            trace->push_back(std::move(step));
        }

        json result;
        switch (expr.kind) {
            case Expression::Kind::Literal:
                result = eval_literal(expr, scope, trace);
                break;
            case Expression::Kind::Var:
                result = eval_var(expr, scope, trace);
                break;
            case Expression::Kind::Operation:
                result = eval_operation(expr, scope, trace);
                break;
        }

        if (trace) {
            TraceStep& step = (*trace)[slot];
            step.span = trace->size() - slot;
            // Operations and array literals record the values their
            // direct children evaluated to
            if (expr.kind == Expression::Kind::Operation || expr.is_array) {
                for (size_t child = slot + 1; child < trace->size(); child += (*trace)[child].span) {
                    step.input.push_back((*trace)[child].output);
                }
            }
            step.output = result;
        }
        return result;
    }

    json eval_literal(const Expression& expr, const Scope& scope, ExecutionTrace* trace) const {
        if (!expr.is_array) return expr.value;
        json arr = json::array();
        for (const auto& child : expr.children) {
            arr.push_back(eval(*child, scope, trace));
        }
        return arr;
    }

    json eval_var(const Expression& expr, const Scope& scope, ExecutionTrace* trace) const {
        if (expr.name.empty()) {
            // Empty name is no reference at the root; inside an iteration
            // it is the current element
            if (scope.iteration) return scope.data;
            return json();
        }
        if (const json* found = logic::resolve_path(scope.data, expr.name)) {
            return *found;
        }
        if (expr.fallback) {
            return eval(*expr.fallback, scope, trace);
        }
        return json();
    }

    static void require_arity(const std::string& op, const Args& args, size_t min, size_t max) {
        if (args.size() < min || args.size() > max) {
            std::string expected = min == max ? std::to_string(min)
                : (max == std::numeric_limits<size_t>::max()
                       ? "at least " + std::to_string(min)
                       : std::to_string(min) + "-" + std::to_string(max));
            throw MalformedExpressionError("Operator " + op + " expects " + expected +
                                           " argument(s), got " + std::to_string(args.size()));
        }
    }

    std::vector<json> eval_all(const Args& args, const Scope& scope, ExecutionTrace* trace) const {
        std::vector<json> values;
        values.reserve(args.size());
        for (const auto& arg : args) {
            values.push_back(eval(*arg, scope, trace));
        }
        return values;
    }

    json eval_operation(const Expression& expr, const Scope& scope, ExecutionTrace* trace) const {
        static constexpr size_t ANY = std::numeric_limits<size_t>::max();
        const std::string& op = expr.name;
        const Args& args = expr.children;

        // Lazy operators: arguments evaluated on demand

        if (op == "if" || op == "?:") {
            require_arity(op, args, 1, ANY);
            size_t i = 0;
            for (; i + 1 < args.size(); i += 2) {
                if (logic::truthy(eval(*args[i], scope, trace))) {
                    return eval(*args[i + 1], scope, trace);
                }
            }
            if (i < args.size()) return eval(*args[i], scope, trace);
            return json();
        }

        if (op == "and") {
            require_arity(op, args, 1, ANY);
            json current;
            for (const auto& arg : args) {
                current = eval(*arg, scope, trace);
                if (!logic::truthy(current)) return current;
            }
            return current;
        }

        if (op == "or") {
            require_arity(op, args, 1, ANY);
            json current;
            for (const auto& arg : args) {
                current = eval(*arg, scope, trace);
                if (logic::truthy(current)) return current;
            }
            return current;
        }

        if (op == "map" || op == "filter" || op == "all" || op == "none" || op == "some") {
            require_arity(op, args, 2, 2);
            return eval_iteration(op, *args[0], *args[1], scope, trace);
        }

        if (op == "reduce") {
            require_arity(op, args, 2, 3);
            return eval_reduce(args, scope, trace);
        }

        // Eager operators: every argument evaluated left to right first

        if (op == "!" || op == "not") {
            require_arity(op, args, 1, 1);
            return !logic::truthy(eval(*args[0], scope, trace));
        }
        if (op == "!!") {
            require_arity(op, args, 1, 1);
            return logic::truthy(eval(*args[0], scope, trace));
        }

        if (op == "==" || op == "!=" || op == "===" || op == "!==") {
            require_arity(op, args, 2, 2);
            auto v = eval_all(args, scope, trace);
            if (op == "==") return logic::loose_equals(v[0], v[1]);
            if (op == "!=") return !logic::loose_equals(v[0], v[1]);
            if (op == "===") return logic::strict_equals(v[0], v[1]);
            return !logic::strict_equals(v[0], v[1]);
        }

        if (op == ">" || op == ">=") {
            require_arity(op, args, 2, 2);
            auto v = eval_all(args, scope, trace);
            return op == ">" ? logic::less_than(v[1], v[0]) : logic::less_or_equal(v[1], v[0]);
        }

        if (op == "<" || op == "<=") {
            // Three arguments form a between test: a < b < c
            require_arity(op, args, 2, 3);
            auto v = eval_all(args, scope, trace);
            auto cmp = op == "<" ? logic::less_than : logic::less_or_equal;
            if (v.size() == 2) return cmp(v[0], v[1]);
            return cmp(v[0], v[1]) && cmp(v[1], v[2]);
        }

        if (op == "+" || op == "*" || op == "-" || op == "/" || op == "%" ||
            op == "min" || op == "max") {
            return eval_arithmetic(op, eval_all(args, scope, trace));
        }

        if (op == "in") {
            require_arity(op, args, 2, 2);
            auto v = eval_all(args, scope, trace);
            return eval_in(v[0], v[1]);
        }

        if (op == "cat") {
            std::string out;
            for (const auto& v : eval_all(args, scope, trace)) {
                out += logic::to_js_string(v);
            }
            return out;
        }

        if (op == "substr") {
            require_arity(op, args, 2, 3);
            return eval_substr(eval_all(args, scope, trace));
        }

        if (op == "merge") {
            json out = json::array();
            for (const auto& v : eval_all(args, scope, trace)) {
                if (v.is_array()) {
                    for (const auto& item : v) out.push_back(item);
                } else {
                    out.push_back(v);
                }
            }
            return out;
        }

        if (op == "missing") {
            return eval_missing(eval_all(args, scope, trace), scope);
        }

        if (op == "missing_some") {
            require_arity(op, args, 2, 2);
            auto v = eval_all(args, scope, trace);
            if (!v[0].is_number()) {
                throw MalformedExpressionError("missing_some expects a required count first");
            }
            if (!v[1].is_array()) {
                throw MalformedExpressionError("missing_some expects an array of names second");
            }
            json absent = eval_missing({v[1]}, scope);
            double need = v[0].get<double>();
            double present = static_cast<double>(v[1].size() - absent.size());
            return present >= need ? json::array() : absent;
        }

        if (registry_) {
            if (const CustomOperator* custom = registry_->find(op)) {
                auto values = eval_all(args, scope, trace);
                try {
                    return custom->implementation(values, scope.data);
                } catch (const Error&) {
                    throw;
                } catch (const std::exception& e) {
                    throw TypeMismatchError("Operator " + op + " failed: " + e.what());
                }
            }
        }

        throw UnknownOperatorError(op);
    }

    json eval_iteration(const std::string& op, const Expression& source, const Expression& logic_expr,
                        const Scope& scope, ExecutionTrace* trace) const {
        json items = eval(source, scope, trace);

        if (op == "map" || op == "filter") {
            json out = json::array();
            if (!items.is_array()) return out;
            for (const auto& item : items) {
                Scope inner{item, true};
                json v = eval(logic_expr, inner, trace);
                if (op == "map") {
                    out.push_back(std::move(v));
                } else if (logic::truthy(v)) {
                    out.push_back(item);
                }
            }
            return out;
        }

        if (!items.is_array() || items.empty()) {
            // all([]) is false; none([]) is true; some([]) is false
            return op == "none";
        }

        for (const auto& item : items) {
            Scope inner{item, true};
            bool hit = logic::truthy(eval(logic_expr, inner, trace));
            if (op == "all" && !hit) return false;
            if (op == "none" && hit) return false;
            if (op == "some" && hit) return true;
        }
        return op != "some";
    }

    json eval_reduce(const Args& args, const Scope& scope, ExecutionTrace* trace) const {
        json items = eval(*args[0], scope, trace);
        json accumulator = args.size() == 3 ? eval(*args[2], scope, trace) : json();
        if (!items.is_array()) return accumulator;

        for (const auto& item : items) {
            json frame = {{"current", item}, {"accumulator", accumulator}};
            Scope inner{frame, true};
            accumulator = eval(*args[1], inner, trace);
        }
        return accumulator;
    }

    static json eval_arithmetic(const std::string& op, const std::vector<json>& v) {
        if (op == "+") {
            double sum = 0.0;
            for (const auto& x : v) sum += logic::arithmetic_operand(x, op);
            return logic::make_number(sum);
        }
        if (op == "*") {
            if (v.empty()) throw MalformedExpressionError("Operator * expects at least 1 argument(s), got 0");
            double product = 1.0;
            for (const auto& x : v) product *= logic::arithmetic_operand(x, op);
            return logic::make_number(product);
        }
        if (op == "-") {
            if (v.size() == 1) return logic::make_number(-logic::arithmetic_operand(v[0], op));
            if (v.size() != 2) {
                throw MalformedExpressionError("Operator - expects 1-2 argument(s), got " +
                                               std::to_string(v.size()));
            }
            return logic::make_number(logic::arithmetic_operand(v[0], op) -
                                      logic::arithmetic_operand(v[1], op));
        }
        if (op == "/" || op == "%") {
            if (v.size() != 2) {
                throw MalformedExpressionError("Operator " + op + " expects 2 argument(s), got " +
                                               std::to_string(v.size()));
            }
            double a = logic::arithmetic_operand(v[0], op);
            double b = logic::arithmetic_operand(v[1], op);
            if (b == 0.0) return json();
            return logic::make_number(op == "/" ? a / b : std::fmod(a, b));
        }
        // min / max
        if (v.empty()) {
            throw MalformedExpressionError("Operator " + op + " expects at least 1 argument(s), got 0");
        }
        double best = logic::arithmetic_operand(v[0], op);
        for (size_t i = 1; i < v.size(); ++i) {
            double x = logic::arithmetic_operand(v[i], op);
            best = op == "min" ? std::min(best, x) : std::max(best, x);
        }
        return logic::make_number(best);
    }

    static json eval_in(const json& needle, const json& haystack) {
        if (haystack.is_null()) return false;
        if (haystack.is_string()) {
            return haystack.get_ref<const std::string&>().find(logic::to_js_string(needle)) !=
                   std::string::npos;
        }
        if (haystack.is_array()) {
            for (const auto& item : haystack) {
                if (logic::strict_equals(item, needle)) return true;
            }
            return false;
        }
        throw TypeMismatchError(std::string("Operator in expects a string or array, got ") +
                                haystack.type_name());
    }

    static json eval_substr(const std::vector<json>& v) {
        std::string source = logic::to_js_string(v[0]);
        auto len = static_cast<int64_t>(source.size());

        auto start_num = logic::to_number(v[1]);
        auto start = static_cast<int64_t>(start_num ? *start_num : 0.0);
        if (start < 0) start = std::max<int64_t>(0, len + start);
        if (start >= len) return std::string();

        std::string tail = source.substr(static_cast<size_t>(start));
        if (v.size() < 3 || v[2].is_null()) return tail;

        auto count_num = logic::to_number(v[2]);
        auto count = static_cast<int64_t>(count_num ? *count_num : 0.0);
        if (count < 0) {
            // Negative length trims from the end
            int64_t keep = static_cast<int64_t>(tail.size()) + count;
            return keep > 0 ? tail.substr(0, static_cast<size_t>(keep)) : std::string();
        }
        return tail.substr(0, static_cast<size_t>(count));
    }

    static json eval_missing(const std::vector<json>& v, const Scope& scope) {
        json names = json::array();
        if (!v.empty() && v[0].is_array()) {
            names = v[0];
        } else {
            for (const auto& x : v) names.push_back(x);
        }

        json absent = json::array();
        for (const auto& name : names) {
            std::string path = name.is_string() ? name.get<std::string>() : logic::to_js_string(name);
            const json* found = path.empty() ? nullptr : logic::resolve_path(scope.data, path);
            if (!found || found->is_null() ||
                (found->is_string() && found->get_ref<const std::string&>().empty())) {
                absent.push_back(name);
            }
        }
        return absent;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Static validation of raw expressions
// ═══════════════════════════════════════════════════════════════════════════

struct ExpressionValidation {
    bool valid = true;
    std::vector<std::string> errors;

    json to_json() const {
        return {{"isValid", valid}, {"errors", errors}};
    }
};

namespace detail {

inline void validate_node(const json& node, const OperatorRegistry* registry, size_t depth,
                          size_t max_depth, std::set<std::string>& seen_unknown,
                          bool& depth_reported, std::vector<std::string>& errors) {
    if (depth > max_depth) {
        if (!depth_reported) {
            errors.push_back("Expression exceeds maximum depth of " + std::to_string(max_depth));
            depth_reported = true;
        }
        return;
    }

    if (node.is_array()) {
        for (const auto& item : node) {
            validate_node(item, registry, depth + 1, max_depth, seen_unknown, depth_reported, errors);
        }
        return;
    }
    if (!node.is_object()) return;

    if (node.empty()) {
        errors.push_back("Expression object must contain an operator");
        return;
    }
    if (node.size() > 1) {
        errors.push_back("Expression object must have exactly one operator key, found " +
                         std::to_string(node.size()));
    }

    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string& op = it.key();
        const json& arg = it.value();

        if (op == "var") {
            const json& path = arg.is_array() && !arg.empty() ? arg[0] : arg;
            if (!(path.is_null() || path.is_string() || path.is_number_integer() ||
                  path.is_number_unsigned() || (arg.is_array() && arg.empty()))) {
                errors.push_back("var path must be a string or an integer index");
            }
            if (arg.is_array() && arg.size() > 2) {
                errors.push_back("var takes a path and an optional default");
            }
            if (arg.is_array() && arg.size() == 2) {
                validate_node(arg[1], registry, depth + 1, max_depth, seen_unknown, depth_reported, errors);
            }
            continue;
        }

        bool known = is_standard_operator(op) || (registry && registry->has(op));
        if (!known && seen_unknown.insert(op).second) {
            errors.push_back("Unknown operator: " + op);
        }
        // The argument list itself is not a level
        if (arg.is_array()) {
            for (const auto& item : arg) {
                validate_node(item, registry, depth + 1, max_depth, seen_unknown, depth_reported, errors);
            }
        } else {
            validate_node(arg, registry, depth + 1, max_depth, seen_unknown, depth_reported, errors);
        }
    }
}

} // namespace detail

// Structural checks before an expression is stored or evaluated:
// null, empty or multi-key objects, unknown operators (reported once each),
// bad var forms, nesting deeper than max_depth.
inline ExpressionValidation validate_expression(const json& expression,
                                                const OperatorRegistry* registry = nullptr,
                                                size_t max_depth = 10) {
    ExpressionValidation result;
    if (expression.is_null()) {
        result.valid = false;
        result.errors.push_back("Expression cannot be null");
        return result;
    }

    std::set<std::string> seen_unknown;
    bool depth_reported = false;
    detail::validate_node(expression, registry, 0, max_depth, seen_unknown, depth_reported,
                          result.errors);
    result.valid = result.errors.empty();
    return result;
}

} // namespace sigil
