#pragma once
// Dependency extraction: which variables an expression reads and which
// variables an effect writes
//
// Only the base segment of a path is recorded: "resources.gold" reads
// "resources", "/variables/resources/gold" writes "resources".

#include "expression.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace sigil {

using json = nlohmann::json;

class DependencyExtractor {
public:
    // Base variable names read anywhere in the tree, defaults included
    std::set<std::string> extract_reads(const Expression& expr) const {
        std::set<std::string> reads;
        walk(expr, reads);
        return reads;
    }

    // Raw wire form. Null or non-object input reads nothing; malformed
    // subtrees are walked as far as they go rather than rejected, down to
    // Expression::max_nesting levels.
    std::set<std::string> extract_reads(const json& expr) const {
        std::set<std::string> reads;
        if (!expr.is_object()) return reads;
        walk_json(expr, reads);
        return reads;
    }

    std::set<std::string> extract_reads_from_multiple(const std::vector<json>& exprs) const {
        std::set<std::string> reads;
        for (const auto& e : exprs) {
            if (e.is_object()) walk_json(e, reads);
        }
        return reads;
    }

    bool reads_variable(const json& expr, const std::string& name) const {
        return extract_reads(expr).count(name) > 0;
    }

    // Full dotted paths, in first-seen order
    std::vector<std::string> extract_variable_paths(const Expression& expr) const {
        std::vector<std::string> paths;
        std::set<std::string> seen;
        collect_paths(expr, paths, seen);
        return paths;
    }

    // Variables a payload writes: the target of add / replace / remove /
    // copy / move, plus the source of move (which it removes)
    std::set<std::string> extract_writes(const json& payload) const {
        std::set<std::string> writes;
        if (!payload.is_array()) return writes;

        for (const auto& op : payload) {
            if (!op.is_object() || !op.contains("op") || !op["op"].is_string()) continue;
            const std::string kind = op["op"].get<std::string>();

            if (kind == "add" || kind == "replace" || kind == "remove" ||
                kind == "copy" || kind == "move") {
                add_variable(op, "path", writes);
            }
            if (kind == "move") {
                add_variable(op, "from", writes);
            }
        }
        return writes;
    }

    std::set<std::string> extract_writes(const Effect& effect) const {
        return extract_writes(effect.payload);
    }

    // Variables a payload inspects: copy / move sources and test targets
    std::set<std::string> extract_patch_reads(const json& payload) const {
        std::set<std::string> reads;
        if (!payload.is_array()) return reads;

        for (const auto& op : payload) {
            if (!op.is_object() || !op.contains("op") || !op["op"].is_string()) continue;
            const std::string kind = op["op"].get<std::string>();

            if (kind == "copy" || kind == "move") {
                add_variable(op, "from", reads);
            } else if (kind == "test") {
                add_variable(op, "path", reads);
            }
        }
        return reads;
    }

    std::set<std::string> extract_patch_reads(const Effect& effect) const {
        return extract_patch_reads(effect.payload);
    }

    // "settlement.population" -> "settlement", "items.0.name" -> "items"
    static std::string base_variable(const std::string& accessor) {
        size_t dot = accessor.find('.');
        return dot == std::string::npos ? accessor : accessor.substr(0, dot);
    }

    // "/variables/a~1b/c" -> "a/b"; empty when outside /variables/
    static std::string variable_from_pointer(const std::string& pointer) {
        static const std::string prefix = "/variables/";
        if (pointer.compare(0, prefix.size(), prefix) != 0) return "";

        std::string rest = pointer.substr(prefix.size());
        size_t slash = rest.find('/');
        return unescape(slash == std::string::npos ? rest : rest.substr(0, slash));
    }

    // RFC 6901: ~1 is '/', ~0 is '~', decoded in that order
    static std::string unescape(const std::string& token) {
        std::string out;
        out.reserve(token.size());
        for (size_t i = 0; i < token.size(); ++i) {
            if (token[i] == '~' && i + 1 < token.size()) {
                if (token[i + 1] == '1') { out += '/'; ++i; continue; }
                if (token[i + 1] == '0') { out += '~'; ++i; continue; }
            }
            out += token[i];
        }
        return out;
    }

private:
    static void add_variable(const json& op, const char* key, std::set<std::string>& out) {
        if (!op.contains(key) || !op[key].is_string()) return;
        std::string name = variable_from_pointer(op[key].get<std::string>());
        if (!name.empty()) out.insert(name);
    }

    void walk(const Expression& expr, std::set<std::string>& reads) const {
        switch (expr.kind) {
            case Expression::Kind::Var: {
                std::string base = base_variable(expr.name);
                if (!base.empty()) reads.insert(base);
                if (expr.fallback) walk(*expr.fallback, reads);
                break;
            }
            case Expression::Kind::Literal:
            case Expression::Kind::Operation:
                for (const auto& child : expr.children) {
                    walk(*child, reads);
                }
                break;
        }
    }

    void walk_json(const json& node, std::set<std::string>& reads, size_t level = 1) const {
        if (level > Expression::max_nesting) return;
        if (node.is_array()) {
            for (const auto& item : node) walk_json(item, reads, level + 1);
            return;
        }
        if (!node.is_object()) return;

        for (auto it = node.begin(); it != node.end(); ++it) {
            if (it.key() == "var") {
                const json& arg = it.value();
                const json& path = arg.is_array() && !arg.empty() ? arg[0] : arg;
                if (path.is_string()) {
                    std::string base = base_variable(path.get<std::string>());
                    if (!base.empty()) reads.insert(base);
                } else if (path.is_number_integer() || path.is_number_unsigned()) {
                    reads.insert(path.dump());
                }
            }
            walk_json(it.value(), reads, level + 1);
        }
    }

    void collect_paths(const Expression& expr, std::vector<std::string>& paths,
                       std::set<std::string>& seen) const {
        if (expr.kind == Expression::Kind::Var) {
            if (!expr.name.empty() && seen.insert(expr.name).second) {
                paths.push_back(expr.name);
            }
            if (expr.fallback) collect_paths(*expr.fallback, paths, seen);
            return;
        }
        for (const auto& child : expr.children) {
            collect_paths(*child, paths, seen);
        }
    }
};

} // namespace sigil
