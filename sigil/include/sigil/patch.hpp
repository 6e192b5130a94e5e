#pragma once
// Patch engine: RFC 6902 operations over entity documents
//
// An entity document is a JSON object whose "variables" member holds the
// entity's VariableState. Effects address variables as /variables/<name>/...
//
// apply() is atomic per call: operations run in order against a working
// copy, and the caller's document is only replaced when every one succeeds.

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sigil {

using json = nlohmann::json;

struct PatchOp {
    enum class Kind : uint8_t { Add, Remove, Replace, Copy, Move, Test };

    Kind kind = Kind::Add;
    std::string path;
    std::optional<json> value;
    std::optional<std::string> from;

    static std::optional<Kind> parse_kind(const std::string& op) {
        if (op == "add") return Kind::Add;
        if (op == "remove") return Kind::Remove;
        if (op == "replace") return Kind::Replace;
        if (op == "copy") return Kind::Copy;
        if (op == "move") return Kind::Move;
        if (op == "test") return Kind::Test;
        return std::nullopt;
    }

    static const char* kind_name(Kind kind) {
        switch (kind) {
            case Kind::Add: return "add";
            case Kind::Remove: return "remove";
            case Kind::Replace: return "replace";
            case Kind::Copy: return "copy";
            case Kind::Move: return "move";
            case Kind::Test: return "test";
        }
        return "unknown";
    }

    // Throws InvalidPatchSyntaxError naming the operation index
    static PatchOp from_json(const json& j, size_t index) {
        auto fail = [index](const std::string& what) {
            return InvalidPatchSyntaxError("Operation " + std::to_string(index) + ": " + what);
        };
        if (!j.is_object()) throw fail("must be an object");
        if (!j.contains("op") || !j["op"].is_string()) throw fail("missing \"op\" field");

        auto kind = parse_kind(j["op"].get<std::string>());
        if (!kind) throw fail("unknown operation \"" + j["op"].get<std::string>() + "\"");
        if (!j.contains("path") || !j["path"].is_string()) throw fail("missing \"path\" field");

        PatchOp op;
        op.kind = *kind;
        op.path = j["path"].get<std::string>();

        if (op.kind == Kind::Add || op.kind == Kind::Replace || op.kind == Kind::Test) {
            if (!j.contains("value")) throw fail(std::string(kind_name(op.kind)) + " requires \"value\"");
            op.value = j["value"];
        }
        if (op.kind == Kind::Copy || op.kind == Kind::Move) {
            if (!j.contains("from") || !j["from"].is_string()) {
                throw fail(std::string(kind_name(op.kind)) + " requires \"from\"");
            }
            op.from = j["from"].get<std::string>();
        }
        return op;
    }

    json to_json() const {
        json j = {{"op", kind_name(kind)}, {"path", path}};
        if (value) j["value"] = *value;
        if (from) j["from"] = *from;
        return j;
    }
};

struct ValidationResult {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    json to_json() const {
        return {{"valid", valid}, {"errors", errors}, {"warnings", warnings}};
    }
};

// Variable-level changes plus the top-level document fields that moved
struct Diff {
    json added = json::object();      // name -> new value
    json modified = json::object();   // name -> {old, new}
    std::vector<std::string> removed;
    std::vector<std::string> changed_fields;

    bool empty() const {
        return added.empty() && modified.empty() && removed.empty() && changed_fields.empty();
    }

    json to_json() const {
        return {
            {"added", added},
            {"modified", modified},
            {"removed", removed},
            {"changedFields", changed_fields}
        };
    }
};

struct PatchResult {
    json document;
    Diff diff;
};

struct PatchPreview {
    bool success = false;
    json before;
    json after;
    Diff diff;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    json to_json() const {
        return {
            {"success", success},
            {"before", before},
            {"after", after},
            {"diff", diff.to_json()},
            {"changedFields", diff.changed_fields},
            {"errors", errors},
            {"warnings", warnings}
        };
    }
};

class PatchEngine {
public:
    // Fields no effect may touch
    static const std::vector<std::string>& protected_fields() {
        static const std::vector<std::string> fields = {
            "id", "createdAt", "updatedAt", "deletedAt", "version"
        };
        return fields;
    }

    // Foreign keys guarded per entity type
    static std::vector<std::string> protected_fields_for(const std::string& type) {
        if (type == entity_type::SETTLEMENT) return {"campaignId", "kingdomId", "locationId"};
        if (type == entity_type::STRUCTURE) return {"settlementId"};
        if (type == entity_type::KINGDOM) return {"campaignId"};
        if (type == entity_type::ENCOUNTER) return {"campaignId", "eventId"};
        if (type == entity_type::EVENT) return {"campaignId", "encounterId"};
        return {};
    }

    // Check a raw payload without touching any document. Every problem is
    // collected; nothing throws.
    ValidationResult validate(const json& payload, const std::string& type = "") const {
        ValidationResult result;
        if (!payload.is_array()) {
            result.errors.push_back("Patch must be an array of operations");
            result.valid = false;
            return result;
        }

        for (size_t i = 0; i < payload.size(); ++i) {
            const json& op = payload[i];
            const std::string at = "Operation " + std::to_string(i);

            if (!op.is_object()) {
                result.errors.push_back(at + ": must be an object");
                continue;
            }
            if (!op.contains("op") || !op["op"].is_string()) {
                result.errors.push_back(at + ": missing \"op\" field");
                continue;
            }
            const std::string name = op["op"].get<std::string>();
            auto kind = PatchOp::parse_kind(name);
            if (!kind) {
                result.errors.push_back(at + ": invalid operation type \"" + name +
                                        "\". Must be one of: add, remove, replace, copy, move, test");
                continue;
            }
            if (!op.contains("path")) {
                result.errors.push_back(at + ": missing \"path\" field");
                continue;
            }
            if (!op["path"].is_string()) {
                result.errors.push_back(at + ": \"path\" must be a string");
                continue;
            }

            if ((*kind == PatchOp::Kind::Add || *kind == PatchOp::Kind::Replace ||
                 *kind == PatchOp::Kind::Test) && !op.contains("value")) {
                result.errors.push_back(at + ": \"" + name + "\" requires a \"value\" field");
            }

            const std::string path = op["path"].get<std::string>();
            check_path(path, at, type, result);

            if (*kind == PatchOp::Kind::Copy || *kind == PatchOp::Kind::Move) {
                if (!op.contains("from")) {
                    result.errors.push_back(at + ": \"" + name + "\" requires a \"from\" field");
                } else if (!op["from"].is_string()) {
                    result.errors.push_back(at + ": \"from\" must be a string");
                } else {
                    check_path(op["from"].get<std::string>(), at + " source", type, result);
                    if (*kind == PatchOp::Kind::Move &&
                        is_proper_prefix(op["from"].get<std::string>(), path)) {
                        result.errors.push_back(at + ": cannot move a value into one of its children");
                    }
                }
            }

            for (auto it = op.begin(); it != op.end(); ++it) {
                const std::string& key = it.key();
                if (key != "op" && key != "path" && key != "value" && key != "from") {
                    result.warnings.push_back(at + ": unknown field \"" + key + "\" ignored");
                }
            }
        }

        result.valid = result.errors.empty();
        return result;
    }

    // Apply to an entity document. Throws InvalidPatchSyntaxError,
    // PatchTestFailedError or PathNotFoundError; the input is never modified.
    PatchResult apply(const json& document, const json& payload, const std::string& type = "") const {
        auto validation = validate(payload, type);
        if (!validation.valid) {
            throw InvalidPatchSyntaxError(join(validation.errors));
        }

        std::vector<PatchOp> ops;
        ops.reserve(payload.size());
        for (size_t i = 0; i < payload.size(); ++i) {
            ops.push_back(PatchOp::from_json(payload[i], i));
        }

        json working = document;
        for (size_t i = 0; i < ops.size(); ++i) {
            apply_one(working, ops[i], i);
        }

        PatchResult result;
        result.diff = diff(document, working);
        result.document = std::move(working);
        return result;
    }

    // Apply to a bare VariableState. Paths still address /variables/...
    PatchResult apply_variables(const VariableState& variables, const json& payload) const {
        json document = {{"variables", variables.is_object() ? variables : json::object()}};
        PatchResult result = apply(document, payload);
        json vars = result.document["variables"];
        result.document = std::move(vars);
        return result;
    }

    // Before / after / diff without committing anything; never throws
    PatchPreview preview(const json& document, const json& payload, const std::string& type = "") const {
        PatchPreview p;
        p.before = document;
        auto validation = validate(payload, type);
        p.warnings = validation.warnings;
        if (!validation.valid) {
            p.errors = validation.errors;
            return p;
        }
        try {
            PatchResult applied = apply(document, payload, type);
            p.after = std::move(applied.document);
            p.diff = std::move(applied.diff);
            p.success = true;
        } catch (const Error& e) {
            p.errors.push_back(std::string(e.kind_name()) + ": " + e.what());
        }
        return p;
    }

    // Variable diff between two documents, plus changed top-level fields
    static Diff diff(const json& before, const json& after) {
        Diff d;

        static const json empty = json::object();
        auto vars_of = [](const json& doc) -> const json& {
            if (doc.is_object()) {
                auto it = doc.find("variables");
                if (it != doc.end() && it->is_object()) return *it;
            }
            return empty;
        };
        const json& old_vars = vars_of(before);
        const json& new_vars = vars_of(after);

        for (auto it = new_vars.begin(); it != new_vars.end(); ++it) {
            auto prev = old_vars.find(it.key());
            if (prev == old_vars.end()) {
                d.added[it.key()] = it.value();
            } else if (*prev != it.value()) {
                d.modified[it.key()] = {{"old", *prev}, {"new", it.value()}};
            }
        }
        for (auto it = old_vars.begin(); it != old_vars.end(); ++it) {
            if (!new_vars.contains(it.key())) d.removed.push_back(it.key());
        }

        if (before.is_object() && after.is_object()) {
            std::set<std::string> keys;
            for (auto it = before.begin(); it != before.end(); ++it) keys.insert(it.key());
            for (auto it = after.begin(); it != after.end(); ++it) keys.insert(it.key());
            for (const auto& key : keys) {
                bool in_before = before.contains(key);
                bool in_after = after.contains(key);
                if (in_before != in_after || (in_before && before[key] != after[key])) {
                    d.changed_fields.push_back(key);
                }
            }
        } else if (before != after) {
            d.changed_fields.push_back("");
        }
        return d;
    }

private:
    static std::string join(const std::vector<std::string>& parts) {
        std::string out;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i) out += "; ";
            out += parts[i];
        }
        return out;
    }

    static bool is_proper_prefix(const std::string& prefix, const std::string& path) {
        return path.size() > prefix.size() &&
               path.compare(0, prefix.size(), prefix) == 0 &&
               path[prefix.size()] == '/';
    }

    static std::string unescape(const std::string& token) {
        std::string out;
        for (size_t i = 0; i < token.size(); ++i) {
            if (token[i] == '~' && i + 1 < token.size()) {
                out += token[i + 1] == '1' ? '/' : '~';
                ++i;
            } else {
                out += token[i];
            }
        }
        return out;
    }

    static bool valid_pointer(const std::string& p) {
        if (p.empty() || p[0] != '/') return false;
        for (size_t i = 0; i < p.size(); ++i) {
            if (p[i] == '~' && (i + 1 >= p.size() || (p[i + 1] != '0' && p[i + 1] != '1'))) {
                return false;
            }
        }
        return true;
    }

    static void check_path(const std::string& path, const std::string& at,
                           const std::string& type, ValidationResult& result) {
        if (path.empty() || path == "/") {
            result.errors.push_back(at + ": path cannot be empty or root");
            return;
        }
        if (!valid_pointer(path)) {
            result.errors.push_back(at + ": \"" + path + "\" is not a valid JSON pointer");
            return;
        }

        size_t end = path.find('/', 1);
        std::string top = unescape(path.substr(1, end == std::string::npos ? std::string::npos
                                                                           : end - 1));

        const auto& common = protected_fields();
        if (std::find(common.begin(), common.end(), top) != common.end()) {
            result.errors.push_back(at + ": path \"" + path + "\" is not allowed: \"" + top +
                                    "\" is a protected field");
            return;
        }
        auto per_type = protected_fields_for(type);
        if (std::find(per_type.begin(), per_type.end(), top) != per_type.end()) {
            result.errors.push_back(at + ": path \"" + path + "\" is not allowed: \"" + top +
                                    "\" is a protected field for " + type);
            return;
        }
        if (top != "variables") {
            result.warnings.push_back(at + ": path \"" + path + "\" is outside /variables/");
        }
    }

    // Array index token: "0" or digits without a leading zero
    static std::optional<size_t> array_index(const std::string& token) {
        if (token.empty() || token.find_first_not_of("0123456789") != std::string::npos) {
            return std::nullopt;
        }
        if (token.size() > 1 && token[0] == '0') return std::nullopt;
        return static_cast<size_t>(std::stoull(token));
    }

    static json& resolve(json& doc, const json::json_pointer& ptr, size_t index, const std::string& path) {
        try {
            return doc.at(ptr);
        } catch (const json::exception& e) {
            throw PathNotFoundError(index, path, e.what());
        }
    }

    static void add_at(json& doc, const std::string& path, json value, size_t index) {
        json::json_pointer ptr(path);
        const std::string last = ptr.back();
        json& parent = resolve(doc, ptr.parent_pointer(), index, path);

        if (parent.is_object()) {
            parent[last] = std::move(value);
        } else if (parent.is_array()) {
            if (last == "-") {
                parent.push_back(std::move(value));
                return;
            }
            auto idx = array_index(last);
            if (!idx || *idx > parent.size()) {
                throw PathNotFoundError(index, path, "array index out of range");
            }
            parent.insert(parent.begin() + static_cast<std::ptrdiff_t>(*idx), std::move(value));
        } else {
            throw PathNotFoundError(index, path, "parent is not a container");
        }
    }

    static void remove_at(json& doc, const std::string& path, size_t index) {
        json::json_pointer ptr(path);
        const std::string last = ptr.back();
        json& parent = resolve(doc, ptr.parent_pointer(), index, path);

        if (parent.is_object()) {
            if (parent.erase(last) == 0) throw PathNotFoundError(index, path);
        } else if (parent.is_array()) {
            auto idx = array_index(last);
            if (!idx || *idx >= parent.size()) {
                throw PathNotFoundError(index, path, "array index out of range");
            }
            parent.erase(*idx);
        } else {
            throw PathNotFoundError(index, path, "parent is not a container");
        }
    }

    static void apply_one(json& doc, const PatchOp& op, size_t index) {
        try {
            switch (op.kind) {
                case PatchOp::Kind::Add:
                    add_at(doc, op.path, *op.value, index);
                    break;
                case PatchOp::Kind::Remove:
                    remove_at(doc, op.path, index);
                    break;
                case PatchOp::Kind::Replace:
                    resolve(doc, json::json_pointer(op.path), index, op.path) = *op.value;
                    break;
                case PatchOp::Kind::Copy: {
                    json value = resolve(doc, json::json_pointer(*op.from), index, *op.from);
                    add_at(doc, op.path, std::move(value), index);
                    break;
                }
                case PatchOp::Kind::Move: {
                    if (*op.from == op.path) break;
                    json value = resolve(doc, json::json_pointer(*op.from), index, *op.from);
                    remove_at(doc, *op.from, index);
                    add_at(doc, op.path, std::move(value), index);
                    break;
                }
                case PatchOp::Kind::Test: {
                    const json& actual = resolve(doc, json::json_pointer(op.path), index, op.path);
                    if (actual != *op.value) {
                        throw PatchTestFailedError(index, op.path);
                    }
                    break;
                }
            }
        } catch (const Error&) {
            throw;
        } catch (const json::parse_error& e) {
            throw InvalidPatchSyntaxError("Operation " + std::to_string(index) + ": " + e.what());
        } catch (const json::exception& e) {
            throw PathNotFoundError(index, op.path, e.what());
        }
        log::debug("patch", "op %zu %s %s ok", index, PatchOp::kind_name(op.kind), op.path.c_str());
    }
};

} // namespace sigil
