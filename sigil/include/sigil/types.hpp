#pragma once
// Core types: the records the engine consumes
//
// Conditions gate behavior, Effects mutate variables, entities own both.
// Records arrive from outside (JSON snapshot, SQLite snapshot, API layer)
// and are read-only to the engine.

#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace sigil {

using json = nlohmann::json;

// Variable name -> JSON value, owned per entity instance.
// Mutated only through the patch engine.
using VariableState = json;

// Timing phase of an effect during resolution
enum class EffectTiming : uint8_t {
    Pre = 0,
    OnResolve = 1,
    Post = 2,
};

inline const char* to_string(EffectTiming timing) {
    switch (timing) {
        case EffectTiming::Pre: return "PRE";
        case EffectTiming::OnResolve: return "ON_RESOLVE";
        case EffectTiming::Post: return "POST";
    }
    return "UNKNOWN";
}

inline std::optional<EffectTiming> parse_timing(const std::string& s) {
    if (s == "PRE") return EffectTiming::Pre;
    if (s == "ON_RESOLVE") return EffectTiming::OnResolve;
    if (s == "POST") return EffectTiming::Post;
    return std::nullopt;
}

// Entity types carried by the campaign model
namespace entity_type {
    constexpr const char* SETTLEMENT = "SETTLEMENT";
    constexpr const char* STRUCTURE = "STRUCTURE";
    constexpr const char* KINGDOM = "KINGDOM";
    constexpr const char* PARTY = "PARTY";
    constexpr const char* CHARACTER = "CHARACTER";
    constexpr const char* ENCOUNTER = "ENCOUNTER";
    constexpr const char* EVENT = "EVENT";
}

// Reference to an entity instance, or to every instance of a type
// when id is empty
struct EntityRef {
    std::string type;
    std::string id;

    bool type_level() const { return id.empty(); }

    // "ENCOUNTER:e1" or "SETTLEMENT:*" for type-level references
    std::string key() const {
        return type + ":" + (id.empty() ? "*" : id);
    }

    bool operator==(const EntityRef& other) const {
        return type == other.type && id == other.id;
    }
    bool operator!=(const EntityRef& other) const { return !(*this == other); }
    bool operator<(const EntityRef& other) const {
        return type < other.type || (type == other.type && id < other.id);
    }
};

namespace detail {

inline std::string required_string(const json& j, const char* key, const char* record) {
    if (!j.contains(key) || !j[key].is_string()) {
        throw InvalidRecordError(std::string(record) + " missing string field \"" + key + "\"");
    }
    return j[key].get<std::string>();
}

inline int optional_int(const json& j, const char* key, int fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (!j[key].is_number()) {
        throw InvalidRecordError(std::string("field \"") + key + "\" must be a number");
    }
    return j[key].get<int>();
}

inline bool optional_bool(const json& j, const char* key, bool fallback) {
    if (!j.contains(key) || j[key].is_null()) return fallback;
    if (j[key].is_boolean()) return j[key].get<bool>();
    // SQLite stores booleans as integers
    if (j[key].is_number()) return j[key].get<int>() != 0;
    throw InvalidRecordError(std::string("field \"") + key + "\" must be a boolean");
}

inline std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::nullopt;
    if (!j[key].is_string()) {
        throw InvalidRecordError(std::string("field \"") + key + "\" must be a string");
    }
    return j[key].get<std::string>();
}

} // namespace detail

// A narrative condition attached to an entity field.
// entity_id empty means the condition applies to every instance of entity_type.
struct Condition {
    std::string id;
    std::string entity_type;
    std::optional<std::string> entity_id;
    std::string field;
    json expression;              // Raw expression tree, parsed on use
    std::string description;
    int priority = 0;
    bool is_active = true;
    int version = 1;
    std::string campaign_id;
    std::string branch_id = "main";

    EntityRef owner() const { return {entity_type, entity_id.value_or("")}; }

    static Condition from_json(const json& j) {
        if (!j.is_object()) throw InvalidRecordError("Condition record must be an object");
        Condition c;
        c.id = detail::required_string(j, "id", "Condition");
        c.entity_type = detail::required_string(j, "entityType", "Condition");
        c.entity_id = detail::optional_string(j, "entityId");
        c.field = detail::optional_string(j, "field").value_or("");
        c.expression = j.contains("expression") ? j["expression"] : json();
        c.description = j.contains("description") && j["description"].is_string()
            ? j["description"].get<std::string>() : "";
        c.priority = detail::optional_int(j, "priority", 0);
        c.is_active = detail::optional_bool(j, "isActive", true);
        c.version = detail::optional_int(j, "version", 1);
        c.campaign_id = detail::optional_string(j, "campaignId").value_or("");
        c.branch_id = detail::optional_string(j, "branchId").value_or("main");
        return c;
    }

    json to_json() const {
        return {
            {"id", id},
            {"entityType", entity_type},
            {"entityId", entity_id ? json(*entity_id) : json()},
            {"field", field},
            {"expression", expression},
            {"description", description},
            {"priority", priority},
            {"isActive", is_active},
            {"version", version},
            {"campaignId", campaign_id},
            {"branchId", branch_id}
        };
    }
};

// A world mutation applied when its owner resolves
struct Effect {
    std::string id;
    std::string name;
    std::string entity_type;
    std::string entity_id;
    EffectTiming timing = EffectTiming::OnResolve;
    int priority = 0;
    json payload = json::array();  // Raw RFC 6902 operation list
    bool is_active = true;
    std::optional<std::string> condition_id;  // Guard condition, if any
    std::string description;
    std::string campaign_id;
    std::string branch_id = "main";

    EntityRef owner() const { return {entity_type, entity_id}; }

    static Effect from_json(const json& j) {
        if (!j.is_object()) throw InvalidRecordError("Effect record must be an object");
        Effect e;
        e.id = detail::required_string(j, "id", "Effect");
        e.name = j.contains("name") && j["name"].is_string() ? j["name"].get<std::string>() : e.id;
        e.entity_type = detail::required_string(j, "entityType", "Effect");
        e.entity_id = detail::required_string(j, "entityId", "Effect");

        std::string timing = detail::optional_string(j, "timing").value_or("ON_RESOLVE");
        auto parsed = parse_timing(timing);
        if (!parsed) {
            throw InvalidRecordError("Effect " + e.id + " has unknown timing \"" + timing + "\"");
        }
        e.timing = *parsed;

        e.priority = detail::optional_int(j, "priority", 0);
        e.payload = j.contains("payload") ? j["payload"] : json::array();
        e.is_active = detail::optional_bool(j, "isActive", true);
        e.condition_id = detail::optional_string(j, "conditionId");
        e.description = j.contains("description") && j["description"].is_string()
            ? j["description"].get<std::string>() : "";
        e.campaign_id = detail::optional_string(j, "campaignId").value_or("");
        e.branch_id = detail::optional_string(j, "branchId").value_or("main");
        return e;
    }

    json to_json() const {
        return {
            {"id", id},
            {"name", name},
            {"entityType", entity_type},
            {"entityId", entity_id},
            {"timing", to_string(timing)},
            {"priority", priority},
            {"payload", payload},
            {"isActive", is_active},
            {"conditionId", condition_id ? json(*condition_id) : json()},
            {"description", description},
            {"campaignId", campaign_id},
            {"branchId", branch_id}
        };
    }
};

// Snapshot of one entity instance. document holds every stored field;
// its "variables" member is the entity's VariableState.
struct EntitySnapshot {
    EntityRef ref;
    std::string campaign_id;
    std::string branch_id = "main";
    json document = json::object();

    const json& variables() const {
        static const json empty = json::object();
        auto it = document.find("variables");
        return (it != document.end() && it->is_object()) ? *it : empty;
    }

    static EntitySnapshot from_json(const json& j) {
        if (!j.is_object()) throw InvalidRecordError("Entity record must be an object");
        EntitySnapshot s;
        if (j.contains("entityType") && j["entityType"].is_string()) {
            s.ref.type = j["entityType"].get<std::string>();
        } else {
            s.ref.type = detail::required_string(j, "type", "Entity");
        }
        s.ref.id = detail::required_string(j, "id", "Entity");
        s.campaign_id = detail::optional_string(j, "campaignId").value_or("");
        s.branch_id = detail::optional_string(j, "branchId").value_or("main");
        s.document = j;
        if (!s.document.contains("variables") || s.document["variables"].is_null()) {
            s.document["variables"] = json::object();
        } else if (!s.document["variables"].is_object()) {
            throw InvalidRecordError("Entity " + s.ref.key() + " variables must be an object");
        }
        return s;
    }
};

} // namespace sigil
