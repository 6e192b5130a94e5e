#pragma once
// Record sources: where conditions, effects and entity snapshots come from
//
// The engine only reads. JsonRecordSource holds a snapshot document:
//
//   {"conditions": [...], "effects": [...], "entities": [...]}
//
// SqliteRecordSource reads a campaign database once, read-only, into the
// same snapshot shape.

#include "errors.hpp"
#include "log.hpp"
#include "types.hpp"
#include "version.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <cctype>
#include <fstream>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sigil {

using json = nlohmann::json;

class RecordSource {
public:
    virtual ~RecordSource() = default;

    // Scoped listings. An empty campaign matches every campaign; records
    // without a campaign match any campaign.
    virtual std::vector<Condition> conditions(const std::string& campaign,
                                              const std::string& branch) const = 0;
    virtual std::vector<Effect> effects(const std::string& campaign,
                                        const std::string& branch) const = 0;
    virtual std::vector<EntitySnapshot> entities(const std::string& campaign,
                                                 const std::string& branch) const = 0;

    // Every effect owned by one entity, any timing
    virtual std::vector<Effect> effects_for(const EntityRef& owner) const = 0;

    virtual std::optional<Condition> condition(const std::string& id) const = 0;
    virtual std::optional<Effect> effect(const std::string& id) const = 0;
    virtual std::optional<EntitySnapshot> entity(const std::string& type,
                                                 const std::string& id) const = 0;

    virtual std::string describe() const = 0;
};

class JsonRecordSource : public RecordSource {
public:
    JsonRecordSource() = default;

    explicit JsonRecordSource(const json& snapshot) { load(snapshot); }

    static JsonRecordSource from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) throw StorageError("Cannot open snapshot " + path);
        json doc;
        try {
            in >> doc;
        } catch (const json::parse_error& e) {
            throw StorageError("Snapshot " + path + " is not valid JSON: " + e.what());
        }
        JsonRecordSource source(doc);
        source.origin_ = path;
        return source;
    }

    // Replaces the current contents. Malformed records are skipped and
    // reported through warnings().
    void load(const json& snapshot) {
        conditions_.clear();
        effects_.clear();
        entities_.clear();
        warnings_.clear();
        if (!snapshot.is_object()) {
            throw StorageError("Snapshot must be a JSON object");
        }
        auto format = snapshot.find("format");
        if (format != snapshot.end() &&
            (!format->is_number_integer() || !version::snapshot_compatible(format->get<int>()))) {
            throw StorageError("Unsupported snapshot format " + format->dump());
        }

        read_list(snapshot, "conditions", [this](const json& j) {
            conditions_.push_back(Condition::from_json(j));
        });
        read_list(snapshot, "effects", [this](const json& j) {
            effects_.push_back(Effect::from_json(j));
        });
        read_list(snapshot, "entities", [this](const json& j) {
            entities_.push_back(EntitySnapshot::from_json(j));
        });

        log::debug("source", "Loaded %zu conditions, %zu effects, %zu entities (%zu skipped)",
                   conditions_.size(), effects_.size(), entities_.size(), warnings_.size());
    }

    std::vector<Condition> conditions(const std::string& campaign,
                                      const std::string& branch) const override {
        std::vector<Condition> result;
        for (const auto& c : conditions_) {
            if (in_scope(c.campaign_id, c.branch_id, campaign, branch)) result.push_back(c);
        }
        return result;
    }

    std::vector<Effect> effects(const std::string& campaign,
                                const std::string& branch) const override {
        std::vector<Effect> result;
        for (const auto& e : effects_) {
            if (in_scope(e.campaign_id, e.branch_id, campaign, branch)) result.push_back(e);
        }
        return result;
    }

    std::vector<EntitySnapshot> entities(const std::string& campaign,
                                         const std::string& branch) const override {
        std::vector<EntitySnapshot> result;
        for (const auto& s : entities_) {
            if (in_scope(s.campaign_id, s.branch_id, campaign, branch)) result.push_back(s);
        }
        return result;
    }

    std::vector<Effect> effects_for(const EntityRef& owner) const override {
        std::vector<Effect> result;
        for (const auto& e : effects_) {
            if (e.owner() == owner) result.push_back(e);
        }
        return result;
    }

    std::optional<Condition> condition(const std::string& id) const override {
        for (const auto& c : conditions_) {
            if (c.id == id) return c;
        }
        return std::nullopt;
    }

    std::optional<Effect> effect(const std::string& id) const override {
        for (const auto& e : effects_) {
            if (e.id == id) return e;
        }
        return std::nullopt;
    }

    std::optional<EntitySnapshot> entity(const std::string& type,
                                         const std::string& id) const override {
        for (const auto& s : entities_) {
            if (s.ref.type == type && s.ref.id == id) return s;
        }
        return std::nullopt;
    }

    std::string describe() const override {
        return "json:" + (origin_.empty() ? std::string("<memory>") : origin_);
    }

    // Snapshot document with every record currently held
    json snapshot() const {
        json doc = {{"format", SIGIL_SNAPSHOT_FORMAT}, {"conditions", json::array()},
                    {"effects", json::array()}, {"entities", json::array()}};
        for (const auto& c : conditions_) doc["conditions"].push_back(c.to_json());
        for (const auto& e : effects_) doc["effects"].push_back(e.to_json());
        for (const auto& s : entities_) {
            json d = s.document;
            d["entityType"] = s.ref.type;
            doc["entities"].push_back(std::move(d));
        }
        return doc;
    }

    const std::vector<std::string>& warnings() const { return warnings_; }
    size_t condition_count() const { return conditions_.size(); }
    size_t effect_count() const { return effects_.size(); }
    size_t entity_count() const { return entities_.size(); }

protected:
    std::string origin_;
    std::vector<std::string> warnings_;

private:
    std::vector<Condition> conditions_;
    std::vector<Effect> effects_;
    std::vector<EntitySnapshot> entities_;

    static bool in_scope(const std::string& record_campaign, const std::string& record_branch,
                         const std::string& campaign, const std::string& branch) {
        if (!campaign.empty() && !record_campaign.empty() && record_campaign != campaign) return false;
        if (!branch.empty() && record_branch != branch) return false;
        return true;
    }

    void skip(const char* key, size_t index, const char* reason) {
        std::string w = std::string(key) + "[" + std::to_string(index) + "]: " + reason;
        log::warn("source", "Skipping %s", w.c_str());
        warnings_.push_back(std::move(w));
    }

    template<typename F>
    void read_list(const json& snapshot, const char* key, F&& add) {
        auto it = snapshot.find(key);
        if (it == snapshot.end() || it->is_null()) return;
        if (!it->is_array()) {
            throw StorageError(std::string("Snapshot field \"") + key + "\" must be an array");
        }
        for (size_t i = 0; i < it->size(); ++i) {
            try {
                add((*it)[i]);
            } catch (const InvalidRecordError& e) {
                skip(key, i, e.what());
            } catch (const json::exception& e) {
                skip(key, i, e.what());
            }
        }
    }
};

// Read-only view of a campaign database
class SqliteRecordSource : public JsonRecordSource {
public:
    // Entity tables and the entity type each row becomes
    static const std::vector<std::pair<const char*, const char*>>& entity_tables() {
        static const std::vector<std::pair<const char*, const char*>> tables = {
            {"Settlement", entity_type::SETTLEMENT},
            {"Structure", entity_type::STRUCTURE},
            {"Kingdom", entity_type::KINGDOM},
            {"Party", entity_type::PARTY},
            {"Character", entity_type::CHARACTER},
            {"Encounter", entity_type::ENCOUNTER},
            {"Event", entity_type::EVENT},
        };
        return tables;
    }

    explicit SqliteRecordSource(const std::string& path) {
        load(read_database(path));
        origin_ = path;
    }

    std::string describe() const override { return "sqlite:" + origin_; }

    static json read_database(const std::string& path) {
        sqlite3* db = nullptr;
        if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            throw StorageError("Cannot open database " + path + ": " + msg);
        }

        json snapshot = {{"format", SIGIL_SNAPSHOT_FORMAT}, {"conditions", json::array()}, {"effects", json::array()}, {"entities", json::array()}};
        try {
            if (table_exists(db, "FieldCondition")) {
                snapshot["conditions"] = read_table(db, "FieldCondition");
            } else {
                log::warn("source", "%s has no FieldCondition table", path.c_str());
            }
            if (table_exists(db, "Effect")) {
                snapshot["effects"] = read_table(db, "Effect");
            } else {
                log::warn("source", "%s has no Effect table", path.c_str());
            }
            for (const auto& [table, type] : entity_tables()) {
                if (!table_exists(db, table)) continue;
                for (auto& row : read_table(db, table)) {
                    row["entityType"] = type;
                    snapshot["entities"].push_back(std::move(row));
                }
            }
        } catch (const Error&) {
            sqlite3_close(db);
            throw;
        }
        sqlite3_close(db);

        log::info("source", "Read %zu conditions, %zu effects, %zu entities from %s",
                  snapshot["conditions"].size(), snapshot["effects"].size(),
                  snapshot["entities"].size(), path.c_str());
        return snapshot;
    }

private:
    static bool table_exists(sqlite3* db, const char* table) {
        const char* sql = "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr) != SQLITE_OK) return false;
        sqlite3_bind_text(stmt, 1, table, -1, SQLITE_STATIC);
        bool exists = sqlite3_step(stmt) == SQLITE_ROW;
        sqlite3_finalize(stmt);
        return exists;
    }

    // Columns stored as JSON text
    static bool is_json_column(const std::string& name) {
        static const std::set<std::string> columns = {
            "expression", "payload", "variables", "variableSchemas", "metadata"
        };
        return columns.count(name) > 0;
    }

    // isActive, isResolved, isCompleted ...
    static bool is_flag_column(const std::string& name) {
        return name.size() > 2 && name[0] == 'i' && name[1] == 's' &&
               std::isupper(static_cast<unsigned char>(name[2]));
    }

    static json column_value(sqlite3_stmt* stmt, int col, const std::string& name) {
        switch (sqlite3_column_type(stmt, col)) {
            case SQLITE_NULL:
                return json();
            case SQLITE_INTEGER: {
                sqlite3_int64 v = sqlite3_column_int64(stmt, col);
                if (is_flag_column(name)) return v != 0;
                return static_cast<int64_t>(v);
            }
            case SQLITE_FLOAT:
                return sqlite3_column_double(stmt, col);
            case SQLITE_TEXT: {
                std::string text(reinterpret_cast<const char*>(sqlite3_column_text(stmt, col)),
                                 static_cast<size_t>(sqlite3_column_bytes(stmt, col)));
                if (is_json_column(name)) {
                    try {
                        return json::parse(text);
                    } catch (const json::parse_error& e) {
                        log::warn("source", "Column %s holds invalid JSON: %s", name.c_str(), e.what());
                        return text;
                    }
                }
                if (is_flag_column(name)) return text == "true" || text == "1";
                return text;
            }
            default:
                return json();
        }
    }

    // Every live row (deletedAt unset) as a JSON object keyed by column
    static json read_table(sqlite3* db, const char* table) {
        std::string sql = std::string("SELECT * FROM \"") + table + "\"";
        sqlite3_stmt* stmt;
        if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
            throw StorageError(std::string("Error preparing ") + table + " query: " + sqlite3_errmsg(db));
        }

        json rows = json::array();
        int columns = sqlite3_column_count(stmt);
        int rc;
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            json row = json::object();
            for (int col = 0; col < columns; ++col) {
                std::string name = sqlite3_column_name(stmt, col);
                row[name] = column_value(stmt, col, name);
            }
            if (row.contains("deletedAt") && !row["deletedAt"].is_null()) continue;
            rows.push_back(std::move(row));
        }
        sqlite3_finalize(stmt);

        if (rc != SQLITE_DONE) {
            throw StorageError(std::string("Error reading ") + table + ": " + sqlite3_errmsg(db));
        }
        return rows;
    }
};

} // namespace sigil
