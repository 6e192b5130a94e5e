#pragma once
// Engine configuration
//
// Layered: defaults, then SIGIL_* environment variables, then command-line
// flags. Each layer overrides only what it sets.

#include "log.hpp"
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <string>

namespace sigil {

enum class SourceKind : uint8_t {
    Json = 0,
    Sqlite = 1,
};

inline const char* to_string(SourceKind kind) {
    switch (kind) {
        case SourceKind::Json: return "json";
        case SourceKind::Sqlite: return "sqlite";
    }
    return "unknown";
}

struct EngineConfig {
    std::string source_path;                 // Snapshot file (JSON or SQLite)
    SourceKind source_kind = SourceKind::Json;
    bool source_kind_explicit = false;       // Otherwise inferred from extension
    std::string default_campaign;            // Used when a call names none
    std::string default_branch = "main";
    size_t max_expression_depth = 10;        // validate_expression limit
    bool refuse_cyclic_writes = false;       // Pipeline refuses effects on write loops
    bool link_write_chains = true;           // Graph adds EFFECT -> EFFECT edges
    log::Level log_level = log::Level::Warn;

    // ".db" / ".sqlite" / ".sqlite3" mean SQLite; anything else JSON
    static SourceKind infer_kind(const std::string& path) {
        auto ends_with = [&](const char* suffix) {
            size_t n = std::strlen(suffix);
            return path.size() >= n && path.compare(path.size() - n, n, suffix) == 0;
        };
        if (ends_with(".db") || ends_with(".sqlite") || ends_with(".sqlite3")) {
            return SourceKind::Sqlite;
        }
        return SourceKind::Json;
    }

    void resolve_kind() {
        if (!source_kind_explicit && !source_path.empty()) {
            source_kind = infer_kind(source_path);
        }
    }

    void apply_environment() {
        if (const char* v = std::getenv("SIGIL_SOURCE")) source_path = v;
        if (const char* v = std::getenv("SIGIL_SOURCE_KIND")) set_kind(v);
        if (const char* v = std::getenv("SIGIL_CAMPAIGN")) default_campaign = v;
        if (const char* v = std::getenv("SIGIL_BRANCH")) default_branch = v;
        if (const char* v = std::getenv("SIGIL_MAX_DEPTH")) {
            long depth = std::strtol(v, nullptr, 10);
            if (depth > 0) max_expression_depth = static_cast<size_t>(depth);
        }
        if (const char* v = std::getenv("SIGIL_REFUSE_CYCLIC_WRITES")) refuse_cyclic_writes = flag(v);
        if (const char* v = std::getenv("SIGIL_LINK_WRITE_CHAINS")) link_write_chains = flag(v);
        if (const char* v = std::getenv("SIGIL_LOG_LEVEL")) log_level = log::parse_level(v, log_level);
        resolve_kind();
    }

    // Consumes the flags it knows and compacts the rest to the front of
    // argv. Returns the new argc.
    int apply_args(int argc, char* argv[]) {
        int out = 1;
        for (int i = 1; i < argc; ++i) {
            const char* arg = argv[i];
            bool has_value = i + 1 < argc;
            if (std::strcmp(arg, "--source") == 0 && has_value) {
                source_path = argv[++i];
            } else if (std::strcmp(arg, "--source-kind") == 0 && has_value) {
                set_kind(argv[++i]);
            } else if (std::strcmp(arg, "--campaign") == 0 && has_value) {
                default_campaign = argv[++i];
            } else if (std::strcmp(arg, "--branch") == 0 && has_value) {
                default_branch = argv[++i];
            } else if (std::strcmp(arg, "--max-depth") == 0 && has_value) {
                long depth = std::strtol(argv[++i], nullptr, 10);
                if (depth > 0) max_expression_depth = static_cast<size_t>(depth);
            } else if (std::strcmp(arg, "--refuse-cyclic-writes") == 0) {
                refuse_cyclic_writes = true;
            } else if (std::strcmp(arg, "--no-write-chains") == 0) {
                link_write_chains = false;
            } else if (std::strcmp(arg, "--log-level") == 0 && has_value) {
                log_level = log::parse_level(argv[++i], log_level);
            } else if (std::strcmp(arg, "-v") == 0 || std::strcmp(arg, "--verbose") == 0) {
                log_level = log::Level::Debug;
            } else {
                argv[out++] = argv[i];
            }
        }
        resolve_kind();
        return out;
    }

    static EngineConfig from_environment() {
        EngineConfig config;
        config.apply_environment();
        return config;
    }

private:
    static bool flag(const char* v) {
        return std::strcmp(v, "1") == 0 || std::strcmp(v, "true") == 0 ||
               std::strcmp(v, "yes") == 0 || std::strcmp(v, "on") == 0;
    }

    void set_kind(const char* v) {
        if (std::strcmp(v, "sqlite") == 0) {
            source_kind = SourceKind::Sqlite;
            source_kind_explicit = true;
        } else if (std::strcmp(v, "json") == 0) {
            source_kind = SourceKind::Json;
            source_kind_explicit = true;
        } else {
            log::warn("config", "Unknown source kind '%s', keeping %s", v, to_string(source_kind));
        }
    }
};

} // namespace sigil
