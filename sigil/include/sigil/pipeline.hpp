#pragma once
// Resolution pipeline: PRE -> core action -> ON_RESOLVE -> POST
//
// Each phase picks the entity's active effects with that timing, orders
// them by descending priority (ties keep record order) and applies them one
// at a time, each seeing the previous one's output. An effect failing is
// recorded in its phase summary and the phase carries on. Only the core
// action failing is fatal.

#include "errors.hpp"
#include "evaluator.hpp"
#include "expression.hpp"
#include "log.hpp"
#include "patch.hpp"
#include "types.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace sigil {

enum class Phase : uint8_t {
    Pre = 0,
    OnResolve = 1,
    Post = 2,
};

inline const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::Pre: return "PRE";
        case Phase::OnResolve: return "ON_RESOLVE";
        case Phase::Post: return "POST";
    }
    return "UNKNOWN";
}

inline EffectTiming timing_of(Phase phase) {
    switch (phase) {
        case Phase::Pre: return EffectTiming::Pre;
        case Phase::OnResolve: return EffectTiming::OnResolve;
        case Phase::Post: return EffectTiming::Post;
    }
    return EffectTiming::OnResolve;
}

enum class PhaseStatus : uint8_t {
    Empty = 0,                  // Nothing to run
    Completed = 1,              // No failures
    CompletedWithWarnings = 2,  // Some failed, some succeeded
    Failed = 3,                 // Every attempted effect failed
};

inline const char* to_string(PhaseStatus status) {
    switch (status) {
        case PhaseStatus::Empty: return "EMPTY";
        case PhaseStatus::Completed: return "COMPLETED";
        case PhaseStatus::CompletedWithWarnings: return "COMPLETED_WITH_WARNINGS";
        case PhaseStatus::Failed: return "FAILED";
    }
    return "UNKNOWN";
}

struct EffectError {
    std::string effect_id;
    std::string message;
    std::string kind;

    json to_json() const {
        return {{"effectId", effect_id}, {"message", message}, {"kind", kind}};
    }
};

// What happened to one effect
struct EffectOutcome {
    enum class Status : uint8_t { Applied, Skipped, Failed };

    std::string effect_id;
    std::string name;
    int priority = 0;
    Status status = Status::Applied;
    Diff diff;
    json guard_value;           // null when unguarded
    std::string error;
    std::string error_kind;

    static const char* status_name(Status s) {
        switch (s) {
            case Status::Applied: return "APPLIED";
            case Status::Skipped: return "SKIPPED";
            case Status::Failed: return "FAILED";
        }
        return "UNKNOWN";
    }

    json to_json() const {
        json j = {
            {"effectId", effect_id},
            {"name", name},
            {"priority", priority},
            {"status", status_name(status)},
            {"guard", guard_value}
        };
        if (status == Status::Applied) j["diff"] = diff.to_json();
        if (!error.empty()) {
            j["error"] = error;
            j["errorKind"] = error_kind;
        }
        return j;
    }
};

struct EffectExecutionSummary {
    Phase phase = Phase::Pre;
    size_t total = 0;
    size_t succeeded = 0;
    size_t failed = 0;
    size_t skipped = 0;
    std::vector<EffectError> errors;
    std::vector<EffectOutcome> results;
    std::vector<std::string> execution_order;

    PhaseStatus status() const {
        if (total == 0) return PhaseStatus::Empty;
        if (failed == 0) return PhaseStatus::Completed;
        return succeeded > 0 ? PhaseStatus::CompletedWithWarnings : PhaseStatus::Failed;
    }

    json to_json() const {
        json errs = json::array();
        for (const auto& e : errors) errs.push_back(e.to_json());
        json res = json::array();
        for (const auto& r : results) res.push_back(r.to_json());
        return {
            {"phase", to_string(phase)},
            {"total", total},
            {"succeeded", succeeded},
            {"failed", failed},
            {"skipped", skipped},
            {"errors", errs},
            {"results", res},
            {"executionOrder", execution_order},
            {"status", to_string(status())}
        };
    }
};

struct ResolutionResult {
    bool ok = true;
    std::string error;
    std::string error_kind;
    EntitySnapshot entity;
    std::array<EffectExecutionSummary, 3> phases;
    std::array<bool, 3> ran{{false, false, false}};

    ResolutionResult() {
        phases[0].phase = Phase::Pre;
        phases[1].phase = Phase::OnResolve;
        phases[2].phase = Phase::Post;
    }

    const EffectExecutionSummary& pre() const { return phases[0]; }
    const EffectExecutionSummary& on_resolve() const { return phases[1]; }
    const EffectExecutionSummary& post() const { return phases[2]; }

    const EffectExecutionSummary& summary(Phase phase) const {
        return phases[static_cast<size_t>(phase)];
    }

    json to_json() const {
        auto phase_json = [this](size_t i) {
            return ran[i] ? phases[i].to_json() : json();
        };
        json j = {
            {"ok", ok},
            {"entity", entity.document},
            {"pre", phase_json(0)},
            {"onResolve", phase_json(1)},
            {"post", phase_json(2)}
        };
        if (!ok) {
            j["error"] = error;
            j["errorKind"] = error_kind;
        }
        return j;
    }
};

// The state change that marks the entity resolved. Throws to abort.
using CoreAction = std::function<void(EntitySnapshot&)>;

struct PipelineOptions {
    bool refuse_cyclic_writes = false;
    json extra_context = json::object();   // Merged into every guard context
};

namespace detail {

inline std::string utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    char out[40];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms.count()));
    return out;
}

inline void bump_version(json& doc) {
    auto it = doc.find("version");
    if (it != doc.end() && it->is_number_integer()) {
        *it = it->get<int64_t>() + 1;
    }
}

inline std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace detail

class Pipeline {
public:
    Pipeline(const Evaluator& evaluator, const PatchEngine& patch, PipelineOptions options = {})
        : evaluator_(evaluator), patch_(patch), options_(std::move(options)) {}

    // Encounter: refuses a second resolution, then sets isResolved / resolvedAt
    static CoreAction resolve_encounter_action() {
        return [](EntitySnapshot& entity) {
            json& doc = entity.document;
            if (logic::truthy(doc.value("isResolved", json(false)))) {
                throw ResolutionFailedError("Encounter with ID " + entity.ref.id + " is already resolved");
            }
            doc["isResolved"] = true;
            doc["resolvedAt"] = detail::utc_timestamp();
            detail::bump_version(doc);
        };
    }

    // Event: refuses a second completion, then sets isCompleted and stamps
    // occurredAt when the event has none
    static CoreAction complete_event_action() {
        return [](EntitySnapshot& entity) {
            json& doc = entity.document;
            if (logic::truthy(doc.value("isCompleted", json(false)))) {
                throw ResolutionFailedError("Event with ID " + entity.ref.id + " is already completed");
            }
            doc["isCompleted"] = true;
            if (!doc.contains("occurredAt") || doc["occurredAt"].is_null()) {
                doc["occurredAt"] = detail::utc_timestamp();
            }
            detail::bump_version(doc);
        };
    }

    // Run all phases. cyclic names effects on a write feedback loop; they
    // are refused when refuse_cyclic_writes is set.
    ResolutionResult resolve(const EntitySnapshot& entity,
                             const std::vector<Effect>& effects,
                             const std::vector<Condition>& conditions,
                             const CoreAction& action,
                             const std::set<std::string>& cyclic = {}) const {
        ResolutionResult result;
        std::map<std::string, const Condition*> guards;
        for (const auto& c : conditions) guards[c.id] = &c;

        EntitySnapshot working = entity;

        result.phases[0] = run_phase(Phase::Pre, working, effects, guards, cyclic);
        result.ran[0] = true;

        try {
            action(working);
        } catch (const Error& e) {
            log::warn("pipeline", "Resolution of %s failed: %s", entity.ref.key().c_str(), e.what());
            result.ok = false;
            result.error = e.what();
            result.error_kind = e.kind_name();
            result.entity = entity;
            return result;
        } catch (const std::exception& e) {
            log::warn("pipeline", "Resolution of %s failed: %s", entity.ref.key().c_str(), e.what());
            result.ok = false;
            result.error = e.what();
            result.error_kind = to_string(ErrorKind::ResolutionFailed);
            result.entity = entity;
            return result;
        }

        result.phases[1] = run_phase(Phase::OnResolve, working, effects, guards, cyclic);
        result.ran[1] = true;
        result.phases[2] = run_phase(Phase::Post, working, effects, guards, cyclic);
        result.ran[2] = true;

        result.entity = std::move(working);
        log::info("pipeline", "Resolved %s: pre %s, on_resolve %s, post %s",
                  entity.ref.key().c_str(), to_string(result.pre().status()),
                  to_string(result.on_resolve().status()), to_string(result.post().status()));
        return result;
    }

    // One phase against the entity, which is updated in place
    EffectExecutionSummary run_phase(Phase phase, EntitySnapshot& entity,
                                     const std::vector<Effect>& effects,
                                     const std::map<std::string, const Condition*>& guards,
                                     const std::set<std::string>& cyclic = {}) const {
        EffectExecutionSummary summary;
        summary.phase = phase;

        auto selected = select(effects, entity.ref, timing_of(phase));
        summary.total = selected.size();

        for (const Effect* effect : selected) {
            summary.execution_order.push_back(effect->id);
            EffectOutcome outcome = run_effect(*effect, entity, guards, cyclic);

            switch (outcome.status) {
                case EffectOutcome::Status::Applied:
                    summary.succeeded++;
                    break;
                case EffectOutcome::Status::Skipped:
                    summary.skipped++;
                    break;
                case EffectOutcome::Status::Failed:
                    summary.failed++;
                    summary.errors.push_back({effect->id, outcome.error, outcome.error_kind});
                    break;
            }
            summary.results.push_back(std::move(outcome));
        }

        if (summary.total > 0) {
            log::debug("pipeline", "%s %s: %zu total, %zu applied, %zu skipped, %zu failed",
                       entity.ref.key().c_str(), to_string(phase), summary.total,
                       summary.succeeded, summary.skipped, summary.failed);
        }
        return summary;
    }

    // Active effects owned by ref with the given timing, in execution order
    static std::vector<const Effect*> select(const std::vector<Effect>& effects,
                                             const EntityRef& ref, EffectTiming timing) {
        std::vector<const Effect*> selected;
        for (const auto& e : effects) {
            if (e.is_active && e.timing == timing && e.entity_type == ref.type && e.entity_id == ref.id) {
                selected.push_back(&e);
            }
        }
        std::stable_sort(selected.begin(), selected.end(),
                         [](const Effect* a, const Effect* b) { return a->priority > b->priority; });
        return selected;
    }

    // Guard evaluation context: the entity's variables at the top level,
    // the whole document under its lowercase type, then extra_context
    json guard_context(const EntitySnapshot& entity) const {
        json ctx = entity.variables();
        ctx[detail::lowercase(entity.ref.type)] = entity.document;
        if (options_.extra_context.is_object()) {
            for (auto it = options_.extra_context.begin(); it != options_.extra_context.end(); ++it) {
                ctx[it.key()] = it.value();
            }
        }
        return ctx;
    }

    const PipelineOptions& options() const { return options_; }

private:
    const Evaluator& evaluator_;
    const PatchEngine& patch_;
    PipelineOptions options_;

    EffectOutcome fail(EffectOutcome outcome, const std::string& kind, const std::string& message) const {
        outcome.status = EffectOutcome::Status::Failed;
        outcome.error = message;
        outcome.error_kind = kind;
        log::warn("pipeline", "Effect %s failed: %s", outcome.effect_id.c_str(), message.c_str());
        return outcome;
    }

    EffectOutcome run_effect(const Effect& effect, EntitySnapshot& entity,
                             const std::map<std::string, const Condition*>& guards,
                             const std::set<std::string>& cyclic) const {
        EffectOutcome outcome;
        outcome.effect_id = effect.id;
        outcome.name = effect.name;
        outcome.priority = effect.priority;

        if (options_.refuse_cyclic_writes && cyclic.count(effect.id)) {
            return fail(std::move(outcome), to_string(ErrorKind::ResolutionFailed),
                        "Effect " + effect.id + " is part of a cyclic write chain");
        }

        if (effect.condition_id) {
            auto it = guards.find(*effect.condition_id);
            if (it == guards.end()) {
                return fail(std::move(outcome), to_string(ErrorKind::RecordNotFound),
                            "Guard condition " + *effect.condition_id + " not found");
            }
            const Condition& guard = *it->second;
            if (guard.is_active) {
                try {
                    auto expr = Expression::parse(guard.expression);
                    outcome.guard_value = evaluator_.value_of(*expr, guard_context(entity));
                } catch (const Error& e) {
                    // Fail closed
                    return fail(std::move(outcome), e.kind_name(),
                                "Guard " + guard.id + ": " + e.what());
                }
                if (!logic::truthy(outcome.guard_value)) {
                    outcome.status = EffectOutcome::Status::Skipped;
                    return outcome;
                }
            }
        }

        try {
            PatchResult applied = patch_.apply(entity.document, effect.payload, entity.ref.type);
            entity.document = std::move(applied.document);
            outcome.diff = std::move(applied.diff);
            outcome.status = EffectOutcome::Status::Applied;
        } catch (const Error& e) {
            return fail(std::move(outcome), e.kind_name(), e.what());
        }
        return outcome;
    }
};

} // namespace sigil
