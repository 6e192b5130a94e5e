#include <sigil/sigil.hpp>
#include <sigil/rpc/handler.hpp>
#include <iostream>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <atomic>
#include <string>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace sigil;

static json J(const char* text) {
    return json::parse(text);
}

static json eval(const char* expr, const char* data = "{}") {
    Evaluator evaluator;
    return evaluator.value_of(*Expression::parse(J(expr)), J(data));
}

template<typename E>
static bool throws(const char* expr, const char* data = "{}") {
    try {
        eval(expr, data);
    } catch (const E&) {
        return true;
    }
    return false;
}

static Condition make_condition(const char* text) {
    return Condition::from_json(J(text));
}

static Effect make_effect(const char* text) {
    return Effect::from_json(J(text));
}

// {"!": {"!": ... true}} with the given number of operators
static json nested_not(size_t levels) {
    json root;
    json* cursor = &root;
    for (size_t i = 0; i < levels; ++i) cursor = &(*cursor)["!"];
    *cursor = true;
    return root;
}

static std::string nested_not_text(size_t levels) {
    std::string text;
    for (size_t i = 0; i < levels; ++i) text += R"({"!": )";
    text += "true";
    text += std::string(levels, '}');
    return text;
}

// ═══════════════════════════════════════════════════════════════════════════
// Expressions
// ═══════════════════════════════════════════════════════════════════════════

void test_expression_parse() {
    std::cout << "Testing Expression parse..." << std::endl;

    auto v = Expression::parse(J(R"({"var": "settlement.population"})"));
    assert(v->is_var());
    assert(v->name == "settlement.population");

    // Single argument shorthand
    auto neg = Expression::parse(J(R"({"!": true})"));
    assert(neg->is_operation());
    assert(neg->children.size() == 1);
    assert(neg->to_json() == J(R"({"!": [true]})"));

    auto with_default = Expression::parse(J(R"({"var": ["gold", 0]})"));
    assert(with_default->fallback != nullptr);
    assert(with_default->to_json() == J(R"({"var": ["gold", 0]})"));

    auto nested = Expression::parse(J(R"({"and": [{"<": [1, {"var": "x"}]}, true]})"));
    assert(nested->depth() == 3);

    bool threw = false;
    try {
        Expression::parse(J(R"({"==": [1, 1], "!=": [1, 2]})"));
    } catch (const MalformedExpressionError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Expression::parse(J(R"({"var": [1.5]})"));
    } catch (const MalformedExpressionError&) {
        threw = true;
    }
    assert(threw);

    // Nesting is capped; the leaf literal counts as a level
    assert(Expression::parse(nested_not(Expression::max_nesting - 1))->depth() == Expression::max_nesting);
    threw = false;
    try {
        Expression::parse(nested_not(Expression::max_nesting));
    } catch (const MalformedExpressionError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

void test_evaluator_arithmetic() {
    std::cout << "Testing Evaluator arithmetic..." << std::endl;

    assert(eval(R"({"+": [1, 2, 3]})") == 6);
    assert(eval(R"({"+": ["1", 2]})") == 3);
    assert(eval(R"({"+": ["1", 2]})").is_number_integer());
    assert(eval(R"({"-": [5]})") == -5);
    assert(eval(R"({"-": [10, 4]})") == 6);
    assert(eval(R"({"*": [2, "2.5"]})") == 5);
    assert(eval(R"({"/": [7, 2]})") == 3.5);
    assert(eval(R"({"/": [6, 3]})").is_number_integer());
    assert(eval(R"({"%": [7, 3]})") == 1);
    assert(eval(R"({"min": [3, 1, 2]})") == 1);
    assert(eval(R"({"max": [1, "3", 2]})") == 3);

    // Division by zero yields null rather than infinity
    assert(eval(R"({"/": [1, 0]})").is_null());
    assert(eval(R"({"%": [7, 0]})").is_null());

    assert(throws<TypeMismatchError>(R"({"+": ["abc", 1]})"));
    assert(throws<TypeMismatchError>(R"({"*": [[1], 2]})"));
    assert(throws<TypeMismatchError>(R"({"+": ["", 1]})"));
    assert(throws<MalformedExpressionError>(R"({"*": []})"));
    assert(throws<MalformedExpressionError>(R"({"/": [1, 2, 3]})"));

    std::cout << "  PASS" << std::endl;
}

void test_evaluator_comparison() {
    std::cout << "Testing Evaluator comparison..." << std::endl;

    assert(eval(R"({"==": [1, "1"]})") == true);
    assert(eval(R"({"===": [1, "1"]})") == false);
    assert(eval(R"({"===": [1, 1.0]})") == true);
    assert(eval(R"({"!=": ["a", "b"]})") == true);
    assert(eval(R"({"!==": [1, 1]})") == false);
    assert(eval(R"({"==": [null, 0]})") == false);
    assert(eval(R"({">": ["b", "a"]})") == true);
    assert(eval(R"({">=": [2, 2]})") == true);
    assert(eval(R"({"<": [1, 2, 3]})") == true);
    assert(eval(R"({"<": [1, 5, 3]})") == false);
    assert(eval(R"({"<=": [1, 1, 3]})") == true);
    assert(eval(R"({"<": ["10", 9]})") == false);

    assert(throws<TypeMismatchError>(R"({"<": [[1], 2]})"));
    assert(throws<TypeMismatchError>(R"({"!=": [{"var": "o"}, 1]})", R"({"o": {"a": 1}})"));
    assert(throws<MalformedExpressionError>(R"({"==": [1]})"));

    assert(eval(R"({"!": [[]]})") == true);
    assert(eval(R"({"!!": ["0"]})") == true);
    assert(eval(R"({"not": 0})") == true);

    std::cout << "  PASS" << std::endl;
}

void test_evaluator_logic() {
    std::cout << "Testing Evaluator logic and laziness..." << std::endl;

    assert(eval(R"({"if": [false, 1, true, 2, 3]})") == 2);
    assert(eval(R"({"if": [false, 1, false, 2, 3]})") == 3);
    assert(eval(R"({"if": [false, 1]})").is_null());
    assert(eval(R"({"?:": [true, "yes", "no"]})") == "yes");

    assert(eval(R"({"and": [1, "a", 0, 2]})") == 0);
    assert(eval(R"({"and": [1, "a"]})") == "a");
    assert(eval(R"({"or": [0, "", "x"]})") == "x");
    assert(eval(R"({"or": [0, false]})") == false);

    // Unevaluated branches never reach the unknown operator
    assert(eval(R"({"or": [true, {"bogus": []}]})") == true);
    assert(eval(R"({"and": [false, {"bogus": []}]})") == false);
    assert(eval(R"({"if": [true, 1, {"bogus": []}]})") == 1);
    assert(throws<UnknownOperatorError>(R"({"or": [false, {"bogus": []}]})"));

    std::cout << "  PASS" << std::endl;
}

void test_evaluator_data_access() {
    std::cout << "Testing Evaluator var / missing..." << std::endl;

    const char* data = R"({"a": {"b": [5, 6]}, "n": null, "s": ""})";
    assert(eval(R"({"var": "a.b.1"})", data) == 6);
    assert(eval(R"({"var": "a.c"})", data).is_null());
    assert(eval(R"({"var": ["a.c", 42]})", data) == 42);
    // A stored null is a value; the default is not used
    assert(eval(R"({"var": ["n", 1]})", data).is_null());
    assert(eval(R"({"var": 1})", "[10, 20]") == 20);
    assert(eval(R"({"var": ""})", data).is_null());

    assert(eval(R"({"missing": ["a", "x", "n", "s"]})", data) == J(R"(["x", "n", "s"])"));
    assert(eval(R"({"missing": [["a.b", "z"]]})", data) == J(R"(["z"])"));
    assert(eval(R"({"missing_some": [1, ["a", "x"]]})", data) == json::array());
    assert(eval(R"({"missing_some": [2, ["a", "x"]]})", data) == J(R"(["x"])"));

    std::cout << "  PASS" << std::endl;
}

void test_evaluator_strings_arrays() {
    std::cout << "Testing Evaluator strings and arrays..." << std::endl;

    assert(eval(R"({"in": ["Spring", "Springfield"]})") == true);
    assert(eval(R"({"in": [1, [1, 2]]})") == true);
    assert(eval(R"({"in": ["1", [1, 2]]})") == false);
    assert(eval(R"({"in": ["x", null]})") == false);
    assert(throws<TypeMismatchError>(R"({"in": ["x", 5]})"));

    assert(eval(R"({"cat": ["a", 1, null, true, 2.5]})") == "a1nulltrue2.5");
    assert(eval(R"({"substr": ["jsonlogic", 4]})") == "logic");
    assert(eval(R"({"substr": ["jsonlogic", -5]})") == "logic");
    assert(eval(R"({"substr": ["jsonlogic", 1, 3]})") == "son");
    assert(eval(R"({"substr": ["jsonlogic", 4, -2]})") == "log");
    assert(eval(R"({"merge": [[1, 2], 3, [4]]})") == J("[1, 2, 3, 4]"));

    const char* data = R"({"xs": [1, 2, 3], "people": [{"name": "Ana"}, {"name": "Bo"}]})";
    assert(eval(R"({"map": [{"var": "xs"}, {"*": [{"var": ""}, 2]}]})", data) == J("[2, 4, 6]"));
    assert(eval(R"({"map": [{"var": "people"}, {"var": "name"}]})", data) == J(R"(["Ana", "Bo"])"));
    assert(eval(R"({"filter": [{"var": "xs"}, {">": [{"var": ""}, 1]}]})", data) == J("[2, 3]"));
    assert(eval(R"({"reduce": [{"var": "xs"}, {"+": [{"var": "current"}, {"var": "accumulator"}]}, 10]})",
                data) == 16);
    assert(eval(R"({"all": [{"var": "xs"}, {">": [{"var": ""}, 0]}]})", data) == true);
    assert(eval(R"({"all": [[], true]})") == false);
    assert(eval(R"({"none": [[], true]})") == true);
    assert(eval(R"({"some": [{"var": "xs"}, {"==": [{"var": ""}, 2]}]})", data) == true);
    assert(eval(R"({"some": [{"var": "xs"}, {"==": [{"var": ""}, 9]}]})", data) == false);
    assert(eval(R"({"map": [{"var": "nothing"}, 1]})", data) == json::array());

    std::cout << "  PASS" << std::endl;
}

void test_evaluator_trace() {
    std::cout << "Testing Evaluator trace..." << std::endl;

    Evaluator evaluator;
    auto expr = Expression::parse(J(R"({"+": [1, {"var": "x"}]})"));
    Evaluation result = evaluator.evaluate(*expr, J(R"({"x": 2})"));
    assert(result.value == 3);

    // Pre-order: the parent occupies its slot before its children run
    assert(result.trace.size() == 3);
    assert(result.trace[0].step == 0);
    assert(result.trace[0].operation == "+");
    assert(result.trace[0].output == 3);
    assert(result.trace[0].input == J("[1, 2]"));
    assert(result.trace[1].operation == "literal");
    assert(result.trace[1].input == 1);
    assert(result.trace[2].operation == "var");
    assert(result.trace[2].input == "x");
    assert(result.trace[2].output == 2);
    assert(trace_to_json(result.trace)[2]["step"] == 2);

    // Short-circuit: the second argument of or is never traced
    auto lazy = Expression::parse(J(R"({"or": [true, {"var": "y"}]})"));
    auto lazy_result = evaluator.evaluate(*lazy, json::object());
    assert(lazy_result.trace.size() == 2);
    assert(lazy_result.trace[0].input == J("[true]"));

    // Each operator records its arguments' values, not its subtree
    auto deep = Expression::parse(nested_not(200));
    auto deep_result = evaluator.evaluate(*deep, json::object());
    assert(deep_result.value == true);
    assert(deep_result.trace.size() == 201);
    assert(deep_result.trace[0].input == J("[false]"));
    assert(deep_result.trace[199].input == J("[true]"));
    assert(trace_to_json(deep_result.trace).dump().size() < 30000);

    // The trace survives a failure up to the failing node
    ExecutionTrace partial;
    auto failing = Expression::parse(J(R"({"and": [true, {"bogus": [1]}]})"));
    bool threw = false;
    try {
        evaluator.evaluate(*failing, json::object(), partial);
    } catch (const UnknownOperatorError& e) {
        threw = true;
        assert(e.op() == "bogus");
    }
    assert(threw);
    assert(partial.size() == 3);
    assert(partial[2].operation == "bogus");
    assert(partial[2].output.is_null());

    std::cout << "  PASS" << std::endl;
}

void test_tags_equality_is_type_mismatch() {
    std::cout << "Testing array equality vs membership..." << std::endl;

    const char* context = R"({"settlement": {"tags": ["trade_hub"]}})";
    assert(throws<TypeMismatchError>(R"({"==": [{"var": "settlement.tags"}, "trade_hub"]})", context));
    assert(eval(R"({"in": ["trade_hub", {"var": "settlement.tags"}]})", context) == true);

    JsonRecordSource source(J(R"({
        "conditions": [{"id": "c1", "entityType": "SETTLEMENT", "field": "isHub",
                        "expression": {"==": [{"var": "settlement.tags"}, "trade_hub"]}}]
    })"));
    Engine engine(source, EngineConfig{});
    auto result = engine.evaluate_condition("c1", J(context));
    assert(!result.success);
    assert(result.error_kind == "TypeMismatchError");
    assert(result.value.is_null());
    assert(!result.trace.empty());
    assert(result.to_json()["success"] == false);

    auto reads = engine.extract_reads(J(R"({"==": [{"var": "settlement.tags"}, "trade_hub"]})"));
    assert(reads.size() == 1 && reads.count("settlement") == 1);

    std::cout << "  PASS" << std::endl;
}

void test_operator_registry() {
    std::cout << "Testing OperatorRegistry..." << std::endl;

    OperatorRegistry registry;
    registry.add({"double", "Twice the argument", [](const std::vector<json>& args, const json&) {
        return json(args.at(0).get<int64_t>() * 2);
    }});
    registry.add({"explode", "Always throws", [](const std::vector<json>&, const json&) -> json {
        throw std::runtime_error("boom");
    }});
    assert(registry.has("double"));
    assert(registry.size() == 2);

    bool threw = false;
    try {
        registry.add({"==", "", [](const std::vector<json>&, const json&) { return json(); }});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        registry.add({"empty", "", nullptr});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    Evaluator evaluator(&registry);
    auto expr = Expression::parse(J(R"({"double": [{"var": "n"}]})"));
    assert(evaluator.value_of(*expr, J(R"({"n": 21})")) == 42);

    // Foreign exceptions surface as engine errors
    threw = false;
    try {
        evaluator.value_of(*Expression::parse(J(R"({"explode": []})")), json::object());
    } catch (const TypeMismatchError&) {
        threw = true;
    }
    assert(threw);

    assert(validate_expression(J(R"({"double": [1]})"), &registry).valid);
    assert(!validate_expression(J(R"({"double": [1]})"), nullptr).valid);

    assert(registry.remove("double"));
    assert(!registry.has("double"));

    std::cout << "  PASS" << std::endl;
}

void test_validate_expression() {
    std::cout << "Testing validate_expression..." << std::endl;

    auto null_result = validate_expression(json());
    assert(!null_result.valid);
    assert(null_result.errors.size() == 1);

    auto unknown = validate_expression(J(R"({"foo": [1, {"foo": 2}, {"bar": 3}]})"));
    assert(!unknown.valid);
    assert(unknown.errors.size() == 2);
    assert(unknown.errors[0] == "Unknown operator: foo");
    assert(unknown.to_json()["isValid"] == false);

    const char* deep = R"({"!": [{"!": [{"!": [true]}]}]})";
    assert(!validate_expression(J(deep), nullptr, 2).valid);
    assert(validate_expression(J(deep), nullptr, 3).valid);
    assert(validate_expression(J(deep)).valid);

    auto shape = validate_expression(J(R"({"var": {"a": 1}})"));
    assert(!shape.valid);

    auto multi = validate_expression(J(R"({"==": [1, 1], "<": [1, 2]})"));
    assert(!multi.valid);

    assert(validate_expression(J(R"({"in": ["a", {"var": ["tags", []]}]})")).valid);
    assert(validate_expression(J("42")).valid);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Dependency extraction
// ═══════════════════════════════════════════════════════════════════════════

void test_dependency_extractor() {
    std::cout << "Testing DependencyExtractor..." << std::endl;

    DependencyExtractor ex;

    auto reads = ex.extract_reads(J(R"({"and": [
        {">": [{"var": "settlement.population"}, 100]},
        {"in": ["port", {"var": "settlement.tags"}]},
        {"var": ["kingdom.stability", {"var": "fallback"}]}
    ]})"));
    assert(reads.size() == 3);
    assert(reads.count("settlement") && reads.count("kingdom") && reads.count("fallback"));

    assert(ex.extract_reads(J(R"({"+": [1, 2]})")).empty());
    assert(ex.extract_reads(json()).empty());
    assert(ex.extract_reads(J("[1, 2]")).empty());

    auto multi = ex.extract_reads_from_multiple({J(R"({"var": "a.x"})"), J(R"({"var": "b"})"),
                                                 J(R"({"var": "a.y"})")});
    assert(multi.size() == 2);

    assert(ex.reads_variable(J(R"({"var": "gold.amount"})"), "gold"));
    assert(!ex.reads_variable(J(R"({"var": "gold.amount"})"), "gold.amount"));

    auto expr = Expression::parse(J(R"({"or": [{"var": "b.c"}, {"var": "a"}, {"var": "b.c"}]})"));
    auto paths = ex.extract_variable_paths(*expr);
    assert(paths.size() == 2);
    assert(paths[0] == "b.c" && paths[1] == "a");
    assert(ex.extract_reads(*expr).size() == 2);

    json payload = J(R"([
        {"op": "replace", "path": "/variables/gold/amount", "value": 5},
        {"op": "add", "path": "/variables/a~1b", "value": 1},
        {"op": "remove", "path": "/variables/stale"},
        {"op": "move", "from": "/variables/old", "path": "/variables/new"},
        {"op": "copy", "from": "/variables/source", "path": "/variables/target"},
        {"op": "test", "path": "/variables/checked", "value": true},
        {"op": "replace", "path": "/name", "value": "x"}
    ])");
    auto writes = ex.extract_writes(payload);
    assert(writes.size() == 6);
    assert(writes.count("gold") && writes.count("a/b") && writes.count("stale"));
    assert(writes.count("old") && writes.count("new") && writes.count("target"));
    assert(!writes.count("checked") && !writes.count("source"));

    auto patch_reads = ex.extract_patch_reads(payload);
    assert(patch_reads.size() == 3);
    assert(patch_reads.count("old") && patch_reads.count("source") && patch_reads.count("checked"));

    assert(DependencyExtractor::variable_from_pointer("/variables/x~0y/z") == "x~y");
    assert(DependencyExtractor::variable_from_pointer("/meta/x").empty());
    assert(DependencyExtractor::base_variable("items.0.name") == "items");

    // Raw trees are walked only down to the nesting cap
    json buried = J(R"({"var": "hidden"})");
    for (int i = 0; i < 10; ++i) buried = json{{"!", buried}};
    assert(ex.extract_reads(buried).count("hidden"));
    for (size_t i = 0; i < Expression::max_nesting; ++i) buried = json{{"!", buried}};
    assert(ex.extract_reads(buried).empty());

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Patches
// ═══════════════════════════════════════════════════════════════════════════

void test_patch_apply() {
    std::cout << "Testing PatchEngine apply..." << std::endl;

    PatchEngine engine;
    json doc = J(R"({"id": "s1", "name": "Port", "variables": {"gold": 10, "tags": ["a"], "old": 1}})");

    auto result = engine.apply(doc, J(R"([
        {"op": "test", "path": "/variables/gold", "value": 10},
        {"op": "replace", "path": "/variables/gold", "value": 15},
        {"op": "add", "path": "/variables/tags/-", "value": "b"},
        {"op": "add", "path": "/variables/tags/0", "value": "z"},
        {"op": "add", "path": "/variables/food", "value": 3},
        {"op": "remove", "path": "/variables/old"}
    ])"));
    assert(result.document["variables"]["gold"] == 15);
    assert(result.document["variables"]["tags"] == J(R"(["z", "a", "b"])"));
    assert(result.document["variables"]["food"] == 3);
    assert(!result.document["variables"].contains("old"));
    assert(doc["variables"]["gold"] == 10);

    assert(result.diff.added.contains("food"));
    assert(result.diff.modified["gold"]["old"] == 10);
    assert(result.diff.modified["gold"]["new"] == 15);
    assert(result.diff.modified.contains("tags"));
    assert(result.diff.removed.size() == 1 && result.diff.removed[0] == "old");
    assert(result.diff.changed_fields.size() == 1 && result.diff.changed_fields[0] == "variables");

    auto moved = engine.apply(doc, J(R"([
        {"op": "copy", "from": "/variables/gold", "path": "/variables/reserve"},
        {"op": "move", "from": "/variables/old", "path": "/variables/renamed"}
    ])"));
    assert(moved.document["variables"]["reserve"] == 10);
    assert(moved.document["variables"]["renamed"] == 1);
    assert(!moved.document["variables"].contains("old"));

    auto vars = engine.apply_variables(J(R"({"hp": 3})"),
                                       J(R"([{"op": "replace", "path": "/variables/hp", "value": 2}])"));
    assert(vars.document == J(R"({"hp": 2})"));
    assert(vars.diff.modified.contains("hp"));

    // add then remove of the same variable leaves the state as it was
    auto added = engine.apply_variables(json::object(),
                                        J(R"([{"op": "add", "path": "/variables/x", "value": 5}])"));
    assert(added.document == J(R"({"x": 5})"));
    auto removed = engine.apply_variables(added.document,
                                          J(R"([{"op": "remove", "path": "/variables/x"}])"));
    assert(removed.document == json::object());

    std::cout << "  PASS" << std::endl;
}

void test_patch_errors() {
    std::cout << "Testing PatchEngine errors and atomicity..." << std::endl;

    PatchEngine engine;
    json doc = J(R"({"id": "s1", "variables": {"gold": 10}})");

    // The failing test at index 1 discards the replace before it
    bool threw = false;
    try {
        engine.apply(doc, J(R"([
            {"op": "replace", "path": "/variables/gold", "value": 0},
            {"op": "test", "path": "/variables/gold", "value": 99}
        ])"));
    } catch (const PatchTestFailedError& e) {
        threw = true;
        assert(e.index() == 1);
    }
    assert(threw);
    assert(doc["variables"]["gold"] == 10);

    threw = false;
    try {
        engine.apply(doc, J(R"([{"op": "replace", "path": "/variables/missing", "value": 1}])"));
    } catch (const PathNotFoundError& e) {
        threw = true;
        assert(e.index() == 0);
    }
    assert(threw);

    threw = false;
    try {
        engine.apply(doc, J(R"([{"op": "remove", "path": "/variables/none/deeper"}])"));
    } catch (const PathNotFoundError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        engine.apply(doc, J(R"([{"op": "replace", "path": "/id", "value": "hijack"}])"));
    } catch (const InvalidPatchSyntaxError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        engine.apply(doc, J(R"([{"op": "jump", "path": "/variables/gold"}])"));
    } catch (const InvalidPatchSyntaxError&) {
        threw = true;
    }
    assert(threw);

    auto validation = engine.validate(J(R"([
        {"op": "replace", "path": "/kingdomId", "value": "k2"},
        {"op": "add", "path": "/variables/x"},
        {"op": "move", "from": "/variables/a", "path": "/variables/a/b"},
        {"op": "add", "path": "/", "value": 1},
        {"op": "add", "path": "/notes", "value": "n", "extra": 1}
    ])"), entity_type::SETTLEMENT);
    assert(!validation.valid);
    assert(validation.errors.size() == 4);
    assert(validation.warnings.size() == 2);

    assert(engine.validate(J(R"([{"op": "replace", "path": "/kingdomId", "value": "k2"}])"),
                           entity_type::PARTY).valid);
    assert(!engine.validate(J(R"({"op": "add"})")).valid);
    assert(!engine.validate(J(R"([{"op": "add", "path": "/variables/a~2", "value": 1}])")).valid);

    auto preview = engine.preview(doc, J(R"([{"op": "test", "path": "/variables/gold", "value": 1}])"));
    assert(!preview.success);
    assert(preview.errors.size() == 1);
    assert(preview.before == doc);

    auto ok = engine.preview(doc, J(R"([{"op": "add", "path": "/variables/food", "value": 2}])"));
    assert(ok.success);
    assert(ok.after["variables"]["food"] == 2);
    assert(ok.to_json()["diff"]["added"]["food"] == 2);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Dependency graph
// ═══════════════════════════════════════════════════════════════════════════

static DependencyNode var_node(const std::string& name) {
    DependencyNode n;
    n.id = "VARIABLE:" + name;
    n.type = NodeType::Variable;
    n.label = name;
    return n;
}

static DependencyEdge reads(const std::string& from, const std::string& to) {
    return {"VARIABLE:" + from, "VARIABLE:" + to, EdgeType::Reads, json::object()};
}

void test_graph_structure() {
    std::cout << "Testing DependencyGraph structure..." << std::endl;

    DependencyGraph g;
    assert(g.add_node(var_node("a")));
    assert(!g.add_node(var_node("a")));
    assert(g.add_node(var_node("b")));
    assert(g.add_node(var_node("c")));

    assert(g.add_edge(reads("a", "b")));
    assert(!g.add_edge(reads("a", "b")));
    assert(g.add_edge({"VARIABLE:a", "VARIABLE:b", EdgeType::Writes, json::object()}));
    assert(!g.add_edge(reads("a", "zzz")));
    assert(g.edge_count() == 2);
    assert(g.has_edge("VARIABLE:a", "VARIABLE:b", EdgeType::Writes));
    assert(g.dependencies_of("VARIABLE:a").size() == 1);
    assert(g.dependents("VARIABLE:b").size() == 1);

    assert(g.add_edge(reads("b", "c")));
    assert(g.has_path("VARIABLE:a", "VARIABLE:c"));
    assert(!g.has_path("VARIABLE:c", "VARIABLE:a"));
    assert(g.would_create_cycle("VARIABLE:c", "VARIABLE:a"));
    assert(!g.would_create_cycle("VARIABLE:a", "VARIABLE:c"));

    assert(g.remove_edge("VARIABLE:a", "VARIABLE:b", EdgeType::Writes) == 1);
    assert(g.edge_count() == 2);

    assert(g.remove_node("VARIABLE:b"));
    assert(g.node_count() == 2);
    assert(g.edge_count() == 0);
    assert(g.node("VARIABLE:c") != nullptr);
    assert(g.outgoing_edges("VARIABLE:a").empty());

    auto j = g.to_json();
    assert(j["nodes"].size() == 2);
    assert(j["stats"]["variableCount"] == 2);

    std::cout << "  PASS" << std::endl;
}

void test_graph_cycles() {
    std::cout << "Testing DependencyGraph cycles..." << std::endl;

    // Ring: a -> b -> c -> a
    DependencyGraph ring;
    for (const char* n : {"a", "b", "c", "d"}) ring.add_node(var_node(n));
    ring.add_edge(reads("a", "b"));
    ring.add_edge(reads("b", "c"));
    ring.add_edge(reads("c", "a"));
    ring.add_edge(reads("c", "d"));

    auto report = ring.detect_cycles();
    assert(report.has_cycles());
    assert(report.cycles.size() == 1);
    assert(report.cycles[0].path.size() == 4);
    assert(report.cycles[0].path.front() == report.cycles[0].path.back());
    assert(report.cycles[0].description().rfind("Cycle detected: ", 0) == 0);

    assert(ring.mark_cycles() == 3);
    assert(ring.node("VARIABLE:a")->in_cycle);
    assert(ring.node("VARIABLE:c")->in_cycle);
    assert(!ring.node("VARIABLE:d")->in_cycle);
    assert(ring.stats().cycle_node_count == 3);

    auto order = ring.topological_sort();
    assert(!order.success);
    assert(order.remaining.size() == 4);  // d waits on c
    assert(order.to_json()["error"].is_string());

    // Traversal terminates on the cycle
    auto down = ring.downstream("VARIABLE:a");
    assert(down.size() == 3);
    auto up = ring.upstream("VARIABLE:a");
    assert(up.size() == 2);

    // Self-loop
    DependencyGraph self;
    self.add_node(var_node("s"));
    self.add_edge(reads("s", "s"));
    assert(self.mark_cycles() == 1);

    // DAG: nothing flagged
    DependencyGraph dag;
    for (const char* n : {"a", "b", "c"}) dag.add_node(var_node(n));
    dag.add_edge(reads("a", "b"));
    dag.add_edge(reads("a", "c"));
    dag.add_edge(reads("b", "c"));
    assert(dag.mark_cycles() == 0);
    assert(!dag.detect_cycles().has_cycles());

    std::cout << "  PASS" << std::endl;
}

void test_graph_order_and_traversal() {
    std::cout << "Testing DependencyGraph ordering and traversal..." << std::endl;

    DependencyGraph g;
    for (const char* n : {"a", "b", "c", "d", "e"}) g.add_node(var_node(n));
    // a depends on b and c; b depends on d; e is isolated
    g.add_edge(reads("a", "b"));
    g.add_edge(reads("a", "c"));
    g.add_edge(reads("b", "d"));

    auto order = g.topological_sort();
    assert(order.success);
    assert(order.order.size() == 5);
    auto pos = [&](const std::string& name) {
        for (size_t i = 0; i < order.order.size(); ++i) {
            if (order.order[i] == "VARIABLE:" + name) return i;
        }
        return order.order.size();
    };
    assert(pos("d") < pos("b"));
    assert(pos("b") < pos("a"));
    assert(pos("c") < pos("a"));

    assert(g.downstream("VARIABLE:a").size() == 3);
    auto shallow = g.downstream("VARIABLE:a", 1);
    assert(shallow.size() == 2);
    assert(g.downstream("VARIABLE:a", 0).empty());
    auto up = g.upstream("VARIABLE:d");
    assert(up.size() == 2);
    assert(up[0] == "VARIABLE:b" && up[1] == "VARIABLE:a");
    assert(g.upstream("VARIABLE:missing").empty());

    auto sel = g.selection({"VARIABLE:b", "VARIABLE:nope"});
    assert(sel.selected.size() == 1);
    assert(sel.upstream.size() == 1 && sel.upstream[0] == "VARIABLE:a");
    assert(sel.downstream.size() == 1 && sel.downstream[0] == "VARIABLE:d");

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Graph builder and cache
// ═══════════════════════════════════════════════════════════════════════════

static std::vector<Condition> builder_conditions() {
    return {
        make_condition(R"({"id": "c1", "entityType": "SETTLEMENT", "entityId": "s1", "field": "isRich",
                           "expression": {">": [{"var": "gold"}, 100]}})"),
        make_condition(R"({"id": "c2", "entityType": "SETTLEMENT", "field": "isBusy",
                           "expression": {"and": [{"var": "traffic.level"}, {"var": "traffic.lanes"}]}})"),
        make_condition(R"({"id": "bad", "entityType": "SETTLEMENT", "field": "broken",
                           "expression": {"==": [1, 1], "<": [1, 2]}})"),
        make_condition(R"({"id": "off", "entityType": "SETTLEMENT", "field": "unused", "isActive": false,
                           "expression": {"var": "ghost"}})"),
    };
}

static std::vector<Effect> builder_effects() {
    return {
        // e1 reads gold (guard) and writes traffic
        make_effect(R"({"id": "e1", "name": "Trade", "entityType": "SETTLEMENT", "entityId": "s1",
                        "conditionId": "c1",
                        "payload": [{"op": "replace", "path": "/variables/traffic", "value": 5}]})"),
        // e2 reads traffic (test) and writes gold
        make_effect(R"({"id": "e2", "name": "Tax", "entityType": "SETTLEMENT", "entityId": "s1",
                        "payload": [{"op": "test", "path": "/variables/traffic", "value": 5},
                                    {"op": "replace", "path": "/variables/gold", "value": 0}]})"),
        make_effect(R"({"id": "e3", "name": "Orphan", "entityType": "SETTLEMENT", "entityId": "s1",
                        "conditionId": "missing",
                        "payload": [{"op": "add", "path": "/variables/x", "value": 1}]})"),
        make_effect(R"({"id": "e4", "name": "Hijack", "entityType": "SETTLEMENT", "entityId": "s1",
                        "payload": [{"op": "replace", "path": "/id", "value": "x"}]})"),
    };
}

void test_graph_builder() {
    std::cout << "Testing GraphBuilder..." << std::endl;

    std::vector<EntitySnapshot> entities = {
        EntitySnapshot::from_json(J(R"({"id": "s1", "entityType": "SETTLEMENT", "name": "Saltmarsh"})"))
    };

    GraphBuilder builder;
    auto build = builder.build(builder_conditions(), builder_effects(), entities);
    const auto& g = build.graph;

    assert(g.has_node("CONDITION:c1"));
    assert(g.has_node("CONDITION:c2"));
    assert(!g.has_node("CONDITION:bad"));
    assert(!g.has_node("CONDITION:off"));
    assert(!g.has_node("VARIABLE:ghost"));
    assert(g.has_node("EFFECT:e3"));
    assert(!g.has_node("EFFECT:e4"));
    // bad expression, unknown guard, protected path
    assert(build.warnings.size() == 3);

    assert(g.has_edge("CONDITION:c1", "VARIABLE:gold", EdgeType::Reads));
    assert(g.has_edge("CONDITION:c2", "VARIABLE:traffic", EdgeType::Reads));
    assert(g.outgoing_edges("CONDITION:c2").size() == 1);
    assert(g.has_edge("EFFECT:e1", "VARIABLE:gold", EdgeType::Reads));
    assert(g.has_edge("EFFECT:e1", "VARIABLE:traffic", EdgeType::Writes));
    assert(g.has_edge("EFFECT:e2", "VARIABLE:traffic", EdgeType::Reads));
    assert(g.has_edge("ENTITY:SETTLEMENT:s1", "EFFECT:e1", EdgeType::DependsOn));
    assert(g.has_edge("ENTITY:SETTLEMENT:*", "CONDITION:c2", EdgeType::DependsOn));
    assert(g.node("ENTITY:SETTLEMENT:s1")->label == "Saltmarsh");
    assert(g.node("CONDITION:c1")->label == "SETTLEMENT.isRich");

    // e1 reads what e2 writes and the other way round
    assert(g.has_edge("EFFECT:e1", "EFFECT:e2", EdgeType::DependsOn));
    assert(g.has_edge("EFFECT:e2", "EFFECT:e1", EdgeType::DependsOn));
    assert(g.node("EFFECT:e1")->in_cycle);
    assert(!g.node("VARIABLE:gold")->in_cycle);
    auto cyclic = GraphBuilder::cyclic_effects(g);
    assert(cyclic.size() == 2 && cyclic.count("e1") && cyclic.count("e2"));

    auto upstream_of_gold = g.upstream("VARIABLE:gold", 1);
    assert(upstream_of_gold.size() == 3);  // c1, e1 (guard), e2 (writes)

    GraphBuilder flat(GraphBuildOptions{false});
    auto plain = flat.build(builder_conditions(), builder_effects());
    assert(!plain.graph.has_edge("EFFECT:e1", "EFFECT:e2"));
    assert(GraphBuilder::cyclic_effects(plain.graph).empty());
    assert(plain.to_json()["warnings"].size() == 3);

    std::cout << "  PASS" << std::endl;
}

void test_graph_builder_updates() {
    std::cout << "Testing GraphBuilder incremental updates..." << std::endl;

    GraphBuilder builder;
    auto build = builder.build(builder_conditions(), builder_effects());
    auto& g = build.graph;

    // c1 now reads food instead of gold; e1's guard edges follow
    auto changed = make_condition(R"({"id": "c1", "entityType": "SETTLEMENT", "entityId": "s1",
                                      "field": "isRich", "expression": {">": [{"var": "food"}, 1]}})");
    std::vector<std::string> warnings;
    builder.update_condition(g, changed, warnings);
    assert(warnings.empty());
    assert(g.has_edge("CONDITION:c1", "VARIABLE:food", EdgeType::Reads));
    assert(!g.has_edge("CONDITION:c1", "VARIABLE:gold"));
    assert(g.has_edge("EFFECT:e1", "VARIABLE:food", EdgeType::Reads));
    assert(!g.has_edge("EFFECT:e1", "VARIABLE:gold"));
    // The loop through gold is gone
    assert(!g.has_edge("EFFECT:e1", "EFFECT:e2"));
    assert(!g.node("EFFECT:e1")->in_cycle);

    assert(builder.remove_record(g, "EFFECT:e2"));
    assert(!builder.remove_record(g, "EFFECT:e2"));
    assert(!g.has_node("EFFECT:e2"));

    std::cout << "  PASS" << std::endl;
}

void test_graph_cache() {
    std::cout << "Testing GraphCache..." << std::endl;

    GraphCache cache;
    std::atomic<int> builds{0};
    GraphCache::Builder builder = [&](const std::string&, const std::string&) {
        builds++;
        GraphBuild b;
        b.graph.add_node(var_node("x"));
        return b;
    };

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto g = cache.get_or_build("camp", "main", builder);
            assert(g->graph.node_count() == 1);
        });
    }
    for (auto& t : threads) t.join();

    assert(builds == 1);
    assert(cache.misses() == 1);
    assert(cache.hits() == 7);
    assert(cache.peek("camp", "main") != nullptr);
    assert(cache.peek("camp", "dev") == nullptr);

    cache.get_or_build("camp", "dev", builder);
    cache.get_or_build("other", "main", builder);
    assert(cache.size() == 3);
    assert(cache.invalidate("other", "main"));
    assert(!cache.invalidate("other", "main"));
    assert(cache.invalidate_campaign("camp") == 2);
    assert(cache.size() == 0);

    cache.get_or_build("camp", "main", builder);
    assert(builds == 4);
    cache.clear();
    assert(cache.stats()["entries"] == 0);

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Pipeline
// ═══════════════════════════════════════════════════════════════════════════

static EntitySnapshot encounter_entity() {
    return EntitySnapshot::from_json(J(R"({
        "id": "enc1", "entityType": "ENCOUNTER", "name": "Ambush", "version": 3,
        "isResolved": false, "variables": {"gold": 10, "alarm": false}
    })"));
}

void test_pipeline_phases() {
    std::cout << "Testing Pipeline phases..." << std::endl;

    std::vector<Effect> effects = {
        make_effect(R"({"id": "low", "entityType": "ENCOUNTER", "entityId": "enc1", "timing": "PRE",
                        "priority": 1,
                        "payload": [{"op": "replace", "path": "/variables/gold", "value": 1}]})"),
        make_effect(R"({"id": "high", "entityType": "ENCOUNTER", "entityId": "enc1", "timing": "PRE",
                        "priority": 9,
                        "payload": [{"op": "replace", "path": "/variables/gold", "value": 9}]})"),
        make_effect(R"({"id": "guarded", "entityType": "ENCOUNTER", "entityId": "enc1",
                        "timing": "ON_RESOLVE", "conditionId": "alarmed",
                        "payload": [{"op": "add", "path": "/variables/reinforcements", "value": 4}]})"),
        make_effect(R"({"id": "bad_test", "entityType": "ENCOUNTER", "entityId": "enc1",
                        "timing": "POST",
                        "payload": [{"op": "test", "path": "/variables/gold", "value": 12345}]})"),
        make_effect(R"({"id": "reward", "entityType": "ENCOUNTER", "entityId": "enc1", "timing": "POST",
                        "payload": [{"op": "add", "path": "/variables/xp", "value": 50}]})"),
        make_effect(R"({"id": "elsewhere", "entityType": "ENCOUNTER", "entityId": "enc2", "timing": "POST",
                        "payload": [{"op": "add", "path": "/variables/xp", "value": 1}]})"),
        make_effect(R"({"id": "disabled", "entityType": "ENCOUNTER", "entityId": "enc1", "timing": "POST",
                        "isActive": false,
                        "payload": [{"op": "add", "path": "/variables/xp", "value": 2}]})"),
    };
    std::vector<Condition> conditions = {
        make_condition(R"({"id": "alarmed", "entityType": "ENCOUNTER", "entityId": "enc1",
                           "field": "alarm", "expression": {"var": "alarm"}})"),
    };

    Evaluator evaluator;
    PatchEngine patch;
    Pipeline pipeline(evaluator, patch);
    EntitySnapshot original = encounter_entity();

    auto result = pipeline.resolve(original, effects, conditions, Pipeline::resolve_encounter_action());
    assert(result.ok);

    // Descending priority: low runs last and wins
    assert(result.pre().execution_order.size() == 2);
    assert(result.pre().execution_order[0] == "high");
    assert(result.pre().execution_order[1] == "low");
    assert(result.entity.variables()["gold"] == 1);
    assert(result.pre().status() == PhaseStatus::Completed);

    // Guard false: skipped, not failed
    assert(result.on_resolve().skipped == 1);
    assert(result.on_resolve().status() == PhaseStatus::Completed);
    assert(!result.entity.variables().contains("reinforcements"));
    assert(result.on_resolve().results[0].guard_value == false);

    // One failure beside one success
    assert(result.post().total == 2);
    assert(result.post().failed == 1);
    assert(result.post().errors[0].effect_id == "bad_test");
    assert(result.post().errors[0].kind == "PatchTestFailedError");
    assert(result.post().status() == PhaseStatus::CompletedWithWarnings);
    assert(result.entity.variables()["xp"] == 50);

    assert(result.entity.document["isResolved"] == true);
    assert(result.entity.document["resolvedAt"].is_string());
    assert(result.entity.document["version"] == 4);
    assert(original.document["isResolved"] == false);

    auto j = result.to_json();
    assert(j["onResolve"]["status"] == "COMPLETED");
    assert(j["post"]["status"] == "COMPLETED_WITH_WARNINGS");

    // The guard's context includes the document under its lowercase type
    assert(pipeline.guard_context(original)["encounter"]["name"] == "Ambush");

    std::cout << "  PASS" << std::endl;
}

void test_pipeline_failures() {
    std::cout << "Testing Pipeline failure handling..." << std::endl;

    std::vector<Effect> effects = {
        make_effect(R"({"id": "pre", "entityType": "ENCOUNTER", "entityId": "enc1", "timing": "PRE",
                        "payload": [{"op": "replace", "path": "/variables/gold", "value": 0}]})"),
        make_effect(R"({"id": "broken_guard", "entityType": "ENCOUNTER", "entityId": "enc1",
                        "timing": "ON_RESOLVE", "conditionId": "broken",
                        "payload": [{"op": "add", "path": "/variables/x", "value": 1}]})"),
        make_effect(R"({"id": "lost_guard", "entityType": "ENCOUNTER", "entityId": "enc1",
                        "timing": "ON_RESOLVE", "conditionId": "nowhere",
                        "payload": [{"op": "add", "path": "/variables/y", "value": 1}]})"),
    };
    std::vector<Condition> conditions = {
        make_condition(R"({"id": "broken", "entityType": "ENCOUNTER", "field": "f",
                           "expression": {"mystery": [1]}})"),
    };

    Evaluator evaluator;
    PatchEngine patch;
    Pipeline pipeline(evaluator, patch, PipelineOptions{false, J(R"({"weather": "rain"})")});

    auto result = pipeline.resolve(encounter_entity(), effects, conditions,
                                   Pipeline::resolve_encounter_action());
    assert(result.ok);
    // Guard errors fail closed
    assert(result.on_resolve().failed == 2);
    assert(result.on_resolve().status() == PhaseStatus::Failed);
    assert(result.on_resolve().errors[0].kind == "UnknownOperatorError");
    assert(result.on_resolve().errors[1].kind == "RecordNotFoundError");
    assert(result.post().status() == PhaseStatus::Empty);
    assert(pipeline.guard_context(encounter_entity())["weather"] == "rain");

    // Core action failure is fatal: the entity comes back untouched
    EntitySnapshot resolved = encounter_entity();
    resolved.document["isResolved"] = true;
    auto again = pipeline.resolve(resolved, effects, conditions, Pipeline::resolve_encounter_action());
    assert(!again.ok);
    assert(again.error_kind == "ResolutionFailedError");
    assert(again.entity.variables()["gold"] == 10);
    assert(again.ran[0] && !again.ran[1] && !again.ran[2]);
    assert(again.to_json()["onResolve"].is_null());

    // Cyclic writers are refused on request
    Pipeline strict(evaluator, patch, PipelineOptions{true, json::object()});
    auto refused = strict.resolve(encounter_entity(), effects, conditions,
                                  Pipeline::resolve_encounter_action(), {"pre"});
    assert(refused.pre().failed == 1);
    assert(refused.entity.variables()["gold"] == 10);

    // Event completion keeps an existing occurredAt
    auto event = EntitySnapshot::from_json(J(R"({"id": "ev1", "entityType": "EVENT",
                                                 "occurredAt": "2024-01-01T00:00:00.000Z"})"));
    auto completed = pipeline.resolve(event, {}, {}, Pipeline::complete_event_action());
    assert(completed.ok);
    assert(completed.entity.document["isCompleted"] == true);
    assert(completed.entity.document["occurredAt"] == "2024-01-01T00:00:00.000Z");
    assert(completed.pre().status() == PhaseStatus::Empty);

    // A PRE effect rejected by validation does not stop ON_RESOLVE
    std::vector<Effect> mixed = {
        make_effect(R"({"id": "rename", "entityType": "ENCOUNTER", "entityId": "enc1", "timing": "PRE",
                        "payload": [{"op": "replace", "path": "/id", "value": "enc9"}]})"),
        make_effect(R"({"id": "reward", "entityType": "ENCOUNTER", "entityId": "enc1",
                        "timing": "ON_RESOLVE",
                        "payload": [{"op": "add", "path": "/variables/r", "value": 1}]})"),
    };
    auto partial = pipeline.resolve(encounter_entity(), mixed, {}, Pipeline::resolve_encounter_action());
    assert(partial.ok);
    assert(partial.pre().failed == 1);
    assert(partial.pre().succeeded == 0);
    assert(partial.pre().errors[0].kind == "InvalidPatchSyntaxError");
    assert(partial.pre().status() == PhaseStatus::Failed);
    assert(partial.on_resolve().succeeded == 1);
    assert(partial.entity.document["id"] == "enc1");
    assert(partial.entity.variables() == J(R"({"gold": 10, "alarm": false, "r": 1})"));

    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Configuration and record sources
// ═══════════════════════════════════════════════════════════════════════════

void test_config() {
    std::cout << "Testing EngineConfig..." << std::endl;

    assert(EngineConfig::infer_kind("world.db") == SourceKind::Sqlite);
    assert(EngineConfig::infer_kind("world.sqlite3") == SourceKind::Sqlite);
    assert(EngineConfig::infer_kind("world.json") == SourceKind::Json);

    setenv("SIGIL_SOURCE", "/tmp/world.db", 1);
    setenv("SIGIL_MAX_DEPTH", "7", 1);
    setenv("SIGIL_REFUSE_CYCLIC_WRITES", "true", 1);
    setenv("SIGIL_LOG_LEVEL", "error", 1);
    EngineConfig config = EngineConfig::from_environment();
    unsetenv("SIGIL_SOURCE");
    unsetenv("SIGIL_MAX_DEPTH");
    unsetenv("SIGIL_REFUSE_CYCLIC_WRITES");
    unsetenv("SIGIL_LOG_LEVEL");

    assert(config.source_path == "/tmp/world.db");
    assert(config.source_kind == SourceKind::Sqlite);
    assert(config.max_expression_depth == 7);
    assert(config.refuse_cyclic_writes);
    assert(config.log_level == log::Level::Error);
    assert(config.default_branch == "main");

    // Flags override the environment; unknown arguments are kept in order
    std::vector<std::string> storage = {"sigil", "--source", "snap.json", "evaluate_expression",
                                        "--branch", "dev", "--expression", "1", "--no-write-chains",
                                        "-v"};
    std::vector<char*> argv;
    for (auto& s : storage) argv.push_back(&s[0]);
    int argc = config.apply_args(static_cast<int>(argv.size()), argv.data());

    assert(argc == 4);
    assert(std::string(argv[1]) == "evaluate_expression");
    assert(std::string(argv[2]) == "--expression");
    assert(std::string(argv[3]) == "1");
    assert(config.source_path == "snap.json");
    assert(config.source_kind == SourceKind::Json);
    assert(config.default_branch == "dev");
    assert(!config.link_write_chains);
    assert(config.log_level == log::Level::Debug);

    log::set_level(log::Level::Warn);
    std::cout << "  PASS" << std::endl;
}

static json world_snapshot() {
    return J(R"({
        "format": 1,
        "conditions": [
            {"id": "c1", "entityType": "ENCOUNTER", "entityId": "enc1", "field": "alarm",
             "campaignId": "camp", "expression": {">": [{"var": "gold"}, 5]}},
            {"id": "c_dev", "entityType": "ENCOUNTER", "field": "x", "campaignId": "camp",
             "branchId": "dev", "expression": {"var": "x"}},
            {"id": "c_off", "entityType": "ENCOUNTER", "field": "y", "isActive": false,
             "expression": true},
            {"entityType": "ENCOUNTER", "field": "no_id"}
        ],
        "effects": [
            {"id": "loot", "entityType": "ENCOUNTER", "entityId": "enc1", "campaignId": "camp",
             "conditionId": "c1", "timing": "ON_RESOLVE", "priority": 2,
             "payload": [{"op": "replace", "path": "/variables/gold", "value": 0}]},
            {"id": "bounty", "entityType": "ENCOUNTER", "entityId": "enc1", "campaignId": "camp",
             "timing": "POST",
             "payload": [{"op": "add", "path": "/variables/bounty", "value": 100}]},
            {"id": "weird", "entityType": "ENCOUNTER", "entityId": "enc1", "timing": "LATER"}
        ],
        "entities": [
            {"id": "enc1", "entityType": "ENCOUNTER", "campaignId": "camp", "name": "Bridge",
             "isResolved": false, "version": 1, "variables": {"gold": 8}},
            {"id": "ev1", "entityType": "EVENT", "campaignId": "camp", "isCompleted": false}
        ]
    })");
}

void test_json_record_source() {
    std::cout << "Testing JsonRecordSource..." << std::endl;

    JsonRecordSource source(world_snapshot());
    assert(source.warnings().size() == 2);
    assert(source.condition_count() == 3);
    assert(source.effect_count() == 2);
    assert(source.entity_count() == 2);

    assert(source.conditions("camp", "main").size() == 2);
    assert(source.conditions("camp", "dev").size() == 1);
    assert(source.conditions("", "main").size() == 2);
    assert(source.conditions("other", "main").size() == 1);  // c_off has no campaign
    assert(source.effects_for({"ENCOUNTER", "enc1"}).size() == 2);
    assert(source.condition("c1").has_value());
    assert(!source.condition("nope").has_value());
    assert(source.effect("bounty")->timing == EffectTiming::Post);
    assert(source.entity("EVENT", "ev1").has_value());
    assert(source.describe() == "json:<memory>");

    // Round trip through the snapshot form
    JsonRecordSource copy(source.snapshot());
    assert(copy.warnings().empty());
    assert(copy.condition_count() == 3);

    bool threw = false;
    try {
        JsonRecordSource future(J(R"({"format": 99})"));
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    // Null fields take their defaults; mistyped ones skip only their record
    JsonRecordSource loose(J(R"({
        "conditions": [
            {"id": "c1", "entityType": "SETTLEMENT", "field": null, "expression": true},
            {"id": "c2", "entityType": "SETTLEMENT", "field": 7, "expression": true}
        ],
        "effects": [
            {"id": "e1", "entityType": "SETTLEMENT", "entityId": "s1", "timing": null},
            {"id": "e2", "entityType": "SETTLEMENT", "entityId": "s1", "timing": 3}
        ]
    })"));
    assert(loose.condition_count() == 1);
    assert(loose.condition("c1")->field.empty());
    assert(loose.effect_count() == 1);
    assert(loose.effect("e1")->timing == EffectTiming::OnResolve);
    assert(loose.warnings().size() == 2);
    assert(loose.warnings()[0].find("conditions[1]") == 0);
    assert(loose.warnings()[1].find("effects[1]") == 0);

    threw = false;
    try {
        JsonRecordSource::from_file("/nonexistent/sigil/world.json");
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  PASS" << std::endl;
}

static void exec_sql(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error: " << (err ? err : "unknown") << "\n";
        sqlite3_free(err);
    }
    assert(rc == SQLITE_OK);
}

void test_sqlite_record_source() {
    std::cout << "Testing SqliteRecordSource..." << std::endl;

    std::string path = "/tmp/sigil_test_" + std::to_string(getpid()) + ".db";
    std::remove(path.c_str());

    sqlite3* db = nullptr;
    assert(sqlite3_open(path.c_str(), &db) == SQLITE_OK);
    exec_sql(db, R"(
        CREATE TABLE FieldCondition (
            id TEXT PRIMARY KEY, entityType TEXT, entityId TEXT, field TEXT,
            expression TEXT, description TEXT, priority INTEGER, isActive INTEGER,
            version INTEGER, campaignId TEXT, deletedAt TEXT);
        CREATE TABLE Effect (
            id TEXT PRIMARY KEY, name TEXT, entityType TEXT, entityId TEXT, timing TEXT,
            priority INTEGER, payload TEXT, isActive INTEGER, conditionId TEXT,
            campaignId TEXT, deletedAt TEXT);
        CREATE TABLE Encounter (
            id TEXT PRIMARY KEY, name TEXT, campaignId TEXT, variables TEXT,
            isResolved INTEGER, version INTEGER, deletedAt TEXT);

        INSERT INTO FieldCondition VALUES
            ('c1', 'ENCOUNTER', 'enc1', 'ready', '{">": [{"var": "gold"}, 5]}', 'rich', 0, 1, 1,
             'camp', NULL),
            ('c_gone', 'ENCOUNTER', 'enc1', 'old', '{"var": "x"}', '', 0, 1, 1, 'camp',
             '2024-01-01'),
            ('c_null', 'ENCOUNTER', 'enc1', NULL, '{"var": "gold"}', NULL, NULL, NULL, NULL,
             'camp', NULL);
        INSERT INTO Effect VALUES
            ('loot', 'Loot', 'ENCOUNTER', 'enc1', 'ON_RESOLVE', 1,
             '[{"op": "replace", "path": "/variables/gold", "value": 0}]', 1, 'c1', 'camp', NULL),
            ('off', 'Off', 'ENCOUNTER', 'enc1', 'POST', 0,
             '[{"op": "add", "path": "/variables/z", "value": 1}]', 0, NULL, 'camp', NULL),
            ('stray', 'Stray', 'ENCOUNTER', 'enc2', NULL, 0, '[]', 1, NULL, 'camp', NULL);
        INSERT INTO Encounter VALUES
            ('enc1', 'Bridge', 'camp', '{"gold": 8}', 0, 1, NULL);
    )");
    sqlite3_close(db);

    json raw = SqliteRecordSource::read_database(path);
    assert(raw["format"] == SIGIL_SNAPSHOT_FORMAT);
    assert(raw["conditions"].size() == 2);
    assert(raw["conditions"][1]["field"].is_null());
    assert(raw["conditions"][0]["isActive"] == true);
    assert(raw["conditions"][0]["expression"].is_object());
    assert(raw["effects"][1]["isActive"] == false);
    assert(raw["entities"][0]["entityType"] == "ENCOUNTER");
    assert(raw["entities"][0]["variables"]["gold"] == 8);

    SqliteRecordSource source(path);
    assert(source.warnings().empty());
    assert(source.describe() == "sqlite:" + path);
    assert(source.effect("off")->is_active == false);
    // NULL columns fall back to their defaults
    assert(source.condition("c_null")->field.empty());
    assert(source.condition("c_null")->is_active);
    assert(source.effect("stray")->timing == EffectTiming::OnResolve);

    EngineConfig config;
    config.default_campaign = "camp";
    Engine engine(source, config);
    auto result = engine.resolve_encounter("enc1");
    assert(result.ok);
    assert(result.on_resolve().succeeded == 1);
    assert(result.entity.variables()["gold"] == 0);
    assert(result.post().status() == PhaseStatus::Empty);

    bool threw = false;
    try {
        SqliteRecordSource missing("/nonexistent/sigil/world.db");
    } catch (const StorageError&) {
        threw = true;
    }
    assert(threw);

    std::remove(path.c_str());
    std::cout << "  PASS" << std::endl;
}

// ═══════════════════════════════════════════════════════════════════════════
// Engine and RPC surface
// ═══════════════════════════════════════════════════════════════════════════

void test_engine() {
    std::cout << "Testing Engine..." << std::endl;

    JsonRecordSource source(world_snapshot());
    EngineConfig config;
    config.default_campaign = "camp";
    Engine engine(source, config);

    auto ok = engine.evaluate_condition("c1", J(R"({"gold": 9})"));
    assert(ok.success);
    assert(ok.value == true);
    assert(ok.to_json()["error"].is_null());

    auto missing = engine.evaluate_condition("nope", json::object());
    assert(!missing.success);
    assert(missing.error_kind == "RecordNotFoundError");
    assert(!engine.evaluate_condition("c_off", json::object()).success);

    assert(!engine.validate_expression(J(R"({"nope": []})")).valid);

    auto too_deep = engine.evaluate_expression(nested_not(2000), json::object());
    assert(!too_deep.success);
    assert(too_deep.error_kind == "MalformedExpressionError");
    assert(too_deep.trace.empty());
    assert(!engine.validate_patch(J(R"([{"op": "replace", "path": "/eventId", "value": 1}])"),
                                  entity_type::ENCOUNTER).valid);

    auto resolved = engine.resolve_encounter("enc1", J(R"({"night": true})"));
    assert(resolved.ok);
    assert(resolved.on_resolve().succeeded == 1);
    assert(resolved.entity.variables()["gold"] == 0);
    assert(resolved.entity.variables()["bounty"] == 100);
    assert(resolved.entity.document["version"] == 2);

    // The source is not written back
    assert(source.entity("ENCOUNTER", "enc1")->variables()["gold"] == 8);

    auto not_found = engine.resolve_event("ev404");
    assert(!not_found.ok);
    assert(not_found.error_kind == "RecordNotFoundError");
    assert(engine.resolve_event("ev1").ok);

    auto build = engine.dependency_graph("", "");
    assert(build->graph.has_node("CONDITION:c1"));
    assert(build->graph.has_node("EFFECT:loot"));
    assert(!build->graph.has_node("CONDITION:c_dev"));
    assert(engine.dependency_graph("camp", "main") == build);
    assert(engine.cache().misses() == 1);
    assert(engine.cache().hits() == 1);

    auto down = engine.downstream("", "", "CONDITION:c1");
    assert(down.size() == 1 && down[0] == "VARIABLE:gold");
    auto up = engine.upstream("", "", "VARIABLE:gold", 1);
    assert(up.size() == 2);
    assert(engine.evaluation_order("", "").success);
    assert(!engine.validate_no_cycles("", "").has_cycles());
    assert(engine.selection("", "", {"VARIABLE:gold"}, 1).upstream.size() == up.size());
    assert(engine.selection("", "", {"VARIABLE:gold"}).upstream.size() == 3);

    assert(engine.invalidate_graph("", ""));
    engine.dependency_graph("", "");
    assert(engine.cache().misses() == 2);

    std::cout << "  PASS" << std::endl;
}

static json rpc_call(rpc::Handler& handler, const std::string& method, const json& params, int id = 1) {
    json request = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
    return json::parse(handler.handle(request.dump()));
}

void test_rpc_handler() {
    std::cout << "Testing RPC handler..." << std::endl;

    JsonRecordSource source(world_snapshot());
    EngineConfig config;
    config.default_campaign = "camp";
    Engine engine(source, config);
    rpc::Handler handler(engine);

    auto init = rpc_call(handler, "initialize", json::object());
    assert(init["result"]["serverInfo"]["name"] == "sigil");
    assert(init["id"] == 1);

    auto list = rpc_call(handler, "tools/list", json::object());
    assert(list["result"]["tools"].size() == handler.tools().size());
    assert(handler.has_tool("evaluate_condition"));
    assert(handler.has_tool("graph_selection"));
    assert(handler.has_tool("invalidate_graph"));

    auto evaluated = rpc_call(handler, "tools/call", {
        {"name", "evaluate_expression"},
        {"arguments", {{"expression", J(R"({"+": [{"var": "a"}, 1]})")}, {"context", {{"a", 2}}}}}
    });
    assert(evaluated["result"]["isError"] == false);
    assert(evaluated["result"]["structured"]["value"] == 3);

    auto mismatch = rpc_call(handler, "tools/call", {
        {"name", "evaluate_condition"},
        {"arguments", {{"conditionId", "c1"}, {"context", {{"gold", J("[1]")}}}}}
    });
    assert(mismatch["result"]["isError"] == true);
    assert(mismatch["result"]["structured"]["errorKind"] == "TypeMismatchError");

    auto no_args = rpc_call(handler, "tools/call", {{"name", "preview_patch"}, {"arguments", json::object()}});
    assert(no_args["result"]["isError"] == true);

    auto graph = rpc_call(handler, "tools/call", {{"name", "dependency_graph"}, {"arguments", json::object()}});
    assert(graph["result"]["structured"]["stats"]["conditionCount"] == 1);

    auto down = rpc_call(handler, "tools/call", {
        {"name", "graph_downstream"}, {"arguments", {{"nodeId", "EFFECT:loot"}, {"maxDepth", 1}}}
    });
    assert(down["result"]["structured"]["downstream"].size() == 1);

    auto resolved = rpc_call(handler, "tools/call", {
        {"name", "resolve_encounter"}, {"arguments", {{"encounterId", "enc1"}}}
    });
    assert(resolved["result"]["isError"] == false);
    assert(resolved["result"]["structured"]["entity"]["isResolved"] == true);

    auto unknown_tool = rpc_call(handler, "tools/call", {{"name", "teleport"}});
    assert(unknown_tool["error"]["code"] == rpc::error::TOOL_NOT_FOUND);

    auto unknown_method = rpc_call(handler, "resources/list", json::object());
    assert(unknown_method["error"]["code"] == rpc::error::METHOD_NOT_FOUND);

    // Over-deep requests are refused before dispatch; over-deep expressions
    // inside an accepted request fail as tool errors
    auto call_text = [](const std::string& expression) {
        return R"({"jsonrpc": "2.0", "id": 7, "method": "tools/call", "params": {"name": "evaluate_expression", "arguments": {"expression": )" +
               expression + "}}}";
    };
    auto refused = json::parse(handler.handle(call_text(nested_not_text(5000))));
    assert(refused["error"]["code"] == rpc::error::INVALID_REQUEST);
    auto capped = json::parse(handler.handle(call_text(nested_not_text(300))));
    assert(capped["id"] == 7);
    assert(capped["result"]["isError"] == true);
    assert(capped["result"]["structured"]["errorKind"] == "MalformedExpressionError");

    auto parse_error = json::parse(handler.handle("{not json"));
    assert(parse_error["error"]["code"] == rpc::error::PARSE_ERROR);

    auto invalid = json::parse(handler.handle(R"({"id": 3, "method": "initialize"})"));
    assert(invalid["error"]["code"] == rpc::error::INVALID_REQUEST);
    assert(invalid["id"] == 3);

    auto direct = handler.call_tool("validate_patch", {{"payload", J(R"([{"op": "remove", "path": "/id"}])")}});
    assert(!direct.is_error);
    assert(direct.structured["valid"] == false);

    assert(!handler.shutdown_requested());
    auto bye = rpc_call(handler, "shutdown", json::object());
    assert(bye["result"]["status"] == "ok");
    assert(handler.shutdown_requested());

    std::cout << "  PASS" << std::endl;
}

int main() {
    std::cout << "=== Sigil C++ Tests ===" << std::endl;
    std::cout << "Version " << SIGIL_VERSION << std::endl;
    std::cout << std::endl;

    test_expression_parse();
    test_evaluator_arithmetic();
    test_evaluator_comparison();
    test_evaluator_logic();
    test_evaluator_data_access();
    test_evaluator_strings_arrays();
    test_evaluator_trace();
    test_tags_equality_is_type_mismatch();
    test_operator_registry();
    test_validate_expression();

    std::cout << std::endl;
    std::cout << "=== Dependencies ===" << std::endl;
    test_dependency_extractor();
    test_graph_structure();
    test_graph_cycles();
    test_graph_order_and_traversal();
    test_graph_builder();
    test_graph_builder_updates();
    test_graph_cache();

    std::cout << std::endl;
    std::cout << "=== Patches and Resolution ===" << std::endl;
    test_patch_apply();
    test_patch_errors();
    test_pipeline_phases();
    test_pipeline_failures();

    std::cout << std::endl;
    std::cout << "=== Sources, Engine, RPC ===" << std::endl;
    test_config();
    test_json_record_source();
    test_sqlite_record_source();
    test_engine();
    test_rpc_handler();

    std::cout << std::endl;
    std::cout << "All tests passed!" << std::endl;
    return 0;
}
