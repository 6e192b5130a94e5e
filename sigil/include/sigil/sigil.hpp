#pragma once
// Sigil: condition and effect engine for campaign state
//
// - Expressions: JSON-logic parsing, evaluation with traces, validation
// - Patches: RFC 6902 application with protected fields and diffs
// - Graph: variable/condition/effect dependencies, cycles, ordering
// - Pipeline: PRE / ON_RESOLVE / POST effect execution
// - Engine: query facade over a RecordSource

#include "version.hpp"
#include "log.hpp"
#include "errors.hpp"
#include "types.hpp"
#include "expression.hpp"
#include "evaluator.hpp"
#include "dependency_extractor.hpp"
#include "patch.hpp"
#include "dependency_graph.hpp"
#include "graph_builder.hpp"
#include "graph_cache.hpp"
#include "pipeline.hpp"
#include "config.hpp"
#include "record_source.hpp"
#include "engine.hpp"
