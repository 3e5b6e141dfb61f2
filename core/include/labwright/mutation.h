#pragma once
#include "blueprint.h"

#include <string>
#include <vector>

namespace labwright {

// What a transformation step does, as far as mutation is concerned.
enum class StepCategory {
    DDL,
    DATA_MIGRATION,
    JOIN,
    FILTERING,
    AGGREGATION,
    LOADING,
    TRANSFORMATION,
    EXTRACTION,
    OTHER,
};

const char* step_category_name(StepCategory c);

// Lower-cased classifier inputs. `keywords` is the declared tags followed by
// the title; `code` is the reference implementation.
struct StepSignals {
    std::string keywords;
    std::string code;
};

StepSignals step_signals(const TransformStep& step);

// One predicate of the ordered classifier. The first rule that matches wins.
struct ClassifierRule {
    const char* name;
    StepCategory category;
    bool (*matches)(const StepSignals& s);
};

const std::vector<ClassifierRule>& classifier_rules();

// OTHER when no rule matches.
StepCategory classify_signals(const StepSignals& s);
StepCategory classify_step(const TransformStep& step);

// Deterministic, idempotent textual mutation of one step implementation.
// Level 0 changes semantics, level 1 (and above) aims at row cardinality.
// Returns the trimmed input unchanged when no pattern applies.
std::string mutate_code(const std::string& code, StepCategory category, int level);

// classify_step + mutate_code. Steps without code yield a placeholder comment.
std::string mutate_step(const TransformStep& step, int level);

} // namespace labwright
