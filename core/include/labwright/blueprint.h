#pragma once

#include <json-c/json.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace labwright {

// Fixed set of column types the sandbox databases accept.
enum class ColumnType {
    INTEGER,
    BIGINT,
    SERIAL,
    TEXT,
    VARCHAR,
    BOOLEAN,
    DATE,
    TIMESTAMP,
    NUMERIC,
    JSON,
};

// DDL spelling, e.g. "VARCHAR(255)".
const char* column_type_sql(ColumnType t);
std::optional<ColumnType> column_type_from_sql(const std::string& s);

struct ColumnDef {
    std::string name;
    ColumnType type{ColumnType::TEXT};
    bool nullable{true};
    bool is_primary_key{false};
    std::string description;
};

// One scalar from a sample-data row.
struct SeedValue {
    enum class Kind { NUL, BOOL, INT, REAL, TEXT } kind{Kind::NUL};
    bool b{false};
    int64_t i{0};
    double d{0.0};
    std::string s;
};

using SampleRow = std::map<std::string, SeedValue>;

struct SourceTable {
    std::string name;
    std::string description;
    std::vector<ColumnDef> columns;
    std::vector<SampleRow> rows;
};

struct TargetTable {
    std::string name;
    std::string description;
    std::vector<ColumnDef> columns;
};

struct TransformStep {
    int step_number{1};
    std::string title;
    std::string description;
    std::string hint;
    std::string solution_code;
    std::vector<std::string> skill_tags;
};

struct ValidationQuery {
    std::string query_name;
    std::string sql;
    int expected_row_count{0};
    std::vector<std::string> expected_columns;
    std::string description;
};

// The declarative lab definition. Treated as immutable input; a repair
// produces a whole new Blueprint.
struct Blueprint {
    std::string title;
    std::string description;
    std::string difficulty{"beginner"};
    int estimated_minutes{30};
    std::vector<std::string> learning_objectives;
    std::string business_context;

    std::vector<SourceTable> source_tables;
    std::vector<TargetTable> target_tables;
    std::vector<TransformStep> steps;
    std::vector<ValidationQuery> validation_queries;

    std::string lab_instructions;
};

struct BlueprintIssue {
    std::string code;
    std::string message;
};

// Parse a blueprint document. Returns false and sets *err on malformed
// structure (missing arrays, wrong types). Content rules are checked
// separately by check_blueprint().
bool blueprint_from_json(const std::string& json, Blueprint* out, std::string* err);
bool blueprint_from_json_object(json_object* root, Blueprint* out, std::string* err);

// Caller owns the returned object.
json_object* blueprint_to_json(const Blueprint& bp);
std::string blueprint_to_json_string(const Blueprint& bp);

// Identifier contract: ^[a-z][a-z0-9_]{0,62}$ and not a reserved SQL word.
bool is_valid_identifier(const std::string& name);

// Validation query contract: starts with SELECT, contains no write/DDL token.
// Returns the offending tokens (empty when read-only).
std::vector<std::string> forbidden_query_tokens(const std::string& sql);

// Re-apply the input contract and volume limits. Empty result means valid.
std::vector<BlueprintIssue> check_blueprint(const Blueprint& bp);

} // namespace labwright
