#pragma once
#include "blueprint.h"

#include <string>

namespace labwright {

// Escape one sample value as a SQL literal (NULL, TRUE/FALSE, number, or a
// single-quoted string with embedded quotes doubled).
std::string sql_literal(const SeedValue& v);

// Source store: CREATE TABLE IF NOT EXISTS plus one INSERT per sample row.
// Returns false and sets *err if the output contains a destructive keyword
// as a standalone word.
bool generate_source_sql(const Blueprint& bp, std::string* out, std::string* err);

// Target store: empty schemas, then the read-only `validator` role with
// SELECT grants on every target table and on future tables.
bool generate_target_sql(const Blueprint& bp, std::string* out, std::string* err);

// Credentials of the read-only grading role.
inline constexpr const char* kValidatorRole = "validator";

} // namespace labwright
