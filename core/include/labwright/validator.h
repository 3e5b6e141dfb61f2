#pragma once
#include "blueprint.h"
#include "exec_channel.h"
#include "types.h"

#include <string>
#include <vector>

namespace labwright {

inline constexpr size_t kMaxQueryLength = 4096;

// Runtime read-only check: length cap, SELECT prefix, no write/DDL keyword
// at a word boundary. Returns false and sets *reason when unsafe.
bool check_query_safety(const std::string& sql, std::string* reason);

// Drop DETAIL/HINT/CONTEXT and LINE/POSITION sub-lines plus caret markers,
// truncate to 500 chars. Never returns an empty string.
std::string sanitize_db_error(const std::string& raw);

// Data lines of tuples-only psql output (blank lines and bare "SET" tags
// are not rows).
int count_result_rows(const std::string& output);

// Header line of a psql probe with headers on; empty when none.
std::vector<std::string> parse_header_columns(const std::string& output);

// Grades the target store against a blueprint's validation queries.
class Validator {
public:
    Validator(const ExecutionChannel& channel, int query_timeout_s,
              std::string role = "validator");

    // One result per query, in blueprint order.
    std::vector<ValidationResult> validate(const ComposeProject& p, const Blueprint& bp) const;

    ValidationResult validate_query(const ComposeProject& p, const ValidationQuery& q) const;

private:
    const ExecutionChannel& channel_;
    int query_timeout_s_;
    std::string role_;
};

} // namespace labwright
