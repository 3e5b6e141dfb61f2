#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace labwright {

// Lifecycle of one provisioned environment.
enum class LabStatus {
    PENDING,
    STARTING,
    RUNNING,
    STOPPING,
    STOPPED,
    ERROR
};

const char* lab_status_name(LabStatus s);

// Failure taxonomy shared by every component. The self-test coordinator is
// the only place that decides whether one of these is terminal.
enum class ErrorKind {
    NONE,
    RESOURCE_EXHAUSTED,
    PROVISIONING_FAILURE,
    READINESS_TIMEOUT,
    EXECUTION_FAILURE,
    VALIDATION_MISMATCH,
    SAFETY_REJECTION,
};

const char* error_kind_name(ErrorKind k);

// Why a single validation query did not pass.
enum class CheckFailure {
    NONE,
    ROW_COUNT,   // row count differs, columns fine
    COLUMNS,     // expected columns missing (row count may also differ)
    EXECUTION,   // query or probe failed in the data store
    SAFETY,      // rejected before execution
};

const char* check_failure_name(CheckFailure f);

// Outcome of one validation query. Produced fresh on every pass.
struct ValidationResult {
    std::string query_name;
    bool passed{false};
    CheckFailure failure{CheckFailure::NONE};
    int expected_row_count{0};
    std::optional<int> actual_row_count;
    std::vector<std::string> expected_columns;
    std::optional<std::vector<std::string>> actual_columns;
    std::string error; // sanitized, empty when passed
};

// Mutation strength. Level 0 is semantic, level 1 must move cardinality.
constexpr int kMinMutationLevel = 0;
constexpr int kMaxMutationLevel = 1;

} // namespace labwright
