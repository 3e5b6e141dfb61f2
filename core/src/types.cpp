#include "labwright/types.h"

namespace labwright {

const char* lab_status_name(LabStatus s) {
    switch (s) {
        case LabStatus::PENDING:  return "pending";
        case LabStatus::STARTING: return "starting";
        case LabStatus::RUNNING:  return "running";
        case LabStatus::STOPPING: return "stopping";
        case LabStatus::STOPPED:  return "stopped";
        case LabStatus::ERROR:    return "error";
    }
    return "error";
}

const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NONE:                 return "none";
        case ErrorKind::RESOURCE_EXHAUSTED:   return "resource_exhausted";
        case ErrorKind::PROVISIONING_FAILURE: return "provisioning_failure";
        case ErrorKind::READINESS_TIMEOUT:    return "readiness_timeout";
        case ErrorKind::EXECUTION_FAILURE:    return "execution_failure";
        case ErrorKind::VALIDATION_MISMATCH:  return "validation_mismatch";
        case ErrorKind::SAFETY_REJECTION:     return "safety_rejection";
    }
    return "none";
}

const char* check_failure_name(CheckFailure f) {
    switch (f) {
        case CheckFailure::NONE:      return "none";
        case CheckFailure::ROW_COUNT: return "row_count";
        case CheckFailure::COLUMNS:   return "columns";
        case CheckFailure::EXECUTION: return "execution";
        case CheckFailure::SAFETY:    return "safety";
    }
    return "none";
}

} // namespace labwright
