#pragma once
#include "blueprint.h"
#include "proc.h"
#include "types.h"

#include <optional>
#include <string>
#include <vector>

namespace labwright {

// One repairable discrepancy: the query ran, only its row count was off.
struct RowCountFailure {
    std::string query_name;
    int expected{0};
    int actual{0};
    std::string sql; // truncated to 200 chars
};

// Row-count failures of a validation pass, paired with their query text.
std::vector<RowCountFailure> collect_row_count_failures(const std::vector<ValidationResult>& results,
                                                        const Blueprint& bp);

// Produces a complete replacement blueprint given concrete row-count
// failures. nullopt with *err set when no usable replacement was produced.
class IRepairer {
public:
    virtual ~IRepairer() = default;
    virtual std::optional<Blueprint> repair(const Blueprint& bp,
                                            const std::vector<RowCountFailure>& failures,
                                            std::string* err) = 0;
};

// Runs an external program (no shell). Its stdin receives
// {"blueprint": {...}, "failures": [{"query_name","expected","actual","sql"}]}
// and its stdout must hold one blueprint JSON object that passes
// check_blueprint().
class ExternalProcessRepairer final : public IRepairer {
public:
    ExternalProcessRepairer(std::string cmd, int timeout_ms);

    std::optional<Blueprint> repair(const Blueprint& bp,
                                    const std::vector<RowCountFailure>& failures,
                                    std::string* err) override;

private:
    std::string cmd_;
    std::vector<std::string> argv_;
    ProcLimits lim_;
};

// Request document sent to a repair collaborator.
std::string repair_request_json(const Blueprint& bp, const std::vector<RowCountFailure>& failures);

} // namespace labwright
