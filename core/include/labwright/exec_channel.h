#pragma once
#include "compose.h"
#include "types.h"

#include <memory>
#include <string>

namespace labwright {

struct ScriptRun {
    bool succeeded{false};
    ErrorKind kind{ErrorKind::NONE}; // EXECUTION_FAILURE or SAFETY_REJECTION on failure
    std::string output;              // captured stdout+stderr, or the rejection reason
};

struct QueryOutput {
    bool ok{false};
    bool timed_out{false};
    std::string output; // raw psql text (error text when !ok)
};

// The only path into a running sandbox. One entry point per payload kind,
// each bounded by a timeout.
class ExecutionChannel {
public:
    ExecutionChannel(std::shared_ptr<IComposeDriver> driver, int script_timeout_ms);

    // Pipes the script into the notebook container's interpreter on stdin.
    // Rejected without execution if check_script() refuses it. Success
    // requires exit 0 and the success sentinel in the output.
    ScriptRun run_script(const ComposeProject& p, const std::string& script) const;

    // One statement against the target store as `role`, with a server-side
    // statement timeout. Unaligned `|`-separated output; with_header keeps
    // the column header line and footer.
    QueryOutput run_query(const ComposeProject& p,
                          const std::string& sql,
                          const std::string& role,
                          int timeout_s,
                          bool with_header) const;

    int script_timeout_ms() const { return script_timeout_ms_; }

private:
    std::shared_ptr<IComposeDriver> driver_;
    int script_timeout_ms_;
};

} // namespace labwright
