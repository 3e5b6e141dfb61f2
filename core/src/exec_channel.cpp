#include "labwright/exec_channel.h"
#include "labwright/renderer.h"
#include "labwright/script_guard.h"

#include <iostream>
#include <utility>

namespace labwright {

ExecutionChannel::ExecutionChannel(std::shared_ptr<IComposeDriver> driver, int script_timeout_ms)
    : driver_(std::move(driver)), script_timeout_ms_(script_timeout_ms) {}

ScriptRun ExecutionChannel::run_script(const ComposeProject& p, const std::string& script) const {
    ScriptRun run;

    ScriptVerdict verdict = check_script(script);
    if (!verdict.ok) {
        std::cerr << "[exec] script rejected: " << verdict.reason << "\n";
        run.kind = ErrorKind::SAFETY_REJECTION;
        run.output = "Script rejected: " + verdict.reason;
        return run;
    }

    ProcResult res = driver_->exec(p, kJupyterService, {"python", "-"}, script, script_timeout_ms_);
    run.output = res.output;

    if (res.timed_out) {
        run.kind = ErrorKind::EXECUTION_FAILURE;
        run.output = "Script execution timed out after " +
                     std::to_string(script_timeout_ms_ / 1000) + " seconds";
        return run;
    }
    if (!res.error.empty()) {
        run.kind = ErrorKind::EXECUTION_FAILURE;
        run.output = res.error + (res.output.empty() ? "" : "\n" + res.output);
        return run;
    }

    run.succeeded = res.exit_code == 0 && res.output.find(kScriptSuccessSentinel) != std::string::npos;
    if (!run.succeeded) run.kind = ErrorKind::EXECUTION_FAILURE;
    return run;
}

QueryOutput ExecutionChannel::run_query(const ComposeProject& p,
                                        const std::string& sql,
                                        const std::string& role,
                                        int timeout_s,
                                        bool with_header) const {
    std::vector<std::string> argv = {
        "psql", "-X", "-U", role, "-d", "target_db",
        "-A", "-F", "|", "-v", "ON_ERROR_STOP=1",
    };
    if (!with_header) argv.push_back("-t");
    argv.push_back("-c");
    argv.push_back("SET statement_timeout = '" + std::to_string(timeout_s) + "s'; " + sql);

    // client-side ceiling a little above the server-side one
    ProcResult res = driver_->exec(p, kTargetDbService, argv, std::string(), timeout_s * 1000 + 10000);

    QueryOutput q;
    q.timed_out = res.timed_out;
    if (res.timed_out) {
        q.output = "query timed out";
        return q;
    }
    if (!res.error.empty()) {
        q.output = res.error;
        return q;
    }
    q.ok = res.exit_code == 0;
    q.output = res.output;
    return q;
}

} // namespace labwright
