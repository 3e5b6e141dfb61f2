#include "labwright/repairer.h"
#include "labwright/json_util.h"

#include <iostream>
#include <map>
#include <utility>

namespace labwright {

namespace ju = json_util;

std::vector<RowCountFailure> collect_row_count_failures(const std::vector<ValidationResult>& results,
                                                        const Blueprint& bp) {
    std::map<std::string, const ValidationQuery*> by_name;
    for (const auto& q : bp.validation_queries) by_name.emplace(q.query_name, &q);

    std::vector<RowCountFailure> out;
    for (const auto& r : results) {
        if (r.passed || r.failure != CheckFailure::ROW_COUNT || !r.actual_row_count) continue;
        RowCountFailure f;
        f.query_name = r.query_name;
        f.expected = r.expected_row_count;
        f.actual = *r.actual_row_count;
        auto it = by_name.find(r.query_name);
        if (it != by_name.end()) f.sql = it->second->sql.substr(0, 200);
        out.push_back(std::move(f));
    }
    return out;
}

std::string repair_request_json(const Blueprint& bp, const std::vector<RowCountFailure>& failures) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "blueprint", blueprint_to_json(bp));
    json_object* arr = json_object_new_array();
    for (const auto& f : failures) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "query_name", ju::new_string(f.query_name));
        json_object_object_add(o, "expected", json_object_new_int(f.expected));
        json_object_object_add(o, "actual", json_object_new_int(f.actual));
        json_object_object_add(o, "sql", ju::new_string(f.sql));
        json_object_array_add(arr, o);
    }
    json_object_object_add(root, "failures", arr);
    return ju::to_string_and_put(root);
}

ExternalProcessRepairer::ExternalProcessRepairer(std::string cmd, int timeout_ms)
    : cmd_(std::move(cmd)) {
    argv_ = split_argv_quoted(cmd_);
    lim_.timeout_ms = timeout_ms;
    lim_.stdout_max_bytes = 4 * 1024 * 1024;
    lim_.rlimit_fsize_mb = 10;
    lim_.rlimit_nofile = 256;
}

std::optional<Blueprint> ExternalProcessRepairer::repair(const Blueprint& bp,
                                                         const std::vector<RowCountFailure>& failures,
                                                         std::string* err) {
    auto fail = [&](const std::string& why) -> std::optional<Blueprint> {
        if (err) *err = why;
        std::cerr << "[repair] " << why << "\n";
        return std::nullopt;
    };

    if (argv_.empty()) return fail("repair command is empty or malformed");

    ProcResult pr;
    if (!proc_run_capture_stdin(argv_, std::string(), repair_request_json(bp, failures), lim_, &pr)) {
        return fail(pr.error.empty() ? "repair command not started" : pr.error);
    }
    if (pr.timed_out) return fail("repair command timed out");
    if (pr.exit_code != 0) return fail("repair command exit_code=" + std::to_string(pr.exit_code));
    if (pr.output_truncated) return fail("repair output exceeds limit");

    // stderr shares the pipe; take the outermost object
    size_t open = pr.output.find('{');
    size_t close = pr.output.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return fail("repair output holds no JSON object");
    }

    Blueprint repaired;
    std::string perr;
    if (!blueprint_from_json(pr.output.substr(open, close - open + 1), &repaired, &perr)) {
        return fail("repair output is not a blueprint: " + perr);
    }
    auto issues = check_blueprint(repaired);
    if (!issues.empty()) {
        return fail("repaired blueprint invalid: " + issues.front().code + " " + issues.front().message);
    }
    return repaired;
}

} // namespace labwright
