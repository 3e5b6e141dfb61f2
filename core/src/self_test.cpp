#include "labwright/self_test.h"
#include "labwright/ids.h"
#include "labwright/json_util.h"
#include "labwright/log.h"
#include "labwright/renderer.h"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace labwright {

namespace fs = std::filesystem;
using namespace labwright::json_util;

const char* self_test_state_name(SelfTestState s) {
    switch (s) {
        case SelfTestState::NotStarted:                      return "not_started";
        case SelfTestState::Provisioning:                    return "provisioning";
        case SelfTestState::AwaitingReadiness:               return "awaiting_readiness";
        case SelfTestState::Executing:                       return "executing";
        case SelfTestState::Validating:                      return "validating";
        case SelfTestState::RepairingAndRetrying:            return "repairing_and_retrying";
        case SelfTestState::VerifyingMutationDiscrimination: return "verifying_mutation_discrimination";
        case SelfTestState::Passed:                          return "passed";
        case SelfTestState::Failed:                          return "failed";
    }
    return "failed";
}

SelfTestOptions self_test_options(const LabConfig& cfg) {
    SelfTestOptions o;
    o.max_retries = cfg.max_retries;
    o.db_ready_timeout_ms = cfg.db_ready_timeout_ms;
    o.db_poll_ms = cfg.db_poll_ms;
    o.settle_ms = cfg.settle_ms;
    o.include_solutions = cfg.include_solutions;
    o.failed_dir = cfg.failed_dir();
    if (cfg.event_log) o.event_log_dir = cfg.event_log_dir();
    return o;
}

static std::string head(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(0, n);
}

static std::string tail(const std::string& s, size_t n) {
    return s.size() <= n ? s : s.substr(s.size() - n);
}

static void sleep_ms(int ms) {
    if (ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

static int count_failed(const std::vector<ValidationResult>& results) {
    return (int)std::count_if(results.begin(), results.end(),
                              [](const ValidationResult& r) { return !r.passed; });
}

// ---------------------------------------------------------------------------
// Readiness
// ---------------------------------------------------------------------------

static bool store_ready(IComposeDriver& driver, const ComposeProject& p,
                        const char* service, const char* db) {
    ProcResult r = driver.exec(p, service, {"pg_isready", "-U", "labuser", "-d", db},
                               std::string(), 10000);
    return r.ok() || r.output.find("accepting connections") != std::string::npos;
}

bool wait_for_databases(IComposeDriver& driver,
                        const ComposeProject& p,
                        int timeout_ms,
                        int poll_ms,
                        std::string* not_ready) {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::milliseconds(std::max(0, timeout_ms));

    bool source_ok = false;
    bool target_ok = false;
    for (;;) {
        if (!source_ok) source_ok = store_ready(driver, p, kSourceDbService, "source_db");
        if (!target_ok) target_ok = store_ready(driver, p, kTargetDbService, "target_db");
        if (source_ok && target_ok) return true;

        if (clock::now() >= deadline) break;
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
        sleep_ms((int)std::min<long long>(std::max(1, poll_ms), left.count()));
    }
    if (not_ready) *not_ready = source_ok ? "Target" : "Source";
    return false;
}

// ---------------------------------------------------------------------------
// JSON views
// ---------------------------------------------------------------------------

json_object* validation_result_to_json(const ValidationResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "query_name", new_string(r.query_name));
    json_object_object_add(o, "passed", json_object_new_boolean(r.passed));
    json_object_object_add(o, "failure", json_object_new_string(check_failure_name(r.failure)));
    json_object_object_add(o, "expected_row_count", json_object_new_int(r.expected_row_count));
    json_object_object_add(o, "actual_row_count",
                           r.actual_row_count ? json_object_new_int(*r.actual_row_count) : nullptr);
    json_object_object_add(o, "expected_columns", new_string_array(r.expected_columns));
    json_object_object_add(o, "actual_columns",
                           r.actual_columns ? new_string_array(*r.actual_columns) : nullptr);
    if (!r.error.empty()) json_object_object_add(o, "error", new_string(r.error));
    return o;
}

static json_object* results_to_json(const std::vector<ValidationResult>& results) {
    json_object* arr = json_object_new_array();
    for (const auto& r : results) json_object_array_add(arr, validation_result_to_json(r));
    return arr;
}

json_object* self_test_result_to_json(const SelfTestResult& r) {
    json_object* o = json_object_new_object();
    json_object_object_add(o, "passed", json_object_new_boolean(r.passed));
    json_object_object_add(o, "run_id", new_string(r.run_id));
    json_object_object_add(o, "attempts", json_object_new_int(r.attempts));
    json_object_object_add(o, "repair_calls", json_object_new_int(r.repair_calls));
    json_object_object_add(o, "error_kind", json_object_new_string(error_kind_name(r.kind)));
    if (!r.error.empty()) json_object_object_add(o, "error", new_string(r.error));
    json_object_object_add(o, "discrimination_level",
                           r.discrimination_level ? json_object_new_int(*r.discrimination_level) : nullptr);

    json_object* trace = json_object_new_array();
    for (auto s : r.trace) json_object_array_add(trace, json_object_new_string(self_test_state_name(s)));
    json_object_object_add(o, "trace", trace);

    json_object_object_add(o, "validation_results", results_to_json(r.results));

    if (r.session) {
        PublishedLab v = publish_view(*r.session);
        json_object* lab = json_object_new_object();
        json_object_object_add(lab, "lab_id", new_string(v.lab_id));
        json_object_object_add(lab, "status", json_object_new_string(lab_status_name(v.status)));
        json_object_object_add(lab, "jupyter_url", new_string(v.jupyter_url));
        json_object_object_add(o, "lab", lab);
    }
    if (!r.diagnostics_path.empty()) {
        json_object_object_add(o, "diagnostics", new_string(r.diagnostics_path.string()));
    }
    return o;
}

std::string failure_summary(const std::vector<ValidationResult>& results) {
    std::string out;
    for (const auto& r : results) {
        if (r.passed) continue;
        if (!out.empty()) out += "; ";
        out += r.query_name + ": " + r.error;
    }
    return out;
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

fs::path save_failed_lab(const fs::path& dir,
                         const std::string& run_id,
                         const Blueprint& bp,
                         int attempt,
                         const std::string& error,
                         const std::string& script,
                         const std::string& script_output,
                         const std::vector<ValidationResult>& results) {
    if (dir.empty()) return {};
    try {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[self_test] cannot create " << dir << ": " << ec.message() << "\n";
            return {};
        }

        json_object* rec = json_object_new_object();
        json_object_object_add(rec, "run_id", new_string(run_id));
        json_object_object_add(rec, "timestamp", new_string(iso_now()));
        json_object_object_add(rec, "attempt", json_object_new_int(attempt));
        json_object_object_add(rec, "error", new_string(error));
        json_object_object_add(rec, "script", new_string(script));
        json_object_object_add(rec, "script_output", new_string(tail(script_output, 20000)));
        json_object_object_add(rec, "validation_results", results_to_json(results));
        json_object_object_add(rec, "blueprint", blueprint_to_json(bp));
        const std::string text = to_string_and_put(rec, JSON_C_TO_STRING_PRETTY);

        fs::path path = dir / ("failed_" + run_id + ".json");
        std::string err;
        if (!write_text_file(path, text + "\n", &err)) {
            std::cerr << "[self_test] diagnostics not saved: " << err << "\n";
            return {};
        }
        std::cerr << "[self_test] diagnostics saved to " << path << "\n";
        return path;
    } catch (const std::exception& e) {
        std::cerr << "[self_test] diagnostics not saved: " << e.what() << "\n";
        return {};
    }
}

// ---------------------------------------------------------------------------
// Coordinator
// ---------------------------------------------------------------------------

struct SelfTestCoordinator::Run {
    SelfTestResult res;
    Blueprint bp;
    std::optional<LabSession> live;
    std::unique_ptr<JsonlLogger> log;
    std::string last_output;

    void event(const char* name, json_object* payload) {
        if (log) log->event(res.attempts, name, payload);
        else if (payload) json_object_put(payload);
    }
};

SelfTestCoordinator::SelfTestCoordinator(LabOrchestrator& orch,
                                         const ExecutionChannel& channel,
                                         const Validator& validator,
                                         IRepairer* repairer,
                                         SelfTestOptions opt)
    : orch_(orch), channel_(channel), validator_(validator), repairer_(repairer), opt_(std::move(opt)) {}

void SelfTestCoordinator::enter(Run& r, SelfTestState s) {
    r.res.trace.push_back(s);
}

void SelfTestCoordinator::teardown_live(Run& r) {
    if (!r.live) return;
    if (!orch_.teardown(*r.live)) {
        std::cerr << "[self_test] teardown of lab " << r.live->lab_id << " reported: "
                  << r.live->error_message << "\n";
    }
    r.live.reset();
}

void SelfTestCoordinator::fail(Run& r, ErrorKind kind, const std::string& msg) {
    enter(r, SelfTestState::Failed);
    r.res.passed = false;
    r.res.kind = kind;
    r.res.error = msg;
    std::cerr << "[self_test] FAILED (" << error_kind_name(kind) << ") attempt " << r.res.attempts
              << ": " << head(msg, 500) << "\n";
    r.res.diagnostics_path = save_failed_lab(opt_.failed_dir, r.res.run_id, r.bp, r.res.attempts,
                                             msg, solution_script(r.bp), r.last_output,
                                             r.res.results);

    json_object* p = json_object_new_object();
    json_object_object_add(p, "passed", json_object_new_boolean(0));
    json_object_object_add(p, "error_kind", json_object_new_string(error_kind_name(kind)));
    json_object_object_add(p, "error", new_string(head(msg, 2000)));
    r.event("finished", p);
}

SelfTestResult SelfTestCoordinator::run(const Blueprint& bp) {
    Run r;
    r.bp = bp;
    r.res.run_id = gen_run_id();
    r.res.trace.push_back(SelfTestState::NotStarted);

    if (!opt_.event_log_dir.empty()) {
        std::error_code ec;
        fs::create_directories(opt_.event_log_dir, ec);
        if (ec) {
            std::cerr << "[self_test] event log disabled: " << ec.message() << "\n";
        } else {
            r.log = std::make_unique<JsonlLogger>(r.res.run_id,
                                                  (opt_.event_log_dir / (r.res.run_id + ".jsonl")).string());
        }
    }

    try {
        attempt_loop(r);
    } catch (const std::exception& e) {
        teardown_live(r);
        fail(r, ErrorKind::EXECUTION_FAILURE, std::string("Unexpected error: ") + e.what());
    }
    return std::move(r.res);
}

void SelfTestCoordinator::attempt_loop(Run& r) {
    const int max_attempts = std::max(0, opt_.max_retries) + 1;

    for (int attempt = 1; attempt <= max_attempts; attempt++) {
        r.res.attempts = attempt;
        r.last_output.clear();
        {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "title", new_string(r.bp.title));
            json_object_object_add(p, "max_attempts", json_object_new_int(max_attempts));
            r.event("attempt_start", p);
        }
        std::cerr << "[self_test] attempt " << attempt << "/" << max_attempts << " for '"
                  << r.bp.title << "'\n";

        // 1. provision
        enter(r, SelfTestState::Provisioning);
        LabSession s = orch_.provision(r.bp, opt_.include_solutions);
        if (s.status == LabStatus::ERROR) {
            fail(r, s.error_kind, s.error_message);
            return;
        }
        r.live = std::move(s);
        {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "lab_id", new_string(r.live->lab_id));
            json_object_object_add(p, "port", json_object_new_int(r.live->jupyter_port.value_or(0)));
            r.event("provisioned", p);
        }

        auto h = orch_.execution_handle(*r.live);
        if (!h) {
            teardown_live(r);
            fail(r, ErrorKind::PROVISIONING_FAILURE, "lab directory missing after provisioning");
            return;
        }

        // 2. readiness
        enter(r, SelfTestState::AwaitingReadiness);
        std::string not_ready;
        if (!wait_for_databases(*orch_.driver(), *h, opt_.db_ready_timeout_ms, opt_.db_poll_ms, &not_ready)) {
            teardown_live(r);
            fail(r, ErrorKind::READINESS_TIMEOUT, not_ready + " database did not become ready in time");
            return;
        }
        r.event("ready", nullptr);

        // 3. settle
        sleep_ms(opt_.settle_ms);

        // 4. reference solution
        enter(r, SelfTestState::Executing);
        ScriptRun run = channel_.run_script(*h, solution_script(r.bp));
        r.last_output = run.output;
        {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "script", json_object_new_string("solution"));
            json_object_object_add(p, "succeeded", json_object_new_boolean(run.succeeded));
            json_object_object_add(p, "error_kind", json_object_new_string(error_kind_name(run.kind)));
            json_object_object_add(p, "output_tail", new_string(tail(run.output, 2000)));
            r.event("script_result", p);
        }
        if (!run.succeeded) {
            teardown_live(r);
            fail(r, run.kind == ErrorKind::NONE ? ErrorKind::EXECUTION_FAILURE : run.kind,
                 "Solution script failed: " + head(run.output, 2000));
            return;
        }

        // 5. validate
        enter(r, SelfTestState::Validating);
        r.res.results = validator_.validate(*h, r.bp);
        r.live->validation_results = r.res.results;
        const int failed = count_failed(r.res.results);
        {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "total", json_object_new_int((int)r.res.results.size()));
            json_object_object_add(p, "failed", json_object_new_int(failed));
            json_object_object_add(p, "results", results_to_json(r.res.results));
            r.event("validation", p);
        }

        if (failed == 0) {
            verify_discrimination(r, *h);
            return;
        }

        std::cerr << "[self_test] validation failed: " << head(failure_summary(r.res.results), 500) << "\n";
        teardown_live(r);

        const bool unsafe = std::any_of(r.res.results.begin(), r.res.results.end(),
            [](const ValidationResult& v) { return v.failure == CheckFailure::SAFETY; });
        const std::string summary = "Validation failed: " + failure_summary(r.res.results);
        if (unsafe) {
            fail(r, ErrorKind::SAFETY_REJECTION, summary);
            return;
        }

        std::vector<RowCountFailure> repairable = collect_row_count_failures(r.res.results, r.bp);
        const bool only_row_counts = (int)repairable.size() == failed;
        if (!only_row_counts || attempt >= max_attempts || !repairer_) {
            fail(r, ErrorKind::VALIDATION_MISMATCH, summary);
            return;
        }

        enter(r, SelfTestState::RepairingAndRetrying);
        r.res.repair_calls++;
        std::string err;
        std::optional<Blueprint> fixed = repairer_->repair(r.bp, repairable, &err);
        {
            json_object* p = json_object_new_object();
            json_object_object_add(p, "failures", json_object_new_int((int)repairable.size()));
            json_object_object_add(p, "ok", json_object_new_boolean(fixed.has_value()));
            if (!fixed) json_object_object_add(p, "error", new_string(err));
            r.event("repair", p);
        }
        if (!fixed) {
            fail(r, ErrorKind::VALIDATION_MISMATCH, summary + " (repair failed: " + err + ")");
            return;
        }
        std::cerr << "[self_test] repaired " << repairable.size() << " row count(s), retrying\n";
        r.bp = std::move(*fixed);
    }
}

void SelfTestCoordinator::verify_discrimination(Run& r, const ComposeProject& h) {
    enter(r, SelfTestState::VerifyingMutationDiscrimination);

    const std::string reference = solution_script(r.bp);
    for (int level = kMinMutationLevel; level <= kMaxMutationLevel; level++) {
        int dirty = orch_.reset_target_store(*r.live);
        if (dirty > 0) {
            std::cerr << "[self_test] " << dirty << " target table(s) not reset before level " << level << "\n";
        }

        bool caught = false;
        std::string detail;
        const std::string script = incorrect_script(r.bp, level);
        if (script == reference) {
            detail = "no mutation applied";
        } else {
            ScriptRun m = channel_.run_script(h, script);
            if (!m.succeeded) {
                caught = true;
                detail = std::string("mutated script failed (") + error_kind_name(m.kind) + ")";
            } else {
                int nf = count_failed(validator_.validate(h, r.bp));
                caught = nf > 0;
                detail = caught ? std::to_string(nf) + " query(ies) failed" : "mutated solution passed validation";
            }
        }

        json_object* p = json_object_new_object();
        json_object_object_add(p, "level", json_object_new_int(level));
        json_object_object_add(p, "caught", json_object_new_boolean(caught));
        json_object_object_add(p, "detail", new_string(detail));
        r.event("mutation_check", p);
        std::cerr << "[self_test] mutation level " << level << ": " << detail << "\n";

        if (caught) {
            r.res.discrimination_level = level;
            if (level > kMinMutationLevel && opt_.include_solutions) {
                std::string err;
                if (!orch_.rewrite_incorrect_notebook(*r.live, level, &err)) {
                    std::cerr << "[self_test] incorrect notebook not updated: " << err << "\n";
                }
            }
            break;
        }
    }

    if (!r.res.discrimination_level) {
        std::cerr << "[WARN] [self_test] mutated solutions passed validation at every level; grading may be "
                     "too permissive for '" << r.bp.title << "'\n";
    }

    int dirty = orch_.reset_target_store(*r.live);
    if (dirty > 0) std::cerr << "[self_test] " << dirty << " target table(s) not reset after self-test\n";

    enter(r, SelfTestState::Passed);
    r.res.passed = true;
    r.res.kind = ErrorKind::NONE;
    r.res.error.clear();
    r.res.session = std::move(*r.live);
    r.live.reset();

    json_object* fin = json_object_new_object();
    json_object_object_add(fin, "passed", json_object_new_boolean(1));
    json_object_object_add(fin, "lab_id", new_string(r.res.session->lab_id));
    json_object_object_add(fin, "discrimination_level",
                           r.res.discrimination_level ? json_object_new_int(*r.res.discrimination_level) : nullptr);
    r.event("finished", fin);
    std::cerr << "[self_test] PASSED lab " << r.res.session->lab_id << " after " << r.res.attempts
              << " attempt(s)\n";
}

} // namespace labwright
