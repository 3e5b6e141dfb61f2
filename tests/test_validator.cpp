#include "test_common.h"
#include "fake_compose.h"

#include "labwright/exec_channel.h"
#include "labwright/validator.h"

#include <memory>

using namespace labwright;

static ValidationQuery query(const std::string& name, const std::string& sql, int rows,
                             std::vector<std::string> cols) {
    ValidationQuery q;
    q.query_name = name;
    q.sql = sql;
    q.expected_row_count = rows;
    q.expected_columns = std::move(cols);
    return q;
}

int main() {
    // Test 1: runtime safety predicate
    {
        std::string why;
        expect_true(check_query_safety("SELECT * FROM orders", &why), "plain select");
        expect_true(check_query_safety("  select id from orders where note = 'updated_at'", &why),
                    "keyword inside an identifier is fine");
        expect_true(!check_query_safety("SELECT 1; DROP TABLE orders", &why), "drop rejected");
        expect_eq_str(why, "Query contains forbidden SQL keywords", "drop reason");
        expect_true(!check_query_safety("WITH x AS (SELECT 1) SELECT * FROM x", &why), "must start with SELECT");
        expect_eq_str(why, "Query must start with SELECT", "prefix reason");
        expect_true(!check_query_safety("SELECT id INTO backup FROM orders", &why), "INTO rejected");
        expect_true(!check_query_safety("SELECT " + std::string(kMaxQueryLength, 'x'), &why), "too long");
        expect_eq_str(why, "Query exceeds maximum length of 4096 characters", "length reason");
    }

    // Test 2: output parsing
    {
        expect_eq_ll(count_result_rows(""), 0, "no rows");
        expect_eq_ll(count_result_rows("SET\n1\n1\n\n1\n"), 3, "SET tag and blanks skipped");
        auto cols = parse_header_columns("SET\nid|customer|amount\n(0 rows)\n");
        expect_eq_ll((long long)cols.size(), 3, "three columns");
        expect_eq_str(cols[1], "customer", "second column");
        expect_true(parse_header_columns("(0 rows)\n").empty(), "no header");
    }

    // Test 3: error sanitizing
    {
        std::string raw =
            "ERROR:  relation \"order\" does not exist\n"
            "LINE 1: SELECT * FROM order\n"
            "                      ^\n"
            "HINT:  Perhaps you meant to reference the table \"orders\".\n";
        std::string s = sanitize_db_error(raw);
        expect_eq_str(s, "ERROR:  relation \"order\" does not exist", "only the error line survives");
        expect_eq_str(sanitize_db_error("DETAIL: x\n"), "Query execution failed", "empty fallback");
        expect_eq_ll((long long)sanitize_db_error(std::string(2000, 'e')).size(), 500, "truncated");
    }

    auto fake = std::make_shared<FakeComposeDriver>();
    ExecutionChannel channel(fake, 5000);
    Validator v(channel, 5);
    ComposeProject p{"lab-test0001", "/tmp/none/docker-compose.yml", "/tmp/none"};

    // Test 4: a DROP TABLE query never reaches the store
    {
        ValidationResult r = v.validate_query(p, query("evil", "SELECT * FROM orders; DROP TABLE orders", 3, {"id"}));
        expect_true(!r.passed, "rejected");
        expect_true(r.failure == CheckFailure::SAFETY, "safety class");
        expect_true(!r.actual_row_count.has_value(), "nothing measured");
        expect_eq_ll(fake->count("exec"), 0, "zero queries executed");
    }

    // Test 5: pass, row count and column classification
    {
        fake->set_rows(3);
        ValidationResult ok = v.validate_query(p, query("all", "SELECT * FROM orders;", 3, {"id", "amount"}));
        expect_true(ok.passed, "pass: " + ok.error);
        expect_eq_ll(*ok.actual_row_count, 3, "row count");
        expect_eq_ll((long long)ok.actual_columns->size(), 3, "columns probed");

        auto calls = fake->calls();
        expect_eq_ll((long long)calls.size(), 2, "count query and probe");
        expect_eq_str(calls[0].service, kTargetDbService, "target store");
        expect_eq_str(calls[0].argv[3], "validator", "read-only role");
        expect_true(contains(calls[0].argv.back(), "SET statement_timeout = '5s'"), "server-side timeout");
        expect_true(contains(calls[0].argv.back(), "SELECT 1 FROM (SELECT * FROM orders\n) AS _q"), "terminator stripped");
        expect_true(contains(calls[1].argv.back(), "LIMIT 0"), "column probe");

        ValidationResult rc = v.validate_query(p, query("rc", "SELECT * FROM orders", 5, {"id"}));
        expect_true(rc.failure == CheckFailure::ROW_COUNT, "row count class");
        expect_eq_str(rc.error, "Expected 5 rows, got 3", "row count message");

        ValidationResult col = v.validate_query(p, query("col", "SELECT * FROM orders", 3, {"id", "total", "tax"}));
        expect_true(col.failure == CheckFailure::COLUMNS, "columns class");
        expect_eq_str(col.error, "Missing columns: total, tax", "columns message");

        ValidationResult both = v.validate_query(p, query("both", "SELECT * FROM orders", 1, {"total"}));
        expect_true(both.failure == CheckFailure::COLUMNS, "columns win over row count");
        expect_eq_str(both.error, "Missing columns: total; expected 1 rows, got 3", "combined message");
    }

    // Test 6: zero rows is a defined count, and still probes columns
    {
        fake->set_rows(0);
        ValidationResult r = v.validate_query(p, query("empty", "SELECT * FROM orders WHERE 1 = 0", 0, {"id"}));
        expect_true(r.passed, "zero expected, zero actual");
        expect_eq_ll(*r.actual_row_count, 0, "defined zero");
        expect_true(r.actual_columns.has_value(), "probe ran on empty result");

        ValidationResult miss = v.validate_query(p, query("empty_cols", "SELECT * FROM orders", 0, {"nope"}));
        expect_true(miss.failure == CheckFailure::COLUMNS, "column mismatch detected on empty result");
    }

    // Test 7: database error is an execution failure with sanitized text
    {
        fake->on_query = [](const std::string&, ProcResult* r) {
            r->exit_code = 1;
            r->output = "ERROR:  column \"x\" does not exist\nLINE 1: SELECT x FROM orders\n               ^\n";
            return true;
        };
        ValidationResult r = v.validate_query(p, query("bad", "SELECT x FROM orders", 1, {"x"}));
        expect_true(r.failure == CheckFailure::EXECUTION, "execution class");
        expect_eq_str(r.error, "ERROR:  column \"x\" does not exist", "sanitized");
        fake->on_query = nullptr;
    }

    // Test 8: order preserved across a whole blueprint
    {
        fake->set_rows(2);
        Blueprint bp;
        bp.validation_queries = {
            query("q1", "SELECT * FROM a", 2, {"id"}),
            query("q2", "SELECT 1; DELETE FROM a", 2, {"id"}),
            query("q3", "SELECT * FROM b", 9, {"id"}),
        };
        auto results = v.validate(p, bp);
        expect_eq_ll((long long)results.size(), 3, "one per query");
        expect_eq_str(results[0].query_name, "q1", "order 1");
        expect_eq_str(results[1].query_name, "q2", "order 2");
        expect_eq_str(results[2].query_name, "q3", "order 3");
        expect_true(results[0].passed, "q1 passes");
        expect_true(results[1].failure == CheckFailure::SAFETY, "q2 unsafe");
        expect_true(results[2].failure == CheckFailure::ROW_COUNT, "q3 row count");
    }

    // Test 9: a trailing line comment does not swallow the closing parenthesis
    {
        fake->set_rows(3);
        size_t before = fake->calls().size();
        ValidationResult r = v.validate_query(p, query("commented", "SELECT * FROM orders -- all rows", 3, {"id"}));
        expect_true(r.passed, "commented query passes: " + r.error);
        auto calls = fake->calls();
        expect_eq_ll((long long)(calls.size() - before), 2, "count query and probe");
        expect_true(contains(calls[before].argv.back(), "-- all rows\n) AS _q"), "count wrapper closes on next line");
        expect_true(contains(calls[before + 1].argv.back(), "-- all rows\n) AS _q LIMIT 0"),
                    "probe wrapper closes on next line");
    }

    std::cerr << "test_validator: ALL PASSED" << std::endl;
    return 0;
}
