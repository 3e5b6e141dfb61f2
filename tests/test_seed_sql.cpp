#include "test_common.h"
#include "sample_blueprint.h"
#include "labwright/seed_sql.h"

#include <cmath>
#include <limits>

using namespace labwright;

int main() {
    // Test 1: literals
    {
        SeedValue n;
        expect_eq_str(sql_literal(n), "NULL", "null");
        SeedValue b;
        b.kind = SeedValue::Kind::BOOL;
        b.b = true;
        expect_eq_str(sql_literal(b), "TRUE", "bool");
        expect_eq_str(sql_literal(seed_int(-42)), "-42", "int");
        expect_eq_str(sql_literal(seed_real(10.5)), "10.5", "real");
        expect_eq_str(sql_literal(seed_real(3.0)), "3.0", "whole real keeps a decimal point");
        expect_eq_str(sql_literal(seed_real(std::numeric_limits<double>::infinity())), "NULL", "inf is NULL");
        expect_eq_str(sql_literal(seed_text("o'hara")), "'o''hara'", "quotes doubled");
        expect_eq_str(sql_literal(seed_text("a\\b")), "'a\\b'", "backslash literal");
    }

    // Test 2: source script
    {
        std::string sql, err;
        expect_true(generate_source_sql(sample_blueprint(), &sql, &err), "source seed: " + err);
        expect_true(contains(sql, "CREATE TABLE IF NOT EXISTS \"raw_orders\" ("), "idempotent create");
        expect_true(contains(sql, "\"id\" INTEGER PRIMARY KEY"), "primary key");
        expect_true(contains(sql, "\"amount\" NUMERIC(12,2)"), "numeric spelling");
        expect_true(contains(sql, "INSERT INTO \"raw_orders\" (\"id\", \"customer\", \"amount\") VALUES (3, 'o''hara', 31.5);"),
                    "escaped insert");
        int inserts = 0;
        for (size_t pos = 0; (pos = sql.find("INSERT INTO", pos)) != std::string::npos; pos++) inserts++;
        expect_eq_ll(inserts, 3, "one insert per row");
    }

    // Test 3: missing sample keys become NULL
    {
        Blueprint bp = sample_blueprint();
        bp.source_tables[0].rows[1].erase("amount");
        std::string sql, err;
        expect_true(generate_source_sql(bp, &sql, &err), "seed with a gap");
        expect_true(contains(sql, "VALUES (2, 'bob', NULL);"), "absent value is NULL");
    }

    // Test 4: destructive keyword as a standalone word is rejected
    {
        Blueprint bp = sample_blueprint();
        bp.source_tables[0].rows[0]["customer"] = seed_text("please drop me");
        std::string sql, err;
        expect_true(!generate_source_sql(bp, &sql, &err), "standalone DROP rejected");
        expect_true(contains(err, "DROP"), "reason names the keyword");

        bp.source_tables[0].rows[0]["customer"] = seed_text("dropship");
        expect_true(generate_source_sql(bp, &sql, &err), "embedded keyword passes");
    }

    // Test 5: target script has the schema and the read-only role
    {
        std::string sql, err;
        expect_true(generate_target_sql(sample_blueprint(), &sql, &err), "target seed: " + err);
        expect_true(contains(sql, "CREATE TABLE IF NOT EXISTS \"orders\" ("), "target schema");
        expect_true(!contains(sql, "INSERT INTO"), "target starts empty");
        expect_true(contains(sql, "CREATE ROLE validator"), "validator role");
        expect_true(contains(sql, "GRANT SELECT ON \"orders\" TO validator;"), "per-table grant");
        expect_true(contains(sql, "ALTER DEFAULT PRIVILEGES IN SCHEMA public GRANT SELECT ON TABLES TO validator;"),
                    "future tables");
        expect_eq_str(kValidatorRole, "validator", "role name");
    }

    std::cerr << "test_seed_sql: ALL PASSED" << std::endl;
    return 0;
}
