#include "labwright/seed_sql.h"

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace labwright {

namespace {

std::string quote_ident(const std::string& name) {
    return "\"" + name + "\"";
}

std::string column_ddl(const ColumnDef& c) {
    std::string s = "    " + quote_ident(c.name) + " " + column_type_sql(c.type);
    if (c.is_primary_key) s += " PRIMARY KEY";
    if (!c.nullable && !c.is_primary_key) s += " NOT NULL";
    return s;
}

std::string create_table_sql(const std::string& table, const std::vector<ColumnDef>& cols) {
    std::string s = "CREATE TABLE IF NOT EXISTS " + quote_ident(table) + " (\n";
    for (size_t i = 0; i < cols.size(); i++) {
        if (i) s += ",\n";
        s += column_ddl(cols[i]);
    }
    s += "\n);\n";
    return s;
}

std::string insert_rows_sql(const SourceTable& t) {
    if (t.rows.empty()) return "";
    std::string quoted_cols;
    for (size_t i = 0; i < t.columns.size(); i++) {
        if (i) quoted_cols += ", ";
        quoted_cols += quote_ident(t.columns[i].name);
    }

    std::ostringstream oss;
    static const SeedValue kNull;
    for (const auto& row : t.rows) {
        oss << "INSERT INTO " << quote_ident(t.name) << " (" << quoted_cols << ") VALUES (";
        for (size_t i = 0; i < t.columns.size(); i++) {
            if (i) oss << ", ";
            auto it = row.find(t.columns[i].name);
            oss << sql_literal(it == row.end() ? kNull : it->second);
        }
        oss << ");\n";
    }
    return oss.str();
}

// Whitespace-delimited scan; quoted literals are not exempt.
bool scan_forbidden(const std::string& sql, std::string* err) {
    static const char* dangerous[] = {"DROP", "ALTER", "GRANT", "REVOKE", "TRUNCATE"};
    std::istringstream in(sql);
    std::string tok;
    while (in >> tok) {
        for (auto& c : tok) c = (char)std::toupper((unsigned char)c);
        for (const char* d : dangerous) {
            if (tok == d) {
                if (err) *err = std::string("generated SQL contains forbidden keyword: ") + d;
                return false;
            }
        }
    }
    return true;
}

} // namespace

std::string sql_literal(const SeedValue& v) {
    switch (v.kind) {
        case SeedValue::Kind::NUL:
            return "NULL";
        case SeedValue::Kind::BOOL:
            return v.b ? "TRUE" : "FALSE";
        case SeedValue::Kind::INT:
            return std::to_string(v.i);
        case SeedValue::Kind::REAL: {
            if (!std::isfinite(v.d)) return "NULL";
            std::ostringstream oss;
            oss << std::setprecision(15) << v.d;
            std::string s = oss.str();
            if (s.find_first_of(".eE") == std::string::npos) s += ".0";
            return s;
        }
        case SeedValue::Kind::TEXT: {
            std::string out = "'";
            for (char c : v.s) {
                if (c == '\'') out += "''";
                else out.push_back(c);
            }
            out += "'";
            return out;
        }
    }
    return "NULL";
}

bool generate_source_sql(const Blueprint& bp, std::string* out, std::string* err) {
    std::string sql = "-- Source database seed (generated from blueprint)\n\n";
    for (const auto& t : bp.source_tables) {
        sql += "-- Table: " + t.name + "\n";
        sql += create_table_sql(t.name, t.columns);
        sql += "\n";
        sql += insert_rows_sql(t);
        sql += "\n";
    }
    if (!scan_forbidden(sql, err)) return false;
    if (out) *out = std::move(sql);
    return true;
}

bool generate_target_sql(const Blueprint& bp, std::string* out, std::string* err) {
    std::string sql = "-- Target database seed (generated from blueprint)\n\n";
    for (const auto& t : bp.target_tables) {
        sql += "-- Table: " + t.name + "\n";
        sql += create_table_sql(t.name, t.columns);
        sql += "\n";
    }
    // only the schema part is scanned; the role block below is fixed text
    if (!scan_forbidden(sql, err)) return false;

    sql += "-- Read-only grading role\n";
    sql += "DO $$\n";
    sql += "BEGIN\n";
    sql += "  IF NOT EXISTS (SELECT FROM pg_roles WHERE rolname = 'validator') THEN\n";
    sql += "    CREATE ROLE validator WITH LOGIN PASSWORD 'validatorpass';\n";
    sql += "  END IF;\n";
    sql += "END\n";
    sql += "$$;\n\n";
    for (const auto& t : bp.target_tables) {
        sql += "GRANT SELECT ON " + quote_ident(t.name) + " TO validator;\n";
    }
    sql += "ALTER DEFAULT PRIVILEGES IN SCHEMA public GRANT SELECT ON TABLES TO validator;\n";

    if (out) *out = std::move(sql);
    return true;
}

} // namespace labwright
