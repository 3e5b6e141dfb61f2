#include "labwright/validator.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <regex>
#include <set>
#include <sstream>
#include <utility>

namespace labwright {

namespace {

std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

std::vector<std::string> lines_of(const std::string& s) {
    std::vector<std::string> out;
    std::istringstream in(s);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        out.push_back(line);
    }
    return out;
}

// Statement text usable inside a subquery.
std::string strip_terminator(std::string sql) {
    sql = trim_ws(sql);
    while (!sql.empty() && (sql.back() == ';' || std::isspace((unsigned char)sql.back()))) sql.pop_back();
    return sql;
}

} // namespace

bool check_query_safety(const std::string& sql, std::string* reason) {
    static const std::regex forbidden(
        R"(\b(INSERT|UPDATE|DELETE|DROP|ALTER|CREATE|GRANT|REVOKE|TRUNCATE|EXECUTE|MERGE|INTO)\b)",
        std::regex::icase);

    auto fail = [&](const std::string& why) {
        if (reason) *reason = why;
        return false;
    };

    if (sql.size() > kMaxQueryLength) {
        return fail("Query exceeds maximum length of " + std::to_string(kMaxQueryLength) + " characters");
    }
    std::string head = trim_ws(sql).substr(0, 6);
    std::transform(head.begin(), head.end(), head.begin(), [](unsigned char c) { return (char)std::toupper(c); });
    if (head != "SELECT") return fail("Query must start with SELECT");
    if (std::regex_search(sql, forbidden)) return fail("Query contains forbidden SQL keywords");
    return true;
}

std::string sanitize_db_error(const std::string& raw) {
    static const std::regex detail(R"((DETAIL|HINT|CONTEXT):.*)");
    static const std::regex position(R"((LINE \d+|POSITION \d+):.*)");

    std::string s = std::regex_replace(raw, detail, "");
    s = std::regex_replace(s, position, "");

    std::string out;
    for (const auto& line : lines_of(s)) {
        std::string t = trim_ws(line);
        if (t.empty() || t.find_first_not_of('^') == std::string::npos) continue;
        if (!out.empty()) out += "\n";
        out += t;
    }
    if (out.size() > 500) out.resize(500);
    out = trim_ws(out);
    return out.empty() ? "Query execution failed" : out;
}

int count_result_rows(const std::string& output) {
    int n = 0;
    for (const auto& line : lines_of(output)) {
        std::string t = trim_ws(line);
        if (t.empty() || t == "SET") continue;
        n++;
    }
    return n;
}

std::vector<std::string> parse_header_columns(const std::string& output) {
    for (const auto& line : lines_of(output)) {
        std::string t = trim_ws(line);
        if (t.empty() || t == "SET" || t[0] == '(') continue;
        std::vector<std::string> cols;
        std::stringstream ss(t);
        std::string c;
        while (std::getline(ss, c, '|')) cols.push_back(c);
        return cols;
    }
    return {};
}

Validator::Validator(const ExecutionChannel& channel, int query_timeout_s, std::string role)
    : channel_(channel), query_timeout_s_(query_timeout_s), role_(std::move(role)) {}

ValidationResult Validator::validate_query(const ComposeProject& p, const ValidationQuery& q) const {
    ValidationResult r;
    r.query_name = q.query_name;
    r.expected_row_count = q.expected_row_count;
    r.expected_columns = q.expected_columns;

    std::string why;
    if (!check_query_safety(q.sql, &why)) {
        std::cerr << "[validator] " << q.query_name << " rejected: " << why << "\n";
        r.failure = CheckFailure::SAFETY;
        r.error = why;
        return r;
    }

    const std::string body = strip_terminator(q.sql);

    // one "1" per result row, so empty or NULL-only rows still count
    QueryOutput rows = channel_.run_query(p, "SELECT 1 FROM (" + body + "\n) AS _q", role_,
                                          query_timeout_s_, false);
    if (!rows.ok) {
        r.failure = CheckFailure::EXECUTION;
        r.error = sanitize_db_error(rows.output);
        return r;
    }
    r.actual_row_count = count_result_rows(rows.output);

    QueryOutput probe = channel_.run_query(p, "SELECT * FROM (" + body + "\n) AS _q LIMIT 0", role_,
                                           query_timeout_s_, true);
    if (!probe.ok) {
        r.failure = CheckFailure::EXECUTION;
        r.error = sanitize_db_error(probe.output);
        return r;
    }
    r.actual_columns = parse_header_columns(probe.output);

    const std::set<std::string> actual(r.actual_columns->begin(), r.actual_columns->end());
    std::vector<std::string> missing;
    for (const auto& c : q.expected_columns) {
        if (!actual.count(c)) missing.push_back(c);
    }
    const bool rows_ok = *r.actual_row_count == q.expected_row_count;

    if (!missing.empty()) {
        r.failure = CheckFailure::COLUMNS;
        r.error = "Missing columns: ";
        for (size_t i = 0; i < missing.size(); i++) {
            if (i) r.error += ", ";
            r.error += missing[i];
        }
        if (!rows_ok) {
            r.error += "; expected " + std::to_string(q.expected_row_count) +
                       " rows, got " + std::to_string(*r.actual_row_count);
        }
        return r;
    }
    if (!rows_ok) {
        r.failure = CheckFailure::ROW_COUNT;
        r.error = "Expected " + std::to_string(q.expected_row_count) + " rows, got " +
                  std::to_string(*r.actual_row_count);
        return r;
    }

    r.passed = true;
    return r;
}

std::vector<ValidationResult> Validator::validate(const ComposeProject& p, const Blueprint& bp) const {
    std::vector<ValidationResult> out;
    out.reserve(bp.validation_queries.size());
    for (const auto& q : bp.validation_queries) {
        out.push_back(validate_query(p, q));
    }
    return out;
}

} // namespace labwright
