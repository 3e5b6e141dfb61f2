#include "labwright/blueprint.h"
#include "labwright/json_util.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

namespace labwright {

namespace ju = json_util;

namespace {

const std::unordered_set<std::string>& reserved_words() {
    static const std::unordered_set<std::string> words = {
        "select", "insert", "update", "delete", "drop", "alter", "create",
        "grant", "revoke", "truncate", "execute", "merge", "replace",
        "union", "intersect", "except", "from", "where", "join", "table",
        "index", "view", "trigger", "procedure", "function", "database",
        "schema", "cascade", "restrict", "references", "foreign", "primary",
        "key", "constraint", "check", "default", "null", "not", "and", "or",
    };
    return words;
}

const std::set<std::string>& forbidden_query_words() {
    static const std::set<std::string> words = {
        "INSERT", "UPDATE", "DELETE", "DROP", "ALTER", "CREATE",
        "GRANT", "REVOKE", "TRUNCATE", "EXECUTE", "MERGE", "INTO",
    };
    return words;
}

constexpr size_t kMaxTotalSampleRows = 100;
constexpr size_t kMaxTotalColumns = 50;
constexpr size_t kMaxSampleTextLen = 1000;
constexpr size_t kMaxValidationQueries = 10;

std::string upper_ascii(std::string s) {
    for (auto& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    while (b < e && std::isspace((unsigned char)s[b])) b++;
    while (e > b && std::isspace((unsigned char)s[e - 1])) e--;
    return s.substr(b, e - b);
}

bool parse_columns(json_object* table, std::vector<ColumnDef>* out, std::string* err) {
    json_object* cols = ju::get_array(table, "columns");
    if (!cols) {
        *err = "table missing columns[]";
        return false;
    }
    const size_t n = json_object_array_length(cols);
    for (size_t i = 0; i < n; i++) {
        json_object* c = json_object_array_get_idx(cols, i);
        ColumnDef cd;
        cd.name = ju::get_string(c, "name").value_or("");
        auto dt = ju::get_string(c, "data_type");
        if (!dt) {
            *err = "column '" + cd.name + "' missing data_type";
            return false;
        }
        auto t = column_type_from_sql(*dt);
        if (!t) {
            *err = "column '" + cd.name + "' has unsupported data_type " + *dt;
            return false;
        }
        cd.type = *t;
        cd.nullable = ju::get_bool(c, "nullable").value_or(true);
        cd.is_primary_key = ju::get_bool(c, "is_primary_key").value_or(false);
        cd.description = ju::get_string(c, "description").value_or("");
        out->push_back(std::move(cd));
    }
    return true;
}

bool parse_seed_value(json_object* v, SeedValue* out) {
    SeedValue sv;
    if (!v) {
        sv.kind = SeedValue::Kind::NUL;
    } else if (json_object_is_type(v, json_type_boolean)) {
        sv.kind = SeedValue::Kind::BOOL;
        sv.b = json_object_get_boolean(v) != 0;
    } else if (json_object_is_type(v, json_type_int)) {
        sv.kind = SeedValue::Kind::INT;
        sv.i = json_object_get_int64(v);
    } else if (json_object_is_type(v, json_type_double)) {
        sv.kind = SeedValue::Kind::REAL;
        sv.d = json_object_get_double(v);
    } else if (json_object_is_type(v, json_type_string)) {
        sv.kind = SeedValue::Kind::TEXT;
        sv.s = json_object_get_string(v);
    } else {
        return false;
    }
    *out = std::move(sv);
    return true;
}

json_object* seed_value_to_json(const SeedValue& v) {
    switch (v.kind) {
        case SeedValue::Kind::NUL:  return nullptr;
        case SeedValue::Kind::BOOL: return json_object_new_boolean(v.b ? 1 : 0);
        case SeedValue::Kind::INT:  return json_object_new_int64(v.i);
        case SeedValue::Kind::REAL: return json_object_new_double(v.d);
        case SeedValue::Kind::TEXT: return ju::new_string(v.s);
    }
    return nullptr;
}

json_object* columns_to_json(const std::vector<ColumnDef>& cols) {
    json_object* arr = json_object_new_array();
    for (const auto& c : cols) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "name", ju::new_string(c.name));
        json_object_object_add(o, "data_type", json_object_new_string(column_type_sql(c.type)));
        json_object_object_add(o, "nullable", json_object_new_boolean(c.nullable ? 1 : 0));
        json_object_object_add(o, "is_primary_key", json_object_new_boolean(c.is_primary_key ? 1 : 0));
        json_object_object_add(o, "description", ju::new_string(c.description));
        json_object_array_add(arr, o);
    }
    return arr;
}

void check_columns(const std::string& table, const std::vector<ColumnDef>& cols,
                   std::vector<BlueprintIssue>* issues) {
    if (cols.empty() || cols.size() > 20) {
        issues->push_back({"BP-11", "table " + table + " must have 1-20 columns"});
    }
    for (const auto& c : cols) {
        if (!is_valid_identifier(c.name)) {
            issues->push_back({"BP-12", "invalid column name '" + c.name + "' in " + table});
        }
    }
}

} // namespace

const char* column_type_sql(ColumnType t) {
    switch (t) {
        case ColumnType::INTEGER:   return "INTEGER";
        case ColumnType::BIGINT:    return "BIGINT";
        case ColumnType::SERIAL:    return "SERIAL";
        case ColumnType::TEXT:      return "TEXT";
        case ColumnType::VARCHAR:   return "VARCHAR(255)";
        case ColumnType::BOOLEAN:   return "BOOLEAN";
        case ColumnType::DATE:      return "DATE";
        case ColumnType::TIMESTAMP: return "TIMESTAMP";
        case ColumnType::NUMERIC:   return "NUMERIC(12,2)";
        case ColumnType::JSON:      return "JSON";
    }
    return "TEXT";
}

std::optional<ColumnType> column_type_from_sql(const std::string& s) {
    const std::string u = upper_ascii(trim_ws(s));
    static const ColumnType all[] = {
        ColumnType::INTEGER, ColumnType::BIGINT, ColumnType::SERIAL, ColumnType::TEXT,
        ColumnType::VARCHAR, ColumnType::BOOLEAN, ColumnType::DATE, ColumnType::TIMESTAMP,
        ColumnType::NUMERIC, ColumnType::JSON,
    };
    for (ColumnType t : all) {
        if (u == column_type_sql(t)) return t;
    }
    return std::nullopt;
}

bool is_valid_identifier(const std::string& name) {
    if (name.empty() || name.size() > 63) return false;
    if (!(name[0] >= 'a' && name[0] <= 'z')) return false;
    for (char c : name) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
        if (!ok) return false;
    }
    return reserved_words().count(name) == 0;
}

std::vector<std::string> forbidden_query_tokens(const std::string& sql) {
    std::vector<std::string> found;
    const std::string u = upper_ascii(trim_ws(sql));
    if (u.rfind("SELECT", 0) != 0) {
        found.push_back("<not SELECT>");
    }
    std::set<std::string> seen;
    std::string cur;
    auto flush = [&]() {
        if (!cur.empty() && forbidden_query_words().count(cur) && seen.insert(cur).second) {
            found.push_back(cur);
        }
        cur.clear();
    };
    for (char c : u) {
        if ((c >= 'A' && c <= 'Z') || c == '_') cur.push_back(c);
        else flush();
    }
    flush();
    return found;
}

bool blueprint_from_json(const std::string& json, Blueprint* out, std::string* err) {
    ju::Doc d = ju::parse(json);
    if (!d) {
        if (err) *err = "invalid JSON";
        return false;
    }
    return blueprint_from_json_object(d.root, out, err);
}

bool blueprint_from_json_object(json_object* root, Blueprint* out, std::string* err) {
    std::string local_err;
    if (!err) err = &local_err;
    if (!out) return false;
    if (!root || !json_object_is_type(root, json_type_object)) {
        *err = "blueprint is not a JSON object";
        return false;
    }

    Blueprint bp;
    bp.title = ju::get_string(root, "title").value_or("");
    bp.description = ju::get_string(root, "description").value_or("");
    bp.difficulty = ju::get_string(root, "difficulty").value_or("beginner");
    bp.estimated_minutes = (int)ju::get_int(root, "estimated_minutes").value_or(30);
    bp.learning_objectives = ju::get_string_array(root, "learning_objectives");
    bp.business_context = ju::get_string(root, "business_context").value_or("");
    bp.lab_instructions = ju::get_string(root, "lab_instructions").value_or("");

    json_object* src = ju::get_array(root, "source_tables");
    json_object* tgt = ju::get_array(root, "target_tables");
    json_object* steps = ju::get_array(root, "transformation_steps");
    json_object* queries = ju::get_array(root, "validation_queries");
    if (!src || !tgt || !steps || !queries) {
        *err = "blueprint requires source_tables, target_tables, transformation_steps and validation_queries arrays";
        return false;
    }

    for (size_t i = 0; i < json_object_array_length(src); i++) {
        json_object* t = json_object_array_get_idx(src, i);
        SourceTable st;
        st.name = ju::get_string(t, "table_name").value_or("");
        st.description = ju::get_string(t, "description").value_or("");
        if (!parse_columns(t, &st.columns, err)) {
            *err = "source table '" + st.name + "': " + *err;
            return false;
        }
        json_object* rows = ju::get_array(t, "sample_data");
        if (rows) {
            for (size_t r = 0; r < json_object_array_length(rows); r++) {
                json_object* ro = json_object_array_get_idx(rows, r);
                if (!ro || !json_object_is_type(ro, json_type_object)) {
                    *err = "source table '" + st.name + "': sample row is not an object";
                    return false;
                }
                SampleRow row;
                json_object_object_foreach(ro, key, val) {
                    SeedValue sv;
                    if (!parse_seed_value(val, &sv)) {
                        *err = "source table '" + st.name + "': unsupported value for " + key;
                        return false;
                    }
                    row[key] = std::move(sv);
                }
                st.rows.push_back(std::move(row));
            }
        }
        bp.source_tables.push_back(std::move(st));
    }

    for (size_t i = 0; i < json_object_array_length(tgt); i++) {
        json_object* t = json_object_array_get_idx(tgt, i);
        TargetTable tt;
        tt.name = ju::get_string(t, "table_name").value_or("");
        tt.description = ju::get_string(t, "description").value_or("");
        if (!parse_columns(t, &tt.columns, err)) {
            *err = "target table '" + tt.name + "': " + *err;
            return false;
        }
        bp.target_tables.push_back(std::move(tt));
    }

    for (size_t i = 0; i < json_object_array_length(steps); i++) {
        json_object* s = json_object_array_get_idx(steps, i);
        TransformStep ts;
        ts.step_number = (int)ju::get_int(s, "step_number").value_or((int64_t)i + 1);
        ts.title = ju::get_string(s, "title").value_or("");
        ts.description = ju::get_string(s, "description").value_or("");
        ts.hint = ju::get_string(s, "hint").value_or("");
        ts.solution_code = ju::get_string(s, "solution_code").value_or("");
        ts.skill_tags = ju::get_string_array(s, "skill_tags");
        bp.steps.push_back(std::move(ts));
    }

    for (size_t i = 0; i < json_object_array_length(queries); i++) {
        json_object* q = json_object_array_get_idx(queries, i);
        ValidationQuery vq;
        vq.query_name = ju::get_string(q, "query_name").value_or("");
        vq.sql = ju::get_string(q, "sql").value_or("");
        auto erc = ju::get_int(q, "expected_row_count");
        if (!erc) {
            *err = "validation query '" + vq.query_name + "' missing expected_row_count";
            return false;
        }
        vq.expected_row_count = (int)*erc;
        vq.expected_columns = ju::get_string_array(q, "expected_columns");
        vq.description = ju::get_string(q, "description").value_or("");
        bp.validation_queries.push_back(std::move(vq));
    }

    *out = std::move(bp);
    return true;
}

json_object* blueprint_to_json(const Blueprint& bp) {
    json_object* root = json_object_new_object();
    json_object_object_add(root, "title", ju::new_string(bp.title));
    json_object_object_add(root, "description", ju::new_string(bp.description));
    json_object_object_add(root, "difficulty", ju::new_string(bp.difficulty));
    json_object_object_add(root, "estimated_minutes", json_object_new_int(bp.estimated_minutes));
    json_object_object_add(root, "learning_objectives", ju::new_string_array(bp.learning_objectives));
    json_object_object_add(root, "business_context", ju::new_string(bp.business_context));

    json_object* src = json_object_new_array();
    for (const auto& t : bp.source_tables) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "table_name", ju::new_string(t.name));
        json_object_object_add(o, "description", ju::new_string(t.description));
        json_object_object_add(o, "columns", columns_to_json(t.columns));
        json_object* rows = json_object_new_array();
        for (const auto& row : t.rows) {
            json_object* ro = json_object_new_object();
            for (const auto& kv : row) {
                json_object_object_add(ro, kv.first.c_str(), seed_value_to_json(kv.second));
            }
            json_object_array_add(rows, ro);
        }
        json_object_object_add(o, "sample_data", rows);
        json_object_array_add(src, o);
    }
    json_object_object_add(root, "source_tables", src);

    json_object* tgt = json_object_new_array();
    for (const auto& t : bp.target_tables) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "table_name", ju::new_string(t.name));
        json_object_object_add(o, "description", ju::new_string(t.description));
        json_object_object_add(o, "columns", columns_to_json(t.columns));
        json_object_array_add(tgt, o);
    }
    json_object_object_add(root, "target_tables", tgt);

    json_object* steps = json_object_new_array();
    for (const auto& s : bp.steps) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "step_number", json_object_new_int(s.step_number));
        json_object_object_add(o, "title", ju::new_string(s.title));
        json_object_object_add(o, "description", ju::new_string(s.description));
        json_object_object_add(o, "hint", ju::new_string(s.hint));
        json_object_object_add(o, "solution_code", ju::new_string(s.solution_code));
        json_object_object_add(o, "skill_tags", ju::new_string_array(s.skill_tags));
        json_object_array_add(steps, o);
    }
    json_object_object_add(root, "transformation_steps", steps);

    json_object* queries = json_object_new_array();
    for (const auto& q : bp.validation_queries) {
        json_object* o = json_object_new_object();
        json_object_object_add(o, "query_name", ju::new_string(q.query_name));
        json_object_object_add(o, "sql", ju::new_string(q.sql));
        json_object_object_add(o, "expected_row_count", json_object_new_int(q.expected_row_count));
        json_object_object_add(o, "expected_columns", ju::new_string_array(q.expected_columns));
        json_object_object_add(o, "description", ju::new_string(q.description));
        json_object_array_add(queries, o);
    }
    json_object_object_add(root, "validation_queries", queries);

    json_object_object_add(root, "lab_instructions", ju::new_string(bp.lab_instructions));
    return root;
}

std::string blueprint_to_json_string(const Blueprint& bp) {
    return ju::to_string_and_put(blueprint_to_json(bp));
}

std::vector<BlueprintIssue> check_blueprint(const Blueprint& bp) {
    std::vector<BlueprintIssue> issues;

    if (bp.source_tables.empty() || bp.source_tables.size() > 5) {
        issues.push_back({"BP-01", "blueprint must have 1-5 source tables"});
    }
    if (bp.target_tables.empty() || bp.target_tables.size() > 5) {
        issues.push_back({"BP-02", "blueprint must have 1-5 target tables"});
    }
    if (bp.steps.empty() || bp.steps.size() > 20) {
        issues.push_back({"BP-03", "blueprint must have 1-20 transformation steps"});
    }
    if (bp.validation_queries.empty() || bp.validation_queries.size() > kMaxValidationQueries) {
        issues.push_back({"BP-04", "blueprint must have 1-10 validation queries"});
    }

    size_t total_rows = 0;
    size_t total_cols = 0;
    for (const auto& t : bp.source_tables) {
        if (!is_valid_identifier(t.name)) {
            issues.push_back({"BP-10", "invalid source table name '" + t.name + "'"});
        }
        check_columns(t.name, t.columns, &issues);
        if (t.rows.size() < 3 || t.rows.size() > 20) {
            issues.push_back({"BP-13", "source table " + t.name + " must have 3-20 sample rows"});
        }
        total_rows += t.rows.size();
        total_cols += t.columns.size();
        for (const auto& row : t.rows) {
            for (const auto& kv : row) {
                if (kv.second.kind == SeedValue::Kind::TEXT && kv.second.s.size() > kMaxSampleTextLen) {
                    issues.push_back({"BP-14", "sample value " + t.name + "." + kv.first + " exceeds 1000 characters"});
                }
            }
        }
    }
    for (const auto& t : bp.target_tables) {
        if (!is_valid_identifier(t.name)) {
            issues.push_back({"BP-10", "invalid target table name '" + t.name + "'"});
        }
        check_columns(t.name, t.columns, &issues);
        total_cols += t.columns.size();
    }
    if (total_rows > kMaxTotalSampleRows) {
        issues.push_back({"BP-20", "blueprint has " + std::to_string(total_rows) + " total sample rows (max 100)"});
    }
    if (total_cols > kMaxTotalColumns) {
        issues.push_back({"BP-21", "blueprint has " + std::to_string(total_cols) + " total columns (max 50)"});
    }

    for (const auto& s : bp.steps) {
        if (s.step_number < 1 || s.step_number > 20) {
            issues.push_back({"BP-30", "step number out of range: " + std::to_string(s.step_number)});
        }
        if (s.skill_tags.size() > 5) {
            issues.push_back({"BP-31", "step " + std::to_string(s.step_number) + " has more than 5 skill tags"});
        }
    }

    for (const auto& q : bp.validation_queries) {
        if (q.expected_row_count < 0) {
            issues.push_back({"BP-40", "query '" + q.query_name + "' has negative expected_row_count"});
        }
        if (q.expected_columns.empty()) {
            issues.push_back({"BP-41", "query '" + q.query_name + "' has no expected_columns"});
        }
        auto bad = forbidden_query_tokens(q.sql);
        if (!bad.empty()) {
            std::string joined;
            for (size_t i = 0; i < bad.size(); i++) {
                if (i) joined += ", ";
                joined += bad[i];
            }
            issues.push_back({"BP-42", "query '" + q.query_name + "' is not SELECT-only: " + joined});
        }
    }

    return issues;
}

} // namespace labwright
