#include "labwright/mutation.h"

#include <initializer_list>
#include <regex>
#include <sstream>

namespace labwright {

namespace {

std::string lower_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'A' && c <= 'Z') c = (char)(c - 'A' + 'a');
    }
    return s;
}

std::string upper_ascii(std::string s) {
    for (char& c : s) {
        if (c >= 'a' && c <= 'z') c = (char)(c - 'a' + 'A');
    }
    return s;
}

std::string trim_ws(const std::string& s) {
    size_t b = 0, e = s.size();
    auto ws = [](char c) { return c == ' ' || c == '\t' || c == '\n' || c == '\r'; };
    while (b < e && ws(s[b])) b++;
    while (e > b && ws(s[e - 1])) e--;
    return s.substr(b, e - b);
}

bool contains(const std::string& hay, const char* needle) {
    return hay.find(needle) != std::string::npos;
}

bool contains_any(const std::string& hay, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (contains(hay, n)) return true;
    }
    return false;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char c : s) {
        if (c == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    out.push_back(cur);
    return out;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i) out += "\n";
        out += lines[i];
    }
    return out;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string replace_first(const std::string& s, const std::string& from, const std::string& to) {
    size_t pos = s.find(from);
    if (pos == std::string::npos) return s;
    std::string out = s;
    out.replace(pos, from.size(), to);
    return out;
}

std::string regex_first(const std::string& s, const std::regex& re, const char* fmt) {
    return std::regex_replace(s, re, fmt, std::regex_constants::format_first_only);
}

const std::regex& re_foreign_key() {
    static const std::regex re(R"(,?\s*FOREIGN\s+KEY\s*\([^)]*\)\s*REFERENCES\s+\w+\s*\([^)]*\))",
                               std::regex::icase);
    return re;
}
const std::regex& re_check() {
    static const std::regex re(R"(,?\s*CHECK\s*\([^)]*\))", std::regex::icase);
    return re;
}
const std::regex& re_not_null() {
    static const std::regex re(R"(\s+NOT\s+NULL)", std::regex::icase);
    return re;
}
const std::regex& re_unique() {
    static const std::regex re(R"(,?\s*UNIQUE\s*\([^)]*\))", std::regex::icase);
    return re;
}
const std::regex& re_to_sql() {
    static const std::regex re(R"((\w+)(\.to_sql\())");
    return re;
}
const std::regex& re_how_inner() {
    static const std::regex re(R"(how\s*=\s*['"]inner['"])");
    return re;
}
const std::regex& re_if_exists_replace() {
    static const std::regex re(R"(if_exists\s*=\s*['"]replace['"])");
    return re;
}
const std::regex& re_groupby_list() {
    static const std::regex re(R"(\.groupby\(\[([^\]]+)\]\))");
    return re;
}

// ".head(1)" in front of the first `<name>.to_sql(`.
std::string head_before_first_to_sql(const std::string& code) {
    return regex_first(code, re_to_sql(), "$1.head(1)$2");
}

// ".head(1)" in front of the last `<name>.to_sql(`.
std::string head_before_last_to_sql(const std::string& code) {
    std::smatch last;
    bool found = false;
    for (auto it = std::sregex_iterator(code.begin(), code.end(), re_to_sql());
         it != std::sregex_iterator(); ++it) {
        last = *it;
        found = true;
    }
    if (!found) return code;
    size_t insert_at = (size_t)last.position(2);
    std::string out = code;
    out.insert(insert_at, ".head(1)");
    return out;
}

// Drop the first column of a multi-column groupby list.
std::string drop_groupby_key(const std::string& code) {
    std::smatch m;
    if (!std::regex_search(code, m, re_groupby_list())) return code;
    std::vector<std::string> cols;
    std::stringstream ss(m[1].str());
    std::string item;
    while (std::getline(ss, item, ',')) cols.push_back(trim_ws(item));
    if (cols.size() < 2) return code;
    std::string rest;
    for (size_t i = 1; i < cols.size(); i++) {
        if (i > 1) rest += ", ";
        rest += cols[i];
    }
    return replace_all(code, m[0].str(), ".groupby([" + rest + "])");
}

// Output and input frame names of a filter statement such as
// `active = df[df['x'] == 1]`.
void filter_names(const std::string& code, std::string* out_var, std::string* in_var) {
    static const std::regex lhs(R"((\w+)\s*=)");
    static const std::regex rhs(R"(=\s*(\w+)\[)");
    std::smatch m;
    *out_var = "filtered";
    *in_var = "df";
    if (std::regex_search(code, m, lhs, std::regex_constants::match_continuous)) *out_var = m[1].str();
    if (std::regex_search(code, m, rhs)) *in_var = m[1].str();
}

std::string mutate_ddl_l0(const std::string& code) {
    std::string m = regex_first(code, re_foreign_key(), "");
    if (m != code) return m;
    m = regex_first(code, re_check(), "");
    if (m != code) return m;

    auto lines = split_lines(code);
    for (auto& line : lines) {
        std::string up = upper_ascii(line);
        if (contains(up, "NOT NULL") && !contains(up, "PRIMARY")) {
            line = std::regex_replace(line, re_not_null(), "");
            return join_lines(lines);
        }
    }

    return regex_first(code, re_unique(), "");
}

std::string mutate_join_l0(const std::string& code) {
    if (contains(code, "how='inner'")) return replace_all(code, "how='inner'", "how='left'");
    if (contains(code, "how=\"inner\"")) return replace_all(code, "how=\"inner\"", "how=\"left\"");
    std::string m = std::regex_replace(code, re_how_inner(), "how='left'");
    if (m != code) return m;
    if (contains(code, ".merge(")) {
        static const std::regex method_merge(R"((\.merge\([^)]*)\))");
        m = regex_first(code, method_merge, "$1, how='left')");
        if (m != code) return m;
    }
    return code;
}

std::string mutate_filter_l0(const std::string& code) {
    std::string out_var, in_var;
    filter_names(code, &out_var, &in_var);
    return "# Skipping filter, assuming all data is relevant\n" +
           out_var + " = " + in_var + ".copy()\n" +
           "print(f'Rows (no filter applied): {len(" + out_var + ")}')";
}

std::string mutate_aggregation_l0(const std::string& code) {
    std::string m = replace_first(code, "'sum'", "'count'");
    if (m != code) return m;
    m = replace_first(code, "\"sum\"", "\"count\"");
    if (m != code) return m;
    return drop_groupby_key(code);
}

std::string mutate_loading_l0(const std::string& code) {
    if (contains(code, "if_exists='replace'")) return replace_all(code, "if_exists='replace'", "if_exists='append'");
    if (contains(code, "if_exists=\"replace\"")) return replace_all(code, "if_exists=\"replace\"", "if_exists=\"append\"");
    return std::regex_replace(code, re_if_exists_replace(), "if_exists='append'");
}

std::string mutate_transform_l0(const std::string& code) {
    auto lines = split_lines(code);
    for (auto& line : lines) {
        size_t br = line.find("['");
        size_t eq = line.find('=');
        if (br != std::string::npos && eq != std::string::npos && eq > br) {
            line = "# SKIPPED: " + trim_ws(line);
            return join_lines(lines);
        }
    }
    return code;
}

std::string mutate_level0(const std::string& code, StepCategory c) {
    switch (c) {
        case StepCategory::DDL:            return mutate_ddl_l0(code);
        case StepCategory::DATA_MIGRATION: return head_before_first_to_sql(code);
        case StepCategory::JOIN:           return mutate_join_l0(code);
        case StepCategory::FILTERING:      return mutate_filter_l0(code);
        case StepCategory::AGGREGATION:    return mutate_aggregation_l0(code);
        case StepCategory::LOADING:        return mutate_loading_l0(code);
        case StepCategory::TRANSFORMATION: return mutate_transform_l0(code);
        case StepCategory::EXTRACTION:
        case StepCategory::OTHER:
            break;
    }
    return code;
}

std::string mutate_level1(const std::string& code, StepCategory c) {
    std::string m = code;
    switch (c) {
        case StepCategory::DDL:
            return "# Skipping table creation for now\nprint('TODO: create table')";

        case StepCategory::DATA_MIGRATION:
            m = head_before_first_to_sql(code);
            if (m != code) return m;
            return "# Skipping data migration for now\nprint('TODO: migrate data')";

        case StepCategory::LOADING:
            m = head_before_first_to_sql(code);
            break;

        case StepCategory::AGGREGATION: {
            m = drop_groupby_key(code);
            if (m == code) {
                static const std::regex reset(R"((\.reset_index\(\)))");
                m = regex_first(code, reset, "$1.head(1)");
            }
            break;
        }

        case StepCategory::FILTERING: {
            std::string out_var, in_var;
            filter_names(code, &out_var, &in_var);
            return "# Aggressive filter, keeping only the first row\n" +
                   out_var + " = " + in_var + ".head(1).copy()\n" +
                   "print(f'After filtering: {len(" + out_var + ")} rows')";
        }

        case StepCategory::JOIN: {
            static const std::regex pd_merge(R"((pd\.merge\()(\w+))");
            static const std::regex method_merge(R"((\w+)(\.merge\())");
            m = regex_first(code, pd_merge, "$1$2.head(2)");
            if (m == code) m = regex_first(code, method_merge, "$1.head(2)$2");
            break;
        }

        case StepCategory::TRANSFORMATION:
            m = mutate_transform_l0(code);
            break;

        case StepCategory::EXTRACTION:
        case StepCategory::OTHER:
            break;
    }
    if (m != code) return m;

    // generic fallback: truncate right before the final write
    return head_before_last_to_sql(code);
}

// --- classifier predicates, in rule order ---

bool rule_ddl(const StepSignals& s) {
    return contains(s.code, "create table");
}
bool rule_data_migration(const StepSignals& s) {
    return contains_any(s.keywords, {"normaliz", "migrat", "populat", "primary_key", "foreign_key",
                                     "star_schema", "surrogate", "constraint", "scd"});
}
bool rule_join(const StepSignals& s) {
    return contains_any(s.keywords, {"join", "merg"});
}
bool rule_filtering(const StepSignals& s) {
    return contains_any(s.keywords, {"filter", "clean", "drop", "remove", "exclude"});
}
bool rule_aggregation(const StepSignals& s) {
    return contains_any(s.keywords, {"aggregat", "groupby", "group_by", "group by", "agg"});
}
bool rule_loading(const StepSignals& s) {
    return contains_any(s.keywords, {"load", "write", "insert", "target"}) && contains(s.code, "to_sql");
}
bool rule_extraction(const StepSignals& s) {
    return contains_any(s.keywords, {"extract", "read", "source", "ingest"});
}
bool rule_transformation(const StepSignals& s) {
    return contains_any(s.keywords, {"transform", "calculat", "comput", "date", "column"});
}
bool rule_code_merge(const StepSignals& s) {
    return contains(s.code, ".merge(");
}
bool rule_code_to_sql(const StepSignals& s) {
    return contains(s.code, ".to_sql(");
}
bool rule_code_groupby(const StepSignals& s) {
    return contains(s.code, ".groupby(");
}
bool rule_code_na(const StepSignals& s) {
    return contains(s.code, ".dropna(") || contains(s.code, ".fillna(");
}

} // namespace

const char* step_category_name(StepCategory c) {
    switch (c) {
        case StepCategory::DDL:            return "DDL";
        case StepCategory::DATA_MIGRATION: return "DATA_MIGRATION";
        case StepCategory::JOIN:           return "JOIN";
        case StepCategory::FILTERING:      return "FILTERING";
        case StepCategory::AGGREGATION:    return "AGGREGATION";
        case StepCategory::LOADING:        return "LOADING";
        case StepCategory::TRANSFORMATION: return "TRANSFORMATION";
        case StepCategory::EXTRACTION:     return "EXTRACTION";
        case StepCategory::OTHER:          return "OTHER";
    }
    return "OTHER";
}

StepSignals step_signals(const TransformStep& step) {
    StepSignals s;
    for (const auto& t : step.skill_tags) {
        s.keywords += lower_ascii(t);
        s.keywords += " ";
    }
    s.keywords += lower_ascii(step.title);
    s.code = lower_ascii(step.solution_code);
    return s;
}

const std::vector<ClassifierRule>& classifier_rules() {
    static const std::vector<ClassifierRule> rules = {
        {"code_create_table", StepCategory::DDL,            rule_ddl},
        {"modeling_keyword",  StepCategory::DATA_MIGRATION, rule_data_migration},
        {"join_keyword",      StepCategory::JOIN,           rule_join},
        {"filter_keyword",    StepCategory::FILTERING,      rule_filtering},
        {"agg_keyword",       StepCategory::AGGREGATION,    rule_aggregation},
        {"load_keyword",      StepCategory::LOADING,        rule_loading},
        {"extract_keyword",   StepCategory::EXTRACTION,     rule_extraction},
        {"transform_keyword", StepCategory::TRANSFORMATION, rule_transformation},
        {"code_merge",        StepCategory::JOIN,           rule_code_merge},
        {"code_to_sql",       StepCategory::LOADING,        rule_code_to_sql},
        {"code_groupby",      StepCategory::AGGREGATION,    rule_code_groupby},
        {"code_na",           StepCategory::FILTERING,      rule_code_na},
    };
    return rules;
}

StepCategory classify_signals(const StepSignals& s) {
    for (const auto& r : classifier_rules()) {
        if (r.matches(s)) return r.category;
    }
    return StepCategory::OTHER;
}

StepCategory classify_step(const TransformStep& step) {
    return classify_signals(step_signals(step));
}

std::string mutate_code(const std::string& code, StepCategory category, int level) {
    const std::string c = trim_ws(code);
    if (c.empty()) return c;
    if (level >= 1) return mutate_level1(c, category);
    return mutate_level0(c, category);
}

std::string mutate_step(const TransformStep& step, int level) {
    const std::string code = trim_ws(step.solution_code);
    if (code.empty()) {
        return "# " + step.title + "\n# (no solution_code available for this step)";
    }
    return mutate_code(code, classify_step(step), level);
}

} // namespace labwright
