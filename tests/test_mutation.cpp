#include "test_common.h"
#include "labwright/mutation.h"

using namespace labwright;

static TransformStep step(const std::string& title, std::vector<std::string> tags, const std::string& code) {
    TransformStep s;
    s.title = title;
    s.skill_tags = std::move(tags);
    s.solution_code = code;
    return s;
}

static StepSignals signals(const std::string& keywords, const std::string& code) {
    StepSignals s;
    s.keywords = keywords;
    s.code = code;
    return s;
}

int main() {
    // Test 1: rule order is fixed
    {
        const auto& rules = classifier_rules();
        expect_eq_ll((long long)rules.size(), 12, "twelve rules");
        expect_eq_str(rules[0].name, "code_create_table", "DDL scan first");
        expect_eq_str(rules[1].name, "modeling_keyword", "modeling second");
        expect_eq_str(rules.back().name, "code_na", "NA scan last");
        for (const auto& r : rules) {
            expect_true(r.matches != nullptr, std::string("predicate for ") + r.name);
        }
    }

    // Test 2: individual predicates
    {
        expect_true(classify_signals(signals("", "cur.execute('create table x (id int)')")) == StepCategory::DDL, "create table");
        expect_true(classify_signals(signals("normalization", "")) == StepCategory::DATA_MIGRATION, "modeling");
        expect_true(classify_signals(signals("join customers", "")) == StepCategory::JOIN, "join keyword");
        expect_true(classify_signals(signals("cleaning", "")) == StepCategory::FILTERING, "clean keyword");
        expect_true(classify_signals(signals("aggregation", "")) == StepCategory::AGGREGATION, "agg keyword");
        expect_true(classify_signals(signals("load", "df.to_sql('t', e)")) == StepCategory::LOADING, "load + to_sql");
        expect_true(classify_signals(signals("load", "")) == StepCategory::OTHER, "load without to_sql");
        expect_true(classify_signals(signals("extract", "")) == StepCategory::EXTRACTION, "extract");
        expect_true(classify_signals(signals("date parsing", "")) == StepCategory::TRANSFORMATION, "transform");
        expect_true(classify_signals(signals("step", "a.merge(b)")) == StepCategory::JOIN, "merge scan");
        expect_true(classify_signals(signals("step", "df.groupby('x')")) == StepCategory::AGGREGATION, "groupby scan");
        expect_true(classify_signals(signals("step", "df = df.dropna()")) == StepCategory::FILTERING, "dropna scan");
        expect_true(classify_signals(signals("step", "x = 1")) == StepCategory::OTHER, "nothing matches");
    }

    // Test 3: table creation overrides tags; earlier rules beat later ones
    {
        auto ddl = step("Join helper", {"JOIN"}, "conn.execute(\"CREATE TABLE dim (id INT)\")");
        expect_true(classify_step(ddl) == StepCategory::DDL, "create table beats JOIN tag");
        auto join_agg = step("Join then aggregate", {}, "");
        expect_true(classify_step(join_agg) == StepCategory::JOIN, "join keyword before agg keyword");
        auto filt = step("Remove cancelled orders", {"TRANSFORMATION"}, "");
        expect_true(classify_step(filt) == StepCategory::FILTERING, "filter keyword before transform keyword");
    }

    // Test 4: schema-definition constraint order
    {
        std::string fk =
            "CREATE TABLE f (\n  id INT PRIMARY KEY,\n  c INT NOT NULL,\n  FOREIGN KEY (c) REFERENCES d(id),\n  CHECK (c > 0)\n)";
        std::string m = mutate_code(fk, StepCategory::DDL, 0);
        expect_true(!contains(m, "FOREIGN KEY"), "FK dropped first");
        expect_true(contains(m, "CHECK (c > 0)"), "CHECK kept");
        expect_true(contains(m, "NOT NULL"), "NOT NULL kept");

        std::string chk = "CREATE TABLE f (\n  id INT PRIMARY KEY NOT NULL,\n  c INT NOT NULL,\n  CHECK (c > 0)\n)";
        m = mutate_code(chk, StepCategory::DDL, 0);
        expect_true(!contains(m, "CHECK"), "CHECK dropped");

        std::string nn = "CREATE TABLE f (\n  id INT PRIMARY KEY NOT NULL,\n  c INT NOT NULL\n)";
        m = mutate_code(nn, StepCategory::DDL, 0);
        expect_true(contains(m, "id INT PRIMARY KEY NOT NULL"), "primary key line untouched");
        expect_true(contains(m, "  c INT\n"), "NOT NULL dropped from the non-key line");

        std::string uq = "CREATE TABLE f (\n  id INT,\n  UNIQUE (id)\n)";
        m = mutate_code(uq, StepCategory::DDL, 0);
        expect_true(!contains(m, "UNIQUE"), "UNIQUE dropped last");

        m = mutate_code(uq, StepCategory::DDL, 1);
        expect_true(!contains(m, "CREATE TABLE"), "level 1 omits the definition");
        expect_true(contains(m, "# Skipping table creation"), "placeholder emitted");
    }

    // Test 5: join
    {
        std::string code = "merged = pd.merge(orders, customers, on='customer_id', how='inner')";
        expect_true(contains(mutate_code(code, StepCategory::JOIN, 0), "how='left'"), "inner -> left");
        std::string l1 = mutate_code(code, StepCategory::JOIN, 1);
        expect_true(contains(l1, "pd.merge(orders.head(2), customers"), "first input truncated");

        std::string method = "merged = orders.merge(customers, on='customer_id')";
        expect_true(contains(mutate_code(method, StepCategory::JOIN, 0), "on='customer_id', how='left')"), "how appended");
        expect_true(contains(mutate_code(method, StepCategory::JOIN, 1), "orders.head(2).merge("), "receiver truncated");
    }

    // Test 6: filter
    {
        std::string code = "active = df[df['status'] == 'active']";
        std::string l0 = mutate_code(code, StepCategory::FILTERING, 0);
        expect_true(contains(l0, "active = df.copy()"), "filter skipped");
        std::string l1 = mutate_code(code, StepCategory::FILTERING, 1);
        expect_true(contains(l1, "active = df.head(1).copy()"), "first row only");
    }

    // Test 7: aggregation
    {
        std::string sum = "summary = df.groupby(['region', 'product']).agg({'amount': 'sum'}).reset_index()";
        std::string l0 = mutate_code(sum, StepCategory::AGGREGATION, 0);
        expect_true(contains(l0, "'count'") && !contains(l0, "'sum'"), "sum -> count");
        std::string l1 = mutate_code(sum, StepCategory::AGGREGATION, 1);
        expect_true(contains(l1, ".groupby(['product'])"), "grouping key dropped");

        std::string single = "summary = df.groupby(['region'])['amount'].mean().reset_index()";
        expect_true(contains(mutate_code(single, StepCategory::AGGREGATION, 1), ".reset_index().head(1)"),
                    "single key: result truncated");
    }

    // Test 8: load
    {
        std::string code = "df.to_sql('orders', target_engine, if_exists='replace', index=False)";
        expect_true(contains(mutate_code(code, StepCategory::LOADING, 0), "if_exists='append'"), "replace -> append");
        expect_eq_str(mutate_code(code, StepCategory::LOADING, 1),
                      "df.head(1).to_sql('orders', target_engine, if_exists='replace', index=False)", "first row only");
    }

    // Test 9: migration
    {
        std::string code = "dim = df[['id']].drop_duplicates()\ndim.to_sql('dim', target_engine, if_exists='append', index=False)";
        expect_true(contains(mutate_code(code, StepCategory::DATA_MIGRATION, 0), "dim.head(1).to_sql("), "migration first row");
        std::string nowrite = "dim = df[['id']]";
        expect_true(contains(mutate_code(nowrite, StepCategory::DATA_MIGRATION, 1), "# Skipping data migration"),
                    "full-skip fallback");
    }

    // Test 10: transformation comments out the first derived column, both levels
    {
        std::string code = "df['total'] = df['qty'] * df['price']\ndf['year'] = df['date'].dt.year";
        std::string l0 = mutate_code(code, StepCategory::TRANSFORMATION, 0);
        expect_true(contains(l0, "# SKIPPED: df['total'] = "), "first assignment skipped");
        expect_true(contains(l0, "\ndf['year'] = "), "second kept");
        expect_eq_str(mutate_code(code, StepCategory::TRANSFORMATION, 1), l0, "level 1 reuses level 0");
    }

    // Test 11: extraction / other, and the generic level-1 fallback
    {
        std::string code = "df = pd.read_sql('SELECT * FROM raw', source_engine)";
        expect_eq_str(mutate_code(code, StepCategory::EXTRACTION, 0), code, "no level-0 mutation");
        expect_eq_str(mutate_code(code, StepCategory::EXTRACTION, 1), code, "nothing to truncate");

        std::string writes = "a.to_sql('x', e)\nb.to_sql('y', e)";
        expect_eq_str(mutate_code(writes, StepCategory::OTHER, 1), "a.to_sql('x', e)\nb.head(1).to_sql('y', e)",
                      "truncate before the final write");
    }

    // Test 12: idempotent, trims, and unmatched input comes back unchanged
    {
        std::string code = "  df.to_sql('orders', target_engine, if_exists='replace')\n";
        std::string a = mutate_code(code, StepCategory::LOADING, 0);
        std::string b = mutate_code(code, StepCategory::LOADING, 0);
        expect_eq_str(a, b, "deterministic");
        expect_eq_str(mutate_code("x = 1", StepCategory::LOADING, 0), "x = 1", "no pattern, no change");

        auto empty = step("Describe data", {}, "");
        expect_eq_str(mutate_step(empty, 0), "# Describe data\n# (no solution_code available for this step)",
                      "placeholder for missing code");
    }

    std::cerr << "test_mutation: ALL PASSED" << std::endl;
    return 0;
}
