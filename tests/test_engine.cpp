#include <framecheck/schema/builder.hpp>
#include <framecheck/validate/engine.hpp>

#include <catch2/catch_test_macros.hpp>

#include <functional>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

using namespace framecheck;
using namespace framecheck::schema;
using namespace framecheck::validate;

namespace {

auto trades_table() -> Table {
    Table table;
    table.add_column("id", Column<std::int64_t>{1, 2, 3});
    table.add_column("symbol", Column<Categorical>{"AAPL", "MSFT", "AAPL"});
    table.add_column("price", Column<double>{10.0, 20.5, 30.0});
    return table;
}

auto trades_schema() -> SchemaBuilder {
    SchemaBuilder builder("Trades");
    builder.column("id", DType::Int64, {.unique = true})
        .column("symbol", DType::Categorical)
        .column("price", DType::Float64, {.gt = 0});
    return builder;
}

auto constraints(const Issues& issues) -> std::vector<Constraint> {
    std::vector<Constraint> out;
    for (const auto& issue : issues) {
        out.push_back(issue.constraint);
    }
    return out;
}

auto per_row(std::string name, std::function<bool(std::int64_t)> pred) -> ColumnCheck {
    return ColumnCheck{
        .name = std::move(name), .fn = [pred](const ColumnEntry& entry) -> CheckResult {
            const auto& col = std::get<Column<std::int64_t>>(*entry.column);
            PerRow result;
            for (auto value : col) {
                result.passed.push_back(pred(value));
            }
            return result;
        }};
}

}  // namespace

TEST_CASE("A conforming table validates cleanly", "[validate][engine]") {
    auto schema = trades_schema().strict().build_or_throw();
    auto result = validate::validate(*schema, trades_table());
    REQUIRE(result.ok());
    REQUIRE(result.table.column_names() == std::vector<std::string>{"id", "symbol", "price"});
}

TEST_CASE("Structural pass", "[validate][engine]") {
    SECTION("a missing required column is one structural issue") {
        auto schema = trades_schema().build_or_throw();
        auto table = trades_table();
        table.select_columns({0, 2});

        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].kind == IssueKind::Structural);
        REQUIRE(result.issues[0].constraint == Constraint::MissingColumn);
        REQUIRE(result.issues[0].field == "symbol");
    }

    SECTION("a missing optional column is fine") {
        auto schema = trades_schema()
                          .column("venue", DType::String, {.optional = true})
                          .build_or_throw();
        REQUIRE(validate::validate(*schema, trades_table()).ok());
    }

    SECTION("strict reports undeclared columns in table order") {
        auto schema = trades_schema().strict().build_or_throw();
        auto table = trades_table();
        table.add_column("zeta", Column<std::int64_t>{0, 0, 0});
        table.add_column("alpha", Column<std::int64_t>{0, 0, 0});

        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 2);
        REQUIRE(result.issues[0].constraint == Constraint::UnexpectedColumn);
        REQUIRE(result.issues[0].field == "zeta");
        REQUIRE(result.issues[1].field == "alpha");
    }

    SECTION("undeclared columns are ignored without strict") {
        auto schema = trades_schema().build_or_throw();
        auto table = trades_table();
        table.add_column("extra", Column<std::int64_t>{0, 0, 0});
        auto result = validate::validate(*schema, table);
        REQUIRE(result.ok());
        REQUIRE(result.table.position("extra").has_value());
    }

    SECTION("filter drops undeclared columns and follows declared order") {
        auto schema = SchemaBuilder()
                          .column("price", DType::Float64)
                          .column("id", DType::Int64)
                          .filter()
                          .strict()
                          .build_or_throw();
        auto table = trades_table();
        auto result = validate::validate(*schema, table);
        REQUIRE(result.ok());
        REQUIRE(result.table.column_names() == std::vector<std::string>{"price", "id"});
        REQUIRE(table.columns.size() == 3);
    }

    SECTION("ordered flags declared columns out of order") {
        auto schema = SchemaBuilder()
                          .column("price", DType::Float64)
                          .column("id", DType::Int64)
                          .strict()
                          .ordered()
                          .build_or_throw();
        auto table = trades_table();
        table.select_columns({0, 2});
        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].kind == IssueKind::Structural);
        REQUIRE(result.issues[0].constraint == Constraint::ColumnOrder);
        REQUIRE(result.issues[0].message == "columns appear as [id, price], expected [price, id]");
    }

    SECTION("alias and regex fields") {
        Table table;
        table.add_column("Price (USD)", Column<double>{1.0});
        table.add_column("m_1", Column<std::int64_t>{1});
        table.add_column("m_2", Column<std::int64_t>{-1});

        auto schema = SchemaBuilder()
                          .column("price", DType::Float64, {.alias = "Price (USD)"})
                          .column("metrics", DType::Int64,
                                  {.ge = 0, .alias = "m_\\d+", .regex = true})
                          .strict()
                          .build_or_throw();
        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].constraint == Constraint::Ge);
        REQUIRE(result.issues[0].field == "m_2");

        table.select_columns({0});
        result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].constraint == Constraint::MissingColumn);
        REQUIRE(result.issues[0].message == "no column matches pattern `m_\\d+`");
    }
}

TEST_CASE("A gt violation names the field and row", "[validate][engine]") {
    auto schema = SchemaBuilder()
                      .column("col1", DType::Int64)
                      .column("col3", DType::Float64, {.gt = 0})
                      .build_or_throw();
    Table table;
    table.add_column("col1", Column<std::int64_t>{1, 2});
    table.add_column("col3", Column<double>{-1.0, 2.0});

    auto result = validate::validate(*schema, table);
    REQUIRE(result.issues.size() == 1);
    const auto& issue = result.issues[0];
    REQUIRE(issue.kind == IssueKind::Constraint);
    REQUIRE(issue.constraint == Constraint::Gt);
    REQUIRE(issue.field == "col3");
    REQUIRE(issue.count == 1);
    REQUIRE(issue.rows == std::vector<std::size_t>{0});
    REQUIRE(issue.values == std::vector<std::string>{"-1"});
    REQUIRE(issue.format() == "[constraint/gt] column `col3`: values must be > 0 (1 row, rows [0], "
                              "values [-1])");
}

TEST_CASE("Every failing field is reported", "[validate][engine]") {
    auto schema = SchemaBuilder()
                      .column("a", DType::Int64, {.ge = 0})
                      .column("b", DType::String, {.str_startswith = "x"})
                      .column("c", DType::Float64, {.lt = 1})
                      .build_or_throw();
    Table table;
    table.add_column("a", Column<std::int64_t>{-1, 5});
    table.add_column("b", Column<std::string>{"xa", "yb"});
    table.add_column("c", Column<double>{0.5, 1.0});

    auto result = validate::validate(*schema, table);
    REQUIRE(constraints(result.issues) ==
            std::vector<Constraint>{Constraint::Ge, Constraint::StrStartswith, Constraint::Lt});
    REQUIRE(result.issues[1].field == "b");
    REQUIRE(result.issues[1].rows == std::vector<std::size_t>{1});
}

TEST_CASE("Uniqueness reports every repeat after the first", "[validate][engine]") {
    auto schema = SchemaBuilder().column("k", DType::String, {.unique = true}).build_or_throw();
    Table table;
    table.add_column("k", Column<std::string>{"a", "b", "a", "c", "a", "b"});

    auto result = validate::validate(*schema, table);
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues[0].constraint == Constraint::Unique);
    REQUIRE(result.issues[0].count == 3);
    REQUIRE(result.issues[0].rows == std::vector<std::size_t>{2, 4, 5});
    REQUIRE(result.issues[0].values == std::vector<std::string>{"\"a\"", "\"a\"", "\"b\""});
}

TEST_CASE("Per-field checks run in a fixed order", "[validate][engine]") {
    auto schema = SchemaBuilder()
                      .column("x", DType::Int64,
                              {.unique = true,
                               .gt = 0,
                               .le = 10,
                               .isin = std::vector<Scalar>{1, 2, 3},
                               .notin = std::vector<Scalar>{2}})
                      .check({"x"}, per_row("even", [](std::int64_t v) { return v % 2 == 0; }))
                      .build_or_throw();
    Table table;
    table.add_column("x", Column<std::int64_t>{0, 2, 2, 11, 0}, {true, true, true, true, false});

    auto result = validate::validate(*schema, table);
    REQUIRE(constraints(result.issues) ==
            std::vector<Constraint>{Constraint::Nullable, Constraint::Gt, Constraint::Le,
                                    Constraint::Isin, Constraint::Notin, Constraint::Unique,
                                    Constraint::Check});
    REQUIRE(result.issues[0].rows == std::vector<std::size_t>{4});
    // Null rows are left to the nullability check.
    REQUIRE(result.issues[1].rows == std::vector<std::size_t>{0});
    REQUIRE(result.issues[3].rows == std::vector<std::size_t>{0, 3});
    REQUIRE(result.issues[6].message == "failed check `even`");
    REQUIRE(result.issues[6].rows == std::vector<std::size_t>{3});
}

TEST_CASE("NaN counts as null", "[validate][engine]") {
    auto schema = SchemaBuilder().column("f", DType::Float64, {.ge = 0}).build_or_throw();
    Table table;
    table.add_column("f", Column<double>{1.0, std::numeric_limits<double>::quiet_NaN()});

    auto result = validate::validate(*schema, table);
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues[0].constraint == Constraint::Nullable);
    REQUIRE(result.issues[0].rows == std::vector<std::size_t>{1});
}

TEST_CASE("Type mismatches", "[validate][engine]") {
    auto builder = SchemaBuilder().column("n", DType::Int64, {.gt = 0});
    Table table;
    table.add_column("n", Column<std::string>{"1", "-2", "x"});

    SECTION("without coercion the dtype issue ends the field") {
        auto result = validate::validate(*builder.build_or_throw(), table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].constraint == Constraint::DType);
        REQUIRE(result.issues[0].message == "expected Int64, found String");
    }

    SECTION("a failed coercion ends the field") {
        auto result = validate::validate(*builder.coerce().build_or_throw(), table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].kind == IssueKind::Coercion);
        REQUIRE(result.issues[0].constraint == Constraint::Coerce);
        REQUIRE(result.issues[0].field == "n");
        REQUIRE(result.issues[0].values == std::vector<std::string>{"\"x\""});
    }

    SECTION("a successful coercion replaces the working column") {
        table.replace_column(0, Column<std::string>{"1", "-2", "3"});
        auto result = validate::validate(*builder.coerce().build_or_throw(), table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].constraint == Constraint::Gt);
        REQUIRE(dtype_of(*result.table.find("n")) == DType::Int64);
        REQUIRE(dtype_of(*table.find("n")) == DType::String);
    }
}

TEST_CASE("Coercion is idempotent", "[validate][engine]") {
    auto plain = trades_schema().build_or_throw();
    auto coercing = trades_schema().coerce().build_or_throw();
    auto table = trades_table();
    table.replace_column(2, Column<double>{10.0, -1.0, 30.0});

    auto without = validate::validate(*plain, table);
    auto with = validate::validate(*coercing, table);
    REQUIRE(without.issues.size() == 1);
    REQUIRE(with.issues.size() == without.issues.size());
    REQUIRE(with.issues[0].format() == without.issues[0].format());
    for (std::size_t i = 0; i < table.columns.size(); ++i) {
        REQUIRE(with.table.columns[i].column == table.columns[i].column);
    }
}

TEST_CASE("Custom checks", "[validate][engine]") {
    Table table;
    table.add_column("a", Column<std::int64_t>{1, 2, 3});
    table.add_column("b", Column<std::int64_t>{4, 5, 6});

    SECTION("one check attached to several columns") {
        auto schema = SchemaBuilder()
                          .column("a", DType::Int64)
                          .column("b", DType::Int64)
                          .check({"a", "b"}, per_row("small", [](std::int64_t v) { return v < 5; }))
                          .build_or_throw();
        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].field == "b");
        REQUIRE(result.issues[0].rows == std::vector<std::size_t>{1, 2});
    }

    SECTION("whole-column verdicts") {
        ColumnCheck sum_is_six{.name = "sum_is_six", .fn = [](const ColumnEntry& entry) {
                                   std::int64_t sum = 0;
                                   for (auto v : std::get<Column<std::int64_t>>(*entry.column)) {
                                       sum += v;
                                   }
                                   return CheckResult{WholeColumn{sum == 6}};
                               }};
        auto schema = SchemaBuilder()
                          .column("a", DType::Int64, {.checks = {sum_is_six}})
                          .column("b", DType::Int64, {.checks = {sum_is_six}})
                          .build_or_throw();
        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].field == "b");
        REQUIRE(result.issues[0].count == 0);
    }

    SECTION("a per-row result of the wrong length fails the check") {
        ColumnCheck short_result{.name = "short", .fn = [](const ColumnEntry&) {
                                     return CheckResult{PerRow{{true}}};
                                 }};
        auto schema =
            SchemaBuilder().column("a", DType::Int64, {.checks = {short_result}}).build_or_throw();
        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].message == "check `short` returned 1 results for 3 rows");
    }

    SECTION("a throwing check is reported, not propagated") {
        ColumnCheck boom{.name = "boom", .fn = [](const ColumnEntry&) -> CheckResult {
                             throw std::runtime_error("kaput");
                         }};
        auto schema =
            SchemaBuilder().column("a", DType::Int64, {.checks = {boom}}).build_or_throw();
        auto result = validate::validate(*schema, table);
        REQUIRE(result.issues.size() == 1);
        REQUIRE(result.issues[0].message == "check `boom` raised: kaput");
    }

    SECTION("pattern checks cover matching columns and flag dead patterns") {
        auto schema = SchemaBuilder()
                          .column("a", DType::Int64)
                          .column("b", DType::Int64)
                          .check_regex({"[ab]", "z.*"},
                                       per_row("odd", [](std::int64_t v) { return v % 2 == 1; }))
                          .build_or_throw();
        auto result = validate::validate(*schema, table);
        REQUIRE(constraints(result.issues) ==
                std::vector<Constraint>{Constraint::PatternUnmatched, Constraint::Check,
                                        Constraint::Check});
        REQUIRE(result.issues[1].field == "a");
        REQUIRE(result.issues[1].rows == std::vector<std::size_t>{1});
        REQUIRE(result.issues[2].field == "b");
        REQUIRE(result.issues[2].rows == std::vector<std::size_t>{0, 2});
    }

    SECTION("table checks run last") {
        auto schema = SchemaBuilder()
                          .column("a", DType::Int64, {.gt = 1})
                          .column("b", DType::Int64)
                          .table_check(TableCheck{
                              .name = "first_a_large",
                              .fn = [](const Table& t) {
                                  const auto& a = std::get<Column<std::int64_t>>(*t.find("a"));
                                  return a[0] > 100;
                              }})
                          .build_or_throw();
        auto result = validate::validate(*schema, table);
        REQUIRE(constraints(result.issues) ==
                std::vector<Constraint>{Constraint::Gt, Constraint::TableCheck});
        REQUIRE(result.issues[1].message == "failed table check `first_a_large`");
    }
}

TEST_CASE("String constraints", "[validate][engine]") {
    auto schema = SchemaBuilder()
                      .column("code", DType::Categorical,
                              {.str_contains = "-", .str_startswith = "EU", .str_endswith = "1"})
                      .build_or_throw();
    Table table;
    table.add_column("code", Column<Categorical>{"EU-1", "US-1", "EU2", "EU-3"});

    auto result = validate::validate(*schema, table);
    REQUIRE(constraints(result.issues) ==
            std::vector<Constraint>{Constraint::StrContains, Constraint::StrStartswith,
                                    Constraint::StrEndswith});
    REQUIRE(result.issues[0].rows == std::vector<std::size_t>{2});
    REQUIRE(result.issues[1].rows == std::vector<std::size_t>{1});
    REQUIRE(result.issues[2].rows == std::vector<std::size_t>{2, 3});
}

TEST_CASE("Sample limit caps rows but not the count", "[validate][engine]") {
    auto schema = SchemaBuilder().column("v", DType::Int64, {.gt = 100}).build_or_throw();
    Table table;
    table.add_column("v", Column<std::int64_t>{1, 2, 3, 4, 5, 6, 7});

    auto result = validate::validate(*schema, table, ValidationOptions{.sample_limit = 3});
    REQUIRE(result.issues.size() == 1);
    REQUIRE(result.issues[0].count == 7);
    REQUIRE(result.issues[0].rows == std::vector<std::size_t>{0, 1, 2});
}

TEST_CASE("Series validation", "[validate][engine][series]") {
    auto schema =
        SchemaBuilder("Price").column("price", DType::Float64, {.gt = 0}).build_or_throw();

    SECTION("the series name is not compared") {
        auto series = Series::make("close", Column<double>{1.0, -1.0});
        ValidationContext context;
        auto issues = validate::validate(*schema, series, context);
        REQUIRE(issues.size() == 1);
        REQUIRE(issues[0].constraint == Constraint::Gt);
        REQUIRE(issues[0].rows == std::vector<std::size_t>{1});
    }

    SECTION("coerced values are written back") {
        auto coercing =
            SchemaBuilder().column("price", DType::Float64).coerce().build_or_throw();
        auto series = Series::make("close", Column<std::int64_t>{1, 2});
        ValidationContext context;
        REQUIRE(validate::validate(*coercing, series, context).empty());
        REQUIRE(dtype_of(*series.values) == DType::Float64);
    }

    SECTION("a schema must declare exactly one column") {
        auto wide = SchemaBuilder()
                        .column("a", DType::Float64)
                        .column("b", DType::Float64)
                        .build_or_throw();
        auto series = Series::make("a", Column<double>{1.0});
        ValidationContext context;
        auto issues = validate::validate(*wide, series, context);
        REQUIRE(issues.size() == 1);
        REQUIRE(issues[0].kind == IssueKind::Structural);
    }
}
