#include <framecheck/inspect/checked.hpp>
#include <framecheck/schema/builder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace framecheck;
using namespace framecheck::inspect;
using framecheck::schema::SchemaBuilder;
using framecheck::validate::AggregateValidationError;
using framecheck::validate::Constraint;

namespace {

auto frame_schema() -> schema::SchemaRef {
    return SchemaBuilder("Frame")
        .column("col1", DType::Int64)
        .column("col3", DType::Float64, {.gt = 0})
        .build_or_throw();
}

auto frame(std::initializer_list<double> col3) -> Value {
    Table table;
    Column<std::int64_t> col1;
    for (std::size_t i = 0; i < col3.size(); ++i) {
        col1.push_back(static_cast<std::int64_t>(i));
    }
    table.add_column("col1", std::move(col1));
    table.add_column("col3", Column<double>{col3});
    return make_table(std::move(table));
}

auto identity() -> Callable {
    return [](const Arguments& args) { return args.front().value; };
}

}  // namespace

TEST_CASE("Valid input runs the callable", "[inspect][checked]") {
    auto schema = frame_schema();
    int calls = 0;
    auto fn = checked(
        [&calls](const Arguments& args) {
            ++calls;
            return args.front().value;
        },
        Signature{.params = {{.name = "df", .annotation = table_of(schema)}},
                  .returns = table_of(schema)});

    auto result = fn({{.name = "df", .value = frame({1.0, 2.0})}});
    REQUIRE(calls == 1);
    REQUIRE(result.as_table() != nullptr);
}

TEST_CASE("Invalid input aborts the call", "[inspect][checked]") {
    auto schema = frame_schema();
    int calls = 0;
    auto fn = checked(
        [&calls](const Arguments&) {
            ++calls;
            return make_scalar(std::int64_t{0});
        },
        Signature{.params = {{.name = "df", .annotation = table_of(schema)}},
                  .returns = unchecked()});

    try {
        (void)fn({{.name = "df", .value = frame({-1.0, 2.0})}});
        FAIL("expected AggregateValidationError");
    } catch (const AggregateValidationError& e) {
        REQUIRE(e.issues().size() == 1);
        const auto& issue = e.issues()[0];
        REQUIRE(issue.constraint == Constraint::Gt);
        REQUIRE(issue.field == "col3");
        REQUIRE(issue.path == "df");
        REQUIRE(issue.rows == std::vector<std::size_t>{0});
        REQUIRE(issue.values == std::vector<std::string>{"-1"});
        REQUIRE(std::string(e.what()).find("validation failed with 1 issue") == 0);
    }
    REQUIRE(calls == 0);
}

TEST_CASE("All input problems arrive in one error", "[inspect][checked]") {
    auto schema = frame_schema();
    auto fn = checked(identity(),
                      Signature{.params = {{.name = "frames",
                                            .annotation = list_of(table_of(schema))},
                                           {.name = "extra", .annotation = table_of(schema)}},
                                .returns = unchecked()});

    Table no_col3;
    no_col3.add_column("col1", Column<std::int64_t>{1});
    auto frames = make_sequence({frame({1.0}), frame({-1.0}), make_table(no_col3)});

    try {
        (void)fn({{.name = "frames", .value = frames}});
        FAIL("expected AggregateValidationError");
    } catch (const AggregateValidationError& e) {
        const auto& issues = e.issues();
        REQUIRE(issues.size() == 3);
        REQUIRE(issues[0].path == "frames[1]");
        REQUIRE(issues[0].constraint == Constraint::Gt);
        REQUIRE(issues[1].path == "frames[2]");
        REQUIRE(issues[1].constraint == Constraint::MissingColumn);
        REQUIRE(issues[2].path == "extra");
        REQUIRE(issues[2].constraint == Constraint::MissingArgument);
    }
}

TEST_CASE("Output is validated after the call", "[inspect][checked]") {
    auto schema = frame_schema();
    int calls = 0;
    auto fn = checked(
        [&calls](const Arguments&) {
            ++calls;
            return make_sequence({frame({1.0}), frame({0.0})});
        },
        Signature{.params = {}, .returns = list_of(table_of(schema))});

    try {
        (void)fn({});
        FAIL("expected AggregateValidationError");
    } catch (const AggregateValidationError& e) {
        REQUIRE(e.issues().size() == 1);
        REQUIRE(e.issues()[0].path == "return[1]");
    }
    // The callable's side effects stand.
    REQUIRE(calls == 1);
}

TEST_CASE("A round trip through identical schemas passes", "[inspect][checked]") {
    auto schema = frame_schema();
    auto fn = checked(identity(),
                      Signature{.params = {{.name = "frames",
                                            .annotation = list_of(table_of(schema))}},
                                .returns = list_of(table_of(schema))});

    auto result = fn({{.name = "frames", .value = make_sequence({frame({1.0}), frame({2.0})})}});
    REQUIRE(result.as_sequence()->size() == 2);
}

TEST_CASE("The callable receives validated working copies", "[inspect][checked]") {
    auto schema = SchemaBuilder("Filtered")
                      .column("col3", DType::Float64)
                      .filter()
                      .build_or_throw();
    std::vector<std::string> seen;
    auto fn = checked(
        [&seen](const Arguments& args) {
            seen = args.front().value.as_table()->column_names();
            return make_scalar({});
        },
        Signature{.params = {{.name = "df", .annotation = table_of(schema)}},
                  .returns = unchecked()});

    auto input = frame({1.0, 2.0});
    (void)fn({{.name = "df", .value = input}});
    REQUIRE(seen == std::vector<std::string>{"col3"});
    REQUIRE(input.as_table()->columns.size() == 2);
}

TEST_CASE("Unannotated arguments pass through", "[inspect][checked]") {
    auto fn = checked(
        [](const Arguments& args) { return args.back().value; },
        Signature{.params = {{.name = "n", .annotation = unchecked()}}, .returns = unchecked()});

    auto result = fn({{.name = "n", .value = make_scalar(std::int64_t{7})},
                      {.name = "other", .value = make_scalar("x")}});
    REQUIRE(std::get<std::string>(*result.as_scalar()) == "x");

    auto omitted = checked(
        [](const Arguments& args) { return make_scalar(static_cast<std::int64_t>(args.size())); },
        Signature{.params = {{.name = "n", .annotation = unchecked()}}, .returns = unchecked()});
    auto count = omitted({});
    REQUIRE(std::get<std::int64_t>(*count.as_scalar()) == 0);

    REQUIRE_THROWS_AS(checked(nullptr, Signature{}), std::invalid_argument);
}
