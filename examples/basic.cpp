#include <framecheck/framecheck.hpp>

#include <fmt/core.h>

auto main() -> int {
    using framecheck::Column;
    using framecheck::DType;
    namespace inspect = framecheck::inspect;

    // Declare the schema once.
    auto prices = framecheck::schema::SchemaBuilder("Prices")
                      .index("id", DType::Int64, {.unique = true})
                      .check_index_name()
                      .column("symbol", DType::Categorical)
                      .column("price", DType::Float64, {.gt = 0.0})
                      .column("volume", DType::Int64, {.nullable = true, .ge = 0})
                      .strict()
                      .build_or_throw();

    framecheck::Table table;
    table.add_column("symbol", Column<framecheck::Categorical>{"AAPL", "MSFT", "AAPL"});
    table.add_column("price", Column<double>{100.5, -2.0, 175.8});
    table.add_column("volume", Column<std::int64_t>{10, 0, 5}, {true, false, true});
    table.add_index_level("id", Column<std::int64_t>{1, 2, 3});

    fmt::print("=== Direct validation ===\n");
    auto result = framecheck::validate::validate(*prices, table);
    fmt::print("ok: {}\n", result.ok());
    for (const auto& issue : result.issues) {
        fmt::print("  {}\n", issue.format());
    }

    fmt::print("\n=== Checked function ===\n");
    auto total_volume = inspect::checked(
        [](const inspect::Arguments& args) {
            std::int64_t total = 0;
            for (const auto& frame : *args.front().value.as_sequence()) {
                const auto& entry = *frame.as_table()->find_entry("volume");
                const auto& volume = std::get<Column<std::int64_t>>(*entry.column);
                for (std::size_t row = 0; row < volume.size(); ++row) {
                    if (!framecheck::is_null(entry, row)) {
                        total += volume[row];
                    }
                }
            }
            return inspect::make_scalar(total);
        },
        inspect::Signature{
            .params = {{.name = "frames",
                        .annotation = inspect::list_of(inspect::table_of(prices))}},
            .returns = inspect::unchecked()});

    try {
        auto value = total_volume(
            {{.name = "frames",
              .value = inspect::make_sequence({inspect::make_table(table)})}});
        fmt::print("total volume: {}\n", std::get<std::int64_t>(*value.as_scalar()));
    } catch (const framecheck::validate::AggregateValidationError& e) {
        fmt::print("{}\n", e.what());
    }

    return 0;
}
