#pragma once
// gen_trades — synthetic trades table for validation benchmarks.
//
//   id     Int64      0..n-1, unique
//   ts     Datetime   one second apart
//   symbol Categorical
//   price  Float64    > 0
//   qty    Int64      1..100

#include <framecheck/core/column.hpp>
#include <framecheck/core/table.hpp>
#include <framecheck/core/time.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

inline auto gen_trades(std::int64_t n) -> framecheck::Table {
    if (n < 0)
        throw std::invalid_argument("gen_trades: n must be non-negative");
    auto rows = static_cast<std::size_t>(n);

    constexpr std::array<std::string_view, 4> kSymbols = {"AAPL", "MSFT", "GOOG", "AMZN"};

    framecheck::Column<std::int64_t> id_col;
    framecheck::Column<framecheck::Timestamp> ts_col;
    framecheck::Column<framecheck::Categorical> symbol_col;
    framecheck::Column<double> price_col;
    framecheck::Column<std::int64_t> qty_col;
    id_col.reserve(rows);
    ts_col.reserve(rows);
    symbol_col.reserve(rows);
    price_col.reserve(rows);
    qty_col.reserve(rows);

    for (std::size_t i = 0; i < rows; ++i) {
        id_col.push_back(static_cast<std::int64_t>(i));
        ts_col.push_back(framecheck::Timestamp{static_cast<std::int64_t>(i) * 1'000'000'000LL});
        symbol_col.push_back(kSymbols[i % kSymbols.size()]);
        price_col.push_back(100.0 + static_cast<double>(i % 100));
        qty_col.push_back(static_cast<std::int64_t>(1 + i % 100));
    }

    framecheck::Table t;
    t.add_column("id", std::move(id_col));
    t.add_column("ts", std::move(ts_col));
    t.add_column("symbol", std::move(symbol_col));
    t.add_column("price", std::move(price_col));
    t.add_column("qty", std::move(qty_col));
    return t;
}

/// The same table with `price` stored as text, for coercion benchmarks.
inline auto gen_trades_text_prices(std::int64_t n) -> framecheck::Table {
    auto t = gen_trades(n);
    auto pos = *t.position("price");
    const auto& prices = std::get<framecheck::Column<double>>(*t.columns[pos].column);
    framecheck::Column<std::string> text;
    text.reserve(prices.size());
    for (double price : prices) {
        text.push_back(fmt::format("{}", price));
    }
    t.replace_column(pos, std::move(text));
    return t;
}
