#include <framecheck/validate/coerce.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <limits>

using namespace framecheck;
using framecheck::validate::coerce_column;

namespace {

template <typename T>
auto require_coerced(const ColumnValue& column, DType target, const Validity& validity = {})
    -> Column<T> {
    auto result = coerce_column(column, validity, target);
    REQUIRE(result.has_value());
    REQUIRE(dtype_of(result->column) == target);
    return std::get<Column<T>>(result->column);
}

}  // namespace

TEST_CASE("Numeric coercion is lossless or fails", "[validate][coerce]") {
    SECTION("integral floats become integers") {
        auto out = require_coerced<std::int64_t>(Column<double>{1.0, -2.0, 3.0}, DType::Int64);
        REQUIRE(out == Column<std::int64_t>{1, -2, 3});
    }

    SECTION("fractional floats are never truncated") {
        auto result = coerce_column(Column<double>{1.0, 2.5, 3.0, 4.25}, std::nullopt,
                                    DType::Int64);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().count == 2);
        REQUIRE(result.error().rows == std::vector<std::size_t>{1, 3});
        REQUIRE(result.error().values.front() == "2.5");
        REQUIRE(result.error().message.find("first offending value 2.5") != std::string::npos);
    }

    SECTION("out of range floats fail") {
        auto result = coerce_column(Column<double>{1e300}, std::nullopt, DType::Int64);
        REQUIRE_FALSE(result.has_value());
    }

    SECTION("large integers cannot become floats") {
        const std::int64_t big = (std::int64_t{1} << 53) + 1;
        REQUIRE_FALSE(coerce_column(Column<std::int64_t>{big}, std::nullopt, DType::Float64));
        auto out = require_coerced<double>(Column<std::int64_t>{1, 2}, DType::Float64);
        REQUIRE(out[1] == 2.0);
    }

    SECTION("booleans only from 0 and 1") {
        auto out = require_coerced<Bool>(Column<std::int64_t>{0, 1}, DType::Bool);
        REQUIRE(out == Column<Bool>{false, true});
        REQUIRE_FALSE(coerce_column(Column<std::int64_t>{2}, std::nullopt, DType::Bool));
    }
}

TEST_CASE("Text parses into typed columns", "[validate][coerce]") {
    SECTION("integers need a full parse") {
        auto out = require_coerced<std::int64_t>(Column<std::string>{"10", "-3"}, DType::Int64);
        REQUIRE(out == Column<std::int64_t>{10, -3});
        auto bad = coerce_column(Column<std::string>{"10", "3x", ""}, std::nullopt, DType::Int64);
        REQUIRE_FALSE(bad.has_value());
        REQUIRE(bad.error().count == 2);
        REQUIRE(bad.error().values.front() == "\"3x\"");
    }

    SECTION("floats, booleans and dates") {
        auto floats = require_coerced<double>(Column<std::string>{"1.5", "2"}, DType::Float64);
        REQUIRE(floats == Column<double>{1.5, 2.0});
        auto bools = require_coerced<Bool>(Column<std::string>{"True", "0"}, DType::Bool);
        REQUIRE(bools == Column<Bool>{true, false});
        auto dates = require_coerced<Date>(Column<std::string>{"2024-01-02"}, DType::Date);
        REQUIRE(dates[0] == date_from_ymd(2024, 1, 2));
        auto times = require_coerced<Timestamp>(Column<std::string>{"2024-01-02T03:04:05"},
                                                DType::Datetime);
        REQUIRE(times[0].nanos == timestamp_from_date(date_from_ymd(2024, 1, 2))->nanos +
                                      (3 * 3600 + 4 * 60 + 5) * 1'000'000'000LL);
    }

    SECTION("categoricals convert through their labels") {
        auto cats =
            require_coerced<Categorical>(Column<std::string>{"a", "b", "a"}, DType::Categorical);
        REQUIRE(cats.dictionary().size() == 2);
        auto ints = require_coerced<std::int64_t>(Column<Categorical>{"1", "2"}, DType::Int64);
        REQUIRE(ints == Column<std::int64_t>{1, 2});
    }
}

TEST_CASE("Anything renders to text", "[validate][coerce]") {
    auto out = require_coerced<std::string>(Column<double>{0.1, 2.0}, DType::String);
    REQUIRE(out == Column<std::string>{"0.1", "2"});
    auto bools = require_coerced<std::string>(Column<Bool>{true}, DType::String);
    REQUIRE(bools[0] == "true");
}

TEST_CASE("Dates and timestamps", "[validate][coerce]") {
    const auto day = date_from_ymd(2023, 6, 1);
    auto ts = require_coerced<Timestamp>(Column<Date>{day}, DType::Datetime);
    REQUIRE(ts[0] == *timestamp_from_date(day));

    auto back = require_coerced<Date>(ColumnValue{ts}, DType::Date);
    REQUIRE(back[0] == day);

    auto not_midnight = coerce_column(Column<Timestamp>{Timestamp{ts[0].nanos + 1}},
                                      std::nullopt, DType::Date);
    REQUIRE_FALSE(not_midnight.has_value());
}

TEST_CASE("Dates beyond the timestamp range fail to coerce", "[validate][coerce]") {
    const Column<Date> dates{date_from_ymd(2024, 1, 1), date_from_ymd(2300, 1, 1)};
    auto result = coerce_column(dates, std::nullopt, DType::Datetime);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().count == 1);
    REQUIRE(result.error().rows == std::vector<std::size_t>{1});
    REQUIRE(result.error().values.front() == "2300-01-01");

    auto text = coerce_column(Column<std::string>{"2300-01-01 00:00:00"}, std::nullopt,
                              DType::Datetime);
    REQUIRE_FALSE(text.has_value());
}

TEST_CASE("Nulls are kept, not converted", "[validate][coerce]") {
    SECTION("validity carries over") {
        auto result = coerce_column(Column<std::string>{"1", "oops", "3"},
                                    std::vector<bool>{true, false, true}, DType::Int64);
        REQUIRE(result.has_value());
        REQUIRE(result->validity == std::vector<bool>{true, false, true});
        const auto& out = std::get<Column<std::int64_t>>(result->column);
        REQUIRE(out[0] == 1);
        REQUIRE(out[2] == 3);
    }

    SECTION("NaN becomes a null row") {
        auto result = coerce_column(
            Column<double>{1.0, std::numeric_limits<double>::quiet_NaN()}, std::nullopt,
            DType::Int64);
        REQUIRE(result.has_value());
        REQUIRE(result->validity == std::vector<bool>{true, false});
    }
}

TEST_CASE("Coercing a correctly typed column is a no-op", "[validate][coerce]") {
    const ColumnValue column = Column<std::int64_t>{4, 5, 6};
    auto once = coerce_column(column, std::nullopt, DType::Int64);
    REQUIRE(once.has_value());
    REQUIRE(once->column == column);
    REQUIRE_FALSE(once->validity.has_value());
}

TEST_CASE("Sample limit caps reported rows", "[validate][coerce]") {
    auto result = coerce_column(Column<std::string>{"a", "b", "c", "d"}, std::nullopt,
                                DType::Int64, 2);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().count == 4);
    REQUIRE(result.error().rows.size() == 2);
}
