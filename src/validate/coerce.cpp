#include <framecheck/validate/coerce.hpp>

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <optional>
#include <string_view>
#include <type_traits>

namespace framecheck::validate {

namespace {

// Largest magnitude below which every integer is exactly representable as double.
constexpr std::int64_t kMaxExactDouble = std::int64_t{1} << 53;

auto try_int(std::string_view text) -> std::optional<std::int64_t> {
    std::int64_t out{};
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    if (text.empty() || result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto try_double(std::string_view text) -> std::optional<double> {
    double out{};
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    if (text.empty() || result.ec != std::errc{} || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto try_bool(std::string_view text) -> std::optional<Bool> {
    if (text == "true" || text == "True" || text == "1") {
        return Bool{true};
    }
    if (text == "false" || text == "False" || text == "0") {
        return Bool{false};
    }
    return std::nullopt;
}

auto shortest(double value) -> std::string {
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec == std::errc{}) {
        return std::string(buffer.data(), ptr);
    }
    return fmt::format("{}", value);
}

// One overload set per target type. Each `from` returns nullopt when the value
// has no exact representation in the target.

struct ToInt64 {
    using type = std::int64_t;
    static auto from(std::int64_t v) -> std::optional<type> { return v; }
    static auto from(double v) -> std::optional<type> {
        constexpr double kLimit = 9223372036854775808.0;
        if (!std::isfinite(v) || std::trunc(v) != v || v < -kLimit || v >= kLimit) {
            return std::nullopt;
        }
        return static_cast<type>(v);
    }
    static auto from(std::string_view v) -> std::optional<type> { return try_int(v); }
    static auto from(Bool v) -> std::optional<type> { return v.value ? 1 : 0; }
    static auto from(Date) -> std::optional<type> { return std::nullopt; }
    static auto from(Timestamp) -> std::optional<type> { return std::nullopt; }
};

struct ToFloat64 {
    using type = double;
    static auto from(std::int64_t v) -> std::optional<type> {
        if (v > kMaxExactDouble || v < -kMaxExactDouble) {
            return std::nullopt;
        }
        return static_cast<type>(v);
    }
    static auto from(double v) -> std::optional<type> { return v; }
    static auto from(std::string_view v) -> std::optional<type> { return try_double(v); }
    static auto from(Bool v) -> std::optional<type> { return v.value ? 1.0 : 0.0; }
    static auto from(Date) -> std::optional<type> { return std::nullopt; }
    static auto from(Timestamp) -> std::optional<type> { return std::nullopt; }
};

struct ToString {
    using type = std::string;
    static auto from(std::int64_t v) -> std::optional<type> { return fmt::format("{}", v); }
    static auto from(double v) -> std::optional<type> { return shortest(v); }
    static auto from(std::string_view v) -> std::optional<type> { return std::string(v); }
    static auto from(Bool v) -> std::optional<type> {
        return std::string(v.value ? "true" : "false");
    }
    static auto from(Date v) -> std::optional<type> { return format_date(v); }
    static auto from(Timestamp v) -> std::optional<type> { return format_timestamp(v); }
};

struct ToBool {
    using type = Bool;
    static auto from(std::int64_t v) -> std::optional<type> {
        if (v != 0 && v != 1) {
            return std::nullopt;
        }
        return Bool{v == 1};
    }
    static auto from(double v) -> std::optional<type> {
        if (v != 0.0 && v != 1.0) {
            return std::nullopt;
        }
        return Bool{v == 1.0};
    }
    static auto from(std::string_view v) -> std::optional<type> { return try_bool(v); }
    static auto from(Bool v) -> std::optional<type> { return v; }
    static auto from(Date) -> std::optional<type> { return std::nullopt; }
    static auto from(Timestamp) -> std::optional<type> { return std::nullopt; }
};

struct ToTimestamp {
    using type = Timestamp;
    static auto from(std::int64_t) -> std::optional<type> { return std::nullopt; }
    static auto from(double) -> std::optional<type> { return std::nullopt; }
    static auto from(std::string_view v) -> std::optional<type> { return parse_timestamp(v); }
    static auto from(Bool) -> std::optional<type> { return std::nullopt; }
    static auto from(Date v) -> std::optional<type> { return timestamp_from_date(v); }
    static auto from(Timestamp v) -> std::optional<type> { return v; }
};

struct ToDate {
    using type = Date;
    static auto from(std::int64_t) -> std::optional<type> { return std::nullopt; }
    static auto from(double) -> std::optional<type> { return std::nullopt; }
    static auto from(std::string_view v) -> std::optional<type> { return parse_date(v); }
    static auto from(Bool) -> std::optional<type> { return std::nullopt; }
    static auto from(Date v) -> std::optional<type> { return v; }
    static auto from(Timestamp v) -> std::optional<type> { return date_if_midnight(v); }
};

// Categorical targets convert through the string rendering of each value.
struct ToCategorical : ToString {};

template <typename To>
auto convert(const ColumnValue& column, const Validity& validity, DType target,
             std::size_t sample_limit) -> std::expected<CoercedColumn, CoerceFailure> {
    const std::size_t rows = column_size(column);
    using Out = std::conditional_t<std::is_same_v<To, ToCategorical>, Column<Categorical>,
                                   Column<typename To::type>>;
    Out out;
    out.reserve(rows);
    std::vector<bool> valid(rows, true);
    bool has_nulls = false;
    CoerceFailure failure;

    std::visit(
        [&](const auto& col) {
            for (std::size_t row = 0; row < rows; ++row) {
                if (is_null(column, validity, row)) {
                    valid[row] = false;
                    has_nulls = true;
                    if constexpr (std::is_same_v<To, ToCategorical>) {
                        out.push_back(std::string_view{});
                    } else {
                        out.push_back(typename To::type{});
                    }
                    continue;
                }
                auto converted = To::from(col[row]);
                if (!converted.has_value()) {
                    if (failure.rows.empty() || failure.rows.size() < sample_limit) {
                        failure.rows.push_back(row);
                        failure.values.push_back(format_cell(column, validity, row));
                    }
                    ++failure.count;
                    continue;
                }
                if (failure.count == 0) {
                    out.push_back(std::move(*converted));
                }
            }
        },
        column);

    if (failure.count > 0) {
        failure.message =
            fmt::format("cannot convert {} to {} without loss, first offending value {}",
                        dtype_name(dtype_of(column)), dtype_name(target), failure.values.front());
        return std::unexpected(std::move(failure));
    }
    Validity result_validity;
    if (has_nulls) {
        result_validity = std::move(valid);
    }
    return CoercedColumn{.column = ColumnValue{std::move(out)},
                         .validity = std::move(result_validity)};
}

}  // namespace

auto coerce_column(const ColumnValue& column, const Validity& validity, DType target,
                   std::size_t sample_limit) -> std::expected<CoercedColumn, CoerceFailure> {
    if (dtype_of(column) == target) {
        return CoercedColumn{.column = column, .validity = validity};
    }
    switch (target) {
        case DType::Int64:
            return convert<ToInt64>(column, validity, target, sample_limit);
        case DType::Float64:
            return convert<ToFloat64>(column, validity, target, sample_limit);
        case DType::String:
            return convert<ToString>(column, validity, target, sample_limit);
        case DType::Bool:
            return convert<ToBool>(column, validity, target, sample_limit);
        case DType::Datetime:
            return convert<ToTimestamp>(column, validity, target, sample_limit);
        case DType::Date:
            return convert<ToDate>(column, validity, target, sample_limit);
        case DType::Categorical:
            return convert<ToCategorical>(column, validity, target, sample_limit);
    }
    return CoercedColumn{.column = column, .validity = validity};
}

}  // namespace framecheck::validate
