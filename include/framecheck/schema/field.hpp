#pragma once

#include <framecheck/core/table.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace framecheck::schema {

/// Numeric bound for `gt`/`ge`/`lt`/`le`.
using Bound = std::variant<std::int64_t, double>;

/// Member of an `isin`/`notin` set.
using Scalar = std::variant<std::int64_t, double, std::string, bool, Date, Timestamp>;

/// Verdict covering the whole column.
struct WholeColumn {
    bool passed = true;
};

/// One verdict per row; false marks an offending row.
struct PerRow {
    std::vector<bool> passed;
};

using CheckResult = std::variant<WholeColumn, PerRow>;

/// Named predicate over one column.
struct ColumnCheck {
    std::string name;
    std::function<CheckResult(const ColumnEntry&)> fn;
};

/// Named predicate over a whole table.
struct TableCheck {
    std::string name;
    std::function<bool(const Table&)> fn;
};

/// Declared type and constraints of one column or index level.
///
/// `name` and `dtype` are filled in by SchemaBuilder; everything else is the
/// constraint descriptor a caller passes alongside them:
///
///   builder.column("price", DType::Float64, {.nullable = true, .gt = 0.0});
struct FieldSpec {
    std::string name;
    DType dtype = DType::Int64;

    bool nullable = false;
    /// Column may be absent from the table altogether.
    bool optional = false;
    bool unique = false;
    /// Unset means the schema-wide default.
    std::optional<bool> coerce;

    std::optional<Bound> gt;
    std::optional<Bound> ge;
    std::optional<Bound> lt;
    std::optional<Bound> le;

    std::optional<std::vector<Scalar>> isin;
    std::optional<std::vector<Scalar>> notin;

    std::optional<std::string> str_contains;
    std::optional<std::string> str_startswith;
    std::optional<std::string> str_endswith;

    /// Actual column name when it differs from `name`. With `regex`, an ECMAScript
    /// pattern that must match whole column names; every match is validated.
    std::optional<std::string> alias;
    bool regex = false;

    std::vector<ColumnCheck> checks;
};

[[nodiscard]] auto is_numeric(DType dtype) noexcept -> bool;
[[nodiscard]] auto is_textual(DType dtype) noexcept -> bool;

/// Whether `value` may appear in an `isin`/`notin` set of a `dtype` field.
[[nodiscard]] auto scalar_fits(const Scalar& value, DType dtype) noexcept -> bool;

[[nodiscard]] auto bound_as_double(const Bound& bound) noexcept -> double;
[[nodiscard]] auto format_bound(const Bound& bound) -> std::string;
[[nodiscard]] auto format_scalar(const Scalar& value) -> std::string;

}  // namespace framecheck::schema
