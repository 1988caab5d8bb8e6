#pragma once

#include <framecheck/core/table.hpp>

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace framecheck::validate {

/// Rows that could not be converted.
struct CoerceFailure {
    std::size_t count = 0;
    std::vector<std::size_t> rows;
    std::vector<std::string> values;
    std::string message;
};

struct CoercedColumn {
    ColumnValue column;
    Validity validity;
};

/// Convert `column` to `target` without losing information.
///
/// Every non-null row must convert exactly (no truncation, no rounding, no
/// overflow); otherwise the offending rows are reported and nothing is
/// converted. Null rows, NaN included, keep their place, receive a placeholder
/// value and are marked invalid in the result. A column already of type
/// `target` is returned unchanged.
[[nodiscard]] auto coerce_column(const ColumnValue& column, const Validity& validity,
                                 DType target, std::size_t sample_limit = 5)
    -> std::expected<CoercedColumn, CoerceFailure>;

}  // namespace framecheck::validate
