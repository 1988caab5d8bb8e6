#pragma once

#include <framecheck/core/column.hpp>
#include <framecheck/core/time.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace framecheck {

/// Semantic element type of a column or index level.
enum class DType : std::uint8_t {
    Int64,
    Float64,
    String,
    Bool,
    Datetime,
    Date,
    Categorical,
};

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>,
                                 Column<Bool>, Column<Timestamp>, Column<Date>,
                                 Column<Categorical>>;

/// Validity bitmap: true = valid (not null), false = null.
/// nullopt means every row is valid, the common case, with zero overhead.
using Validity = std::optional<std::vector<bool>>;

/// DType of the column's element type.
[[nodiscard]] auto dtype_of(const ColumnValue& column) noexcept -> DType;
/// Display name used in messages (`Int64`, `Float64`, ...).
[[nodiscard]] auto dtype_name(DType dtype) noexcept -> std::string_view;
[[nodiscard]] auto column_size(const ColumnValue& column) noexcept -> std::size_t;

/// Empty column of the given element type.
[[nodiscard]] auto make_column(DType dtype) -> ColumnValue;

/// A named column with its shared storage and validity.
struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    Validity validity;
};

/// One level of a row index.
struct IndexLevel {
    std::optional<std::string> name;
    std::shared_ptr<ColumnValue> values;
    Validity validity;
};

/// Returns true if row `row` is missing: its validity bit is false, or it holds NaN
/// in a floating-point column.
[[nodiscard]] auto is_null(const ColumnValue& column, const Validity& validity, std::size_t row)
    -> bool;

[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return is_null(*entry.column, entry.validity, row);
}

/// Text rendering of one cell, `null` for missing values.
[[nodiscard]] auto format_cell(const ColumnValue& column, const Validity& validity,
                               std::size_t row) -> std::string;

/// An in-memory table: named, typed columns plus a row index.
///
/// Column storage is shared between copies. Mutating operations reseat the
/// shared_ptr rather than writing through it, so copying a Table and modifying
/// the copy never changes the original.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> lookup;
    /// Explicit index levels. Empty means the default positional index.
    std::vector<IndexLevel> index;

    /// Append a column with no nulls.
    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Reseat the storage of column `pos`. Throws std::invalid_argument if the length changes.
    void replace_column(std::size_t pos, ColumnValue column);
    /// Keep only the columns at `positions`, in that order.
    void select_columns(const std::vector<std::size_t>& positions);

    /// Append an index level; a nullopt name is an unnamed level.
    void add_index_level(std::optional<std::string> name, ColumnValue values);
    void add_index_level(std::optional<std::string> name, ColumnValue values,
                         std::vector<bool> validity);

    /// The explicit index, or a single unnamed Int64 level `0..rows-1`.
    [[nodiscard]] auto index_levels() const -> std::vector<IndexLevel>;

    /// Column by name, or nullptr.
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto position(const std::string& name) const -> std::optional<std::size_t>;
    /// Row count, taken from the first column or the index.
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;

   private:
    void rebuild_lookup();
};

/// A single named column with its own row index.
struct Series {
    std::string name;
    std::shared_ptr<ColumnValue> values;
    Validity validity;
    std::vector<IndexLevel> index;

    /// Series with no nulls and the default index.
    [[nodiscard]] static auto make(std::string name, ColumnValue values) -> Series;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

}  // namespace framecheck
