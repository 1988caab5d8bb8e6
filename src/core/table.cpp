#include <framecheck/core/table.hpp>

#include <fmt/format.h>

#include <array>
#include <charconv>
#include <cmath>
#include <numeric>
#include <stdexcept>
#include <type_traits>

namespace framecheck {

namespace {

auto format_double(double value) -> std::string {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value > 0 ? "inf" : "-inf";
    }
    std::array<char, 64> buffer{};
    auto [ptr, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec == std::errc{}) {
        return std::string(buffer.data(), ptr);
    }
    return fmt::format("{}", value);
}

auto check_length(const Table& table, const ColumnValue& column, std::string_view what) -> void {
    if (!table.columns.empty() && column_size(column) != table.rows()) {
        throw std::invalid_argument(fmt::format("{} has {} rows, table has {}", what,
                                                column_size(column), table.rows()));
    }
}

}  // namespace

auto dtype_of(const ColumnValue& column) noexcept -> DType {
    return std::visit(
        [](const auto& col) -> DType {
            using ColType = std::decay_t<decltype(col)>;
            if constexpr (std::is_same_v<ColType, Column<std::int64_t>>) {
                return DType::Int64;
            } else if constexpr (std::is_same_v<ColType, Column<double>>) {
                return DType::Float64;
            } else if constexpr (std::is_same_v<ColType, Column<std::string>>) {
                return DType::String;
            } else if constexpr (std::is_same_v<ColType, Column<Bool>>) {
                return DType::Bool;
            } else if constexpr (std::is_same_v<ColType, Column<Timestamp>>) {
                return DType::Datetime;
            } else if constexpr (std::is_same_v<ColType, Column<Date>>) {
                return DType::Date;
            } else {
                return DType::Categorical;
            }
        },
        column);
}

auto dtype_name(DType dtype) noexcept -> std::string_view {
    switch (dtype) {
        case DType::Int64:
            return "Int64";
        case DType::Float64:
            return "Float64";
        case DType::String:
            return "String";
        case DType::Bool:
            return "Bool";
        case DType::Datetime:
            return "Datetime";
        case DType::Date:
            return "Date";
        case DType::Categorical:
            return "Categorical";
    }
    return "Unknown";
}

auto column_size(const ColumnValue& column) noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto make_column(DType dtype) -> ColumnValue {
    switch (dtype) {
        case DType::Int64:
            return Column<std::int64_t>{};
        case DType::Float64:
            return Column<double>{};
        case DType::String:
            return Column<std::string>{};
        case DType::Bool:
            return Column<Bool>{};
        case DType::Datetime:
            return Column<Timestamp>{};
        case DType::Date:
            return Column<Date>{};
        case DType::Categorical:
            return Column<Categorical>{};
    }
    return Column<std::int64_t>{};
}

auto is_null(const ColumnValue& column, const Validity& validity, std::size_t row) -> bool {
    if (validity.has_value() && !(*validity)[row]) {
        return true;
    }
    if (const auto* doubles = std::get_if<Column<double>>(&column)) {
        return std::isnan((*doubles)[row]);
    }
    return false;
}

auto format_cell(const ColumnValue& column, const Validity& validity, std::size_t row)
    -> std::string {
    if (validity.has_value() && !(*validity)[row]) {
        return "null";
    }
    return std::visit(
        [row](const auto& col) -> std::string {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, Date>) {
                return format_date(col[row]);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(col[row]);
            } else if constexpr (std::is_same_v<T, Bool>) {
                return col[row].value ? "true" : "false";
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(col[row]);
            } else if constexpr (std::is_same_v<T, std::string> ||
                                 std::is_same_v<T, std::string_view>) {
                return fmt::format("\"{}\"", col[row]);
            } else {
                return fmt::format("{}", col[row]);
            }
        },
        column);
}

void Table::add_column(std::string name, ColumnValue column) {
    check_length(*this, column, fmt::format("column '{}'", name));
    if (auto it = lookup.find(name); it != lookup.end()) {
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column)),
                                  .validity = std::nullopt});
    lookup[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    if (validity.size() != column_size(column)) {
        throw std::invalid_argument(
            fmt::format("validity of column '{}' has {} rows, column has {}", name,
                        validity.size(), column_size(column)));
    }
    auto key = name;
    add_column(std::move(name), std::move(column));
    columns[lookup.at(key)].validity = std::move(validity);
}

void Table::replace_column(std::size_t pos, ColumnValue column) {
    auto& entry = columns.at(pos);
    if (column_size(column) != column_size(*entry.column)) {
        throw std::invalid_argument(fmt::format("replacement for column '{}' changes its length",
                                                entry.name));
    }
    entry.column = std::make_shared<ColumnValue>(std::move(column));
}

void Table::select_columns(const std::vector<std::size_t>& positions) {
    std::vector<ColumnEntry> kept;
    kept.reserve(positions.size());
    for (auto pos : positions) {
        kept.push_back(columns.at(pos));
    }
    columns = std::move(kept);
    rebuild_lookup();
}

void Table::add_index_level(std::optional<std::string> name, ColumnValue values) {
    check_length(*this, values, "index level");
    index.push_back(IndexLevel{.name = std::move(name),
                               .values = std::make_shared<ColumnValue>(std::move(values)),
                               .validity = std::nullopt});
}

void Table::add_index_level(std::optional<std::string> name, ColumnValue values,
                            std::vector<bool> validity) {
    if (validity.size() != column_size(values)) {
        throw std::invalid_argument("index validity length does not match its values");
    }
    add_index_level(std::move(name), std::move(values));
    index.back().validity = std::move(validity);
}

auto Table::index_levels() const -> std::vector<IndexLevel> {
    if (!index.empty()) {
        return index;
    }
    std::vector<std::int64_t> positions(rows());
    std::iota(positions.begin(), positions.end(), std::int64_t{0});
    return {IndexLevel{.name = std::nullopt,
                       .values = std::make_shared<ColumnValue>(
                           Column<std::int64_t>{std::move(positions)}),
                       .validity = std::nullopt}};
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = lookup.find(name); it != lookup.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = lookup.find(name); it != lookup.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::position(const std::string& name) const -> std::optional<std::size_t> {
    if (auto it = lookup.find(name); it != lookup.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        if (!index.empty()) {
            return column_size(*index.front().values);
        }
        return 0;
    }
    return column_size(*columns.front().column);
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

void Table::rebuild_lookup() {
    lookup.clear();
    for (std::size_t i = 0; i < columns.size(); ++i) {
        lookup[columns[i].name] = i;
    }
}

auto Series::make(std::string name, ColumnValue values) -> Series {
    return Series{.name = std::move(name),
                  .values = std::make_shared<ColumnValue>(std::move(values)),
                  .validity = std::nullopt,
                  .index = {}};
}

auto Series::rows() const noexcept -> std::size_t {
    return values == nullptr ? 0 : column_size(*values);
}

}  // namespace framecheck
