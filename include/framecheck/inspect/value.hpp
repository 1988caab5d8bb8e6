#pragma once

#include <framecheck/core/table.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace framecheck::inspect {

/// Leaf value that is never validated. monostate stands for "no value".
using ScalarValue = std::variant<std::monostate, std::int64_t, double, std::string, bool>;

struct Value;
using Sequence = std::vector<Value>;
/// Entries are visited in key order.
using Mapping = std::map<std::string, Value>;
using SequencePtr = std::shared_ptr<Sequence>;
using MappingPtr = std::shared_ptr<Mapping>;

/// Order matches the alternatives of Value::node.
enum class ValueKind : std::uint8_t {
    Scalar,
    Sequence,
    Mapping,
    Table,
    Series,
};

/// An argument or return value of a checked call.
///
/// Sequences and mappings are shared between copies of a Value, so a container
/// may end up holding itself. Tables and series are held by value; their column
/// storage is shared.
struct Value {
    std::variant<ScalarValue, SequencePtr, MappingPtr, Table, Series> node;

    [[nodiscard]] auto kind() const noexcept -> ValueKind {
        return static_cast<ValueKind>(node.index());
    }

    [[nodiscard]] auto as_table() noexcept -> Table* { return std::get_if<Table>(&node); }
    [[nodiscard]] auto as_table() const noexcept -> const Table* {
        return std::get_if<Table>(&node);
    }
    [[nodiscard]] auto as_series() noexcept -> Series* { return std::get_if<Series>(&node); }
    [[nodiscard]] auto as_series() const noexcept -> const Series* {
        return std::get_if<Series>(&node);
    }
    [[nodiscard]] auto as_scalar() const noexcept -> const ScalarValue* {
        return std::get_if<ScalarValue>(&node);
    }

    /// The shared sequence, or null if this is not a sequence.
    [[nodiscard]] auto as_sequence() const noexcept -> Sequence* {
        const auto* ptr = std::get_if<SequencePtr>(&node);
        return ptr == nullptr ? nullptr : ptr->get();
    }
    /// The shared mapping, or null if this is not a mapping.
    [[nodiscard]] auto as_mapping() const noexcept -> Mapping* {
        const auto* ptr = std::get_if<MappingPtr>(&node);
        return ptr == nullptr ? nullptr : ptr->get();
    }
};

[[nodiscard]] auto make_scalar(ScalarValue value) -> Value;
[[nodiscard]] auto make_sequence(std::vector<Value> items) -> Value;
[[nodiscard]] auto make_mapping(Mapping entries) -> Value;
[[nodiscard]] auto make_table(Table table) -> Value;
[[nodiscard]] auto make_series(Series series) -> Value;

[[nodiscard]] auto value_kind_name(ValueKind kind) noexcept -> std::string_view;

}  // namespace framecheck::inspect
