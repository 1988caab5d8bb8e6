#include <framecheck/inspect/value.hpp>

namespace framecheck::inspect {

auto make_scalar(ScalarValue value) -> Value {
    return Value{.node = std::move(value)};
}

auto make_sequence(std::vector<Value> items) -> Value {
    return Value{.node = std::make_shared<Sequence>(std::move(items))};
}

auto make_mapping(Mapping entries) -> Value {
    return Value{.node = std::make_shared<Mapping>(std::move(entries))};
}

auto make_table(Table table) -> Value {
    return Value{.node = std::move(table)};
}

auto make_series(Series series) -> Value {
    return Value{.node = std::move(series)};
}

auto value_kind_name(ValueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ValueKind::Scalar:
            return "scalar";
        case ValueKind::Sequence:
            return "sequence";
        case ValueKind::Mapping:
            return "mapping";
        case ValueKind::Table:
            return "table";
        case ValueKind::Series:
            return "series";
    }
    return "unknown";
}

}  // namespace framecheck::inspect
