#include <framecheck/schema/model.hpp>

namespace framecheck::schema {

auto SchemaModel::field(const std::string& name) const -> const FieldSpec* {
    for (const auto& spec : columns_) {
        if (spec.name == name) {
            return &spec;
        }
    }
    return nullptr;
}

auto SchemaModel::alias_pattern(std::size_t pos) const -> const std::regex* {
    const auto& pattern = alias_patterns_.at(pos);
    return pattern.has_value() ? &*pattern : nullptr;
}

auto SchemaModel::matches(std::size_t pos, const std::string& column_name) const -> bool {
    if (const auto* pattern = alias_pattern(pos)) {
        return std::regex_match(column_name, *pattern);
    }
    const auto& spec = columns_.at(pos);
    return column_name == spec.alias.value_or(spec.name);
}

}  // namespace framecheck::schema
