#pragma once

#include <framecheck/schema/field.hpp>
#include <framecheck/schema/index_spec.hpp>

#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace framecheck::schema {

/// Schema-wide behaviour.
struct SchemaConfig {
    /// Undeclared columns are an error.
    bool strict = false;
    /// Undeclared columns are dropped and the result follows declared order.
    bool filter = false;
    /// Default for fields that leave `coerce` unset.
    bool coerce = false;
    /// Declared columns must appear in declared order. Needs `strict` or `filter`.
    bool ordered = false;
};

/// A column check targeting every column whose name matches one of `patterns`.
struct PatternCheck {
    std::vector<std::string> patterns;
    std::vector<std::regex> compiled;
    ColumnCheck check;
};

class SchemaBuilder;

/// Compiled, immutable description of one table shape.
///
/// Only SchemaBuilder creates these. Once built, a model is never mutated and
/// can be shared between any number of concurrent validations.
class SchemaModel {
   public:
    [[nodiscard]] auto name() const noexcept -> const std::string& { return name_; }
    [[nodiscard]] auto columns() const noexcept -> const std::vector<FieldSpec>& {
        return columns_;
    }
    [[nodiscard]] auto index() const noexcept -> const IndexSpec& { return index_; }
    [[nodiscard]] auto config() const noexcept -> const SchemaConfig& { return config_; }
    [[nodiscard]] auto pattern_checks() const noexcept -> const std::vector<PatternCheck>& {
        return pattern_checks_;
    }
    [[nodiscard]] auto table_checks() const noexcept -> const std::vector<TableCheck>& {
        return table_checks_;
    }

    /// Declared field by name.
    [[nodiscard]] auto field(const std::string& name) const -> const FieldSpec*;

    /// Compiled alias pattern of the column at `pos`, if it is a regex field.
    [[nodiscard]] auto alias_pattern(std::size_t pos) const -> const std::regex*;

    /// Whether the field at `pos` resolves against the given column name.
    [[nodiscard]] auto matches(std::size_t pos, const std::string& column_name) const -> bool;

    /// Effective coercion flag of a field.
    [[nodiscard]] auto coerces(const FieldSpec& field) const noexcept -> bool {
        return field.coerce.value_or(config_.coerce);
    }

   private:
    friend class SchemaBuilder;

    SchemaModel() = default;

    std::string name_;
    std::vector<FieldSpec> columns_;
    std::vector<std::optional<std::regex>> alias_patterns_;
    IndexSpec index_;
    SchemaConfig config_;
    std::vector<PatternCheck> pattern_checks_;
    std::vector<TableCheck> table_checks_;
};

using SchemaRef = std::shared_ptr<const SchemaModel>;

}  // namespace framecheck::schema
