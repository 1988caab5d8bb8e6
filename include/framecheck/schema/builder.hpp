#pragma once

#include <framecheck/schema/model.hpp>

#include <expected>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace framecheck::schema {

/// A malformed schema definition.
struct DefinitionError {
    std::string message;
    /// Offending column or index level, if any.
    std::string field;

    [[nodiscard]] auto format() const -> std::string;
};

/// Thrown by SchemaBuilder::build_or_throw().
class SchemaDefinitionError : public std::runtime_error {
   public:
    explicit SchemaDefinitionError(DefinitionError error)
        : std::runtime_error(error.format()), error_(std::move(error)) {}

    [[nodiscard]] auto error() const noexcept -> const DefinitionError& { return error_; }

   private:
    DefinitionError error_;
};

using BuildResult = std::expected<SchemaModel, DefinitionError>;

/// Declarative schema definition, compiled once into an immutable SchemaModel.
///
///   auto trades = SchemaBuilder("Trades")
///                     .index("id", DType::Int64, {.unique = true})
///                     .column("symbol", DType::Categorical)
///                     .column("price", DType::Float64, {.gt = 0.0})
///                     .strict()
///                     .build_or_throw();
///
/// Every definition problem is reported by build(); none are deferred to
/// validation time.
class SchemaBuilder {
   public:
    explicit SchemaBuilder(std::string name = "Schema") : name_(std::move(name)) {}

    auto column(std::string name, DType dtype, FieldSpec spec = {}) -> SchemaBuilder&;

    /// Declare the next index level. An empty name declares an unnamed level.
    auto index(std::string name, DType dtype, FieldSpec spec = {}) -> SchemaBuilder&;

    auto check_index_name(bool enabled = true) -> SchemaBuilder&;
    auto index_unique(bool enabled = true) -> SchemaBuilder&;
    auto index_sorted(bool enabled = true) -> SchemaBuilder&;

    auto strict(bool enabled = true) -> SchemaBuilder&;
    auto filter(bool enabled = true) -> SchemaBuilder&;
    auto coerce(bool enabled = true) -> SchemaBuilder&;
    auto ordered(bool enabled = true) -> SchemaBuilder&;
    auto config(SchemaConfig config) -> SchemaBuilder&;

    /// Attach `check` to each named column.
    auto check(std::vector<std::string> columns, ColumnCheck check) -> SchemaBuilder&;

    /// Attach `check` to every table column whose name matches one of `patterns`.
    /// A pattern that matches nothing at validation time is a structural error.
    auto check_regex(std::vector<std::string> patterns, ColumnCheck check) -> SchemaBuilder&;

    auto table_check(TableCheck check) -> SchemaBuilder&;

    [[nodiscard]] auto build() const -> BuildResult;
    [[nodiscard]] auto build_shared() const -> std::expected<SchemaRef, DefinitionError>;
    [[nodiscard]] auto build_or_throw() const -> SchemaRef;

   private:
    std::string name_;
    std::vector<FieldSpec> columns_;
    IndexSpec index_;
    SchemaConfig config_;
    std::vector<std::pair<std::vector<std::string>, ColumnCheck>> column_checks_;
    std::vector<std::pair<std::vector<std::string>, ColumnCheck>> pattern_checks_;
    std::vector<TableCheck> table_checks_;
};

}  // namespace framecheck::schema
