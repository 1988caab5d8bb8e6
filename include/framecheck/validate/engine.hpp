#pragma once

#include <framecheck/core/table.hpp>
#include <framecheck/schema/model.hpp>
#include <framecheck/validate/context.hpp>
#include <framecheck/validate/issue.hpp>

namespace framecheck::validate {

/// Outcome of validating a copy of a table.
struct ValidationResult {
    /// The validated working copy, coerced and filtered as the schema asks.
    Table table;
    Issues issues;

    [[nodiscard]] auto ok() const noexcept -> bool { return issues.empty(); }
};

/// Validate `working` against `schema`, collecting every issue.
///
/// Runs the structural pass (missing, unexpected and misordered columns), the
/// index pass, the per-field pass in declaration order and finally the
/// table-wide checks. Nothing stops early: the returned list holds every
/// problem found, in a deterministic order. An empty list means success.
///
/// `working` is the caller's working copy. Coerced columns replace the original
/// ones in it and, in filter mode, undeclared columns are removed and the rest
/// reordered to declaration order.
[[nodiscard]] auto validate(const schema::SchemaModel& schema, Table& working,
                            ValidationContext& context) -> Issues;

/// Validate a copy of `table`.
[[nodiscard]] auto validate(const schema::SchemaModel& schema, const Table& table,
                            ValidationOptions options = {}) -> ValidationResult;

/// Validate a Series against a schema declaring exactly one column. The
/// series name is not compared with the declared column name.
[[nodiscard]] auto validate(const schema::SchemaModel& schema, Series& working,
                            ValidationContext& context) -> Issues;

}  // namespace framecheck::validate
