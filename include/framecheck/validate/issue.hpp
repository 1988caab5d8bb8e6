#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace framecheck::validate {

/// Error class of an issue.
enum class IssueKind : std::uint8_t {
    /// Shape problems: missing or unexpected columns, index layout, value shape,
    /// traversal limits.
    Structural,
    /// A value that cannot be cast losslessly to its declared type.
    Coercion,
    /// A present, correctly shaped column whose contents break a constraint.
    Constraint,
};

/// Which rule produced an issue.
enum class Constraint : std::uint8_t {
    MissingColumn,
    UnexpectedColumn,
    ColumnOrder,
    PatternUnmatched,
    IndexLevels,
    IndexName,
    ValueShape,
    MissingArgument,
    DepthLimit,
    Cycle,
    Coerce,
    DType,
    Nullable,
    Gt,
    Ge,
    Lt,
    Le,
    Isin,
    Notin,
    StrContains,
    StrStartswith,
    StrEndswith,
    Unique,
    Check,
    IndexUnique,
    IndexSorted,
    TableCheck,
};

[[nodiscard]] auto kind_name(IssueKind kind) noexcept -> std::string_view;
[[nodiscard]] auto constraint_name(Constraint constraint) noexcept -> std::string_view;

/// One validation failure.
///
/// `count` is the total number of offending rows; `rows` and `values` hold at most
/// ValidationOptions::sample_limit of them.
struct Issue {
    IssueKind kind = IssueKind::Constraint;
    Constraint constraint = Constraint::Check;
    /// Location of the validated value within the call, e.g. `frames[1]`.
    std::string path;
    /// Column or index level name; empty for table-wide issues.
    std::string field;
    bool on_index = false;
    std::size_t count = 0;
    std::vector<std::size_t> rows;
    std::vector<std::string> values;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

using Issues = std::vector<Issue>;

/// Thrown to the caller of a checked function; bundles every issue of one pass.
class AggregateValidationError : public std::runtime_error {
   public:
    explicit AggregateValidationError(Issues issues);

    [[nodiscard]] auto issues() const noexcept -> const Issues& { return issues_; }

   private:
    Issues issues_;
};

/// Render issues one per line.
[[nodiscard]] auto format_issues(const Issues& issues) -> std::string;

}  // namespace framecheck::validate
