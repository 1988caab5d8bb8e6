#include <framecheck/validate/issue.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace framecheck::validate {

auto kind_name(IssueKind kind) noexcept -> std::string_view {
    switch (kind) {
        case IssueKind::Structural:
            return "structural";
        case IssueKind::Coercion:
            return "coercion";
        case IssueKind::Constraint:
            return "constraint";
    }
    return "unknown";
}

auto constraint_name(Constraint constraint) noexcept -> std::string_view {
    switch (constraint) {
        case Constraint::MissingColumn:
            return "missing_column";
        case Constraint::UnexpectedColumn:
            return "unexpected_column";
        case Constraint::ColumnOrder:
            return "column_order";
        case Constraint::PatternUnmatched:
            return "pattern_unmatched";
        case Constraint::IndexLevels:
            return "index_levels";
        case Constraint::IndexName:
            return "index_name";
        case Constraint::ValueShape:
            return "value_shape";
        case Constraint::MissingArgument:
            return "missing_argument";
        case Constraint::DepthLimit:
            return "depth_limit";
        case Constraint::Cycle:
            return "cycle";
        case Constraint::Coerce:
            return "coerce";
        case Constraint::DType:
            return "dtype";
        case Constraint::Nullable:
            return "nullable";
        case Constraint::Gt:
            return "gt";
        case Constraint::Ge:
            return "ge";
        case Constraint::Lt:
            return "lt";
        case Constraint::Le:
            return "le";
        case Constraint::Isin:
            return "isin";
        case Constraint::Notin:
            return "notin";
        case Constraint::StrContains:
            return "str_contains";
        case Constraint::StrStartswith:
            return "str_startswith";
        case Constraint::StrEndswith:
            return "str_endswith";
        case Constraint::Unique:
            return "unique";
        case Constraint::Check:
            return "check";
        case Constraint::IndexUnique:
            return "index_unique";
        case Constraint::IndexSorted:
            return "index_sorted";
        case Constraint::TableCheck:
            return "table_check";
    }
    return "unknown";
}

auto Issue::format() const -> std::string {
    std::string out = fmt::format("[{}/{}]", kind_name(kind), constraint_name(constraint));
    if (!path.empty()) {
        out += fmt::format(" {}", path);
    }
    if (!field.empty()) {
        out += fmt::format(" {} `{}`", on_index ? "index level" : "column", field);
    }
    if (!message.empty()) {
        out += fmt::format(": {}", message);
    }
    if (count > 0) {
        out += fmt::format(" ({} row{}", count, count == 1 ? "" : "s");
        if (!rows.empty()) {
            out += fmt::format(", rows [{}]", fmt::join(rows, ", "));
        }
        if (!values.empty()) {
            out += fmt::format(", values [{}]", fmt::join(values, ", "));
        }
        out += ")";
    }
    return out;
}

auto format_issues(const Issues& issues) -> std::string {
    std::string out = fmt::format("validation failed with {} issue{}", issues.size(),
                                  issues.size() == 1 ? "" : "s");
    for (const auto& issue : issues) {
        out += "\n  ";
        out += issue.format();
    }
    return out;
}

AggregateValidationError::AggregateValidationError(Issues issues)
    : std::runtime_error(format_issues(issues)), issues_(std::move(issues)) {}

}  // namespace framecheck::validate
