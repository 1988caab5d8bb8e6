#include <framecheck/validate/engine.hpp>

#include <framecheck/validate/coerce.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <robin_hood.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <exception>
#include <memory>
#include <regex>
#include <string_view>
#include <type_traits>
#include <variant>

namespace framecheck::validate {

namespace {

using schema::Bound;
using schema::FieldSpec;
using schema::Scalar;
using schema::SchemaModel;

// Hash and set key for a column element: strings are keyed by view.
template <typename T>
using KeyOf = std::conditional_t<std::is_same_v<T, std::string>, std::string_view, T>;

/// One cell of a combined index key. Null cells compare equal to each other.
using Cell =
    std::variant<std::monostate, std::int64_t, double, std::string_view, Bool, Timestamp, Date>;

auto cell_at(const ColumnValue& column, const Validity& validity, std::size_t row) -> Cell {
    if (is_null(column, validity, row)) {
        return std::monostate{};
    }
    return std::visit(
        [row](const auto& col) -> Cell {
            using T = typename std::decay_t<decltype(col)>::value_type;
            return KeyOf<T>{col[row]};
        },
        column);
}

struct Key {
    std::vector<Cell> values;
};

struct KeyHash {
    auto operator()(const Key& key) const -> std::size_t {
        std::size_t seed = 0;
        auto hash_combine = [&](std::size_t value) {
            seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
        };
        for (const auto& value : key.values) {
            hash_combine(std::hash<Cell>{}(value));
        }
        return seed;
    }
};

struct KeyEq {
    auto operator()(const Key& lhs, const Key& rhs) const -> bool {
        return lhs.values == rhs.values;
    }
};

auto make_issue(const ValidationContext& context, IssueKind kind, Constraint constraint,
                std::string field, bool on_index, std::string message) -> Issue {
    return Issue{.kind = kind,
                 .constraint = constraint,
                 .path = context.path(),
                 .field = std::move(field),
                 .on_index = on_index,
                 .count = 0,
                 .rows = {},
                 .values = {},
                 .message = std::move(message)};
}

/// Issues raised against one column or index level.
class FieldScope {
   public:
    FieldScope(ValidationContext& context, Issues& issues, std::string field, bool on_index)
        : context_(context), issues_(issues), field_(std::move(field)), on_index_(on_index) {}

    void add(Issue issue) { issues_.push_back(std::move(issue)); }

    void report(IssueKind kind, Constraint constraint, std::string message) {
        issues_.push_back(
            make_issue(context_, kind, constraint, field_, on_index_, std::move(message)));
    }

    void report_rows(Constraint constraint, const ColumnEntry& entry,
                     const std::vector<std::size_t>& rows, std::string message) {
        auto issue = make_issue(context_, IssueKind::Constraint, constraint, field_, on_index_,
                                std::move(message));
        issue.count = rows.size();
        const auto limit = context_.options().sample_limit;
        for (std::size_t i = 0; i < rows.size() && i < limit; ++i) {
            issue.rows.push_back(rows[i]);
            issue.values.push_back(format_cell(*entry.column, entry.validity, rows[i]));
        }
        issues_.push_back(std::move(issue));
    }

    [[nodiscard]] auto context() const noexcept -> const ValidationContext& { return context_; }
    [[nodiscard]] auto field() const noexcept -> const std::string& { return field_; }
    [[nodiscard]] auto on_index() const noexcept -> bool { return on_index_; }

   private:
    ValidationContext& context_;
    Issues& issues_;
    std::string field_;
    bool on_index_;
};

/// Non-null rows for which `test` holds.
template <typename Test>
auto offending_rows(const ColumnEntry& entry, Test&& test) -> std::vector<std::size_t> {
    std::vector<std::size_t> rows;
    std::visit(
        [&](const auto& col) {
            for (std::size_t row = 0; row < col.size(); ++row) {
                if (!is_null(entry, row) && test(col[row])) {
                    rows.push_back(row);
                }
            }
        },
        *entry.column);
    return rows;
}

enum class Cmp : std::uint8_t { Gt, Ge, Lt, Le };

template <typename A>
auto compare(A lhs, A rhs, Cmp cmp) -> bool {
    switch (cmp) {
        case Cmp::Gt:
            return lhs > rhs;
        case Cmp::Ge:
            return lhs >= rhs;
        case Cmp::Lt:
            return lhs < rhs;
        case Cmp::Le:
            return lhs <= rhs;
    }
    return false;
}

template <typename T>
auto satisfies(T value, const Bound& bound, Cmp cmp) -> bool {
    return std::visit(
        [&](auto limit) -> bool {
            if constexpr (std::is_same_v<T, std::int64_t> &&
                          std::is_same_v<decltype(limit), std::int64_t>) {
                return compare(value, limit, cmp);
            } else {
                return compare(static_cast<double>(value), static_cast<double>(limit), cmp);
            }
        },
        bound);
}

auto bound_rows(const ColumnEntry& entry, const Bound& bound, Cmp cmp)
    -> std::vector<std::size_t> {
    return offending_rows(entry, [&](const auto& value) -> bool {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, double>) {
            return !satisfies(value, bound, cmp);
        } else {
            return false;
        }
    });
}

/// The members of `values` usable as keys of type T.
template <typename T>
auto member_keys(const std::vector<Scalar>& values) -> robin_hood::unordered_flat_set<T> {
    robin_hood::unordered_flat_set<T> keys;
    keys.reserve(values.size());
    for (const auto& value : values) {
        std::visit(
            [&keys](const auto& member) {
                using S = std::decay_t<decltype(member)>;
                if constexpr (std::is_same_v<T, double> &&
                              (std::is_same_v<S, std::int64_t> || std::is_same_v<S, double>)) {
                    keys.insert(static_cast<double>(member));
                } else if constexpr (std::is_same_v<T, std::string_view> &&
                                     std::is_same_v<S, std::string>) {
                    keys.insert(std::string_view{member});
                } else if constexpr (std::is_same_v<T, Bool> && std::is_same_v<S, bool>) {
                    keys.insert(Bool{member});
                } else if constexpr (std::is_same_v<T, S>) {
                    keys.insert(member);
                }
            },
            value);
    }
    return keys;
}

auto membership_rows(const ColumnEntry& entry, const std::vector<Scalar>& values,
                     bool must_be_member) -> std::vector<std::size_t> {
    std::vector<std::size_t> rows;
    std::visit(
        [&](const auto& col) {
            using T = KeyOf<typename std::decay_t<decltype(col)>::value_type>;
            auto keys = member_keys<T>(values);
            for (std::size_t row = 0; row < col.size(); ++row) {
                if (is_null(entry, row)) {
                    continue;
                }
                if ((keys.count(T{col[row]}) != 0) != must_be_member) {
                    rows.push_back(row);
                }
            }
        },
        *entry.column);
    return rows;
}

template <typename Pred>
auto string_rows(const ColumnEntry& entry, Pred pred) -> std::vector<std::size_t> {
    return offending_rows(entry, [&](const auto& value) -> bool {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_convertible_v<const T&, std::string_view>) {
            return !pred(std::string_view{value});
        } else {
            return false;
        }
    });
}

/// Every occurrence of a value after its first.
auto duplicate_rows(const ColumnEntry& entry) -> std::vector<std::size_t> {
    std::vector<std::size_t> rows;
    std::visit(
        [&](const auto& col) {
            using T = KeyOf<typename std::decay_t<decltype(col)>::value_type>;
            robin_hood::unordered_flat_set<T> seen;
            seen.reserve(col.size());
            for (std::size_t row = 0; row < col.size(); ++row) {
                if (is_null(entry, row)) {
                    continue;
                }
                if (!seen.insert(T{col[row]}).second) {
                    rows.push_back(row);
                }
            }
        },
        *entry.column);
    return rows;
}

void run_check(const schema::ColumnCheck& check, const ColumnEntry& entry, FieldScope& scope) {
    schema::CheckResult result;
    try {
        result = check.fn(entry);
    } catch (const std::exception& e) {
        scope.report(IssueKind::Constraint, Constraint::Check,
                     fmt::format("check `{}` raised: {}", check.name, e.what()));
        return;
    }

    if (const auto* whole = std::get_if<schema::WholeColumn>(&result)) {
        if (!whole->passed) {
            scope.report(IssueKind::Constraint, Constraint::Check,
                         fmt::format("failed check `{}`", check.name));
        }
        return;
    }
    const auto& passed = std::get<schema::PerRow>(result).passed;
    const std::size_t rows = column_size(*entry.column);
    if (passed.size() != rows) {
        scope.report(IssueKind::Constraint, Constraint::Check,
                     fmt::format("check `{}` returned {} results for {} rows", check.name,
                                 passed.size(), rows));
        return;
    }
    std::vector<std::size_t> failing;
    for (std::size_t row = 0; row < rows; ++row) {
        if (!passed[row]) {
            failing.push_back(row);
        }
    }
    if (!failing.empty()) {
        scope.report_rows(Constraint::Check, entry, failing,
                          fmt::format("failed check `{}`", check.name));
    }
}

/// Coercion, type, nullability, value constraints, uniqueness and checks for one
/// column or index level. Coerced values are written back into `entry`.
void check_field(const SchemaModel& model, const FieldSpec& spec, ColumnEntry& entry,
                 FieldScope& scope) {
    const DType actual = dtype_of(*entry.column);
    if (actual != spec.dtype) {
        if (!model.coerces(spec)) {
            scope.report(IssueKind::Constraint, Constraint::DType,
                         fmt::format("expected {}, found {}", dtype_name(spec.dtype),
                                     dtype_name(actual)));
            return;
        }
        auto coerced = coerce_column(*entry.column, entry.validity, spec.dtype,
                                     scope.context().options().sample_limit);
        if (!coerced.has_value()) {
            auto& failure = coerced.error();
            auto issue = make_issue(scope.context(), IssueKind::Coercion, Constraint::Coerce,
                                    scope.field(), scope.on_index(), std::move(failure.message));
            issue.count = failure.count;
            issue.rows = std::move(failure.rows);
            issue.values = std::move(failure.values);
            scope.add(std::move(issue));
            return;
        }
        spdlog::debug("coerced {} `{}` from {} to {}",
                      scope.on_index() ? "index level" : "column", scope.field(),
                      dtype_name(actual), dtype_name(spec.dtype));
        entry.column = std::make_shared<ColumnValue>(std::move(coerced->column));
        entry.validity = std::move(coerced->validity);
    }

    if (!spec.nullable) {
        std::vector<std::size_t> nulls;
        const std::size_t rows = column_size(*entry.column);
        for (std::size_t row = 0; row < rows; ++row) {
            if (is_null(entry, row)) {
                nulls.push_back(row);
            }
        }
        if (!nulls.empty()) {
            scope.report_rows(Constraint::Nullable, entry, nulls, "null values not allowed");
        }
    }

    struct BoundRule {
        Constraint constraint;
        const std::optional<Bound>* bound;
        Cmp cmp;
        std::string_view op;
    };
    const BoundRule bounds[] = {
        {Constraint::Gt, &spec.gt, Cmp::Gt, ">"},
        {Constraint::Ge, &spec.ge, Cmp::Ge, ">="},
        {Constraint::Lt, &spec.lt, Cmp::Lt, "<"},
        {Constraint::Le, &spec.le, Cmp::Le, "<="},
    };
    for (const auto& rule : bounds) {
        if (!rule.bound->has_value()) {
            continue;
        }
        auto rows = bound_rows(entry, **rule.bound, rule.cmp);
        if (!rows.empty()) {
            scope.report_rows(rule.constraint, entry, rows,
                              fmt::format("values must be {} {}", rule.op,
                                          schema::format_bound(**rule.bound)));
        }
    }

    auto render_set = [](const std::vector<Scalar>& values) {
        std::vector<std::string> out;
        out.reserve(values.size());
        for (const auto& value : values) {
            out.push_back(schema::format_scalar(value));
        }
        return fmt::format("{{{}}}", fmt::join(out, ", "));
    };
    if (spec.isin.has_value()) {
        auto rows = membership_rows(entry, *spec.isin, true);
        if (!rows.empty()) {
            scope.report_rows(Constraint::Isin, entry, rows,
                              fmt::format("values must be in {}", render_set(*spec.isin)));
        }
    }
    if (spec.notin.has_value()) {
        auto rows = membership_rows(entry, *spec.notin, false);
        if (!rows.empty()) {
            scope.report_rows(Constraint::Notin, entry, rows,
                              fmt::format("values must not be in {}", render_set(*spec.notin)));
        }
    }

    if (spec.str_contains.has_value()) {
        const std::string_view needle = *spec.str_contains;
        auto rows = string_rows(entry, [needle](std::string_view v) {
            return v.find(needle) != std::string_view::npos;
        });
        if (!rows.empty()) {
            scope.report_rows(Constraint::StrContains, entry, rows,
                              fmt::format("values must contain \"{}\"", needle));
        }
    }
    if (spec.str_startswith.has_value()) {
        const std::string_view prefix = *spec.str_startswith;
        auto rows = string_rows(entry, [prefix](std::string_view v) {
            return v.starts_with(prefix);
        });
        if (!rows.empty()) {
            scope.report_rows(Constraint::StrStartswith, entry, rows,
                              fmt::format("values must start with \"{}\"", prefix));
        }
    }
    if (spec.str_endswith.has_value()) {
        const std::string_view suffix = *spec.str_endswith;
        auto rows = string_rows(entry, [suffix](std::string_view v) {
            return v.ends_with(suffix);
        });
        if (!rows.empty()) {
            scope.report_rows(Constraint::StrEndswith, entry, rows,
                              fmt::format("values must end with \"{}\"", suffix));
        }
    }

    if (spec.unique) {
        auto rows = duplicate_rows(entry);
        if (!rows.empty()) {
            scope.report_rows(Constraint::Unique, entry, rows, "values must be unique");
        }
    }

    for (const auto& check : spec.checks) {
        run_check(check, entry, scope);
    }
}

/// Declared fields resolved to table positions.
struct Resolution {
    /// Per declared field, the positions of the columns it validates.
    std::vector<std::vector<std::size_t>> positions;
    std::vector<bool> claimed;
};

auto resolve(const SchemaModel& model, const Table& working) -> Resolution {
    const auto& fields = model.columns();
    Resolution out{.positions = std::vector<std::vector<std::size_t>>(fields.size()),
                   .claimed = std::vector<bool>(working.columns.size(), false)};
    for (std::size_t i = 0; i < fields.size(); ++i) {
        for (std::size_t pos = 0; pos < working.columns.size(); ++pos) {
            if (!model.matches(i, working.columns[pos].name)) {
                continue;
            }
            out.positions[i].push_back(pos);
            out.claimed[pos] = true;
            if (!fields[i].regex) {
                break;
            }
        }
    }
    return out;
}

void check_structure(const SchemaModel& model, Table& working, Resolution& resolution,
                     ValidationContext& context, Issues& issues) {
    const auto& fields = model.columns();
    const auto& config = model.config();

    for (std::size_t i = 0; i < fields.size(); ++i) {
        const auto& spec = fields[i];
        if (!resolution.positions[i].empty() || spec.optional) {
            continue;
        }
        std::string message;
        if (spec.regex) {
            message = fmt::format("no column matches pattern `{}`", *spec.alias);
        } else if (spec.alias.has_value()) {
            message = fmt::format("column `{}` not found", *spec.alias);
        } else {
            message = "column not found";
        }
        issues.push_back(make_issue(context, IssueKind::Structural, Constraint::MissingColumn,
                                    spec.name, false, std::move(message)));
    }

    if (config.strict && !config.filter) {
        for (std::size_t pos = 0; pos < working.columns.size(); ++pos) {
            if (!resolution.claimed[pos]) {
                issues.push_back(make_issue(
                    context, IssueKind::Structural, Constraint::UnexpectedColumn,
                    working.columns[pos].name, false,
                    fmt::format("column is not declared in schema {}", model.name())));
            }
        }
    }

    if (config.ordered) {
        // Owning field of each claimed column, visited in table order.
        std::vector<std::size_t> owner(working.columns.size(), fields.size());
        for (std::size_t i = fields.size(); i-- > 0;) {
            for (auto pos : resolution.positions[i]) {
                owner[pos] = i;
            }
        }
        std::vector<std::string> seen;
        std::vector<std::size_t> seen_owner;
        for (std::size_t pos = 0; pos < working.columns.size(); ++pos) {
            if (owner[pos] < fields.size()) {
                seen.push_back(working.columns[pos].name);
                seen_owner.push_back(owner[pos]);
            }
        }
        if (!std::ranges::is_sorted(seen_owner)) {
            std::vector<std::string> expected;
            for (std::size_t i = 0; i < fields.size(); ++i) {
                for (auto pos : resolution.positions[i]) {
                    expected.push_back(working.columns[pos].name);
                }
            }
            issues.push_back(make_issue(
                context, IssueKind::Structural, Constraint::ColumnOrder, "", false,
                fmt::format("columns appear as [{}], expected [{}]", fmt::join(seen, ", "),
                            fmt::join(expected, ", "))));
        }
    }

    if (config.filter) {
        std::vector<std::size_t> keep;
        std::vector<std::size_t> new_position(working.columns.size(), 0);
        std::vector<bool> kept(working.columns.size(), false);
        for (auto& positions : resolution.positions) {
            for (auto pos : positions) {
                if (!kept[pos]) {
                    kept[pos] = true;
                    new_position[pos] = keep.size();
                    keep.push_back(pos);
                }
            }
        }
        for (std::size_t pos = 0; pos < working.columns.size(); ++pos) {
            if (!kept[pos]) {
                spdlog::debug("filter dropped column `{}`", working.columns[pos].name);
            }
        }
        working.select_columns(keep);
        for (auto& positions : resolution.positions) {
            for (auto& pos : positions) {
                pos = new_position[pos];
            }
        }
        resolution.claimed.assign(working.columns.size(), true);
    }
}

auto index_key(const std::vector<IndexLevel>& levels, std::size_t row) -> Key {
    Key key;
    key.values.reserve(levels.size());
    for (const auto& level : levels) {
        key.values.push_back(cell_at(*level.values, level.validity, row));
    }
    return key;
}

auto format_key(const std::vector<IndexLevel>& levels, std::size_t row) -> std::string {
    if (levels.size() == 1) {
        return format_cell(*levels.front().values, levels.front().validity, row);
    }
    std::vector<std::string> parts;
    parts.reserve(levels.size());
    for (const auto& level : levels) {
        parts.push_back(format_cell(*level.values, level.validity, row));
    }
    return fmt::format("({})", fmt::join(parts, ", "));
}

auto index_issue(const ValidationContext& context, Constraint constraint,
                 const std::vector<IndexLevel>& levels, const std::vector<std::size_t>& rows,
                 std::string message) -> Issue {
    auto issue = make_issue(context, IssueKind::Constraint, constraint, "", true,
                            std::move(message));
    issue.count = rows.size();
    const auto limit = context.options().sample_limit;
    for (std::size_t i = 0; i < rows.size() && i < limit; ++i) {
        issue.rows.push_back(rows[i]);
        issue.values.push_back(format_key(levels, rows[i]));
    }
    return issue;
}

void check_index(const SchemaModel& model, Table& working, ValidationContext& context,
                 Issues& issues) {
    const auto& declared = model.index();
    if (declared.empty()) {
        return;
    }
    auto levels = working.index_levels();
    if (levels.size() != declared.levels.size()) {
        issues.push_back(make_issue(context, IssueKind::Structural, Constraint::IndexLevels, "",
                                    true,
                                    fmt::format("expected {} index level{}, found {}",
                                                declared.levels.size(),
                                                declared.levels.size() == 1 ? "" : "s",
                                                levels.size())));
        return;
    }

    bool changed = false;
    for (std::size_t i = 0; i < levels.size(); ++i) {
        const auto& spec = declared.levels[i];
        auto& level = levels[i];
        std::string label = spec.name.empty() ? fmt::format("level {}", i) : spec.name;

        if (declared.check_index_name && level.name.value_or("") != spec.name) {
            issues.push_back(make_issue(
                context, IssueKind::Structural, Constraint::IndexName, label, true,
                level.name.has_value()
                    ? fmt::format("expected level name `{}`, found `{}`", spec.name, *level.name)
                    : fmt::format("expected level name `{}`, found an unnamed level",
                                  spec.name)));
        }

        ColumnEntry entry{.name = label, .column = level.values, .validity = level.validity};
        FieldScope scope(context, issues, std::move(label), true);
        check_field(model, spec, entry, scope);
        if (entry.column != level.values) {
            level.values = std::move(entry.column);
            level.validity = std::move(entry.validity);
            changed = true;
        }
    }
    if (changed) {
        working.index = levels;
    }

    const std::size_t rows = levels.empty() ? 0 : column_size(*levels.front().values);
    if (declared.unique) {
        robin_hood::unordered_flat_set<Key, KeyHash, KeyEq> seen;
        seen.reserve(rows);
        std::vector<std::size_t> duplicates;
        for (std::size_t row = 0; row < rows; ++row) {
            if (!seen.insert(index_key(levels, row)).second) {
                duplicates.push_back(row);
            }
        }
        if (!duplicates.empty()) {
            issues.push_back(index_issue(context, Constraint::IndexUnique, levels, duplicates,
                                         "index values must be unique"));
        }
    }
    if (declared.sorted && rows > 1) {
        std::vector<Key> keys;
        keys.reserve(rows);
        for (std::size_t row = 0; row < rows; ++row) {
            keys.push_back(index_key(levels, row));
        }
        std::vector<std::size_t> not_increasing;
        bool decreasing = true;
        for (std::size_t row = 1; row < rows; ++row) {
            if (keys[row].values < keys[row - 1].values) {
                not_increasing.push_back(row);
            }
            if (keys[row - 1].values < keys[row].values) {
                decreasing = false;
            }
        }
        if (!not_increasing.empty() && !decreasing) {
            issues.push_back(index_issue(context, Constraint::IndexSorted, levels,
                                         not_increasing,
                                         "index must be monotonically increasing or decreasing"));
        }
    }
}

void check_patterns(const SchemaModel& model, Table& working, ValidationContext& context,
                    Issues& issues) {
    for (const auto& pattern_check : model.pattern_checks()) {
        std::vector<bool> selected(working.columns.size(), false);
        for (std::size_t p = 0; p < pattern_check.compiled.size(); ++p) {
            bool any = false;
            for (std::size_t pos = 0; pos < working.columns.size(); ++pos) {
                if (std::regex_match(working.columns[pos].name, pattern_check.compiled[p])) {
                    selected[pos] = true;
                    any = true;
                }
            }
            if (!any) {
                issues.push_back(make_issue(
                    context, IssueKind::Structural, Constraint::PatternUnmatched, "", false,
                    fmt::format("no column matches pattern `{}` of check `{}`",
                                pattern_check.patterns[p], pattern_check.check.name)));
            }
        }
        for (std::size_t pos = 0; pos < working.columns.size(); ++pos) {
            if (selected[pos]) {
                FieldScope scope(context, issues, working.columns[pos].name, false);
                run_check(pattern_check.check, working.columns[pos], scope);
            }
        }
    }
}

void check_table(const SchemaModel& model, const Table& working, ValidationContext& context,
                 Issues& issues) {
    for (const auto& check : model.table_checks()) {
        std::string message;
        try {
            if (check.fn(working)) {
                continue;
            }
            message = fmt::format("failed table check `{}`", check.name);
        } catch (const std::exception& e) {
            message = fmt::format("table check `{}` raised: {}", check.name, e.what());
        }
        issues.push_back(make_issue(context, IssueKind::Constraint, Constraint::TableCheck, "",
                                    false, std::move(message)));
    }
}

}  // namespace

auto validate(const schema::SchemaModel& schema, Table& working, ValidationContext& context)
    -> Issues {
    Issues issues;

    auto resolution = resolve(schema, working);
    check_structure(schema, working, resolution, context, issues);
    check_index(schema, working, context, issues);

    const auto& fields = schema.columns();
    for (std::size_t i = 0; i < fields.size(); ++i) {
        for (auto pos : resolution.positions[i]) {
            ColumnEntry entry = working.columns[pos];
            FieldScope scope(context, issues, entry.name, false);
            check_field(schema, fields[i], entry, scope);
            working.columns[pos].column = std::move(entry.column);
            working.columns[pos].validity = std::move(entry.validity);
        }
    }

    check_patterns(schema, working, context, issues);
    check_table(schema, working, context, issues);

    spdlog::debug("validated {} at '{}': {} rows, {} columns, {} issues", schema.name(),
                  context.path(), working.rows(), working.columns.size(), issues.size());
    return issues;
}

auto validate(const schema::SchemaModel& schema, const Table& table, ValidationOptions options)
    -> ValidationResult {
    ValidationResult result{.table = table, .issues = {}};
    ValidationContext context(options);
    result.issues = validate(schema, result.table, context);
    return result;
}

auto validate(const schema::SchemaModel& schema, Series& working, ValidationContext& context)
    -> Issues {
    if (schema.columns().size() != 1) {
        return {make_issue(context, IssueKind::Structural, Constraint::ValueShape, "", false,
                           fmt::format("series schema {} must declare exactly one column, "
                                       "found {}",
                                       schema.name(), schema.columns().size()))};
    }
    if (working.values == nullptr) {
        return {make_issue(context, IssueKind::Structural, Constraint::ValueShape, "", false,
                           "series holds no values")};
    }

    const auto& spec = schema.columns().front();
    std::string column_name = spec.regex ? working.name : spec.alias.value_or(spec.name);
    Table table;
    table.columns.push_back(ColumnEntry{
        .name = column_name, .column = working.values, .validity = working.validity});
    table.lookup.emplace(std::move(column_name), 0);
    table.index = working.index;

    auto issues = validate(schema, table, context);
    if (!table.columns.empty()) {
        working.values = table.columns.front().column;
        working.validity = table.columns.front().validity;
    }
    working.index = std::move(table.index);
    return issues;
}

}  // namespace framecheck::validate
