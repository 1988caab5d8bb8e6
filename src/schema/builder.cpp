#include <framecheck/schema/builder.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <optional>
#include <unordered_set>

namespace framecheck::schema {

namespace {

using Failure = std::optional<DefinitionError>;

auto fail(std::string field, std::string message) -> Failure {
    return DefinitionError{.message = std::move(message), .field = std::move(field)};
}

auto compile_regex(const std::string& pattern) -> std::optional<std::regex> {
    try {
        return std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error&) {
        return std::nullopt;
    }
}

auto validate_check(const std::string& field, const ColumnCheck& check) -> Failure {
    if (check.name.empty()) {
        return fail(field, "custom check has no name");
    }
    if (!check.fn) {
        return fail(field, fmt::format("custom check '{}' has no function", check.name));
    }
    return std::nullopt;
}

// A pair of lower and upper bounds that leaves no admissible value.
auto empty_range(const FieldSpec& spec) -> bool {
    struct Side {
        const std::optional<Bound>* bound;
        bool exclusive;
    };
    const Side lows[] = {{&spec.gt, true}, {&spec.ge, false}};
    const Side highs[] = {{&spec.lt, true}, {&spec.le, false}};
    for (const auto& lo : lows) {
        if (!lo.bound->has_value()) {
            continue;
        }
        for (const auto& hi : highs) {
            if (!hi.bound->has_value()) {
                continue;
            }
            double low = bound_as_double(**lo.bound);
            double high = bound_as_double(**hi.bound);
            if (low > high || (low == high && (lo.exclusive || hi.exclusive))) {
                return true;
            }
        }
    }
    return false;
}

auto validate_field(const FieldSpec& spec, bool is_level) -> Failure {
    const auto& name = spec.name;
    const auto type = dtype_name(spec.dtype);

    const std::pair<const char*, const std::optional<Bound>*> bounds[] = {
        {"gt", &spec.gt}, {"ge", &spec.ge}, {"lt", &spec.lt}, {"le", &spec.le}};
    for (const auto& [label, bound] : bounds) {
        if (!bound->has_value()) {
            continue;
        }
        if (!is_numeric(spec.dtype)) {
            return fail(name, fmt::format("bound '{}' requires a numeric field, found {}", label,
                                          type));
        }
        if (std::isnan(bound_as_double(**bound))) {
            return fail(name, fmt::format("bound '{}' is NaN", label));
        }
    }
    if (empty_range(spec)) {
        return fail(name, "lower bound exceeds upper bound");
    }

    const std::pair<const char*, const std::optional<std::vector<Scalar>>*> sets[] = {
        {"isin", &spec.isin}, {"notin", &spec.notin}};
    for (const auto& [label, set] : sets) {
        if (!set->has_value()) {
            continue;
        }
        for (const auto& value : **set) {
            if (!scalar_fits(value, spec.dtype)) {
                return fail(name, fmt::format("'{}' value {} does not fit a {} field", label,
                                              format_scalar(value), type));
            }
        }
    }

    const std::pair<const char*, const std::optional<std::string>*> patterns[] = {
        {"str_contains", &spec.str_contains},
        {"str_startswith", &spec.str_startswith},
        {"str_endswith", &spec.str_endswith}};
    for (const auto& [label, text] : patterns) {
        if (text->has_value() && !is_textual(spec.dtype)) {
            return fail(name, fmt::format("'{}' requires a String or Categorical field, found {}",
                                          label, type));
        }
    }

    if (is_level) {
        if (spec.alias.has_value() || spec.regex) {
            return fail(name, "index levels are matched by position and take no alias");
        }
        if (spec.optional) {
            return fail(name, "index levels cannot be optional");
        }
    } else if (spec.regex) {
        if (!spec.alias.has_value()) {
            return fail(name, "regex field needs an alias pattern");
        }
        if (!compile_regex(*spec.alias)) {
            return fail(name, fmt::format("invalid alias pattern '{}'", *spec.alias));
        }
    }

    for (const auto& check : spec.checks) {
        if (auto failure = validate_check(name, check)) {
            return failure;
        }
    }
    return std::nullopt;
}

}  // namespace

auto DefinitionError::format() const -> std::string {
    if (field.empty()) {
        return fmt::format("schema definition error: {}", message);
    }
    return fmt::format("schema definition error in `{}`: {}", field, message);
}

auto SchemaBuilder::column(std::string name, DType dtype, FieldSpec spec) -> SchemaBuilder& {
    spec.name = std::move(name);
    spec.dtype = dtype;
    columns_.push_back(std::move(spec));
    return *this;
}

auto SchemaBuilder::index(std::string name, DType dtype, FieldSpec spec) -> SchemaBuilder& {
    spec.name = std::move(name);
    spec.dtype = dtype;
    index_.levels.push_back(std::move(spec));
    return *this;
}

auto SchemaBuilder::check_index_name(bool enabled) -> SchemaBuilder& {
    index_.check_index_name = enabled;
    return *this;
}

auto SchemaBuilder::index_unique(bool enabled) -> SchemaBuilder& {
    index_.unique = enabled;
    return *this;
}

auto SchemaBuilder::index_sorted(bool enabled) -> SchemaBuilder& {
    index_.sorted = enabled;
    return *this;
}

auto SchemaBuilder::strict(bool enabled) -> SchemaBuilder& {
    config_.strict = enabled;
    return *this;
}

auto SchemaBuilder::filter(bool enabled) -> SchemaBuilder& {
    config_.filter = enabled;
    return *this;
}

auto SchemaBuilder::coerce(bool enabled) -> SchemaBuilder& {
    config_.coerce = enabled;
    return *this;
}

auto SchemaBuilder::ordered(bool enabled) -> SchemaBuilder& {
    config_.ordered = enabled;
    return *this;
}

auto SchemaBuilder::config(SchemaConfig config) -> SchemaBuilder& {
    config_ = config;
    return *this;
}

auto SchemaBuilder::check(std::vector<std::string> columns, ColumnCheck check)
    -> SchemaBuilder& {
    column_checks_.emplace_back(std::move(columns), std::move(check));
    return *this;
}

auto SchemaBuilder::check_regex(std::vector<std::string> patterns, ColumnCheck check)
    -> SchemaBuilder& {
    pattern_checks_.emplace_back(std::move(patterns), std::move(check));
    return *this;
}

auto SchemaBuilder::table_check(TableCheck check) -> SchemaBuilder& {
    table_checks_.push_back(std::move(check));
    return *this;
}

auto SchemaBuilder::build() const -> BuildResult {
    SchemaModel model;
    model.name_ = name_;
    model.columns_ = columns_;
    model.index_ = index_;
    model.config_ = config_;

    if (config_.ordered && !config_.strict && !config_.filter) {
        return std::unexpected(DefinitionError{
            .message = "'ordered' needs 'strict' or 'filter' to fix the column set", .field = {}});
    }

    std::unordered_set<std::string> names;
    std::unordered_set<std::string> targets;
    for (const auto& spec : columns_) {
        if (spec.name.empty()) {
            return std::unexpected(
                DefinitionError{.message = "column with an empty name", .field = {}});
        }
        if (!names.insert(spec.name).second) {
            return std::unexpected(
                DefinitionError{.message = "duplicate column name", .field = spec.name});
        }
        if (auto failure = validate_field(spec, false)) {
            return std::unexpected(std::move(*failure));
        }
        if (!spec.regex && !targets.insert(spec.alias.value_or(spec.name)).second) {
            return std::unexpected(DefinitionError{
                .message = fmt::format("column `{}` is already claimed by another field",
                                       spec.alias.value_or(spec.name)),
                .field = spec.name});
        }
    }

    const auto& levels = index_.levels;
    if (levels.empty() && (index_.check_index_name || index_.unique || index_.sorted)) {
        return std::unexpected(DefinitionError{
            .message = "index options given but no index levels declared", .field = {}});
    }
    std::unordered_set<std::string> level_names;
    for (std::size_t i = 0; i < levels.size(); ++i) {
        const auto& level = levels[i];
        auto label = level.name.empty() ? fmt::format("level {}", i) : level.name;
        if (level.name.empty() && index_.check_index_name) {
            return std::unexpected(DefinitionError{
                .message = "'check_index_name' needs every index level to be named",
                .field = label});
        }
        if (!level.name.empty()) {
            if (!level_names.insert(level.name).second) {
                return std::unexpected(
                    DefinitionError{.message = "duplicate index level name", .field = label});
            }
            if (names.contains(level.name)) {
                return std::unexpected(DefinitionError{
                    .message = "index level name is also a column name", .field = label});
            }
        }
        if (auto failure = validate_field(level, true)) {
            failure->field = label;
            return std::unexpected(std::move(*failure));
        }
    }

    model.alias_patterns_.reserve(columns_.size());
    for (const auto& spec : columns_) {
        if (spec.regex) {
            model.alias_patterns_.push_back(compile_regex(*spec.alias));
        } else {
            model.alias_patterns_.emplace_back(std::nullopt);
        }
    }

    for (const auto& [targets, check] : column_checks_) {
        if (targets.empty()) {
            return std::unexpected(DefinitionError{
                .message = fmt::format("custom check '{}' names no columns", check.name),
                .field = {}});
        }
        for (const auto& target : targets) {
            if (auto failure = validate_check(target, check)) {
                return std::unexpected(std::move(*failure));
            }
            auto it = std::find_if(model.columns_.begin(), model.columns_.end(),
                                   [&](const FieldSpec& spec) { return spec.name == target; });
            if (it == model.columns_.end()) {
                return std::unexpected(DefinitionError{
                    .message = fmt::format("custom check '{}' targets an undeclared column",
                                           check.name),
                    .field = target});
            }
            it->checks.push_back(check);
        }
    }

    for (const auto& [patterns, check] : pattern_checks_) {
        if (patterns.empty()) {
            return std::unexpected(DefinitionError{
                .message = fmt::format("custom check '{}' names no patterns", check.name),
                .field = {}});
        }
        if (auto failure = validate_check({}, check)) {
            return std::unexpected(std::move(*failure));
        }
        PatternCheck compiled{.patterns = patterns, .compiled = {}, .check = check};
        for (const auto& pattern : patterns) {
            auto re = compile_regex(pattern);
            if (!re) {
                return std::unexpected(DefinitionError{
                    .message = fmt::format("invalid check pattern '{}'", pattern), .field = {}});
            }
            compiled.compiled.push_back(std::move(*re));
        }
        model.pattern_checks_.push_back(std::move(compiled));
    }

    for (const auto& check : table_checks_) {
        if (check.name.empty() || !check.fn) {
            return std::unexpected(DefinitionError{
                .message = "table check needs a name and a function", .field = {}});
        }
    }
    model.table_checks_ = table_checks_;

    spdlog::debug("compiled schema {}: {} columns, {} index levels", name_, columns_.size(),
                  levels.size());
    return model;
}

auto SchemaBuilder::build_shared() const -> std::expected<SchemaRef, DefinitionError> {
    auto model = build();
    if (!model) {
        return std::unexpected(std::move(model.error()));
    }
    return std::make_shared<const SchemaModel>(std::move(*model));
}

auto SchemaBuilder::build_or_throw() const -> SchemaRef {
    auto model = build_shared();
    if (!model) {
        throw SchemaDefinitionError(std::move(model.error()));
    }
    return std::move(*model);
}

}  // namespace framecheck::schema
