#include <framecheck/inspect/inspector.hpp>

#include <framecheck/validate/engine.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <memory>

namespace framecheck::inspect {

namespace {

using validate::Constraint;
using validate::Issue;
using validate::IssueKind;

auto structural(const validate::ValidationContext& context, Constraint constraint,
                std::string message) -> Issue {
    return Issue{.kind = IssueKind::Structural,
                 .constraint = constraint,
                 .path = context.path(),
                 .field = {},
                 .on_index = false,
                 .count = 0,
                 .rows = {},
                 .values = {},
                 .message = std::move(message)};
}

auto shape_mismatch(const validate::ValidationContext& context, const Annotation& annotation,
                    const Value& value) -> Issue {
    return structural(context, Constraint::ValueShape,
                      fmt::format("expected {}, found a {}", annotation.describe(),
                                  value_kind_name(value.kind())));
}

void append(validate::Issues& into, validate::Issues&& from) {
    into.insert(into.end(), std::make_move_iterator(from.begin()),
                std::make_move_iterator(from.end()));
}

}  // namespace

auto Inspector::inspect(Value& value, const Annotation& annotation,
                        validate::ValidationContext& context) const -> validate::Issues {
    validate::Issues issues;
    Walk walk{.context = context, .issues = issues, .active = {}};
    visit(value, annotation, 0, walk);
    return issues;
}

void Inspector::visit(Value& value, const Annotation& annotation, std::size_t depth,
                      Walk& walk) const {
    if (!annotation.checks_anything()) {
        return;
    }
    if (depth > config_.max_depth) {
        walk.issues.push_back(
            structural(walk.context, Constraint::DepthLimit,
                       fmt::format("nesting exceeds the limit of {} levels", config_.max_depth)));
        return;
    }

    switch (annotation.kind()) {
        case AnnotationKind::Unchecked:
            return;
        case AnnotationKind::TableOf: {
            auto* table = value.as_table();
            if (table == nullptr) {
                walk.issues.push_back(shape_mismatch(walk.context, annotation, value));
                return;
            }
            append(walk.issues, validate::validate(*annotation.schema(), *table, walk.context));
            return;
        }
        case AnnotationKind::SeriesOf: {
            auto* series = value.as_series();
            if (series == nullptr) {
                walk.issues.push_back(shape_mismatch(walk.context, annotation, value));
                return;
            }
            append(walk.issues,
                   validate::validate(*annotation.schema(), *series, walk.context));
            return;
        }
        case AnnotationKind::ListOf:
        case AnnotationKind::TupleOf:
            visit_sequence(value, annotation, depth, walk);
            return;
        case AnnotationKind::MapOf:
            visit_mapping(value, annotation, depth, walk);
            return;
    }
}

void Inspector::visit_sequence(Value& value, const Annotation& annotation, std::size_t depth,
                               Walk& walk) const {
    const Sequence* items = value.as_sequence();
    if (items == nullptr) {
        walk.issues.push_back(shape_mismatch(walk.context, annotation, value));
        return;
    }
    const bool tuple = annotation.kind() == AnnotationKind::TupleOf;
    if (tuple && items->size() != annotation.elements().size()) {
        walk.issues.push_back(structural(walk.context, Constraint::ValueShape,
                                         fmt::format("expected {} elements, found {}",
                                                     annotation.elements().size(),
                                                     items->size())));
        return;
    }
    if (std::ranges::find(walk.active, static_cast<const void*>(items)) != walk.active.end()) {
        walk.issues.push_back(structural(walk.context, Constraint::Cycle,
                                         "sequence contains itself"));
        return;
    }

    walk.active.push_back(items);
    auto copy = std::make_shared<Sequence>(*items);
    for (std::size_t i = 0; i < copy->size(); ++i) {
        const auto& element = tuple ? annotation.elements()[i] : annotation.elements().front();
        validate::PathGuard guard(walk.context, validate::PositionSegment{.position = i});
        visit((*copy)[i], element, depth + 1, walk);
    }
    walk.active.pop_back();
    value.node = std::move(copy);
}

void Inspector::visit_mapping(Value& value, const Annotation& annotation, std::size_t depth,
                              Walk& walk) const {
    const Mapping* entries = value.as_mapping();
    if (entries == nullptr) {
        walk.issues.push_back(shape_mismatch(walk.context, annotation, value));
        return;
    }
    if (std::ranges::find(walk.active, static_cast<const void*>(entries)) != walk.active.end()) {
        walk.issues.push_back(structural(walk.context, Constraint::Cycle,
                                         "mapping contains itself"));
        return;
    }

    walk.active.push_back(entries);
    auto copy = std::make_shared<Mapping>(*entries);
    for (auto& [key, item] : *copy) {
        validate::PathGuard guard(walk.context, validate::KeySegment{.key = key});
        visit(item, annotation.elements().front(), depth + 1, walk);
    }
    walk.active.pop_back();
    value.node = std::move(copy);
}

}  // namespace framecheck::inspect
