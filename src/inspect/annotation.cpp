#include <framecheck/inspect/annotation.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <stdexcept>

namespace framecheck::inspect {

Annotation::Annotation(AnnotationKind kind, schema::SchemaRef schema,
                       std::vector<Annotation> elements)
    : kind_(kind), schema_(std::move(schema)), elements_(std::move(elements)) {
    checks_anything_ =
        schema_ != nullptr ||
        std::ranges::any_of(elements_, [](const Annotation& a) { return a.checks_anything(); });
}

auto Annotation::describe() const -> std::string {
    switch (kind_) {
        case AnnotationKind::Unchecked:
            return "any";
        case AnnotationKind::TableOf:
            return fmt::format("table[{}]", schema_->name());
        case AnnotationKind::SeriesOf:
            return fmt::format("series[{}]", schema_->name());
        case AnnotationKind::ListOf:
            return fmt::format("list[{}]", elements_.front().describe());
        case AnnotationKind::MapOf:
            return fmt::format("map[{}]", elements_.front().describe());
        case AnnotationKind::TupleOf: {
            std::vector<std::string> parts;
            parts.reserve(elements_.size());
            for (const auto& element : elements_) {
                parts.push_back(element.describe());
            }
            return fmt::format("tuple[{}]", fmt::join(parts, ", "));
        }
    }
    return "unknown";
}

auto unchecked() -> Annotation {
    return Annotation{};
}

auto table_of(schema::SchemaRef schema) -> Annotation {
    if (schema == nullptr) {
        throw std::invalid_argument("table_of: null schema");
    }
    return Annotation(AnnotationKind::TableOf, std::move(schema), {});
}

auto series_of(schema::SchemaRef schema) -> Annotation {
    if (schema == nullptr) {
        throw std::invalid_argument("series_of: null schema");
    }
    return Annotation(AnnotationKind::SeriesOf, std::move(schema), {});
}

auto list_of(Annotation element) -> Annotation {
    return Annotation(AnnotationKind::ListOf, nullptr, {std::move(element)});
}

auto tuple_of(std::vector<Annotation> elements) -> Annotation {
    return Annotation(AnnotationKind::TupleOf, nullptr, std::move(elements));
}

auto map_of(Annotation value) -> Annotation {
    return Annotation(AnnotationKind::MapOf, nullptr, {std::move(value)});
}

}  // namespace framecheck::inspect
