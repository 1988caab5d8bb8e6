#pragma once

#include <framecheck/schema/model.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace framecheck::inspect {

enum class AnnotationKind : std::uint8_t {
    Unchecked,
    TableOf,
    SeriesOf,
    ListOf,
    TupleOf,
    MapOf,
};

/// Declared shape of a parameter or return value.
///
/// Built with the factory functions below, e.g.
///
///   list_of(table_of(trades))          // every element is a Trades table
///   map_of(tuple_of({table_of(a), unchecked()}))
class Annotation {
   public:
    /// Unchecked.
    Annotation() = default;

    [[nodiscard]] auto kind() const noexcept -> AnnotationKind { return kind_; }
    /// Schema of a TableOf or SeriesOf annotation, null otherwise.
    [[nodiscard]] auto schema() const noexcept -> const schema::SchemaRef& { return schema_; }
    /// Element annotations: one for ListOf and MapOf, one per position for TupleOf.
    [[nodiscard]] auto elements() const noexcept -> const std::vector<Annotation>& {
        return elements_;
    }

    /// Whether a schema is reachable from this annotation. Values under an
    /// annotation that reaches none are passed through unexamined.
    [[nodiscard]] auto checks_anything() const noexcept -> bool { return checks_anything_; }

    /// Readable rendering such as `list[table[Trades]]`.
    [[nodiscard]] auto describe() const -> std::string;

    friend auto unchecked() -> Annotation;
    friend auto table_of(schema::SchemaRef schema) -> Annotation;
    friend auto series_of(schema::SchemaRef schema) -> Annotation;
    friend auto list_of(Annotation element) -> Annotation;
    friend auto tuple_of(std::vector<Annotation> elements) -> Annotation;
    friend auto map_of(Annotation value) -> Annotation;

   private:
    Annotation(AnnotationKind kind, schema::SchemaRef schema, std::vector<Annotation> elements);

    AnnotationKind kind_ = AnnotationKind::Unchecked;
    schema::SchemaRef schema_;
    std::vector<Annotation> elements_;
    bool checks_anything_ = false;
};

[[nodiscard]] auto unchecked() -> Annotation;
/// Throws std::invalid_argument if `schema` is null.
[[nodiscard]] auto table_of(schema::SchemaRef schema) -> Annotation;
/// Throws std::invalid_argument if `schema` is null.
[[nodiscard]] auto series_of(schema::SchemaRef schema) -> Annotation;
[[nodiscard]] auto list_of(Annotation element) -> Annotation;
[[nodiscard]] auto tuple_of(std::vector<Annotation> elements) -> Annotation;
[[nodiscard]] auto map_of(Annotation value) -> Annotation;

}  // namespace framecheck::inspect
