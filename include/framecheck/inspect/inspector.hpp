#pragma once

#include <framecheck/inspect/annotation.hpp>
#include <framecheck/inspect/value.hpp>
#include <framecheck/validate/context.hpp>
#include <framecheck/validate/issue.hpp>

#include <cstddef>
#include <vector>

namespace framecheck::inspect {

struct InspectorConfig {
    /// Deepest container nesting examined below the inspected value.
    std::size_t max_depth = 64;
};

/// Finds every schema-annotated table or series inside a value and validates it.
///
/// The walk is depth-first: sequences element by element, mappings value by
/// value in key order. Each validated table or series is replaced in `value` by
/// its validated working copy. Containers on the way are copied before being
/// modified, so containers shared with the caller are never changed.
class Inspector {
   public:
    Inspector() = default;
    explicit Inspector(InspectorConfig config) : config_(config) {}

    [[nodiscard]] auto config() const noexcept -> const InspectorConfig& { return config_; }

    [[nodiscard]] auto inspect(Value& value, const Annotation& annotation,
                               validate::ValidationContext& context) const -> validate::Issues;

   private:
    struct Walk {
        validate::ValidationContext& context;
        validate::Issues& issues;
        /// Containers on the current path.
        std::vector<const void*> active;
    };

    void visit(Value& value, const Annotation& annotation, std::size_t depth, Walk& walk) const;
    void visit_sequence(Value& value, const Annotation& annotation, std::size_t depth,
                        Walk& walk) const;
    void visit_mapping(Value& value, const Annotation& annotation, std::size_t depth,
                       Walk& walk) const;

    InspectorConfig config_;
};

}  // namespace framecheck::inspect
