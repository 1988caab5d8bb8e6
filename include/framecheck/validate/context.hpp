#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace framecheck::validate {

/// Tunables for one validation call.
struct ValidationOptions {
    /// Maximum offending rows and values kept per issue.
    std::size_t sample_limit = 5;
};

/// Named argument of a call.
struct ArgSegment {
    std::string name;
};

/// Position within a sequence.
struct PositionSegment {
    std::size_t position = 0;
};

/// Key within a mapping.
struct KeySegment {
    std::string key;
};

/// The return value of a call.
struct ReturnSegment {};

using PathSegment = std::variant<ArgSegment, PositionSegment, KeySegment, ReturnSegment>;

/// Per-call state: where in the call's arguments the current value sits.
///
/// Created fresh for every checked call and never shared between calls.
class ValidationContext {
   public:
    ValidationContext() = default;
    explicit ValidationContext(ValidationOptions options) : options_(options) {}

    [[nodiscard]] auto options() const noexcept -> const ValidationOptions& { return options_; }

    void push(PathSegment segment) { path_.push_back(std::move(segment)); }
    void pop() { path_.pop_back(); }
    [[nodiscard]] auto depth() const noexcept -> std::size_t { return path_.size(); }

    /// Current location, e.g. `frames[1]`, `by_region["eu"]` or `return[0]`.
    [[nodiscard]] auto path() const -> std::string;

   private:
    ValidationOptions options_;
    std::vector<PathSegment> path_;
};

/// Pushes a segment for the lifetime of the guard.
class PathGuard {
   public:
    PathGuard(ValidationContext& context, PathSegment segment) : context_(context) {
        context_.push(std::move(segment));
    }
    ~PathGuard() { context_.pop(); }

    PathGuard(const PathGuard&) = delete;
    auto operator=(const PathGuard&) -> PathGuard& = delete;

   private:
    ValidationContext& context_;
};

}  // namespace framecheck::validate
