#pragma once

#include <framecheck/inspect/annotation.hpp>
#include <framecheck/inspect/inspector.hpp>
#include <framecheck/inspect/value.hpp>
#include <framecheck/validate/context.hpp>

#include <functional>
#include <string>
#include <vector>

namespace framecheck::inspect {

/// One bound argument of a call.
struct Argument {
    std::string name;
    Value value;
};

using Arguments = std::vector<Argument>;

struct Parameter {
    std::string name;
    Annotation annotation;
};

/// Annotations of a callable's parameters and of its return value.
struct Signature {
    std::vector<Parameter> params;
    Annotation returns;
};

struct CheckOptions {
    validate::ValidationOptions validation;
    InspectorConfig inspector;
};

using Callable = std::function<Value(const Arguments&)>;

/// A callable whose annotated inputs and output are validated on every call.
class CheckedFunction {
   public:
    CheckedFunction(Callable fn, Signature signature, CheckOptions options = {});

    /// Validate `args`, run the wrapped callable on the validated working copies,
    /// then validate its result.
    ///
    /// Throws validate::AggregateValidationError listing every input issue, in
    /// which case the callable is not run, or every output issue. Side effects
    /// of the callable are not undone when its output is rejected.
    auto operator()(Arguments args) const -> Value;

    [[nodiscard]] auto signature() const noexcept -> const Signature& { return signature_; }

   private:
    Callable fn_;
    Signature signature_;
    CheckOptions options_;
    Inspector inspector_;
};

[[nodiscard]] auto checked(Callable fn, Signature signature, CheckOptions options = {})
    -> CheckedFunction;

}  // namespace framecheck::inspect
