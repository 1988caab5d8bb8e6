#include <framecheck/inspect/checked.hpp>

#include <framecheck/validate/issue.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>

namespace framecheck::inspect {

CheckedFunction::CheckedFunction(Callable fn, Signature signature, CheckOptions options)
    : fn_(std::move(fn)),
      signature_(std::move(signature)),
      options_(options),
      inspector_(options.inspector) {
    if (!fn_) {
        throw std::invalid_argument("checked: empty callable");
    }
}

auto CheckedFunction::operator()(Arguments args) const -> Value {
    validate::Issues issues;
    validate::ValidationContext input(options_.validation);
    for (const auto& param : signature_.params) {
        if (!param.annotation.checks_anything()) {
            continue;
        }
        validate::PathGuard guard(input, validate::ArgSegment{.name = param.name});
        auto arg = std::ranges::find(args, param.name, &Argument::name);
        if (arg == args.end()) {
            issues.push_back(validate::Issue{.kind = validate::IssueKind::Structural,
                                             .constraint = validate::Constraint::MissingArgument,
                                             .path = input.path(),
                                             .field = {},
                                             .on_index = false,
                                             .count = 0,
                                             .rows = {},
                                             .values = {},
                                             .message = "argument is not bound"});
            continue;
        }
        auto found = inspector_.inspect(arg->value, param.annotation, input);
        issues.insert(issues.end(), std::make_move_iterator(found.begin()),
                      std::make_move_iterator(found.end()));
    }
    if (!issues.empty()) {
        spdlog::debug("rejected call with {} input issue{}", issues.size(),
                      issues.size() == 1 ? "" : "s");
        throw validate::AggregateValidationError(std::move(issues));
    }

    Value result = fn_(args);

    validate::ValidationContext output(options_.validation);
    validate::PathGuard guard(output, validate::ReturnSegment{});
    issues = inspector_.inspect(result, signature_.returns, output);
    if (!issues.empty()) {
        spdlog::debug("rejected result with {} issue{}", issues.size(),
                      issues.size() == 1 ? "" : "s");
        throw validate::AggregateValidationError(std::move(issues));
    }
    return result;
}

auto checked(Callable fn, Signature signature, CheckOptions options) -> CheckedFunction {
    return CheckedFunction(std::move(fn), std::move(signature), options);
}

}  // namespace framecheck::inspect
