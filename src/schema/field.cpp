#include <framecheck/schema/field.hpp>

#include <fmt/format.h>

#include <type_traits>

namespace framecheck::schema {

auto is_numeric(DType dtype) noexcept -> bool {
    return dtype == DType::Int64 || dtype == DType::Float64;
}

auto is_textual(DType dtype) noexcept -> bool {
    return dtype == DType::String || dtype == DType::Categorical;
}

auto scalar_fits(const Scalar& value, DType dtype) noexcept -> bool {
    return std::visit(
        [dtype](const auto& v) -> bool {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return dtype == DType::Int64 || dtype == DType::Float64;
            } else if constexpr (std::is_same_v<T, double>) {
                return dtype == DType::Float64;
            } else if constexpr (std::is_same_v<T, std::string>) {
                return is_textual(dtype);
            } else if constexpr (std::is_same_v<T, bool>) {
                return dtype == DType::Bool;
            } else if constexpr (std::is_same_v<T, Date>) {
                return dtype == DType::Date;
            } else {
                return dtype == DType::Datetime;
            }
        },
        value);
}

auto bound_as_double(const Bound& bound) noexcept -> double {
    return std::visit([](auto v) { return static_cast<double>(v); }, bound);
}

auto format_bound(const Bound& bound) -> std::string {
    return std::visit([](auto v) { return fmt::format("{}", v); }, bound);
}

auto format_scalar(const Scalar& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return fmt::format("\"{}\"", v);
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

}  // namespace framecheck::schema
