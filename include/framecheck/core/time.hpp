#pragma once

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace framecheck {

/// Calendar date in days since 1970-01-01 (Unix epoch).
struct Date {
    std::int32_t days = 0;
    auto operator<=>(const Date&) const = default;
};

/// Instant in nanoseconds since 1970-01-01T00:00:00Z (Unix epoch).
struct Timestamp {
    std::int64_t nanos = 0;
    auto operator<=>(const Timestamp&) const = default;
};

inline constexpr std::int64_t kNanosPerDay = 86'400'000'000'000;

[[nodiscard]] auto date_from_ymd(int year, unsigned month, unsigned day) -> Date;

/// Midnight of `date`, or nullopt when it lies outside the range of Timestamp
/// (1677-09-21 to 2262-04-11).
[[nodiscard]] auto timestamp_from_date(Date date) noexcept -> std::optional<Timestamp>;

/// Calendar date of `ts`, or nullopt when `ts` is not exactly midnight.
[[nodiscard]] auto date_if_midnight(Timestamp ts) noexcept -> std::optional<Date>;

[[nodiscard]] auto format_date(Date date) -> std::string;
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

/// Parse `YYYY-MM-DD`.
[[nodiscard]] auto parse_date(std::string_view text) -> std::optional<Date>;

/// Parse `YYYY-MM-DD`, `YYYY-MM-DD HH:MM:SS` or `YYYY-MM-DDTHH:MM:SS`, with an
/// optional fractional second of up to nine digits. Every field is digits only.
/// Instants outside the range of Timestamp are rejected.
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

}  // namespace framecheck

namespace std {

template <>
struct hash<framecheck::Date> {
    auto operator()(const framecheck::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<framecheck::Timestamp> {
    auto operator()(const framecheck::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
