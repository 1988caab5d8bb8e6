#include <framecheck/core/time.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <chrono>
#include <limits>

namespace framecheck {

namespace {

template <typename Int>
auto parse_fixed(std::string_view text, std::size_t pos, std::size_t width) -> std::optional<Int> {
    if (pos + width > text.size()) {
        return std::nullopt;
    }
    const char* first = text.data() + pos;
    const char* last = first + width;
    // Digits only, no sign.
    if (!std::all_of(first, last, [](char c) { return c >= '0' && c <= '9'; })) {
        return std::nullopt;
    }
    Int value{};
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last) {
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto date_from_ymd(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    auto day_point = sys_days{std::chrono::year{year} / std::chrono::month{month} /
                              std::chrono::day{day}};
    return Date{static_cast<std::int32_t>(day_point.time_since_epoch().count())};
}

auto timestamp_from_date(Date date) noexcept -> std::optional<Timestamp> {
    constexpr auto kMaxDays = std::numeric_limits<std::int64_t>::max() / kNanosPerDay;
    constexpr auto kMinDays = std::numeric_limits<std::int64_t>::min() / kNanosPerDay;
    if (date.days > kMaxDays || date.days < kMinDays) {
        return std::nullopt;
    }
    return Timestamp{static_cast<std::int64_t>(date.days) * kNanosPerDay};
}

auto date_if_midnight(Timestamp ts) noexcept -> std::optional<Date> {
    if (ts.nanos % kNanosPerDay != 0) {
        return std::nullopt;
    }
    return Date{static_cast<std::int32_t>(ts.nanos / kNanosPerDay)};
}

auto format_date(Date date) -> std::string {
    using namespace std::chrono;
    sys_days day = sys_days{days{date.days}};
    year_month_day ymd{day};
    return fmt::format("{:04}-{:02}-{:02}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()));
}

auto format_timestamp(Timestamp ts) -> std::string {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    auto day = floor<days>(tp);
    year_month_day ymd{day};
    auto tod = tp - day;
    hh_mm_ss<nanoseconds> hms{tod};
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:09}", static_cast<int>(ymd.year()),
                       static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                       hms.hours().count(), hms.minutes().count(), hms.seconds().count(),
                       hms.subseconds().count());
}

auto parse_date(std::string_view text) -> std::optional<Date> {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }
    auto y = parse_fixed<int>(text, 0, 4);
    auto m = parse_fixed<unsigned>(text, 5, 2);
    auto d = parse_fixed<unsigned>(text, 8, 2);
    if (!y || !m || !d) {
        return std::nullopt;
    }
    std::chrono::year_month_day ymd{std::chrono::year{*y}, std::chrono::month{*m},
                                    std::chrono::day{*d}};
    if (!ymd.ok()) {
        return std::nullopt;
    }
    return date_from_ymd(*y, *m, *d);
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    if (text.size() < 10) {
        return std::nullopt;
    }
    auto date = parse_date(text.substr(0, 10));
    if (!date) {
        return std::nullopt;
    }
    auto ts = timestamp_from_date(*date);
    if (!ts || text.size() == 10) {
        return ts;
    }
    if ((text[10] != ' ' && text[10] != 'T') || text.size() < 19 || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }
    auto hh = parse_fixed<std::int64_t>(text, 11, 2);
    auto mm = parse_fixed<std::int64_t>(text, 14, 2);
    auto ss = parse_fixed<std::int64_t>(text, 17, 2);
    if (!hh || !mm || !ss || *hh > 23 || *mm > 59 || *ss > 59) {
        return std::nullopt;
    }
    std::int64_t fraction = 0;
    if (text.size() > 19) {
        std::size_t digits = text.size() - 20;
        if (text[19] != '.' || digits == 0 || digits > 9) {
            return std::nullopt;
        }
        auto parsed = parse_fixed<std::int64_t>(text, 20, digits);
        if (!parsed) {
            return std::nullopt;
        }
        fraction = *parsed;
        for (std::size_t i = digits; i < 9; ++i) {
            fraction *= 10;
        }
    }
    constexpr std::int64_t kNanosPerSecond = 1'000'000'000;
    const std::int64_t offset = ((*hh * 60 + *mm) * 60 + *ss) * kNanosPerSecond + fraction;
    if (ts->nanos > std::numeric_limits<std::int64_t>::max() - offset) {
        return std::nullopt;
    }
    ts->nanos += offset;
    return ts;
}

}  // namespace framecheck
