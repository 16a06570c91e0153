#pragma once

#include <compare>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tabula {

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

/// Broken-down calendar fields of a timestamp.
///
/// `day_of_week` counts from Monday = 0 to Sunday = 6.
struct CalendarFields {
    Date date;
    std::int64_t year = 0;
    std::int64_t month = 0;
    std::int64_t day = 0;
    std::int64_t day_of_week = 0;
};

[[nodiscard]] auto make_date(int year, unsigned month, unsigned day) -> Date;

/// Whole-second timestamp from civil fields (UTC).
[[nodiscard]] auto make_timestamp(int year, unsigned month, unsigned day, unsigned hour = 0,
                                  unsigned minute = 0, unsigned second = 0) -> Timestamp;

/// Parse `YYYY-MM-DD`, `YYYY-MM-DD HH:MM:SS[.fraction]` or the same with a `T`
/// separator and an optional trailing `Z`. Returns nullopt on malformed input
/// or an impossible calendar date.
[[nodiscard]] auto parse_timestamp(std::string_view text) -> std::optional<Timestamp>;

[[nodiscard]] auto calendar_fields(Timestamp ts) -> CalendarFields;

/// `YYYY-MM-DD`.
[[nodiscard]] auto format_date(Date date) -> std::string;

/// `YYYY-MM-DD HH:MM:SS`, with a fractional part only when non-zero.
[[nodiscard]] auto format_timestamp(Timestamp ts) -> std::string;

}  // namespace tabula

namespace std {

template <>
struct hash<tabula::Date> {
    auto operator()(const tabula::Date& d) const noexcept -> std::size_t {
        return std::hash<std::int32_t>{}(d.days);
    }
};

template <>
struct hash<tabula::Timestamp> {
    auto operator()(const tabula::Timestamp& ts) const noexcept -> std::size_t {
        return std::hash<std::int64_t>{}(ts.nanos);
    }
};

}  // namespace std
