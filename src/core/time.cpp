#include <tabula/core/time.hpp>

#include <fmt/format.h>

#include <charconv>
#include <chrono>

namespace tabula {

namespace {

constexpr std::int64_t kNanosPerSecond = 1'000'000'000LL;
constexpr std::int64_t kNanosPerDay = 86'400LL * kNanosPerSecond;

auto parse_fixed(std::string_view text, std::size_t pos, std::size_t width, unsigned& out) -> bool {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end = begin + width;
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto parse_ymd(std::string_view text, std::chrono::sys_days& out) -> bool {
    // YYYY-MM-DD
    if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    unsigned y = 0;
    unsigned m = 0;
    unsigned d = 0;
    if (!parse_fixed(text, 0, 4, y) || !parse_fixed(text, 5, 2, m) ||
        !parse_fixed(text, 8, 2, d)) {
        return false;
    }
    std::chrono::year_month_day ymd{std::chrono::year{static_cast<int>(y)},
                                    std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) {
        return false;
    }
    out = std::chrono::sys_days{ymd};
    return true;
}

}  // namespace

auto make_date(int year, unsigned month, unsigned day) -> Date {
    using namespace std::chrono;
    sys_days point{std::chrono::year{year} / std::chrono::month{month} / std::chrono::day{day}};
    return Date{static_cast<std::int32_t>(point.time_since_epoch().count())};
}

auto make_timestamp(int year, unsigned month, unsigned day, unsigned hour, unsigned minute,
                    unsigned second) -> Timestamp {
    const Date date = make_date(year, month, day);
    const std::int64_t secs = static_cast<std::int64_t>(hour) * 3600 +
                              static_cast<std::int64_t>(minute) * 60 + second;
    return Timestamp{static_cast<std::int64_t>(date.days) * kNanosPerDay + secs * kNanosPerSecond};
}

auto parse_timestamp(std::string_view text) -> std::optional<Timestamp> {
    std::chrono::sys_days day;
    if (!parse_ymd(text, day)) {
        return std::nullopt;
    }
    std::int64_t nanos = static_cast<std::int64_t>(day.time_since_epoch().count()) * kNanosPerDay;
    if (text.size() == 10) {
        return Timestamp{nanos};
    }
    if (text.back() == 'Z') {
        text.remove_suffix(1);
    }
    // [ T]HH:MM:SS
    if (text.size() < 19 || (text[10] != ' ' && text[10] != 'T') || text[13] != ':' ||
        text[16] != ':') {
        return std::nullopt;
    }
    unsigned hh = 0;
    unsigned mm = 0;
    unsigned ss = 0;
    if (!parse_fixed(text, 11, 2, hh) || !parse_fixed(text, 14, 2, mm) ||
        !parse_fixed(text, 17, 2, ss) || hh > 23 || mm > 59 || ss > 59) {
        return std::nullopt;
    }
    nanos += (static_cast<std::int64_t>(hh) * 3600 + static_cast<std::int64_t>(mm) * 60 + ss) *
             kNanosPerSecond;
    if (text.size() == 19) {
        return Timestamp{nanos};
    }
    if (text[19] != '.' || text.size() == 20 || text.size() > 29) {
        return std::nullopt;
    }
    std::int64_t fraction = 0;
    std::int64_t scale = kNanosPerSecond;
    for (std::size_t i = 20; i < text.size(); ++i) {
        const char ch = text[i];
        if (ch < '0' || ch > '9') {
            return std::nullopt;
        }
        scale /= 10;
        fraction += static_cast<std::int64_t>(ch - '0') * scale;
    }
    return Timestamp{nanos + fraction};
}

auto calendar_fields(Timestamp ts) -> CalendarFields {
    using namespace std::chrono;
    sys_time<nanoseconds> tp{nanoseconds{ts.nanos}};
    const auto day_point = floor<days>(tp);
    const year_month_day ymd{day_point};
    const weekday wd{day_point};
    CalendarFields fields;
    fields.date = Date{static_cast<std::int32_t>(day_point.time_since_epoch().count())};
    fields.year = static_cast<int>(ymd.year());
    fields.month = static_cast<unsigned>(ymd.month());
    fields.day = static_cast<unsigned>(ymd.day());
    // iso_encoding(): Monday = 1 ... Sunday = 7
    fields.day_of_week = static_cast<std::int64_t>(wd.iso_encoding()) - 1;
    return fields;
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
    auto text = fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}", static_cast<int>(ymd.year()),
                            static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()),
                            hms.hours().count(), hms.minutes().count(), hms.seconds().count());
    if (hms.subseconds().count() != 0) {
        text += fmt::format(".{:09}", hms.subseconds().count());
    }
    return text;
}

}  // namespace tabula
