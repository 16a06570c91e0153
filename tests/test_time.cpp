#include <tabula/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

using tabula::make_date;
using tabula::make_timestamp;
using tabula::parse_timestamp;

TEST_CASE("parse_timestamp accepts the supported layouts", "[core][time]") {
    const auto expected = make_timestamp(2024, 5, 15, 10, 30, 45);

    SECTION("space separator") {
        REQUIRE(parse_timestamp("2024-05-15 10:30:45") == expected);
    }

    SECTION("T separator with trailing Z") {
        REQUIRE(parse_timestamp("2024-05-15T10:30:45Z") == expected);
    }

    SECTION("fractional seconds") {
        auto ts = parse_timestamp("2024-05-15 10:30:45.250");
        REQUIRE(ts.has_value());
        REQUIRE(ts->nanos - expected.nanos == 250'000'000);
    }

    SECTION("date only is midnight") {
        REQUIRE(parse_timestamp("2024-05-15") == make_timestamp(2024, 5, 15));
    }
}

TEST_CASE("parse_timestamp rejects malformed text", "[core][time]") {
    REQUIRE_FALSE(parse_timestamp("").has_value());
    REQUIRE_FALSE(parse_timestamp("not a timestamp").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-13-01 00:00:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2023-02-29 00:00:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-05-15 24:00:00").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-05-15 10:30:45.").has_value());
}

TEST_CASE("calendar_fields counts weekdays from Monday = 0", "[core][time]") {
    // 2024-01-01 was a Monday.
    auto monday = tabula::calendar_fields(make_timestamp(2024, 1, 1, 8));
    REQUIRE(monday.day_of_week == 0);
    REQUIRE(monday.year == 2024);
    REQUIRE(monday.month == 1);
    REQUIRE(monday.day == 1);
    REQUIRE(monday.date == make_date(2024, 1, 1));

    auto wednesday = tabula::calendar_fields(make_timestamp(2024, 5, 15, 23, 59, 59));
    REQUIRE(wednesday.day_of_week == 2);
    REQUIRE(wednesday.date == make_date(2024, 5, 15));

    auto sunday = tabula::calendar_fields(make_timestamp(2024, 5, 19));
    REQUIRE(sunday.day_of_week == 6);
}

TEST_CASE("calendar_fields handles instants before the epoch", "[core][time]") {
    auto fields = tabula::calendar_fields(make_timestamp(1969, 12, 31, 23));
    REQUIRE(fields.year == 1969);
    REQUIRE(fields.month == 12);
    REQUIRE(fields.day == 31);
    REQUIRE(fields.date == make_date(1969, 12, 31));
}

TEST_CASE("format_date and format_timestamp", "[core][time]") {
    REQUIRE(tabula::format_date(make_date(2024, 3, 9)) == "2024-03-09");
    REQUIRE(tabula::format_timestamp(make_timestamp(2024, 3, 9, 7, 5, 1)) == "2024-03-09 07:05:01");

    auto with_fraction = parse_timestamp("2024-03-09 07:05:01.5");
    REQUIRE(with_fraction.has_value());
    REQUIRE(tabula::format_timestamp(*with_fraction).starts_with("2024-03-09 07:05:01.5"));
}
