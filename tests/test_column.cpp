#include <tabula/core/column.hpp>
#include <tabula/core/time.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

TEST_CASE("Column<int64_t> basic operations", "[core][column]") {
    tabula::Column<std::int64_t> col{1, 2, 3, 4, 5};

    SECTION("size and element access") {
        REQUIRE(col.size() == 5);
        REQUIRE_FALSE(col.empty());
        REQUIRE(col.at(0) == 1);
        REQUIRE(col[4] == 5);
    }

    SECTION("push_back grows the column") {
        col.push_back(6);
        REQUIRE(col.size() == 6);
        REQUIRE(col.at(5) == 6);
    }

    SECTION("span provides zero-copy view") {
        auto view = col.span();
        REQUIRE(view.size() == 5);
        REQUIRE(view[2] == 3);
    }

    SECTION("at() throws on out-of-bounds") {
        REQUIRE_THROWS_AS(col.at(100), std::out_of_range);
    }
}

TEST_CASE("Column append concatenates in order", "[core][column]") {
    tabula::Column<std::string> first{"Books", "Toys"};
    tabula::Column<std::string> second{"Health"};

    first.append(second);

    REQUIRE(first.size() == 3);
    REQUIRE(first[0] == "Books");
    REQUIRE(first[2] == "Health");
    REQUIRE(second.size() == 1);
}

TEST_CASE("Column resize fills with the given value", "[core][column]") {
    tabula::Column<double> ratings;
    ratings.resize(3, 0.0);

    REQUIRE(ratings == tabula::Column<double>{0.0, 0.0, 0.0});
}

TEST_CASE("Column holds calendar values", "[core][column]") {
    tabula::Column<tabula::Date> dates{tabula::make_date(2024, 1, 2), tabula::make_date(2024, 1, 1)};

    REQUIRE(dates[1] < dates[0]);
    REQUIRE(dates[0].days - dates[1].days == 1);
}

TEST_CASE("Column range-for iteration", "[core][column]") {
    tabula::Column<std::int64_t> col{10, 20, 30};

    std::int64_t sum = 0;
    for (auto val : col) {
        sum += val;
    }
    REQUIRE(sum == 60);
}
