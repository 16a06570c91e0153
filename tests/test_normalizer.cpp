#include <tabula/engine/normalizer.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using tabula::Column;
using tabula::Table;

namespace {

// Shaped like a freshly loaded file: everything text except what the reader inferred.
auto raw_transactions() -> Table {
    Table t;
    t.add_column("transaction_id", Column<std::string>{"t1", "t2", "t3"});
    t.add_column("timestamp", Column<std::string>{"2024-01-01 08:00:00", "2024-05-15T10:30:45",
                                                  "2024-05-19 23:59:59.5"});
    t.add_column("category", Column<std::string>{"Books", "Books", "Toys"});
    t.add_column("product_name", Column<std::string>{"Cookbook", "History", "Puzzle"});
    t.add_column("price", Column<std::int64_t>{100, 10, 20});
    t.add_column("quantity", Column<std::int64_t>{3, 1, 2});
    t.add_column("rating", Column<std::int64_t>{5, 0, 4}, std::vector<bool>{true, false, true});
    t.add_column("is_gift", Column<std::string>{"True", "false", "1"});
    return t;
}

auto tables_equal(const Table& a, const Table& b) -> bool {
    if (a.column_names() != b.column_names() || a.rows() != b.rows()) {
        return false;
    }
    for (std::size_t c = 0; c < a.columns.size(); ++c) {
        const auto& lhs = a.columns[c];
        const auto& rhs = b.columns[c];
        if (*lhs.column != *rhs.column || lhs.validity != rhs.validity) {
            return false;
        }
    }
    return true;
}

template <typename T>
auto column(const Table& t, const char* name) -> const Column<T>& {
    const auto* col = std::get_if<Column<T>>(t.find(name));
    REQUIRE(col != nullptr);
    return *col;
}

}  // namespace

TEST_CASE("normalize_table coerces types and derives columns", "[engine][normalizer]") {
    auto result = tabula::normalize_table(raw_transactions());
    REQUIRE(result.has_value());
    const Table& t = *result;

    REQUIRE(column<double>(t, "price") == Column<double>{100.0, 10.0, 20.0});
    REQUIRE(column<std::int64_t>(t, "quantity") == Column<std::int64_t>{3, 1, 2});
    REQUIRE(column<std::int64_t>(t, "is_gift") == Column<std::int64_t>{1, 0, 1});
    REQUIRE(column<tabula::Timestamp>(t, "timestamp")[0] == tabula::make_timestamp(2024, 1, 1, 8));

    REQUIRE(column<tabula::Date>(t, "date")[1] == tabula::make_date(2024, 5, 15));
    REQUIRE(column<std::int64_t>(t, "year") == Column<std::int64_t>{2024, 2024, 2024});
    REQUIRE(column<std::int64_t>(t, "month") == Column<std::int64_t>{1, 5, 5});
    REQUIRE(column<std::int64_t>(t, "day") == Column<std::int64_t>{1, 15, 19});
    REQUIRE(column<std::int64_t>(t, "day_of_week") == Column<std::int64_t>{0, 2, 6});
}

TEST_CASE("total_price is price times quantity exactly", "[engine][normalizer]") {
    auto result = tabula::normalize_table(raw_transactions());
    REQUIRE(result.has_value());
    REQUIRE(column<double>(*result, "total_price")[0] == 300.0);
    REQUIRE(column<double>(*result, "total_price")[2] == 40.0);
}

TEST_CASE("missing ratings become zero", "[engine][normalizer]") {
    SECTION("null cells") {
        auto result = tabula::normalize_table(raw_transactions());
        REQUIRE(result.has_value());
        const auto* entry = result->find_entry("rating");
        REQUIRE_FALSE(entry->validity.has_value());
        REQUIRE(column<double>(*result, "rating") == Column<double>{5.0, 0.0, 4.0});
    }

    SECTION("absent column") {
        Table t = raw_transactions();
        Table without;
        for (const auto& entry : t.columns) {
            if (entry.name != "rating") {
                without.add_column(entry.name, *entry.column);
            }
        }
        auto result = tabula::normalize_table(without);
        REQUIRE(result.has_value());
        REQUIRE(column<double>(*result, "rating") == Column<double>{0.0, 0.0, 0.0});
    }
}

TEST_CASE("normalize_table is idempotent", "[engine][normalizer]") {
    auto once = tabula::normalize_table(raw_transactions());
    REQUIRE(once.has_value());
    auto twice = tabula::normalize_table(*once);
    REQUIRE(twice.has_value());
    REQUIRE(tables_equal(*once, *twice));
}

TEST_CASE("normalize_table never modifies its input", "[engine][normalizer]") {
    const Table input = raw_transactions();
    auto result = tabula::normalize_table(input);
    REQUIRE(result.has_value());
    REQUIRE(std::holds_alternative<Column<std::string>>(*input.find("timestamp")));
    REQUIRE(std::holds_alternative<Column<std::int64_t>>(*input.find("price")));
    REQUIRE_FALSE(input.has_column("total_price"));
}

TEST_CASE("integral doubles are accepted as quantities", "[engine][normalizer]") {
    Table t = raw_transactions();
    t.add_column("quantity", Column<double>{3.0, 1.0, 2.0});
    auto result = tabula::normalize_table(t);
    REQUIRE(result.has_value());
    REQUIRE(column<std::int64_t>(*result, "quantity") == Column<std::int64_t>{3, 1, 2});
}

TEST_CASE("malformed scalars fail with TypeCoercionError", "[engine][normalizer]") {
    Table t = raw_transactions();

    SECTION("unparseable price") {
        t.add_column("price", Column<std::string>{"100", "ten", "20"});
        auto result = tabula::normalize_table(t);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tabula::ErrorKind::TypeCoercion);
        REQUIRE(result.error().message.find("price") != std::string::npos);
        REQUIRE(result.error().message.find("ten") != std::string::npos);
    }

    SECTION("fractional quantity") {
        t.add_column("quantity", Column<double>{3.0, 1.5, 2.0});
        auto result = tabula::normalize_table(t);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tabula::ErrorKind::TypeCoercion);
        REQUIRE(result.error().message.find("quantity") != std::string::npos);
    }

    SECTION("null quantity") {
        t.add_column("quantity", Column<std::int64_t>{3, 0, 2}, std::vector<bool>{true, false, true});
        auto result = tabula::normalize_table(t);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tabula::ErrorKind::TypeCoercion);
    }

    SECTION("bad timestamp") {
        t.add_column("timestamp",
                     Column<std::string>{"2024-01-01 08:00:00", "yesterday", "2024-01-01"});
        auto result = tabula::normalize_table(t);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().kind == tabula::ErrorKind::TypeCoercion);
        REQUIRE(result.error().message.find("yesterday") != std::string::npos);
    }

    SECTION("bad gift flag") {
        t.add_column("is_gift", Column<std::string>{"true", "maybe", "false"});
        auto result = tabula::normalize_table(t);
        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().message.find("is_gift") != std::string::npos);
    }
}

TEST_CASE("normalize_table requires timestamp, price and quantity", "[engine][normalizer]") {
    Table t;
    t.add_column("price", Column<double>{1.0});
    t.add_column("quantity", Column<std::int64_t>{1});
    auto result = tabula::normalize_table(t);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().kind == tabula::ErrorKind::MissingColumn);
}
