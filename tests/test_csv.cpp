#include <tabula/io/csv.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {

namespace fs = std::filesystem;

auto write_text(const fs::path& path, const char* content) {
    std::ofstream out(path);
    out << content;
}

auto read_text(const fs::path& path) -> std::string {
    std::ifstream in(path);
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto tmp(const char* name) -> fs::path {
    return fs::temp_directory_path() / name;
}

auto text_at(const tabula::Table& table, const char* name, std::size_t row) -> std::string {
    const auto* col = std::get_if<tabula::Column<std::string>>(table.find(name));
    REQUIRE(col != nullptr);
    return (*col)[row];
}

auto is_null_at(const tabula::Table& table, const char* name, std::size_t row) -> bool {
    const auto* entry = table.find_entry(name);
    REQUIRE(entry != nullptr);
    return tabula::is_null(*entry, row);
}

}  // namespace

TEST_CASE("read_csv_text keeps every cell as text", "[io][csv]") {
    auto path = tmp("tabula_test_text.csv");
    write_text(path, "price,category\n10,Books\n20.5,Toys\n");

    auto table = tabula::io::read_csv_text(path);
    REQUIRE(table.has_value());
    REQUIRE(table->rows() == 2);
    REQUIRE(table->column_names() == std::vector<std::string>{"price", "category"});
    REQUIRE(text_at(*table, "price", 1) == "20.5");
    REQUIRE(text_at(*table, "category", 0) == "Books");
}

TEST_CASE("read_csv_text marks empty cells and null tokens as null", "[io][csv]") {
    auto path = tmp("tabula_test_nulls.csv");
    write_text(path, "rating,category\n5,Books\n,Toys\nNA,Health\n");

    tabula::io::CsvReadOptions options;
    options.null_tokens.insert("NA");
    auto table = tabula::io::read_csv_text(path, options);
    REQUIRE(table.has_value());
    REQUIRE_FALSE(is_null_at(*table, "rating", 0));
    REQUIRE(is_null_at(*table, "rating", 1));
    REQUIRE(is_null_at(*table, "rating", 2));
    REQUIRE_FALSE(is_null_at(*table, "category", 2));
}

TEST_CASE("read_csv_text honours RFC 4180 quoting", "[io][csv]") {
    auto path = tmp("tabula_test_quoted.csv");
    write_text(path, "product_name,tags\n\"Knife Set, deluxe\",\"sale,new\"\nCereal,\n");

    auto table = tabula::io::read_csv_text(path);
    REQUIRE(table.has_value());
    REQUIRE(text_at(*table, "product_name", 0) == "Knife Set, deluxe");
    REQUIRE(text_at(*table, "tags", 0) == "sale,new");
    REQUIRE(text_at(*table, "product_name", 1) == "Cereal");
    REQUIRE(is_null_at(*table, "tags", 1));
}

TEST_CASE("read_csv_text reports unreadable input as IOError", "[io][csv]") {
    auto table = tabula::io::read_csv_text(tmp("tabula_test_does_not_exist.csv"));
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().kind == tabula::ErrorKind::Io);
}

TEST_CASE("read_csv_text rejects duplicate header names", "[io][csv]") {
    auto path = tmp("tabula_test_dup.csv");
    write_text(path, "price,price\n1,2\n");

    auto table = tabula::io::read_csv_text(path);
    REQUIRE_FALSE(table.has_value());
    REQUIRE(table.error().kind == tabula::ErrorKind::SchemaMismatch);
}

TEST_CASE("infer_numeric_column picks int64, then double, then text", "[io][csv]") {
    using tabula::Column;

    auto ints = tabula::io::infer_numeric_column(Column<std::string>{"1", "2", "+3"}, std::nullopt);
    const auto* as_int = std::get_if<Column<std::int64_t>>(&ints);
    REQUIRE(as_int != nullptr);
    REQUIRE((*as_int)[2] == 3);

    auto doubles =
        tabula::io::infer_numeric_column(Column<std::string>{"1", "2.5", ""},
                                         std::vector<bool>{true, true, false});
    const auto* as_double = std::get_if<Column<double>>(&doubles);
    REQUIRE(as_double != nullptr);
    REQUIRE((*as_double)[1] == Catch::Approx(2.5));

    auto text = tabula::io::infer_numeric_column(Column<std::string>{"1", "abc"}, std::nullopt);
    REQUIRE(std::holds_alternative<Column<std::string>>(text));
}

TEST_CASE("parse_int64 and parse_double match whole cells only", "[io][csv]") {
    REQUIRE(tabula::io::parse_int64(" 42 ") == 42);
    REQUIRE_FALSE(tabula::io::parse_int64("42abc").has_value());
    REQUIRE_FALSE(tabula::io::parse_int64("4.2").has_value());
    REQUIRE(tabula::io::parse_double("4.25") == 4.25);
    REQUIRE_FALSE(tabula::io::parse_double("four").has_value());
}

TEST_CASE("write_csv quotes, renders nulls as empty and formats calendar values", "[io][csv]") {
    tabula::Table table;
    table.add_column("category", tabula::Column<std::string>{"Books", "Home, Kitchen", "a\"b"});
    table.add_column("total_price", tabula::Column<double>{30.0, 0.1, 2.5});
    table.add_column("rating", tabula::Column<std::int64_t>{5, 0, 3},
                     std::vector<bool>{true, false, true});
    table.add_column("date", tabula::Column<tabula::Date>{tabula::make_date(2024, 1, 1),
                                                          tabula::make_date(2024, 1, 2),
                                                          tabula::make_date(2024, 12, 31)});

    auto path = tmp("tabula_test_write.csv");
    auto rows = tabula::io::write_csv(table, path);
    REQUIRE(rows.has_value());
    REQUIRE(*rows == 3);
    REQUIRE(read_text(path) ==
            "category,total_price,rating,date\n"
            "Books,30,5,2024-01-01\n"
            "\"Home, Kitchen\",0.1,,2024-01-02\n"
            "\"a\"\"b\",2.5,3,2024-12-31\n");
}

TEST_CASE("a cell with an embedded line break reads back as one cell", "[io][csv]") {
    tabula::Table table;
    table.add_column("product_name", tabula::Column<std::string>{"Line one\nline two", "Cereal"});
    table.add_column("price", tabula::Column<double>{1.0, 2.5});

    auto path = tmp("tabula_test_linebreak.csv");
    REQUIRE(tabula::io::write_csv(table, path).has_value());
    REQUIRE(read_text(path) == "product_name,price\n\"Line one\nline two\",1\nCereal,2.5\n");

    auto loaded = tabula::io::read_csv_text(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->rows() == 2);
    REQUIRE(text_at(*loaded, "product_name", 0) == "Line one\nline two");
    REQUIRE(text_at(*loaded, "price", 0) == "1");
    REQUIRE(text_at(*loaded, "product_name", 1) == "Cereal");
}

TEST_CASE("write_file_atomic replaces the target in one step", "[io][csv]") {
    auto dir = tmp("tabula_test_atomic");
    fs::remove_all(dir);
    fs::create_directories(dir);
    auto target = dir / "out.csv";
    write_text(target, "old contents\n");

    const std::string chunks[] = {"a,b\n", "1,2\n"};
    REQUIRE(tabula::io::write_file_atomic(target, chunks).has_value());
    REQUIRE(read_text(target) == "a,b\n1,2\n");

    std::size_t entries = 0;
    for ([[maybe_unused]] const auto& entry : fs::directory_iterator(dir)) {
        ++entries;
    }
    REQUIRE(entries == 1);
}

TEST_CASE("write_file_atomic fails with IOError on an unwritable target", "[io][csv]") {
    const std::string chunks[] = {"a\n"};

    SECTION("missing parent directory") {
        auto status = tabula::io::write_file_atomic(
            tmp("tabula_test_missing_dir") / "nested" / "out.csv", chunks);
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().kind == tabula::ErrorKind::Io);
    }

    SECTION("target is a directory") {
        auto dir = tmp("tabula_test_target_dir");
        fs::create_directories(dir);
        auto status = tabula::io::write_file_atomic(dir, chunks);
        REQUIRE_FALSE(status.has_value());
        REQUIRE(status.error().kind == tabula::ErrorKind::Io);
    }
}
