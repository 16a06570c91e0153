#include <tabula/engine/backend.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace fs = std::filesystem;

auto fresh_dir(const char* name) -> fs::path {
    auto dir = fs::temp_directory_path() / name;
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_text(const fs::path& path, const std::string& content) {
    std::ofstream out(path);
    out << content;
}

auto read_lines(const fs::path& path) -> std::vector<std::string> {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

constexpr const char* kHeader =
    "transaction_id,timestamp,category,product_name,price,quantity,rating,payment_method,"
    "is_gift\n";

// Three files, the last with a shuffled column order.
auto write_inputs(const fs::path& dir) {
    write_text(dir / "transactions_001.csv",
               std::string(kHeader) +
                   "a,2024-03-02 10:00:00,Books,Cookbook,10.0,1,4,Cash,True\n"
                   "b,2024-03-01 09:00:00,Toys,Puzzle,5.5,2,,PayPal,False\n");
    write_text(dir / "transactions_002.csv",
               std::string(kHeader) +
                   "c,2024-03-02 18:00:00,Books,Cookbook,20,2,5,Cash,False\n"
                   "d,2024-02-28 12:00:00,Health,Vitamins,7.25,4,3,Credit Card,True\n");
    write_text(dir / "transactions_003.csv",
               "category,transaction_id,timestamp,product_name,price,quantity,rating,"
               "payment_method,is_gift\n"
               "Toys,e,2024-03-01 23:00:00,Doll,3,1,,PayPal,False\n"
               "Books,f,2024-02-28 08:00:00,History,12.5,3,2,Cash,False\n");
}

// view row key -> reduced values, insensitive to row order and partitioning.
using ViewContents = std::map<std::string, std::vector<double>>;

auto contents(const tabula::AggregationView& view, std::size_t key_columns) -> ViewContents {
    const tabula::Table table = view.data.collect();
    ViewContents out;
    for (std::size_t row = 0; row < table.rows(); ++row) {
        std::string key;
        std::vector<double> values;
        for (std::size_t c = 0; c < table.columns.size(); ++c) {
            auto cell = tabula::scalar_at(table.columns[c], row);
            if (c < key_columns) {
                key += tabula::format_scalar(cell) + "|";
            } else if (const auto* i = std::get_if<std::int64_t>(&cell)) {
                values.push_back(static_cast<double>(*i));
            } else {
                values.push_back(std::get<double>(cell));
            }
        }
        out.emplace(key, values);
    }
    return out;
}

auto run_all(tabula::Backend& backend, const fs::path& input) -> tabula::ViewSet {
    auto loaded = backend.source->load({input});
    REQUIRE(loaded.has_value());
    auto cleaned = backend.normalizer->normalize(*loaded);
    REQUIRE(cleaned.has_value());
    auto views = backend.aggregator->aggregate(*cleaned);
    REQUIRE(views.has_value());
    return *views;
}

}  // namespace

TEST_CASE("local row source loads files in name order into one partition", "[engine][backend]") {
    auto dir = fresh_dir("tabula_backend_local_load");
    write_inputs(dir);

    auto backend = tabula::make_local_backend();
    auto loaded = backend.source->load({dir});
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->num_partitions() == 1);
    REQUIRE(loaded->rows() == 6);

    const auto& ids = std::get<tabula::Column<std::string>>(
        *loaded->partitions().front().find("transaction_id"));
    REQUIRE(ids == tabula::Column<std::string>{"a", "b", "c", "d", "e", "f"});
    const auto* rating = loaded->partitions().front().find_entry("rating");
    REQUIRE(tabula::is_null(*rating, 1));
}

TEST_CASE("distributed row source keeps one partition per file", "[engine][backend]") {
    auto dir = fresh_dir("tabula_backend_dist_load");
    write_inputs(dir);

    tabula::ComputeContext context(tabula::ComputeOptions{.workers = 2});
    auto backend = tabula::make_distributed_backend(context);
    auto loaded = backend.source->load({dir});
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->num_partitions() == 3);
    REQUIRE(loaded->rows() == 6);
    for (const auto& part : loaded->partitions()) {
        REQUIRE(part.column_names() == loaded->partitions().front().column_names());
    }
}

TEST_CASE("row sources fail on empty input and schema mismatch", "[engine][backend]") {
    tabula::ComputeContext context(tabula::ComputeOptions{.workers = 2});
    std::vector<tabula::Backend> backends;
    backends.push_back(tabula::make_local_backend());
    backends.push_back(tabula::make_distributed_backend(context));

    for (auto& backend : backends) {
        SECTION(std::string(tabula::to_string(backend.kind)) + ": empty directory") {
            auto dir = fresh_dir("tabula_backend_empty");
            auto loaded = backend.source->load({dir});
            REQUIRE_FALSE(loaded.has_value());
            REQUIRE(loaded.error().kind == tabula::ErrorKind::EmptyInput);
        }

        SECTION(std::string(tabula::to_string(backend.kind)) + ": differing column sets") {
            auto dir = fresh_dir("tabula_backend_mismatch");
            write_inputs(dir);
            write_text(dir / "transactions_004.csv",
                       "transaction_id,timestamp,category,product_name,price,quantity\n"
                       "g,2024-03-01 00:00:00,Books,History,1,1\n");
            auto loaded = backend.source->load({dir});
            REQUIRE_FALSE(loaded.has_value());
            REQUIRE(loaded.error().kind == tabula::ErrorKind::SchemaMismatch);
        }

        SECTION(std::string(tabula::to_string(backend.kind)) + ": unknown column") {
            auto dir = fresh_dir("tabula_backend_unknown");
            write_text(dir / "x.csv",
                       "transaction_id,timestamp,category,product_name,price,quantity,colour\n"
                       "g,2024-03-01 00:00:00,Books,History,1,1,red\n");
            auto loaded = backend.source->load({dir});
            REQUIRE_FALSE(loaded.has_value());
            REQUIRE(loaded.error().kind == tabula::ErrorKind::SchemaMismatch);
        }

        SECTION(std::string(tabula::to_string(backend.kind)) + ": missing location") {
            auto loaded = backend.source->load({fs::temp_directory_path() / "tabula_no_such_dir"});
            REQUIRE_FALSE(loaded.has_value());
            REQUIRE(loaded.error().kind == tabula::ErrorKind::Io);
        }
    }
}

TEST_CASE("local and distributed backends agree on every view", "[engine][backend]") {
    auto dir = fresh_dir("tabula_backend_equivalence");
    write_inputs(dir);

    auto local = tabula::make_local_backend();
    const auto local_views = run_all(local, dir);

    tabula::ComputeContext context(tabula::ComputeOptions{.workers = 3});
    auto distributed = tabula::make_distributed_backend(context);
    const auto dist_views = run_all(distributed, dir);

    REQUIRE(local_views.size() == 5);
    REQUIRE(dist_views.size() == local_views.size());
    for (std::size_t v = 0; v < local_views.size(); ++v) {
        const auto& spec = tabula::default_views()[v];
        REQUIRE(dist_views[v].name == local_views[v].name);
        const auto lhs = contents(local_views[v], spec.group_keys.size());
        const auto rhs = contents(dist_views[v], spec.group_keys.size());
        REQUIRE(lhs.size() == rhs.size());
        for (const auto& [key, values] : lhs) {
            auto it = rhs.find(key);
            REQUIRE(it != rhs.end());
            REQUIRE(it->second.size() == values.size());
            for (std::size_t i = 0; i < values.size(); ++i) {
                REQUIRE(it->second[i] == Catch::Approx(values[i]).epsilon(1e-9));
            }
        }
    }
}

TEST_CASE("sales_by_date is date-sorted in the distributed backend", "[engine][backend]") {
    auto dir = fresh_dir("tabula_backend_dist_sorted");
    write_inputs(dir);

    tabula::ComputeContext context(tabula::ComputeOptions{.workers = 4});
    auto backend = tabula::make_distributed_backend(context);
    const auto views = run_all(backend, dir);
    const auto* by_date = tabula::find_view(views, "sales_by_date");
    REQUIRE(by_date != nullptr);

    const auto table = by_date->data.collect();
    const auto& dates = std::get<tabula::Column<tabula::Date>>(*table.find("date"));
    REQUIRE(dates.size() == 3);
    REQUIRE(std::ranges::is_sorted(dates));
}

TEST_CASE("distributed normalizer surfaces a partition's coercion error", "[engine][backend]") {
    auto dir = fresh_dir("tabula_backend_dist_bad");
    write_inputs(dir);
    write_text(dir / "transactions_004.csv",
               std::string(kHeader) + "g,2024-03-01 00:00:00,Books,History,abc,1,1,Cash,True\n");

    tabula::ComputeContext context(tabula::ComputeOptions{.workers = 2});
    auto backend = tabula::make_distributed_backend(context);
    auto loaded = backend.source->load({dir});
    REQUIRE(loaded.has_value());
    auto cleaned = backend.normalizer->normalize(*loaded);
    REQUIRE_FALSE(cleaned.has_value());
    REQUIRE(cleaned.error().kind == tabula::ErrorKind::TypeCoercion);
    REQUIRE(cleaned.error().message.find("abc") != std::string::npos);
}

TEST_CASE("sinks write one header and every row", "[engine][backend]") {
    auto dir = fresh_dir("tabula_backend_sink");
    write_inputs(dir);
    auto out = fresh_dir("tabula_backend_sink_out");

    tabula::ComputeContext context(tabula::ComputeOptions{.workers = 2});
    std::vector<tabula::Backend> backends;
    backends.push_back(tabula::make_local_backend());
    backends.push_back(tabula::make_distributed_backend(context));

    for (auto& backend : backends) {
        auto loaded = backend.source->load({dir});
        REQUIRE(loaded.has_value());
        auto cleaned = backend.normalizer->normalize(*loaded);
        REQUIRE(cleaned.has_value());

        const auto target = out / (std::string(tabula::to_string(backend.kind)) + ".csv");
        REQUIRE(backend.sink->persist("cleaned data", *cleaned, target).has_value());

        const auto lines = read_lines(target);
        REQUIRE(lines.size() == 7);
        REQUIRE(lines[0].starts_with("transaction_id,timestamp,category,product_name,price"));
        REQUIRE(lines[0].ends_with(",total_price"));
        REQUIRE(std::ranges::count_if(lines, [](const auto& l) {
                    return l.starts_with("transaction_id");
                }) == 1);
    }
}

TEST_CASE("sink fails with IOError when the target cannot be written", "[engine][backend]") {
    auto backend = tabula::make_local_backend();
    tabula::Table table;
    table.add_column("category", tabula::Column<std::string>{"Books"});
    auto status = backend.sink->persist(
        "view", tabula::Dataset(table),
        fs::temp_directory_path() / "tabula_missing_parent" / "deeper" / "view.csv");
    REQUIRE_FALSE(status.has_value());
    REQUIRE(status.error().kind == tabula::ErrorKind::Io);
}

TEST_CASE("make_backend selects by kind", "[engine][backend]") {
    REQUIRE(tabula::parse_backend_kind("local") == tabula::BackendKind::Local);
    REQUIRE(tabula::parse_backend_kind("distributed") == tabula::BackendKind::Distributed);
    REQUIRE_FALSE(tabula::parse_backend_kind("spark").has_value());

    REQUIRE(tabula::make_backend(tabula::BackendKind::Local, {}).kind ==
            tabula::BackendKind::Local);
    REQUIRE_THROWS_AS(tabula::make_backend(tabula::BackendKind::Distributed, {}),
                      std::invalid_argument);

    tabula::ComputeContext context(tabula::ComputeOptions{.workers = 1});
    REQUIRE(tabula::make_backend(tabula::BackendKind::Distributed, {}, &context).kind ==
            tabula::BackendKind::Distributed);
}
