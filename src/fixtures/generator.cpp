#include <tabula/fixtures/generator.hpp>
#include <tabula/io/csv.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <random>
#include <string_view>
#include <system_error>

namespace tabula::fixtures {

namespace {

namespace fs = std::filesystem;

struct CategoryProducts {
    std::string_view category;
    std::vector<std::string_view> products;
};

auto catalogue() -> const std::vector<CategoryProducts>& {
    static const std::vector<CategoryProducts> entries = {
        {"Electronics",
         {"Smartphone", "Laptop", "Headphones", "Tablet", "Smart Watch", "Camera", "TV"}},
        {"Clothing", {"T-shirt", "Jeans", "Dress", "Jacket", "Shoes", "Hat", "Socks"}},
        {"Home & Kitchen",
         {"Blender", "Coffee Maker", "Toaster", "Microwave", "Knife Set", "Plates"}},
        {"Books",
         {"Fiction Novel", "Biography", "Cookbook", "Self-Help", "Science Fiction", "History"}},
        {"Sports",
         {"Basketball", "Tennis Racket", "Yoga Mat", "Dumbbells", "Running Shoes", "Bicycle"}},
        {"Beauty",
         {"Shampoo", "Lipstick", "Face Cream", "Perfume", "Hair Dryer", "Nail Polish"}},
        {"Toys",
         {"Action Figure", "Board Game", "Puzzle", "Stuffed Animal", "Building Blocks", "Doll"}},
        {"Automotive", {"Car Wax", "Floor Mats", "Air Freshener", "Tire Gauge", "Jump Starter"}},
        {"Health", {"Vitamins", "First Aid Kit", "Thermometer", "Pain Reliever", "Bandages"}},
        {"Grocery", {"Cereal", "Coffee", "Pasta", "Snacks", "Canned Goods", "Frozen Meals"}},
    };
    return entries;
}

constexpr std::array<std::string_view, 6> kPaymentMethods = {
    "Credit Card", "Debit Card", "PayPal", "Cash", "Bank Transfer", "Gift Card"};
constexpr std::array<std::string_view, 5> kStreets = {"Main", "Oak", "Pine", "Maple", "Cedar"};
constexpr std::array<std::string_view, 5> kCities = {"New York", "Los Angeles", "Chicago",
                                                     "Houston", "Phoenix"};
constexpr std::array<std::string_view, 5> kStates = {"NY", "CA", "IL", "TX", "AZ"};
constexpr std::array<std::string_view, 5> kTags = {"sale", "new", "trending", "limited",
                                                   "exclusive"};

constexpr std::int64_t kSecond = 1'000'000'000LL;

class RecordGenerator {
   public:
    RecordGenerator(std::uint64_t seed, Timestamp now) : rng_(seed), now_(now) {}

    auto next() -> TransactionRecord {
        const auto& entry = pick(catalogue());

        TransactionRecord record;
        record.transaction_id = uuid();
        record.customer_id = uuid().substr(0, 8);

        const std::int64_t offset_seconds =
            uniform(0, 365) * 86'400 + uniform(0, 24) * 3'600 + uniform(0, 60) * 60;
        // Whole seconds, like the rendered text.
        const std::int64_t now_seconds = now_.nanos / kSecond;
        record.timestamp = Timestamp{(now_seconds - offset_seconds) * kSecond};

        record.product_id = uuid().substr(0, 8);
        record.product_name = pick(entry.products);
        record.category = entry.category;

        std::uniform_real_distribution<double> price_dist(10.0, 1000.0);
        record.price = std::round(price_dist(rng_) * 100.0) / 100.0;
        record.quantity = uniform(1, 10);
        record.payment_method = pick(kPaymentMethods);

        record.shipping_address.street = fmt::format("{} {} St", uniform(100, 9999), pick(kStreets));
        record.shipping_address.city = pick(kCities);
        record.shipping_address.state = pick(kStates);
        record.shipping_address.zip_code = fmt::format("{}", uniform(10000, 99999));
        record.shipping_address.country = "USA";

        record.is_gift = std::bernoulli_distribution(0.5)(rng_);
        if (std::uniform_real_distribution<double>(0.0, 1.0)(rng_) > 0.3) {
            record.rating = uniform(1, 5);
        }

        std::array<std::string_view, kTags.size()> pool = kTags;
        std::ranges::shuffle(pool, rng_);
        const auto count = static_cast<std::size_t>(uniform(0, 3));
        record.tags.assign(pool.begin(), pool.begin() + static_cast<std::ptrdiff_t>(count));
        return record;
    }

   private:
    auto uniform(std::int64_t lo, std::int64_t hi) -> std::int64_t {
        return std::uniform_int_distribution<std::int64_t>(lo, hi)(rng_);
    }

    template <typename Range>
    auto pick(const Range& range) -> decltype(range[std::size_t{}]) {
        const auto n = static_cast<std::int64_t>(std::size(range));
        return range[static_cast<std::size_t>(uniform(0, n - 1))];
    }

    auto uuid() -> std::string {
        const std::uint64_t hi = rng_();
        const std::uint64_t lo = rng_();
        const std::string hex = fmt::format("{:016x}{:016x}", hi, lo);
        // Version 4 layout: xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx
        constexpr std::string_view kVariant = "89ab";
        return fmt::format("{}-{}-4{}-{}{}-{}", hex.substr(0, 8), hex.substr(8, 4),
                           hex.substr(13, 3), kVariant[(lo >> 60) & 0x3], hex.substr(17, 3),
                           hex.substr(20, 12));
    }

    std::mt19937_64 rng_;
    Timestamp now_;
};

void emit_record(YAML::Emitter& out, const TransactionRecord& record) {
    out << YAML::BeginMap;
    out << YAML::Key << "transaction_id" << YAML::Value << record.transaction_id;
    out << YAML::Key << "customer_id" << YAML::Value << record.customer_id;
    out << YAML::Key << "timestamp" << YAML::Value << format_timestamp(record.timestamp);
    out << YAML::Key << "product_id" << YAML::Value << record.product_id;
    out << YAML::Key << "product_name" << YAML::Value << record.product_name;
    out << YAML::Key << "category" << YAML::Value << record.category;
    out << YAML::Key << "price" << YAML::Value << record.price;
    out << YAML::Key << "quantity" << YAML::Value << record.quantity;
    out << YAML::Key << "payment_method" << YAML::Value << record.payment_method;

    const auto& address = record.shipping_address;
    out << YAML::Key << "shipping_address" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "street" << YAML::Value << address.street;
    out << YAML::Key << "city" << YAML::Value << address.city;
    out << YAML::Key << "state" << YAML::Value << address.state;
    out << YAML::Key << "zip_code" << YAML::Value << address.zip_code;
    out << YAML::Key << "country" << YAML::Value << address.country;
    out << YAML::EndMap;

    out << YAML::Key << "is_gift" << YAML::Value << record.is_gift;
    out << YAML::Key << "rating" << YAML::Value;
    if (record.rating.has_value()) {
        out << *record.rating;
    } else {
        out << YAML::Null;
    }
    out << YAML::Key << "tags" << YAML::Value << YAML::BeginSeq;
    for (const auto& tag : record.tags) {
        out << tag;
    }
    out << YAML::EndSeq;
    out << YAML::EndMap;
}

auto wall_clock_now() -> Timestamp {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return Timestamp{std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count()};
}

}  // namespace

auto records_to_json(std::span<const TransactionRecord> records) -> std::string {
    // JSON is the flow-style, double-quoted subset of YAML.
    YAML::Emitter out;
    out.SetOutputCharset(YAML::EscapeAsJson);
    out.SetStringFormat(YAML::DoubleQuoted);
    out.SetNullFormat(YAML::LowerNull);
    out.SetBoolFormat(YAML::TrueFalseBool);
    out.SetMapFormat(YAML::Flow);
    out.SetSeqFormat(YAML::Flow);
    // Prices are whole cents; 15 significant digits print them exactly.
    out.SetDoublePrecision(15);

    out << YAML::BeginSeq;
    for (const auto& record : records) {
        emit_record(out, record);
    }
    out << YAML::EndSeq;
    return std::string(out.c_str()) + "\n";
}

auto transaction_file_name(std::int64_t index) -> std::string {
    return fmt::format("transactions_{:03d}.json", index);
}

auto generate_transactions(const GeneratorOptions& options, const LoggerPtr& logger)
    -> Result<std::vector<fs::path>> {
    if (options.num_files < 0 || options.records_per_file < 0) {
        return make_error(ErrorKind::TypeCoercion,
                          "file and record counts must be non-negative");
    }
    std::error_code ec;
    fs::create_directories(options.output_dir, ec);
    if (ec) {
        return make_error(ErrorKind::Io, fmt::format("cannot create {}: {}",
                                                     options.output_dir.string(), ec.message()));
    }
    logger->info("Generating {} files with {} records each", options.num_files,
                 options.records_per_file);

    RecordGenerator generator(options.seed, options.now.value_or(wall_clock_now()));
    std::vector<fs::path> written;
    std::vector<TransactionRecord> records;
    for (std::int64_t file = 1; file <= options.num_files; ++file) {
        records.clear();
        records.reserve(static_cast<std::size_t>(options.records_per_file));
        for (std::int64_t i = 0; i < options.records_per_file; ++i) {
            records.push_back(generator.next());
        }

        const fs::path target = options.output_dir / transaction_file_name(file);
        const std::array<std::string, 1> chunks = {records_to_json(records)};
        if (auto status = io::write_file_atomic(target, chunks); !status) {
            return std::unexpected(std::move(status.error()));
        }
        logger->info("Generated {} with {} records", target.string(), options.records_per_file);
        written.push_back(target);
    }
    logger->info("Data generation completed: {} files created with {} records each",
                 options.num_files, options.records_per_file);
    return written;
}

}  // namespace tabula::fixtures
