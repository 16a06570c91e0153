#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/logging.hpp>
#include <tabula/core/time.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace tabula::fixtures {

struct GeneratorOptions {
    std::int64_t num_files = 10;
    std::int64_t records_per_file = 1000;
    std::filesystem::path output_dir = "data/raw";
    std::uint64_t seed = 42;
    /// Upper end of the one-year timestamp window; the wall clock when unset.
    std::optional<Timestamp> now;
};

struct ShippingAddress {
    std::string street;
    std::string city;
    std::string state;
    std::string zip_code;
    std::string country;
};

/// One synthetic transaction as it appears in the raw JSON files.
struct TransactionRecord {
    std::string transaction_id;
    std::string customer_id;
    Timestamp timestamp;
    std::string product_id;
    std::string product_name;
    std::string category;
    double price = 0.0;
    std::int64_t quantity = 0;
    std::string payment_method;
    ShippingAddress shipping_address;
    bool is_gift = false;
    std::optional<std::int64_t> rating;
    std::vector<std::string> tags;
};

/// Serialize records as a JSON array of objects. Keys keep the member order
/// above; a missing rating is `null` and strings use JSON escapes.
[[nodiscard]] auto records_to_json(std::span<const TransactionRecord> records) -> std::string;

/// `transactions_007.json` for index 7.
[[nodiscard]] auto transaction_file_name(std::int64_t index) -> std::string;

/// Write `num_files` JSON arrays of synthetic transaction records into
/// `output_dir` (created if missing). Output is fully determined by the seed
/// and `now`. Returns the written paths in order.
///
/// Each record carries a transaction id, short customer and product ids, a
/// timestamp within the year before `now`, a category and matching product,
/// price, quantity, payment method, nested shipping address, gift flag,
/// rating (null about 30% of the time) and up to three tags.
[[nodiscard]] auto generate_transactions(const GeneratorOptions& options,
                                         const LoggerPtr& logger)
    -> Result<std::vector<std::filesystem::path>>;

}  // namespace tabula::fixtures
