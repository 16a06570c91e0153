#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/table.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace tabula::schema {

// Column names of the transaction record shape.
inline constexpr const char* kTransactionId = "transaction_id";
inline constexpr const char* kCustomerId = "customer_id";
inline constexpr const char* kProductId = "product_id";
inline constexpr const char* kTimestamp = "timestamp";
inline constexpr const char* kCategory = "category";
inline constexpr const char* kProductName = "product_name";
inline constexpr const char* kPrice = "price";
inline constexpr const char* kQuantity = "quantity";
inline constexpr const char* kRating = "rating";
inline constexpr const char* kIsGift = "is_gift";
inline constexpr const char* kPaymentMethod = "payment_method";
inline constexpr const char* kTags = "tags";

// Columns added by normalization.
inline constexpr const char* kDate = "date";
inline constexpr const char* kYear = "year";
inline constexpr const char* kMonth = "month";
inline constexpr const char* kDay = "day";
inline constexpr const char* kDayOfWeek = "day_of_week";
inline constexpr const char* kTotalPrice = "total_price";

enum class Presence : std::uint8_t {
    Required,
    Optional,
    /// Produced by normalization; accepted on input so normalized output reloads.
    Derived,
};

/// One column of the fixed record shape and the type it holds once normalized.
struct Field {
    std::string_view name;
    ScalarKind kind = ScalarKind::String;
    Presence presence = Presence::Optional;
};

[[nodiscard]] auto find_field(std::string_view name) -> const Field*;

/// Checks a header against the record shape: names must be unique, known
/// (case-sensitive) and include every required column.
/// Fails with SchemaMismatchError; `origin` names the input in the message.
[[nodiscard]] auto validate_columns(const std::vector<std::string>& names,
                                    std::string_view origin) -> Status;

/// Order-insensitive column-set equality.
[[nodiscard]] auto same_column_set(const std::vector<std::string>& lhs,
                                   const std::vector<std::string>& rhs) -> bool;

}  // namespace tabula::schema
