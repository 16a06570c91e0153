#include <tabula/core/schema.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <unordered_set>

namespace tabula::schema {

namespace {

constexpr std::array kFields = {
    Field{"transaction_id", ScalarKind::String, Presence::Required},
    Field{"timestamp", ScalarKind::Timestamp, Presence::Required},
    Field{"category", ScalarKind::String, Presence::Required},
    Field{"product_name", ScalarKind::String, Presence::Required},
    Field{"price", ScalarKind::Double, Presence::Required},
    Field{"quantity", ScalarKind::Int, Presence::Required},
    Field{"rating", ScalarKind::Double, Presence::Optional},
    Field{"is_gift", ScalarKind::Int, Presence::Optional},
    Field{"payment_method", ScalarKind::String, Presence::Optional},
    Field{"customer_id", ScalarKind::String, Presence::Optional},
    Field{"product_id", ScalarKind::String, Presence::Optional},
    Field{"tags", ScalarKind::String, Presence::Optional},
    Field{"shipping_address_street", ScalarKind::String, Presence::Optional},
    Field{"shipping_address_city", ScalarKind::String, Presence::Optional},
    Field{"shipping_address_state", ScalarKind::String, Presence::Optional},
    Field{"shipping_address_zip_code", ScalarKind::String, Presence::Optional},
    Field{"shipping_address_country", ScalarKind::String, Presence::Optional},
    Field{"date", ScalarKind::Date, Presence::Derived},
    Field{"year", ScalarKind::Int, Presence::Derived},
    Field{"month", ScalarKind::Int, Presence::Derived},
    Field{"day", ScalarKind::Int, Presence::Derived},
    Field{"day_of_week", ScalarKind::Int, Presence::Derived},
    Field{"total_price", ScalarKind::Double, Presence::Derived},
};

}  // namespace

auto find_field(std::string_view name) -> const Field* {
    auto it = std::ranges::find(kFields, name, &Field::name);
    return it == kFields.end() ? nullptr : &*it;
}

auto validate_columns(const std::vector<std::string>& names, std::string_view origin) -> Status {
    std::unordered_set<std::string_view> seen;
    std::vector<std::string_view> unknown;
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            return make_error(ErrorKind::SchemaMismatch,
                              fmt::format("{}: duplicate column '{}'", origin, name));
        }
        if (find_field(name) == nullptr) {
            unknown.emplace_back(name);
        }
    }
    if (!unknown.empty()) {
        return make_error(ErrorKind::SchemaMismatch,
                          fmt::format("{}: unknown column(s) {}", origin, fmt::join(unknown, ", ")));
    }
    for (const auto& field : kFields) {
        if (field.presence == Presence::Required && !seen.contains(field.name)) {
            return make_error(ErrorKind::SchemaMismatch,
                              fmt::format("{}: required column '{}' is missing", origin,
                                          field.name));
        }
    }
    return {};
}

auto same_column_set(const std::vector<std::string>& lhs, const std::vector<std::string>& rhs)
    -> bool {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    auto a = lhs;
    auto b = rhs;
    std::ranges::sort(a);
    std::ranges::sort(b);
    return a == b;
}

}  // namespace tabula::schema
