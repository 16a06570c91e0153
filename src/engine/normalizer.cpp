#include <tabula/core/schema.hpp>
#include <tabula/engine/normalizer.hpp>
#include <tabula/io/csv.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>

namespace tabula {

namespace {

auto coercion_error(std::string_view column, std::string_view value, std::string_view target)
    -> std::unexpected<Error> {
    return make_error(ErrorKind::TypeCoercion,
                      fmt::format("column '{}': cannot convert '{}' to {}", column, value, target));
}

auto missing_value_error(std::string_view column, std::size_t row) -> std::unexpected<Error> {
    return make_error(ErrorKind::TypeCoercion,
                      fmt::format("column '{}': missing value at row {}", column, row));
}

auto require_entry(const Table& table, const char* name) -> Result<const ColumnEntry*> {
    const auto* entry = table.find_entry(name);
    if (entry == nullptr) {
        return make_error(ErrorKind::MissingColumn, fmt::format("column '{}' not found", name));
    }
    return entry;
}

auto integral_double(double v) -> std::optional<std::int64_t> {
    constexpr double kMax = 9.2233720368547748e18;
    if (!std::isfinite(v) || std::trunc(v) != v || v < -kMax || v >= kMax) {
        return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
}

/// Column to double. Nulls become `null_fill` or, without one, an error.
auto to_double_column(const ColumnEntry& entry, std::optional<double> null_fill)
    -> Result<Column<double>> {
    const std::size_t n = column_size(*entry.column);
    Column<double> out;
    out.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        if (is_null(entry, row)) {
            if (!null_fill.has_value()) {
                return missing_value_error(entry.name, row);
            }
            out.push_back(*null_fill);
            continue;
        }
        std::optional<double> value = std::visit(
            [row](const auto& col) -> std::optional<double> {
                using T = typename std::decay_t<decltype(col)>::value_type;
                if constexpr (std::is_same_v<T, double>) {
                    return col[row];
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return static_cast<double>(col[row]);
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return io::parse_double(col[row]);
                } else {
                    return std::nullopt;
                }
            },
            *entry.column);
        if (!value.has_value()) {
            return coercion_error(entry.name, format_scalar(scalar_at(entry, row)), "double");
        }
        out.push_back(*value);
    }
    return out;
}

auto to_int_column(const ColumnEntry& entry) -> Result<Column<std::int64_t>> {
    if (entry.validity.has_value() || !std::holds_alternative<Column<std::int64_t>>(*entry.column)) {
        const std::size_t n = column_size(*entry.column);
        Column<std::int64_t> out;
        out.reserve(n);
        for (std::size_t row = 0; row < n; ++row) {
            if (is_null(entry, row)) {
                return missing_value_error(entry.name, row);
            }
            std::optional<std::int64_t> value = std::visit(
                [row](const auto& col) -> std::optional<std::int64_t> {
                    using T = typename std::decay_t<decltype(col)>::value_type;
                    if constexpr (std::is_same_v<T, std::int64_t>) {
                        return col[row];
                    } else if constexpr (std::is_same_v<T, double>) {
                        return integral_double(col[row]);
                    } else if constexpr (std::is_same_v<T, std::string>) {
                        if (auto parsed = io::parse_int64(col[row])) {
                            return parsed;
                        }
                        if (auto parsed = io::parse_double(col[row])) {
                            return integral_double(*parsed);
                        }
                        return std::nullopt;
                    } else {
                        return std::nullopt;
                    }
                },
                *entry.column);
            if (!value.has_value()) {
                return coercion_error(entry.name, format_scalar(scalar_at(entry, row)),
                                      "integer");
            }
            out.push_back(*value);
        }
        return out;
    }
    return std::get<Column<std::int64_t>>(*entry.column);
}

auto parse_flag(std::string_view text) -> std::optional<std::int64_t> {
    std::string lowered;
    lowered.reserve(text.size());
    for (char ch : text) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
        }
    }
    if (lowered == "true" || lowered == "1") {
        return 1;
    }
    if (lowered == "false" || lowered == "0") {
        return 0;
    }
    return std::nullopt;
}

auto to_flag_column(const ColumnEntry& entry) -> Result<Column<std::int64_t>> {
    const std::size_t n = column_size(*entry.column);
    Column<std::int64_t> out;
    out.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        if (is_null(entry, row)) {
            return missing_value_error(entry.name, row);
        }
        std::optional<std::int64_t> value = std::visit(
            [row](const auto& col) -> std::optional<std::int64_t> {
                using T = typename std::decay_t<decltype(col)>::value_type;
                if constexpr (std::is_same_v<T, std::int64_t>) {
                    return col[row] == 0 || col[row] == 1 ? std::optional{col[row]} : std::nullopt;
                } else if constexpr (std::is_same_v<T, double>) {
                    auto v = integral_double(col[row]);
                    return v == 0 || v == 1 ? v : std::nullopt;
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return parse_flag(col[row]);
                } else {
                    return std::nullopt;
                }
            },
            *entry.column);
        if (!value.has_value()) {
            return coercion_error(entry.name, format_scalar(scalar_at(entry, row)), "boolean");
        }
        out.push_back(*value);
    }
    return out;
}

auto to_timestamp_column(const ColumnEntry& entry) -> Result<Column<Timestamp>> {
    if (!entry.validity.has_value()) {
        if (const auto* ts = std::get_if<Column<Timestamp>>(entry.column.get())) {
            return *ts;
        }
    }
    const std::size_t n = column_size(*entry.column);
    Column<Timestamp> out;
    out.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        if (is_null(entry, row)) {
            return missing_value_error(entry.name, row);
        }
        std::optional<Timestamp> value = std::visit(
            [row](const auto& col) -> std::optional<Timestamp> {
                using T = typename std::decay_t<decltype(col)>::value_type;
                if constexpr (std::is_same_v<T, Timestamp>) {
                    return col[row];
                } else if constexpr (std::is_same_v<T, Date>) {
                    return Timestamp{static_cast<std::int64_t>(col[row].days) * 86'400 *
                                     1'000'000'000LL};
                } else if constexpr (std::is_same_v<T, std::string>) {
                    return parse_timestamp(col[row]);
                } else {
                    return std::nullopt;
                }
            },
            *entry.column);
        if (!value.has_value()) {
            return coercion_error(entry.name, format_scalar(scalar_at(entry, row)), "timestamp");
        }
        out.push_back(*value);
    }
    return out;
}

}  // namespace

auto normalize_table(const Table& input) -> Result<Table> {
    Table output = input;
    const std::size_t rows = input.rows();

    // 1. Calendar fields.
    auto ts_entry = require_entry(input, schema::kTimestamp);
    if (!ts_entry) {
        return std::unexpected(std::move(ts_entry.error()));
    }
    auto timestamps = to_timestamp_column(**ts_entry);
    if (!timestamps) {
        return std::unexpected(std::move(timestamps.error()));
    }
    Column<Date> dates;
    Column<std::int64_t> years;
    Column<std::int64_t> months;
    Column<std::int64_t> days;
    Column<std::int64_t> weekdays;
    dates.reserve(rows);
    years.reserve(rows);
    months.reserve(rows);
    days.reserve(rows);
    weekdays.reserve(rows);
    for (const auto& ts : *timestamps) {
        const auto fields = calendar_fields(ts);
        dates.push_back(fields.date);
        years.push_back(fields.year);
        months.push_back(fields.month);
        days.push_back(fields.day);
        weekdays.push_back(fields.day_of_week);
    }

    // 2. Numeric coercion; 4. missing ratings become 0.
    auto price_entry = require_entry(input, schema::kPrice);
    if (!price_entry) {
        return std::unexpected(std::move(price_entry.error()));
    }
    auto prices = to_double_column(**price_entry, std::nullopt);
    if (!prices) {
        return std::unexpected(std::move(prices.error()));
    }
    auto quantity_entry = require_entry(input, schema::kQuantity);
    if (!quantity_entry) {
        return std::unexpected(std::move(quantity_entry.error()));
    }
    auto quantities = to_int_column(**quantity_entry);
    if (!quantities) {
        return std::unexpected(std::move(quantities.error()));
    }
    Column<double> ratings;
    if (const auto* rating_entry = input.find_entry(schema::kRating)) {
        auto coerced = to_double_column(*rating_entry, 0.0);
        if (!coerced) {
            return std::unexpected(std::move(coerced.error()));
        }
        ratings = std::move(*coerced);
    } else {
        ratings.resize(rows, 0.0);
    }

    // 3. Derived total.
    Column<double> totals;
    totals.reserve(rows);
    for (std::size_t row = 0; row < rows; ++row) {
        totals.push_back((*prices)[row] * static_cast<double>((*quantities)[row]));
    }

    // 5. Gift flag.
    if (const auto* gift_entry = input.find_entry(schema::kIsGift)) {
        auto flags = to_flag_column(*gift_entry);
        if (!flags) {
            return std::unexpected(std::move(flags.error()));
        }
        output.add_column(schema::kIsGift, std::move(*flags));
    }

    output.add_column(schema::kTimestamp, std::move(*timestamps));
    output.add_column(schema::kPrice, std::move(*prices));
    output.add_column(schema::kQuantity, std::move(*quantities));
    output.add_column(schema::kRating, std::move(ratings));
    output.add_column(schema::kDate, std::move(dates));
    output.add_column(schema::kYear, std::move(years));
    output.add_column(schema::kMonth, std::move(months));
    output.add_column(schema::kDay, std::move(days));
    output.add_column(schema::kDayOfWeek, std::move(weekdays));
    output.add_column(schema::kTotalPrice, std::move(totals));
    return output;
}

}  // namespace tabula
