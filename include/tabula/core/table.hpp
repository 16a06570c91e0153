#pragma once

#include <tabula/core/column.hpp>
#include <tabula/core/time.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tabula {

enum class ScalarKind : std::uint8_t {
    Int,
    Double,
    String,
    Date,
    Timestamp,
};

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>,
                                 Column<Date>, Column<Timestamp>>;

/// One cell. std::monostate is null.
using ScalarValue =
    std::variant<std::monostate, std::int64_t, double, std::string, Date, Timestamp>;

struct ColumnEntry {
    std::string name;
    std::shared_ptr<ColumnValue> column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid.
    std::optional<std::vector<bool>> validity;
};

/// Returns true if row `row` of `entry` is null.
[[nodiscard]] inline auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    return entry.validity.has_value() && !(*entry.validity)[row];
}

/// Column-major table: ordered, uniquely named columns of equal length.
///
/// Column storage is shared between copies; add_column() reseats a column
/// instead of mutating shared data, so a copied Table never aliases writes.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;

    /// Append a column, or replace an existing one in place (position kept).
    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto has_column(const std::string& name) const -> bool;
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
};

[[nodiscard]] auto column_size(const ColumnValue& column) -> std::size_t;
[[nodiscard]] auto column_kind(const ColumnValue& column) -> ScalarKind;
[[nodiscard]] auto make_empty_like(const ColumnValue& column) -> ColumnValue;

/// Cell value at `row`, honouring the validity bitmap.
[[nodiscard]] auto scalar_at(const ColumnEntry& entry, std::size_t row) -> ScalarValue;

/// Text rendering used by the delimited writer: nulls are empty, doubles use the
/// shortest representation that round-trips.
[[nodiscard]] auto format_scalar(const ScalarValue& value) -> std::string;

/// Rows selected by `indices`, in that order.
[[nodiscard]] auto take_rows(const Table& table, std::span<const std::size_t> indices) -> Table;

/// Row-wise concatenation of tables that share a column set (column order of the
/// first table wins). Int and double columns meeting in one output column are
/// widened to double; any other type disagreement falls back to text.
/// Throws std::invalid_argument when the column sets differ.
[[nodiscard]] auto concat_tables(std::span<const Table> tables) -> Table;

}  // namespace tabula
