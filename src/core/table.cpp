#include <tabula/core/table.hpp>

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace tabula {

namespace {

template <typename ColType>
auto widen_to_double(const ColType& col) -> Column<double> {
    Column<double> out;
    out.reserve(col.size());
    for (const auto& v : col) {
        if constexpr (std::is_same_v<ColType, Column<std::int64_t>>) {
            out.push_back(static_cast<double>(v));
        } else {
            out.push_back(v);
        }
    }
    return out;
}

auto as_text_column(const ColumnEntry& entry) -> Column<std::string> {
    const std::size_t n = column_size(*entry.column);
    Column<std::string> out;
    out.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        out.push_back(format_scalar(scalar_at(entry, row)));
    }
    return out;
}

}  // namespace

void Table::add_column(std::string name, ColumnValue column) {
    if (auto it = index.find(name); it != index.end()) {
        // Reseat the shared_ptr rather than mutating shared data (copy-on-write).
        columns[it->second].column = std::make_shared<ColumnValue>(std::move(column));
        columns[it->second].validity.reset();
        return;
    }
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name),
                                  .column = std::make_shared<ColumnValue>(std::move(column)),
                                  .validity = std::nullopt});
    index[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    std::string key = name;
    add_column(std::move(name), std::move(column));
    columns[index.at(key)].validity = std::move(validity);
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return columns[it->second].column.get();
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::has_column(const std::string& name) const -> bool {
    return index.contains(name);
}

auto Table::column_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(columns.size());
    for (const auto& entry : columns) {
        names.push_back(entry.name);
    }
    return names;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return 0;
    }
    return column_size(*columns.front().column);
}

auto column_size(const ColumnValue& column) -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto column_kind(const ColumnValue& column) -> ScalarKind {
    if (std::holds_alternative<Column<std::int64_t>>(column)) {
        return ScalarKind::Int;
    }
    if (std::holds_alternative<Column<double>>(column)) {
        return ScalarKind::Double;
    }
    if (std::holds_alternative<Column<Date>>(column)) {
        return ScalarKind::Date;
    }
    if (std::holds_alternative<Column<Timestamp>>(column)) {
        return ScalarKind::Timestamp;
    }
    return ScalarKind::String;
}

auto make_empty_like(const ColumnValue& column) -> ColumnValue {
    return std::visit([](const auto& col) -> ColumnValue { return std::decay_t<decltype(col)>{}; },
                      column);
}

auto scalar_at(const ColumnEntry& entry, std::size_t row) -> ScalarValue {
    if (is_null(entry, row)) {
        return std::monostate{};
    }
    return std::visit([row](const auto& col) -> ScalarValue { return col[row]; }, *entry.column);
}

auto format_scalar(const ScalarValue& value) -> std::string {
    return std::visit(
        [](const auto& v) -> std::string {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return {};
            } else if constexpr (std::is_same_v<T, std::string>) {
                return v;
            } else if constexpr (std::is_same_v<T, Date>) {
                return format_date(v);
            } else if constexpr (std::is_same_v<T, Timestamp>) {
                return format_timestamp(v);
            } else if constexpr (std::is_same_v<T, double>) {
                if (std::isnan(v))
                    return "nan";
                if (std::isinf(v))
                    return v > 0 ? "inf" : "-inf";
                return fmt::format("{}", v);
            } else {
                return fmt::format("{}", v);
            }
        },
        value);
}

auto take_rows(const Table& table, std::span<const std::size_t> indices) -> Table {
    Table output;
    output.columns.reserve(table.columns.size());
    for (const auto& entry : table.columns) {
        ColumnValue gathered = std::visit(
            [&](const auto& src) -> ColumnValue {
                std::decay_t<decltype(src)> dst;
                dst.reserve(indices.size());
                for (auto i : indices) {
                    dst.push_back(src[i]);
                }
                return dst;
            },
            *entry.column);
        if (entry.validity.has_value()) {
            std::vector<bool> validity;
            validity.reserve(indices.size());
            for (auto i : indices) {
                validity.push_back((*entry.validity)[i]);
            }
            output.add_column(entry.name, std::move(gathered), std::move(validity));
        } else {
            output.add_column(entry.name, std::move(gathered));
        }
    }
    return output;
}

auto concat_tables(std::span<const Table> tables) -> Table {
    if (tables.empty()) {
        return {};
    }
    if (tables.size() == 1) {
        return tables.front();
    }
    const Table& first = tables.front();
    Table output;
    for (const auto& head : first.columns) {
        std::vector<const ColumnEntry*> parts;
        parts.reserve(tables.size());
        bool same_kind = true;
        bool numeric = true;
        bool any_null = false;
        const ScalarKind kind = column_kind(*head.column);
        for (const auto& table : tables) {
            const auto* entry = table.find_entry(head.name);
            if (entry == nullptr || table.columns.size() != first.columns.size()) {
                throw std::invalid_argument("concat: column sets differ at '" + head.name + "'");
            }
            const ScalarKind part_kind = column_kind(*entry->column);
            same_kind = same_kind && part_kind == kind;
            numeric = numeric && (part_kind == ScalarKind::Int || part_kind == ScalarKind::Double);
            any_null = any_null || entry->validity.has_value();
            parts.push_back(entry);
        }

        ColumnValue merged;
        if (same_kind) {
            merged = make_empty_like(*head.column);
            std::visit(
                [&](auto& dst) {
                    using ColType = std::decay_t<decltype(dst)>;
                    for (const auto* part : parts) {
                        dst.append(std::get<ColType>(*part->column));
                    }
                },
                merged);
        } else if (numeric) {
            Column<double> dst;
            for (const auto* part : parts) {
                std::visit(
                    [&](const auto& src) {
                        using ColType = std::decay_t<decltype(src)>;
                        if constexpr (std::is_same_v<ColType, Column<std::int64_t>> ||
                                      std::is_same_v<ColType, Column<double>>) {
                            dst.append(widen_to_double(src));
                        }
                    },
                    *part->column);
            }
            merged = std::move(dst);
        } else {
            Column<std::string> dst;
            for (const auto* part : parts) {
                dst.append(as_text_column(*part));
            }
            merged = std::move(dst);
        }

        if (any_null) {
            std::vector<bool> validity;
            for (const auto* part : parts) {
                const std::size_t n = column_size(*part->column);
                if (part->validity.has_value()) {
                    validity.insert(validity.end(), part->validity->begin(),
                                    part->validity->end());
                } else {
                    validity.insert(validity.end(), n, true);
                }
            }
            output.add_column(head.name, std::move(merged), std::move(validity));
        } else {
            output.add_column(head.name, std::move(merged));
        }
    }
    return output;
}

}  // namespace tabula
