#include <tabula/engine/group_by.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <functional>
#include <limits>
#include <numeric>
#include <type_traits>
#include <variant>

namespace tabula {

namespace {

/// `total += value` unless the result leaves the int64 range.
auto add_checked(std::int64_t& total, std::int64_t value) -> bool {
    constexpr auto hi = std::numeric_limits<std::int64_t>::max();
    constexpr auto lo = std::numeric_limits<std::int64_t>::min();
    if ((value > 0 && total > hi - value) || (value < 0 && total < lo - value)) {
        return false;
    }
    total += value;
    return true;
}

auto sum_overflow(const std::string& column) -> std::unexpected<Error> {
    return make_error(ErrorKind::TypeCoercion,
                      fmt::format("column '{}': integer sum overflows int64", column));
}

auto empty_column(ScalarKind kind) -> ColumnValue {
    switch (kind) {
        case ScalarKind::Int:
            return Column<std::int64_t>{};
        case ScalarKind::Double:
            return Column<double>{};
        case ScalarKind::String:
            return Column<std::string>{};
        case ScalarKind::Date:
            return Column<Date>{};
        case ScalarKind::Timestamp:
            return Column<Timestamp>{};
    }
    return Column<std::string>{};
}

// Null (monostate) appends the type's default value; callers track validity.
void append_scalar(ColumnValue& column, const ScalarValue& value) {
    std::visit(
        [&](auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if (const auto* v = std::get_if<T>(&value)) {
                col.push_back(*v);
            } else {
                col.push_back(T{});
            }
        },
        column);
}

auto is_numeric(ScalarKind kind) -> bool {
    return kind == ScalarKind::Int || kind == ScalarKind::Double;
}

}  // namespace

auto plan_group_by(const Table& table, std::span<const std::string> keys,
                   std::span<const AggSpec> aggregations) -> Result<GroupPlan> {
    GroupPlan plan;
    for (const auto& key : keys) {
        const auto* column = table.find(key);
        if (column == nullptr) {
            return make_error(ErrorKind::MissingColumn,
                              fmt::format("group-by column '{}' not found", key));
        }
        plan.keys.push_back(key);
        plan.key_kinds.push_back(column_kind(*column));
    }
    for (const auto& agg : aggregations) {
        const auto* column = table.find(agg.column);
        if (column == nullptr) {
            return make_error(ErrorKind::MissingColumn,
                              fmt::format("aggregate column '{}' not found", agg.column));
        }
        const auto kind = column_kind(*column);
        if (agg.func != AggFunc::Count && !is_numeric(kind)) {
            return make_error(ErrorKind::TypeCoercion,
                              fmt::format("column '{}': cannot aggregate non-numeric values",
                                          agg.column));
        }
        plan.aggregations.push_back(agg);
        plan.value_kinds.push_back(kind);
    }
    return plan;
}

auto GroupKeyHash::operator()(const GroupKey& key) const -> std::size_t {
    std::size_t seed = 0;
    auto hash_combine = [&](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    };
    for (const auto& value : key.values) {
        std::size_t h = std::visit(
            [](const auto& v) { return std::hash<std::decay_t<decltype(v)>>{}(v); }, value);
        hash_combine(h);
    }
    return seed;
}

GroupState::GroupState(const GroupPlan& plan) : plan_(&plan) {}

auto GroupState::slots_for(const GroupKey& key) -> AggSlot* {
    const std::size_t width = plan_->aggregations.size();
    auto it = index_.find(key);
    if (it == index_.end()) {
        const std::size_t gid = keys_.size();
        index_.emplace(key, gid);
        keys_.push_back(key);
        slots_.resize(slots_.size() + width);
        return slots_.data() + gid * width;
    }
    return slots_.data() + it->second * width;
}

auto GroupState::accumulate(const Table& table) -> Status {
    std::vector<const ColumnEntry*> key_entries;
    for (const auto& key : plan_->keys) {
        const auto* entry = table.find_entry(key);
        if (entry == nullptr) {
            return make_error(ErrorKind::MissingColumn,
                              fmt::format("group-by column '{}' not found", key));
        }
        key_entries.push_back(entry);
    }
    std::vector<const ColumnEntry*> value_entries;
    for (std::size_t i = 0; i < plan_->aggregations.size(); ++i) {
        const auto& agg = plan_->aggregations[i];
        const auto* entry = table.find_entry(agg.column);
        if (entry == nullptr) {
            return make_error(ErrorKind::MissingColumn,
                              fmt::format("aggregate column '{}' not found", agg.column));
        }
        if (agg.func != AggFunc::Count && column_kind(*entry->column) != plan_->value_kinds[i]) {
            return make_error(ErrorKind::TypeCoercion,
                              fmt::format("column '{}' changes type between partitions",
                                          agg.column));
        }
        value_entries.push_back(entry);
    }

    const std::size_t rows = table.rows();
    GroupKey key;
    key.values.resize(key_entries.size());
    for (std::size_t row = 0; row < rows; ++row) {
        for (std::size_t k = 0; k < key_entries.size(); ++k) {
            key.values[k] = scalar_at(*key_entries[k], row);
        }
        AggSlot* slots = slots_for(key);
        for (std::size_t i = 0; i < value_entries.size(); ++i) {
            const auto& agg = plan_->aggregations[i];
            AggSlot& slot = slots[i];
            if (agg.func == AggFunc::Count) {
                slot.count += 1;
                continue;
            }
            const ColumnEntry& entry = *value_entries[i];
            if (is_null(entry, row)) {
                continue;
            }
            if (const auto* ints = std::get_if<Column<std::int64_t>>(entry.column.get())) {
                if (!add_checked(slot.int_value, (*ints)[row])) {
                    return sum_overflow(agg.column);
                }
                slot.double_value += static_cast<double>((*ints)[row]);
            } else {
                slot.double_value += std::get<Column<double>>(*entry.column)[row];
            }
            slot.count += 1;
        }
    }
    return {};
}

auto GroupState::merge(const GroupState& other) -> Status {
    const std::size_t width = plan_->aggregations.size();
    for (std::size_t g = 0; g < other.keys_.size(); ++g) {
        AggSlot* slots = slots_for(other.keys_[g]);
        const AggSlot* theirs = other.slots_.data() + g * width;
        for (std::size_t i = 0; i < width; ++i) {
            slots[i].count += theirs[i].count;
            if (!add_checked(slots[i].int_value, theirs[i].int_value)) {
                return sum_overflow(plan_->aggregations[i].column);
            }
            slots[i].double_value += theirs[i].double_value;
        }
    }
    return {};
}

auto GroupState::split(std::size_t buckets) const -> std::vector<GroupState> {
    buckets = std::max<std::size_t>(1, buckets);
    std::vector<GroupState> out(buckets, GroupState(*plan_));
    const std::size_t width = plan_->aggregations.size();
    GroupKeyHash hasher;
    for (std::size_t g = 0; g < keys_.size(); ++g) {
        GroupState& target = out[hasher(keys_[g]) % buckets];
        AggSlot* slots = target.slots_for(keys_[g]);
        std::copy_n(slots_.data() + g * width, width, slots);
    }
    return out;
}

auto GroupState::finalize() const -> Table {
    Table output;
    const std::size_t width = plan_->aggregations.size();
    const std::size_t groups = keys_.size();

    for (std::size_t k = 0; k < plan_->keys.size(); ++k) {
        ColumnValue column = empty_column(plan_->key_kinds[k]);
        std::vector<bool> validity(groups, true);
        bool has_null = false;
        for (std::size_t g = 0; g < groups; ++g) {
            const auto& value = keys_[g].values[k];
            if (std::holds_alternative<std::monostate>(value)) {
                validity[g] = false;
                has_null = true;
            }
            append_scalar(column, value);
        }
        if (has_null) {
            output.add_column(plan_->keys[k], std::move(column), std::move(validity));
        } else {
            output.add_column(plan_->keys[k], std::move(column));
        }
    }

    for (std::size_t i = 0; i < width; ++i) {
        const auto& agg = plan_->aggregations[i];
        switch (agg.func) {
            case AggFunc::Count: {
                Column<std::int64_t> counts;
                counts.reserve(groups);
                for (std::size_t g = 0; g < groups; ++g) {
                    counts.push_back(slots_[g * width + i].count);
                }
                output.add_column(agg.alias, std::move(counts));
                break;
            }
            case AggFunc::Mean: {
                Column<double> means;
                means.reserve(groups);
                for (std::size_t g = 0; g < groups; ++g) {
                    const AggSlot& slot = slots_[g * width + i];
                    means.push_back(slot.count == 0
                                        ? 0.0
                                        : slot.double_value / static_cast<double>(slot.count));
                }
                output.add_column(agg.alias, std::move(means));
                break;
            }
            case AggFunc::Sum: {
                if (plan_->value_kinds[i] == ScalarKind::Int) {
                    Column<std::int64_t> sums;
                    sums.reserve(groups);
                    for (std::size_t g = 0; g < groups; ++g) {
                        sums.push_back(slots_[g * width + i].int_value);
                    }
                    output.add_column(agg.alias, std::move(sums));
                } else {
                    Column<double> sums;
                    sums.reserve(groups);
                    for (std::size_t g = 0; g < groups; ++g) {
                        sums.push_back(slots_[g * width + i].double_value);
                    }
                    output.add_column(agg.alias, std::move(sums));
                }
                break;
            }
        }
    }
    return output;
}

auto sort_table(const Table& table, std::span<const std::string> keys) -> Result<Table> {
    std::vector<const ColumnEntry*> entries;
    for (const auto& key : keys) {
        const auto* entry = table.find_entry(key);
        if (entry == nullptr) {
            return make_error(ErrorKind::MissingColumn,
                              fmt::format("order-by column '{}' not found", key));
        }
        entries.push_back(entry);
    }
    std::vector<std::size_t> order(table.rows());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::ranges::stable_sort(order, [&](std::size_t a, std::size_t b) {
        for (const auto* entry : entries) {
            auto lhs = scalar_at(*entry, a);
            auto rhs = scalar_at(*entry, b);
            if (lhs < rhs) {
                return true;
            }
            if (rhs < lhs) {
                return false;
            }
        }
        return false;
    });
    return take_rows(table, order);
}

}  // namespace tabula
