#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/table.hpp>

#include <robin_hood.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace tabula {

enum class AggFunc : std::uint8_t {
    Sum,
    Count,
    Mean,
};

/// One reducer: `func(column)` written to the output column `alias`.
struct AggSpec {
    AggFunc func = AggFunc::Sum;
    std::string column;
    std::string alias;
};

/// Grouping keys and reducers resolved against a concrete column set.
struct GroupPlan {
    std::vector<std::string> keys;
    std::vector<ScalarKind> key_kinds;
    std::vector<AggSpec> aggregations;
    std::vector<ScalarKind> value_kinds;
};

/// Fails with MissingColumnError when a key or reduced column is absent, and
/// with TypeCoercionError when sum or mean targets a non-numeric column.
[[nodiscard]] auto plan_group_by(const Table& table, std::span<const std::string> keys,
                                 std::span<const AggSpec> aggregations) -> Result<GroupPlan>;

struct GroupKey {
    std::vector<ScalarValue> values;
};

struct GroupKeyHash {
    auto operator()(const GroupKey& key) const -> std::size_t;
};

struct GroupKeyEq {
    auto operator()(const GroupKey& a, const GroupKey& b) const -> bool {
        return a.values == b.values;
    }
};

/// Running accumulator for one reducer of one group. Mean keeps sum and count
/// so partial states merge exactly.
struct AggSlot {
    std::int64_t count = 0;
    std::int64_t int_value = 0;
    double double_value = 0.0;
};

/// Partial aggregation state: groups in first-appearance order, each with one
/// AggSlot per reducer of the plan.
///
/// Null key values form their own group. Sum and mean skip null inputs;
/// count counts rows.
class GroupState {
   public:
    explicit GroupState(const GroupPlan& plan);

    /// Fold every row of `table` into the state. An integer sum that leaves
    /// the int64 range fails with TypeCoercionError.
    [[nodiscard]] auto accumulate(const Table& table) -> Status;

    /// Fold another partial state (built from the same plan) into this one.
    /// Fails like accumulate on integer overflow.
    [[nodiscard]] auto merge(const GroupState& other) -> Status;

    /// Hash-partition the groups into `buckets` states; group g lands in
    /// bucket `hash(g) % buckets`.
    [[nodiscard]] auto split(std::size_t buckets) const -> std::vector<GroupState>;

    /// One output row per group: key columns, then one column per reducer.
    [[nodiscard]] auto finalize() const -> Table;

    [[nodiscard]] auto groups() const noexcept -> std::size_t { return keys_.size(); }

   private:
    auto slots_for(const GroupKey& key) -> AggSlot*;

    const GroupPlan* plan_;
    robin_hood::unordered_flat_map<GroupKey, std::size_t, GroupKeyHash, GroupKeyEq> index_;
    std::vector<GroupKey> keys_;
    std::vector<AggSlot> slots_;
};

/// Stable sort of rows ascending by `keys`; nulls sort first.
[[nodiscard]] auto sort_table(const Table& table, std::span<const std::string> keys)
    -> Result<Table>;

}  // namespace tabula
