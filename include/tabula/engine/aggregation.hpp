#pragma once

#include <tabula/core/error.hpp>
#include <tabula/engine/dataset.hpp>
#include <tabula/engine/group_by.hpp>

#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tabula {

/// Declarative description of one named grouped summary.
struct ViewSpec {
    std::string name;
    std::vector<std::string> group_keys;
    std::vector<AggSpec> reducers;
    /// Explicit output ordering; empty leaves row order unspecified.
    std::vector<std::string> order_by;
    /// When non-empty the view exists only if the input has this column.
    std::string condition_column;
};

/// The fixed view catalogue, in output order:
/// sales_by_category, sales_by_date, product_performance, payment_analysis,
/// gift_analysis.
[[nodiscard]] auto default_views() -> const std::vector<ViewSpec>&;

/// Views of `catalogue` whose condition column (if any) is among `columns`.
[[nodiscard]] auto applicable_views(std::span<const ViewSpec> catalogue,
                                    const std::vector<std::string>& columns)
    -> std::vector<const ViewSpec*>;

struct AggregationView {
    std::string name;
    Dataset data;
};

/// Views in catalogue order.
using ViewSet = std::vector<AggregationView>;

[[nodiscard]] auto find_view(const ViewSet& views, std::string_view name)
    -> const AggregationView*;

/// Single-table evaluation of one view: group, reduce, then apply order_by.
[[nodiscard]] auto aggregate_table(const Table& table, const ViewSpec& view) -> Result<Table>;

/// Computes the named summaries of a normalized dataset.
///
/// Fails with MissingColumnError when a view's key or reduced column is
/// absent; conditional views whose condition column is absent are skipped.
class AggregationEngine {
   public:
    virtual ~AggregationEngine() = default;

    [[nodiscard]] virtual auto aggregate(const Dataset& dataset) -> Result<ViewSet> = 0;
};

}  // namespace tabula
