#include <tabula/core/schema.hpp>
#include <tabula/engine/aggregation.hpp>

#include <algorithm>

namespace tabula {

namespace {

auto sum(const char* column) -> AggSpec {
    return AggSpec{.func = AggFunc::Sum, .column = column, .alias = column};
}

auto num_transactions() -> AggSpec {
    return AggSpec{
        .func = AggFunc::Count, .column = schema::kTransactionId, .alias = "num_transactions"};
}

auto build_catalogue() -> std::vector<ViewSpec> {
    std::vector<ViewSpec> views;
    views.push_back(ViewSpec{
        .name = "sales_by_category",
        .group_keys = {schema::kCategory},
        .reducers = {sum(schema::kTotalPrice), sum(schema::kQuantity), num_transactions()},
    });
    views.push_back(ViewSpec{
        .name = "sales_by_date",
        .group_keys = {schema::kDate},
        .reducers = {sum(schema::kTotalPrice), sum(schema::kQuantity), num_transactions()},
        .order_by = {schema::kDate},
    });
    views.push_back(ViewSpec{
        .name = "product_performance",
        .group_keys = {schema::kCategory, schema::kProductName},
        .reducers = {sum(schema::kTotalPrice), sum(schema::kQuantity), num_transactions(),
                     AggSpec{.func = AggFunc::Mean, .column = schema::kRating,
                             .alias = "avg_rating"}},
    });
    views.push_back(ViewSpec{
        .name = "payment_analysis",
        .group_keys = {schema::kPaymentMethod},
        .reducers = {sum(schema::kTotalPrice), num_transactions()},
        .condition_column = schema::kPaymentMethod,
    });
    views.push_back(ViewSpec{
        .name = "gift_analysis",
        .group_keys = {schema::kCategory, schema::kIsGift},
        .reducers = {sum(schema::kTotalPrice), num_transactions()},
        .condition_column = schema::kIsGift,
    });
    return views;
}

}  // namespace

auto default_views() -> const std::vector<ViewSpec>& {
    static const std::vector<ViewSpec> catalogue = build_catalogue();
    return catalogue;
}

auto applicable_views(std::span<const ViewSpec> catalogue, const std::vector<std::string>& columns)
    -> std::vector<const ViewSpec*> {
    std::vector<const ViewSpec*> out;
    for (const auto& view : catalogue) {
        if (view.condition_column.empty() ||
            std::ranges::find(columns, view.condition_column) != columns.end()) {
            out.push_back(&view);
        }
    }
    return out;
}

auto find_view(const ViewSet& views, std::string_view name) -> const AggregationView* {
    auto it = std::ranges::find_if(views, [&](const auto& v) { return v.name == name; });
    return it == views.end() ? nullptr : &*it;
}

auto aggregate_table(const Table& table, const ViewSpec& view) -> Result<Table> {
    auto plan = plan_group_by(table, view.group_keys, view.reducers);
    if (!plan) {
        return std::unexpected(std::move(plan.error()));
    }
    GroupState state(*plan);
    if (auto status = state.accumulate(table); !status) {
        return std::unexpected(std::move(status.error()));
    }
    Table result = state.finalize();
    if (view.order_by.empty()) {
        return result;
    }
    return sort_table(result, view.order_by);
}

}  // namespace tabula
