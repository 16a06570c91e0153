#include <tabula/engine/backend.hpp>

#include <memory>
#include <optional>

namespace tabula {

namespace {

namespace fs = std::filesystem;

// Same columns, laid out in `names` order.
auto align_columns(const Table& table, const std::vector<std::string>& names) -> Table {
    Table out;
    out.columns.reserve(names.size());
    for (const auto& name : names) {
        const auto* entry = table.find_entry(name);
        out.index.emplace(name, out.columns.size());
        out.columns.push_back(*entry);
    }
    return out;
}

class DistributedRowSource final : public RowSource {
   public:
    DistributedRowSource(ComputeContext& context, io::CsvReadOptions options, LoggerPtr logger)
        : context_(context), options_(std::move(options)), logger_(std::move(logger)) {}

    auto load(const std::vector<fs::path>& locations) -> Result<Dataset> override {
        auto files = resolve_locations(locations);
        if (!files) {
            return std::unexpected(std::move(files.error()));
        }
        logger_->info("Found {} CSV files to load", files->size());

        std::vector<Table> partitions(files->size());
        auto status = context_.run_tasks(files->size(), [&](std::size_t i) -> Status {
            logger_->debug("Loading {} as partition {}", (*files)[i].string(), i);
            auto table = read_partition((*files)[i], options_);
            if (!table) {
                return std::unexpected(std::move(table.error()));
            }
            partitions[i] = std::move(*table);
            return {};
        });
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }

        const auto names = partitions.front().column_names();
        for (std::size_t i = 1; i < partitions.size(); ++i) {
            auto same = check_same_schema(partitions.front(), files->front(), partitions[i],
                                          (*files)[i]);
            if (!same) {
                return std::unexpected(std::move(same.error()));
            }
            partitions[i] = align_columns(partitions[i], names);
        }

        Dataset dataset(std::move(partitions));
        logger_->info("Loaded {} CSV files with {} total records", files->size(), dataset.rows());
        return dataset;
    }

   private:
    ComputeContext& context_;
    io::CsvReadOptions options_;
    LoggerPtr logger_;
};

class DistributedNormalizer final : public Normalizer {
   public:
    DistributedNormalizer(ComputeContext& context, LoggerPtr logger)
        : context_(context), logger_(std::move(logger)) {}

    auto normalize(const Dataset& dataset) -> Result<Dataset> override {
        const auto& input = dataset.partitions();
        std::vector<Table> output(input.size());
        auto status = context_.run_tasks(input.size(), [&](std::size_t i) -> Status {
            auto cleaned = normalize_table(input[i]);
            if (!cleaned) {
                return std::unexpected(std::move(cleaned.error()));
            }
            output[i] = std::move(*cleaned);
            return {};
        });
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }
        Dataset cleaned(std::move(output));
        logger_->info("Cleaned data: {} records in {} partitions", cleaned.rows(),
                      cleaned.num_partitions());
        return cleaned;
    }

   private:
    ComputeContext& context_;
    LoggerPtr logger_;
};

/// Map: one partial GroupState per input partition. Shuffle: each partial is
/// hash-split into one bucket per executor. Reduce: buckets merged and
/// finalized in parallel, giving one output partition per bucket.
class DistributedAggregationEngine final : public AggregationEngine {
   public:
    DistributedAggregationEngine(ComputeContext& context, std::vector<ViewSpec> views,
                                 LoggerPtr logger)
        : context_(context), views_(std::move(views)), logger_(std::move(logger)) {}

    auto aggregate(const Dataset& dataset) -> Result<ViewSet> override {
        ViewSet result;
        for (const auto* view : applicable_views(views_, dataset.column_names())) {
            logger_->info("Creating {} aggregation", view->name);
            auto summary = aggregate_view(dataset, *view);
            if (!summary) {
                return std::unexpected(std::move(summary.error()));
            }
            result.push_back(AggregationView{.name = view->name, .data = std::move(*summary)});
        }
        logger_->info("Created {} aggregation views", result.size());
        return result;
    }

   private:
    auto aggregate_view(const Dataset& dataset, const ViewSpec& view) -> Result<Dataset> {
        const auto& parts = dataset.partitions();
        if (parts.empty()) {
            return Dataset{};
        }
        auto plan = plan_group_by(parts.front(), view.group_keys, view.reducers);
        if (!plan) {
            return std::unexpected(std::move(plan.error()));
        }

        std::vector<GroupState> partials(parts.size(), GroupState(*plan));
        auto mapped = context_.run_tasks(
            parts.size(), [&](std::size_t i) -> Status { return partials[i].accumulate(parts[i]); });
        if (!mapped) {
            return std::unexpected(std::move(mapped.error()));
        }

        const std::size_t buckets = context_.workers();
        std::vector<std::vector<GroupState>> shuffled(parts.size());
        auto split = context_.run_tasks(parts.size(), [&](std::size_t i) -> Status {
            shuffled[i] = partials[i].split(buckets);
            return {};
        });
        if (!split) {
            return std::unexpected(std::move(split.error()));
        }

        std::vector<Table> reduced(buckets);
        auto merged = context_.run_tasks(buckets, [&](std::size_t b) -> Status {
            GroupState state(*plan);
            for (const auto& part : shuffled) {
                if (auto status = state.merge(part[b]); !status) {
                    return status;
                }
            }
            reduced[b] = state.finalize();
            return {};
        });
        if (!merged) {
            return std::unexpected(std::move(merged.error()));
        }
        logger_->debug("View {} reduced from {} partitions into {} buckets", view.name,
                       parts.size(), buckets);

        if (view.order_by.empty()) {
            return Dataset(std::move(reduced));
        }
        auto sorted = sort_table(concat_tables(reduced), view.order_by);
        if (!sorted) {
            return std::unexpected(std::move(sorted.error()));
        }
        return Dataset(std::move(*sorted));
    }

    ComputeContext& context_;
    std::vector<ViewSpec> views_;
    LoggerPtr logger_;
};

class DistributedSink final : public Sink {
   public:
    DistributedSink(ComputeContext& context, io::CsvWriteOptions options, LoggerPtr logger)
        : context_(context), options_(options), logger_(std::move(logger)) {}

    auto persist(std::string_view name, const Dataset& dataset, const fs::path& target)
        -> Status override {
        const auto& parts = dataset.partitions();
        std::vector<std::string> chunks(parts.size() + 1);
        if (!parts.empty()) {
            chunks[0] = io::format_csv_header(parts.front(), options_);
        }
        auto status = context_.run_tasks(parts.size(), [&](std::size_t i) -> Status {
            chunks[i + 1] = io::format_csv_rows(parts[i], options_);
            return {};
        });
        if (!status) {
            return status;
        }
        if (auto written = io::write_file_atomic(target, chunks); !written) {
            return written;
        }
        logger_->info("Saved {} to {}", name, target.string());
        return {};
    }

   private:
    ComputeContext& context_;
    io::CsvWriteOptions options_;
    LoggerPtr logger_;
};

}  // namespace

auto make_distributed_backend(ComputeContext& context, EngineOptions options) -> Backend {
    auto logger = or_null(std::move(options.logger));
    Backend backend;
    backend.kind = BackendKind::Distributed;
    backend.source =
        std::make_unique<DistributedRowSource>(context, std::move(options.csv_read), logger);
    backend.normalizer = std::make_unique<DistributedNormalizer>(context, logger);
    backend.aggregator =
        std::make_unique<DistributedAggregationEngine>(context, std::move(options.views), logger);
    backend.sink = std::make_unique<DistributedSink>(context, options.csv_write, logger);
    return backend;
}

}  // namespace tabula
