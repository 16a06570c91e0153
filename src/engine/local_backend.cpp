#include <tabula/engine/backend.hpp>

#include <memory>

namespace tabula {

namespace {

namespace fs = std::filesystem;

class LocalRowSource final : public RowSource {
   public:
    LocalRowSource(io::CsvReadOptions options, LoggerPtr logger)
        : options_(std::move(options)), logger_(std::move(logger)) {}

    auto load(const std::vector<fs::path>& locations) -> Result<Dataset> override {
        auto files = resolve_locations(locations);
        if (!files) {
            return std::unexpected(std::move(files.error()));
        }
        logger_->info("Found {} CSV files to load", files->size());

        std::vector<Table> tables;
        tables.reserve(files->size());
        for (const auto& file : *files) {
            logger_->debug("Loading {}", file.string());
            auto table = read_partition(file, options_);
            if (!table) {
                return std::unexpected(std::move(table.error()));
            }
            if (!tables.empty()) {
                auto same = check_same_schema(tables.front(), files->front(), *table, file);
                if (!same) {
                    return std::unexpected(std::move(same.error()));
                }
            }
            tables.push_back(std::move(*table));
        }

        Table combined = concat_tables(tables);
        logger_->info("Loaded {} CSV files with {} total records", files->size(), combined.rows());
        return Dataset(std::move(combined));
    }

   private:
    io::CsvReadOptions options_;
    LoggerPtr logger_;
};

class LocalNormalizer final : public Normalizer {
   public:
    explicit LocalNormalizer(LoggerPtr logger) : logger_(std::move(logger)) {}

    auto normalize(const Dataset& dataset) -> Result<Dataset> override {
        auto cleaned = normalize_table(dataset.collect());
        if (!cleaned) {
            return std::unexpected(std::move(cleaned.error()));
        }
        logger_->info("Cleaned data: {} records", cleaned->rows());
        return Dataset(std::move(*cleaned));
    }

   private:
    LoggerPtr logger_;
};

class LocalAggregationEngine final : public AggregationEngine {
   public:
    LocalAggregationEngine(std::vector<ViewSpec> views, LoggerPtr logger)
        : views_(std::move(views)), logger_(std::move(logger)) {}

    auto aggregate(const Dataset& dataset) -> Result<ViewSet> override {
        const Table table = dataset.collect();
        ViewSet result;
        for (const auto* view : applicable_views(views_, table.column_names())) {
            logger_->info("Creating {} aggregation", view->name);
            auto summary = aggregate_table(table, *view);
            if (!summary) {
                return std::unexpected(std::move(summary.error()));
            }
            result.push_back(AggregationView{.name = view->name,
                                             .data = Dataset(std::move(*summary))});
        }
        logger_->info("Created {} aggregation views", result.size());
        return result;
    }

   private:
    std::vector<ViewSpec> views_;
    LoggerPtr logger_;
};

class LocalSink final : public Sink {
   public:
    LocalSink(io::CsvWriteOptions options, LoggerPtr logger)
        : options_(options), logger_(std::move(logger)) {}

    auto persist(std::string_view name, const Dataset& dataset, const fs::path& target)
        -> Status override {
        auto rows = io::write_csv(dataset.collect(), target, options_);
        if (!rows) {
            return std::unexpected(std::move(rows.error()));
        }
        logger_->info("Saved {} to {}", name, target.string());
        return {};
    }

   private:
    io::CsvWriteOptions options_;
    LoggerPtr logger_;
};

}  // namespace

auto make_local_backend(EngineOptions options) -> Backend {
    auto logger = or_null(std::move(options.logger));
    Backend backend;
    backend.kind = BackendKind::Local;
    backend.source = std::make_unique<LocalRowSource>(std::move(options.csv_read), logger);
    backend.normalizer = std::make_unique<LocalNormalizer>(logger);
    backend.aggregator =
        std::make_unique<LocalAggregationEngine>(std::move(options.views), logger);
    backend.sink = std::make_unique<LocalSink>(options.csv_write, logger);
    return backend;
}

}  // namespace tabula
