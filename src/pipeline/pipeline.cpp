#include <tabula/fixtures/generator.hpp>
#include <tabula/fixtures/json_flatten.hpp>
#include <tabula/pipeline/pipeline.hpp>

#include <fmt/format.h>

#include <chrono>
#include <exception>
#include <functional>
#include <string>
#include <system_error>

namespace tabula::pipeline {

namespace fs = std::filesystem;

namespace {

auto fail(Stage stage, Error error) -> std::unexpected<StageError> {
    return std::unexpected(StageError{.stage = stage, .error = std::move(error)});
}

using StepResult = std::expected<void, std::string>;

auto seconds_since(std::chrono::steady_clock::time_point start) -> double {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

auto run_step(const std::string& name, const LoggerPtr& logger,
              const std::function<StepResult()>& step) -> bool {
    logger->info("Starting step: {}", name);
    const auto start = std::chrono::steady_clock::now();
    StepResult result;
    try {
        result = step();
    } catch (const std::exception& e) {
        result = std::unexpected(std::string(e.what()));
    }
    if (!result) {
        logger->error("Error in step {}: {}", name, result.error());
        return false;
    }
    logger->info("Completed step: {} in {:.2f} seconds", name, seconds_since(start));
    return true;
}

}  // namespace

auto run_transform(Backend& backend, const std::vector<fs::path>& inputs,
                   const fs::path& output_dir) -> std::expected<TransformSummary, StageError> {
    auto loaded = backend.source->load(inputs);
    if (!loaded) {
        return fail(Stage::Load, std::move(loaded.error()));
    }
    auto cleaned = backend.normalizer->normalize(*loaded);
    if (!cleaned) {
        return fail(Stage::Normalize, std::move(cleaned.error()));
    }

    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return fail(Stage::Persist,
                    Error{.kind = ErrorKind::Io,
                          .message = fmt::format("cannot create output directory {}: {}",
                                                 output_dir.string(), ec.message())});
    }

    TransformSummary summary;
    summary.rows = cleaned->rows();
    const fs::path cleaned_file = output_dir / "cleaned_data.csv";
    if (auto saved = backend.sink->persist("cleaned data", *cleaned, cleaned_file); !saved) {
        return fail(Stage::Persist, std::move(saved.error()));
    }
    summary.artifacts.push_back(cleaned_file);

    auto views = backend.aggregator->aggregate(*cleaned);
    if (!views) {
        return fail(Stage::Aggregate, std::move(views.error()));
    }
    for (const auto& view : *views) {
        const fs::path target = output_dir / (view.name + ".csv");
        if (auto saved = backend.sink->persist(view.name, view.data, target); !saved) {
            return fail(Stage::Persist, std::move(saved.error()));
        }
        summary.artifacts.push_back(target);
    }
    summary.views = views->size();
    return summary;
}

auto transform_output_dir(const PipelineConfig& config, BackendKind kind) -> fs::path {
    if (kind == BackendKind::Distributed) {
        return fs::path(config.curated_data_dir.string() + "_distributed");
    }
    return config.curated_data_dir;
}

auto run_pipeline(const PipelineConfig& config, const RunOptions& options,
                  const LoggerPtr& logger) -> bool {
    const BackendKind kind = options.backend.value_or(config.backend);
    const std::size_t workers = options.workers.value_or(config.workers);

    const auto pipeline_start = std::chrono::steady_clock::now();
    logger->info("Starting data processing pipeline");

    if (options.skip_generate) {
        logger->info("Skipping step: Data Generation");
    } else {
        const bool generated = run_step("Data Generation", logger, [&]() -> StepResult {
            fixtures::GeneratorOptions gen;
            gen.num_files = config.num_files;
            gen.records_per_file = config.records_per_file;
            gen.output_dir = config.raw_data_dir;
            gen.seed = config.seed;
            auto files = fixtures::generate_transactions(gen, logger);
            if (!files) {
                return std::unexpected(files.error().format());
            }
            return {};
        });
        if (!generated) {
            logger->error("Pipeline failed at data generation step");
            return false;
        }
    }

    const bool converted = run_step("JSON to CSV Conversion", logger, [&]() -> StepResult {
        auto files =
            fixtures::convert_directory(config.raw_data_dir, config.processed_data_dir, logger);
        if (!files) {
            return std::unexpected(files.error().format());
        }
        return {};
    });
    if (!converted) {
        logger->error("Pipeline failed at JSON to CSV conversion step");
        return false;
    }

    const std::string step_name = kind == BackendKind::Distributed
                                      ? "Data Transformation (distributed)"
                                      : "Data Transformation";
    const bool transformed = run_step(step_name, logger, [&]() -> StepResult {
        EngineOptions engine;
        engine.logger = logger;
        const fs::path output_dir = transform_output_dir(config, kind);
        std::expected<TransformSummary, StageError> summary;
        if (kind == BackendKind::Distributed) {
            // Held for the whole transform; joined on every exit path.
            ComputeContext context(ComputeOptions{.workers = workers}, logger);
            auto backend = make_distributed_backend(context, std::move(engine));
            summary = run_transform(backend, {config.processed_data_dir}, output_dir);
        } else {
            auto backend = make_local_backend(std::move(engine));
            summary = run_transform(backend, {config.processed_data_dir}, output_dir);
        }
        if (!summary) {
            return std::unexpected(summary.error().format());
        }
        logger->info("Data processing completed successfully: {} records, {} views written to {}",
                     summary->rows, summary->views, output_dir.string());
        return {};
    });
    if (!transformed) {
        logger->error("Pipeline failed at data transformation step");
        return false;
    }

    logger->info("Pipeline completed successfully in {:.2f} seconds",
                 seconds_since(pipeline_start));
    return true;
}

}  // namespace tabula::pipeline
