#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/logging.hpp>
#include <tabula/engine/backend.hpp>
#include <tabula/pipeline/config.hpp>

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <vector>

namespace tabula::pipeline {

struct TransformSummary {
    std::size_t rows = 0;
    std::size_t views = 0;
    /// Every file written, cleaned data first.
    std::vector<std::filesystem::path> artifacts;
};

/// Load, normalize, aggregate and persist with one backend.
///
/// Writes `cleaned_data.csv` and one `<view>.csv` per view into `output_dir`,
/// creating it if needed. Stops at the first failing stage; files already
/// written stay on disk.
[[nodiscard]] auto run_transform(Backend& backend,
                                 const std::vector<std::filesystem::path>& inputs,
                                 const std::filesystem::path& output_dir)
    -> std::expected<TransformSummary, StageError>;

/// Where a transform with `kind` writes: the curated directory, with a
/// `_distributed` suffix for the distributed backend.
[[nodiscard]] auto transform_output_dir(const PipelineConfig& config, BackendKind kind)
    -> std::filesystem::path;

/// Command-line overrides applied on top of the loaded config.
struct RunOptions {
    std::optional<BackendKind> backend;
    std::optional<std::size_t> workers;
    bool skip_generate = false;
};

/// Run Data Generation, JSON to CSV Conversion and Data Transformation in
/// order, timing each step. Returns false at the first failing step.
[[nodiscard]] auto run_pipeline(const PipelineConfig& config, const RunOptions& options,
                                const LoggerPtr& logger) -> bool;

}  // namespace tabula::pipeline
