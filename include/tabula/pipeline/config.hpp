#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/logging.hpp>
#include <tabula/engine/backend.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>

namespace tabula::pipeline {

/// Settings for one end-to-end run. Loaded from a YAML (or JSON) mapping whose
/// keys match the member names; absent keys keep these defaults.
struct PipelineConfig {
    std::int64_t num_files = 10;
    std::int64_t records_per_file = 1000;
    std::filesystem::path raw_data_dir = "data/raw";
    std::filesystem::path processed_data_dir = "data/processed";
    std::filesystem::path curated_data_dir = "data/curated";
    BackendKind backend = BackendKind::Local;
    /// Executors for the distributed backend; 0 means one per hardware thread.
    std::size_t workers = 0;
    std::uint64_t seed = 42;
};

/// Parse a config file. Fails with IOError when the file is missing or not a
/// mapping, and TypeCoercionError when a value has the wrong type or range.
[[nodiscard]] auto load_config_file(const std::filesystem::path& path) -> Result<PipelineConfig>;

/// load_config_file(), falling back to the defaults (with an error logged)
/// on failure. Without a path the defaults are returned.
[[nodiscard]] auto load_config(const std::optional<std::filesystem::path>& path,
                               const LoggerPtr& logger) -> PipelineConfig;

}  // namespace tabula::pipeline
