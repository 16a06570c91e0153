#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/logging.hpp>
#include <tabula/core/table.hpp>

#include <cstddef>
#include <filesystem>
#include <string_view>

namespace tabula::fixtures {

/// Flatten a JSON array of objects into a text table.
///
/// Nested objects become `parent_child` columns, arrays are joined with ','
/// and JSON null (or a key missing from a record) is a null cell. Columns are
/// the sorted union of keys over all records.
/// Fails with IOError when the text is not an array of objects.
[[nodiscard]] auto flatten_json_records(std::string_view json_text) -> Result<Table>;

/// Convert one JSON file to CSV. An empty array writes nothing and logs a
/// warning. Returns the number of records converted.
[[nodiscard]] auto convert_json_to_csv(const std::filesystem::path& json_file,
                                       const std::filesystem::path& csv_file,
                                       const LoggerPtr& logger) -> Result<std::size_t>;

/// Convert every `*.json` in `input_dir` to a same-named `.csv` in
/// `output_dir` (created if missing). Returns the number of files processed;
/// a directory without JSON files only logs a warning.
[[nodiscard]] auto convert_directory(const std::filesystem::path& input_dir,
                                     const std::filesystem::path& output_dir,
                                     const LoggerPtr& logger) -> Result<std::size_t>;

}  // namespace tabula::fixtures
