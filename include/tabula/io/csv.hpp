#pragma once

#include <tabula/core/error.hpp>
#include <tabula/core/table.hpp>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_set>

namespace tabula::io {

struct CsvReadOptions {
    char separator = ',';
    /// Treat empty cells as null.
    bool null_if_empty = true;
    /// Additional cell texts read as null (e.g. "NA").
    std::unordered_set<std::string> null_tokens;
};

struct CsvWriteOptions {
    char separator = ',';
};

/// Read a delimited file with a header row (RFC 4180 quoting) into a table of
/// text columns. Cells matching the null options are marked null.
/// Fails with IOError when the file cannot be opened or is malformed.
[[nodiscard]] auto read_csv_text(const std::filesystem::path& path,
                                 const CsvReadOptions& options = {}) -> Result<Table>;

/// Re-type a text column as int64, then double, when every valid cell parses;
/// otherwise the text column is returned unchanged.
[[nodiscard]] auto infer_numeric_column(const Column<std::string>& text,
                                        const std::optional<std::vector<bool>>& validity)
    -> ColumnValue;

/// Cell parsing shared by the reader and the normalizer. Whole-string matches only.
[[nodiscard]] auto parse_int64(std::string_view text) -> std::optional<std::int64_t>;
[[nodiscard]] auto parse_double(std::string_view text) -> std::optional<double>;

/// Header line, terminated by '\n'.
[[nodiscard]] auto format_csv_header(const Table& table, const CsvWriteOptions& options = {})
    -> std::string;

/// Data lines only, each terminated by '\n'.
[[nodiscard]] auto format_csv_rows(const Table& table, const CsvWriteOptions& options = {})
    -> std::string;

/// Replace `target` with the concatenated chunks. Content goes to a sibling
/// temporary file that is renamed over `target`, so readers never observe a
/// partially written file. Fails with IOError.
[[nodiscard]] auto write_file_atomic(const std::filesystem::path& target,
                                     std::span<const std::string> chunks) -> Status;

/// Header plus rows, written atomically. Returns the number of data rows.
[[nodiscard]] auto write_csv(const Table& table, const std::filesystem::path& target,
                             const CsvWriteOptions& options = {}) -> Result<std::size_t>;

}  // namespace tabula::io
