#pragma once

#include <tabula/core/error.hpp>
#include <tabula/engine/dataset.hpp>
#include <tabula/io/csv.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace tabula {

/// Supplies one unified dataset from one or more homogeneous delimited files.
class RowSource {
   public:
    virtual ~RowSource() = default;

    /// Each location is a file or a directory (expanded to its `*.csv` files).
    ///
    /// Fails with EmptyInputError when the locations resolve to no files,
    /// SchemaMismatchError when files disagree on their column set or leave
    /// the transaction record shape, IOError when a file cannot be read.
    [[nodiscard]] virtual auto load(const std::vector<std::filesystem::path>& locations)
        -> Result<Dataset> = 0;
};

/// Expand locations into a de-duplicated file list: directories contribute
/// their `*.csv` entries sorted by name, files are taken as given.
[[nodiscard]] auto resolve_locations(const std::vector<std::filesystem::path>& locations)
    -> Result<std::vector<std::filesystem::path>>;

/// Read one file and validate its header against the record shape. Numeric
/// columns of the shape are re-typed where every cell parses; everything
/// else stays text for the normalizer to coerce.
[[nodiscard]] auto read_partition(const std::filesystem::path& file,
                                  const io::CsvReadOptions& options) -> Result<Table>;

/// Fails with SchemaMismatchError unless `candidate` has the column set of
/// `reference` (order-insensitive).
[[nodiscard]] auto check_same_schema(const Table& reference, const std::filesystem::path& ref_file,
                                     const Table& candidate,
                                     const std::filesystem::path& candidate_file) -> Status;

}  // namespace tabula
