#pragma once

#include <tabula/core/table.hpp>

#include <string>
#include <vector>

namespace tabula {

/// The unit passed between pipeline stages: a schema-homogeneous set of rows
/// held as one or more column-major partitions.
///
/// The single-node backend always produces one partition, in file-then-row
/// order. The distributed backend keeps one partition per unit of parallel
/// work and gives no ordering guarantee across them.
class Dataset {
   public:
    Dataset() = default;
    explicit Dataset(Table table);
    explicit Dataset(std::vector<Table> partitions);

    [[nodiscard]] auto partitions() const noexcept -> const std::vector<Table>& {
        return partitions_;
    }
    [[nodiscard]] auto num_partitions() const noexcept -> std::size_t {
        return partitions_.size();
    }

    /// Total rows across partitions.
    [[nodiscard]] auto rows() const noexcept -> std::size_t;

    /// Column names of the first partition (all partitions share the set).
    [[nodiscard]] auto column_names() const -> std::vector<std::string>;

    /// All partitions concatenated into one table.
    [[nodiscard]] auto collect() const -> Table;

   private:
    std::vector<Table> partitions_;
};

}  // namespace tabula
