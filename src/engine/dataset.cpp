#include <tabula/engine/dataset.hpp>

namespace tabula {

Dataset::Dataset(Table table) {
    partitions_.push_back(std::move(table));
}

Dataset::Dataset(std::vector<Table> partitions) : partitions_(std::move(partitions)) {}

auto Dataset::rows() const noexcept -> std::size_t {
    std::size_t total = 0;
    for (const auto& part : partitions_) {
        total += part.rows();
    }
    return total;
}

auto Dataset::column_names() const -> std::vector<std::string> {
    if (partitions_.empty()) {
        return {};
    }
    return partitions_.front().column_names();
}

auto Dataset::collect() const -> Table {
    return concat_tables(partitions_);
}

}  // namespace tabula
