#include <tabula/core/schema.hpp>
#include <tabula/engine/row_source.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <set>
#include <system_error>

namespace tabula {

namespace fs = std::filesystem;

auto resolve_locations(const std::vector<fs::path>& locations) -> Result<std::vector<fs::path>> {
    std::vector<fs::path> files;
    std::set<fs::path> seen;
    auto add = [&](const fs::path& file) {
        auto key = file.lexically_normal();
        if (seen.insert(key).second) {
            files.push_back(file);
        }
    };

    for (const auto& location : locations) {
        std::error_code ec;
        if (fs::is_directory(location, ec)) {
            std::vector<fs::path> entries;
            for (const auto& entry : fs::directory_iterator(location, ec)) {
                if (entry.is_regular_file() && entry.path().extension() == ".csv") {
                    entries.push_back(entry.path());
                }
            }
            if (ec) {
                return make_error(ErrorKind::Io, fmt::format("cannot list {}: {}",
                                                             location.string(), ec.message()));
            }
            std::ranges::sort(entries);
            for (const auto& file : entries) {
                add(file);
            }
        } else if (fs::exists(location, ec)) {
            add(location);
        } else {
            return make_error(ErrorKind::Io,
                              fmt::format("input location does not exist: {}", location.string()));
        }
    }

    if (files.empty()) {
        std::vector<std::string> names;
        for (const auto& location : locations) {
            names.push_back(location.string());
        }
        return make_error(ErrorKind::EmptyInput,
                          fmt::format("no CSV files found in [{}]", fmt::join(names, ", ")));
    }
    return files;
}

auto read_partition(const fs::path& file, const io::CsvReadOptions& options) -> Result<Table> {
    auto raw = io::read_csv_text(file, options);
    if (!raw) {
        return std::unexpected(std::move(raw.error()));
    }
    if (auto valid = schema::validate_columns(raw->column_names(), file.string()); !valid) {
        return std::unexpected(std::move(valid.error()));
    }

    Table table;
    for (const auto& entry : raw->columns) {
        const auto* field = schema::find_field(entry.name);
        const bool numeric = field != nullptr && (field->kind == ScalarKind::Int ||
                                                  field->kind == ScalarKind::Double);
        const auto& text = std::get<Column<std::string>>(*entry.column);
        ColumnValue column =
            numeric ? io::infer_numeric_column(text, entry.validity) : ColumnValue{text};
        if (entry.validity.has_value()) {
            table.add_column(entry.name, std::move(column), *entry.validity);
        } else {
            table.add_column(entry.name, std::move(column));
        }
    }
    return table;
}

auto check_same_schema(const Table& reference, const fs::path& ref_file, const Table& candidate,
                       const fs::path& candidate_file) -> Status {
    const auto expected = reference.column_names();
    const auto actual = candidate.column_names();
    if (schema::same_column_set(expected, actual)) {
        return {};
    }
    return make_error(ErrorKind::SchemaMismatch,
                      fmt::format("{} has columns [{}] but {} has [{}]", candidate_file.string(),
                                  fmt::join(actual, ", "), ref_file.string(),
                                  fmt::join(expected, ", ")));
}

}  // namespace tabula
