// Delimited-file reading via rapidcsv (RFC 4180 quoting).

#include <tabula/io/csv.hpp>

#include <fmt/format.h>
#include <rapidcsv.h>

#include <charconv>
#include <exception>
#include <string>
#include <vector>

namespace tabula::io {

namespace {

auto csv_trim(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto is_null_cell(const std::string& cell, const CsvReadOptions& options) -> bool {
    return (options.null_if_empty && csv_trim(cell).empty()) ||
           options.null_tokens.contains(cell);
}

}  // namespace

auto parse_int64(std::string_view text) -> std::optional<std::int64_t> {
    text = csv_trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    std::int64_t out = 0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto parse_double(std::string_view text) -> std::optional<double> {
    text = csv_trim(text);
    if (text.empty()) {
        return std::nullopt;
    }
    if (text.front() == '+') {
        text.remove_prefix(1);
    }
    double out = 0.0;
    const char* end = text.data() + text.size();
    auto result = std::from_chars(text.data(), end, out);
    if (result.ec != std::errc() || result.ptr != end) {
        return std::nullopt;
    }
    return out;
}

auto infer_numeric_column(const Column<std::string>& text,
                          const std::optional<std::vector<bool>>& validity) -> ColumnValue {
    auto valid = [&](std::size_t i) { return !validity.has_value() || (*validity)[i]; };

    // Try int64
    bool all_int = !text.empty();
    bool any_valid = false;
    for (std::size_t i = 0; i < text.size() && all_int; ++i) {
        if (!valid(i)) {
            continue;
        }
        all_int = parse_int64(text[i]).has_value();
        any_valid = true;
    }
    if (all_int && any_valid) {
        Column<std::int64_t> col;
        col.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            col.push_back(valid(i) ? *parse_int64(text[i]) : 0);
        }
        return col;
    }

    // Try double
    bool all_double = !text.empty();
    any_valid = false;
    for (std::size_t i = 0; i < text.size() && all_double; ++i) {
        if (!valid(i)) {
            continue;
        }
        all_double = parse_double(text[i]).has_value();
        any_valid = true;
    }
    if (all_double && any_valid) {
        Column<double> col;
        col.reserve(text.size());
        for (std::size_t i = 0; i < text.size(); ++i) {
            col.push_back(valid(i) ? *parse_double(text[i]) : 0.0);
        }
        return col;
    }

    return text;
}

auto read_csv_text(const std::filesystem::path& path, const CsvReadOptions& options)
    -> Result<Table> {
    std::vector<std::string> col_names;
    std::vector<std::vector<std::string>> values;
    try {
        rapidcsv::Document doc(path.string(),
                               rapidcsv::LabelParams(0, -1),  // row 0 = header, no row-index column
                               // Quoted cells may span lines, as the writer emits them.
                               rapidcsv::SeparatorParams(options.separator, false,
                                                         rapidcsv::sPlatformHasCR, true),
                               rapidcsv::ConverterParams(),
                               rapidcsv::LineReaderParams(false, '#', true));
        col_names = doc.GetColumnNames();
        values.reserve(col_names.size());
        for (const auto& name : col_names) {
            values.push_back(doc.GetColumn<std::string>(name));
        }
    } catch (const std::exception& e) {
        return make_error(ErrorKind::Io,
                          fmt::format("failed to read csv {}: {}", path.string(), e.what()));
    }

    if (col_names.empty()) {
        return make_error(ErrorKind::Io, fmt::format("csv has no header: {}", path.string()));
    }

    Table table;
    for (std::size_t c = 0; c < col_names.size(); ++c) {
        if (table.has_column(col_names[c])) {
            return make_error(ErrorKind::SchemaMismatch,
                              fmt::format("{}: duplicate column '{}'", path.string(),
                                          col_names[c]));
        }
        auto& vals = values[c];
        std::vector<bool> validity(vals.size(), true);
        bool has_nulls = false;
        for (std::size_t i = 0; i < vals.size(); ++i) {
            if (is_null_cell(vals[i], options)) {
                validity[i] = false;
                has_nulls = true;
                vals[i].clear();
            }
        }
        if (has_nulls) {
            table.add_column(col_names[c], Column<std::string>(std::move(vals)),
                             std::move(validity));
        } else {
            table.add_column(col_names[c], Column<std::string>(std::move(vals)));
        }
    }
    return table;
}

}  // namespace tabula::io
