#include <tabula/io/csv.hpp>

#include <fmt/format.h>

#include <atomic>
#include <fstream>
#include <system_error>
#include <unistd.h>

namespace tabula::io {

namespace {

auto needs_quoting(std::string_view cell, char separator) -> bool {
    return cell.find_first_of(std::string{separator} + "\"\r\n") != std::string_view::npos;
}

void append_cell(std::string& out, std::string_view cell, char separator) {
    if (!needs_quoting(cell, separator)) {
        out.append(cell);
        return;
    }
    out.push_back('"');
    for (char ch : cell) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
}

auto temp_path_for(const std::filesystem::path& target) -> std::filesystem::path {
    static std::atomic<std::uint64_t> counter{0};
    auto name = fmt::format(".{}.{}.{}.tmp", target.filename().string(), ::getpid(),
                            counter.fetch_add(1, std::memory_order_relaxed));
    return target.parent_path() / name;
}

}  // namespace

auto format_csv_header(const Table& table, const CsvWriteOptions& options) -> std::string {
    std::string out;
    for (std::size_t c = 0; c < table.columns.size(); ++c) {
        if (c > 0) {
            out.push_back(options.separator);
        }
        append_cell(out, table.columns[c].name, options.separator);
    }
    out.push_back('\n');
    return out;
}

auto format_csv_rows(const Table& table, const CsvWriteOptions& options) -> std::string {
    std::string out;
    const std::size_t rows = table.rows();
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < table.columns.size(); ++c) {
            if (c > 0) {
                out.push_back(options.separator);
            }
            append_cell(out, format_scalar(scalar_at(table.columns[c], r)), options.separator);
        }
        out.push_back('\n');
    }
    return out;
}

auto write_file_atomic(const std::filesystem::path& target, std::span<const std::string> chunks)
    -> Status {
    std::error_code ec;
    if (target.has_parent_path() && !std::filesystem::exists(target.parent_path(), ec)) {
        return make_error(ErrorKind::Io, fmt::format("output directory does not exist: {}",
                                                     target.parent_path().string()));
    }
    if (std::filesystem::is_directory(target, ec)) {
        return make_error(ErrorKind::Io,
                          fmt::format("cannot overwrite directory: {}", target.string()));
    }

    const auto tmp = temp_path_for(target);
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            return make_error(ErrorKind::Io, fmt::format("cannot open {} for writing",
                                                         tmp.string()));
        }
        for (const auto& chunk : chunks) {
            out.write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        }
        out.flush();
        if (!out) {
            out.close();
            std::filesystem::remove(tmp, ec);
            return make_error(ErrorKind::Io, fmt::format("write failed: {}", tmp.string()));
        }
    }

    std::filesystem::rename(tmp, target, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return make_error(ErrorKind::Io, fmt::format("cannot replace {}: {}", target.string(),
                                                     ec.message()));
    }
    return {};
}

auto write_csv(const Table& table, const std::filesystem::path& target,
               const CsvWriteOptions& options) -> Result<std::size_t> {
    const std::string chunks[] = {format_csv_header(table, options),
                                  format_csv_rows(table, options)};
    if (auto status = write_file_atomic(target, chunks); !status) {
        return std::unexpected(std::move(status.error()));
    }
    return table.rows();
}

}  // namespace tabula::io
