#include <tabula/fixtures/json_flatten.hpp>
#include <tabula/io/csv.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <map>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace tabula::fixtures {

namespace {

namespace fs = std::filesystem;

using FlatRecord = std::map<std::string, std::optional<std::string>>;

auto join_sequence(const YAML::Node& node) -> std::string {
    std::string out;
    bool first = true;
    for (const auto& item : node) {
        if (!first) {
            out.push_back(',');
        }
        first = false;
        if (item.IsScalar()) {
            out += item.Scalar();
        } else if (!item.IsNull()) {
            out += YAML::Dump(item);
        }
    }
    return out;
}

void flatten_into(const YAML::Node& node, const std::string& prefix, FlatRecord& out) {
    for (const auto& kv : node) {
        const std::string key = prefix + kv.first.as<std::string>();
        const YAML::Node& value = kv.second;
        if (value.IsMap()) {
            flatten_into(value, key + "_", out);
        } else if (value.IsSequence()) {
            out[key] = join_sequence(value);
        } else if (value.IsNull()) {
            out[key] = std::nullopt;
        } else {
            out[key] = value.Scalar();
        }
    }
}

auto read_text(const fs::path& path) -> Result<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return make_error(ErrorKind::Io, fmt::format("cannot open {}", path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

auto flatten_json_records(std::string_view json_text) -> Result<Table> {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(json_text));
    } catch (const YAML::Exception& e) {
        return make_error(ErrorKind::Io, fmt::format("malformed JSON: {}", e.what()));
    }
    if (root.IsNull()) {
        return Table{};
    }
    if (!root.IsSequence()) {
        return make_error(ErrorKind::Io, "expected a JSON array of records");
    }

    std::vector<FlatRecord> records;
    std::set<std::string> keys;
    for (const auto& node : root) {
        if (!node.IsMap()) {
            return make_error(ErrorKind::Io,
                              fmt::format("record {} is not a JSON object", records.size()));
        }
        FlatRecord record;
        flatten_into(node, "", record);
        for (const auto& [key, value] : record) {
            keys.insert(key);
        }
        records.push_back(std::move(record));
    }

    Table table;
    for (const auto& key : keys) {
        Column<std::string> column;
        column.reserve(records.size());
        std::vector<bool> validity;
        validity.reserve(records.size());
        bool has_null = false;
        for (const auto& record : records) {
            auto it = record.find(key);
            if (it == record.end() || !it->second.has_value()) {
                column.push_back(std::string{});
                validity.push_back(false);
                has_null = true;
            } else {
                column.push_back(*it->second);
                validity.push_back(true);
            }
        }
        if (has_null) {
            table.add_column(key, std::move(column), std::move(validity));
        } else {
            table.add_column(key, std::move(column));
        }
    }
    return table;
}

auto convert_json_to_csv(const fs::path& json_file, const fs::path& csv_file,
                         const LoggerPtr& logger) -> Result<std::size_t> {
    auto text = read_text(json_file);
    if (!text) {
        return std::unexpected(std::move(text.error()));
    }
    auto table = flatten_json_records(*text);
    if (!table) {
        return make_error(table.error().kind,
                          fmt::format("{}: {}", json_file.string(), table.error().message));
    }
    if (table->rows() == 0) {
        logger->warn("{} contains no data.", json_file.string());
        return 0;
    }
    auto rows = io::write_csv(*table, csv_file);
    if (!rows) {
        return std::unexpected(std::move(rows.error()));
    }
    logger->info("Converted {} to {}", json_file.string(), csv_file.string());
    return *rows;
}

auto convert_directory(const fs::path& input_dir, const fs::path& output_dir,
                       const LoggerPtr& logger) -> Result<std::size_t> {
    std::error_code ec;
    fs::create_directories(output_dir, ec);
    if (ec) {
        return make_error(ErrorKind::Io,
                          fmt::format("cannot create {}: {}", output_dir.string(), ec.message()));
    }

    std::vector<fs::path> json_files;
    if (fs::is_directory(input_dir, ec)) {
        for (const auto& entry : fs::directory_iterator(input_dir, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json") {
                json_files.push_back(entry.path());
            }
        }
    }
    if (ec) {
        return make_error(ErrorKind::Io,
                          fmt::format("cannot list {}: {}", input_dir.string(), ec.message()));
    }
    if (json_files.empty()) {
        logger->warn("No JSON files found in {}", input_dir.string());
        return 0;
    }
    std::ranges::sort(json_files);
    logger->info("Found {} JSON files to process", json_files.size());

    for (const auto& json_file : json_files) {
        auto csv_file = output_dir / json_file.filename();
        csv_file.replace_extension(".csv");
        auto converted = convert_json_to_csv(json_file, csv_file, logger);
        if (!converted) {
            return std::unexpected(std::move(converted.error()));
        }
    }
    logger->info("Processed {} JSON files", json_files.size());
    return json_files.size();
}

}  // namespace tabula::fixtures
