#include <tabula/pipeline/config.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <string>

namespace tabula::pipeline {

namespace {

template <typename T>
auto read_key(const YAML::Node& root, const char* key, T& out) -> Status {
    const YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        return {};
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception& e) {
        return make_error(ErrorKind::TypeCoercion,
                          fmt::format("config key '{}': {}", key, e.what()));
    }
    return {};
}

auto read_path(const YAML::Node& root, const char* key, std::filesystem::path& out) -> Status {
    std::string text = out.string();
    if (auto status = read_key(root, key, text); !status) {
        return status;
    }
    out = text;
    return {};
}

auto require_non_negative(const char* key, std::int64_t value) -> Status {
    if (value < 0) {
        return make_error(ErrorKind::TypeCoercion,
                          fmt::format("config key '{}' must be non-negative, got {}", key, value));
    }
    return {};
}

}  // namespace

auto load_config_file(const std::filesystem::path& path) -> Result<PipelineConfig> {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return make_error(ErrorKind::Io,
                          fmt::format("cannot load config {}: {}", path.string(), e.what()));
    }
    if (!root.IsMap()) {
        return make_error(ErrorKind::Io,
                          fmt::format("config {} is not a key/value mapping", path.string()));
    }

    PipelineConfig config;
    std::int64_t workers = 0;
    std::string backend{to_string(config.backend)};
    for (auto status : {read_key(root, "num_files", config.num_files),
                        read_key(root, "records_per_file", config.records_per_file),
                        read_path(root, "raw_data_dir", config.raw_data_dir),
                        read_path(root, "processed_data_dir", config.processed_data_dir),
                        read_path(root, "curated_data_dir", config.curated_data_dir),
                        read_key(root, "backend", backend), read_key(root, "workers", workers),
                        read_key(root, "seed", config.seed)}) {
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }
    }
    for (auto status : {require_non_negative("num_files", config.num_files),
                        require_non_negative("records_per_file", config.records_per_file),
                        require_non_negative("workers", workers)}) {
        if (!status) {
            return std::unexpected(std::move(status.error()));
        }
    }
    config.workers = static_cast<std::size_t>(workers);

    auto kind = parse_backend_kind(backend);
    if (!kind.has_value()) {
        return make_error(ErrorKind::TypeCoercion,
                          fmt::format("config key 'backend': unknown backend '{}'", backend));
    }
    config.backend = *kind;
    return config;
}

auto load_config(const std::optional<std::filesystem::path>& path, const LoggerPtr& logger)
    -> PipelineConfig {
    if (!path.has_value()) {
        logger->info("No configuration file given, using defaults");
        return PipelineConfig{};
    }
    auto loaded = load_config_file(*path);
    if (!loaded) {
        logger->error("Error loading configuration: {}", loaded.error().format());
        PipelineConfig defaults;
        logger->info(
            "Using default configuration: num_files={}, records_per_file={}, raw_data_dir={}, "
            "processed_data_dir={}, curated_data_dir={}",
            defaults.num_files, defaults.records_per_file, defaults.raw_data_dir.string(),
            defaults.processed_data_dir.string(), defaults.curated_data_dir.string());
        return defaults;
    }
    logger->info("Loaded configuration from {}", path->string());
    return *loaded;
}

}  // namespace tabula::pipeline
