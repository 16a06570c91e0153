#include <tabula/core/logging.hpp>
#include <tabula/engine/backend.hpp>
#include <tabula/pipeline/config.hpp>
#include <tabula/pipeline/pipeline.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>

int main(int argc, char* argv[]) {
    CLI::App app{"Tabula - generate, flatten, normalize and aggregate transaction data"};

    std::string config_path;
    std::string backend_name;
    std::size_t workers = 0;
    bool verbose = false;
    bool skip_generate = false;
    std::string log_file;
    app.add_option("-c,--config", config_path, "Path to a YAML or JSON configuration file");
    auto* backend_opt = app.add_option("-b,--backend", backend_name,
                                       "Transformation backend; overrides the config file")
                            ->check(CLI::IsMember({"local", "distributed"}));
    auto* workers_opt =
        app.add_option("-w,--workers", workers,
                       "Executors for the distributed backend (0 = one per hardware thread)");
    app.add_flag("--skip-generate", skip_generate,
                 "Reuse the JSON files already in the raw data directory");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");
    app.add_option("--log-file", log_file, "Also append log output to this file");

    CLI11_PARSE(app, argc, argv);

    auto made = tabula::make_logger(tabula::LogOptions{
        .name = "data_pipeline", .verbose = verbose, .file = log_file});
    if (!made) {
        fmt::print(stderr, "error: {}\n", made.error().format());
        return 1;
    }
    const auto& logger = *made;

    std::optional<std::filesystem::path> path;
    if (!config_path.empty()) {
        path = config_path;
    }
    const auto config = tabula::pipeline::load_config(path, logger);

    tabula::pipeline::RunOptions options;
    options.skip_generate = skip_generate;
    if (backend_opt->count() > 0) {
        options.backend = tabula::parse_backend_kind(backend_name);
    }
    if (workers_opt->count() > 0) {
        options.workers = workers;
    }

    if (!tabula::pipeline::run_pipeline(config, options, logger)) {
        logger->error("Pipeline execution failed");
        return 1;
    }
    logger->info("Pipeline execution completed successfully");
    return 0;
}
