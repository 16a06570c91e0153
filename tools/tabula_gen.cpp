#include <tabula/core/logging.hpp>
#include <tabula/fixtures/generator.hpp>
#include <tabula/fixtures/json_flatten.hpp>

#include <CLI/CLI.hpp>
#include <fmt/core.h>

#include <cstdint>
#include <cstdio>
#include <string>

int main(int argc, char* argv[]) {
    CLI::App app{"Tabula fixture generator - synthetic transaction JSON files"};

    tabula::fixtures::GeneratorOptions options;
    std::string output_dir = options.output_dir.string();
    std::string csv_dir;
    bool verbose = false;
    app.add_option("-n,--num-files", options.num_files, "Number of JSON files to generate")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-r,--records-per-file", options.records_per_file,
                   "Number of records per file")
        ->check(CLI::NonNegativeNumber);
    app.add_option("-o,--output-dir", output_dir, "Output directory for JSON files");
    app.add_option("-s,--seed", options.seed, "Random seed");
    app.add_option("--csv-dir", csv_dir, "Also flatten the generated files into this directory");
    app.add_flag("-v,--verbose", verbose, "Enable debug logging");

    CLI11_PARSE(app, argc, argv);

    auto made =
        tabula::make_logger(tabula::LogOptions{.name = "data_generator", .verbose = verbose});
    if (!made) {
        fmt::print(stderr, "error: {}\n", made.error().format());
        return 1;
    }
    const auto& logger = *made;
    options.output_dir = output_dir;

    auto files = tabula::fixtures::generate_transactions(options, logger);
    if (!files) {
        logger->error("{}", files.error().format());
        return 1;
    }
    if (!csv_dir.empty()) {
        auto converted = tabula::fixtures::convert_directory(options.output_dir, csv_dir, logger);
        if (!converted) {
            logger->error("{}", converted.error().format());
            return 1;
        }
    }
    return 0;
}
