#include <tabula/core/logging.hpp>

#include <fmt/format.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>
#include <vector>

namespace tabula {

auto make_logger(const LogOptions& options) -> Result<LoggerPtr> {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!options.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(options.file));
        } catch (const spdlog::spdlog_ex& e) {
            return make_error(ErrorKind::Io,
                              fmt::format("cannot open log file {}: {}", options.file, e.what()));
        }
    }
    auto logger = std::make_shared<spdlog::logger>(options.name, sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S,%e - %n - %l - %v");
    logger->set_level(options.verbose ? spdlog::level::debug : spdlog::level::info);
    return logger;
}

auto null_logger() -> LoggerPtr {
    auto logger = std::make_shared<spdlog::logger>("null");
    logger->set_level(spdlog::level::off);
    return logger;
}

auto or_null(LoggerPtr logger) -> LoggerPtr {
    return logger ? std::move(logger) : null_logger();
}

}  // namespace tabula
