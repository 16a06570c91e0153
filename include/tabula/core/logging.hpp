#pragma once

#include <tabula/core/error.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace tabula {

using LoggerPtr = std::shared_ptr<spdlog::logger>;

/// Loggers are handed to components explicitly; nothing registers with or
/// reads spdlog's global registry.
struct LogOptions {
    std::string name = "tabula";
    bool verbose = false;
    /// Also append to this file when non-empty.
    std::string file;
};

/// Console logger (plus optional file sink) at info, or debug when verbose.
/// Fails with IOError when the log file cannot be opened.
[[nodiscard]] auto make_logger(const LogOptions& options) -> Result<LoggerPtr>;

/// A logger without sinks; the default for components given none.
[[nodiscard]] auto null_logger() -> LoggerPtr;

/// `logger` itself, or a null logger when it is empty.
[[nodiscard]] auto or_null(LoggerPtr logger) -> LoggerPtr;

}  // namespace tabula
