#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace geopat {

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warning,
    Error,
    Critical,
    Off
};

/// Shared library logger ("geopat"), writing to stderr.
/// Created on first use with level Warning.
std::shared_ptr<spdlog::logger> logger();

void setLogLevel(LogLevel level);
LogLevel logLevel();

} // namespace geopat
