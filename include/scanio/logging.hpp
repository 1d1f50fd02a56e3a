#pragma once

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace scanio::log {

// Name of the library logger registered with spdlog
constexpr const char* kLoggerName = "scanio";

// The library logger. Created on first use with a stderr sink at level
// `warn`, or at the level named by SCANIO_LOG_LEVEL when it is set.
std::shared_ptr<spdlog::logger> get();

// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

// Set the library logger's level; returns false for an unknown name
bool set_level(const std::string& name);

} // namespace scanio::log
