#include "scanio/logging.hpp"
#include "scanio/platform.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace scanio::log {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::shared_ptr<spdlog::logger> create_logger() {
    auto logger = spdlog::get(kLoggerName);
    if (logger) {
        return logger;
    }

    logger = spdlog::stderr_color_mt(kLoggerName);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
    logger->set_level(spdlog::level::warn);

    if (auto env_level = get_env("SCANIO_LOG_LEVEL")) {
        if (auto level = parse_level(*env_level)) {
            logger->set_level(*level);
        } else {
            logger->warn("ignoring invalid SCANIO_LOG_LEVEL '{}'", *env_level);
        }
    }
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    static std::once_flag once;
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(once, [] { logger = create_logger(); });
    return logger;
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    std::string lower = to_lower(name);
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

bool set_level(const std::string& name) {
    auto level = parse_level(name);
    if (!level) {
        return false;
    }
    get()->set_level(*level);
    return true;
}

} // namespace scanio::log
