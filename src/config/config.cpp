#include "scanio/config.hpp"
#include "scanio/input_stream.hpp"
#include "scanio/logging.hpp"
#include "scanio/platform.hpp"
#include "scanio/stream_drain.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <exception>
#include <optional>

#include <nlohmann/json.hpp>

namespace scanio {

namespace {

std::atomic<bool> g_early_release{true};

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

const char* const kKnownKeys[] = {
    "$schema",
    "log_level",
    "mapped_read_threshold",
    "early_release",
};

bool is_known_key(const std::string& key) {
    return std::find(std::begin(kKnownKeys), std::end(kKnownKeys), key) != std::end(kKnownKeys);
}

} // namespace

Config get_default_config() {
    Config config;
    config.schema = kConfigSchema;
    config.early_release = true;
    return config;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config = get_default_config();
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        if (auto schema = get_string(j, "$schema")) {
            result.config.schema = trim(*schema);
        } else {
            result.error = "$schema missing";
            return result;
        }

        if (result.config.schema != kConfigSchema) {
            result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
            return result;
        }

        if (j.contains("log_level")) {
            auto level = get_string(j, "log_level");
            if (level && log::parse_level(*level)) {
                result.config.log_level = *level;
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        if (j.contains("mapped_read_threshold")) {
            const auto& threshold = j["mapped_read_threshold"];
            if (threshold.is_number_integer()) {
                result.config.mapped_read_threshold = threshold.get<int64_t>();
            } else {
                result.warnings.push_back("invalid_configuration:mapped_read_threshold");
            }
        }

        if (j.contains("early_release")) {
            const auto& early = j["early_release"];
            if (early.is_boolean()) {
                result.config.early_release = early.get<bool>();
            } else {
                result.warnings.push_back("invalid_configuration:early_release");
            }
        }

        for (auto& [key, val] : j.items()) {
            (void)val;
            if (!is_known_key(key)) {
                result.warnings.push_back("unknown_key:" + key);
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ConfigParseResult load_config(const std::string& path) {
    ConfigParseResult result;

    TextDrainResult text;
    try {
        auto stream = FileInputStream::open(path);
        text = drain_as_string(stream, stream.size_hint());
    } catch (const std::exception& e) {
        result.error = e.what();
        return result;
    }

    if (!text.ok) {
        result.error = "failed to read " + path + ": " + text.error;
        return result;
    }

    return parse_config(text.text, path);
}

void apply_config(const Config& config) {
    if (!config.log_level.empty() && !log::set_level(config.log_level)) {
        log::get()->warn("ignoring invalid log level '{}'", config.log_level);
    }

    if (config.mapped_read_threshold) {
        int64_t threshold = *config.mapped_read_threshold;
        set_mapped_read_threshold_provider([threshold]() { return threshold; });
    } else {
        set_mapped_read_threshold_provider(nullptr);
    }

    set_early_release(config.early_release);

    log::get()->debug("applied configuration from {}",
                      config.source_path.empty() ? "<defaults>" : config.source_path);
}

bool early_release_enabled() {
    return g_early_release.load(std::memory_order_relaxed);
}

void set_early_release(bool enabled) {
    g_early_release.store(enabled, std::memory_order_relaxed);
}

} // namespace scanio
