#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scanio {

// ============================================================================
// Library configuration (scanio.config.v1)
// ============================================================================

constexpr const char* kConfigSchema = "scanio.config.v1";

struct Config {
    std::string schema;

    // Library logger level; empty keeps the current level
    std::string log_level;

    // Overrides the per-platform mapped-read threshold when set
    std::optional<int64_t> mapped_read_threshold;

    // When false, read_file() never force-unmaps and leaves release to RAII
    bool early_release = true;

    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> warnings;
    Config config;
};

// Built-in defaults (what the library uses with no configuration)
Config get_default_config();

// Parse a JSON configuration document
ConfigParseResult parse_config(const std::string& json_str,
                               const std::string& source_path = "");

// Read and parse a configuration file
ConfigParseResult load_config(const std::string& path);

// Install `config` process-wide: log level, threshold provider, early release
void apply_config(const Config& config);

bool early_release_enabled();
void set_early_release(bool enabled);

} // namespace scanio
