/**
 * scanio CLI - Common utilities and types
 */

#pragma once

#include <scanio/scanio.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <string>
#include <vector>

namespace scanio::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Apply --config and --verbose before a command runs.
 * Returns false (after reporting) when the configuration cannot be loaded.
 */
inline bool prepare_command(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    if (!opts.config.empty()) {
        auto loaded = scanio::load_config(opts.config);
        if (!loaded.ok) {
            print_error("invalid configuration " + opts.config + ": " + loaded.error, opts.json);
            return false;
        }
        for (const auto& w : loaded.warnings) {
            print_warning(w);
        }
        scanio::apply_config(loaded.config);
    }

    if (opts.verbose) {
        scanio::log::set_level("debug");
    }
    return true;
}

} // namespace scanio::cli
