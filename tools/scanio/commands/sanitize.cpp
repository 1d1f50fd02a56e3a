/**
 * scanio CLI - sanitize command
 *
 * Print the sanitized form of archive entry paths.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace scanio::cli::commands {

namespace {

struct SanitizeOptions {
    std::vector<std::string> paths;
    bool check = false;
};

int cmd_sanitize(const GlobalOptions& opts, const SanitizeOptions& sanitize_opts) {
    if (!prepare_command(opts)) {
        return 1;
    }

    // --check: exit 1 if any path is not already in sanitized form
    int exit_code = 0;
    nlohmann::json entries = nlohmann::json::array();

    for (const auto& path : sanitize_opts.paths) {
        std::string sanitized = sanitize_entry_path(path);
        bool clean = is_sanitized(path);
        if (sanitize_opts.check && !clean) {
            exit_code = 1;
        }

        if (opts.json) {
            nlohmann::json entry;
            entry["input"] = path;
            entry["sanitized"] = sanitized;
            entry["changed"] = !clean;
            entries.push_back(entry);
        } else if (sanitize_opts.check) {
            std::cout << (clean ? "ok      " : "unsafe  ") << path << std::endl;
        } else {
            std::cout << sanitized << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = exit_code == 0;
        j["paths"] = entries;
        output_json(j);
    }
    return exit_code;
}

} // namespace

void setup_sanitize(CLI::App* app, GlobalOptions& opts) {
    static SanitizeOptions sanitize_opts;

    app->add_option("paths", sanitize_opts.paths, "Entry paths to sanitize")->required();
    app->add_flag("--check", sanitize_opts.check, "Fail if any path needs sanitizing");

    app->callback([&opts]() {
        std::exit(cmd_sanitize(opts, sanitize_opts));
    });
}

} // namespace scanio::cli::commands
