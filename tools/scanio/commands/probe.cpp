/**
 * scanio CLI - probe command
 *
 * Report platform details relevant to reading and unmapping files.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>

namespace scanio::cli::commands {

namespace {

int cmd_probe(const GlobalOptions& opts) {
    if (!prepare_command(opts)) {
        return 1;
    }

    const auto& info = resolve_release_capability();

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["platform"] = to_string(get_current_platform());
        j["page_size"] = page_size();
        j["mapped_read_threshold"] = mapped_read_threshold();
        j["early_release"] = early_release_enabled();
        j["capability"] = to_string(info.capability);
        j["mechanism"] = to_string(info.mechanism);
        j["detail"] = info.detail;
        output_json(j);
    } else {
        std::cout << "Platform:              " << to_string(get_current_platform()) << std::endl;
        std::cout << "Page size:             " << page_size() << std::endl;
        std::cout << "Mapped-read threshold: " << mapped_read_threshold() << std::endl;
        std::cout << "Early release:         " << (early_release_enabled() ? "on" : "off") << std::endl;
        std::cout << "Release capability:    " << to_string(info.capability)
                  << " (" << to_string(info.mechanism) << ")" << std::endl;
        std::cout << "  " << info.detail << std::endl;
    }
    return 0;
}

} // namespace

void setup_probe(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_probe(opts));
    });
}

} // namespace scanio::cli::commands
