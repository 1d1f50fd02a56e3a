/**
 * scanio CLI - Entry Point
 *
 * Command-line front end for the scanio I/O primitives.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace scanio::cli::commands {
    void setup_drain(CLI::App* app, GlobalOptions& opts);
    void setup_sanitize(CLI::App* app, GlobalOptions& opts);
    void setup_read(CLI::App* app, GlobalOptions& opts);
    void setup_probe(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace scanio::cli;

    CLI::App app{"scanio - I/O primitives for classpath scanning"};
    app.set_version_flag("-V,--version", SCANIO_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (scanio.config.v1)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* drain_cmd = app.add_subcommand("drain", "Read a file to the end through a stream");
    commands::setup_drain(drain_cmd, opts);

    auto* sanitize_cmd = app.add_subcommand("sanitize", "Sanitize archive entry paths");
    commands::setup_sanitize(sanitize_cmd, opts);

    auto* read_cmd = app.add_subcommand("read", "Read a file, mapping it when large enough");
    commands::setup_read(read_cmd, opts);

    auto* probe_cmd = app.add_subcommand("probe", "Report the buffer release capability");
    commands::setup_probe(probe_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
