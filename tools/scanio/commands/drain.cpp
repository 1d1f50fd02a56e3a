/**
 * scanio CLI - drain command
 *
 * Read a file to end-of-stream through FileInputStream and drain().
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <optional>

namespace scanio::cli::commands {

namespace {

struct DrainOptions {
    std::string file;
    int64_t hint = kUnknownSize;
    bool use_file_size = false;
    bool text = false;
};

int cmd_drain(const GlobalOptions& opts, const DrainOptions& drain_opts) {
    if (!prepare_command(opts)) {
        return 1;
    }

    std::optional<FileInputStream> stream;
    try {
        stream.emplace(FileInputStream::open(drain_opts.file));
    } catch (const std::exception& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    int64_t hint = drain_opts.use_file_size ? stream->size_hint() : drain_opts.hint;

    if (drain_opts.text) {
        auto result = drain_as_string(*stream, hint);
        if (!result.ok) {
            print_error(result.error, opts.json);
            return 1;
        }
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = true;
            j["file"] = drain_opts.file;
            j["hint"] = hint;
            j["text"] = result.text;
            output_json(j);
        } else {
            std::cout << result.text;
        }
        return 0;
    }

    auto result = drain(*stream, hint);
    if (!result.ok) {
        print_error(std::string(to_string(result.kind)) + ": " + result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["file"] = drain_opts.file;
        j["hint"] = hint;
        j["length"] = result.length;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << drain_opts.file << ": " << result.length << " bytes" << std::endl;
    }
    return 0;
}

} // namespace

void setup_drain(CLI::App* app, GlobalOptions& opts) {
    static DrainOptions drain_opts;

    app->add_option("file", drain_opts.file, "File to read")->required();
    app->add_option("--hint", drain_opts.hint, "Size hint in bytes (-1 for unknown)");
    app->add_flag("--file-size-hint", drain_opts.use_file_size, "Use the file's size as the hint");
    app->add_flag("--text", drain_opts.text, "Decode and print the contents as UTF-8");

    app->callback([&opts]() {
        std::exit(cmd_drain(opts, drain_opts));
    });
}

} // namespace scanio::cli::commands
