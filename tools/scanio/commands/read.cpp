/**
 * scanio CLI - read command
 *
 * Read a file the way a scanner would: mapped when it is at least the
 * mapped-read threshold, streamed otherwise.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

#include <cstdlib>
#include <optional>

namespace scanio::cli::commands {

namespace {

struct ReadOptions {
    std::string file;
    std::optional<int64_t> threshold;
};

int cmd_read(const GlobalOptions& opts, const ReadOptions& read_opts) {
    if (!prepare_command(opts)) {
        return 1;
    }

    if (read_opts.threshold) {
        int64_t threshold = *read_opts.threshold;
        set_mapped_read_threshold_provider([threshold]() { return threshold; });
    }

    if (!can_read(read_opts.file)) {
        print_error("cannot read " + read_opts.file, opts.json);
        return 1;
    }

    auto result = read_file(read_opts.file);
    if (!result.ok) {
        print_error(std::string(to_string(result.kind)) + ": " + result.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["file"] = read_opts.file;
        j["length"] = result.data.size();
        j["method"] = to_string(result.method);
        j["released_early"] = result.released_early;
        j["threshold"] = mapped_read_threshold();
        j["classfile"] = is_classfile(read_opts.file);
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << read_opts.file << ": " << result.data.size() << " bytes ("
                  << to_string(result.method);
        if (result.method == ReadMethod::Mapped) {
            std::cout << (result.released_early ? ", released early" : ", released on close");
        }
        std::cout << ")" << std::endl;
    }
    return 0;
}

} // namespace

void setup_read(CLI::App* app, GlobalOptions& opts) {
    static ReadOptions read_opts;

    app->add_option("file", read_opts.file, "File to read")->required();
    app->add_option("--threshold", read_opts.threshold,
                    "Mapped-read threshold in bytes (-1 maps every file)");

    app->callback([&opts]() {
        std::exit(cmd_read(opts, read_opts));
    });
}

} // namespace scanio::cli::commands
