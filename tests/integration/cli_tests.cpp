/**
 * Integration tests for the scanio command-line tool
 *
 * Runs the built binary (SCANIO_CLI_PATH) and checks exit codes and
 * JSON output.
 */

#include <doctest/doctest.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

#ifndef _WIN32
#include <sys/wait.h>
#endif

namespace fs = std::filesystem;

#ifndef _WIN32

namespace {

struct CommandResult {
    int exit_code = -1;
    std::string output;
};

CommandResult run_cli(const std::string& args) {
    CommandResult result;
    std::string command = std::string("\"") + SCANIO_CLI_PATH + "\" " + args + " 2>/dev/null";
    FILE* pipe = ::popen(command.c_str(), "r");
    if (!pipe) {
        return result;
    }
    std::array<char, 4096> chunk;
    size_t n = 0;
    while ((n = std::fread(chunk.data(), 1, chunk.size(), pipe)) > 0) {
        result.output.append(chunk.data(), n);
    }
    int status = ::pclose(pipe);
    if (status != -1 && WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    }
    return result;
}

class TempDir {
public:
    TempDir() {
        std::random_device rd;
        path_ = fs::temp_directory_path() / ("scanio_cli_" + std::to_string(rd()));
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const {
        fs::path file = path_ / name;
        std::ofstream out(file, std::ios::binary);
        out << content;
        return file.string();
    }

    std::string path() const { return path_.string(); }

private:
    fs::path path_;
};

} // namespace

TEST_CASE("scanio --version") {
    auto result = run_cli("--version");
    CHECK(result.exit_code == 0);
    CHECK_FALSE(result.output.empty());
}

TEST_CASE("scanio sanitize prints sanitized paths") {
    auto result = run_cli("sanitize ../../etc/passwd 'a//b/./c/../d' ../");
    REQUIRE(result.exit_code == 0);
    CHECK(result.output == "etc/passwd\na/b/d\n\n");
}

TEST_CASE("scanio sanitize --check fails on unsafe paths") {
    CHECK(run_cli("sanitize --check com/example/Main.class").exit_code == 0);
    CHECK(run_cli("sanitize --check com/example/Main.class ../x").exit_code == 1);
}

TEST_CASE("scanio sanitize --json") {
    auto result = run_cli("--json sanitize /abs/path");
    REQUIRE(result.exit_code == 0);
    auto j = nlohmann::json::parse(result.output);
    REQUIRE(j["paths"].size() == 1);
    CHECK(j["paths"][0]["sanitized"] == "abs/path");
    CHECK(j["paths"][0]["changed"] == true);
}

TEST_CASE("scanio drain reports the length") {
    TempDir dir;
    auto path = dir.write("data.txt", std::string(20000, 'x'));

    auto result = run_cli("--json drain \"" + path + "\"");
    REQUIRE(result.exit_code == 0);
    auto j = nlohmann::json::parse(result.output);
    CHECK(j["ok"] == true);
    CHECK(j["length"] == 20000);
}

TEST_CASE("scanio drain --text prints the decoded contents") {
    TempDir dir;
    auto path = dir.write("hello.txt", "hello\n");
    auto result = run_cli("drain --text \"" + path + "\"");
    REQUIRE(result.exit_code == 0);
    CHECK(result.output == "hello\n");
}

TEST_CASE("scanio drain of a missing file fails") {
    TempDir dir;
    CHECK(run_cli("drain \"" + dir.path() + "/missing\"").exit_code == 1);
}

TEST_CASE("scanio read picks the strategy from the threshold") {
    TempDir dir;
    auto path = dir.write("Big.class", std::string(50000, 'c'));

    auto mapped = run_cli("--json read --threshold 1024 \"" + path + "\"");
    REQUIRE(mapped.exit_code == 0);
    auto jm = nlohmann::json::parse(mapped.output);
    CHECK(jm["method"] == "mapped");
    CHECK(jm["length"] == 50000);
    CHECK(jm["classfile"] == true);

    auto streamed = run_cli("--json read --threshold 1000000 \"" + path + "\"");
    REQUIRE(streamed.exit_code == 0);
    CHECK(nlohmann::json::parse(streamed.output)["method"] == "stream");
}

TEST_CASE("scanio read honours --config") {
    TempDir dir;
    auto data = dir.write("data.bin", std::string(5000, 'd'));
    auto config = dir.write("scanio.json",
                            R"({"$schema": "scanio.config.v1", "mapped_read_threshold": 100})");

    auto result = run_cli("--json --config \"" + config + "\" read \"" + data + "\"");
    REQUIRE(result.exit_code == 0);
    auto j = nlohmann::json::parse(result.output);
    CHECK(j["method"] == "mapped");
    CHECK(j["threshold"] == 100);
}

TEST_CASE("scanio rejects an invalid configuration") {
    TempDir dir;
    auto config = dir.write("bad.json", R"({"log_level": "info"})");
    CHECK(run_cli("--config \"" + config + "\" probe").exit_code == 1);
}

TEST_CASE("scanio probe --json") {
    auto result = run_cli("--json probe");
    REQUIRE(result.exit_code == 0);
    auto j = nlohmann::json::parse(result.output);
    CHECK(j["capability"] == "direct_release");
    CHECK(j["mechanism"] == "munmap");
    CHECK(j["page_size"].get<size_t>() > 0);
}

#endif
