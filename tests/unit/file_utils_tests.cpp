#include <doctest/doctest.h>
#include <scanio/buffer_release.hpp>
#include <scanio/config.hpp>
#include <scanio/file_utils.hpp>
#include <scanio/platform.hpp>

#include "test_files.hpp"
#include "test_streams.hpp"

#include <cstring>

using namespace scanio;

namespace {

// Pins the mapped-read threshold and early release for one test
class ReadSettings {
public:
    ReadSettings(int64_t threshold, bool early_release) {
        set_mapped_read_threshold_provider([threshold]() { return threshold; });
        set_early_release(early_release);
    }

    ~ReadSettings() {
        set_mapped_read_threshold_provider(nullptr);
        set_early_release(true);
    }
};

} // namespace

// ============================================================================
// is_classfile / can_read
// ============================================================================

TEST_CASE("is_classfile") {
    CHECK(is_classfile("Foo.class"));
    CHECK(is_classfile("com/example/Main.class"));
    CHECK(is_classfile("A.CLASS"));
    CHECK(is_classfile("x.Class"));
    CHECK_FALSE(is_classfile(".class"));
    CHECK_FALSE(is_classfile("class"));
    CHECK_FALSE(is_classfile("Foo.java"));
    CHECK_FALSE(is_classfile("Foo.classes"));
    CHECK_FALSE(is_classfile(""));
}

TEST_CASE("can_read") {
    TempDir dir;
    auto path = dir.write("readable.txt", std::string("hello"));

    CHECK(can_read(path));
    CHECK(can_read(dir.path()));
    CHECK_FALSE(can_read(dir.path() + "/missing.txt"));
    CHECK_FALSE(can_read(""));
}

// ============================================================================
// read_file
// ============================================================================

TEST_CASE("read_file streams files below the threshold") {
    ReadSettings settings(1 << 20, true);
    TempDir dir;
    auto bytes = make_pattern_bytes(5000);
    auto path = dir.write("small.bin", bytes);

    auto result = read_file(path);
    REQUIRE(result.ok);
    CHECK(result.method == ReadMethod::Stream);
    CHECK_FALSE(result.released_early);
    CHECK(result.data == bytes);
}

TEST_CASE("read_file maps files at the threshold and releases them") {
    ReadSettings settings(16384, true);
    TempDir dir;
    auto bytes = make_pattern_bytes(16384);
    auto path = dir.write("large.bin", bytes);

    auto result = read_file(path);
    REQUIRE(result.ok);
    CHECK(result.method == ReadMethod::Mapped);
#ifndef _WIN32
    CHECK(result.released_early);
#endif
    CHECK(result.data == bytes);
}

TEST_CASE("read_file leaves mappings to RAII when early release is off") {
    ReadSettings settings(-1, false);
    TempDir dir;
    auto bytes = make_pattern_bytes(100);
    auto path = dir.write("any.bin", bytes);

    auto result = read_file(path);
    REQUIRE(result.ok);
    CHECK(result.method == ReadMethod::Mapped);
    CHECK_FALSE(result.released_early);
    CHECK(result.data == bytes);
}

TEST_CASE("read_file of an empty file") {
    ReadSettings settings(-1, true);
    TempDir dir;
    auto path = dir.write("empty.bin", std::vector<uint8_t>{});

    auto result = read_file(path);
    REQUIRE(result.ok);
    CHECK(result.method == ReadMethod::Stream);
    CHECK(result.data.empty());
}

TEST_CASE("read_file of a missing file") {
    TempDir dir;
    auto result = read_file(dir.path() + "/missing.bin");
    CHECK_FALSE(result.ok);
    CHECK(result.kind == IoError::OpenFailure);
    CHECK_FALSE(result.error.empty());
}

TEST_CASE("read method names") {
    CHECK(std::string(to_string(ReadMethod::Stream)) == "stream");
    CHECK(std::string(to_string(ReadMethod::Mapped)) == "mapped");
}

// ============================================================================
// open_file_buffer
// ============================================================================

TEST_CASE("open_file_buffer returns a heap buffer below the threshold") {
    ReadSettings settings(1 << 20, true);
    TempDir dir;
    auto bytes = make_pattern_bytes(300);
    auto path = dir.write("small.bin", bytes);

    auto result = open_file_buffer(path);
    REQUIRE(result.ok);
    CHECK_FALSE(result.buffer.is_direct());
    REQUIRE(result.buffer.size() == bytes.size());
    CHECK(std::memcmp(result.buffer.data(), bytes.data(), bytes.size()) == 0);
    CHECK_FALSE(release_buffer(result.buffer));
}

#ifndef _WIN32
TEST_CASE("open_file_buffer maps large files and the caller may release them") {
    ReadSettings settings(4096, true);
    TempDir dir;
    auto bytes = make_pattern_bytes(40000);
    auto path = dir.write("large.bin", bytes);

    auto result = open_file_buffer(path);
    REQUIRE(result.ok);
    CHECK(result.buffer.is_direct());
    REQUIRE(result.buffer.data() != nullptr);
    CHECK(std::memcmp(result.buffer.data(), bytes.data(), bytes.size()) == 0);

    CHECK_FALSE(release_buffer(result.buffer.slice(0, 10)));
    CHECK(release_buffer(result.buffer));
    CHECK(result.buffer.data() == nullptr);
}
#endif

TEST_CASE("open_file_buffer of a missing file") {
    TempDir dir;
    auto result = open_file_buffer(dir.path() + "/missing.bin");
    CHECK_FALSE(result.ok);
    CHECK_FALSE(result.error.empty());
}
