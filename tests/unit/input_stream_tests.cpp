#include <doctest/doctest.h>
#include <scanio/byte_buffer.hpp>
#include <scanio/input_stream.hpp>
#include <scanio/stream_drain.hpp>

#include "test_files.hpp"
#include "test_streams.hpp"

#include <algorithm>
#include <string>
#include <system_error>

using namespace scanio;

TEST_CASE("ByteRegionInputStream single-byte reads") {
    std::vector<uint8_t> bytes = {0x00, 0x7F, 0x80, 0xFF};
    ByteRegionInputStream stream(bytes);

    CHECK(stream.read() == 0x00);
    CHECK(stream.read() == 0x7F);
    CHECK(stream.read() == 0x80);
    CHECK(stream.read() == 0xFF);
    CHECK(stream.read() == kEndOfStream);
    CHECK(stream.read() == kEndOfStream);
}

TEST_CASE("ByteRegionInputStream bulk reads copy min(length, remaining)") {
    auto bytes = make_pattern_bytes(10);
    ByteRegionInputStream stream(bytes);
    std::vector<uint8_t> dst(16, 0xEE);

    CHECK(stream.read(dst.data(), 2, 4) == 4);
    CHECK(stream.position() == 4);
    CHECK(stream.remaining() == 6);
    CHECK(std::equal(bytes.begin(), bytes.begin() + 4, dst.begin() + 2));
    CHECK(dst[0] == 0xEE);
    CHECK(dst[6] == 0xEE);

    CHECK(stream.read(dst.data(), 0, 16) == 6);
    CHECK(std::equal(bytes.begin() + 4, bytes.end(), dst.begin()));
    CHECK(stream.remaining() == 0);

    CHECK(stream.read(dst.data(), 0, 16) == kEndOfStream);
}

TEST_CASE("ByteRegionInputStream zero-length read before the end") {
    auto bytes = make_pattern_bytes(3);
    ByteRegionInputStream stream(bytes);
    uint8_t dst[1];
    CHECK(stream.read(dst, 0, 0) == 0);
    CHECK(stream.position() == 0);
}

TEST_CASE("ByteRegionInputStream mixes single-byte and bulk reads") {
    std::vector<uint8_t> bytes = {1, 2, 3, 4, 5};
    ByteRegionInputStream stream(bytes);
    uint8_t dst[8] = {};

    CHECK(stream.read() == 1);
    CHECK(stream.read(dst, 0, 3) == 3);
    CHECK(dst[0] == 2);
    CHECK(dst[2] == 4);
    CHECK(stream.read() == 5);
    CHECK(stream.read() == kEndOfStream);
}

TEST_CASE("ByteRegionInputStream over an empty region") {
    ByteRegionInputStream stream(nullptr, 0);
    uint8_t dst[4];
    CHECK(stream.read() == kEndOfStream);
    CHECK(stream.read(dst, 0, 4) == kEndOfStream);
}

TEST_CASE("ByteRegionInputStream feeds drain") {
    auto bytes = make_pattern_bytes(50000);
    ByteRegionInputStream stream(bytes);
    auto result = drain(stream, static_cast<int64_t>(bytes.size()));
    REQUIRE(result.ok);
    CHECK(result.buffer == bytes);
}

TEST_CASE("ByteRegionInputStream reads a buffer's view") {
    auto bytes = make_pattern_bytes(64);
    auto buffer = ByteBuffer::wrap(bytes);
    auto view = buffer.slice(8, 16);

    ByteRegionInputStream stream(view);
    auto result = drain(stream, 16);
    REQUIRE(result.ok);
    CHECK(result.buffer == std::vector<uint8_t>(bytes.begin() + 8, bytes.begin() + 24));
}

TEST_CASE("FileInputStream reads a file to the end") {
    auto bytes = make_pattern_bytes(20000);
    TempDir dir;
    auto path = dir.write("data.bin", bytes);

    auto stream = FileInputStream::open(path);
    CHECK(stream.size_hint() == 20000);

    auto result = drain(stream, stream.size_hint());
    REQUIRE(result.ok);
    CHECK(result.buffer == bytes);
    CHECK(stream.read() == kEndOfStream);
}

TEST_CASE("FileInputStream single-byte reads") {
    TempDir dir;
    auto stream = FileInputStream::open(dir.write("two.bin", std::vector<uint8_t>{0xCA, 0xFE}));
    CHECK(stream.read() == 0xCA);
    CHECK(stream.read() == 0xFE);
    CHECK(stream.read() == kEndOfStream);
}

TEST_CASE("FileInputStream open failure throws system_error") {
    CHECK_THROWS_AS(FileInputStream::open("/nonexistent/scanio/file.bin"), std::system_error);
}

TEST_CASE("FileInputStream moved-from stream releases nothing") {
    TempDir dir;
    auto first = FileInputStream::open(dir.write("three.bin", std::vector<uint8_t>{1, 2, 3}));
    int fd = first.fd();
    FileInputStream second(std::move(first));
    CHECK(first.fd() == -1);
    CHECK(second.fd() == fd);
    CHECK(second.read() == 1);
}
