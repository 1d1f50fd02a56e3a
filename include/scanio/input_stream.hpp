#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scanio {

class ByteBuffer;

// Returned by InputStream reads once the input is exhausted
constexpr int kEndOfStream = -1;

// ============================================================================
// Byte-producing stream
// ============================================================================

// Minimal pull-style stream consumed by drain().
//
// read() returns the next byte as 0..255, or kEndOfStream.
// read(dst, offset, length) stores up to `length` bytes at dst + offset and
// returns the number of bytes stored, 0 when `length` is 0, or kEndOfStream.
//
// Streams report I/O faults by throwing (std::system_error for OS errors).
class InputStream {
public:
    virtual ~InputStream() = default;

    virtual int read() = 0;
    virtual int64_t read(uint8_t* dst, size_t offset, size_t length) = 0;
};

// ============================================================================
// Fixed byte region
// ============================================================================

// Reads a fixed, caller-owned byte region. The region must outlive the
// stream. Used to feed mapped regions through the same path as file streams.
class ByteRegionInputStream : public InputStream {
public:
    ByteRegionInputStream(const uint8_t* data, size_t size);
    explicit ByteRegionInputStream(const std::vector<uint8_t>& data);

    // Reads the buffer's current contents; the buffer must stay mapped
    explicit ByteRegionInputStream(const ByteBuffer& buffer);

    int read() override;
    int64_t read(uint8_t* dst, size_t offset, size_t length) override;

    size_t position() const { return position_; }
    size_t remaining() const { return size_ - position_; }

private:
    const uint8_t* data_;
    size_t size_;
    size_t position_ = 0;
};

// ============================================================================
// File descriptor stream (POSIX)
// ============================================================================

// Owns an open file descriptor; closes it on destruction.
class FileInputStream : public InputStream {
public:
    explicit FileInputStream(int fd);
    ~FileInputStream() override;

    FileInputStream(const FileInputStream&) = delete;
    FileInputStream& operator=(const FileInputStream&) = delete;

    // Opens `path` read-only. Throws std::system_error on failure.
    static FileInputStream open(const std::string& path);

    FileInputStream(FileInputStream&& other) noexcept;

    int read() override;
    int64_t read(uint8_t* dst, size_t offset, size_t length) override;

    int fd() const { return fd_; }

    // Size of the underlying file, or -1 if it cannot be determined
    int64_t size_hint() const;

private:
    int fd_ = -1;
};

} // namespace scanio
