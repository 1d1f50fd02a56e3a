#include "scanio/input_stream.hpp"
#include "scanio/byte_buffer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace scanio {

// ============================================================================
// ByteRegionInputStream
// ============================================================================

ByteRegionInputStream::ByteRegionInputStream(const uint8_t* data, size_t size)
    : data_(data), size_(data ? size : 0) {}

ByteRegionInputStream::ByteRegionInputStream(const std::vector<uint8_t>& data)
    : ByteRegionInputStream(data.data(), data.size()) {}

ByteRegionInputStream::ByteRegionInputStream(const ByteBuffer& buffer)
    : ByteRegionInputStream(buffer.data(), buffer.size()) {}

int ByteRegionInputStream::read() {
    if (position_ >= size_) {
        return kEndOfStream;
    }
    return data_[position_++];
}

int64_t ByteRegionInputStream::read(uint8_t* dst, size_t offset, size_t length) {
    if (position_ >= size_) {
        return kEndOfStream;
    }
    size_t count = std::min(length, size_ - position_);
    if (count > 0) {
        std::memcpy(dst + offset, data_ + position_, count);
        position_ += count;
    }
    return static_cast<int64_t>(count);
}

// ============================================================================
// FileInputStream
// ============================================================================

namespace {

#ifdef _WIN32
using io_size_t = unsigned int;
int sys_read(int fd, void* buf, io_size_t len) { return _read(fd, buf, len); }
int sys_close(int fd) { return _close(fd); }
#else
using io_size_t = size_t;
ssize_t sys_read(int fd, void* buf, io_size_t len) { return ::read(fd, buf, len); }
int sys_close(int fd) { return ::close(fd); }
#endif

// Cap a single read so the count fits the platform's return type
constexpr size_t kMaxReadChunk = 1u << 30;

} // namespace

FileInputStream::FileInputStream(int fd) : fd_(fd) {}

FileInputStream::~FileInputStream() {
    if (fd_ >= 0) {
        sys_close(fd_);
    }
}

FileInputStream::FileInputStream(FileInputStream&& other) noexcept : fd_(other.fd_) {
    other.fd_ = -1;
}

FileInputStream FileInputStream::open(const std::string& path) {
#ifdef _WIN32
    int fd = _open(path.c_str(), _O_RDONLY | _O_BINARY);
#else
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
#endif
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "failed to open " + path);
    }
    return FileInputStream(fd);
}

int FileInputStream::read() {
    uint8_t byte = 0;
    int64_t n = read(&byte, 0, 1);
    if (n <= 0) {
        return kEndOfStream;
    }
    return byte;
}

int64_t FileInputStream::read(uint8_t* dst, size_t offset, size_t length) {
    if (length == 0) {
        return 0;
    }
    size_t chunk = std::min(length, kMaxReadChunk);
    for (;;) {
        auto n = sys_read(fd_, dst + offset, static_cast<io_size_t>(chunk));
        if (n > 0) {
            return static_cast<int64_t>(n);
        }
        if (n == 0) {
            return kEndOfStream;
        }
        if (errno == EINTR) {
            continue;
        }
        throw std::system_error(errno, std::generic_category(), "read failed");
    }
}

int64_t FileInputStream::size_hint() const {
#ifdef _WIN32
    struct _stat64 st;
    if (_fstat64(fd_, &st) != 0) {
        return -1;
    }
#else
    struct stat st;
    if (::fstat(fd_, &st) != 0 || !S_ISREG(st.st_mode)) {
        return -1;
    }
#endif
    return static_cast<int64_t>(st.st_size);
}

} // namespace scanio
