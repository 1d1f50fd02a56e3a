#include "scanio/byte_buffer.hpp"
#include "scanio/logging.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace scanio {

// ============================================================================
// MappedRegion
// ============================================================================

MappedRegion::MappedRegion(void* address, size_t length, bool writable, std::string origin)
    : address_(address), length_(length), writable_(writable), origin_(std::move(origin)) {}

MappedRegion::~MappedRegion() {
    if (released()) {
        return;
    }
#ifndef _WIN32
    if (::munmap(address_, length_) != 0) {
        log::get()->warn("failed to unmap {} ({} bytes): {}", origin_, length_,
                         std::strerror(errno));
    }
#endif
}

UnmapResult MappedRegion::unmap() {
    UnmapResult result;
    std::lock_guard<std::mutex> lock(mutex_);

    if (released_.load(std::memory_order_relaxed)) {
        result.status = UnmapStatus::AlreadyReleased;
        return result;
    }

#ifdef _WIN32
    result.status = UnmapStatus::Failed;
#else
    if (::munmap(address_, length_) == 0) {
        released_.store(true, std::memory_order_release);
        result.status = UnmapStatus::Unmapped;
        return result;
    }
    result.error_code = errno;
    result.status = (result.error_code == EINVAL) ? UnmapStatus::InvalidArgument
                                                  : UnmapStatus::Failed;
#endif
    return result;
}

// ============================================================================
// ByteBuffer
// ============================================================================

ByteBuffer ByteBuffer::wrap(std::vector<uint8_t> bytes) {
    ByteBuffer buffer;
    buffer.kind_ = BufferKind::Heap;
    buffer.size_ = bytes.size();
    buffer.heap_ = std::make_shared<std::vector<uint8_t>>(std::move(bytes));
    return buffer;
}

BufferResult ByteBuffer::allocate_direct(size_t size) {
    BufferResult result;

#ifdef _WIN32
    result.error = "direct buffers are not supported on this platform";
#else
    if (size == 0) {
        result.error = "cannot allocate an empty direct buffer";
        return result;
    }

    void* address = ::mmap(nullptr, size, PROT_READ | PROT_WRITE,
                           MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (address == MAP_FAILED) {
        result.error = "failed to allocate direct buffer: " + std::string(std::strerror(errno));
        return result;
    }

    result.buffer.kind_ = BufferKind::Direct;
    result.buffer.region_ = std::make_shared<MappedRegion>(address, size, true, "anonymous");
    result.buffer.size_ = size;
    result.ok = true;
#endif

    return result;
}

BufferResult ByteBuffer::map_file(const std::string& path) {
    BufferResult result;

#ifdef _WIN32
    (void)path;
    result.error = "direct buffers are not supported on this platform";
#else
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        result.error = "failed to open " + path + ": " + std::strerror(errno);
        return result;
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        result.error = "failed to stat " + path + ": " + std::strerror(errno);
        ::close(fd);
        return result;
    }

    if (!S_ISREG(st.st_mode)) {
        result.error = "not a regular file: " + path;
        ::close(fd);
        return result;
    }

    if (st.st_size <= 0) {
        result.error = "cannot map empty file: " + path;
        ::close(fd);
        return result;
    }

    size_t length = static_cast<size_t>(st.st_size);
    void* address = ::mmap(nullptr, length, PROT_READ, MAP_PRIVATE, fd, 0);
    int map_errno = errno;
    // The mapping stays valid after the descriptor is closed
    ::close(fd);

    if (address == MAP_FAILED) {
        result.error = "failed to map " + path + ": " + std::strerror(map_errno);
        return result;
    }

    result.buffer.kind_ = BufferKind::Direct;
    result.buffer.region_ = std::make_shared<MappedRegion>(address, length, false, path);
    result.buffer.size_ = length;
    result.ok = true;
#endif

    return result;
}

const uint8_t* ByteBuffer::data() const {
    if (kind_ == BufferKind::Direct) {
        if (!region_ || region_->released()) {
            return nullptr;
        }
        return region_->address() + offset_;
    }
    if (!heap_) {
        return nullptr;
    }
    return heap_->data() + offset_;
}

uint8_t* ByteBuffer::mutable_data() const {
    if (kind_ == BufferKind::Direct) {
        if (!region_ || !region_->writable() || region_->released()) {
            return nullptr;
        }
        return region_->address() + offset_;
    }
    if (!heap_) {
        return nullptr;
    }
    return heap_->data() + offset_;
}

bool ByteBuffer::is_released() const {
    return kind_ == BufferKind::Direct && region_ && region_->released();
}

ByteBuffer ByteBuffer::duplicate() const {
    ByteBuffer view = *this;
    if (kind_ == BufferKind::Direct) {
        view.attachment_ = region_;
    }
    return view;
}

ByteBuffer ByteBuffer::slice(size_t offset, size_t length) const {
    if (offset > size_ || length > size_ - offset) {
        throw std::out_of_range("slice [" + std::to_string(offset) + ", +" +
                                std::to_string(length) + ") exceeds buffer of " +
                                std::to_string(size_) + " bytes");
    }
    ByteBuffer view = duplicate();
    view.offset_ = offset_ + offset;
    view.size_ = length;
    return view;
}

} // namespace scanio
