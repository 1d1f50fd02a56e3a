#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace scanio {

// ============================================================================
// Native mapped region
// ============================================================================

enum class UnmapStatus {
    Unmapped,
    AlreadyReleased,
    InvalidArgument,
    Failed,
};

struct UnmapResult {
    UnmapStatus status = UnmapStatus::Failed;
    int error_code = 0;  // errno when status is InvalidArgument or Failed
};

// A region of native memory obtained from mmap. Unmapped exactly once:
// either explicitly through unmap() or when the last owner goes away.
class MappedRegion {
public:
    MappedRegion(void* address, size_t length, bool writable, std::string origin);
    ~MappedRegion();

    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    uint8_t* address() const { return static_cast<uint8_t*>(address_); }
    size_t length() const { return length_; }
    bool writable() const { return writable_; }
    const std::string& origin() const { return origin_; }

    bool released() const { return released_.load(std::memory_order_acquire); }

    // Unmap now. Serialized; only the first successful call unmaps.
    UnmapResult unmap();

private:
    void* address_;
    size_t length_;
    bool writable_;
    std::string origin_;
    std::mutex mutex_;
    std::atomic<bool> released_{false};
};

// ============================================================================
// Byte buffer handle
// ============================================================================

enum class BufferKind {
    Heap,    // ordinary heap memory, reclaimed with the last handle
    Direct,  // backed by a MappedRegion
};

struct BufferResult;

// Shared handle onto heap or mapped bytes, in the manner of a NIO buffer.
//
// duplicate() and slice() produce views sharing the same storage. A view of
// a direct buffer records the region it was derived from in attachment();
// only the original buffer (attachment() == nullptr) may be released early,
// since releasing through a view would unmap memory other handles still use.
class ByteBuffer {
public:
    ByteBuffer() = default;

    // Heap buffer owning `bytes`
    static ByteBuffer wrap(std::vector<uint8_t> bytes);

    // Zero-filled anonymous mapping of `size` bytes
    static BufferResult allocate_direct(size_t size);

    // Read-only private mapping of the whole file at `path`
    static BufferResult map_file(const std::string& path);

    BufferKind kind() const { return kind_; }
    bool is_direct() const { return kind_ == BufferKind::Direct; }

    // nullptr once the backing region has been released
    const uint8_t* data() const;

    // nullptr for read-only mappings and released buffers
    uint8_t* mutable_data() const;

    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    // True once the backing region was released through any handle
    bool is_released() const;

    ByteBuffer duplicate() const;

    // View of [offset, offset + length). Throws std::out_of_range when the
    // range does not fit in this buffer.
    ByteBuffer slice(size_t offset, size_t length) const;

    // The owning region if this buffer is a view of a direct buffer
    const std::shared_ptr<MappedRegion>& attachment() const { return attachment_; }

    // The backing region of a direct buffer, nullptr for heap buffers
    const std::shared_ptr<MappedRegion>& region() const { return region_; }

private:
    BufferKind kind_ = BufferKind::Heap;
    std::shared_ptr<std::vector<uint8_t>> heap_;
    std::shared_ptr<MappedRegion> region_;
    std::shared_ptr<MappedRegion> attachment_;
    size_t offset_ = 0;
    size_t size_ = 0;
};

struct BufferResult {
    bool ok = false;
    std::string error;
    ByteBuffer buffer;
};

} // namespace scanio
