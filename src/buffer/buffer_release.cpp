#include "scanio/buffer_release.hpp"
#include "scanio/logging.hpp"
#include "scanio/platform.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <mutex>
#include <utility>

#ifndef _WIN32
#include <sys/mman.h>
#endif

namespace scanio {

const char* to_string(ReleaseCapability capability) {
    switch (capability) {
        case ReleaseCapability::Unavailable: return "unavailable";
        case ReleaseCapability::DirectRelease: return "direct_release";
    }
    return "unknown";
}

const char* to_string(ReleaseMechanism mechanism) {
    switch (mechanism) {
        case ReleaseMechanism::None: return "none";
        case ReleaseMechanism::PosixMunmap: return "munmap";
    }
    return "unknown";
}

CapabilityInfo probe_release_capability() {
    CapabilityInfo info;

#ifdef _WIN32
    info.detail = "direct buffers are not supported on this platform";
#else
    size_t page = page_size();
    if (page == 0) {
        info.detail = "page size unavailable";
        return info;
    }

    void* trial = ::mmap(nullptr, page, PROT_READ | PROT_WRITE,
                         MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (trial == MAP_FAILED) {
        info.detail = "trial mapping failed: " + std::string(std::strerror(errno));
        return info;
    }
    if (::munmap(trial, page) != 0) {
        info.detail = "trial unmap failed: " + std::string(std::strerror(errno));
        return info;
    }

    info.capability = ReleaseCapability::DirectRelease;
    info.mechanism = ReleaseMechanism::PosixMunmap;
    info.detail = "munmap available (page size " + std::to_string(page) + ")";
#endif

    return info;
}

const CapabilityInfo& resolve_release_capability() {
    static std::once_flag once;
    static CapabilityInfo resolved;
    std::call_once(once, [] {
        resolved = probe_release_capability();
        auto logger = log::get();
        if (resolved.capability == ReleaseCapability::DirectRelease) {
            logger->debug("early buffer release: {}", resolved.detail);
        } else {
            logger->warn("early buffer release unavailable: {}", resolved.detail);
        }
    });
    return resolved;
}

BufferReleaser::BufferReleaser(CapabilityInfo info) : info_(std::move(info)) {}

bool BufferReleaser::release(const ByteBuffer& buffer, spdlog::logger* log) const {
    if (!buffer.is_direct()) {
        return false;
    }

    if (info_.capability == ReleaseCapability::Unavailable) {
        if (log) {
            log->debug("could not release buffer: {}", info_.detail);
        }
        return false;
    }

    // Views share the owner's region; unmapping through one would leave
    // the owner and its other views pointing at freed memory
    if (buffer.attachment()) {
        return false;
    }

    try {
        const auto& region = buffer.region();
        if (!region) {
            if (log) {
                log->debug("could not release buffer: no backing region");
            }
            return false;
        }

        UnmapResult unmapped = region->unmap();
        switch (unmapped.status) {
            case UnmapStatus::Unmapped:
                return true;
            case UnmapStatus::AlreadyReleased:
            case UnmapStatus::InvalidArgument:
                return false;
            case UnmapStatus::Failed:
                if (log) {
                    log->warn("could not release buffer {}: {}", region->origin(),
                              std::strerror(unmapped.error_code));
                }
                return false;
        }
    } catch (const std::exception& e) {
        if (log) {
            log->warn("could not release buffer: {}", e.what());
        }
    }
    return false;
}

bool release_buffer(const ByteBuffer& buffer, spdlog::logger* log) {
    if (!buffer.is_direct()) {
        return false;
    }
    static const BufferReleaser releaser(resolve_release_capability());
    return releaser.release(buffer, log);
}

} // namespace scanio
