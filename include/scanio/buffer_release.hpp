#pragma once

#include "scanio/byte_buffer.hpp"

#include <string>

namespace spdlog {
class logger;
}

namespace scanio {

// ============================================================================
// Release capability
// ============================================================================

enum class ReleaseCapability {
    Unavailable,    // rely on RAII release when the last handle goes away
    DirectRelease,  // the platform can unmap a region on request
};

enum class ReleaseMechanism {
    None,
    PosixMunmap,
};

struct CapabilityInfo {
    ReleaseCapability capability = ReleaseCapability::Unavailable;
    ReleaseMechanism mechanism = ReleaseMechanism::None;
    std::string detail;  // probe outcome, for diagnostics
};

const char* to_string(ReleaseCapability capability);
const char* to_string(ReleaseMechanism mechanism);

// Query the platform for an explicit "unmap now" operation. On POSIX this
// maps and unmaps one anonymous page, so sandboxes that forbid munmap are
// detected. Never throws; failures produce Unavailable with a detail message.
CapabilityInfo probe_release_capability();

// The process-wide capability, probed once on first call. Concurrent
// callers block until the probe finishes and all see the same value.
const CapabilityInfo& resolve_release_capability();

// ============================================================================
// Early release
// ============================================================================

// Forces the native memory behind direct buffers to be released now rather
// than when the last handle is destroyed.
class BufferReleaser {
public:
    explicit BufferReleaser(CapabilityInfo info);

    const CapabilityInfo& capability() const { return info_; }

    // Release the region behind `buffer`. Returns true only if this call
    // unmapped it. Returns false, without side effects, for heap buffers,
    // for duplicates and slices, for regions already released, and when the
    // capability is Unavailable. Failures are logged to `log` when given;
    // nothing is thrown. The buffer must not be read after a true return.
    bool release(const ByteBuffer& buffer, spdlog::logger* log = nullptr) const;

private:
    CapabilityInfo info_;
};

// BufferReleaser::release() using resolve_release_capability()
bool release_buffer(const ByteBuffer& buffer, spdlog::logger* log = nullptr);

} // namespace scanio
