#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace scanio {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    BSD,
    Solaris,
    Unix,
    Unknown
};

Platform get_current_platform();

const char* to_string(Platform platform);

// ============================================================================
// Mapped-read threshold
// ============================================================================

// Smallest file size, in bytes, at which reading through a memory mapping
// beats reading through a stream. -1 means "always map".
//
// Defaults per platform, from file-read benchmarks:
//   - Linux, macOS, BSD, Solaris, other Unix, Unknown: 16384
//   - Windows: -1 (mapping is faster even for small files)
int64_t default_mapped_read_threshold(Platform platform);

using ThresholdProvider = std::function<int64_t()>;

// Replace the threshold lookup. Passing an empty function restores the
// per-platform default.
void set_mapped_read_threshold_provider(ThresholdProvider provider);

// The active threshold: the installed provider's value, or the default
// for the current platform.
int64_t mapped_read_threshold();

// True if a file of `file_size` bytes should be read through a mapping
bool should_map_file(int64_t file_size);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Size of a virtual memory page, or 0 if it cannot be determined
size_t page_size();

} // namespace scanio
