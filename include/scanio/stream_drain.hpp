#pragma once

#include "scanio/input_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace scanio {

// ============================================================================
// Buffer size limits
// ============================================================================

// Largest buffer drain() will allocate: 2^31 - 9, leaving headroom below
// the platform array-size limits of downstream consumers.
constexpr int64_t kMaxBufferSize = 2147483647LL - 8;

// Initial capacity when the size is unknown
constexpr int64_t kDefaultBufferSize = 16384;

// Cap on the initial capacity derived from a size hint
constexpr int64_t kMaxInitialBufferSize = 16 * 1024 * 1024;

// Size hint meaning "unknown"
constexpr int64_t kUnknownSize = -1;

enum class IoError {
    None,
    TooLarge,
    ReadFailure,
    OpenFailure,
};

const char* to_string(IoError error);

// ============================================================================
// Drain results
// ============================================================================

// `buffer` holds the bytes read; only the first `length` bytes are
// meaningful. drain() shrinks the buffer so buffer.size() == length.
struct DrainResult {
    bool ok = false;
    IoError kind = IoError::None;
    std::string error;
    std::vector<uint8_t> buffer;
    size_t length = 0;
};

struct TextDrainResult {
    bool ok = false;
    IoError kind = IoError::None;
    std::string error;
    std::string text;
};

// Read `stream` to end-of-stream into a single buffer.
//
// size_hint is advisory (e.g. an archive entry's declared size): it seeds
// the initial capacity but is capped at kMaxInitialBufferSize, so a forged
// size field cannot drive a large allocation. A hint above kMaxBufferSize
// is rejected up front. The buffer doubles whenever it fills, clamped to
// kMaxBufferSize; a stream longer than that fails with IoError::TooLarge.
// A read that delivers 0 bytes into a buffer with room left is retried
// without growing.
// A throwing stream yields IoError::ReadFailure and the partial buffer is
// discarded.
DrainResult drain(InputStream& stream, int64_t size_hint = kUnknownSize);

// drain(); the result buffer is already right-sized (buffer == contents)
DrainResult drain_as_bytes(InputStream& stream, int64_t size_hint = kUnknownSize);

// drain() decoding the bytes as UTF-8; malformed sequences become U+FFFD
TextDrainResult drain_as_string(InputStream& stream, int64_t size_hint = kUnknownSize);

// Replace every malformed UTF-8 sequence in `bytes` with U+FFFD
std::string decode_utf8(const uint8_t* bytes, size_t length);

} // namespace scanio
