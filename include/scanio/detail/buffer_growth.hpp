#pragma once

#include <cstddef>

namespace scanio::detail {

// Capacity after growing a full buffer of `capacity` bytes: doubled, or
// clamped to kMaxBufferSize when doubling would pass it. Returns 0 when
// `capacity` is already kMaxBufferSize and the buffer cannot grow.
size_t next_capacity(size_t capacity);

} // namespace scanio::detail
