#include "scanio/stream_drain.hpp"
#include "scanio/detail/buffer_growth.hpp"
#include "scanio/logging.hpp"

#include <algorithm>
#include <exception>
#include <new>
#include <string>
#include <utility>
#include <vector>

namespace scanio {

namespace {

constexpr char kReplacementChar[] = "\xEF\xBF\xBD";

DrainResult fail(IoError kind, std::string message) {
    DrainResult result;
    result.kind = kind;
    result.error = std::move(message);
    return result;
}

size_t initial_capacity(int64_t size_hint) {
    if (size_hint < 1) {
        return static_cast<size_t>(kDefaultBufferSize);
    }
    // The hint may come from an untrusted header; never allocate more than
    // kMaxInitialBufferSize on its word alone.
    return static_cast<size_t>(std::min(size_hint, kMaxInitialBufferSize));
}

} // namespace

namespace detail {

size_t next_capacity(size_t capacity) {
    constexpr size_t max_size = static_cast<size_t>(kMaxBufferSize);
    if (capacity >= max_size) {
        return 0;
    }
    if (capacity <= max_size - capacity) {
        return capacity << 1;
    }
    return max_size;
}

} // namespace detail

const char* to_string(IoError error) {
    switch (error) {
        case IoError::None: return "none";
        case IoError::TooLarge: return "too_large";
        case IoError::ReadFailure: return "read_failure";
        case IoError::OpenFailure: return "open_failure";
    }
    return "unknown";
}

DrainResult drain(InputStream& stream, int64_t size_hint) {
    if (size_hint > kMaxBufferSize) {
        return fail(IoError::TooLarge,
                    "input stream is too large to read: declared size " + std::to_string(size_hint));
    }

    size_t capacity = initial_capacity(size_hint);
    size_t total = 0;
    std::vector<uint8_t> buffer;

    try {
        buffer.resize(capacity);

        for (;;) {
            // Only a full buffer grows; a 0-byte read with room left is retried
            if (total == capacity) {
                size_t next = detail::next_capacity(capacity);
                if (next == 0) {
                    if (stream.read() < 0) {
                        break;
                    }
                    log::get()->debug("drain: stream exceeds {} bytes", capacity);
                    return fail(IoError::TooLarge, "input stream is too large to read");
                }
                capacity = next;
                buffer.resize(capacity);
            }

            int64_t bytes_read = stream.read(buffer.data(), total, capacity - total);
            if (bytes_read < 0) {
                break;
            }
            if (static_cast<uint64_t>(bytes_read) > capacity - total) {
                return fail(IoError::ReadFailure, "stream reported more bytes than requested");
            }
            total += static_cast<size_t>(bytes_read);
        }
    } catch (const std::bad_alloc&) {
        return fail(IoError::TooLarge,
                    "out of memory growing buffer to " + std::to_string(capacity) + " bytes");
    } catch (const std::exception& e) {
        return fail(IoError::ReadFailure, e.what());
    }

    DrainResult result;
    result.ok = true;
    result.length = total;
    if (buffer.size() == total) {
        result.buffer = std::move(buffer);
    } else {
        result.buffer.assign(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(total));
    }
    return result;
}

DrainResult drain_as_bytes(InputStream& stream, int64_t size_hint) {
    return drain(stream, size_hint);
}

TextDrainResult drain_as_string(InputStream& stream, int64_t size_hint) {
    DrainResult drained = drain(stream, size_hint);

    TextDrainResult result;
    result.ok = drained.ok;
    result.kind = drained.kind;
    result.error = std::move(drained.error);
    if (drained.ok) {
        result.text = decode_utf8(drained.buffer.data(), drained.length);
    }
    return result;
}

std::string decode_utf8(const uint8_t* bytes, size_t length) {
    std::string out;
    out.reserve(length);

    size_t i = 0;
    while (i < length) {
        uint8_t lead = bytes[i];
        if (lead < 0x80) {
            out.push_back(static_cast<char>(lead));
            ++i;
            continue;
        }

        // Continuation byte bounds for the first trailing byte; the rest
        // are always 0x80..0xBF. Rejects overlongs, surrogates and > U+10FFFF.
        size_t needed = 0;
        uint8_t lower = 0x80;
        uint8_t upper = 0xBF;
        if (lead >= 0xC2 && lead <= 0xDF) {
            needed = 1;
        } else if (lead == 0xE0) {
            needed = 2;
            lower = 0xA0;
        } else if ((lead >= 0xE1 && lead <= 0xEC) || lead == 0xEE || lead == 0xEF) {
            needed = 2;
        } else if (lead == 0xED) {
            needed = 2;
            upper = 0x9F;
        } else if (lead == 0xF0) {
            needed = 3;
            lower = 0x90;
        } else if (lead >= 0xF1 && lead <= 0xF3) {
            needed = 3;
        } else if (lead == 0xF4) {
            needed = 3;
            upper = 0x8F;
        } else {
            out.append(kReplacementChar, 3);
            ++i;
            continue;
        }

        size_t j = i + 1;
        size_t seen = 0;
        while (seen < needed && j < length) {
            uint8_t c = bytes[j];
            if (c < lower || c > upper) break;
            lower = 0x80;
            upper = 0xBF;
            ++seen;
            ++j;
        }

        if (seen == needed) {
            out.append(reinterpret_cast<const char*>(bytes + i), needed + 1);
        } else {
            // Maximal subpart replaced by a single U+FFFD
            out.append(kReplacementChar, 3);
        }
        i = j;
    }

    return out;
}

} // namespace scanio
