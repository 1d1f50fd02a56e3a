#include "scanio/file_utils.hpp"
#include "scanio/buffer_release.hpp"
#include "scanio/config.hpp"
#include "scanio/input_stream.hpp"
#include "scanio/logging.hpp"
#include "scanio/platform.hpp"

#include <cctype>
#include <exception>
#include <filesystem>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <io.h>
#else
#include <unistd.h>
#endif

namespace scanio {

namespace fs = std::filesystem;

namespace {

bool ends_with_ignore_case(const std::string& s, const std::string& suffix) {
    if (s.size() < suffix.size()) {
        return false;
    }
    size_t base = s.size() - suffix.size();
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(s[base + i])) !=
            std::tolower(static_cast<unsigned char>(suffix[i]))) {
            return false;
        }
    }
    return true;
}

int64_t file_size_or_unknown(const std::string& path) {
    std::error_code ec;
    auto size = fs::file_size(path, ec);
    if (ec) {
        return kUnknownSize;
    }
    return static_cast<int64_t>(size);
}

FileReadResult read_via_stream(const std::string& path) {
    FileReadResult result;
    result.method = ReadMethod::Stream;

    DrainResult drained;
    try {
        auto stream = FileInputStream::open(path);
        drained = drain_as_bytes(stream, stream.size_hint());
    } catch (const std::system_error& e) {
        result.kind = IoError::OpenFailure;
        result.error = e.what();
        return result;
    }

    if (!drained.ok) {
        result.kind = drained.kind;
        result.error = drained.error;
        return result;
    }

    result.ok = true;
    result.data = std::move(drained.buffer);
    return result;
}

FileReadResult read_via_mapping(const std::string& path, const ByteBuffer& mapped) {
    FileReadResult result;
    result.method = ReadMethod::Mapped;

    ByteRegionInputStream stream(mapped);
    DrainResult drained = drain_as_bytes(stream, static_cast<int64_t>(mapped.size()));
    if (!drained.ok) {
        result.kind = drained.kind;
        result.error = drained.error;
        return result;
    }

    result.ok = true;
    result.data = std::move(drained.buffer);

    if (early_release_enabled()) {
        result.released_early = release_buffer(mapped, log::get().get());
        if (!result.released_early) {
            log::get()->debug("{} left mapped until its handle is destroyed", path);
        }
    }
    return result;
}

} // namespace

bool is_classfile(const std::string& path) {
    return path.size() > 6 && ends_with_ignore_case(path, ".class");
}

bool can_read(const std::string& path) {
    try {
        if (!fs::exists(path)) {
            return false;
        }
    } catch (const fs::filesystem_error&) {
        return false;
    }
#ifdef _WIN32
    return _access(path.c_str(), 4) == 0;
#else
    return ::access(path.c_str(), R_OK) == 0;
#endif
}

const char* to_string(ReadMethod method) {
    switch (method) {
        case ReadMethod::Stream: return "stream";
        case ReadMethod::Mapped: return "mapped";
    }
    return "unknown";
}

FileReadResult read_file(const std::string& path) {
    int64_t size = file_size_or_unknown(path);
    if (size > kMaxBufferSize) {
        FileReadResult result;
        result.kind = IoError::TooLarge;
        result.error = "file is too large to read: " + path;
        return result;
    }

    if (should_map_file(size)) {
        BufferResult mapped = ByteBuffer::map_file(path);
        if (mapped.ok) {
            return read_via_mapping(path, mapped.buffer);
        }
        log::get()->debug("mapping {} failed, falling back to stream: {}", path, mapped.error);
    }

    return read_via_stream(path);
}

BufferResult open_file_buffer(const std::string& path) {
    int64_t size = file_size_or_unknown(path);
    if (should_map_file(size)) {
        BufferResult mapped = ByteBuffer::map_file(path);
        if (mapped.ok) {
            return mapped;
        }
        log::get()->debug("mapping {} failed, falling back to stream: {}", path, mapped.error);
    }

    BufferResult result;
    FileReadResult read = read_via_stream(path);
    if (!read.ok) {
        result.error = read.error;
        return result;
    }
    result.ok = true;
    result.buffer = ByteBuffer::wrap(std::move(read.data));
    return result;
}

} // namespace scanio
