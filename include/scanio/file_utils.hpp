#pragma once

#include "scanio/byte_buffer.hpp"
#include "scanio/stream_drain.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace scanio {

// True if `path` names a classfile: longer than ".class" and ending in
// ".class", ignoring case.
bool is_classfile(const std::string& path);

// True if `path` exists and the process may read it. Never throws.
bool can_read(const std::string& path);

enum class ReadMethod {
    Stream,
    Mapped,
};

const char* to_string(ReadMethod method);

struct FileReadResult {
    bool ok = false;
    IoError kind = IoError::None;
    std::string error;
    std::vector<uint8_t> data;
    ReadMethod method = ReadMethod::Stream;
    bool released_early = false;  // mapping was force-unmapped after copying
};

// Read a whole file. Files at or above mapped_read_threshold() are mapped
// and drained through a ByteRegionInputStream, then released early when
// early_release_enabled(); smaller files are drained from a FileInputStream
// using the file size as the hint.
FileReadResult read_file(const std::string& path);

// Open a file as a buffer without copying large files: a direct (mapped)
// buffer above the threshold, otherwise a heap buffer holding the drained
// bytes. The caller owns the buffer and may pass it to release_buffer().
BufferResult open_file_buffer(const std::string& path);

} // namespace scanio
