#pragma once

/**
 * scanio - I/O primitives for classpath and resource scanning
 *
 * Umbrella header:
 *   - stream draining with untrusted size hints (stream_drain.hpp)
 *   - archive entry path sanitizing (path_sanitizer.hpp)
 *   - early release of mapped buffers (buffer_release.hpp)
 */

#include "scanio/buffer_release.hpp"
#include "scanio/byte_buffer.hpp"
#include "scanio/config.hpp"
#include "scanio/file_utils.hpp"
#include "scanio/input_stream.hpp"
#include "scanio/logging.hpp"
#include "scanio/path_sanitizer.hpp"
#include "scanio/platform.hpp"
#include "scanio/stream_drain.hpp"
