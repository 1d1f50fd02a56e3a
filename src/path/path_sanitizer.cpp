#include "scanio/path_sanitizer.hpp"

#include <string>
#include <utility>

namespace scanio {

namespace {

bool starts_with(const std::string& s, size_t pos, const char* prefix, size_t len) {
    return s.compare(pos, len, prefix) == 0;
}

// Drop the last segment of `out`. Trailing slashes delimit an empty
// segment, so they are skipped before looking for the separator.
void drop_last_segment(std::string& out) {
    size_t end = out.find_last_not_of('/');
    if (end == std::string::npos) {
        out.clear();
        return;
    }
    size_t slash = out.rfind('/', end);
    if (slash == std::string::npos) {
        out.clear();
    } else {
        out.resize(slash);
    }
}

// Remove every "/../" along with the segment preceding it
std::string collapse_parent_segments(const std::string& path) {
    size_t idx = path.find("/../");
    if (idx == std::string::npos) {
        return path;
    }

    std::string out;
    out.reserve(path.size());
    size_t src = 0;
    for (;;) {
        out.append(path, src, idx - src);
        drop_last_segment(out);
        // Resume at the trailing '/', which also starts "/../../" chains
        src = idx + 3;
        idx = path.find("/../", src);
        if (idx == std::string::npos) {
            out.append(path, src, std::string::npos);
            break;
        }
    }
    return out;
}

// Replace each occurrence of `pattern` (which ends in '/') by a single '/'
std::string collapse_pattern(const std::string& path, const std::string& pattern) {
    size_t idx = path.find(pattern);
    if (idx == std::string::npos) {
        return path;
    }

    std::string out;
    out.reserve(path.size());
    size_t src = 0;
    for (;;) {
        out.append(path, src, idx - src);
        src = idx + pattern.size() - 1;
        idx = path.find(pattern, src);
        if (idx == std::string::npos) {
            out.append(path, src, std::string::npos);
            break;
        }
    }
    return out;
}

std::string strip_leading_segments(const std::string& path) {
    size_t start = 0;
    for (;;) {
        if (starts_with(path, start, "./", 2)) {
            start += 2;
        } else if (starts_with(path, start, "../", 3)) {
            start += 3;
        } else if (start < path.size() && path[start] == '/') {
            ++start;
        } else {
            break;
        }
    }

    std::string rest = path.substr(start);
    if (rest == "." || rest == "..") {
        return {};
    }
    return rest;
}

std::string sanitize_once(const std::string& path) {
    std::string out = collapse_parent_segments(path);
    out = collapse_pattern(out, "/./");
    out = collapse_pattern(out, "//");
    return strip_leading_segments(out);
}

} // namespace

std::string sanitize_entry_path(const std::string& entry_path) {
    std::string path = entry_path;
    // Each round only ever removes characters, so this terminates
    for (;;) {
        std::string next = sanitize_once(path);
        if (next == path) {
            return next;
        }
        path = std::move(next);
    }
}

bool is_sanitized(const std::string& path) {
    if (path == "." || path == "..") {
        return false;
    }
    if (starts_with(path, 0, "/", 1) || starts_with(path, 0, "./", 2) ||
        starts_with(path, 0, "../", 3)) {
        return false;
    }
    return path.find("/../") == std::string::npos &&
           path.find("/./") == std::string::npos &&
           path.find("//") == std::string::npos;
}

} // namespace scanio
