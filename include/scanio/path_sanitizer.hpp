#pragma once

#include <string>

namespace scanio {

// Sanitize a relative archive-entry path against "zip slip" traversal.
// String-based only: `/` is the separator on every platform and nothing on
// disk is consulted.
//
// Passes, each over the whole string:
//   1. "/../" is removed together with the segment before it
//   2. "/./" becomes "/"
//   3. "//" becomes "/"
//   4. leading "./", "../" and "/" are stripped; a bare "." or ".." is dropped
// The passes repeat until the string stops changing, so the result never
// starts with "/", "./" or "../" and never contains "/../", "/./" or "//".
//
// Examples:
//   "../../etc/passwd" -> "etc/passwd"
//   "a//b/./c/../d"    -> "a/b/d"
//   "../"              -> ""
//
// Every untrusted entry name must go through this before it is used as a
// path relative to an extraction or lookup root.
std::string sanitize_entry_path(const std::string& entry_path);

// True if `path` is already in sanitized form
bool is_sanitized(const std::string& path);

} // namespace scanio
