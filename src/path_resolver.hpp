#pragma once

#include <string>

namespace nsf {

enum class PathError {
    None,
    InvalidPath,   // NUL byte or otherwise unusable
    OutsideRoot,   // joined path escaped the root directory
};

struct ResolvedPath {
    PathError error = PathError::None;
    std::string relative;   // cleaned, no leading '/', "" for the root itself
    std::string full;       // root_dir joined with relative

    bool ok() const { return error == PathError::None; }
};

// Lexically normalizes a '/'-separated path: collapses repeated separators,
// drops "." and lets ".." remove the previous element. A rooted path never
// climbs above "/". Returns "." for an empty relative result.
std::string clean_path(const std::string& path);

// Parent of a cleaned relative path, "" when it has a single element
std::string parent_path(const std::string& relative);

// Joins two cleaned paths with exactly one '/'
std::string join_path(const std::string& base, const std::string& rel);

// Maps a decoded request path ("/a/b") onto root_dir. root_dir must already be
// absolute and canonical. The result always lies within root_dir.
ResolvedPath resolve_request_path(const std::string& root_dir, const std::string& request_path);

} // namespace nsf
