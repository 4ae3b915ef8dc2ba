#pragma once

#include <string>
#include <istream>
#include <ostream>

namespace nsf {

// Empty if path is an existing directory, otherwise the reason it is not
std::string validate_directory(const std::string& path);

// Expands symlinks and makes the path absolute. Throws std::runtime_error.
std::string resolve_root(const std::string& path);

// Asks on `out` until `in` yields a usable directory. Throws
// std::runtime_error when input ends first.
std::string prompt_for_directory(std::istream& in, std::ostream& out);

// Best-effort LAN address for the startup banner. Never fails; falls back to
// 127.0.0.1.
std::string detect_local_ip();

} // namespace nsf
