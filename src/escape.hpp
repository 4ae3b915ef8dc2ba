#pragma once

#include <string>
#include <optional>

namespace nsf {

// Escapes & < > " ' for safe interpolation into HTML text and attributes
std::string html_escape(const std::string& text);

// Percent-encodes everything outside the RFC 3986 unreserved set, '/' included
std::string url_escape_segment(const std::string& segment);

// Escapes each '/'-separated segment, keeping the separators
std::string url_escape_path(const std::string& path);

// Decodes %XX sequences. Returns nullopt on a truncated or non-hex escape.
std::optional<std::string> percent_decode(const std::string& text);

// Value for a Content-Disposition header marking `filename` as a download.
// The quoted form carries an ASCII-only fallback, filename* the exact UTF-8 name.
std::string attachment_disposition(const std::string& filename);

} // namespace nsf
