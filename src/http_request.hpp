#pragma once

#include <string>
#include <vector>
#include <utility>
#include <optional>

namespace nsf {

struct HttpRequest {
    std::string method;
    std::string target;    // raw request-target as sent
    std::string path;      // percent-decoded, query stripped
    std::string query;
    std::string version;
    std::vector<std::pair<std::string, std::string>> headers;

    // Case-insensitive header lookup, empty if absent
    std::string header(const std::string& name) const;
};

enum class ParseError {
    None,
    Incomplete,     // no blank line yet
    Malformed,
};

struct ParseResult {
    ParseError error = ParseError::None;
    HttpRequest request;
};

// Offset just past the "\r\n\r\n" that ends the header block, npos if absent
size_t find_header_end(const std::string& buffer);

// Parses "METHOD target HTTP/x.y\r\n" followed by header lines
ParseResult parse_request_head(const std::string& head);

} // namespace nsf
