#include "http_request.hpp"
#include "escape.hpp"
#include <algorithm>
#include <cctype>

namespace nsf {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    std::string wanted = to_lower(name);
    for (const auto& [key, value] : headers) {
        if (to_lower(key) == wanted) {
            return value;
        }
    }
    return "";
}

size_t find_header_end(const std::string& buffer) {
    auto pos = buffer.find("\r\n\r\n");
    if (pos == std::string::npos) return std::string::npos;
    return pos + 4;
}

ParseResult parse_request_head(const std::string& head) {
    ParseResult result;

    auto first_line_end = head.find("\r\n");
    if (first_line_end == std::string::npos) {
        result.error = ParseError::Incomplete;
        return result;
    }

    // Parse first line: "GET /path HTTP/1.1"
    std::string first_line = head.substr(0, first_line_end);
    auto sp1 = first_line.find(' ');
    auto sp2 = sp1 == std::string::npos ? std::string::npos : first_line.find(' ', sp1 + 1);
    if (sp1 == std::string::npos || sp2 == std::string::npos || sp1 == 0 || sp2 == sp1 + 1) {
        result.error = ParseError::Malformed;
        return result;
    }

    HttpRequest& req = result.request;
    req.method = first_line.substr(0, sp1);
    req.target = first_line.substr(sp1 + 1, sp2 - sp1 - 1);
    req.version = first_line.substr(sp2 + 1);

    if (req.version.rfind("HTTP/1.", 0) != 0 || req.target[0] != '/') {
        result.error = ParseError::Malformed;
        return result;
    }

    // Strip query string
    std::string raw_path = req.target;
    auto query = raw_path.find('?');
    if (query != std::string::npos) {
        req.query = raw_path.substr(query + 1);
        raw_path = raw_path.substr(0, query);
    }

    auto decoded = percent_decode(raw_path);
    if (!decoded) {
        result.error = ParseError::Malformed;
        return result;
    }
    req.path = *decoded;

    size_t pos = first_line_end + 2;
    while (pos < head.size()) {
        auto line_end = head.find("\r\n", pos);
        if (line_end == std::string::npos) line_end = head.size();
        std::string line = head.substr(pos, line_end - pos);
        pos = line_end + 2;

        if (line.empty()) break;

        auto colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            result.error = ParseError::Malformed;
            return result;
        }
        req.headers.emplace_back(line.substr(0, colon), trim(line.substr(colon + 1)));
    }

    return result;
}

} // namespace nsf
