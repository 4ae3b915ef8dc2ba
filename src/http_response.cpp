#include "http_response.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace nsf {

namespace {

bool iequals(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

} // namespace

void HttpResponse::set_header(const std::string& name, const std::string& value) {
    for (auto& [key, existing] : headers) {
        if (iequals(key, name)) {
            existing = value;
            return;
        }
    }
    headers.emplace_back(name, value);
}

std::string HttpResponse::serialize_head() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
    for (const auto& [key, value] : headers) {
        oss << key << ": " << value << "\r\n";
    }
    oss << "Server: nsf/" << NSF_VERSION << "\r\n"
        << "Connection: close\r\n"
        << "\r\n";
    return oss.str();
}

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        default:  return "Unknown";
    }
}

bool send_response(const WriteCallback& write, HttpResponse response,
                   const std::string& body, bool head_only) {
    response.set_header("Content-Length", std::to_string(body.size()));
    std::string head = response.serialize_head();
    if (!write(head.data(), head.size())) {
        return false;
    }
    if (head_only || body.empty()) {
        return true;
    }
    return write(body.data(), body.size());
}

bool send_error(const WriteCallback& write, int status, bool head_only) {
    HttpResponse response;
    response.status = status;
    response.set_header("Content-Type", "text/plain; charset=utf-8");
    if (status == 405) {
        response.set_header("Allow", "GET, HEAD");
    }
    std::string body = std::to_string(status) + " " + status_text(status) + "\n";
    return send_response(write, std::move(response), body, head_only);
}

} // namespace nsf
