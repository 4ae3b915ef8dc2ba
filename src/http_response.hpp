#pragma once

#include <string>
#include <vector>
#include <utility>
#include <functional>
#include <cstddef>

namespace nsf {

// Sink for response bytes. Returns false once the peer is gone.
using WriteCallback = std::function<bool(const char* data, size_t size)>;

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;

    void set_header(const std::string& name, const std::string& value);

    // Status line and header block, terminated by the blank line
    std::string serialize_head() const;
};

const char* status_text(int status);

// Sends a complete response whose body is already in memory. Content-Length
// is set from body; the body is skipped for HEAD.
bool send_response(const WriteCallback& write, HttpResponse response,
                   const std::string& body, bool head_only = false);

// Plain-text "<code> <reason>" error page
bool send_error(const WriteCallback& write, int status, bool head_only = false);

} // namespace nsf
