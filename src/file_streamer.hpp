#pragma once

#include "http_response.hpp"
#include <string>
#include <cstdint>

namespace nsf {

struct FileTransfer {
    std::string absolute_path;
    std::string display_name;
    uint64_t size_bytes = 0;
};

// Build the download headers for a transfer
HttpResponse make_download_response(const FileTransfer& transfer);

// Sends headers and then copies exactly transfer.size_bytes from fd.
// A read or write failure mid-body is logged and ends the response;
// nothing already sent can be taken back.
bool stream_file(const WriteCallback& write, int fd, const FileTransfer& transfer,
                 bool head_only = false);

} // namespace nsf
