#include "file_streamer.hpp"
#include "escape.hpp"
#include <spdlog/spdlog.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <vector>

namespace nsf {

namespace {
constexpr size_t kChunkSize = 64 * 1024;
}

HttpResponse make_download_response(const FileTransfer& transfer) {
    HttpResponse response;
    response.status = 200;
    response.set_header("Content-Disposition", attachment_disposition(transfer.display_name));
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("Content-Length", std::to_string(transfer.size_bytes));
    return response;
}

bool stream_file(const WriteCallback& write, int fd, const FileTransfer& transfer,
                 bool head_only) {
    std::string head = make_download_response(transfer).serialize_head();
    if (!write(head.data(), head.size())) {
        spdlog::warn("File transfer aborted before body: {}", transfer.absolute_path);
        return false;
    }
    if (head_only) {
        return true;
    }

    std::vector<char> buf(kChunkSize);
    uint64_t remaining = transfer.size_bytes;

    // Content-Length is already on the wire, so stop at the stat size even if the file grew
    while (remaining > 0) {
        size_t want = remaining < kChunkSize ? static_cast<size_t>(remaining) : kChunkSize;
        ssize_t n = ::read(fd, buf.data(), want);
        if (n < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("File transfer error reading {}: {}", transfer.absolute_path,
                         std::strerror(errno));
            return false;
        }
        if (n == 0) {
            spdlog::warn("File transfer error: {} shrank by {} bytes during transfer",
                         transfer.absolute_path, remaining);
            return false;
        }
        if (!write(buf.data(), static_cast<size_t>(n))) {
            spdlog::warn("File transfer error: client went away during {} ({} bytes left)",
                         transfer.absolute_path, remaining);
            return false;
        }
        remaining -= static_cast<uint64_t>(n);
    }
    return true;
}

} // namespace nsf
