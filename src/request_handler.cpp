#include "request_handler.hpp"
#include "directory_listing.hpp"
#include "file_streamer.hpp"
#include "path_resolver.hpp"
#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <filesystem>
#include <utility>

namespace nsf {

namespace {

// Owns an open descriptor for the length of one request
class FileDescriptor {
public:
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() {
        if (fd_ >= 0) ::close(fd_);
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }

private:
    int fd_;
};

int reply_error(const WriteCallback& write, int status, bool head_only) {
    if (!send_error(write, status, head_only)) {
        spdlog::debug("Client went away before {} response", status);
    }
    return status;
}

} // namespace

RequestHandler::RequestHandler(const ServerConfig& config, DirectoryReader reader)
    : config_(config)
    , read_dir_(std::move(reader))
{
}

int RequestHandler::handle(const HttpRequest& request, const WriteCallback& write) const {
    auto start = std::chrono::steady_clock::now();
    spdlog::info("[REQUEST] {} {}", request.method, request.path);

    int status = dispatch(request, write);

    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start).count();
    spdlog::info("[COMPLETE] {} {} {} Duration: {:.3f}ms", request.method, request.path, status, elapsed);
    return status;
}

int RequestHandler::dispatch(const HttpRequest& request, const WriteCallback& write) const {
    const bool head_only = request.method == "HEAD";
    if (request.method != "GET" && !head_only) {
        return reply_error(write, 405, false);
    }

    ResolvedPath resolved = resolve_request_path(config_.root_dir, request.path);
    if (resolved.error == PathError::InvalidPath) {
        spdlog::warn("Rejected invalid path: {}", request.target);
        return reply_error(write, 400, head_only);
    }
    if (resolved.error == PathError::OutsideRoot) {
        spdlog::warn("Path traversal attempt: {} -> {}", request.target, resolved.full);
        return reply_error(write, 403, head_only);
    }
    spdlog::debug("Processing path: {} -> {}", request.path, resolved.full);

    // O_NONBLOCK keeps a FIFO from stalling the open; regular reads ignore it
    FileDescriptor file(::open(resolved.full.c_str(), O_RDONLY | O_CLOEXEC | O_NONBLOCK));
    if (!file.valid()) {
        spdlog::warn("File open failed: {}: {}", resolved.full, std::strerror(errno));
        return reply_error(write, 404, head_only);
    }

    struct stat info {};
    if (::fstat(file.get(), &info) != 0) {
        spdlog::error("File stat failed: {}: {}", resolved.full, std::strerror(errno));
        return reply_error(write, 500, head_only);
    }

    if (S_ISDIR(info.st_mode)) {
        return list_directory(resolved.full, resolved.relative, write, head_only);
    }

    if (!S_ISREG(info.st_mode)) {
        spdlog::warn("Refusing to serve special file: {}", resolved.full);
        return reply_error(write, 403, head_only);
    }

    FileTransfer transfer;
    transfer.absolute_path = resolved.full;
    transfer.display_name = std::filesystem::path(resolved.full).filename().string();
    transfer.size_bytes = static_cast<uint64_t>(info.st_size);

    if (!stream_file(write, file.get(), transfer, head_only)) {
        spdlog::debug("Download of {} incomplete", transfer.absolute_path);
    }
    return 200;
}

int RequestHandler::list_directory(const std::string& full_path, const std::string& relative_path,
                                   const WriteCallback& write, bool head_only) const {
    std::error_code ec;
    auto children = read_dir_(full_path, ec);
    if (ec) {
        spdlog::warn("Directory read error: {}: {}", full_path, ec.message());
        return reply_error(write, 403, head_only);
    }

    std::string body = render_directory_listing(build_directory_listing(relative_path, children));

    HttpResponse response;
    response.set_header("Content-Type", "text/html; charset=utf-8");
    if (!send_response(write, std::move(response), body, head_only)) {
        spdlog::warn("Listing for /{} not delivered: client went away", relative_path);
    }
    return 200;
}

} // namespace nsf
