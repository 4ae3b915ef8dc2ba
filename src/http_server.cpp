#include "http_server.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace nsf {

namespace {

using std::chrono::milliseconds;

milliseconds time_left(std::chrono::steady_clock::time_point deadline) {
    return std::chrono::duration_cast<milliseconds>(deadline - std::chrono::steady_clock::now());
}

// Bounds a single blocking call; the caller enforces the overall deadline
void set_socket_timeout(int fd, int option, milliseconds timeout) {
    // A zero timeval would mean "block forever"
    long ms = std::max<long>(1, static_cast<long>(timeout.count()));
    timeval tv{};
    tv.tv_sec = ms / 1000;
    tv.tv_usec = (ms % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv)) < 0) {
        spdlog::debug("HTTP: setsockopt timeout failed: {}", std::strerror(errno));
    }
}

// Half-close and drain: close() with unread input sends RST and can drop the
// error response before the client reads it
void linger_close(int fd) {
    shutdown(fd, SHUT_WR);
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(1);
    char buf[4096];
    size_t drained = 0;
    while (drained < 64 * 1024) {
        auto left = time_left(deadline);
        if (left.count() <= 0) break;
        set_socket_timeout(fd, SO_RCVTIMEO, left);
        ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        drained += static_cast<size_t>(n);
    }
}

} // namespace

milliseconds accept_backoff(int err) {
    switch (err) {
        case EMFILE:
        case ENFILE:
        case ENOBUFS:
        case ENOMEM:
            return milliseconds(100);
        default:
            return milliseconds(0);
    }
}

HttpServer::HttpServer(const ServerConfig& config)
    : config_(config)
    , handler_(config)
{
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(config_.port);
    if (inet_pton(AF_INET, config_.bind_address.c_str(), &addr.sin_addr) != 1) {
        spdlog::error("HTTP: Invalid bind address '{}'", config_.bind_address);
        return false;
    }

    server_fd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        spdlog::error("HTTP: Failed to create socket: {}", std::strerror(errno));
        return false;
    }

    int opt = 1;
    setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    if (bind(server_fd_, (sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("HTTP: Failed to bind to {}:{}: {}", config_.bind_address, config_.port,
                      std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    if (listen(server_fd_, 64) < 0) {
        spdlog::error("HTTP: Failed to listen: {}", std::strerror(errno));
        close(server_fd_);
        server_fd_ = -1;
        return false;
    }

    sockaddr_in bound{};
    socklen_t bound_len = sizeof(bound);
    if (getsockname(server_fd_, (sockaddr*)&bound, &bound_len) == 0) {
        bound_port_ = ntohs(bound.sin_port);
    } else {
        bound_port_ = config_.port;
    }

    running_.store(true);
    thread_ = std::thread(&HttpServer::server_thread, this);
    spdlog::info("HTTP server listening on http://{}:{} (root: {})",
                 config_.bind_address, bound_port_, config_.root_dir);
    return true;
}

void HttpServer::stop() {
    running_.store(false);
    if (server_fd_ >= 0) {
        shutdown(server_fd_, SHUT_RDWR);
        close(server_fd_);
        server_fd_ = -1;
    }
    if (thread_.joinable()) {
        thread_.join();
    }

    // Connection threads reference this object, so wait for all of them.
    // Shutting the sockets down wakes any thread blocked in recv/send.
    std::unique_lock<std::mutex> lock(clients_mutex_);
    if (!client_fds_.empty()) {
        spdlog::info("HTTP: Closing {} open connections", client_fds_.size());
    }
    for (int fd : client_fds_) {
        shutdown(fd, SHUT_RDWR);
    }
    clients_cv_.wait(lock, [this]() { return client_fds_.empty(); });
}

HttpServer::Stats HttpServer::get_stats() const {
    Stats stats;
    stats.total_connections = total_connections_.load();
    stats.active_connections = active_connections_.load();
    stats.bytes_sent = bytes_sent_.load();
    return stats;
}

void HttpServer::server_thread() {
    while (running_.load()) {
        sockaddr_in client_addr{};
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept4(server_fd_, (sockaddr*)&client_addr, &client_len, SOCK_CLOEXEC);
        if (client_fd < 0) {
            int err = errno;
            if (!running_.load()) {
                break;
            }
            auto pause = accept_backoff(err);
            if (pause.count() > 0) {
                spdlog::warn("HTTP: Accept failed: {}, retrying in {}ms", std::strerror(err), pause.count());
                std::this_thread::sleep_for(pause);
            } else {
                spdlog::debug("HTTP: Accept failed: {}", std::strerror(err));
            }
            continue;
        }

        char peer[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &client_addr.sin_addr, peer, sizeof(peer));
        spdlog::debug("HTTP: Connection from {}:{}", peer, ntohs(client_addr.sin_port));

        {
            std::lock_guard<std::mutex> lock(clients_mutex_);
            client_fds_.insert(client_fd);
            total_connections_++;
            active_connections_++;
        }

        // Each connection runs on its own thread; they share only the immutable config
        try {
            std::thread([this, client_fd]() {
                handle_client(client_fd);
                release_client(client_fd);
            }).detach();
        } catch (const std::system_error& e) {
            spdlog::error("HTTP: Could not start connection thread: {}", e.what());
            release_client(client_fd);
        }
    }
}

// Last use of `this` on a connection thread
void HttpServer::release_client(int client_fd) {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    client_fds_.erase(client_fd);
    close(client_fd);
    active_connections_--;
    clients_cv_.notify_all();
}

bool HttpServer::read_request_head(int client_fd, std::string& head, int& error_status) {
    char buf[4096];
    error_status = 0;
    const auto deadline = Clock::now() + std::chrono::seconds(config_.read_timeout_s);

    while (true) {
        size_t end = find_header_end(head);
        if (end != std::string::npos) {
            if (end > config_.max_header_bytes) {   // terminator included
                error_status = 431;
                return false;
            }
            head.resize(end);
            return true;
        }
        if (head.size() > config_.max_header_bytes) {
            error_status = 431;
            return false;
        }

        auto left = time_left(deadline);
        if (left.count() <= 0) {
            spdlog::debug("HTTP: Read deadline hit after {} bytes", head.size());
            error_status = head.empty() ? 0 : 408;
            return false;
        }
        set_socket_timeout(client_fd, SO_RCVTIMEO, left);

        // Never buffer more than one byte past the limit
        size_t room = std::min(sizeof(buf), config_.max_header_bytes + 1 - head.size());
        ssize_t n = recv(client_fd, buf, room, 0);
        if (n < 0 && (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK)) {
            continue;
        }
        if (n <= 0) {
            // Peer closed or reset before finishing the request
            return false;
        }
        head.append(buf, static_cast<size_t>(n));
    }
}

void HttpServer::handle_client(int client_fd) {
    auto write_deadline = Clock::now();
    WriteCallback write = [this, client_fd, &write_deadline](const char* data, size_t size) {
        return send_all(client_fd, data, size, write_deadline);
    };

    std::string head;
    int error_status = 0;
    bool complete = read_request_head(client_fd, head, error_status);

    // The whole response must go out within write_timeout_s of the request
    write_deadline = Clock::now() + std::chrono::seconds(config_.write_timeout_s);

    if (!complete) {
        if (error_status != 0) {
            if (!send_error(write, error_status)) {
                spdlog::debug("HTTP: Could not deliver {} response", error_status);
            }
            linger_close(client_fd);
        }
        return;
    }

    ParseResult parsed = parse_request_head(head);
    if (parsed.error != ParseError::None) {
        spdlog::warn("HTTP: Malformed request: {}", head.substr(0, head.find("\r\n")));
        if (!send_error(write, 400)) {
            spdlog::debug("HTTP: Could not deliver 400 response");
        }
        linger_close(client_fd);
        return;
    }

    handler_.handle(parsed.request, write);
}

bool HttpServer::send_all(int fd, const char* data, size_t size, Clock::time_point deadline) {
    while (size > 0) {
        auto left = time_left(deadline);
        if (left.count() <= 0) {
            spdlog::warn("HTTP: Write deadline exceeded with {} bytes unsent", size);
            return false;
        }
        set_socket_timeout(fd, SO_SNDTIMEO, left);

        ssize_t n = send(fd, data, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) continue;
            spdlog::warn("HTTP: Send failed: {}", std::strerror(errno));
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
        bytes_sent_ += static_cast<uint64_t>(n);
    }
    return true;
}

} // namespace nsf
