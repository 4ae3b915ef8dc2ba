#pragma once

#include "config.hpp"
#include "request_handler.hpp"
#include <string>
#include <thread>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <unordered_set>
#include <cstdint>

namespace nsf {

// How long the accept loop sleeps after accept() failed with `err`.
// Zero for per-connection errors; descriptor or memory exhaustion backs off.
std::chrono::milliseconds accept_backoff(int err);

// HTTP/1.1 file-sharing server: one detached thread per connection,
// one request per connection.
class HttpServer {
public:
    explicit HttpServer(const ServerConfig& config);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool start();

    // Closes the listener, shuts down every open client socket and returns
    // only once all connection threads have finished
    void stop();
    bool is_running() const { return running_.load(); }

    // Port actually bound; differs from the config when it asked for 0
    uint16_t port() const { return bound_port_; }

    struct Stats {
        uint64_t total_connections = 0;
        uint64_t active_connections = 0;
        uint64_t bytes_sent = 0;
    };
    Stats get_stats() const;

private:
    using Clock = std::chrono::steady_clock;

    void server_thread();
    void handle_client(int client_fd);
    void release_client(int client_fd);
    bool read_request_head(int client_fd, std::string& head, int& error_status);
    bool send_all(int fd, const char* data, size_t size, Clock::time_point deadline);

    ServerConfig config_;
    RequestHandler handler_;
    uint16_t bound_port_ = 0;
    int server_fd_ = -1;
    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex clients_mutex_;
    std::condition_variable clients_cv_;
    std::unordered_set<int> client_fds_;   // guarded by clients_mutex_

    std::atomic<uint64_t> total_connections_{0};
    std::atomic<uint64_t> active_connections_{0};
    std::atomic<uint64_t> bytes_sent_{0};
};

} // namespace nsf
