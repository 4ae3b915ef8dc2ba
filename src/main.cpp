#include "config.hpp"
#include "logger.hpp"
#include "http_server.hpp"
#include "net_utils.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <filesystem>
#include <iostream>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static void print_usage() {
    std::cout << "Usage: nsf-server [options]\n"
              << "Options:\n"
              << "  --dir, --directory <path>  Directory to share (prompted if omitted)\n"
              << "  --port <port>              HTTP port (default: 8080)\n"
              << "  -c, --config <path>        Config file (default: config.yaml if present)\n"
              << "  -h, --help                 Show this help\n"
              << "\nEnvironment variables:\n"
              << "  NSF_DIR                    Directory to share\n"
              << "  NSF_PORT                   HTTP port\n"
              << "  NSF_BIND_ADDRESS           Listen address (default: 0.0.0.0)\n"
              << "  LOG_LEVEL                  Log level (trace/debug/info/warn/error)\n";
}

static void print_banner(const nsf::AppConfig& cfg, uint16_t port, const std::string& local_ip) {
    std::cout << R"(
  _   _   ____    _____
 | \ | | / ___|  |  ___|
 |  \| | \___ \  | |_
 | |\  |  ___) | |  _|
 |_| \_| |____/  |_|      v)" NSF_VERSION R"(
)" << std::endl;

    spdlog::info("File Server Configuration:");
    spdlog::info("  Shared directory : {}", cfg.server.root_dir);
    spdlog::info("  Listening port   : {}", port);
    spdlog::info("  Local access     : http://127.0.0.1:{}/", port);
    spdlog::info("  Network access   : http://{}:{}/", local_ip, port);
    spdlog::info("  Timeouts         : read {}s, write {}s",
                 cfg.server.read_timeout_s, cfg.server.write_timeout_s);
    spdlog::info("Press CTRL+C to exit");
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    nsf::CliOptions opts;
    try {
        opts = nsf::parse_command_line(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << "\n\n";
        print_usage();
        return 1;
    }
    if (opts.show_help) {
        print_usage();
        return 0;
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    nsf::AppConfig config;
    try {
        std::string config_path = opts.config_path;
        if (config_path.empty() && std::filesystem::exists("config.yaml")) {
            config_path = "config.yaml";
        }
        config = config_path.empty() ? nsf::default_config() : nsf::load_config(config_path);
        nsf::apply_cli_overrides(config, opts);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    nsf::init_logger(config.logging);

    // ─── Resolve shared directory ─────────────────────────────────────────────
    try {
        if (config.server.root_dir.empty()) {
            config.server.root_dir = nsf::prompt_for_directory(std::cin, std::cout);
        }
        config.server.root_dir = nsf::resolve_root(config.server.root_dir);
    } catch (const std::exception& e) {
        spdlog::critical("{}", e.what());
        return 1;
    }

    std::string local_ip = nsf::detect_local_ip();

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ─── Start server ─────────────────────────────────────────────────────────
    nsf::HttpServer http_server(config.server);
    if (!http_server.start()) {
        spdlog::critical("Server startup failed on port {} (port in use or permission denied?)",
                         config.server.port);
        return 1;
    }

    print_banner(config, http_server.port(), local_ip);

    // ─── Main loop ────────────────────────────────────────────────────────────
    auto last_stats_time = std::chrono::steady_clock::now();
    constexpr auto stats_interval = std::chrono::seconds(60);
    uint64_t last_total = 0;

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= stats_interval) {
            last_stats_time = now;

            auto stats = http_server.get_stats();
            if (stats.total_connections != last_total) {
                spdlog::info("Connections: {} total, {} active | Sent: {:.1f} MB",
                             stats.total_connections, stats.active_connections,
                             stats.bytes_sent / (1024.0 * 1024.0));
                last_total = stats.total_connections;
            }
        }
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    http_server.stop();
    spdlog::info("Shutdown complete. Goodbye!");

    return 0;
}
