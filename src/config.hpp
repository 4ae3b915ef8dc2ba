#pragma once

#include <string>
#include <cstdint>
#include <cstddef>

namespace nsf {

struct ServerConfig {
    std::string root_dir;              // empty = ask on stdin
    uint16_t port = 8080;
    std::string bind_address = "0.0.0.0";
    int read_timeout_s = 10;
    int write_timeout_s = 30;
    size_t max_header_bytes = 8192;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    LoggingConfig logging;
};

// Command-line options. Unset fields leave the loaded config untouched.
struct CliOptions {
    std::string config_path;
    std::string root_dir;
    std::string port;
    bool show_help = false;
};

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Defaults plus environment variable overrides, no file
AppConfig default_config();

void apply_env_overrides(AppConfig& cfg);

CliOptions parse_command_line(int argc, const char* const argv[]);

// CLI flags win over everything else
void apply_cli_overrides(AppConfig& cfg, const CliOptions& opts);

uint16_t parse_port(const std::string& value);

} // namespace nsf
