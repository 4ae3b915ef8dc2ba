#include "config.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace nsf {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

// Present keys must convert; as<T>(fallback) would silently keep the default
template <typename T>
static void read_key(const YAML::Node& node, const char* key, T& out) {
    auto value = node[key];
    if (value && !value.IsNull()) {
        out = value.as<T>();
    }
}

uint16_t parse_port(const std::string& value) {
    size_t used = 0;
    long port = 0;
    try {
        port = std::stol(value, &used);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid port: '" + value + "'");
    }
    if (used != value.size() || port < 0 || port > 65535) {
        throw std::runtime_error("Invalid port: '" + value + "'");
    }
    return static_cast<uint16_t>(port);
}

void apply_env_overrides(AppConfig& cfg) {
    cfg.server.root_dir = env_or("NSF_DIR", cfg.server.root_dir);
    cfg.server.bind_address = env_or("NSF_BIND_ADDRESS", cfg.server.bind_address);
    if (const char* port = std::getenv("NSF_PORT")) {
        cfg.server.port = parse_port(port);
    }
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);
}

AppConfig default_config() {
    AppConfig cfg;
    apply_env_overrides(cfg);
    return cfg;
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            read_key(s, "root_dir", cfg.server.root_dir);
            if (auto port = s["port"]) {
                cfg.server.port = parse_port(port.as<std::string>());
            }
            read_key(s, "bind_address", cfg.server.bind_address);
            read_key(s, "read_timeout_s", cfg.server.read_timeout_s);
            read_key(s, "write_timeout_s", cfg.server.write_timeout_s);
            read_key(s, "max_header_bytes", cfg.server.max_header_bytes);
        }

        // Logging
        if (auto l = root["logging"]) {
            read_key(l, "level", cfg.logging.level);
            read_key(l, "file", cfg.logging.file);
            read_key(l, "max_file_size_mb", cfg.logging.max_file_size_mb);
            read_key(l, "max_files", cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value in " + path + ": " + std::string(e.what()));
    }

    if (cfg.server.read_timeout_s <= 0 || cfg.server.write_timeout_s <= 0) {
        throw std::runtime_error("Timeouts must be positive");
    }
    if (cfg.logging.max_file_size_mb <= 0 || cfg.logging.max_files <= 0) {
        throw std::runtime_error("Log rotation sizes must be positive");
    }
    if (cfg.server.max_header_bytes < 256) {
        throw std::runtime_error("max_header_bytes must be at least 256");
    }

    // Environment variable overrides (Docker / systemd)
    apply_env_overrides(cfg);

    return cfg;
}

CliOptions parse_command_line(int argc, const char* const argv[]) {
    CliOptions opts;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        std::string value;
        bool has_inline_value = false;

        auto eq = arg.find('=');
        if (arg.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = arg.substr(eq + 1);
            arg = arg.substr(0, eq);
            has_inline_value = true;
        }

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
            continue;
        }

        std::string* target = nullptr;
        if (arg == "--dir" || arg == "--directory") {
            target = &opts.root_dir;
        } else if (arg == "--port") {
            target = &opts.port;
        } else if (arg == "--config" || arg == "-c") {
            target = &opts.config_path;
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }

        if (!has_inline_value) {
            if (i + 1 >= argc) {
                throw std::runtime_error("Missing value for " + arg);
            }
            value = argv[++i];
        }
        *target = value;
    }

    if (!opts.port.empty()) {
        parse_port(opts.port);
    }
    return opts;
}

void apply_cli_overrides(AppConfig& cfg, const CliOptions& opts) {
    if (!opts.root_dir.empty()) {
        cfg.server.root_dir = opts.root_dir;
    }
    if (!opts.port.empty()) {
        cfg.server.port = parse_port(opts.port);
    }
}

} // namespace nsf
