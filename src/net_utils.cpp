#include "net_utils.hpp"
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <unistd.h>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace nsf {

namespace {

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

// Local end of a connected UDP socket; no packet is sent
std::string ip_from_udp_route() {
    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (fd < 0) return "";

    sockaddr_in remote{};
    remote.sin_family = AF_INET;
    remote.sin_port = htons(80);
    inet_pton(AF_INET, "8.8.8.8", &remote.sin_addr);

    std::string result;
    if (connect(fd, (sockaddr*)&remote, sizeof(remote)) == 0) {
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        char buf[INET_ADDRSTRLEN] = {0};
        if (getsockname(fd, (sockaddr*)&local, &len) == 0 &&
            local.sin_addr.s_addr != htonl(INADDR_ANY) &&
            inet_ntop(AF_INET, &local.sin_addr, buf, sizeof(buf))) {
            result = buf;
        }
    }
    close(fd);
    return result;
}

std::string ip_from_interfaces() {
    ifaddrs* list = nullptr;
    if (getifaddrs(&list) != 0) return "";

    std::string result;
    for (ifaddrs* it = list; it; it = it->ifa_next) {
        if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET) continue;
        if (it->ifa_flags & IFF_LOOPBACK) continue;

        auto* sin = reinterpret_cast<sockaddr_in*>(it->ifa_addr);
        char buf[INET_ADDRSTRLEN] = {0};
        if (inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) {
            result = buf;
            break;
        }
    }
    freeifaddrs(list);
    return result;
}

} // namespace

std::string validate_directory(const std::string& path) {
    if (path.empty()) {
        return "path is empty";
    }
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec) {
        return "path access error: " + ec.message();
    }
    if (!fs::is_directory(status)) {
        return "not a directory";
    }
    return "";
}

std::string resolve_root(const std::string& path) {
    std::error_code ec;
    fs::path resolved = fs::canonical(path, ec);
    if (ec) {
        throw std::runtime_error("Symbolic link resolution failed for '" + path + "': " + ec.message());
    }
    std::string reason = validate_directory(resolved.string());
    if (!reason.empty()) {
        throw std::runtime_error("Shared path '" + resolved.string() + "' unusable: " + reason);
    }
    return resolved.string();
}

std::string prompt_for_directory(std::istream& in, std::ostream& out) {
    std::string line;
    while (true) {
        out << "Enter directory path to share (e.g. /srv/share): " << std::flush;
        if (!std::getline(in, line)) {
            throw std::runtime_error("No directory given: input closed");
        }
        std::string candidate = trim(line);
        std::string reason = validate_directory(candidate);
        if (reason.empty()) {
            return candidate;
        }
        out << "Invalid path: " << reason << ", please retry" << std::endl;
    }
}

std::string detect_local_ip() {
    std::string ip = ip_from_udp_route();
    if (!ip.empty()) return ip;

    spdlog::debug("No default route, scanning interfaces for a LAN address");
    ip = ip_from_interfaces();
    if (!ip.empty()) return ip;

    return "127.0.0.1";
}

} // namespace nsf
