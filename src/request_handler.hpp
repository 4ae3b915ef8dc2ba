#pragma once

#include "config.hpp"
#include "directory_listing.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include <string>

namespace nsf {

// Maps one request onto the shared directory and writes the response.
// Holds only the immutable server config, so a single instance can serve
// any number of connections at once.
class RequestHandler {
public:
    explicit RequestHandler(const ServerConfig& config, DirectoryReader reader = read_directory);

    // Returns the status code sent (or attempted)
    int handle(const HttpRequest& request, const WriteCallback& write) const;

    const std::string& root_dir() const { return config_.root_dir; }

private:
    int dispatch(const HttpRequest& request, const WriteCallback& write) const;
    int list_directory(const std::string& full_path, const std::string& relative_path,
                       const WriteCallback& write, bool head_only) const;

    ServerConfig config_;
    DirectoryReader read_dir_;
};

} // namespace nsf
