#pragma once

#include <functional>
#include <string>
#include <vector>
#include <system_error>

namespace nsf {

// Raw child of a directory as read from disk
struct DirectoryChild {
    std::string name;
    bool is_directory = false;
};

// View model entries hold already-escaped text
struct ListingEntry {
    std::string display_name;   // HTML-escaped
    std::string url;            // URL-escaped, absolute from the server root
    bool is_directory = false;
};

struct DirectoryListing {
    std::string relative_path;  // HTML-escaped
    bool has_parent = false;
    std::string parent_url;     // URL-escaped, only set when has_parent
    std::vector<ListingEntry> entries;
};

// Immediate children of dir_path sorted by name. Symlinks are reported by
// what they point at; a dangling link counts as a file.
std::vector<DirectoryChild> read_directory(const std::string& dir_path, std::error_code& ec);

// Signature of read_directory, for callers that take the reader as a parameter
using DirectoryReader =
    std::function<std::vector<DirectoryChild>(const std::string& dir_path, std::error_code& ec)>;

DirectoryListing build_directory_listing(const std::string& relative_path,
                                         const std::vector<DirectoryChild>& children);

std::string render_directory_listing(const DirectoryListing& listing);

} // namespace nsf
