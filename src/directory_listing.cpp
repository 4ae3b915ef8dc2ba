#include "directory_listing.hpp"
#include "escape.hpp"
#include "path_resolver.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>

namespace fs = std::filesystem;

namespace nsf {

std::vector<DirectoryChild> read_directory(const std::string& dir_path, std::error_code& ec) {
    std::vector<DirectoryChild> children;

    fs::directory_iterator it(dir_path, ec);
    if (ec) {
        return children;
    }

    for (fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            children.clear();
            return children;
        }
        std::error_code type_ec;
        DirectoryChild child;
        child.name = it->path().filename().string();
        child.is_directory = it->is_directory(type_ec) && !type_ec;
        children.push_back(std::move(child));
    }
    if (ec) {
        children.clear();
        return children;
    }

    std::sort(children.begin(), children.end(),
              [](const DirectoryChild& a, const DirectoryChild& b) { return a.name < b.name; });
    return children;
}

DirectoryListing build_directory_listing(const std::string& relative_path,
                                         const std::vector<DirectoryChild>& children) {
    DirectoryListing listing;
    listing.relative_path = html_escape(relative_path);
    listing.has_parent = !relative_path.empty();

    if (listing.has_parent) {
        std::string parent = parent_path(relative_path);
        listing.parent_url = "/" + url_escape_path(parent);
        if (!parent.empty()) {
            listing.parent_url += '/';
        }
    }

    listing.entries.reserve(children.size());
    for (const auto& child : children) {
        ListingEntry entry;
        entry.display_name = html_escape(child.name);
        entry.url = "/" + url_escape_path(join_path(relative_path, child.name));
        if (child.is_directory) {
            entry.url += '/';
        }
        entry.is_directory = child.is_directory;
        listing.entries.push_back(std::move(entry));
    }
    return listing;
}

std::string render_directory_listing(const DirectoryListing& listing) {
    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html>\n<head>\n"
         << "<meta charset=\"UTF-8\">\n"
         << "<title>File Server - /" << listing.relative_path << "</title>\n"
         << "<style>\n"
         << "  li { font-family: monospace; }\n"
         << "  .dir { color: blue; }\n"
         << "  .file { color: green; }\n"
         << "</style>\n"
         << "</head>\n<body>\n"
         << "<h1>Directory Listing: /" << listing.relative_path << "</h1>\n"
         << "<ul>\n";

    if (listing.has_parent) {
        html << "<li><a href=\"" << listing.parent_url << "\">.. (Parent Directory)</a></li>\n";
    }

    for (const auto& entry : listing.entries) {
        html << "<li><a href=\"" << entry.url << "\" class=\""
             << (entry.is_directory ? "dir" : "file") << "\">"
             << entry.display_name << (entry.is_directory ? "/" : "")
             << "</a></li>\n";
    }

    html << "</ul>\n</body>\n</html>\n";
    return html.str();
}

} // namespace nsf
