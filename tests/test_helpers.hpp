#pragma once

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace nsf::test {

// Scratch directory removed on destruction. path() is canonical.
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "nsf-test-XXXXXX").string();
        std::vector<char> buf(tmpl.begin(), tmpl.end());
        buf.push_back('\0');
        if (!mkdtemp(buf.data())) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = std::filesystem::canonical(buf.data()).string();
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::permissions(path_, std::filesystem::perms::owner_all,
                                     std::filesystem::perm_options::add, ec);
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string write_file(const std::string& rel, const std::string& content) const {
        auto full = std::filesystem::path(path_) / rel;
        std::filesystem::create_directories(full.parent_path());
        std::ofstream out(full, std::ios::binary);
        out << content;
        return full.string();
    }

    std::string make_dir(const std::string& rel) const {
        auto full = std::filesystem::path(path_) / rel;
        std::filesystem::create_directories(full);
        return full.string();
    }

private:
    std::string path_;
};

struct ParsedResponse {
    int status = 0;
    std::string head;
    std::string body;

    // Case-sensitive lookup is enough: the server writes canonical names
    std::string header(const std::string& name) const {
        std::string key = "\r\n" + name + ": ";
        auto pos = head.find(key);
        if (pos == std::string::npos) return "";
        pos += key.size();
        return head.substr(pos, head.find("\r\n", pos) - pos);
    }
};

inline ParsedResponse parse_response(const std::string& raw) {
    ParsedResponse r;
    auto end = raw.find("\r\n\r\n");
    if (end == std::string::npos || raw.compare(0, 9, "HTTP/1.1 ") != 0) {
        return r;
    }
    r.head = raw.substr(0, end + 2);
    r.body = raw.substr(end + 4);
    r.status = std::stoi(raw.substr(9, 3));
    return r;
}

inline size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

} // namespace nsf::test
