#include "path_resolver.hpp"
#include <vector>

namespace nsf {

std::string clean_path(const std::string& path) {
    if (path.empty()) {
        return ".";
    }

    const bool rooted = path[0] == '/';
    std::vector<std::string> parts;

    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string elem = path.substr(start, slash - start);
        start = slash + 1;

        if (elem.empty() || elem == ".") {
            continue;
        }
        if (elem == "..") {
            if (!parts.empty() && parts.back() != "..") {
                parts.pop_back();
            } else if (!rooted) {
                parts.push_back(elem);
            }
            // ".." at the root of a rooted path is dropped
            continue;
        }
        parts.push_back(elem);
    }

    std::string out = rooted ? "/" : "";
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += '/';
        out += parts[i];
    }
    if (out.empty()) {
        return ".";
    }
    return out;
}

std::string parent_path(const std::string& relative) {
    auto slash = relative.rfind('/');
    if (slash == std::string::npos) {
        return "";
    }
    return relative.substr(0, slash);
}

std::string join_path(const std::string& base, const std::string& rel) {
    if (rel.empty()) return base;
    if (base.empty()) return rel;
    if (base.back() == '/') return base + rel;
    return base + "/" + rel;
}

ResolvedPath resolve_request_path(const std::string& root_dir, const std::string& request_path) {
    ResolvedPath result;

    if (request_path.find('\0') != std::string::npos) {
        result.error = PathError::InvalidPath;
        return result;
    }

    // Clean as a rooted path so leading ".." segments stop at the root boundary
    std::string stripped = request_path;
    while (!stripped.empty() && stripped[0] == '/') {
        stripped.erase(0, 1);
    }
    std::string cleaned = clean_path("/" + stripped);
    result.relative = cleaned.substr(1);

    std::string root = clean_path(root_dir);
    result.full = join_path(root, result.relative);

    // Containment check on top of cleaning
    bool inside = root == "/" ? result.full[0] == '/'
                              : (result.full == root || result.full.rfind(root + "/", 0) == 0);
    if (!inside) {
        result.error = PathError::OutsideRoot;
    }
    return result;
}

} // namespace nsf
