#include "path_utils.h"
#include <cstdlib>
#include <string>

namespace coop_assist {

std::string expand_path(const std::string& path) {
    if (path.empty()) return path;
    if (path.size() == 1 && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home);
        return path;
    }
    if (path.size() >= 2 && path[0] == '~' && (path[1] == '/' || path[1] == '\\')) {
        const char* home = std::getenv("HOME");
        if (home) return std::string(home) + path.substr(1);
        return path;
    }
    return path;
}

std::string parent_directory(const std::string& path) {
    size_t pos = path.find_last_of('/');
    if (pos == std::string::npos) return ".";
    if (pos == 0) return "/";
    return path.substr(0, pos);
}

std::string resolve_path(const std::string& base_dir, const std::string& path) {
    std::string expanded = expand_path(path);
    if (expanded.empty() || expanded[0] == '/') return expanded;
    if (base_dir.empty() || base_dir == ".") return expanded;
    return base_dir + "/" + expanded;
}

} // namespace coop_assist
