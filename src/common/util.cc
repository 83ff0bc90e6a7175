#include "util.h"
#include <string>
#include <vector>

std::vector<std::string> split_path(const std::string &path) {
    std::vector<std::string> components;
    size_t start = 0;
    while (start < path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos)
            end = path.size();
        // "a//b" and a trailing '/' yield no empty components
        if (end > start)
            components.push_back(path.substr(start, end - start));
        start = end + 1;
    }
    return components;
}

std::string join_paths(const std::string &path1, const std::string &path2) {
    if (path1.empty())
        return path2;
    if (path2.empty())
        return path1;
    if (path1.back() == '/')
        return path1 + path2;
    return path1 + "/" + path2;
}

bool is_valid_name(const std::string &name) {
    return !name.empty() && name.find('/') == std::string::npos;
}
