#ifndef KBSTORE_UTIL_H
#define KBSTORE_UTIL_H

#include <string>
#include <vector>

std::vector<std::string> split_path(const std::string &path);

std::string join_paths(const std::string &path1, const std::string &path2);

// A child name is usable as a single path component.
bool is_valid_name(const std::string &name);

#endif // KBSTORE_UTIL_H
