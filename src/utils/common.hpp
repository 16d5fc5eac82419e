#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <sstream>
#include <string>
#include <vector>

namespace sandcell::utils {

inline std::string Join(const std::vector<std::string>& items, const std::string& delimiter) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            oss << delimiter;
        }
        oss << items[i];
    }
    return oss.str();
}

inline std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

inline std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

inline std::vector<std::string> SplitCsv(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream stream(value);
    std::string item;
    while (std::getline(stream, item, ',')) {
        item = Trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

inline std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

inline std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

// Expands a leading "~" and makes the path absolute without requiring it to exist.
inline std::filesystem::path ExpandPath(const std::string& value) {
    std::filesystem::path path(value);
    if (!value.empty() && value[0] == '~') {
        path = GetHomePath() / value.substr(value.size() > 1 && value[1] == '/' ? 2 : 1);
    }
    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    auto normal = ec ? path.lexically_normal() : absolute.lexically_normal();
    if (normal.has_parent_path() && normal.filename().empty() && normal != normal.root_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

inline std::chrono::system_clock::time_point Now() {
    return std::chrono::system_clock::now();
}

}  // namespace sandcell::utils
