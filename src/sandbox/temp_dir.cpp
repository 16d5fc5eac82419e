#include "sandbox/temp_dir.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <vector>

#include <stdlib.h>

#include "utils/logging.hpp"

namespace sandcell::sandbox {
namespace {

std::string SanitizePrefix(const std::string& prefix) {
    std::string clean;
    for (char c : prefix) {
        const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                          c == '-' || c == '_';
        clean.push_back(keep ? c : '_');
    }
    return clean.substr(0, 48);
}

}  // namespace

TempDir::TempDir(const std::string& prefix) {
    const auto pattern = (std::filesystem::temp_directory_path() / (SanitizePrefix(prefix) + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("cannot create temp dir " + pattern + ": " + std::strerror(errno));
    }
    path_ = buffer.data();
}

TempDir::~TempDir() {
    Remove();
}

TempDir::TempDir(TempDir&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDir& TempDir::operator=(TempDir&& other) noexcept {
    if (this != &other) {
        Remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempDir::Remove() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        utils::Log(utils::LogLevel::kWarn, "sandbox", "temp dir removal failed",
                   {{"path", path_.string()}, {"error", ec.message()}});
    }
    path_.clear();
}

}  // namespace sandcell::sandbox
