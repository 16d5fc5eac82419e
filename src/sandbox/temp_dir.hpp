#pragma once

#include <filesystem>
#include <string>

namespace sandcell::sandbox {

// Owns a freshly created private directory under the system temp dir and
// removes it recursively on destruction or Remove().
class TempDir {
public:
    explicit TempDir(const std::string& prefix);
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
    TempDir(TempDir&& other) noexcept;
    TempDir& operator=(TempDir&& other) noexcept;

    const std::filesystem::path& Path() const { return path_; }
    void Remove();

private:
    std::filesystem::path path_;
};

}  // namespace sandcell::sandbox
