#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "sqlite3.h"
#include "state/state_store.hpp"

namespace sandcell::state {

class SqliteStateStore : public StateStore {
public:
    explicit SqliteStateStore(std::filesystem::path db_path);
    ~SqliteStateStore() override;

    SqliteStateStore(const SqliteStateStore&) = delete;
    SqliteStateStore& operator=(const SqliteStateStore&) = delete;

    void Save(const std::string& session_id, const std::string& bytes) override;
    std::optional<std::string> Load(const std::string& session_id) override;
    void Erase(const std::string& session_id) override;
    std::vector<std::string> Sessions() override;

    bool IsOpen() const { return db_ != nullptr; }

private:
    void EnsureSchema();
    static bool Exec(sqlite3* db, const std::string& sql);

    std::filesystem::path db_path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

}  // namespace sandcell::state
