#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sandcell::state {

// One snapshot per session; Save overwrites. Implementations are thread-safe.
class StateStore {
public:
    virtual ~StateStore() = default;

    virtual void Save(const std::string& session_id, const std::string& bytes) = 0;
    virtual std::optional<std::string> Load(const std::string& session_id) = 0;
    virtual void Erase(const std::string& session_id) = 0;
    virtual std::vector<std::string> Sessions() = 0;
};

class InMemoryStateStore : public StateStore {
public:
    void Save(const std::string& session_id, const std::string& bytes) override;
    std::optional<std::string> Load(const std::string& session_id) override;
    void Erase(const std::string& session_id) override;
    std::vector<std::string> Sessions() override;

private:
    std::unordered_map<std::string, std::string> snapshots_;
    std::mutex mutex_;
};

}  // namespace sandcell::state
