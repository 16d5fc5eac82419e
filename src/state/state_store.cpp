#include "state/state_store.hpp"

#include <algorithm>

namespace sandcell::state {

void InMemoryStateStore::Save(const std::string& session_id, const std::string& bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.insert_or_assign(session_id, bytes);
}

std::optional<std::string> InMemoryStateStore::Load(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(session_id);
    if (it == snapshots_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void InMemoryStateStore::Erase(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    snapshots_.erase(session_id);
}

std::vector<std::string> InMemoryStateStore::Sessions() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(snapshots_.size());
    for (const auto& entry : snapshots_) {
        ids.push_back(entry.first);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

}  // namespace sandcell::state
