#pragma once

#include <map>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace sandcell::state {

inline constexpr const char* kSnapshotFormat = "sandcell.snapshot";
inline constexpr int kSnapshotVersion = 1;

// One named guest value. JSON-encodable values travel as-is, modules by
// name; everything else is an opaque pickle blob (base64) that only the
// guest runner reads.
struct SnapshotValue {
    std::string encoding;  // "json", "module" or "pickle"
    nlohmann::json value;
    std::string data;
    std::string type_name;
};

struct EnvironmentSnapshot {
    std::string backend;
    std::map<std::string, SnapshotValue> values;

    bool Empty() const { return values.empty(); }

    // {"name": {"encoding": ..., "value"|"data": ..., "type": ...}, ...}
    nlohmann::json ValuesToJson() const;
    static EnvironmentSnapshot FromValuesJson(const nlohmann::json& values, std::string backend);

    // Envelope written to the state store.
    std::string Serialize() const;
};

struct SnapshotLoad {
    EnvironmentSnapshot snapshot;
    bool corrupt = false;
    std::vector<std::string> warnings;
};

// Fails closed: anything unreadable yields an empty snapshot plus a warning.
SnapshotLoad DeserializeSnapshot(const std::string& bytes, const std::string& expected_backend);

std::string Sha256Hex(const std::string& data);

}  // namespace sandcell::state
