#include "state/environment_snapshot.hpp"

#include <iomanip>
#include <optional>
#include <sstream>

#include <openssl/sha.h>

namespace sandcell::state {
namespace {

// Absent and non-string members read as nullopt; json::value() would throw
// on the latter.
std::optional<std::string> StringMember(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

}  // namespace

std::string Sha256Hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    std::ostringstream oss;
    for (unsigned char byte : digest) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

nlohmann::json EnvironmentSnapshot::ValuesToJson() const {
    nlohmann::json data = nlohmann::json::object();
    for (const auto& [name, entry] : values) {
        nlohmann::json item{{"encoding", entry.encoding}};
        if (entry.encoding == "json" || entry.encoding == "module") {
            item["value"] = entry.value;
        } else {
            item["data"] = entry.data;
        }
        if (!entry.type_name.empty()) {
            item["type"] = entry.type_name;
        }
        data[name] = std::move(item);
    }
    return data;
}

EnvironmentSnapshot EnvironmentSnapshot::FromValuesJson(const nlohmann::json& values, std::string backend) {
    EnvironmentSnapshot snapshot{};
    snapshot.backend = std::move(backend);
    if (!values.is_object()) {
        return snapshot;
    }
    for (const auto& item : values.items()) {
        const auto& entry = item.value();
        if (!entry.is_object()) {
            continue;
        }
        SnapshotValue value{};
        if (entry.contains("encoding") && !entry["encoding"].is_string()) {
            continue;
        }
        value.encoding = StringMember(entry, "encoding").value_or("json");
        if (value.encoding == "json") {
            value.value = entry.contains("value") ? entry["value"] : nlohmann::json();
        } else if (value.encoding == "module" && entry.contains("value") && entry["value"].is_string()) {
            value.value = entry["value"];
        } else if (value.encoding == "pickle" && entry.contains("data") && entry["data"].is_string()) {
            value.data = entry["data"].get<std::string>();
        } else {
            continue;
        }
        value.type_name = StringMember(entry, "type").value_or("");
        snapshot.values.emplace(item.key(), std::move(value));
    }
    return snapshot;
}

std::string EnvironmentSnapshot::Serialize() const {
    const auto payload = ValuesToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    nlohmann::json envelope{
        {"format", kSnapshotFormat},
        {"version", kSnapshotVersion},
        {"backend", backend},
        {"checksum", Sha256Hex(payload)},
        {"payload", payload}
    };
    return envelope.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

SnapshotLoad DeserializeSnapshot(const std::string& bytes, const std::string& expected_backend) {
    SnapshotLoad load{};
    load.snapshot.backend = expected_backend;
    if (bytes.empty()) {
        return load;
    }
    auto fail = [&](const std::string& why) {
        load.corrupt = true;
        load.warnings.push_back("SnapshotCorrupt: snapshot could not be restored (" + why + "); starting from an empty environment.");
        return load;
    };

    const auto envelope = nlohmann::json::parse(bytes, nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return fail("malformed envelope");
    }
    if (StringMember(envelope, "format") != std::optional<std::string>(kSnapshotFormat)) {
        return fail("unknown format");
    }
    if (!envelope.contains("version") || !envelope["version"].is_number_integer() ||
        envelope["version"].get<int>() != kSnapshotVersion) {
        return fail("unsupported version");
    }
    const auto backend_member = StringMember(envelope, "backend");
    if (!backend_member) {
        return fail("missing backend");
    }
    const auto& backend = *backend_member;
    if (backend != expected_backend) {
        load.warnings.push_back("Snapshot was produced by backend '" + backend + "' and cannot be used by '" +
                                expected_backend + "'; starting from an empty environment.");
        return load;
    }
    if (!envelope.contains("payload") || !envelope["payload"].is_string()) {
        return fail("missing payload");
    }
    const auto payload = envelope["payload"].get<std::string>();
    if (StringMember(envelope, "checksum") != std::optional<std::string>(Sha256Hex(payload))) {
        return fail("checksum mismatch");
    }
    const auto values = nlohmann::json::parse(payload, nullptr, false);
    if (values.is_discarded() || !values.is_object()) {
        return fail("malformed payload");
    }
    load.snapshot = EnvironmentSnapshot::FromValuesJson(values, expected_backend);
    return load;
}

}  // namespace sandcell::state
