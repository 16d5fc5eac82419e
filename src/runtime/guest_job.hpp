#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "safety/safety_policy.hpp"

namespace sandcell::runtime {

// What the runner reported back. `finished` is false when result.json is
// missing, i.e. the interpreter died before the runner could finish.
struct GuestOutcome {
    bool finished = false;
    bool ok = false;
    std::optional<std::string> return_value;
    std::string error_type;
    std::string error_message;
    std::string traceback;
    std::vector<std::string> warnings;
    // {"name": {...}} from snapshot_out.json, when the runner wrote one.
    std::optional<nlohmann::json> snapshot_values;
};

// File exchange with the guest runner inside one session-scoped directory.
class GuestJob {
public:
    explicit GuestJob(std::filesystem::path dir);

    // Writes runner.py, job.json and snapshot_in.json, removing any output
    // left by a previous invocation. Throws std::runtime_error on I/O errors.
    // Invalid UTF-8 is written as U+FFFD, so callers reject such source first.
    void Prepare(const std::string& source,
                 const safety::EnforcementPolicy& policy,
                 bool trusted,
                 const nlohmann::json& snapshot_values) const;

    GuestOutcome Collect() const;

    const std::filesystem::path& Dir() const { return dir_; }
    std::filesystem::path RunnerPath() const;
    std::filesystem::path JobPath() const;

private:
    std::filesystem::path dir_;
};

}  // namespace sandcell::runtime
