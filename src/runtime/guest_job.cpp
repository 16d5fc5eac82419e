#include "runtime/guest_job.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

#include "runtime/guest_runner.hpp"

namespace sandcell::runtime {
namespace {

namespace fs = std::filesystem;

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw std::runtime_error("cannot write " + path.string());
    }
    output << content;
    if (!output) {
        throw std::runtime_error("short write to " + path.string());
    }
}

std::optional<nlohmann::json> ReadJson(const fs::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    auto data = nlohmann::json::parse(buffer.str(), nullptr, false);
    if (data.is_discarded()) {
        return std::nullopt;
    }
    return data;
}

std::string StringMember(const nlohmann::json& object, const char* key) {
    const auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>() : std::string();
}

}  // namespace

GuestJob::GuestJob(fs::path dir)
    : dir_(std::move(dir)) {}

fs::path GuestJob::RunnerPath() const {
    return dir_ / kRunnerFileName;
}

fs::path GuestJob::JobPath() const {
    return dir_ / kJobFileName;
}

void GuestJob::Prepare(const std::string& source,
                       const safety::EnforcementPolicy& policy,
                       bool trusted,
                       const nlohmann::json& snapshot_values) const {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error("cannot create job dir " + dir_.string() + ": " + ec.message());
    }
    fs::remove(dir_ / kResultFileName, ec);
    fs::remove(dir_ / kSnapshotOutFileName, ec);

    nlohmann::json job{
        {"source", source},
        {"policy", policy.ToJson()},
        {"trusted", trusted},
        {"snapshot_in", kSnapshotInFileName},
        {"snapshot_out", kSnapshotOutFileName},
        {"result", kResultFileName}
    };
    WriteFile(RunnerPath(), GuestRunnerScript());
    WriteFile(JobPath(), job.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    WriteFile(dir_ / kSnapshotInFileName, nlohmann::json{{"values", snapshot_values}}.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

GuestOutcome GuestJob::Collect() const {
    GuestOutcome outcome{};
    if (auto snapshot = ReadJson(dir_ / kSnapshotOutFileName)) {
        if (snapshot->is_object() && snapshot->contains("values") && (*snapshot)["values"].is_object()) {
            outcome.snapshot_values = (*snapshot)["values"];
        }
    }
    const auto result = ReadJson(dir_ / kResultFileName);
    if (!result || !result->is_object()) {
        return outcome;
    }
    outcome.finished = true;
    outcome.ok = result->contains("ok") && (*result)["ok"].is_boolean() && (*result)["ok"].get<bool>();
    if (result->contains("return_value") && (*result)["return_value"].is_string()) {
        outcome.return_value = (*result)["return_value"].get<std::string>();
    }
    if (result->contains("error") && (*result)["error"].is_object()) {
        const auto& error = (*result)["error"];
        outcome.error_type = StringMember(error, "type");
        outcome.error_message = StringMember(error, "message");
        outcome.traceback = StringMember(error, "traceback");
    }
    if (result->contains("warnings") && (*result)["warnings"].is_array()) {
        for (const auto& warning : (*result)["warnings"]) {
            if (warning.is_string()) {
                outcome.warnings.push_back(warning.get<std::string>());
            }
        }
    }
    return outcome;
}

}  // namespace sandcell::runtime
