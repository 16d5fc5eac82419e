#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "providers/execution_provider.hpp"
#include "safety/safety_policy.hpp"
#include "sandbox/output_filter.hpp"
#include "shell/shell_guard.hpp"

namespace sandcell::session {

enum class SubmitKind {
    kGuestCode,
    kShell
};

// What a submit does when the session is already executing.
enum class BusyPolicy {
    kQueue,
    kReject
};

const char* ToString(SubmitKind kind);
std::optional<SubmitKind> SubmitKindFromString(const std::string& value);
const char* ToString(BusyPolicy policy);
std::optional<BusyPolicy> BusyPolicyFromString(const std::string& value);

struct SessionConfig {
    providers::ProviderKind provider = providers::ProviderKind::kAuto;
    safety::EnforcementConfig enforcement;
    shell::ShellPolicy shell;
    providers::MountTable mounts;
    std::map<std::string, std::string> env;
    providers::ResourceLimits limits;
    bool enable_network = false;
    std::string workdir;
    sandbox::OutputLimits output;
    BusyPolicy busy_policy = BusyPolicy::kQueue;
    // Seeds the session's variables; {"name": <json value>}.
    nlohmann::json initial_variables = nlohmann::json::object();
    providers::LocalSettings local;
    providers::ContainerSettings container;
    providers::RemoteSettings remote;
};

struct SubmitRequest {
    SubmitKind kind = SubmitKind::kGuestCode;
    // Guest source or shell command line.
    std::string payload;
    // Only for framework-authored scaffolding.
    bool trusted = false;
    // Unset: the session's limits.timeout / limits.shell_timeout.
    std::optional<std::chrono::milliseconds> timeout;
    std::string workdir;
};

struct SessionInfo {
    std::string id;
    std::string provider;
    bool started = false;
    bool failed = false;
    std::string failure;
    std::size_t executions = 0;

    nlohmann::json ToJson() const;
};

// Misuse of the session API: unknown session, submit before configure,
// reconfiguring a live session without force.
class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace sandcell::session
