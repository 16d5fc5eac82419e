#pragma once

#include <atomic>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "safety/safety_policy.hpp"
#include "shell/shell_guard.hpp"

namespace sandcell::providers {

enum class ErrorKind {
    kSafetyRejected,
    kShellRejected,
    kGuestRuntimeError,
    kSandboxSetupError,
    kTimeout,
    kSnapshotCorrupt,
    kSessionBusy
};

const char* ToString(ErrorKind kind);
std::optional<ErrorKind> ErrorKindFromString(const std::string& value);

struct ExecutionError {
    ErrorKind kind = ErrorKind::kGuestRuntimeError;
    std::string message;
    std::string traceback;
};

struct ExecutionResult {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> return_value;
    std::optional<ExecutionError> error;
    bool truncated = false;
    // The stored snapshot could not be restored; the run started empty.
    bool snapshot_corrupt = false;
    std::chrono::milliseconds duration{0};
    int exit_code = 0;
    std::vector<std::string> warnings;

    bool Ok() const { return !error.has_value(); }
    nlohmann::json ToJson() const;
};

ExecutionResult MakeErrorResult(ErrorKind kind, std::string message, std::string traceback = {});

// Guest source must be UTF-8 to cross the JSON job and wire formats.
bool IsValidUtf8(const std::string& text);
ExecutionResult InvalidSourceResult();

struct GuestCodeRequest {
    std::string source;
    safety::EnforcementPolicy policy;
    bool trusted = false;
    std::chrono::milliseconds timeout{30000};
    const std::atomic<bool>* cancel = nullptr;
};

struct ShellCommandRequest {
    shell::ShellCommand command;
    std::chrono::milliseconds timeout{30000};
    std::string workdir;
    const std::atomic<bool>* cancel = nullptr;
};

// Isolation could not be set up. The owning session is unusable until it is
// torn down and configured again.
class SandboxSetupError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

}  // namespace sandcell::providers
