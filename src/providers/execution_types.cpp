#include "providers/execution_types.hpp"

namespace sandcell::providers {

const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kSafetyRejected: return "SafetyRejected";
        case ErrorKind::kShellRejected: return "ShellRejected";
        case ErrorKind::kGuestRuntimeError: return "GuestRuntimeError";
        case ErrorKind::kSandboxSetupError: return "SandboxSetupError";
        case ErrorKind::kTimeout: return "Timeout";
        case ErrorKind::kSnapshotCorrupt: return "SnapshotCorrupt";
        case ErrorKind::kSessionBusy: return "SessionBusy";
    }
    return "Unknown";
}

std::optional<ErrorKind> ErrorKindFromString(const std::string& value) {
    for (auto kind : {ErrorKind::kSafetyRejected, ErrorKind::kShellRejected, ErrorKind::kGuestRuntimeError,
                      ErrorKind::kSandboxSetupError, ErrorKind::kTimeout, ErrorKind::kSnapshotCorrupt,
                      ErrorKind::kSessionBusy}) {
        if (value == ToString(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

nlohmann::json ExecutionResult::ToJson() const {
    nlohmann::json data{
        {"stdout", stdout_text},
        {"stderr", stderr_text},
        {"truncated", truncated},
        {"snapshot_corrupt", snapshot_corrupt},
        {"duration_ms", duration.count()},
        {"exit_code", exit_code},
        {"warnings", warnings}
    };
    data["return_value"] = return_value ? nlohmann::json(*return_value) : nlohmann::json();
    if (error) {
        data["error"] = {
            {"kind", ToString(error->kind)},
            {"message", error->message},
            {"traceback", error->traceback}
        };
    } else {
        data["error"] = nullptr;
    }
    return data;
}

ExecutionResult MakeErrorResult(ErrorKind kind, std::string message, std::string traceback) {
    ExecutionResult result{};
    result.exit_code = 1;
    result.error = ExecutionError{kind, std::move(message), std::move(traceback)};
    return result;
}

bool IsValidUtf8(const std::string& text) {
    try {
        static_cast<void>(nlohmann::json(text).dump());
    } catch (const nlohmann::json::type_error&) {
        return false;
    }
    return true;
}

ExecutionResult InvalidSourceResult() {
    return MakeErrorResult(ErrorKind::kGuestRuntimeError,
                           "SyntaxError: source code is not valid UTF-8.");
}

}  // namespace sandcell::providers
