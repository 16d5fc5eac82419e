#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "nlohmann/json.hpp"
#include "providers/execution_provider.hpp"

namespace sandcell::providers {

// Delegates isolation to a remote sandbox service over HTTP/JSON. The local
// session maps to one remote sandbox; state lives on the remote side.
class RemoteProvider : public ExecutionProvider {
public:
    explicit RemoteProvider(ProviderSettings settings);
    ~RemoteProvider() override;

    std::string Name() const override { return "remote"; }
    ExecutionResult ExecuteGuestCode(const GuestCodeRequest& request) override;
    ExecutionResult ExecuteShellCommand(const ShellCommandRequest& request) override;
    void Cleanup() override;
    bool Started() const override { return sandbox_id_.has_value(); }

    static bool IsSupported(const ProviderSettings& settings);

    const std::optional<std::string>& SandboxId() const { return sandbox_id_; }

private:
    struct Reply {
        int status = 0;
        bool timed_out = false;
        nlohmann::json body;
    };

    Reply Send(const std::string& method,
               const std::string& path,
               const nlohmann::json& payload,
               std::chrono::seconds read_timeout);
    void EnsureSandbox();
    void Bootstrap();
    std::string SandboxPath(const std::string& suffix) const;

    ProviderSettings settings_;
    std::optional<std::string> sandbox_id_;
};

}  // namespace sandcell::providers
