#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "providers/execution_provider.hpp"
#include "session/session_types.hpp"
#include "state/state_store.hpp"

namespace sandcell::session {

// Builds the backend for a freshly configured session. The default probes
// the host and picks with providers::SelectProvider.
using ProviderFactory = std::function<std::unique_ptr<providers::ExecutionProvider>(
    const SessionConfig& config,
    const providers::ProviderSettings& settings,
    state::StateStore& store)>;

providers::ProviderSettings ToProviderSettings(const std::string& session_id, const SessionConfig& config);

std::unique_ptr<providers::ExecutionProvider> CreateDefaultProvider(const SessionConfig& config,
                                                                    const providers::ProviderSettings& settings,
                                                                    state::StateStore& store);

// Entry points for the orchestrating caller. Every submission is vetted
// (safety engine or shell guard) before it reaches the backend, and
// executions within one session are serialized. Distinct sessions run in
// parallel.
class SandboxService {
public:
    SandboxService(SessionConfig defaults, state::StateStore& store, ProviderFactory factory = CreateDefaultProvider);
    ~SandboxService();

    SandboxService(const SandboxService&) = delete;
    SandboxService& operator=(const SandboxService&) = delete;

    const SessionConfig& Defaults() const { return defaults_; }

    // Throws SessionError when the session already executed and `force` is
    // false; with `force` the old backend and its state are torn down.
    // Throws providers::SandboxSetupError when no backend is available.
    void ConfigureSession(const std::string& session_id, SessionConfig config, bool force = false);
    void ConfigureSession(const std::string& session_id) { ConfigureSession(session_id, defaults_); }

    // Routine failures come back inside the result. Throws SessionError for
    // unknown sessions (including one torn down while this call waited for
    // its turn) and providers::SandboxSetupError once the session's backend
    // failed.
    providers::ExecutionResult Submit(const std::string& session_id, const SubmitRequest& request);

    // Stops the execution in flight; false when the session is unknown.
    bool Cancel(const std::string& session_id);
    // Releases backend resources and the stored snapshot; false when the
    // session is unknown.
    bool Teardown(const std::string& session_id);

    std::vector<SessionInfo> ListSessions() const;

private:
    struct Slot {
        SessionConfig config;
        std::unique_ptr<providers::ExecutionProvider> provider;
        std::mutex execution;
        std::atomic<bool> cancel{false};
        std::atomic<std::size_t> executions{0};
        // Set once the slot left the map; queued submissions must not run.
        std::atomic<bool> torn_down{false};
        // Guarded by `execution`.
        bool failed = false;
        std::string failure;
    };

    std::shared_ptr<Slot> Find(const std::string& session_id) const;
    void SeedVariables(const std::string& session_id, Slot& slot);
    providers::ExecutionResult Dispatch(const std::string& session_id, Slot& slot, const SubmitRequest& request);
    void ApplyOutputLimits(const SessionConfig& config, providers::ExecutionResult& result) const;
    void Release(const std::string& session_id, Slot& slot);

    SessionConfig defaults_;
    state::StateStore& store_;
    ProviderFactory factory_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> sessions_;
    mutable std::mutex mutex_;
};

}  // namespace sandcell::session
