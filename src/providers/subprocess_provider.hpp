#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "providers/execution_provider.hpp"
#include "runtime/guest_job.hpp"
#include "sandbox/process_runner.hpp"
#include "sandbox/temp_dir.hpp"
#include "state/state_store.hpp"

namespace sandcell::providers {

// How one invocation is started: the backend wraps the interpreter or shell
// in its isolation launcher.
struct LaunchPlan {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;
    std::string working_dir;
    const sandbox::KernelFilter* kernel_filter = nullptr;
    std::function<void()> on_terminate;
    std::vector<std::string> warnings;
};

// Shared lifecycle of backends that run the guest interpreter as a host
// subprocess: session state dir, snapshot exchange through GuestJob,
// deadline handling, ANSI stripping and result mapping. Subclasses only
// decide how the command is wrapped.
class SubprocessProvider : public ExecutionProvider {
public:
    SubprocessProvider(ProviderSettings settings, state::StateStore& store);
    ~SubprocessProvider() override;

    ExecutionResult ExecuteGuestCode(const GuestCodeRequest& request) override;
    ExecutionResult ExecuteShellCommand(const ShellCommandRequest& request) override;
    void Cleanup() override;
    bool Started() const override { return session_dir_.has_value(); }

    // Minimal environment for guest processes with the caller's map on top.
    static std::map<std::string, std::string> BaseEnvironment(const std::string& home,
                                                              const std::map<std::string, std::string>& overrides);

protected:
    // `job` lives in StateDir()/job; argv must start the runner with the job file.
    virtual LaunchPlan PlanGuest(const runtime::GuestJob& job) = 0;
    // `command_argv` is the shell invocation (bash -c LINE) to wrap.
    virtual LaunchPlan PlanShell(const std::vector<std::string>& command_argv,
                                 const std::string& workdir,
                                 const std::map<std::string, std::string>& extra_env) = 0;
    // Called once when the session directory was created.
    virtual void OnSessionStart() {}
    // True when the isolation launcher itself failed (as opposed to the
    // guest); turns the run into a SandboxSetupError.
    virtual bool LauncherFailed(const sandbox::ProcessResult& /*process*/) const { return false; }

    const ProviderSettings& Settings() const { return settings_; }
    const std::filesystem::path& StateDir() const;
    const std::filesystem::path& WorkDir() const { return workdir_; }

private:
    void EnsureSession();
    sandbox::ProcessResult Launch(LaunchPlan& plan,
                                  std::chrono::milliseconds timeout,
                                  const std::atomic<bool>* cancel);
    void SaveSnapshot(const nlohmann::json& values, ExecutionResult& result);

    ProviderSettings settings_;
    state::StateStore& store_;
    std::optional<sandbox::TempDir> session_dir_;
    // A configured workdir outlives the session; the default one lives in session_dir_.
    std::filesystem::path workdir_;
};

}  // namespace sandcell::providers
