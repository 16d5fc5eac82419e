#pragma once

#include <atomic>
#include <filesystem>
#include <optional>

#include "providers/subprocess_provider.hpp"

namespace sandcell::providers {

inline constexpr const char* kContainerStateDir = "/sandcell/state";

// One `docker run --rm` per invocation. The session state dir and workdir
// are bind-mounted, so the snapshot exchange is the same as for the local
// backends.
class ContainerProvider : public SubprocessProvider {
public:
    ContainerProvider(ProviderSettings settings, state::StateStore& store);
    ~ContainerProvider() override;

    std::string Name() const override { return "container"; }
    void Cleanup() override;

    static bool IsSupported(const ProviderSettings& settings);

    // Host path to its in-container location; nullopt when not mounted.
    std::optional<std::string> MapPath(const std::filesystem::path& host_path) const;
    std::string SessionWorkdir() const;

protected:
    LaunchPlan PlanGuest(const runtime::GuestJob& job) override;
    LaunchPlan PlanShell(const std::vector<std::string>& command_argv,
                         const std::string& workdir,
                         const std::map<std::string, std::string>& extra_env) override;
    void OnSessionStart() override;
    bool LauncherFailed(const sandbox::ProcessResult& process) const override;

private:
    LaunchPlan Plan(const std::vector<std::string>& command,
                    const std::string& container_workdir,
                    const std::map<std::string, std::string>& env);
    void EnsureImage();
    void ReleaseOwnership();

    std::atomic<int> invocation_{0};
};

}  // namespace sandcell::providers
