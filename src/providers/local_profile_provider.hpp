#pragma once

#include "providers/access_profile.hpp"
#include "providers/subprocess_provider.hpp"

namespace sandcell::providers {

// Runs the interpreter under a declarative access profile: sandbox-exec
// (Seatbelt) on macOS, bubblewrap elsewhere.
class LocalProfileProvider : public SubprocessProvider {
public:
    LocalProfileProvider(ProviderSettings settings, state::StateStore& store);
    ~LocalProfileProvider() override;

    std::string Name() const override { return "local-profile"; }

    static bool IsSupported(const ProviderSettings& settings);
    // Absolute path of the profile launcher, or empty.
    static std::string Launcher();

protected:
    LaunchPlan PlanGuest(const runtime::GuestJob& job) override;
    LaunchPlan PlanShell(const std::vector<std::string>& command_argv,
                         const std::string& workdir,
                         const std::map<std::string, std::string>& extra_env) override;
    bool LauncherFailed(const sandbox::ProcessResult& process) const override;

private:
    std::vector<std::string> WrapCommand(const AccessProfile& profile,
                                         const std::vector<std::string>& command);
    std::string SeatbeltProfilePath(const AccessProfile& profile);

    std::string python_;
};

}  // namespace sandcell::providers
