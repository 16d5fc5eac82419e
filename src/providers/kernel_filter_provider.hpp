#pragma once

#include <memory>

#include "providers/access_profile.hpp"
#include "providers/subprocess_provider.hpp"
#include "sandbox/kernel_filter.hpp"

namespace sandcell::providers {

// Plain host subprocess confined from the inside: rlimits, no_new_privs,
// Landlock and seccomp are applied between fork and exec.
class KernelFilterProvider : public SubprocessProvider {
public:
    KernelFilterProvider(ProviderSettings settings, state::StateStore& store);
    ~KernelFilterProvider() override;

    std::string Name() const override { return "kernel-filter"; }

    static bool IsSupported(const ProviderSettings& settings);

    sandbox::KernelFilterSpec FilterSpec(const AccessProfile& profile) const;

protected:
    LaunchPlan PlanGuest(const runtime::GuestJob& job) override;
    LaunchPlan PlanShell(const std::vector<std::string>& command_argv,
                         const std::string& workdir,
                         const std::map<std::string, std::string>& extra_env) override;

private:
    LaunchPlan Plan(std::vector<std::string> argv, const std::string& workdir);

    std::string python_;
    // Referenced by the plan of the invocation in flight.
    std::unique_ptr<sandbox::KernelFilter> filter_;
};

}  // namespace sandcell::providers
