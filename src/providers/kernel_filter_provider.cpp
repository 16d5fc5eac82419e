#include "providers/kernel_filter_provider.hpp"

#include <algorithm>
#include <chrono>

#include "sandbox/process_runner.hpp"
#include "utils/logging.hpp"

namespace sandcell::providers {
namespace {

constexpr std::uint64_t kMiB = 1024 * 1024;

}  // namespace

KernelFilterProvider::KernelFilterProvider(ProviderSettings settings, state::StateStore& store)
    : SubprocessProvider(std::move(settings), store) {
    python_ = sandbox::ProcessRunner::FindExecutable(Settings().local.python);
    if (python_.empty()) {
        python_ = Settings().local.python;
    }
}

KernelFilterProvider::~KernelFilterProvider() = default;

bool KernelFilterProvider::IsSupported(const ProviderSettings& settings) {
#ifdef __linux__
    return sandbox::KernelFilter::SeccompAvailable() &&
           sandbox::KernelFilter::NativeArchitectureSupported() &&
           !sandbox::ProcessRunner::FindExecutable(settings.local.python).empty();
#else
    (void)settings;
    return false;
#endif
}

sandbox::KernelFilterSpec KernelFilterProvider::FilterSpec(const AccessProfile& profile) const {
    const auto& limits = Settings().limits;
    sandbox::KernelFilterSpec spec{};
    spec.read_paths = profile.read_paths;
    spec.read_paths.push_back("/proc");
    spec.write_paths = profile.write_paths;
    spec.write_paths.push_back("/dev/null");
    spec.allow_network = profile.allow_network;
    spec.memory_bytes = limits.memory_mb * kMiB;
    // The wall-clock deadline is enforced by the runner; this only backs it up.
    const auto longest = std::max(limits.timeout, limits.shell_timeout);
    spec.cpu_seconds = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(longest).count()) + 1;
    spec.max_processes = limits.max_processes;
    spec.max_file_bytes = sandbox::kFileSizeLimitBytes;
    return spec;
}

LaunchPlan KernelFilterProvider::Plan(std::vector<std::string> argv, const std::string& workdir) {
    const auto profile = AccessProfile::Build(Settings(), WorkDir().string(), StateDir().string(), python_);
    filter_ = std::make_unique<sandbox::KernelFilter>(FilterSpec(profile));
    for (const auto& warning : filter_->Warnings()) {
        utils::Log(utils::LogLevel::kWarn, Name(), "filter degraded", {{"reason", warning}});
    }

    LaunchPlan plan{};
    plan.argv = std::move(argv);
    plan.env = BaseEnvironment(WorkDir().string(), Settings().env);
    plan.working_dir = workdir;
    plan.kernel_filter = filter_.get();
    plan.warnings = filter_->Warnings();
    return plan;
}

LaunchPlan KernelFilterProvider::PlanGuest(const runtime::GuestJob& job) {
    return Plan({python_, job.RunnerPath().string(), job.JobPath().string()}, WorkDir().string());
}

LaunchPlan KernelFilterProvider::PlanShell(const std::vector<std::string>& command_argv,
                                           const std::string& workdir,
                                           const std::map<std::string, std::string>& extra_env) {
    auto plan = Plan(command_argv, workdir);
    for (const auto& [key, value] : extra_env) {
        plan.env[key] = value;
    }
    return plan;
}

}  // namespace sandcell::providers
