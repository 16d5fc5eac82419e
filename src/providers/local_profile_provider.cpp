#include "providers/local_profile_provider.hpp"

#include <filesystem>
#include <fstream>

#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandcell::providers {
namespace {

namespace fs = std::filesystem;

#ifdef __APPLE__
constexpr const char* kLauncher = "sandbox-exec";
#else
constexpr const char* kLauncher = "bwrap";
#endif

}  // namespace

LocalProfileProvider::LocalProfileProvider(ProviderSettings settings, state::StateStore& store)
    : SubprocessProvider(std::move(settings), store) {
    python_ = sandbox::ProcessRunner::FindExecutable(Settings().local.python);
    if (python_.empty()) {
        python_ = Settings().local.python;
    }
}

LocalProfileProvider::~LocalProfileProvider() = default;

std::string LocalProfileProvider::Launcher() {
    return sandbox::ProcessRunner::FindExecutable(kLauncher);
}

bool LocalProfileProvider::IsSupported(const ProviderSettings& settings) {
    return !Launcher().empty() && !sandbox::ProcessRunner::FindExecutable(settings.local.python).empty();
}

std::string LocalProfileProvider::SeatbeltProfilePath(const AccessProfile& profile) {
    const auto& override_profile = Settings().local.seatbelt_profile;
    if (!override_profile.empty()) {
        const auto candidate = utils::ExpandPath(override_profile);
        std::error_code ec;
        if (fs::is_regular_file(candidate, ec)) {
            return candidate.string();
        }
    }
    const auto path = StateDir() / "profile.sb";
    std::ofstream output(path, std::ios::trunc);
    if (!output.is_open()) {
        throw SandboxSetupError(Name() + ": cannot write " + path.string());
    }
    output << (override_profile.empty() ? profile.ToSeatbelt() : override_profile);
    return path.string();
}

std::vector<std::string> LocalProfileProvider::WrapCommand(const AccessProfile& profile,
                                                           const std::vector<std::string>& command) {
    const auto launcher = Launcher();
    if (launcher.empty()) {
        throw SandboxSetupError(Name() + ": " + kLauncher + " not found on PATH");
    }
    std::vector<std::string> argv;
#ifdef __APPLE__
    argv = {launcher, "-f", SeatbeltProfilePath(profile)};
#else
    argv = profile.ToBwrapArgs(launcher);
#endif
    argv.insert(argv.end(), command.begin(), command.end());
    return argv;
}

LaunchPlan LocalProfileProvider::PlanGuest(const runtime::GuestJob& job) {
    const auto profile = AccessProfile::Build(Settings(), WorkDir().string(), StateDir().string(), python_);
    LaunchPlan plan{};
    plan.argv = WrapCommand(profile, {python_, job.RunnerPath().string(), job.JobPath().string()});
    plan.env = BaseEnvironment(WorkDir().string(), Settings().env);
    plan.working_dir = WorkDir().string();
    return plan;
}

LaunchPlan LocalProfileProvider::PlanShell(const std::vector<std::string>& command_argv,
                                           const std::string& workdir,
                                           const std::map<std::string, std::string>& extra_env) {
    // The profile is the session's; a request workdir only moves the cwd.
    auto profile = AccessProfile::Build(Settings(), WorkDir().string(), StateDir().string(), python_);
    profile.workdir = workdir;
    LaunchPlan plan{};
    plan.argv = WrapCommand(profile, command_argv);
    plan.env = BaseEnvironment(WorkDir().string(), Settings().env);
    for (const auto& [key, value] : extra_env) {
        plan.env[key] = value;
    }
    plan.working_dir = workdir;
    return plan;
}

bool LocalProfileProvider::LauncherFailed(const sandbox::ProcessResult& process) const {
    if (process.exit_code == 0) {
        return false;
    }
    const auto prefix = std::string(kLauncher) + ":";
    return process.error.rfind(prefix, 0) == 0;
}

}  // namespace sandcell::providers
