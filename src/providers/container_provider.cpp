#include "providers/container_provider.hpp"

#include <cctype>
#include <sstream>

#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandcell::providers {
namespace {

namespace fs = std::filesystem;

constexpr auto kProbeTimeout = std::chrono::seconds(5);
constexpr auto kInspectTimeout = std::chrono::seconds(30);
constexpr auto kPullTimeout = std::chrono::minutes(10);
constexpr auto kKillTimeout = std::chrono::seconds(10);

// Docker exits 125 when the daemon rejects the run itself.
constexpr int kDockerRunFailure = 125;

std::optional<fs::path> Relative(const fs::path& path, const fs::path& root) {
    if (root.empty()) {
        return std::nullopt;
    }
    const auto normalized = path.lexically_normal();
    const auto relative = normalized.lexically_relative(root.lexically_normal());
    if (relative.empty() || *relative.begin() == "..") {
        return std::nullopt;
    }
    return relative;
}

std::string Join(const std::string& base, const fs::path& relative) {
    if (relative == ".") {
        return base;
    }
    return (fs::path(base) / relative).lexically_normal().string();
}

std::string FormatCpus(double cpus) {
    std::ostringstream out;
    out << cpus;
    return out.str();
}

std::string ContainerName(const std::string& session_id, int invocation) {
    std::string name = "sandcell-";
    for (char c : session_id) {
        const bool keep = std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == '.';
        name.push_back(keep ? c : '-');
    }
    return name + "-" + std::to_string(invocation);
}

}  // namespace

ContainerProvider::ContainerProvider(ProviderSettings settings, state::StateStore& store)
    : SubprocessProvider(std::move(settings), store) {}

ContainerProvider::~ContainerProvider() {
    ReleaseOwnership();
}

bool ContainerProvider::IsSupported(const ProviderSettings& settings) {
    const auto docker = sandbox::ProcessRunner::FindExecutable(settings.container.docker);
    if (docker.empty()) {
        return false;
    }
    return sandbox::ProcessRunner::RunQuiet({docker, "info"}, kProbeTimeout) == 0;
}

std::string ContainerProvider::SessionWorkdir() const {
    return Settings().container.workspace + "/session";
}

std::optional<std::string> ContainerProvider::MapPath(const fs::path& host_path) const {
    // The default workdir sits inside the state dir; check it first.
    if (auto relative = Relative(host_path, WorkDir())) {
        return Join(SessionWorkdir(), *relative);
    }
    if (auto relative = Relative(host_path, StateDir())) {
        return Join(kContainerStateDir, *relative);
    }
    const auto& mounts = Settings().mounts;
    for (const auto* list : {&mounts.read_write, &mounts.read_only}) {
        for (const auto& mount : *list) {
            const auto host = utils::ExpandPath(mount);
            if (auto relative = Relative(host_path, host)) {
                return Join(Settings().container.workspace + host.string(), *relative);
            }
        }
    }
    return std::nullopt;
}

void ContainerProvider::EnsureImage() {
    const auto& container = Settings().container;
    if (sandbox::ProcessRunner::RunQuiet({container.docker, "image", "inspect", container.image},
                                         kInspectTimeout) == 0) {
        return;
    }
    if (!container.auto_pull) {
        throw SandboxSetupError(Name() + ": image " + container.image + " is not present and autoPull is off");
    }
    utils::Log(utils::LogLevel::kInfo, Name(), "pulling image", {{"image", container.image}});
    std::string output;
    if (sandbox::ProcessRunner::RunQuiet({container.docker, "pull", container.image}, kPullTimeout, &output) != 0) {
        throw SandboxSetupError(Name() + ": cannot pull " + container.image + ": " + utils::Trim(output));
    }
}

void ContainerProvider::OnSessionStart() {
    EnsureImage();
    // The guest runs as an unprivileged uid that must write results and
    // snapshots into the bind-mounted dirs.
    const auto writable = fs::perms::owner_all | fs::perms::group_all | fs::perms::others_all;
    fs::permissions(StateDir(), writable);
    fs::permissions(StateDir() / "job", writable);
    if (Settings().workdir.empty()) {
        fs::permissions(WorkDir(), writable);
    }
}

void ContainerProvider::ReleaseOwnership() {
    if (!Started()) {
        return;
    }
    const auto& container = Settings().container;
    // Files the guest uid created cannot be removed by us otherwise.
    const int code = sandbox::ProcessRunner::RunQuiet(
        {container.docker, "run", "--rm", "--network", "none", "--user", "0:0",
         "-v", StateDir().string() + ":" + kContainerStateDir + ":rw",
         container.image, "chmod", "-R", "a+rwX", kContainerStateDir},
        kInspectTimeout);
    if (code != 0) {
        utils::Log(utils::LogLevel::kWarn, Name(), "cannot release state dir ownership",
                   {{"dir", StateDir().string()}, {"code", std::to_string(code)}});
    }
}

void ContainerProvider::Cleanup() {
    ReleaseOwnership();
    SubprocessProvider::Cleanup();
}

LaunchPlan ContainerProvider::Plan(const std::vector<std::string>& command,
                                   const std::string& container_workdir,
                                   const std::map<std::string, std::string>& env) {
    const auto& settings = Settings();
    const auto& container = settings.container;
    const auto name = ContainerName(settings.session_id, ++invocation_);

    std::vector<std::string> argv{
        container.docker, "run", "--rm", "--name", name,
        "--network", settings.enable_network ? "bridge" : "none",
        "--memory", std::to_string(settings.limits.memory_mb) + "m",
        "--cpus", FormatCpus(settings.limits.cpus),
        "--pids-limit", std::to_string(settings.limits.max_processes),
        "--read-only", "--tmpfs", "/tmp",
        "--user", container.user,
        "--cap-drop", "ALL",
        "--security-opt", "no-new-privileges",
        "-v", StateDir().string() + ":" + kContainerStateDir + ":rw",
        "-v", WorkDir().string() + ":" + SessionWorkdir() + ":rw"
    };
    for (const auto& mount : settings.mounts.read_only) {
        const auto host = utils::ExpandPath(mount).string();
        argv.insert(argv.end(), {"-v", host + ":" + container.workspace + host + ":ro"});
    }
    for (const auto& mount : settings.mounts.read_write) {
        const auto host = utils::ExpandPath(mount).string();
        argv.insert(argv.end(), {"-v", host + ":" + container.workspace + host + ":rw"});
    }
    for (const auto& [key, value] : env) {
        argv.insert(argv.end(), {"-e", key + "=" + value});
    }
    argv.insert(argv.end(), {"-w", container_workdir, container.image});
    argv.insert(argv.end(), command.begin(), command.end());

    LaunchPlan plan{};
    plan.argv = std::move(argv);
    // The docker client needs the host environment (DOCKER_HOST, config dir).
    plan.env = sandbox::ProcessRunner::HostEnvironment();
    plan.working_dir = StateDir().string();
    const auto docker = container.docker;
    plan.on_terminate = [docker, name]() {
        if (sandbox::ProcessRunner::RunQuiet({docker, "kill", name}, kKillTimeout) != 0) {
            utils::Log(utils::LogLevel::kWarn, "container", "docker kill failed", {{"container", name}});
        }
    };
    return plan;
}

LaunchPlan ContainerProvider::PlanGuest(const runtime::GuestJob& job) {
    const auto runner = MapPath(job.RunnerPath());
    const auto job_file = MapPath(job.JobPath());
    if (!runner || !job_file) {
        throw SandboxSetupError(Name() + ": job dir " + job.Dir().string() + " is not mounted");
    }
    const auto env = BaseEnvironment(SessionWorkdir(), Settings().env);
    return Plan({"python3", *runner, *job_file}, SessionWorkdir(), env);
}

LaunchPlan ContainerProvider::PlanShell(const std::vector<std::string>& command_argv,
                                        const std::string& workdir,
                                        const std::map<std::string, std::string>& extra_env) {
    auto env = BaseEnvironment(SessionWorkdir(), Settings().env);
    for (const auto& [key, value] : extra_env) {
        const bool host_path = key == "GIT_CONFIG_GLOBAL";
        env[key] = host_path ? MapPath(value).value_or(value) : value;
    }
    std::vector<std::string> warnings;
    auto container_workdir = MapPath(workdir);
    if (!container_workdir) {
        warnings.push_back("Working directory " + workdir + " is not mounted in the container; using " +
                           SessionWorkdir() + ".");
        container_workdir = SessionWorkdir();
    }
    auto plan = Plan(command_argv, *container_workdir, env);
    plan.warnings = std::move(warnings);
    return plan;
}

bool ContainerProvider::LauncherFailed(const sandbox::ProcessResult& process) const {
    return process.exit_code == kDockerRunFailure && !process.timed_out && !process.cancelled;
}

}  // namespace sandcell::providers
