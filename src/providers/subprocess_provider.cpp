#include "providers/subprocess_provider.hpp"

#include <fstream>

#include "sandbox/output_filter.hpp"
#include "state/environment_snapshot.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandcell::providers {
namespace {

namespace fs = std::filesystem;

constexpr const char* kGitConfig =
    "[user]\n"
    "\tname = sandcell\n"
    "\temail = sandcell@localhost\n"
    "[safe]\n"
    "\tdirectory = *\n";

// `bash -lc X` would source login profiles; run `bash -c X` instead.
shell::ShellCommand DropLoginShellFlags(const shell::ShellCommand& command) {
    shell::ShellCommand normalized = command;
    bool command_position = true;
    bool shell_command = false;
    std::vector<shell::ShellToken> tokens;
    for (auto token : command.tokens) {
        if (token.kind == shell::ShellTokenKind::kOperator) {
            command_position = !shell::ShellLexer::IsRedirection(token.text);
            shell_command = false;
            tokens.push_back(std::move(token));
            continue;
        }
        if (command_position) {
            command_position = false;
            shell_command = token.text == "bash" || token.text == "sh";
            tokens.push_back(std::move(token));
            continue;
        }
        if (shell_command) {
            if (token.raw == "-lc" || token.raw == "-cl") {
                token.raw = "-c";
                token.text = "-c";
            } else if (token.raw == "-l" || token.raw == "--login") {
                continue;
            }
        }
        tokens.push_back(std::move(token));
    }
    normalized.tokens = std::move(tokens);
    return normalized;
}

bool InvokesGit(const shell::ShellCommand& command) {
    for (const auto& token : command.tokens) {
        if (token.kind == shell::ShellTokenKind::kWord && token.text == "git") {
            return true;
        }
    }
    return false;
}

std::string ArgvSummary(const std::vector<std::string>& argv) {
    auto summary = utils::Join(argv, " ");
    if (summary.size() > 200) {
        summary = summary.substr(0, 200) + "...";
    }
    return summary;
}

}  // namespace

SubprocessProvider::SubprocessProvider(ProviderSettings settings, state::StateStore& store)
    : settings_(std::move(settings))
    , store_(store) {}

// session_dir_ removes the state directory when it is destroyed.
SubprocessProvider::~SubprocessProvider() = default;

std::map<std::string, std::string> SubprocessProvider::BaseEnvironment(
    const std::string& home,
    const std::map<std::string, std::string>& overrides) {
    std::map<std::string, std::string> env{
        {"PATH", "/usr/local/bin:/usr/bin:/bin"},
        {"HOME", home},
        {"LANG", "C.UTF-8"},
        {"LC_ALL", "C.UTF-8"},
        {"PYTHONDONTWRITEBYTECODE", "1"},
        {"PYTHONUNBUFFERED", "1"}
    };
    for (const auto& [key, value] : overrides) {
        env[key] = value;
    }
    return env;
}

const fs::path& SubprocessProvider::StateDir() const {
    static const fs::path kEmpty;
    return session_dir_ ? session_dir_->Path() : kEmpty;
}

void SubprocessProvider::EnsureSession() {
    if (session_dir_) {
        return;
    }
    try {
        session_dir_.emplace("sandcell-" + settings_.session_id);
        if (settings_.workdir.empty()) {
            workdir_ = session_dir_->Path() / "workspace";
        } else {
            workdir_ = utils::ExpandPath(settings_.workdir);
        }
        fs::create_directories(workdir_);
        fs::create_directories(session_dir_->Path() / "job");
        OnSessionStart();
    } catch (const SandboxSetupError&) {
        session_dir_.reset();
        throw;
    } catch (const std::exception& ex) {
        session_dir_.reset();
        throw SandboxSetupError(Name() + ": session setup failed: " + ex.what());
    }
    utils::Log(utils::LogLevel::kInfo, Name(), "session started",
               {{"session", settings_.session_id}, {"state_dir", StateDir().string()},
                {"workdir", workdir_.string()}});
}

void SubprocessProvider::Cleanup() {
    if (!session_dir_) {
        return;
    }
    session_dir_.reset();
    utils::Log(utils::LogLevel::kInfo, Name(), "cleanup", {{"session", settings_.session_id}});
}

sandbox::ProcessResult SubprocessProvider::Launch(LaunchPlan& plan,
                                                  std::chrono::milliseconds timeout,
                                                  const std::atomic<bool>* cancel) {
    sandbox::ProcessSpec spec{};
    spec.argv = plan.argv;
    spec.env = plan.env;
    spec.working_dir = plan.working_dir;
    spec.capture_dir = StateDir();
    spec.timeout = timeout;
    spec.cancel = cancel;
    spec.kernel_filter = plan.kernel_filter;
    spec.on_terminate = plan.on_terminate;

    utils::Log(utils::LogLevel::kInfo, Name(), "launch",
               {{"session", settings_.session_id}, {"argv", ArgvSummary(plan.argv)}});
    auto process = sandbox::ProcessRunner::Run(spec);
    if (!process.launch_error.empty()) {
        utils::Log(utils::LogLevel::kError, Name(), "launch failed", {{"error", process.launch_error}});
        throw SandboxSetupError(Name() + ": " + process.launch_error);
    }
    if (LauncherFailed(process)) {
        utils::Log(utils::LogLevel::kError, Name(), "isolation launcher failed", {{"stderr", process.error}});
        throw SandboxSetupError(Name() + ": isolation launcher failed: " + utils::Trim(process.error));
    }
    if (process.timed_out || process.cancelled) {
        utils::Log(utils::LogLevel::kWarn, Name(), process.cancelled ? "cancelled" : "timeout",
                   {{"session", settings_.session_id}, {"timeout_ms", std::to_string(timeout.count())}});
    } else {
        utils::Log(utils::LogLevel::kDebug, Name(), "exit",
                   {{"code", std::to_string(process.exit_code)},
                    {"duration_ms", std::to_string(process.duration.count())}});
    }
    return process;
}

void SubprocessProvider::SaveSnapshot(const nlohmann::json& values, ExecutionResult& result) {
    const auto snapshot = state::EnvironmentSnapshot::FromValuesJson(values, Name());
    try {
        store_.Save(settings_.session_id, snapshot.Serialize());
    } catch (const std::runtime_error& ex) {
        utils::Log(utils::LogLevel::kError, Name(), "snapshot save failed", {{"error", ex.what()}});
        result.warnings.push_back(std::string("Environment snapshot was not saved: ") + ex.what());
    }
}

ExecutionResult SubprocessProvider::ExecuteGuestCode(const GuestCodeRequest& request) {
    if (!IsValidUtf8(request.source)) {
        return InvalidSourceResult();
    }
    EnsureSession();
    ExecutionResult result{};

    const auto stored = store_.Load(settings_.session_id);
    auto load = state::DeserializeSnapshot(stored.value_or(std::string()), Name());
    result.snapshot_corrupt = load.corrupt;
    for (auto& warning : load.warnings) {
        utils::Log(utils::LogLevel::kWarn, Name(), "snapshot not restored",
                   {{"session", settings_.session_id}, {"reason", warning}});
        result.warnings.push_back(std::move(warning));
    }

    runtime::GuestJob job(StateDir() / "job");
    try {
        job.Prepare(request.source, request.policy, request.trusted, load.snapshot.ValuesToJson());
    } catch (const std::runtime_error& ex) {
        throw SandboxSetupError(Name() + ": cannot prepare guest job: " + ex.what());
    } catch (const nlohmann::json::exception& ex) {
        throw SandboxSetupError(Name() + ": cannot encode guest job: " + ex.what());
    }

    auto plan = PlanGuest(job);
    result.warnings.insert(result.warnings.end(), plan.warnings.begin(), plan.warnings.end());
    const auto process = Launch(plan, request.timeout, request.cancel);
    result.stdout_text = sandbox::StripAnsi(process.output);
    result.stderr_text = sandbox::StripAnsi(process.error);
    result.duration = process.duration;
    result.exit_code = process.exit_code;
    if (process.capture_truncated) {
        result.truncated = true;
        result.warnings.push_back("Output exceeded the capture limit and was cut.");
    }
    if (process.timed_out || process.cancelled) {
        result.error = ExecutionError{
            ErrorKind::kTimeout,
            process.cancelled ? "Execution was cancelled."
                              : "Execution exceeded the time limit of " + std::to_string(request.timeout.count()) + " ms.",
            {}};
        return result;
    }

    auto outcome = job.Collect();
    for (auto& warning : outcome.warnings) {
        if (warning.rfind("SnapshotCorrupt", 0) == 0) {
            result.snapshot_corrupt = true;
        }
        result.warnings.push_back(std::move(warning));
    }
    if (!outcome.finished) {
        result.error = ExecutionError{
            ErrorKind::kGuestRuntimeError,
            "Guest interpreter exited with status " + std::to_string(process.exit_code) +
                " before reporting a result.",
            result.stderr_text};
        return result;
    }
    result.return_value = outcome.return_value;
    if (outcome.snapshot_values) {
        SaveSnapshot(*outcome.snapshot_values, result);
    }
    if (!outcome.ok) {
        result.error = ExecutionError{ErrorKind::kGuestRuntimeError, outcome.error_message, outcome.traceback};
    }
    return result;
}

ExecutionResult SubprocessProvider::ExecuteShellCommand(const ShellCommandRequest& request) {
    EnsureSession();
    ExecutionResult result{};

    const auto command = DropLoginShellFlags(request.command);
    std::map<std::string, std::string> extra_env{{"BASH_ENV", "/dev/null"}, {"ENV", "/dev/null"}};
    std::optional<fs::path> git_config;
    if (InvokesGit(command)) {
        git_config = StateDir() / "gitconfig";
        std::ofstream output(*git_config, std::ios::trunc);
        if (!output.is_open()) {
            throw SandboxSetupError(Name() + ": cannot write " + git_config->string());
        }
        output << kGitConfig;
        extra_env["GIT_CONFIG_GLOBAL"] = git_config->string();
        extra_env["GIT_CONFIG_NOSYSTEM"] = "1";
    }
    const std::string workdir = request.workdir.empty() ? WorkDir().string()
                                                        : utils::ExpandPath(request.workdir).string();
    auto plan = PlanShell({"bash", "-c", command.Render()}, workdir, extra_env);
    result.warnings.insert(result.warnings.end(), plan.warnings.begin(), plan.warnings.end());
    const auto process = Launch(plan, request.timeout, request.cancel);
    if (git_config) {
        std::error_code ec;
        fs::remove(*git_config, ec);
    }

    result.stdout_text = sandbox::StripAnsi(process.output);
    result.stderr_text = sandbox::StripAnsi(process.error);
    result.duration = process.duration;
    result.exit_code = process.exit_code;
    if (process.capture_truncated) {
        result.truncated = true;
        result.warnings.push_back("Output exceeded the capture limit and was cut.");
    }
    if (process.timed_out || process.cancelled) {
        result.error = ExecutionError{
            ErrorKind::kTimeout,
            process.cancelled ? "Command was cancelled."
                              : "Command exceeded the time limit of " + std::to_string(request.timeout.count()) + " ms.",
            {}};
    }
    return result;
}

}  // namespace sandcell::providers
