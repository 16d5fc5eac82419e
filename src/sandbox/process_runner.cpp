#include "sandbox/process_runner.hpp"

#include <atomic>
#include <cerrno>
#include <cstdio>
#include <fstream>
#include <system_error>
#include <thread>

#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "sandbox/kernel_filter.hpp"
#include "sandbox/process_compat.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

extern char** environ;

namespace sandcell::sandbox {
namespace {

namespace fs = std::filesystem;

std::string ReadCapped(const fs::path& path, std::size_t limit, bool& truncated) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::string data(limit, '\0');
    input.read(&data[0], static_cast<std::streamsize>(limit));
    data.resize(static_cast<std::size_t>(input.gcount()));
    if (input && input.peek() != std::char_traits<char>::eof()) {
        truncated = true;
    }
    return data;
}

std::string CaptureStamp() {
    static std::atomic<unsigned long> counter{0};
    return std::to_string(::getpid()) + "_" +
           std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) + "_" +
           std::to_string(counter.fetch_add(1));
}

void SignalGroup(pid_t pid, int signal) {
    if (::kill(-pid, signal) != 0) {
        ::kill(pid, signal);
    }
}

}  // namespace

std::map<std::string, std::string> ProcessRunner::HostEnvironment() {
    std::map<std::string, std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        const std::string item(*entry);
        const auto eq = item.find('=');
        if (eq != std::string::npos) {
            env[item.substr(0, eq)] = item.substr(eq + 1);
        }
    }
    return env;
}

std::string ProcessRunner::FindExecutable(const std::string& program) {
    if (program.empty()) {
        return {};
    }
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0 ? program : std::string();
    }
    const auto found = bp::search_path(program);
    return found.empty() ? std::string() : found.string();
}

ProcessResult ProcessRunner::Run(const ProcessSpec& spec) {
    ProcessResult result{};
    const auto started = std::chrono::steady_clock::now();
    if (spec.argv.empty()) {
        result.launch_error = "empty command";
        return result;
    }
    const auto exe = FindExecutable(spec.argv.front());
    if (exe.empty()) {
        result.launch_error = "executable not found: " + spec.argv.front();
        return result;
    }

    const auto capture_dir = spec.capture_dir.empty() ? fs::temp_directory_path() : spec.capture_dir;
    const auto stamp = CaptureStamp();
    const auto stdout_path = capture_dir / ("stdout_" + stamp + ".log");
    const auto stderr_path = capture_dir / ("stderr_" + stamp + ".log");

    bp::environment env;
    for (const auto& [key, value] : spec.env) {
        env[key] = value;
    }
    const std::vector<std::string> args(spec.argv.begin() + 1, spec.argv.end());
    const auto working_dir = spec.working_dir.empty() ? fs::current_path().string() : spec.working_dir.string();
    const KernelFilter* filter = spec.kernel_filter;
    const auto max_file_bytes = spec.max_file_bytes;

    try {
        bp::child child_process(
            bp::exe = exe,
            bp::args = args,
            env,
            bp::start_dir = working_dir,
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            bp::extend::on_exec_setup([filter, max_file_bytes](auto& exec) {
                ::setpgid(0, 0);
                if (max_file_bytes > 0) {
                    rlimit rl{};
                    rl.rlim_cur = static_cast<rlim_t>(max_file_bytes);
                    rl.rlim_max = static_cast<rlim_t>(max_file_bytes);
                    if (::setrlimit(RLIMIT_FSIZE, &rl) != 0) {
                        exec.set_error(std::error_code(errno, std::system_category()), "file size limit failed");
                        return;
                    }
                }
                if (filter) {
                    const int err = filter->ApplyInChild();
                    if (err != 0) {
                        exec.set_error(std::error_code(err, std::system_category()), "kernel filter setup failed");
                    }
                }
            }));

        const auto deadline = started + spec.timeout;
        bool finished = false;
        int status = 0;
        const pid_t pid = child_process.id();
        while (true) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0) {
                break;
            }
            if (std::chrono::steady_clock::now() >= deadline) {
                result.timed_out = true;
                break;
            }
            if (spec.cancel && spec.cancel->load()) {
                result.cancelled = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        if (!finished && (result.timed_out || result.cancelled)) {
            SignalGroup(pid, SIGTERM);
            if (spec.on_terminate) {
                spec.on_terminate();
            }
            const auto grace_deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (std::chrono::steady_clock::now() < grace_deadline) {
                const auto waited = ::waitpid(pid, &status, WNOHANG);
                if (waited == pid) {
                    finished = true;
                    break;
                }
                if (waited < 0) {
                    break;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            if (!finished) {
                SignalGroup(pid, SIGKILL);
                ::waitpid(pid, &status, 0);
            }
        }
        // Reaped above; keep the child object from waiting again.
        child_process.detach();

        if (result.timed_out || result.cancelled) {
            result.exit_code = kTimeoutExitCode;
        } else if (finished) {
            if (WIFEXITED(status)) {
                result.exit_code = WEXITSTATUS(status);
            } else if (WIFSIGNALED(status)) {
                result.exit_code = 128 + WTERMSIG(status);
            }
        }
    } catch (const bp::process_error& ex) {
        result.exit_code = -1;
        result.launch_error = std::string("exec failed: ") + ex.what();
    }

    result.output = ReadCapped(stdout_path, spec.capture_limit, result.capture_truncated);
    result.error = ReadCapped(stderr_path, spec.capture_limit, result.capture_truncated);

    std::error_code ec;
    fs::remove(stdout_path, ec);
    fs::remove(stderr_path, ec);
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return result;
}

int ProcessRunner::RunQuiet(const std::vector<std::string>& argv,
                            std::chrono::milliseconds timeout,
                            std::string* output) {
    ProcessSpec spec{};
    spec.argv = argv;
    spec.env = HostEnvironment();
    spec.timeout = timeout;
    spec.capture_limit = 1024 * 1024;
    const auto result = Run(spec);
    if (!result.launch_error.empty()) {
        utils::Log(utils::LogLevel::kDebug, "sandbox", "probe failed",
                   {{"command", utils::Join(argv, " ")}, {"error", result.launch_error}});
        return -1;
    }
    if (output) {
        *output = result.output;
    }
    return result.timed_out ? -1 : result.exit_code;
}

}  // namespace sandcell::sandbox
