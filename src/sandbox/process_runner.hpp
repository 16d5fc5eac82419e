#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace sandcell::sandbox {

class KernelFilter;

inline constexpr std::size_t kCaptureLimitBytes = 16 * 1024 * 1024;
inline constexpr std::uint64_t kFileSizeLimitBytes = 256ULL * 1024 * 1024;
inline constexpr int kTimeoutExitCode = 124;

struct ProcessSpec {
    std::vector<std::string> argv;
    // Replaces the inherited environment entirely.
    std::map<std::string, std::string> env;
    std::filesystem::path working_dir;
    // stdout/stderr are redirected to files in this directory.
    std::filesystem::path capture_dir;
    std::chrono::milliseconds timeout{30000};
    const std::atomic<bool>* cancel = nullptr;
    std::size_t capture_limit = kCaptureLimitBytes;
    // RLIMIT_FSIZE for the child, bounding the capture files as well as
    // anything it writes itself. Zero leaves the limit untouched.
    std::uint64_t max_file_bytes = kFileSizeLimitBytes;
    // Applied in the child between fork and exec.
    const KernelFilter* kernel_filter = nullptr;
    // Runs after the process group was signalled because of a timeout or
    // cancellation (e.g. to stop a container the client started).
    std::function<void()> on_terminate;
};

struct ProcessResult {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    bool capture_truncated = false;
    std::string output;
    std::string error;
    // Non-empty when the process could not be started at all.
    std::string launch_error;
    std::chrono::milliseconds duration{0};
};

class ProcessRunner {
public:
    static ProcessResult Run(const ProcessSpec& spec);

    static std::map<std::string, std::string> HostEnvironment();

    // Absolute path of `program` on PATH, or empty.
    static std::string FindExecutable(const std::string& program);

    // Runs a short host command (tool probes, docker housekeeping) with the
    // current environment and returns its exit code, or -1.
    static int RunQuiet(const std::vector<std::string>& argv,
                        std::chrono::milliseconds timeout,
                        std::string* output = nullptr);
};

}  // namespace sandcell::sandbox
