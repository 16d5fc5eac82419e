#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <linux/filter.h>
#include <sys/types.h>

namespace sandcell::sandbox {

struct KernelFilterSpec {
    std::vector<std::string> read_paths;
    std::vector<std::string> write_paths;
    bool allow_network = false;
    // Zero leaves the corresponding limit untouched.
    std::uint64_t memory_bytes = 0;
    std::uint64_t cpu_seconds = 0;
    // Tasks the child may add on top of those the user already runs.
    std::uint64_t max_processes = 0;
    std::uint64_t max_file_bytes = 0;
};

// Restrictions applied to a child between fork and exec: resource limits,
// no_new_privs, a Landlock filesystem ruleset and a seccomp BPF filter.
// Everything that allocates or opens files happens in the constructor (in
// the parent); ApplyInChild only issues syscalls.
class KernelFilter {
public:
    explicit KernelFilter(const KernelFilterSpec& spec);
    ~KernelFilter();

    KernelFilter(const KernelFilter&) = delete;
    KernelFilter& operator=(const KernelFilter&) = delete;

    // Returns 0 or the errno of the first step that failed.
    int ApplyInChild() const noexcept;

    bool LandlockActive() const { return ruleset_fd_ >= 0; }
    const std::vector<std::string>& Warnings() const { return warnings_; }
    const std::vector<sock_filter>& Program() const { return program_; }

    static bool SeccompAvailable();
    // Landlock ABI version, or 0 when the kernel does not offer it.
    static int LandlockAbi();
    static bool NativeArchitectureSupported();
    // Tasks (threads included) owned by the real uid, as RLIMIT_NPROC counts them.
    static std::uint64_t CountUserTasks(uid_t uid);

    // RLIMIT_NPROC value the child gets, or 0 when unlimited.
    std::uint64_t ProcessLimit() const { return process_limit_; }

private:
    void BuildSeccompProgram(bool allow_network);
    void BuildLandlockRuleset(const KernelFilterSpec& spec);
    bool AddPathRule(const std::string& path, bool writable);

    KernelFilterSpec spec_;
    std::vector<sock_filter> program_;
    int ruleset_fd_ = -1;
    std::uint64_t process_limit_ = 0;
    std::vector<std::string> warnings_;
};

}  // namespace sandcell::sandbox
