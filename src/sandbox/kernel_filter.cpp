#include "sandbox/kernel_filter.hpp"

#include <cerrno>
#include <cstddef>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <linux/audit.h>
#include <linux/landlock.h>
#include <linux/seccomp.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/syscall.h>
#include <unistd.h>

namespace sandcell::sandbox {
namespace {

#ifndef __NR_landlock_create_ruleset
#define __NR_landlock_create_ruleset 444
#endif
#ifndef __NR_landlock_add_rule
#define __NR_landlock_add_rule 445
#endif
#ifndef __NR_landlock_restrict_self
#define __NR_landlock_restrict_self 446
#endif

#if defined(__x86_64__)
constexpr std::uint32_t kNativeArch = AUDIT_ARCH_X86_64;
#elif defined(__aarch64__)
constexpr std::uint32_t kNativeArch = AUDIT_ARCH_AARCH64;
#else
constexpr std::uint32_t kNativeArch = 0;
#endif

constexpr std::uint64_t kReadAccess =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_READ_DIR;
constexpr std::uint64_t kFileAccess =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_READ_FILE | LANDLOCK_ACCESS_FS_WRITE_FILE;
constexpr std::uint64_t kHandledAccess =
    LANDLOCK_ACCESS_FS_EXECUTE | LANDLOCK_ACCESS_FS_WRITE_FILE | LANDLOCK_ACCESS_FS_READ_FILE |
    LANDLOCK_ACCESS_FS_READ_DIR | LANDLOCK_ACCESS_FS_REMOVE_DIR | LANDLOCK_ACCESS_FS_REMOVE_FILE |
    LANDLOCK_ACCESS_FS_MAKE_CHAR | LANDLOCK_ACCESS_FS_MAKE_DIR | LANDLOCK_ACCESS_FS_MAKE_REG |
    LANDLOCK_ACCESS_FS_MAKE_SOCK | LANDLOCK_ACCESS_FS_MAKE_FIFO | LANDLOCK_ACCESS_FS_MAKE_BLOCK |
    LANDLOCK_ACCESS_FS_MAKE_SYM;

// Syscalls guest code never needs: kernel, mount namespace and
// cross-process introspection.
const long kDeniedSyscalls[] = {
    __NR_ptrace, __NR_mount, __NR_umount2, __NR_pivot_root, __NR_chroot, __NR_kexec_load,
    __NR_init_module, __NR_finit_module, __NR_delete_module, __NR_reboot, __NR_swapon,
    __NR_swapoff, __NR_bpf, __NR_perf_event_open, __NR_keyctl, __NR_add_key, __NR_request_key,
    __NR_unshare, __NR_setns, __NR_process_vm_readv, __NR_process_vm_writev,
};

sock_filter Stmt(std::uint16_t code, std::uint32_t k) {
    return sock_filter{code, 0, 0, k};
}

sock_filter Jump(std::uint16_t code, std::uint32_t k, std::uint8_t jt, std::uint8_t jf) {
    return sock_filter{code, jt, jf, k};
}

}  // namespace

KernelFilter::KernelFilter(const KernelFilterSpec& spec)
    : spec_(spec) {
    if (spec.max_processes > 0) {
        process_limit_ = CountUserTasks(::getuid()) + spec.max_processes;
    }
    BuildSeccompProgram(spec.allow_network);
    BuildLandlockRuleset(spec);
}

KernelFilter::~KernelFilter() {
    if (ruleset_fd_ >= 0) {
        ::close(ruleset_fd_);
        ruleset_fd_ = -1;
    }
}

bool KernelFilter::SeccompAvailable() {
    return ::prctl(PR_GET_SECCOMP, 0, 0, 0, 0) >= 0;
}

int KernelFilter::LandlockAbi() {
    const long abi = ::syscall(__NR_landlock_create_ruleset, nullptr, 0, LANDLOCK_CREATE_RULESET_VERSION);
    return abi > 0 ? static_cast<int>(abi) : 0;
}

bool KernelFilter::NativeArchitectureSupported() {
    return kNativeArch != 0;
}

std::uint64_t KernelFilter::CountUserTasks(uid_t uid) {
    std::uint64_t tasks = 0;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const auto name = entry.path().filename().string();
        if (name.empty() || name.find_first_not_of("0123456789") != std::string::npos) {
            continue;
        }
        // Processes may exit while the directory is being read.
        std::ifstream status(entry.path() / "status");
        bool owned = false;
        std::uint64_t threads = 0;
        std::string line;
        while (std::getline(status, line)) {
            std::istringstream fields(line);
            std::string key;
            fields >> key;
            if (key == "Uid:") {
                long long real = -1;
                fields >> real;
                owned = real == static_cast<long long>(uid);
            } else if (key == "Threads:") {
                fields >> threads;
            }
        }
        if (owned) {
            tasks += threads > 0 ? threads : 1;
        }
    }
    return tasks;
}

void KernelFilter::BuildSeccompProgram(bool allow_network) {
    const auto ret_errno = static_cast<std::uint32_t>(SECCOMP_RET_ERRNO | (EPERM & SECCOMP_RET_DATA));
    program_.push_back(Stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, kNativeArch, 1, 0));
    program_.push_back(Stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    program_.push_back(Stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));
#if defined(__x86_64__)
    // x32 syscalls share the arch value.
    program_.push_back(Jump(BPF_JMP | BPF_JGE | BPF_K, 0x40000000U, 0, 1));
    program_.push_back(Stmt(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
#endif
    for (const long nr : kDeniedSyscalls) {
        program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<std::uint32_t>(nr), 0, 1));
        program_.push_back(Stmt(BPF_RET | BPF_K, ret_errno));
    }
    if (!allow_network) {
        program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, static_cast<std::uint32_t>(__NR_socket), 0, 4));
        program_.push_back(Stmt(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, args[0])));
        program_.push_back(Jump(BPF_JMP | BPF_JEQ | BPF_K, AF_UNIX, 0, 1));
        program_.push_back(Stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
        program_.push_back(Stmt(BPF_RET | BPF_K, ret_errno));
    }
    program_.push_back(Stmt(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
}

void KernelFilter::BuildLandlockRuleset(const KernelFilterSpec& spec) {
    if (LandlockAbi() <= 0) {
        warnings_.push_back("Landlock is not available on this kernel; filesystem access is not restricted.");
        return;
    }
    landlock_ruleset_attr attr{};
    attr.handled_access_fs = kHandledAccess;
    const long fd = ::syscall(__NR_landlock_create_ruleset, &attr, sizeof(attr), 0);
    if (fd < 0) {
        warnings_.push_back(std::string("Landlock ruleset creation failed: ") + std::strerror(errno));
        return;
    }
    ruleset_fd_ = static_cast<int>(fd);
    for (const auto& path : spec.read_paths) {
        AddPathRule(path, false);
    }
    for (const auto& path : spec.write_paths) {
        AddPathRule(path, true);
    }
}

bool KernelFilter::AddPathRule(const std::string& path, bool writable) {
    const int path_fd = ::open(path.c_str(), O_PATH | O_CLOEXEC);
    if (path_fd < 0) {
        return false;
    }
    struct stat info {};
    if (::fstat(path_fd, &info) != 0) {
        ::close(path_fd);
        return false;
    }
    landlock_path_beneath_attr rule{};
    rule.parent_fd = path_fd;
    if (S_ISDIR(info.st_mode)) {
        rule.allowed_access = writable ? kHandledAccess : kReadAccess;
    } else {
        rule.allowed_access = writable ? kFileAccess : (kReadAccess & ~LANDLOCK_ACCESS_FS_READ_DIR);
    }
    const long rc = ::syscall(__NR_landlock_add_rule, ruleset_fd_, LANDLOCK_RULE_PATH_BENEATH, &rule, 0);
    ::close(path_fd);
    if (rc != 0) {
        warnings_.push_back("Landlock rule for " + path + " was rejected: " + std::strerror(errno));
        return false;
    }
    return true;
}

int KernelFilter::ApplyInChild() const noexcept {
    auto limit = [](int resource, std::uint64_t value) {
        if (value == 0) {
            return 0;
        }
        rlimit rl{};
        rl.rlim_cur = static_cast<rlim_t>(value);
        rl.rlim_max = static_cast<rlim_t>(value);
        return ::setrlimit(resource, &rl) == 0 ? 0 : errno;
    };
    int err = limit(RLIMIT_AS, spec_.memory_bytes);
    if (err == 0) {
        err = limit(RLIMIT_CPU, spec_.cpu_seconds);
    }
    if (err == 0) {
        err = limit(RLIMIT_NPROC, process_limit_);
    }
    if (err == 0) {
        err = limit(RLIMIT_FSIZE, spec_.max_file_bytes);
    }
    if (err != 0) {
        return err;
    }
    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0) {
        return errno;
    }
    if (ruleset_fd_ >= 0 && ::syscall(__NR_landlock_restrict_self, ruleset_fd_, 0) != 0) {
        return errno;
    }
    sock_fprog prog{};
    prog.len = static_cast<unsigned short>(program_.size());
    prog.filter = const_cast<sock_filter*>(program_.data());
    if (::prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return errno;
    }
    return 0;
}

}  // namespace sandcell::sandbox
