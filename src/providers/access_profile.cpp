#include "providers/access_profile.hpp"

#include <algorithm>
#include <filesystem>
#include <sstream>

#include "sandbox/process_runner.hpp"
#include "utils/common.hpp"

namespace sandcell::providers {
namespace {

namespace fs = std::filesystem;

void AddUnique(std::vector<std::string>& paths, const std::string& path) {
    if (path.empty()) {
        return;
    }
    if (std::find(paths.begin(), paths.end(), path) == paths.end()) {
        paths.push_back(path);
    }
}

std::string SeatbeltQuote(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

bool IsUnder(const std::string& path, const std::string& root) {
    if (path == root) {
        return true;
    }
    const auto prefix = root.back() == '/' ? root : root + "/";
    return path.rfind(prefix, 0) == 0;
}

}  // namespace

const std::vector<std::string>& AccessProfile::SafeReadPaths() {
    static const std::vector<std::string> kPaths = {
        "/usr", "/bin", "/sbin", "/lib", "/lib64", "/etc", "/opt", "/dev"
    };
    return kPaths;
}

std::string InterpreterPrefix(const std::string& interpreter) {
    const auto located = sandbox::ProcessRunner::FindExecutable(interpreter);
    if (located.empty()) {
        return {};
    }
    std::error_code ec;
    auto resolved = fs::canonical(located, ec);
    if (ec) {
        resolved = located;
    }
    // <prefix>/bin/python3
    return resolved.parent_path().parent_path().string();
}

AccessProfile AccessProfile::Build(const ProviderSettings& settings,
                                   const std::string& workdir,
                                   const std::string& state_dir,
                                   const std::string& interpreter) {
    AccessProfile profile{};
    profile.allow_network = settings.enable_network;
    profile.workdir = workdir;
    for (const auto& path : SafeReadPaths()) {
        AddUnique(profile.read_paths, path);
    }
    const auto prefix = InterpreterPrefix(interpreter);
    if (!prefix.empty() && prefix != "/") {
        AddUnique(profile.read_paths, prefix);
    }
    AddUnique(profile.read_paths, fs::temp_directory_path().string());
    for (const auto& path : settings.mounts.read_only) {
        AddUnique(profile.read_paths, utils::ExpandPath(path).string());
    }
    AddUnique(profile.read_paths, workdir);

    AddUnique(profile.write_paths, workdir);
    AddUnique(profile.write_paths, state_dir);
    for (const auto& path : settings.mounts.read_write) {
        AddUnique(profile.write_paths, utils::ExpandPath(path).string());
    }
    return profile;
}

std::string AccessProfile::ToSeatbelt() const {
    std::ostringstream out;
    out << "(version 1)\n"
        << "(deny default)\n"
        << "(allow process-exec)\n"
        << "(allow process-fork)\n"
        << "(allow signal (target self))\n"
        << "(allow sysctl-read)\n"
        << "(allow mach-lookup)\n"
        << "(allow ipc-posix-shm)\n"
        << "(allow file-read-metadata)\n";
    out << "(allow file-read*\n    (literal \"/\")\n    (literal \"/dev/null\")";
    for (const auto& path : read_paths) {
        out << "\n    (subpath " << SeatbeltQuote(path) << ")";
    }
    for (const auto& path : write_paths) {
        out << "\n    (subpath " << SeatbeltQuote(path) << ")";
    }
    out << ")\n";
    out << "(allow file-write*\n    (literal \"/dev/null\")\n    (literal \"/dev/tty\")";
    for (const auto& path : write_paths) {
        out << "\n    (subpath " << SeatbeltQuote(path) << ")";
    }
    out << ")\n";
    if (allow_network) {
        out << "(allow network*)\n";
    } else {
        out << "(allow network* (remote unix-socket))\n";
    }
    return out.str();
}

std::vector<std::string> AccessProfile::ToBwrapArgs(const std::string& bwrap) const {
    std::vector<std::string> args{bwrap, "--unshare-all"};
    if (allow_network) {
        args.push_back("--share-net");
    }
    args.insert(args.end(), {"--die-with-parent", "--new-session", "--dev", "/dev", "--proc", "/proc",
                             "--tmpfs", "/tmp"});
    const auto temp_dir = fs::temp_directory_path().string();
    for (const auto& path : read_paths) {
        // /dev and the temp dir are provided above.
        if (path == "/dev" || IsUnder(path, temp_dir)) {
            continue;
        }
        args.insert(args.end(), {"--ro-bind-try", path, path});
    }
    // Later binds win, so writable paths nested in read-only ones stay writable.
    for (const auto& path : write_paths) {
        args.insert(args.end(), {"--bind-try", path, path});
    }
    for (const auto& path : read_paths) {
        if (IsUnder(path, temp_dir) && path != temp_dir) {
            args.insert(args.end(), {"--ro-bind-try", path, path});
        }
    }
    if (!workdir.empty()) {
        args.insert(args.end(), {"--chdir", workdir});
    }
    return args;
}

}  // namespace sandcell::providers
