#pragma once

#include <string>
#include <vector>

#include "providers/execution_provider.hpp"

namespace sandcell::providers {

// Default-deny filesystem/network profile for one invocation. Rendered for
// macOS Seatbelt or Linux bubblewrap; the kernel-filter backend feeds the
// same path lists to Landlock.
struct AccessProfile {
    std::vector<std::string> read_paths;
    std::vector<std::string> write_paths;
    bool allow_network = false;
    std::string workdir;

    static const std::vector<std::string>& SafeReadPaths();

    // read = safe set + interpreter prefix + temp dir + mounts.read_only + workdir
    // write = workdir + state dir + mounts.read_write
    static AccessProfile Build(const ProviderSettings& settings,
                               const std::string& workdir,
                               const std::string& state_dir,
                               const std::string& interpreter);

    std::string ToSeatbelt() const;
    // bwrap arguments up to (not including) the wrapped command.
    std::vector<std::string> ToBwrapArgs(const std::string& bwrap) const;
};

// Installation prefix of an interpreter binary (/usr for /usr/bin/python3),
// following symlinks.
std::string InterpreterPrefix(const std::string& interpreter);

}  // namespace sandcell::providers
