#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "providers/execution_types.hpp"

namespace sandcell::providers {

enum class ProviderKind {
    kAuto,
    kLocalProfile,
    kContainer,
    kRemote,
    kKernelFilter
};

const char* ToString(ProviderKind kind);
std::optional<ProviderKind> ProviderKindFromString(const std::string& value);

struct ResourceLimits {
    std::uint64_t memory_mb = 512;
    double cpus = 1.0;
    std::chrono::milliseconds timeout{30000};
    std::chrono::milliseconds shell_timeout{30000};
    std::uint64_t max_processes = 64;
};

struct MountTable {
    std::vector<std::string> read_only;
    std::vector<std::string> read_write;
};

struct LocalSettings {
    std::string python = "python3";
    // Seatbelt profile text or path; replaces the generated one on macOS.
    std::string seatbelt_profile;
};

struct ContainerSettings {
    std::string image = "python:3.12-slim";
    std::string user = "65534:65534";
    std::string workspace = "/workspace";
    bool auto_pull = false;
    std::string docker = "docker";
};

struct RemoteSettings {
    std::string api_base;
    std::string api_key;
    std::vector<std::string> packages;
    std::map<std::string, std::string> secrets;
    // Framework scaffolding, sent once per remote sandbox as trusted code.
    std::string bootstrap_code;
    std::chrono::seconds request_timeout{120};
};

struct ProviderSettings {
    std::string session_id;
    // Empty: a private directory inside the session state dir.
    std::string workdir;
    MountTable mounts;
    std::map<std::string, std::string> env;
    ResourceLimits limits;
    bool enable_network = false;
    LocalSettings local;
    ContainerSettings container;
    RemoteSettings remote;
};

// One isolation mechanism bound to one session. Instances are used by one
// execution at a time; the session layer serializes calls.
class ExecutionProvider {
public:
    virtual ~ExecutionProvider() = default;

    virtual std::string Name() const = 0;
    virtual ExecutionResult ExecuteGuestCode(const GuestCodeRequest& request) = 0;
    virtual ExecutionResult ExecuteShellCommand(const ShellCommandRequest& request) = 0;
    // Idempotent; safe after a partially failed start.
    virtual void Cleanup() = 0;
    // True once session resources exist (first execution started them).
    virtual bool Started() const = 0;
};

}  // namespace sandcell::providers
