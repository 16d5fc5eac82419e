#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "safety/safety_policy.hpp"
#include "shell/shell_guard.hpp"

namespace sandcell::config {

struct SafetyConfig {
    std::vector<std::string> denied_modules = safety::DefaultDeniedModules();
    std::vector<std::string> denied_functions = safety::DefaultDeniedFunctions();
    std::optional<std::vector<std::string>> authorized_imports;
    std::vector<std::string> authorized_functions;
    bool check_string_obfuscation = true;
};

struct ShellConfig {
    std::vector<std::string> safe_commands = shell::DefaultSafeCommands();
    std::vector<std::string> safe_operators = shell::DefaultSafeOperators();
    std::vector<std::string> additional_safe_commands;
    std::vector<std::string> additional_safe_operators;
    bool bypass_shell_safety = false;
};

struct LimitsConfig {
    std::int64_t memory_mb = 512;
    double cpus = 1.0;
    double timeout_s = 30.0;
    double shell_timeout_s = 30.0;
    std::int64_t max_processes = 64;
};

struct OutputConfig {
    std::int64_t max_lines = 1000;
    std::int64_t max_bytes = 64 * 1024;
    // Empty: the built-in notice.
    std::string truncation_notice;
};

struct SandboxConfig {
    std::string provider = "auto";
    std::string python = "python3";
    std::vector<std::string> read_dirs;
    std::vector<std::string> write_dirs;
    std::map<std::string, std::string> env;
    bool enable_network = false;
    std::string workdir;
    std::string busy_policy = "queue";
    std::string seatbelt_profile;
    nlohmann::json initial_variables = nlohmann::json::object();
};

struct ContainerConfig {
    std::string image = "python:3.12-slim";
    std::string user = "65534:65534";
    std::string workspace = "/workspace";
    bool auto_pull = false;
    std::string docker = "docker";
};

struct RemoteConfig {
    std::string api_base;
    std::string api_key;
    std::vector<std::string> packages;
    std::map<std::string, std::string> secrets;
    std::string bootstrap_code;
    int request_timeout_s = 120;
};

struct StateConfig {
    std::string store = "memory";
    std::string path = "~/.sandcell/state.db";
};

struct LogSettings {
    std::string level = "info";
};

struct Config {
    SafetyConfig safety;
    ShellConfig shell;
    LimitsConfig limits;
    OutputConfig output;
    SandboxConfig sandbox;
    ContainerConfig container;
    RemoteConfig remote;
    StateConfig state;
    LogSettings log;
};

}  // namespace sandcell::config
