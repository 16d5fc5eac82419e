#include "config/config_loader.hpp"

#include <cmath>
#include <fstream>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandcell::config {
namespace {

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = utils::GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return utils::GetEnv(secondary);
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadBool(const nlohmann::json& section, const char* key, bool& target) {
    if (section.contains(key) && section[key].is_boolean()) {
        target = section[key].get<bool>();
    }
}

template <typename Number>
void ReadNumber(const nlohmann::json& section, const char* key, Number& target) {
    if (section.contains(key) && section[key].is_number()) {
        target = section[key].get<Number>();
    }
}

std::vector<std::string> StringList(const nlohmann::json& items) {
    std::vector<std::string> values;
    for (const auto& item : items) {
        if (item.is_string()) {
            values.push_back(item.get<std::string>());
        }
    }
    return values;
}

void ReadStringList(const nlohmann::json& section, const char* key, std::vector<std::string>& target) {
    if (section.contains(key) && section[key].is_array()) {
        target = StringList(section[key]);
    }
}

void ReadStringMap(const nlohmann::json& section, const char* key, std::map<std::string, std::string>& target) {
    if (!section.contains(key) || !section[key].is_object()) {
        return;
    }
    target.clear();
    for (const auto& item : section[key].items()) {
        if (item.value().is_string()) {
            target[item.key()] = item.value().get<std::string>();
        }
    }
}

bool ParseBool(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

std::int64_t ParseInt(const std::string& value, std::int64_t fallback) {
    try {
        return std::stoll(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        return std::stod(value);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::chrono::milliseconds ToMillis(double seconds, const char* name) {
    if (!(seconds > 0.0) || !std::isfinite(seconds)) {
        throw ConfigError(std::string(name) + " must be a positive number of seconds");
    }
    return std::chrono::milliseconds(static_cast<std::int64_t>(std::llround(seconds * 1000.0)));
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto overridden = utils::GetEnv("SANDCELL_CONFIG");
    if (!overridden.empty()) {
        return utils::ExpandPath(overridden);
    }
    return utils::GetHomePath() / ".sandcell" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("safety") && data["safety"].is_object()) {
        const auto& safety = data["safety"];
        ReadStringList(safety, "deniedModules", config.safety.denied_modules);
        ReadStringList(safety, "deniedFunctions", config.safety.denied_functions);
        if (safety.contains("authorizedImports")) {
            if (safety["authorizedImports"].is_array()) {
                config.safety.authorized_imports = StringList(safety["authorizedImports"]);
            } else if (safety["authorizedImports"].is_null()) {
                config.safety.authorized_imports.reset();
            }
        }
        ReadStringList(safety, "authorizedFunctions", config.safety.authorized_functions);
        ReadBool(safety, "checkStringObfuscation", config.safety.check_string_obfuscation);
    }

    if (data.contains("shell") && data["shell"].is_object()) {
        const auto& shell = data["shell"];
        ReadStringList(shell, "safeCommands", config.shell.safe_commands);
        ReadStringList(shell, "safeOperators", config.shell.safe_operators);
        ReadStringList(shell, "additionalSafeCommands", config.shell.additional_safe_commands);
        ReadStringList(shell, "additionalSafeOperators", config.shell.additional_safe_operators);
        ReadBool(shell, "bypassShellSafety", config.shell.bypass_shell_safety);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ReadNumber(limits, "memoryMb", config.limits.memory_mb);
        ReadNumber(limits, "cpus", config.limits.cpus);
        ReadNumber(limits, "timeoutS", config.limits.timeout_s);
        ReadNumber(limits, "shellTimeoutS", config.limits.shell_timeout_s);
        ReadNumber(limits, "maxProcesses", config.limits.max_processes);
    }

    if (data.contains("output") && data["output"].is_object()) {
        const auto& output = data["output"];
        ReadNumber(output, "maxLines", config.output.max_lines);
        ReadNumber(output, "maxBytes", config.output.max_bytes);
        ReadString(output, "truncationNotice", config.output.truncation_notice);
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        const auto& sandbox = data["sandbox"];
        ReadString(sandbox, "provider", config.sandbox.provider);
        ReadString(sandbox, "python", config.sandbox.python);
        ReadStringList(sandbox, "readDirs", config.sandbox.read_dirs);
        ReadStringList(sandbox, "writeDirs", config.sandbox.write_dirs);
        ReadStringMap(sandbox, "env", config.sandbox.env);
        ReadBool(sandbox, "enableNetwork", config.sandbox.enable_network);
        ReadString(sandbox, "workdir", config.sandbox.workdir);
        ReadString(sandbox, "busyPolicy", config.sandbox.busy_policy);
        ReadString(sandbox, "seatbeltProfile", config.sandbox.seatbelt_profile);
        if (sandbox.contains("initialVariables") && sandbox["initialVariables"].is_object()) {
            config.sandbox.initial_variables = sandbox["initialVariables"];
        }
    }

    if (data.contains("container") && data["container"].is_object()) {
        const auto& container = data["container"];
        ReadString(container, "image", config.container.image);
        ReadString(container, "user", config.container.user);
        ReadString(container, "workspace", config.container.workspace);
        ReadBool(container, "autoPull", config.container.auto_pull);
        ReadString(container, "docker", config.container.docker);
    }

    if (data.contains("remote") && data["remote"].is_object()) {
        const auto& remote = data["remote"];
        ReadString(remote, "apiBase", config.remote.api_base);
        ReadString(remote, "apiKey", config.remote.api_key);
        ReadStringList(remote, "packages", config.remote.packages);
        ReadStringMap(remote, "secrets", config.remote.secrets);
        ReadString(remote, "bootstrapCode", config.remote.bootstrap_code);
        ReadNumber(remote, "requestTimeoutS", config.remote.request_timeout_s);
    }

    if (data.contains("state") && data["state"].is_object()) {
        const auto& state = data["state"];
        ReadString(state, "store", config.state.store);
        ReadString(state, "path", config.state.path);
    }

    if (data.contains("log") && data["log"].is_object()) {
        ReadString(data["log"], "level", config.log.level);
    }
}

void ApplyEnvironmentOverrides(Config& config) {
    const auto provider = GetEnvFallback("SANDCELL_SANDBOX__PROVIDER", "SANDCELL_PROVIDER");
    if (!provider.empty()) {
        config.sandbox.provider = provider;
    }

    const auto python = GetEnvFallback("SANDCELL_SANDBOX__PYTHON", "SANDCELL_PYTHON");
    if (!python.empty()) {
        config.sandbox.python = python;
    }

    const auto read_dirs = GetEnvFallback("SANDCELL_SANDBOX__READ_DIRS", "SANDCELL_READ_DIRS");
    if (!read_dirs.empty()) {
        config.sandbox.read_dirs = utils::SplitCsv(read_dirs);
    }

    const auto write_dirs = GetEnvFallback("SANDCELL_SANDBOX__WRITE_DIRS", "SANDCELL_WRITE_DIRS");
    if (!write_dirs.empty()) {
        config.sandbox.write_dirs = utils::SplitCsv(write_dirs);
    }

    const auto enable_network = GetEnvFallback("SANDCELL_SANDBOX__ENABLE_NETWORK", "SANDCELL_ENABLE_NETWORK");
    if (!enable_network.empty()) {
        config.sandbox.enable_network = ParseBool(enable_network);
    }

    const auto workdir = GetEnvFallback("SANDCELL_SANDBOX__WORKDIR", "SANDCELL_WORKDIR");
    if (!workdir.empty()) {
        config.sandbox.workdir = workdir;
    }

    const auto busy_policy = GetEnvFallback("SANDCELL_SANDBOX__BUSY_POLICY", "SANDCELL_BUSY_POLICY");
    if (!busy_policy.empty()) {
        config.sandbox.busy_policy = busy_policy;
    }

    const auto authorized_imports =
        GetEnvFallback("SANDCELL_SAFETY__AUTHORIZED_IMPORTS", "SANDCELL_AUTHORIZED_IMPORTS");
    if (!authorized_imports.empty()) {
        config.safety.authorized_imports = utils::SplitCsv(authorized_imports);
    }

    const auto authorized_functions =
        GetEnvFallback("SANDCELL_SAFETY__AUTHORIZED_FUNCTIONS", "SANDCELL_AUTHORIZED_FUNCTIONS");
    if (!authorized_functions.empty()) {
        config.safety.authorized_functions = utils::SplitCsv(authorized_functions);
    }

    const auto safe_commands =
        GetEnvFallback("SANDCELL_SHELL__ADDITIONAL_SAFE_COMMANDS", "SANDCELL_ADDITIONAL_SAFE_COMMANDS");
    if (!safe_commands.empty()) {
        config.shell.additional_safe_commands = utils::SplitCsv(safe_commands);
    }

    const auto bypass_shell = GetEnvFallback("SANDCELL_SHELL__BYPASS_SHELL_SAFETY", "SANDCELL_BYPASS_SHELL_SAFETY");
    if (!bypass_shell.empty()) {
        config.shell.bypass_shell_safety = ParseBool(bypass_shell);
    }

    const auto memory_mb = GetEnvFallback("SANDCELL_LIMITS__MEMORY_MB", "SANDCELL_MEMORY_MB");
    if (!memory_mb.empty()) {
        config.limits.memory_mb = ParseInt(memory_mb, config.limits.memory_mb);
    }

    const auto cpus = GetEnvFallback("SANDCELL_LIMITS__CPUS", "SANDCELL_CPUS");
    if (!cpus.empty()) {
        config.limits.cpus = ParseDouble(cpus, config.limits.cpus);
    }

    const auto timeout = GetEnvFallback("SANDCELL_LIMITS__TIMEOUT_S", "SANDCELL_TIMEOUT_S");
    if (!timeout.empty()) {
        config.limits.timeout_s = ParseDouble(timeout, config.limits.timeout_s);
    }

    const auto shell_timeout = GetEnvFallback("SANDCELL_LIMITS__SHELL_TIMEOUT_S", "SANDCELL_SHELL_TIMEOUT_S");
    if (!shell_timeout.empty()) {
        config.limits.shell_timeout_s = ParseDouble(shell_timeout, config.limits.shell_timeout_s);
    }

    const auto max_processes = GetEnvFallback("SANDCELL_LIMITS__MAX_PROCESSES", "SANDCELL_MAX_PROCESSES");
    if (!max_processes.empty()) {
        config.limits.max_processes = ParseInt(max_processes, config.limits.max_processes);
    }

    const auto image = GetEnvFallback("SANDCELL_CONTAINER__IMAGE", "SANDCELL_CONTAINER_IMAGE");
    if (!image.empty()) {
        config.container.image = image;
    }

    const auto auto_pull = GetEnvFallback("SANDCELL_CONTAINER__AUTO_PULL", "SANDCELL_CONTAINER_AUTO_PULL");
    if (!auto_pull.empty()) {
        config.container.auto_pull = ParseBool(auto_pull);
    }

    const auto api_base = GetEnvFallback("SANDCELL_REMOTE__API_BASE", "SANDCELL_REMOTE_API_BASE");
    if (!api_base.empty()) {
        config.remote.api_base = api_base;
    }

    const auto api_key = GetEnvFallback("SANDCELL_REMOTE__API_KEY", "SANDCELL_REMOTE_API_KEY");
    if (!api_key.empty()) {
        config.remote.api_key = api_key;
    }

    const auto store = GetEnvFallback("SANDCELL_STATE__STORE", "SANDCELL_STATE_STORE");
    if (!store.empty()) {
        config.state.store = store;
    }

    const auto store_path = GetEnvFallback("SANDCELL_STATE__PATH", "SANDCELL_STATE_PATH");
    if (!store_path.empty()) {
        config.state.path = store_path;
    }

    const auto log_level = GetEnvFallback("SANDCELL_LOG__LEVEL", "SANDCELL_LOG_LEVEL");
    if (!log_level.empty()) {
        config.log.level = log_level;
    }
}

Config LoadConfig(const std::filesystem::path& path) {
    Config config{};

    std::error_code ec;
    if (std::filesystem::exists(path, ec)) {
        try {
            std::ifstream input(path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "config", "malformed config file, using defaults",
                       {{"path", path.string()}, {"error", ex.what()}});
        }
    }

    ApplyEnvironmentOverrides(config);
    return config;
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

session::SessionConfig ToSessionConfig(const Config& config) {
    session::SessionConfig session{};

    const auto provider = providers::ProviderKindFromString(config.sandbox.provider);
    if (!provider) {
        throw ConfigError("unknown sandbox.provider '" + config.sandbox.provider +
                          "' (expected auto, local, container, remote or kernel)");
    }
    session.provider = *provider;

    const auto busy_policy = session::BusyPolicyFromString(config.sandbox.busy_policy);
    if (!busy_policy) {
        throw ConfigError("unknown sandbox.busyPolicy '" + config.sandbox.busy_policy + "' (expected queue or reject)");
    }
    session.busy_policy = *busy_policy;

    session.enforcement.denied_modules = config.safety.denied_modules;
    session.enforcement.denied_functions = config.safety.denied_functions;
    session.enforcement.authorized_imports = config.safety.authorized_imports;
    session.enforcement.authorized_functions = config.safety.authorized_functions;
    session.enforcement.check_string_obfuscation = config.safety.check_string_obfuscation;

    session.shell.safe_commands = config.shell.safe_commands;
    session.shell.safe_operators = config.shell.safe_operators;
    session.shell.additional_safe_commands = config.shell.additional_safe_commands;
    session.shell.additional_safe_operators = config.shell.additional_safe_operators;
    session.shell.bypass_shell_safety = config.shell.bypass_shell_safety;

    if (config.limits.memory_mb <= 0) {
        throw ConfigError("limits.memoryMb must be positive");
    }
    if (!(config.limits.cpus > 0.0)) {
        throw ConfigError("limits.cpus must be positive");
    }
    if (config.limits.max_processes <= 0) {
        throw ConfigError("limits.maxProcesses must be positive");
    }
    session.limits.memory_mb = static_cast<std::uint64_t>(config.limits.memory_mb);
    session.limits.cpus = config.limits.cpus;
    session.limits.timeout = ToMillis(config.limits.timeout_s, "limits.timeoutS");
    session.limits.shell_timeout = ToMillis(config.limits.shell_timeout_s, "limits.shellTimeoutS");
    session.limits.max_processes = static_cast<std::uint64_t>(config.limits.max_processes);

    if (config.output.max_lines <= 0 || config.output.max_bytes <= 0) {
        throw ConfigError("output.maxLines and output.maxBytes must be positive");
    }
    session.output.max_lines = static_cast<std::size_t>(config.output.max_lines);
    session.output.max_bytes = static_cast<std::size_t>(config.output.max_bytes);
    if (!config.output.truncation_notice.empty()) {
        session.output.truncation_notice = config.output.truncation_notice;
    }

    session.mounts.read_only = config.sandbox.read_dirs;
    session.mounts.read_write = config.sandbox.write_dirs;
    session.env = config.sandbox.env;
    session.enable_network = config.sandbox.enable_network;
    session.workdir = config.sandbox.workdir;
    session.initial_variables = config.sandbox.initial_variables;

    session.local.python = config.sandbox.python;
    session.local.seatbelt_profile = config.sandbox.seatbelt_profile;

    session.container.image = config.container.image;
    session.container.user = config.container.user;
    session.container.workspace = config.container.workspace;
    session.container.auto_pull = config.container.auto_pull;
    session.container.docker = config.container.docker;

    session.remote.api_base = config.remote.api_base;
    session.remote.api_key = config.remote.api_key;
    session.remote.packages = config.remote.packages;
    session.remote.secrets = config.remote.secrets;
    session.remote.bootstrap_code = config.remote.bootstrap_code;
    if (config.remote.request_timeout_s <= 0) {
        throw ConfigError("remote.requestTimeoutS must be positive");
    }
    session.remote.request_timeout = std::chrono::seconds(config.remote.request_timeout_s);
    return session;
}

}  // namespace sandcell::config
