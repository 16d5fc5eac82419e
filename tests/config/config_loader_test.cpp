#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

#include "config/config_loader.hpp"
#include "sandbox/temp_dir.hpp"

namespace sandcell::config {
namespace {

// Sets an environment variable for the lifetime of the guard.
class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        ::setenv(name, value, 1);
    }
    ~ScopedEnv() { ::unsetenv(name_); }

    ScopedEnv(const ScopedEnv&) = delete;
    ScopedEnv& operator=(const ScopedEnv&) = delete;

private:
    const char* name_;
};

TEST(ConfigLoaderTest, DefaultsMatchSessionDefaults) {
    const auto session = ToSessionConfig(Config{});
    EXPECT_EQ(session.provider, providers::ProviderKind::kAuto);
    EXPECT_EQ(session.busy_policy, session::BusyPolicy::kQueue);
    EXPECT_FALSE(session.enforcement.authorized_imports.has_value());
    EXPECT_EQ(session.enforcement.denied_modules, safety::DefaultDeniedModules());
    EXPECT_EQ(session.limits.timeout, std::chrono::milliseconds(30000));
    EXPECT_EQ(session.output.truncation_notice, sandbox::kDefaultTruncationNotice);
    EXPECT_FALSE(session.enable_network);
}

TEST(ConfigLoaderTest, ReadsCamelCaseSections) {
    const auto data = nlohmann::json::parse(R"({
        "safety": {"authorizedImports": ["numpy", "pandas.*"], "checkStringObfuscation": false},
        "shell": {"additionalSafeCommands": ["git"], "bypassShellSafety": true},
        "limits": {"memoryMb": 256, "timeoutS": 2.5, "maxProcesses": 8},
        "output": {"maxLines": 50, "truncationNotice": "[cut]"},
        "sandbox": {"provider": "docker", "readDirs": ["/data"], "enableNetwork": true,
                    "busyPolicy": "reject", "env": {"MODE": "test", "BAD": 1},
                    "initialVariables": {"x": 5}},
        "container": {"image": "python:3.11", "autoPull": true},
        "remote": {"apiBase": "https://sbx.example.com", "requestTimeoutS": 30},
        "state": {"store": "sqlite", "path": "/tmp/state.db"},
        "log": {"level": "debug"}
    })");
    Config config{};
    ApplyConfigFromJson(config, data);

    ASSERT_TRUE(config.safety.authorized_imports.has_value());
    EXPECT_EQ(*config.safety.authorized_imports, (std::vector<std::string>{"numpy", "pandas.*"}));
    EXPECT_EQ(config.sandbox.env, (std::map<std::string, std::string>{{"MODE", "test"}}));
    EXPECT_EQ(config.state.store, "sqlite");
    EXPECT_EQ(config.log.level, "debug");

    const auto session = ToSessionConfig(config);
    EXPECT_EQ(session.provider, providers::ProviderKind::kContainer);
    EXPECT_EQ(session.busy_policy, session::BusyPolicy::kReject);
    EXPECT_FALSE(session.enforcement.check_string_obfuscation);
    EXPECT_EQ(session.shell.additional_safe_commands, (std::vector<std::string>{"git"}));
    EXPECT_TRUE(session.shell.bypass_shell_safety);
    EXPECT_EQ(session.limits.memory_mb, 256u);
    EXPECT_EQ(session.limits.timeout, std::chrono::milliseconds(2500));
    EXPECT_EQ(session.limits.max_processes, 8u);
    EXPECT_EQ(session.output.max_lines, 50u);
    EXPECT_EQ(session.output.truncation_notice, "[cut]");
    EXPECT_EQ(session.mounts.read_only, (std::vector<std::string>{"/data"}));
    EXPECT_TRUE(session.enable_network);
    EXPECT_EQ(session.initial_variables["x"], 5);
    EXPECT_EQ(session.container.image, "python:3.11");
    EXPECT_TRUE(session.container.auto_pull);
    EXPECT_EQ(session.remote.api_base, "https://sbx.example.com");
    EXPECT_EQ(session.remote.request_timeout, std::chrono::seconds(30));
}

TEST(ConfigLoaderTest, NullAuthorizedImportsClearsAllowList) {
    Config config{};
    config.safety.authorized_imports = std::vector<std::string>{"numpy"};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"safety": {"authorizedImports": null}})"));
    EXPECT_FALSE(config.safety.authorized_imports.has_value());
}

TEST(ConfigLoaderTest, WrongTypesAreIgnored) {
    Config config{};
    ApplyConfigFromJson(config, nlohmann::json::parse(R"({"limits": {"memoryMb": "lots"}, "sandbox": []})"));
    EXPECT_EQ(config.limits.memory_mb, 512);
    EXPECT_EQ(config.sandbox.provider, "auto");
}

TEST(ConfigLoaderTest, EnvironmentOverridesPreferSectionedNames) {
    ScopedEnv sectioned("SANDCELL_SANDBOX__PROVIDER", "kernel");
    ScopedEnv flat("SANDCELL_PROVIDER", "remote");
    ScopedEnv imports("SANDCELL_AUTHORIZED_IMPORTS", "numpy, pandas ,");
    ScopedEnv network("SANDCELL_SANDBOX__ENABLE_NETWORK", "yes");
    ScopedEnv memory("SANDCELL_LIMITS__MEMORY_MB", "not-a-number");
    ScopedEnv timeout("SANDCELL_TIMEOUT_S", "0.5");

    Config config{};
    ApplyEnvironmentOverrides(config);
    EXPECT_EQ(config.sandbox.provider, "kernel");
    ASSERT_TRUE(config.safety.authorized_imports.has_value());
    EXPECT_EQ(*config.safety.authorized_imports, (std::vector<std::string>{"numpy", "pandas"}));
    EXPECT_TRUE(config.sandbox.enable_network);
    EXPECT_EQ(config.limits.memory_mb, 512);
    EXPECT_DOUBLE_EQ(config.limits.timeout_s, 0.5);
}

TEST(ConfigLoaderTest, InvalidValuesAreConfigErrors) {
    Config provider{};
    provider.sandbox.provider = "firecracker";
    EXPECT_THROW(ToSessionConfig(provider), ConfigError);

    Config busy{};
    busy.sandbox.busy_policy = "drop";
    EXPECT_THROW(ToSessionConfig(busy), ConfigError);

    Config memory{};
    memory.limits.memory_mb = 0;
    EXPECT_THROW(ToSessionConfig(memory), ConfigError);

    Config timeout{};
    timeout.limits.timeout_s = -1;
    EXPECT_THROW(ToSessionConfig(timeout), ConfigError);

    Config output{};
    output.output.max_bytes = 0;
    EXPECT_THROW(ToSessionConfig(output), ConfigError);

    Config remote{};
    remote.remote.request_timeout_s = 0;
    EXPECT_THROW(ToSessionConfig(remote), ConfigError);
}

TEST(ConfigLoaderTest, LoadsFileThenEnvironment) {
    sandbox::TempDir dir("config-test");
    const auto path = dir.Path() / "config.json";
    {
        std::ofstream output(path);
        output << R"({"sandbox": {"provider": "container", "workdir": "/srv/work"}})";
    }
    ScopedEnv workdir("SANDCELL_WORKDIR", "/override");

    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.provider, "container");
    EXPECT_EQ(config.sandbox.workdir, "/override");
}

TEST(ConfigLoaderTest, MalformedFileKeepsDefaults) {
    sandbox::TempDir dir("config-test");
    const auto path = dir.Path() / "config.json";
    {
        std::ofstream output(path);
        output << "{\"sandbox\": {\"provider\": ";
    }
    const auto config = LoadConfig(path);
    EXPECT_EQ(config.sandbox.provider, "auto");
    EXPECT_EQ(config.limits.memory_mb, 512);
}

TEST(ConfigLoaderTest, MissingFileUsesDefaults) {
    const auto config = LoadConfig("/sandcell-no-such-dir/config.json");
    EXPECT_EQ(config.state.store, "memory");
}

TEST(ConfigLoaderTest, ConfigPathHonoursOverride) {
    ScopedEnv path("SANDCELL_CONFIG", "/etc/sandcell/config.json");
    EXPECT_EQ(GetConfigPath(), std::filesystem::path("/etc/sandcell/config.json"));
}

}  // namespace
}  // namespace sandcell::config
