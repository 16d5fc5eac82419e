#include <gtest/gtest.h>

#include "providers/provider_factory.hpp"
#include "state/state_store.hpp"

namespace sandcell::providers {
namespace {

TEST(ProviderKindTest, ParsesNamesAndAliases) {
    EXPECT_EQ(ProviderKindFromString(""), ProviderKind::kAuto);
    EXPECT_EQ(ProviderKindFromString("AUTO"), ProviderKind::kAuto);
    EXPECT_EQ(ProviderKindFromString("bwrap"), ProviderKind::kLocalProfile);
    EXPECT_EQ(ProviderKindFromString("docker"), ProviderKind::kContainer);
    EXPECT_EQ(ProviderKindFromString(" remote "), ProviderKind::kRemote);
    EXPECT_EQ(ProviderKindFromString("kernel-filter"), ProviderKind::kKernelFilter);
    EXPECT_FALSE(ProviderKindFromString("firecracker").has_value());
    for (auto kind : {ProviderKind::kAuto, ProviderKind::kLocalProfile, ProviderKind::kContainer,
                      ProviderKind::kRemote, ProviderKind::kKernelFilter}) {
        EXPECT_EQ(ProviderKindFromString(ToString(kind)), kind);
    }
}

TEST(SelectProviderTest, AutoPrefersLocalThenContainerThenKernelThenRemote) {
    Capabilities caps{};
    EXPECT_FALSE(SelectProvider(ProviderKind::kAuto, caps).has_value());

    caps.remote = true;
    EXPECT_EQ(SelectProvider(ProviderKind::kAuto, caps), ProviderKind::kRemote);
    caps.kernel_filter = true;
    EXPECT_EQ(SelectProvider(ProviderKind::kAuto, caps), ProviderKind::kKernelFilter);
    caps.container = true;
    EXPECT_EQ(SelectProvider(ProviderKind::kAuto, caps), ProviderKind::kContainer);
    caps.local_profile = true;
    EXPECT_EQ(SelectProvider(ProviderKind::kAuto, caps), ProviderKind::kLocalProfile);
}

TEST(SelectProviderTest, ExplicitPreferenceNeedsSupport) {
    Capabilities caps{};
    caps.local_profile = true;
    EXPECT_FALSE(SelectProvider(ProviderKind::kContainer, caps).has_value());
    caps.container = true;
    EXPECT_EQ(SelectProvider(ProviderKind::kContainer, caps), ProviderKind::kContainer);
}

TEST(CapabilitiesTest, JsonUsesShortNames) {
    Capabilities caps{};
    caps.kernel_filter = true;
    const auto json = caps.ToJson();
    EXPECT_TRUE(json["kernel"].get<bool>());
    EXPECT_FALSE(json["local"].get<bool>());
    EXPECT_FALSE(json["container"].get<bool>());
    EXPECT_FALSE(json["remote"].get<bool>());
    EXPECT_TRUE(caps.Supports(ProviderKind::kAuto));
}

TEST(CapabilitiesTest, RemoteNeedsApiBase) {
    ProviderSettings settings{};
    EXPECT_FALSE(ProbeCapabilities(settings).remote);
    settings.remote.api_base = "https://sandbox.example.com";
    EXPECT_TRUE(ProbeCapabilities(settings).remote);
}

TEST(CreateProviderTest, BuildsRequestedBackend) {
    state::InMemoryStateStore store;
    ProviderSettings settings{};
    settings.session_id = "factory";
    settings.remote.api_base = "http://127.0.0.1:1";

    auto remote = CreateProvider(ProviderKind::kRemote, settings, store);
    ASSERT_NE(remote, nullptr);
    EXPECT_EQ(remote->Name(), "remote");
    EXPECT_FALSE(remote->Started());

    auto kernel = CreateProvider(ProviderKind::kKernelFilter, settings, store);
    EXPECT_EQ(kernel->Name(), "kernel-filter");
    EXPECT_EQ(CreateProvider(ProviderKind::kLocalProfile, settings, store)->Name(), "local-profile");
    EXPECT_EQ(CreateProvider(ProviderKind::kContainer, settings, store)->Name(), "container");

    EXPECT_THROW(CreateProvider(ProviderKind::kAuto, settings, store), SandboxSetupError);
}

TEST(ExecutionTypesTest, ErrorKindNamesRoundTrip) {
    for (auto kind : {ErrorKind::kSafetyRejected, ErrorKind::kShellRejected, ErrorKind::kGuestRuntimeError,
                      ErrorKind::kSandboxSetupError, ErrorKind::kTimeout, ErrorKind::kSnapshotCorrupt,
                      ErrorKind::kSessionBusy}) {
        EXPECT_EQ(ErrorKindFromString(ToString(kind)), kind);
    }
    EXPECT_FALSE(ErrorKindFromString("Oops").has_value());
}

TEST(ExecutionTypesTest, ResultJson) {
    auto result = MakeErrorResult(ErrorKind::kShellRejected, "Command 'rm' is not in the list of safe commands.");
    EXPECT_FALSE(result.Ok());
    EXPECT_EQ(result.exit_code, 1);
    auto json = result.ToJson();
    EXPECT_EQ(json["error"]["kind"], "ShellRejected");
    EXPECT_TRUE(json["return_value"].is_null());

    ExecutionResult ok{};
    ok.stdout_text = "hi\n";
    ok.return_value = "42";
    json = ok.ToJson();
    EXPECT_TRUE(ok.Ok());
    EXPECT_TRUE(json["error"].is_null());
    EXPECT_EQ(json["return_value"], "42");
    EXPECT_EQ(json["stdout"], "hi\n");
}

TEST(ExecutionTypesTest, InvalidUtf8IsDetected) {
    EXPECT_TRUE(IsValidUtf8("x = 'caf\xC3\xA9'"));
    EXPECT_TRUE(IsValidUtf8(""));
    EXPECT_FALSE(IsValidUtf8("x = '\xff'"));
    EXPECT_FALSE(IsValidUtf8("\xC3"));

    const auto result = InvalidSourceResult();
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->kind, ErrorKind::kGuestRuntimeError);
    EXPECT_EQ(result.exit_code, 1);
}

TEST(ExecutionTypesTest, ResultWithRawBytesStillSerializes) {
    ExecutionResult result{};
    result.stdout_text = "ok \xff\xfe\n";
    const auto text = result.ToJson().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    EXPECT_NE(text.find("ok \xEF\xBF\xBD"), std::string::npos);
}

}  // namespace
}  // namespace sandcell::providers
