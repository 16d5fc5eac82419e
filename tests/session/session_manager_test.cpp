#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <future>
#include <mutex>
#include <thread>

#include "providers/provider_factory.hpp"
#include "session/session_manager.hpp"
#include "state/environment_snapshot.hpp"

namespace sandcell::session {
namespace {

using providers::ErrorKind;
using providers::ExecutionResult;

// Observations shared between a test and the fake backends it created.
struct FakeBackendState {
    std::mutex mutex;
    std::condition_variable changed;
    bool hold = false;
    int entered = 0;
    int running = 0;
    int max_running = 0;
    int code_calls = 0;
    int shell_calls = 0;
    int cleanups = 0;
    bool throw_setup = false;
    bool wait_for_cancel = false;
    std::string stdout_text = "ok\n";
    std::vector<providers::GuestCodeRequest> code_requests;
    std::vector<std::string> shell_lines;

    void Release() {
        std::lock_guard<std::mutex> lock(mutex);
        hold = false;
        changed.notify_all();
    }

    void WaitEntered(int count) {
        std::unique_lock<std::mutex> lock(mutex);
        changed.wait_for(lock, std::chrono::seconds(10), [&]() { return entered >= count; });
    }
};

class FakeProvider : public providers::ExecutionProvider {
public:
    explicit FakeProvider(FakeBackendState& state) : state_(state) {}

    std::string Name() const override { return "fake"; }

    ExecutionResult ExecuteGuestCode(const providers::GuestCodeRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(state_.mutex);
            ++state_.code_calls;
            state_.code_requests.push_back(request);
        }
        return Run(request.cancel);
    }

    ExecutionResult ExecuteShellCommand(const providers::ShellCommandRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(state_.mutex);
            ++state_.shell_calls;
            state_.shell_lines.push_back(request.command.Render());
        }
        return Run(request.cancel);
    }

    void Cleanup() override {
        std::lock_guard<std::mutex> lock(state_.mutex);
        if (started_) {
            ++state_.cleanups;
        }
        started_ = false;
    }

    bool Started() const override { return started_; }

private:
    ExecutionResult Run(const std::atomic<bool>* cancel) {
        std::unique_lock<std::mutex> lock(state_.mutex);
        if (state_.throw_setup) {
            throw providers::SandboxSetupError("fake: launcher missing");
        }
        started_ = true;
        ++state_.entered;
        ++state_.running;
        state_.max_running = std::max(state_.max_running, state_.running);
        state_.changed.notify_all();
        state_.changed.wait_for(lock, std::chrono::seconds(10), [&]() { return !state_.hold; });
        ExecutionResult result{};
        if (state_.wait_for_cancel) {
            lock.unlock();
            const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
            while (!cancel->load() && std::chrono::steady_clock::now() < deadline) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
            lock.lock();
            result = providers::MakeErrorResult(ErrorKind::kTimeout, "Execution was cancelled.");
        } else {
            result.stdout_text = state_.stdout_text;
        }
        --state_.running;
        return result;
    }

    FakeBackendState& state_;
    bool started_ = false;
};

class SandboxServiceTest : public ::testing::Test {
protected:
    std::unique_ptr<SandboxService> MakeService(SessionConfig defaults = {}) {
        return std::make_unique<SandboxService>(
            std::move(defaults), store_,
            [this](const SessionConfig&, const providers::ProviderSettings& settings, state::StateStore&) {
                last_settings_ = settings;
                ++created_;
                return std::make_unique<FakeProvider>(backend_);
            });
    }

    static SubmitRequest Code(const std::string& source) {
        SubmitRequest request{};
        request.payload = source;
        return request;
    }

    static SubmitRequest Shell(const std::string& line) {
        SubmitRequest request{};
        request.kind = SubmitKind::kShell;
        request.payload = line;
        return request;
    }

    FakeBackendState backend_;
    state::InMemoryStateStore store_;
    providers::ProviderSettings last_settings_{};
    int created_ = 0;
};

TEST_F(SandboxServiceTest, SubmitRunsVettedCode) {
    auto service = MakeService();
    service->ConfigureSession("s1");
    const auto result = service->Submit("s1", Code("total = sum(range(4))\ntotal"));
    EXPECT_TRUE(result.Ok());
    EXPECT_EQ(result.stdout_text, "ok\n");
    ASSERT_EQ(backend_.code_requests.size(), 1u);
    EXPECT_EQ(backend_.code_requests[0].timeout, SessionConfig{}.limits.timeout);
    EXPECT_FALSE(backend_.code_requests[0].trusted);
    EXPECT_NE(backend_.code_requests[0].cancel, nullptr);
}

TEST_F(SandboxServiceTest, RejectedCodeNeverReachesBackend) {
    auto service = MakeService();
    service->ConfigureSession("s1");
    const auto code = service->Submit("s1", Code("import os\nos.system('id')"));
    ASSERT_FALSE(code.Ok());
    EXPECT_EQ(code.error->kind, ErrorKind::kSafetyRejected);
    EXPECT_NE(code.error->message.find("os"), std::string::npos);

    const auto shell = service->Submit("s1", Shell("rm -rf /"));
    ASSERT_FALSE(shell.Ok());
    EXPECT_EQ(shell.error->kind, ErrorKind::kShellRejected);
    EXPECT_EQ(shell.error->message, "Command 'rm' is not in the list of safe commands.");

    EXPECT_EQ(backend_.code_calls, 0);
    EXPECT_EQ(backend_.shell_calls, 0);
}

TEST_F(SandboxServiceTest, ShellRunsRenderedCommand) {
    auto service = MakeService();
    service->ConfigureSession("s1");
    SubmitRequest request = Shell("ls   -la  |  grep 'a b'");
    request.timeout = std::chrono::milliseconds(1500);
    EXPECT_TRUE(service->Submit("s1", request).Ok());
    ASSERT_EQ(backend_.shell_lines.size(), 1u);
    EXPECT_EQ(backend_.shell_lines[0], "ls -la | grep 'a b'");
}

TEST_F(SandboxServiceTest, UnknownSessionIsAnError) {
    auto service = MakeService();
    EXPECT_THROW(service->Submit("missing", Code("1")), SessionError);
    EXPECT_FALSE(service->Teardown("missing"));
    EXPECT_FALSE(service->Cancel("missing"));
    EXPECT_THROW(service->ConfigureSession(""), SessionError);
}

TEST_F(SandboxServiceTest, BusySessionRejectsSecondSubmit) {
    SessionConfig config{};
    config.busy_policy = BusyPolicy::kReject;
    auto service = MakeService(config);
    service->ConfigureSession("s1");

    backend_.hold = true;
    auto first = std::async(std::launch::async, [&]() { return service->Submit("s1", Code("1")); });
    backend_.WaitEntered(1);

    const auto second = service->Submit("s1", Code("2"));
    ASSERT_FALSE(second.Ok());
    EXPECT_EQ(second.error->kind, ErrorKind::kSessionBusy);
    EXPECT_EQ(second.error->message, "Session 's1' is busy with another execution.");

    backend_.Release();
    EXPECT_TRUE(first.get().Ok());
    EXPECT_EQ(backend_.code_calls, 1);
}

TEST_F(SandboxServiceTest, QueuedSubmitsRunOneAtATime) {
    auto service = MakeService();
    service->ConfigureSession("s1");

    backend_.hold = true;
    auto first = std::async(std::launch::async, [&]() { return service->Submit("s1", Code("1")); });
    backend_.WaitEntered(1);
    auto second = std::async(std::launch::async, [&]() { return service->Submit("s1", Code("2")); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    {
        std::lock_guard<std::mutex> lock(backend_.mutex);
        EXPECT_EQ(backend_.entered, 1);
    }

    backend_.Release();
    EXPECT_TRUE(first.get().Ok());
    EXPECT_TRUE(second.get().Ok());
    EXPECT_EQ(backend_.code_calls, 2);
    EXPECT_EQ(backend_.max_running, 1);
}

TEST_F(SandboxServiceTest, DistinctSessionsRunInParallel) {
    auto service = MakeService();
    service->ConfigureSession("a");
    service->ConfigureSession("b");

    backend_.hold = true;
    auto first = std::async(std::launch::async, [&]() { return service->Submit("a", Code("1")); });
    auto second = std::async(std::launch::async, [&]() { return service->Submit("b", Code("2")); });
    backend_.WaitEntered(2);
    {
        std::lock_guard<std::mutex> lock(backend_.mutex);
        EXPECT_EQ(backend_.max_running, 2);
    }
    backend_.Release();
    EXPECT_TRUE(first.get().Ok());
    EXPECT_TRUE(second.get().Ok());
}

TEST_F(SandboxServiceTest, CancelStopsRunningExecution) {
    auto service = MakeService();
    service->ConfigureSession("s1");
    backend_.wait_for_cancel = true;

    auto running = std::async(std::launch::async, [&]() { return service->Submit("s1", Code("1")); });
    backend_.WaitEntered(1);
    EXPECT_TRUE(service->Cancel("s1"));
    const auto result = running.get();
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.error->kind, ErrorKind::kTimeout);

    // The flag is reset for the next submission.
    backend_.wait_for_cancel = false;
    EXPECT_TRUE(service->Submit("s1", Code("2")).Ok());
}

TEST_F(SandboxServiceTest, SetupFailureMakesSessionUnusable) {
    auto service = MakeService();
    service->ConfigureSession("s1");
    backend_.throw_setup = true;
    EXPECT_THROW(service->Submit("s1", Code("1")), providers::SandboxSetupError);

    backend_.throw_setup = false;
    try {
        service->Submit("s1", Code("1"));
        FAIL() << "expected SandboxSetupError";
    } catch (const providers::SandboxSetupError& ex) {
        EXPECT_NE(std::string(ex.what()).find("fake: launcher missing"), std::string::npos);
    }

    const auto sessions = service->ListSessions();
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_TRUE(sessions[0].failed);

    EXPECT_TRUE(service->Teardown("s1"));
    service->ConfigureSession("s1");
    EXPECT_TRUE(service->Submit("s1", Code("1")).Ok());
}

TEST_F(SandboxServiceTest, ReconfigureStartedSessionNeedsForce) {
    auto service = MakeService();
    service->ConfigureSession("s1");
    // Not started yet: reconfiguring is free.
    service->ConfigureSession("s1");
    EXPECT_EQ(created_, 2);

    ASSERT_TRUE(service->Submit("s1", Code("1")).Ok());
    SessionConfig changed{};
    changed.enable_network = true;
    EXPECT_THROW(service->ConfigureSession("s1", changed), SessionError);
    EXPECT_EQ(created_, 2);

    service->ConfigureSession("s1", changed, true);
    EXPECT_EQ(created_, 3);
    EXPECT_EQ(backend_.cleanups, 1);
    EXPECT_TRUE(last_settings_.enable_network);
}

TEST_F(SandboxServiceTest, OutputIsTruncated) {
    SessionConfig config{};
    config.output.max_lines = 2;
    config.output.truncation_notice = "[{stream}: -{removed_lines} lines]";
    auto service = MakeService(config);
    service->ConfigureSession("s1");
    backend_.stdout_text = "a\nb\nc\nd\n";

    const auto result = service->Submit("s1", Code("1"));
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_text.rfind("a\nb\n", 0), 0u);
    EXPECT_EQ(result.stdout_text.find("c\n"), std::string::npos);
    EXPECT_NE(result.stdout_text.find("[stdout: -"), std::string::npos);
}

TEST_F(SandboxServiceTest, InitialVariablesSeedTheSnapshot) {
    SessionConfig config{};
    config.initial_variables = {{"x", 5}, {"names", {"a", "b"}}, {"__hidden", 1}, {"not valid", 2}};
    auto service = MakeService();
    service->ConfigureSession("s1", config);

    const auto bytes = store_.Load("s1");
    ASSERT_TRUE(bytes.has_value());
    const auto load = state::DeserializeSnapshot(*bytes, "fake");
    EXPECT_FALSE(load.corrupt);
    ASSERT_EQ(load.snapshot.values.size(), 2u);
    EXPECT_EQ(load.snapshot.values.at("x").encoding, "json");
    EXPECT_EQ(load.snapshot.values.at("x").value, 5);
    EXPECT_EQ(load.snapshot.values.at("names").value, nlohmann::json({"a", "b"}));
}

TEST_F(SandboxServiceTest, TeardownReleasesBackendAndState) {
    auto service = MakeService();
    service->ConfigureSession("s1");
    ASSERT_TRUE(service->Submit("s1", Code("1")).Ok());
    store_.Save("s1", "bytes");

    EXPECT_TRUE(service->Teardown("s1"));
    EXPECT_EQ(backend_.cleanups, 1);
    EXPECT_FALSE(store_.Load("s1").has_value());
    EXPECT_THROW(service->Submit("s1", Code("1")), SessionError);
    EXPECT_FALSE(service->Teardown("s1"));
}

TEST_F(SandboxServiceTest, SubmitQueuedBehindTeardownDoesNotRun) {
    auto service = MakeService();
    service->ConfigureSession("s1");

    backend_.hold = true;
    auto first = std::async(std::launch::async, [&]() { return service->Submit("s1", Code("1")); });
    backend_.WaitEntered(1);
    auto queued = std::async(std::launch::async, [&]() { return service->Submit("s1", Code("2")); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto teardown = std::async(std::launch::async, [&]() { return service->Teardown("s1"); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    backend_.Release();
    EXPECT_TRUE(first.get().Ok());
    EXPECT_THROW(queued.get(), SessionError);
    EXPECT_TRUE(teardown.get());
    EXPECT_EQ(backend_.code_calls, 1);
    EXPECT_FALSE(store_.Load("s1").has_value());
}

TEST_F(SandboxServiceTest, ListSessionsReportsState) {
    auto service = MakeService();
    service->ConfigureSession("beta");
    service->ConfigureSession("alpha");
    ASSERT_TRUE(service->Submit("beta", Code("1")).Ok());

    const auto sessions = service->ListSessions();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].id, "alpha");
    EXPECT_FALSE(sessions[0].started);
    EXPECT_EQ(sessions[1].id, "beta");
    EXPECT_TRUE(sessions[1].started);
    EXPECT_EQ(sessions[1].executions, 1u);
    EXPECT_EQ(sessions[1].ToJson()["provider"], "fake");
}

// Two submissions racing on one session of a real host backend must both
// land; the second sees the first one's snapshot.
TEST(SandboxServiceBackendTest, ConcurrentIncrementsBothPersist) {
    state::InMemoryStateStore store;
    SessionConfig config{};
    config.limits.memory_mb = 1024;
    const auto caps = providers::ProbeCapabilities(ToProviderSettings("counter", config));
    if (caps.Supports(providers::ProviderKind::kKernelFilter)) {
        config.provider = providers::ProviderKind::kKernelFilter;
    } else if (caps.Supports(providers::ProviderKind::kLocalProfile)) {
        config.provider = providers::ProviderKind::kLocalProfile;
    } else {
        GTEST_SKIP() << "no host backend available";
    }

    SandboxService service(config, store);
    service.ConfigureSession("counter");
    SubmitRequest init{};
    init.payload = "counter = 0";
    try {
        const auto result = service.Submit("counter", init);
        ASSERT_TRUE(result.Ok()) << result.error->message;
    } catch (const providers::SandboxSetupError& ex) {
        GTEST_SKIP() << "backend cannot start here: " << ex.what();
    }

    SubmitRequest increment{};
    increment.payload = "counter += 1";
    auto first = std::async(std::launch::async, [&]() { return service.Submit("counter", increment); });
    auto second = std::async(std::launch::async, [&]() { return service.Submit("counter", increment); });
    const auto first_result = first.get();
    const auto second_result = second.get();
    ASSERT_TRUE(first_result.Ok()) << first_result.error->message;
    ASSERT_TRUE(second_result.Ok()) << second_result.error->message;

    SubmitRequest read{};
    read.payload = "counter";
    const auto total = service.Submit("counter", read);
    ASSERT_TRUE(total.Ok()) << total.error->message;
    EXPECT_EQ(total.return_value, std::optional<std::string>("2"));
    EXPECT_TRUE(service.Teardown("counter"));
}

TEST(ProviderSettingsTest, InitialVariablesBecomeRemoteBootstrap) {
    SessionConfig config{};
    config.remote.bootstrap_code = "import json";
    config.initial_variables = {{"x", 5}};
    const auto settings = ToProviderSettings("s1", config);
    EXPECT_EQ(settings.session_id, "s1");
    EXPECT_EQ(settings.remote.bootstrap_code.rfind("import json\n", 0), 0u);
    EXPECT_NE(settings.remote.bootstrap_code.find("globals().update("), std::string::npos);

    SessionConfig plain{};
    EXPECT_TRUE(ToProviderSettings("s2", plain).remote.bootstrap_code.empty());
}

TEST(SessionTypesTest, ParsesEnumNames) {
    EXPECT_EQ(SubmitKindFromString("shell"), SubmitKind::kShell);
    EXPECT_EQ(SubmitKindFromString("python"), SubmitKind::kGuestCode);
    EXPECT_FALSE(SubmitKindFromString("perl").has_value());
    EXPECT_EQ(BusyPolicyFromString("Reject"), BusyPolicy::kReject);
    EXPECT_FALSE(BusyPolicyFromString("drop").has_value());
}

}  // namespace
}  // namespace sandcell::session
