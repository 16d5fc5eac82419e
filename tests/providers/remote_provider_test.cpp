#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>

#include "httplib.h"
#include "nlohmann/json.hpp"
#include "providers/remote_provider.hpp"
#include "sandbox/process_runner.hpp"

namespace sandcell::providers {
namespace {

using nlohmann::json;

struct RecordedRequest {
    std::string method;
    std::string path;
    json body;
};

// Fake sandbox service; each test overrides the per-endpoint replies it needs.
class RemoteProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_.Post("/v1/sandboxes", [this](const httplib::Request& req, httplib::Response& res) {
            Record(req);
            res.set_content(json{{"sandbox_id", "sbx-1"}}.dump(), "application/json");
        });
        server_.Post(R"(/v1/sandboxes/([^/]+)/execute)", [this](const httplib::Request& req, httplib::Response& res) {
            Record(req);
            res.status = execute_status_;
            res.set_content(execute_reply_.dump(), "application/json");
        });
        server_.Post(R"(/v1/sandboxes/([^/]+)/shell)", [this](const httplib::Request& req, httplib::Response& res) {
            Record(req);
            res.set_content(json{{"stdout", "a.txt\n"}, {"stderr", ""}, {"exit_code", 2}}.dump(),
                            "application/json");
        });
        server_.Delete(R"(/v1/sandboxes/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
            Record(req);
            res.status = 204;
        });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        thread_ = std::thread([this]() { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        ASSERT_TRUE(server_.is_running());

        settings_.session_id = "remote-test";
        settings_.remote.api_base = "http://127.0.0.1:" + std::to_string(port_);
        settings_.remote.api_key = "sk-test-key-123456";
        settings_.remote.request_timeout = std::chrono::seconds(10);
    }

    void TearDown() override {
        server_.stop();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    void Record(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(mutex_);
        RecordedRequest recorded{req.method, req.path, json()};
        if (!req.body.empty()) {
            recorded.body = json::parse(req.body, nullptr, false);
        }
        requests_.push_back(std::move(recorded));
    }

    std::vector<RecordedRequest> Requests() {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    GuestCodeRequest CodeRequest(const std::string& source) const {
        GuestCodeRequest request{};
        request.source = source;
        request.timeout = std::chrono::seconds(5);
        return request;
    }

    httplib::Server server_;
    std::thread thread_;
    int port_ = 0;
    std::mutex mutex_;
    std::vector<RecordedRequest> requests_;
    int execute_status_ = 200;
    json execute_reply_ = {
        {"stdout", "\x1b[32mhello\x1b[0m\n"},
        {"stderr", ""},
        {"return_value", 42},
        {"warnings", {"remote warning"}},
        {"error", nullptr}
    };
    ProviderSettings settings_{};
};

TEST_F(RemoteProviderTest, CreatesSandboxAndExecutes) {
    RemoteProvider provider(settings_);
    EXPECT_FALSE(provider.Started());

    const auto result = provider.ExecuteGuestCode(CodeRequest("print('hello')\n42"));
    EXPECT_TRUE(result.Ok());
    EXPECT_EQ(result.stdout_text, "hello\n");
    ASSERT_TRUE(result.return_value.has_value());
    EXPECT_EQ(*result.return_value, "42");
    EXPECT_EQ(result.warnings, (std::vector<std::string>{"remote warning"}));
    EXPECT_TRUE(provider.Started());
    EXPECT_EQ(provider.SandboxId(), std::optional<std::string>("sbx-1"));

    const auto requests = Requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[0].path, "/v1/sandboxes");
    EXPECT_EQ(requests[0].body["session"], "remote-test");
    EXPECT_EQ(requests[1].path, "/v1/sandboxes/sbx-1/execute");
    EXPECT_EQ(requests[1].body["code"], "print('hello')\n42");
    EXPECT_FALSE(requests[1].body["trusted"].get<bool>());
    EXPECT_TRUE(requests[1].body["policy"].is_object());
    EXPECT_EQ(requests[1].body["timeout_s"], 5);
}

TEST_F(RemoteProviderTest, BootstrapRunsOnceAsTrustedCode) {
    settings_.remote.bootstrap_code = "x = 1";
    RemoteProvider provider(settings_);
    provider.ExecuteGuestCode(CodeRequest("x"));
    provider.ExecuteGuestCode(CodeRequest("x + 1"));

    const auto requests = Requests();
    ASSERT_EQ(requests.size(), 4u);
    EXPECT_EQ(requests[1].body["code"], "x = 1");
    EXPECT_TRUE(requests[1].body["trusted"].get<bool>());
    EXPECT_TRUE(requests[1].body["policy"].is_null());
    EXPECT_EQ(requests[2].body["code"], "x");
    EXPECT_EQ(requests[3].body["code"], "x + 1");
}

TEST_F(RemoteProviderTest, GuestErrorIsMapped) {
    execute_reply_ = {
        {"stdout", ""},
        {"stderr", ""},
        {"error", {{"kind", "GuestRuntimeError"}, {"message", "ZeroDivisionError: division by zero"},
                   {"traceback", "Traceback..."}}}
    };
    RemoteProvider provider(settings_);
    const auto result = provider.ExecuteGuestCode(CodeRequest("1/0"));
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.error->kind, ErrorKind::kGuestRuntimeError);
    EXPECT_EQ(result.error->message, "ZeroDivisionError: division by zero");
    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.return_value.has_value());
}

TEST_F(RemoteProviderTest, GoneSandboxIsSetupError) {
    execute_status_ = 404;
    RemoteProvider provider(settings_);
    try {
        provider.ExecuteGuestCode(CodeRequest("1"));
        FAIL() << "expected SandboxSetupError";
    } catch (const SandboxSetupError& ex) {
        EXPECT_NE(std::string(ex.what()).find("remote session sbx-1 for remote-test is gone"), std::string::npos);
    }
    EXPECT_FALSE(provider.Started());
}

TEST_F(RemoteProviderTest, GatewayTimeoutIsTimeout) {
    execute_status_ = 504;
    RemoteProvider provider(settings_);
    const auto result = provider.ExecuteGuestCode(CodeRequest("while True: pass"));
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.error->kind, ErrorKind::kTimeout);
    EXPECT_EQ(result.exit_code, sandbox::kTimeoutExitCode);
    EXPECT_TRUE(provider.Started());
}

TEST_F(RemoteProviderTest, ShellReportsExitCode) {
    const auto verdict = shell::ShellGuard::Validate("ls -la", shell::ShellPolicy{});
    ASSERT_TRUE(verdict.accepted);
    ShellCommandRequest request{};
    request.command = verdict.command;
    request.workdir = "/workspace";

    RemoteProvider provider(settings_);
    const auto result = provider.ExecuteShellCommand(request);
    EXPECT_TRUE(result.Ok());
    EXPECT_EQ(result.exit_code, 2);
    EXPECT_EQ(result.stdout_text, "a.txt\n");

    const auto requests = Requests();
    ASSERT_EQ(requests.size(), 2u);
    EXPECT_EQ(requests[1].path, "/v1/sandboxes/sbx-1/shell");
    EXPECT_EQ(requests[1].body["command"], "ls -la");
    EXPECT_EQ(requests[1].body["workdir"], "/workspace");
}

TEST_F(RemoteProviderTest, CleanupDeletesOnce) {
    RemoteProvider provider(settings_);
    provider.ExecuteGuestCode(CodeRequest("1"));
    provider.Cleanup();
    provider.Cleanup();
    EXPECT_FALSE(provider.Started());

    int deletes = 0;
    for (const auto& request : Requests()) {
        if (request.method == "DELETE") {
            ++deletes;
            EXPECT_EQ(request.path, "/v1/sandboxes/sbx-1");
        }
    }
    EXPECT_EQ(deletes, 1);
}

TEST_F(RemoteProviderTest, CancelledBeforeSendMakesNoRequest) {
    std::atomic<bool> cancel{true};
    auto request = CodeRequest("1");
    request.cancel = &cancel;

    RemoteProvider provider(settings_);
    const auto result = provider.ExecuteGuestCode(request);
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.error->kind, ErrorKind::kTimeout);
    EXPECT_EQ(result.error->message, "Execution was cancelled.");
    EXPECT_TRUE(Requests().empty());
}

TEST_F(RemoteProviderTest, InvalidUtf8SourceMakesNoRequest) {
    RemoteProvider provider(settings_);
    const auto result = provider.ExecuteGuestCode(CodeRequest("x = '\xff'"));
    ASSERT_FALSE(result.Ok());
    EXPECT_EQ(result.error->kind, ErrorKind::kGuestRuntimeError);
    EXPECT_NE(result.error->message.find("UTF-8"), std::string::npos);
    EXPECT_TRUE(Requests().empty());
}

TEST(RemoteProviderStandaloneTest, UnreachableServiceIsSetupError) {
    ProviderSettings settings{};
    settings.session_id = "nowhere";
    settings.remote.api_base = "http://127.0.0.1:1";
    RemoteProvider provider(settings);
    GuestCodeRequest request{};
    request.source = "1";
    EXPECT_THROW(provider.ExecuteGuestCode(request), SandboxSetupError);
    EXPECT_FALSE(provider.Started());
}

TEST(RemoteProviderStandaloneTest, SupportNeedsApiBase) {
    ProviderSettings settings{};
    EXPECT_FALSE(RemoteProvider::IsSupported(settings));
    settings.remote.api_base = "https://sandbox.example.com/api";
    EXPECT_TRUE(RemoteProvider::IsSupported(settings));
}

}  // namespace
}  // namespace sandcell::providers
