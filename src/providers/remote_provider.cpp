#include "providers/remote_provider.hpp"

#include <memory>
#include <stdexcept>

#include "httplib.h"
#include "sandbox/output_filter.hpp"
#include "sandbox/process_runner.hpp"
#include "utils/logging.hpp"

namespace sandcell::providers {
namespace {

constexpr auto kConnectTimeout = std::chrono::seconds(10);
// Slack on top of the execution deadline before the client gives up.
constexpr auto kReadSlack = std::chrono::seconds(15);

struct ParsedUrl {
    bool https = true;
    std::string host;
    int port = 443;
    std::string base_path;
};

ParsedUrl ParseUrl(const std::string& url) {
    ParsedUrl parsed{};
    std::string working = url;
    if (working.rfind("https://", 0) == 0) {
        parsed.https = true;
        working = working.substr(8);
    } else if (working.rfind("http://", 0) == 0) {
        parsed.https = false;
        parsed.port = 80;
        working = working.substr(7);
    }

    const auto slash_pos = working.find('/');
    std::string host_port = working;
    if (slash_pos != std::string::npos) {
        host_port = working.substr(0, slash_pos);
        parsed.base_path = working.substr(slash_pos);
    }

    const auto colon_pos = host_port.find(':');
    if (colon_pos != std::string::npos) {
        parsed.host = host_port.substr(0, colon_pos);
        parsed.port = std::stoi(host_port.substr(colon_pos + 1));
    } else {
        parsed.host = host_port;
    }

    if (!parsed.base_path.empty() && parsed.base_path.back() == '/') {
        parsed.base_path.pop_back();
    }
    return parsed;
}

std::string MaskKey(const std::string& key) {
    if (key.size() <= 8) {
        return "****";
    }
    return key.substr(0, 4) + "****" + key.substr(key.size() - 4);
}

std::chrono::seconds TimeoutSeconds(std::chrono::milliseconds timeout) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(timeout + std::chrono::milliseconds(999));
    return seconds.count() > 0 ? seconds : std::chrono::seconds(1);
}

std::string StringField(const nlohmann::json& body, const char* key) {
    if (!body.is_object() || !body.contains(key) || !body[key].is_string()) {
        return {};
    }
    return body[key].get<std::string>();
}

ExecutionResult TimeoutResult(std::chrono::milliseconds timeout, std::chrono::milliseconds duration) {
    ExecutionResult result{};
    result.exit_code = sandbox::kTimeoutExitCode;
    result.duration = duration;
    result.error = ExecutionError{
        ErrorKind::kTimeout,
        "Execution exceeded the time limit of " + std::to_string(timeout.count()) + " ms.",
        {}};
    return result;
}

ExecutionResult CancelledResult() {
    ExecutionResult result{};
    result.exit_code = sandbox::kTimeoutExitCode;
    result.error = ExecutionError{ErrorKind::kTimeout, "Execution was cancelled.", {}};
    return result;
}

std::chrono::milliseconds Since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

}  // namespace

RemoteProvider::RemoteProvider(ProviderSettings settings)
    : settings_(std::move(settings)) {}

RemoteProvider::~RemoteProvider() {
    Cleanup();
}

bool RemoteProvider::IsSupported(const ProviderSettings& settings) {
    return !settings.remote.api_base.empty();
}

std::string RemoteProvider::SandboxPath(const std::string& suffix) const {
    return "/v1/sandboxes/" + sandbox_id_.value_or("") + suffix;
}

RemoteProvider::Reply RemoteProvider::Send(const std::string& method,
                                           const std::string& path,
                                           const nlohmann::json& payload,
                                           std::chrono::seconds read_timeout) {
    const auto& remote = settings_.remote;
    if (remote.api_base.empty()) {
        throw SandboxSetupError("remote: no API base configured");
    }
    ParsedUrl parsed{};
    try {
        parsed = ParseUrl(remote.api_base);
    } catch (const std::exception& ex) {
        throw SandboxSetupError("remote: invalid API base " + remote.api_base + ": " + ex.what());
    }
    const std::string endpoint = parsed.base_path + path;
    std::string scheme_host_port = parsed.https ? "https://" : "http://";
    scheme_host_port += parsed.host + ":" + std::to_string(parsed.port);

    auto client = std::make_unique<httplib::Client>(scheme_host_port);
    client->set_connection_timeout(kConnectTimeout.count());
    client->set_read_timeout(read_timeout.count());

    httplib::Headers headers{{"Accept", "application/json"}};
    if (!remote.api_key.empty()) {
        headers.emplace("Authorization", "Bearer " + remote.api_key);
    }
    utils::Log(utils::LogLevel::kDebug, "remote", method + " " + scheme_host_port + endpoint,
               {{"api_key", MaskKey(remote.api_key)}});

    httplib::Result response = method == "DELETE"
        ? client->Delete(endpoint.c_str(), headers)
        : client->Post(endpoint.c_str(), headers, payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), "application/json");
    Reply reply{};
    if (!response) {
        const auto err = response.error();
        if (err == httplib::Error::Read) {
            reply.timed_out = true;
            return reply;
        }
        utils::Log(utils::LogLevel::kError, "remote", "request failed",
                   {{"error", httplib::to_string(err)}, {"endpoint", endpoint}});
        throw SandboxSetupError("remote: request failed (" + httplib::to_string(err) + ")");
    }
    reply.status = response->status;
    if (reply.status == 408 || reply.status == 504) {
        reply.timed_out = true;
        return reply;
    }
    if ((reply.status == 404 || reply.status == 410) && sandbox_id_) {
        const auto gone = *sandbox_id_;
        sandbox_id_.reset();
        utils::Log(utils::LogLevel::kError, "remote", "sandbox gone",
                   {{"session", settings_.session_id}, {"sandbox", gone}});
        throw SandboxSetupError("remote session " + gone + " for " + settings_.session_id + " is gone");
    }
    if (reply.status >= 400) {
        utils::Log(utils::LogLevel::kError, "remote", "HTTP " + std::to_string(reply.status),
                   {{"endpoint", endpoint}, {"body", response->body}});
        throw SandboxSetupError("remote: HTTP " + std::to_string(reply.status) + " from " + endpoint);
    }
    if (!response->body.empty()) {
        reply.body = nlohmann::json::parse(response->body, nullptr, false);
        if (reply.body.is_discarded()) {
            throw SandboxSetupError("remote: invalid response from " + endpoint);
        }
    }
    return reply;
}

void RemoteProvider::EnsureSandbox() {
    if (sandbox_id_) {
        return;
    }
    const auto& remote = settings_.remote;
    const nlohmann::json payload{
        {"session", settings_.session_id},
        {"packages", remote.packages},
        {"secrets", remote.secrets}
    };
    const auto reply = Send("POST", "/v1/sandboxes", payload, remote.request_timeout);
    if (reply.timed_out) {
        throw SandboxSetupError("remote: sandbox creation timed out");
    }
    const auto id = StringField(reply.body, "sandbox_id");
    if (id.empty()) {
        throw SandboxSetupError("remote: sandbox creation returned no sandbox_id");
    }
    sandbox_id_ = id;
    utils::Log(utils::LogLevel::kInfo, "remote", "sandbox created",
               {{"session", settings_.session_id}, {"sandbox", id}});
    try {
        Bootstrap();
    } catch (const SandboxSetupError&) {
        Cleanup();
        throw;
    }
}

void RemoteProvider::Bootstrap() {
    const auto& remote = settings_.remote;
    if (remote.bootstrap_code.empty()) {
        return;
    }
    // Framework scaffolding, never caller content.
    const nlohmann::json payload{
        {"code", remote.bootstrap_code},
        {"trusted", true},
        {"policy", nullptr},
        {"timeout_s", remote.request_timeout.count()}
    };
    const auto reply = Send("POST", SandboxPath("/execute"), payload, remote.request_timeout + kReadSlack);
    if (reply.timed_out) {
        throw SandboxSetupError("remote: bootstrap timed out");
    }
    if (reply.body.is_object() && reply.body.contains("error") && reply.body["error"].is_object()) {
        throw SandboxSetupError("remote: bootstrap failed: " + StringField(reply.body["error"], "message"));
    }
    utils::Log(utils::LogLevel::kInfo, "remote", "bootstrap done", {{"sandbox", *sandbox_id_}});
}

ExecutionResult RemoteProvider::ExecuteGuestCode(const GuestCodeRequest& request) {
    if (request.cancel && request.cancel->load()) {
        return CancelledResult();
    }
    if (!IsValidUtf8(request.source)) {
        return InvalidSourceResult();
    }
    EnsureSandbox();
    const auto started = std::chrono::steady_clock::now();
    const auto timeout_s = TimeoutSeconds(request.timeout);
    const nlohmann::json payload{
        {"code", request.source},
        {"trusted", request.trusted},
        {"policy", request.policy.ToJson()},
        {"timeout_s", timeout_s.count()}
    };
    const auto reply = Send("POST", SandboxPath("/execute"), payload, timeout_s + kReadSlack);
    if (reply.timed_out) {
        utils::Log(utils::LogLevel::kWarn, "remote", "timeout", {{"session", settings_.session_id}});
        return TimeoutResult(request.timeout, Since(started));
    }

    ExecutionResult result{};
    result.duration = Since(started);
    result.stdout_text = sandbox::StripAnsi(StringField(reply.body, "stdout"));
    result.stderr_text = sandbox::StripAnsi(StringField(reply.body, "stderr"));
    if (reply.body.contains("return_value") && !reply.body["return_value"].is_null()) {
        const auto& value = reply.body["return_value"];
        result.return_value = value.is_string() ? value.get<std::string>() : value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    }
    if (reply.body.contains("warnings") && reply.body["warnings"].is_array()) {
        for (const auto& warning : reply.body["warnings"]) {
            if (warning.is_string()) {
                result.warnings.push_back(warning.get<std::string>());
            }
        }
    }
    if (reply.body.contains("error") && reply.body["error"].is_object()) {
        const auto& error = reply.body["error"];
        const auto kind = ErrorKindFromString(StringField(error, "kind")).value_or(ErrorKind::kGuestRuntimeError);
        result.error = ExecutionError{kind, StringField(error, "message"), StringField(error, "traceback")};
        result.exit_code = kind == ErrorKind::kTimeout ? sandbox::kTimeoutExitCode : 1;
    }
    return result;
}

ExecutionResult RemoteProvider::ExecuteShellCommand(const ShellCommandRequest& request) {
    if (request.cancel && request.cancel->load()) {
        return CancelledResult();
    }
    EnsureSandbox();
    const auto started = std::chrono::steady_clock::now();
    const auto timeout_s = TimeoutSeconds(request.timeout);
    const nlohmann::json payload{
        {"command", request.command.Render()},
        {"workdir", request.workdir},
        {"timeout_s", timeout_s.count()}
    };
    const auto reply = Send("POST", SandboxPath("/shell"), payload, timeout_s + kReadSlack);
    if (reply.timed_out) {
        utils::Log(utils::LogLevel::kWarn, "remote", "timeout", {{"session", settings_.session_id}});
        return TimeoutResult(request.timeout, Since(started));
    }
    ExecutionResult result{};
    result.duration = Since(started);
    result.stdout_text = sandbox::StripAnsi(StringField(reply.body, "stdout"));
    result.stderr_text = sandbox::StripAnsi(StringField(reply.body, "stderr"));
    if (reply.body.is_object() && reply.body.contains("exit_code") && reply.body["exit_code"].is_number_integer()) {
        result.exit_code = reply.body["exit_code"].get<int>();
    }
    return result;
}

void RemoteProvider::Cleanup() {
    if (!sandbox_id_) {
        return;
    }
    const auto id = *sandbox_id_;
    try {
        const auto reply = Send("DELETE", SandboxPath(""), nullptr, std::chrono::seconds(30));
        if (reply.timed_out) {
            utils::Log(utils::LogLevel::kWarn, "remote", "sandbox delete timed out", {{"sandbox", id}});
        }
    } catch (const std::exception& ex) {
        // 404/410 lands here too: the sandbox is already gone.
        utils::Log(utils::LogLevel::kWarn, "remote", "sandbox delete failed", {{"sandbox", id}, {"error", ex.what()}});
    }
    sandbox_id_.reset();
    utils::Log(utils::LogLevel::kInfo, "remote", "cleanup", {{"session", settings_.session_id}, {"sandbox", id}});
}

}  // namespace sandcell::providers
