#include "session/session_manager.hpp"

#include <algorithm>
#include <cctype>

#include "providers/provider_factory.hpp"
#include "safety/safety_engine.hpp"
#include "state/environment_snapshot.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace sandcell::session {
namespace {

bool IsIdentifier(const std::string& name) {
    if (name.empty() || std::isdigit(static_cast<unsigned char>(name.front()))) {
        return false;
    }
    for (char c : name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') {
            return false;
        }
    }
    return true;
}

nlohmann::json SeedableVariables(const std::string& session_id, const nlohmann::json& variables) {
    nlohmann::json seeded = nlohmann::json::object();
    if (!variables.is_object()) {
        return seeded;
    }
    for (const auto& item : variables.items()) {
        if (!IsIdentifier(item.key()) || item.key().rfind("__", 0) == 0) {
            utils::Log(utils::LogLevel::kWarn, "session", "initial variable skipped",
                       {{"session", session_id}, {"name", item.key()}});
            continue;
        }
        seeded[item.key()] = item.value();
    }
    return seeded;
}

}  // namespace

const char* ToString(SubmitKind kind) {
    switch (kind) {
        case SubmitKind::kGuestCode: return "guest_code";
        case SubmitKind::kShell: return "shell";
    }
    return "guest_code";
}

std::optional<SubmitKind> SubmitKindFromString(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "guest_code" || lowered == "code" || lowered == "python") {
        return SubmitKind::kGuestCode;
    }
    if (lowered == "shell") {
        return SubmitKind::kShell;
    }
    return std::nullopt;
}

const char* ToString(BusyPolicy policy) {
    switch (policy) {
        case BusyPolicy::kQueue: return "queue";
        case BusyPolicy::kReject: return "reject";
    }
    return "queue";
}

std::optional<BusyPolicy> BusyPolicyFromString(const std::string& value) {
    const auto lowered = utils::ToLower(value);
    if (lowered == "queue") {
        return BusyPolicy::kQueue;
    }
    if (lowered == "reject") {
        return BusyPolicy::kReject;
    }
    return std::nullopt;
}

nlohmann::json SessionInfo::ToJson() const {
    return {
        {"id", id},
        {"provider", provider},
        {"started", started},
        {"failed", failed},
        {"failure", failure},
        {"executions", executions}
    };
}

providers::ProviderSettings ToProviderSettings(const std::string& session_id, const SessionConfig& config) {
    providers::ProviderSettings settings{};
    settings.session_id = session_id;
    settings.workdir = config.workdir;
    settings.mounts = config.mounts;
    settings.env = config.env;
    settings.limits = config.limits;
    settings.enable_network = config.enable_network;
    settings.local = config.local;
    settings.container = config.container;
    settings.remote = config.remote;

    // The remote service keeps state itself; seed it from the trusted bootstrap.
    const auto seeded = SeedableVariables(session_id, config.initial_variables);
    if (!seeded.empty()) {
        auto& bootstrap = settings.remote.bootstrap_code;
        if (!bootstrap.empty() && bootstrap.back() != '\n') {
            bootstrap += "\n";
        }
        bootstrap += "globals().update(__import__(\"json\").loads(" + nlohmann::json(seeded.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)).dump() + "))\n";
    }
    return settings;
}

std::unique_ptr<providers::ExecutionProvider> CreateDefaultProvider(const SessionConfig& config,
                                                                    const providers::ProviderSettings& settings,
                                                                    state::StateStore& store) {
    const auto capabilities = providers::ProbeCapabilities(settings);
    const auto kind = providers::SelectProvider(config.provider, capabilities);
    if (!kind) {
        throw providers::SandboxSetupError(
            std::string("no usable sandbox backend for preference '") + providers::ToString(config.provider) +
            "' (capabilities " + capabilities.ToJson().dump() + ")");
    }
    return providers::CreateProvider(*kind, settings, store);
}

SandboxService::SandboxService(SessionConfig defaults, state::StateStore& store, ProviderFactory factory)
    : defaults_(std::move(defaults))
    , store_(store)
    , factory_(std::move(factory)) {}

SandboxService::~SandboxService() {
    std::unordered_map<std::string, std::shared_ptr<Slot>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, slot] : sessions) {
        slot->cancel = true;
        std::lock_guard<std::mutex> execution(slot->execution);
        slot->torn_down = true;
        slot->provider->Cleanup();
    }
}

std::shared_ptr<SandboxService::Slot> SandboxService::Find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

void SandboxService::ConfigureSession(const std::string& session_id, SessionConfig config, bool force) {
    if (session_id.empty()) {
        throw SessionError("session id must not be empty");
    }
    if (auto existing = Find(session_id)) {
        std::lock_guard<std::mutex> execution(existing->execution);
        if (existing->provider->Started() && !force) {
            throw SessionError("session " + session_id +
                               " already started; reconfiguring requires force (tears down its state)");
        }
        if (existing->provider->Started()) {
            utils::Log(utils::LogLevel::kWarn, "session", "reconfigure tears down running backend",
                       {{"session", session_id}, {"provider", existing->provider->Name()}});
        }
        Release(session_id, *existing);
    }

    auto slot = std::make_shared<Slot>();
    slot->config = std::move(config);
    const auto settings = ToProviderSettings(session_id, slot->config);
    slot->provider = factory_(slot->config, settings, store_);
    if (!slot->provider) {
        throw providers::SandboxSetupError("no sandbox backend for session " + session_id);
    }
    SeedVariables(session_id, *slot);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions_[session_id] = slot;
    }
    utils::Log(utils::LogLevel::kInfo, "session", "configured",
               {{"session", session_id}, {"provider", slot->provider->Name()},
                {"busy_policy", ToString(slot->config.busy_policy)},
                {"network", slot->config.enable_network ? "on" : "off"}});
}

void SandboxService::SeedVariables(const std::string& session_id, Slot& slot) {
    const auto seeded = SeedableVariables(session_id, slot.config.initial_variables);
    // A persistent store may already hold this session's state from an
    // earlier process; seeding only applies to a fresh session.
    if (seeded.empty() || store_.Load(session_id)) {
        return;
    }
    nlohmann::json values = nlohmann::json::object();
    for (const auto& item : seeded.items()) {
        values[item.key()] = {{"encoding", "json"}, {"value", item.value()}, {"type", item.value().type_name()}};
    }
    const auto snapshot = state::EnvironmentSnapshot::FromValuesJson(values, slot.provider->Name());
    try {
        store_.Save(session_id, snapshot.Serialize());
    } catch (const std::runtime_error& ex) {
        throw providers::SandboxSetupError("cannot seed variables for session " + session_id + ": " + ex.what());
    }
}

void SandboxService::Release(const std::string& session_id, Slot& slot) {
    slot.torn_down = true;
    slot.provider->Cleanup();
    try {
        store_.Erase(session_id);
    } catch (const std::runtime_error& ex) {
        utils::Log(utils::LogLevel::kWarn, "session", "snapshot erase failed",
                   {{"session", session_id}, {"error", ex.what()}});
    }
}

providers::ExecutionResult SandboxService::Submit(const std::string& session_id, const SubmitRequest& request) {
    auto slot = Find(session_id);
    if (!slot) {
        throw SessionError("session " + session_id + " is not configured");
    }

    std::unique_lock<std::mutex> execution(slot->execution, std::defer_lock);
    if (slot->config.busy_policy == BusyPolicy::kReject) {
        if (!execution.try_lock()) {
            utils::Log(utils::LogLevel::kInfo, "session", "busy", {{"session", session_id}});
            return providers::MakeErrorResult(providers::ErrorKind::kSessionBusy,
                                              "Session '" + session_id + "' is busy with another execution.");
        }
    } else {
        execution.lock();
    }
    if (slot->torn_down) {
        throw SessionError("session " + session_id + " was torn down");
    }
    if (slot->failed) {
        throw providers::SandboxSetupError("session " + session_id + " is unusable after a setup failure (" +
                                           slot->failure + "); tear it down and configure it again");
    }
    slot->cancel = false;

    try {
        auto result = Dispatch(session_id, *slot, request);
        ApplyOutputLimits(slot->config, result);
        ++slot->executions;
        return result;
    } catch (const providers::SandboxSetupError& ex) {
        slot->failed = true;
        slot->failure = ex.what();
        utils::Log(utils::LogLevel::kError, "session", "backend setup failed",
                   {{"session", session_id}, {"error", ex.what()}});
        throw;
    }
}

providers::ExecutionResult SandboxService::Dispatch(const std::string& session_id,
                                                    Slot& slot,
                                                    const SubmitRequest& request) {
    const auto& config = slot.config;
    if (request.kind == SubmitKind::kShell) {
        auto verdict = shell::ShellGuard::Validate(request.payload, config.shell);
        if (!verdict.accepted) {
            utils::Log(utils::LogLevel::kInfo, "session", "shell rejected",
                       {{"session", session_id}, {"reason", verdict.reason}});
            return providers::MakeErrorResult(providers::ErrorKind::kShellRejected, verdict.reason);
        }
        providers::ShellCommandRequest shell_request{};
        shell_request.command = std::move(verdict.command);
        shell_request.timeout = request.timeout.value_or(config.limits.shell_timeout);
        shell_request.workdir = request.workdir;
        shell_request.cancel = &slot.cancel;
        return slot.provider->ExecuteShellCommand(shell_request);
    }

    auto verdict = safety::SafetyEngine::Analyze(request.payload, config.enforcement, request.trusted);
    if (!verdict.accepted) {
        utils::Log(utils::LogLevel::kInfo, "session", "code rejected",
                   {{"session", session_id}, {"construct", verdict.construct}, {"line", std::to_string(verdict.line)}});
        auto result = providers::MakeErrorResult(providers::ErrorKind::kSafetyRejected, verdict.reason);
        result.warnings = std::move(verdict.warnings);
        return result;
    }
    if (request.trusted) {
        utils::Log(utils::LogLevel::kDebug, "session", "trusted submission", {{"session", session_id}});
    }
    providers::GuestCodeRequest code_request{};
    code_request.source = request.payload;
    code_request.policy = verdict.policy;
    code_request.trusted = request.trusted;
    code_request.timeout = request.timeout.value_or(config.limits.timeout);
    code_request.cancel = &slot.cancel;
    auto result = slot.provider->ExecuteGuestCode(code_request);
    result.warnings.insert(result.warnings.begin(), verdict.warnings.begin(), verdict.warnings.end());
    return result;
}

void SandboxService::ApplyOutputLimits(const SessionConfig& config, providers::ExecutionResult& result) const {
    const sandbox::OutputLimiter limiter(config.output);
    auto out = limiter.Apply(result.stdout_text, "stdout");
    auto err = limiter.Apply(result.stderr_text, "stderr");
    result.stdout_text = std::move(out.text);
    result.stderr_text = std::move(err.text);
    result.truncated = result.truncated || out.truncated || err.truncated;
}

bool SandboxService::Cancel(const std::string& session_id) {
    auto slot = Find(session_id);
    if (!slot) {
        return false;
    }
    slot->cancel = true;
    utils::Log(utils::LogLevel::kInfo, "session", "cancel requested", {{"session", session_id}});
    return true;
}

bool SandboxService::Teardown(const std::string& session_id) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        slot = it->second;
        sessions_.erase(it);
    }
    slot->torn_down = true;
    slot->cancel = true;
    std::lock_guard<std::mutex> execution(slot->execution);
    Release(session_id, *slot);
    utils::Log(utils::LogLevel::kInfo, "session", "teardown", {{"session", session_id}});
    return true;
}

std::vector<SessionInfo> SandboxService::ListSessions() const {
    std::vector<std::shared_ptr<Slot>> slots;
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, slot] : sessions_) {
            ids.push_back(id);
            slots.push_back(slot);
        }
    }
    std::vector<SessionInfo> sessions;
    for (std::size_t i = 0; i < slots.size(); ++i) {
        SessionInfo info{};
        info.id = ids[i];
        info.provider = slots[i]->provider->Name();
        info.executions = slots[i]->executions.load();
        // A session that is executing reports itself as started.
        std::unique_lock<std::mutex> execution(slots[i]->execution, std::try_to_lock);
        info.started = true;
        if (execution.owns_lock()) {
            info.started = slots[i]->provider->Started();
            info.failed = slots[i]->failed;
            info.failure = slots[i]->failure;
        }
        sessions.push_back(std::move(info));
    }
    std::sort(sessions.begin(), sessions.end(), [](const SessionInfo& a, const SessionInfo& b) {
        return a.id < b.id;
    });
    return sessions;
}

}  // namespace sandcell::session
