#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config_loader.hpp"
#include "nlohmann/json.hpp"
#include "providers/provider_factory.hpp"
#include "safety/safety_engine.hpp"
#include "session/session_manager.hpp"
#include "shell/shell_guard.hpp"
#include "state/sqlite_state_store.hpp"
#include "state/state_store.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitRejected = 1;
constexpr int kExitUsage = 2;

volatile std::sig_atomic_t g_signal = 0;

void HandleSignal(int signal) {
    g_signal = signal;
}

// Turns SIGINT/SIGTERM into a cancellation of the running submission.
class SignalWatcher {
public:
    SignalWatcher(sandcell::session::SandboxService& service, std::string session)
        : thread_([this, &service, session]() {
            while (!done_.load()) {
                if (g_signal != 0) {
                    service.Cancel(session);
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }) {}

    ~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    std::atomic<bool> done_{false};
    std::thread thread_;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Options {
    std::string session = "cli";
    bool trusted = false;
    std::optional<double> timeout_s;
    std::string provider;
    std::string workdir;
    std::vector<std::string> positional;
};

void PrintUsage() {
    std::cout << "Usage:\n"
              << "  sandcell run [--session ID] [--trusted] [--timeout S] [--provider P] FILE|-\n"
              << "  sandcell shell [--session ID] [--timeout S] [--workdir DIR] [--provider P] \"COMMAND\"\n"
              << "  sandcell check FILE|-\n"
              << "  sandcell check-shell \"COMMAND\"\n"
              << "  sandcell providers\n"
              << "  sandcell sessions" << std::endl;
}

Options ParseOptions(int argc, char** argv, int first) {
    Options options{};
    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];
        const auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw UsageError(arg + " needs a value");
            }
            return argv[++i];
        };
        if (arg == "--session") {
            options.session = next();
        } else if (arg == "--trusted") {
            options.trusted = true;
        } else if (arg == "--timeout") {
            const auto value = next();
            try {
                options.timeout_s = std::stod(value);
            } catch (const std::exception&) {
                throw UsageError("invalid --timeout " + value);
            }
            if (!(*options.timeout_s > 0.0)) {
                throw UsageError("--timeout must be positive");
            }
        } else if (arg == "--provider") {
            options.provider = next();
        } else if (arg == "--workdir") {
            options.workdir = next();
        } else if (arg != "-" && arg.rfind("--", 0) == 0) {
            throw UsageError("unknown option " + arg);
        } else {
            options.positional.push_back(arg);
        }
    }
    return options;
}

std::string ReadSource(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        throw UsageError("cannot read " + path);
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

std::string SinglePositional(const Options& options, const char* what) {
    if (options.positional.size() != 1) {
        throw UsageError(std::string("expected exactly one ") + what);
    }
    return options.positional.front();
}

std::unique_ptr<sandcell::state::StateStore> CreateStore(const sandcell::config::Config& config) {
    const auto kind = sandcell::utils::ToLower(config.state.store);
    if (kind == "memory") {
        return std::make_unique<sandcell::state::InMemoryStateStore>();
    }
    if (kind == "sqlite") {
        auto store = std::make_unique<sandcell::state::SqliteStateStore>(sandcell::utils::ExpandPath(config.state.path));
        if (!store->IsOpen()) {
            throw sandcell::config::ConfigError("cannot open state store " + config.state.path);
        }
        return store;
    }
    throw sandcell::config::ConfigError("unknown state.store '" + config.state.store + "' (expected memory or sqlite)");
}

// Guest output is arbitrary bytes; invalid UTF-8 is printed as U+FFFD.
void PrintJson(const nlohmann::json& json) {
    std::cout << json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

sandcell::session::SessionConfig BuildSessionConfig(const sandcell::config::Config& config, const Options& options) {
    auto session = sandcell::config::ToSessionConfig(config);
    if (!options.provider.empty()) {
        const auto kind = sandcell::providers::ProviderKindFromString(options.provider);
        if (!kind) {
            throw UsageError("unknown provider " + options.provider);
        }
        session.provider = *kind;
    }
    return session;
}

int Submit(const sandcell::config::Config& config,
           const Options& options,
           sandcell::session::SubmitKind kind,
           const std::string& payload) {
    auto store = CreateStore(config);
    const auto session_config = BuildSessionConfig(config, options);
    sandcell::session::SandboxService service(session_config, *store);
    service.ConfigureSession(options.session, session_config);

    struct sigaction action {};
    action.sa_handler = HandleSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = 0;
    sigaction(SIGINT, &action, nullptr);
    sigaction(SIGTERM, &action, nullptr);

    sandcell::session::SubmitRequest request{};
    request.kind = kind;
    request.payload = payload;
    request.trusted = options.trusted;
    request.workdir = options.workdir;
    if (options.timeout_s) {
        request.timeout = std::chrono::milliseconds(static_cast<long long>(*options.timeout_s * 1000.0));
    }

    std::optional<sandcell::providers::ExecutionResult> result;
    {
        SignalWatcher watcher(service, options.session);
        result = service.Submit(options.session, request);
    }

    PrintJson(result->ToJson());
    if (!result->Ok()) {
        return kExitRejected;
    }
    if (kind == sandcell::session::SubmitKind::kShell && result->exit_code != 0) {
        return kExitRejected;
    }
    return kExitOk;
}

int RunCheck(const sandcell::config::Config& config, const Options& options) {
    const auto source = ReadSource(SinglePositional(options, "FILE"));
    const auto session = sandcell::config::ToSessionConfig(config);
    const auto verdict = sandcell::safety::SafetyEngine::Analyze(source, session.enforcement, options.trusted);
    PrintJson(verdict.ToJson());
    return verdict.accepted ? kExitOk : kExitRejected;
}

int RunCheckShell(const sandcell::config::Config& config, const Options& options) {
    const auto line = SinglePositional(options, "COMMAND");
    const auto session = sandcell::config::ToSessionConfig(config);
    const auto verdict = sandcell::shell::ShellGuard::Validate(line, session.shell);
    PrintJson(verdict.ToJson());
    return verdict.accepted ? kExitOk : kExitRejected;
}

int RunProviders(const sandcell::config::Config& config, const Options& options) {
    const auto session = BuildSessionConfig(config, options);
    const auto settings = sandcell::session::ToProviderSettings(options.session, session);
    const auto capabilities = sandcell::providers::ProbeCapabilities(settings);
    const auto selected = sandcell::providers::SelectProvider(session.provider, capabilities);
    nlohmann::json json{
        {"capabilities", capabilities.ToJson()},
        {"preference", sandcell::providers::ToString(session.provider)},
        {"selected", selected ? nlohmann::json(sandcell::providers::ToString(*selected)) : nlohmann::json(nullptr)}
    };
    PrintJson(json);
    return selected ? kExitOk : kExitRejected;
}

int RunSessions(const sandcell::config::Config& config) {
    auto store = CreateStore(config);
    nlohmann::json json = nlohmann::json::array();
    for (const auto& id : store->Sessions()) {
        json.push_back(id);
    }
    PrintJson(json);
    return kExitOk;
}

int Dispatch(const std::string& command, const Options& options) {
    const auto config = sandcell::config::LoadConfig();
    sandcell::utils::LogConfig log_config{};
    log_config.min_level = sandcell::utils::LogLevelFromString(config.log.level);
    sandcell::utils::SetLogConfig(log_config);

    if (command == "run") {
        const auto source = ReadSource(SinglePositional(options, "FILE"));
        return Submit(config, options, sandcell::session::SubmitKind::kGuestCode, source);
    }
    if (command == "shell") {
        return Submit(config, options, sandcell::session::SubmitKind::kShell, SinglePositional(options, "COMMAND"));
    }
    if (command == "check") {
        return RunCheck(config, options);
    }
    if (command == "check-shell") {
        return RunCheckShell(config, options);
    }
    if (command == "providers") {
        return RunProviders(config, options);
    }
    if (command == "sessions") {
        return RunSessions(config);
    }
    throw UsageError("unknown command " + command);
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        PrintUsage();
        return kExitUsage;
    }
    const std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        PrintUsage();
        return kExitOk;
    }

    try {
        const auto options = ParseOptions(argc, argv, 2);
        return Dispatch(command, options);
    } catch (const UsageError& ex) {
        std::cerr << "sandcell: " << ex.what() << std::endl;
        PrintUsage();
        return kExitUsage;
    } catch (const sandcell::config::ConfigError& ex) {
        std::cerr << "sandcell: configuration error: " << ex.what() << std::endl;
        return kExitUsage;
    } catch (const sandcell::providers::SandboxSetupError& ex) {
        std::cerr << "sandcell: sandbox setup failed: " << ex.what() << std::endl;
        return kExitUsage;
    } catch (const sandcell::session::SessionError& ex) {
        std::cerr << "sandcell: " << ex.what() << std::endl;
        return kExitUsage;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "sandcell: invalid JSON data: " << ex.what() << std::endl;
        return kExitUsage;
    }
}
