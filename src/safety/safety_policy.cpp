#include "safety/safety_policy.hpp"

#include <algorithm>
#include <set>

#include "utils/common.hpp"

namespace sandcell::safety {
namespace {

bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

std::vector<std::string> Sorted(const std::vector<std::string>& items) {
    std::set<std::string> unique(items.begin(), items.end());
    return {unique.begin(), unique.end()};
}

}  // namespace

const std::vector<std::string>& DefaultDeniedModules() {
    static const std::vector<std::string> kModules = {
        "builtins", "code", "ctypes", "gc", "importlib", "inspect", "io", "marshal",
        "multiprocessing", "os", "pathlib", "pdb", "posix", "pty", "runpy", "shlex",
        "shutil", "signal", "socket", "subprocess", "sys", "tempfile", "threading",
        "_thread", "webbrowser"
    };
    return kModules;
}

const std::vector<std::string>& DefaultDeniedFunctions() {
    static const std::vector<std::string> kFunctions = {
        "__import__", "breakpoint", "compile", "eval", "exec", "globals", "input",
        "locals", "open", "vars"
    };
    return kFunctions;
}

const std::vector<std::string>& EssentialModules() {
    static const std::vector<std::string> kModules = {
        "cloudpickle", "datetime", "json", "requests", "time"
    };
    return kModules;
}

const std::vector<std::string>& DangerousAttributes() {
    static const std::vector<std::string> kAttributes = {
        "__builtins__", "__globals__", "__subclasses__", "__code__", "__closure__",
        "__bases__", "__mro__", "__base__", "__loader__", "__getattribute__"
    };
    return kAttributes;
}

nlohmann::json EnforcementPolicy::ToJson() const {
    nlohmann::json data;
    data["trusted"] = trusted;
    data["imports_unrestricted"] = imports_unrestricted;
    data["allowed_modules"] = allowed_modules;
    data["authorized_imports"] = authorized_imports;
    data["denied_modules"] = denied_modules;
    data["allowed_functions"] = allowed_functions;
    data["blocked_functions"] = blocked_functions;
    data["function_blocking_active"] = function_blocking_active;
    data["check_string_obfuscation"] = check_string_obfuscation;
    return data;
}

EnforcementPolicy EnforcementPolicy::FromJson(const nlohmann::json& data) {
    EnforcementPolicy policy{};
    policy.trusted = data.value("trusted", false);
    policy.imports_unrestricted = data.value("imports_unrestricted", true);
    policy.allowed_modules = data.value("allowed_modules", std::vector<std::string>{});
    policy.authorized_imports = data.value("authorized_imports", std::vector<std::string>{});
    policy.denied_modules = data.value("denied_modules", DefaultDeniedModules());
    policy.allowed_functions = data.value("allowed_functions", std::vector<std::string>{});
    policy.blocked_functions = data.value("blocked_functions", DefaultDeniedFunctions());
    policy.function_blocking_active = data.value("function_blocking_active", true);
    policy.check_string_obfuscation = data.value("check_string_obfuscation", true);
    return policy;
}

EnforcementPolicy ResolvePolicy(const EnforcementConfig& config, bool trusted) {
    EnforcementPolicy policy{};
    policy.trusted = trusted;
    policy.denied_modules = Sorted(config.denied_modules);
    policy.check_string_obfuscation = config.check_string_obfuscation && !trusted;

    if (config.authorized_imports) {
        policy.authorized_imports = Sorted(*config.authorized_imports);
        auto combined = *config.authorized_imports;
        combined.insert(combined.end(), EssentialModules().begin(), EssentialModules().end());
        policy.allowed_modules = Sorted(combined);
        policy.imports_unrestricted = Contains(policy.allowed_modules, "*");
    } else {
        policy.imports_unrestricted = true;
    }

    const bool all_functions = Contains(config.authorized_functions, "*");
    policy.allowed_functions = Sorted(config.authorized_functions);
    for (const auto& name : Sorted(config.denied_functions)) {
        if (!all_functions && !Contains(config.authorized_functions, name)) {
            policy.blocked_functions.push_back(name);
        }
    }
    policy.function_blocking_active = !trusted && !policy.blocked_functions.empty();
    return policy;
}

bool MatchesModulePattern(const std::string& module_root, const std::string& pattern) {
    if (pattern == "*") {
        return true;
    }
    if (pattern.size() > 2 && pattern.compare(pattern.size() - 2, 2, ".*") == 0) {
        return module_root == pattern.substr(0, pattern.size() - 2);
    }
    return module_root == pattern;
}

std::string ModuleRoot(const std::string& module) {
    return module.substr(0, module.find('.'));
}

ModuleDecision DecideModule(const EnforcementPolicy& policy, const std::string& module) {
    ModuleDecision decision{};
    if (policy.trusted) {
        return decision;
    }
    const auto root = ModuleRoot(module);
    const bool denied = Contains(policy.denied_modules, root);
    if (policy.allowed_modules.empty()) {
        // No allow-list: everything that is not denied.
        decision.allowed = !denied;
        return decision;
    }
    const bool listed = std::any_of(policy.allowed_modules.begin(), policy.allowed_modules.end(),
                                    [&](const std::string& pattern) {
                                        return MatchesModulePattern(root, pattern);
                                    });
    decision.allowed = listed;
    decision.denied_but_authorized = listed && denied;
    return decision;
}

bool IsFunctionBlocked(const EnforcementPolicy& policy, const std::string& name) {
    if (policy.trusted) {
        return false;
    }
    return Contains(policy.blocked_functions, name);
}

std::string ImportRejectionReason(const EnforcementPolicy& policy,
                                  const std::vector<std::string>& modules) {
    auto reason = "Importing module(s) " + utils::Join(Sorted(modules), ", ") + " is not allowed.";
    if (!policy.allowed_modules.empty()) {
        reason += " Allowed imports are: " + utils::Join(policy.authorized_imports, ", ");
    }
    return reason;
}

}  // namespace sandcell::safety
