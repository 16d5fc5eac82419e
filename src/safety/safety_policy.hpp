#pragma once

#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace sandcell::safety {

const std::vector<std::string>& DefaultDeniedModules();
const std::vector<std::string>& DefaultDeniedFunctions();
const std::vector<std::string>& EssentialModules();
const std::vector<std::string>& DangerousAttributes();

// Caller-facing knobs. authorized_imports unset means "everything not denied";
// set (even empty) means "only these plus the essential modules".
struct EnforcementConfig {
    std::vector<std::string> denied_modules = DefaultDeniedModules();
    std::vector<std::string> denied_functions = DefaultDeniedFunctions();
    std::optional<std::vector<std::string>> authorized_imports;
    std::vector<std::string> authorized_functions;
    bool check_string_obfuscation = true;
};

// Resolved per request. The guest runner receives this as JSON and applies
// the same decisions to late-bound imports and built-in calls.
struct EnforcementPolicy {
    bool trusted = false;
    bool imports_unrestricted = true;
    std::vector<std::string> allowed_modules;
    std::vector<std::string> authorized_imports;
    std::vector<std::string> denied_modules;
    std::vector<std::string> allowed_functions;
    std::vector<std::string> blocked_functions;
    bool function_blocking_active = true;
    bool check_string_obfuscation = true;

    nlohmann::json ToJson() const;
    static EnforcementPolicy FromJson(const nlohmann::json& data);
};

EnforcementPolicy ResolvePolicy(const EnforcementConfig& config, bool trusted);

// "*" matches everything, "pkg.*" matches the root "pkg", anything else
// must equal the root module name.
bool MatchesModulePattern(const std::string& module_root, const std::string& pattern);

std::string ModuleRoot(const std::string& module);

struct ModuleDecision {
    bool allowed = true;
    bool denied_but_authorized = false;
};

ModuleDecision DecideModule(const EnforcementPolicy& policy, const std::string& module);

bool IsFunctionBlocked(const EnforcementPolicy& policy, const std::string& name);

std::string ImportRejectionReason(const EnforcementPolicy& policy,
                                  const std::vector<std::string>& modules);

}  // namespace sandcell::safety
