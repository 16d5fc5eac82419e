#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "safety/safety_policy.hpp"

namespace sandcell::safety {

struct SafetyVerdict {
    bool accepted = true;
    std::string reason;
    // Short name of the offending construct, e.g. "import os" or "call to eval".
    std::string construct;
    int line = 0;
    EnforcementPolicy policy;
    std::vector<std::string> warnings;

    nlohmann::json ToJson() const;
};

// Static vetting of guest source. Pure: no I/O, no interpreter.
//
// Imports are checked across the whole source first so that the reason
// lists every offending module; the remaining checks report the first
// match in source order. Trusted code skips every check but still gets a
// resolved (trusted) policy.
class SafetyEngine {
public:
    static SafetyVerdict Analyze(const std::string& source,
                                 const EnforcementConfig& config,
                                 bool trusted);
};

}  // namespace sandcell::safety
