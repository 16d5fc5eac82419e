#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "shell/shell_lexer.hpp"

namespace sandcell::shell {

const std::vector<std::string>& DefaultSafeCommands();
const std::vector<std::string>& DefaultSafeOperators();

struct ShellPolicy {
    std::vector<std::string> safe_commands = DefaultSafeCommands();
    std::vector<std::string> safe_operators = DefaultSafeOperators();
    std::vector<std::string> additional_safe_commands;
    std::vector<std::string> additional_safe_operators;
    bool bypass_shell_safety = false;
};

// A validated command line. Backends run Render(), never the caller's
// original string.
struct ShellCommand {
    std::vector<ShellToken> tokens;
    // Set when validation was bypassed and the line did not tokenize.
    std::string verbatim;

    std::string Render() const;
    bool Empty() const { return tokens.empty() && verbatim.empty(); }
};

struct ShellVerdict {
    bool accepted = false;
    std::string reason;
    ShellCommand command;
    std::vector<std::string> commands;
    std::vector<std::string> operators;

    nlohmann::json ToJson() const;
};

class ShellGuard {
public:
    static ShellVerdict Validate(const std::string& command_line, const ShellPolicy& policy);
};

}  // namespace sandcell::shell
