#include "shell/shell_guard.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "utils/common.hpp"

namespace sandcell::shell {
namespace {

bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

bool IsAssignment(const std::string& word) {
    const auto eq = word.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    if (!(std::isalpha(static_cast<unsigned char>(word[0])) || word[0] == '_')) {
        return false;
    }
    return std::all_of(word.begin(), word.begin() + static_cast<std::ptrdiff_t>(eq), [](unsigned char c) {
        return std::isalnum(c) || c == '_';
    });
}

// Variables that change how later words are resolved or executed.
bool IsSensitiveVariable(const std::string& name) {
    static const std::vector<std::string> kNames = {
        "PATH", "IFS", "ENV", "BASH_ENV", "SHELLOPTS", "BASHOPTS", "PS4", "PROMPT_COMMAND", "CDPATH", "GLOBIGNORE"
    };
    return Contains(kNames, name) || name.rfind("LD_", 0) == 0;
}

// Options that turn an otherwise read-only utility into one that writes
// files or runs other programs. `-v NAME` of printf and test takes a
// variable name whose array subscript bash evaluates arithmetically, which
// expands command substitutions even when quoted.
bool IsForbiddenArgument(const std::string& command, const std::string& arg) {
    static const std::unordered_map<std::string, std::vector<std::string>> kExact = {
        {"find", {"-exec", "-execdir", "-ok", "-okdir", "-delete", "-fprint", "-fprint0", "-fprintf", "-fls"}},
        {"sort", {"-o", "--output"}},
        {"rg", {"--pre"}},
        {"printf", {"-v"}},
        {"test", {"-v", "-R"}},
        {"[", {"-v", "-R"}},
    };
    const auto it = kExact.find(command);
    if (it == kExact.end()) {
        return false;
    }
    if (Contains(it->second, arg)) {
        return true;
    }
    if (command == "sort") {
        if (arg.rfind("--output=", 0) == 0) {
            return true;
        }
        // Clustered short options such as -rno.
        return arg.size() > 1 && arg[0] == '-' && arg[1] != '-' && arg.find('o') != std::string::npos;
    }
    if (command == "rg") {
        return arg.rfind("--pre=", 0) == 0;
    }
    if (command == "printf") {
        // bash also accepts the name glued to the option: -vNAME.
        return arg.rfind("-v", 0) == 0;
    }
    return false;
}

class Validator {
public:
    explicit Validator(const ShellPolicy& policy)
        : policy_(policy) {}

    bool OperatorAllowed(const std::string& op) const {
        return policy_.bypass_shell_safety || Contains(policy_.additional_safe_operators, "*") ||
               Contains(policy_.safe_operators, op) || Contains(policy_.additional_safe_operators, op);
    }

    bool CommandAllowed(const std::string& name) const {
        if (policy_.bypass_shell_safety || Contains(policy_.additional_safe_commands, "*")) {
            return true;
        }
        if (name.find('/') != std::string::npos) {
            return Contains(policy_.additional_safe_commands, name);
        }
        return Contains(policy_.safe_commands, name) || Contains(policy_.additional_safe_commands, name);
    }

    bool ArgumentsGuarded(const std::string& name) const {
        return !policy_.bypass_shell_safety && !Contains(policy_.additional_safe_commands, "*") &&
               !Contains(policy_.additional_safe_commands, name);
    }

private:
    const ShellPolicy& policy_;
};

}  // namespace

const std::vector<std::string>& DefaultSafeCommands() {
    static const std::vector<std::string> kCommands = {
        "ls", "cat", "head", "tail", "grep", "egrep", "fgrep", "rg", "find", "wc", "pwd",
        "echo", "printf", "sort", "uniq", "cut", "tr", "diff", "cmp", "file", "stat", "du",
        "df", "which", "whoami", "id", "date", "basename", "dirname", "realpath", "readlink",
        "tree", "true", "false", "test"
    };
    return kCommands;
}

const std::vector<std::string>& DefaultSafeOperators() {
    static const std::vector<std::string> kOperators = {"&&", "||", "|", ";"};
    return kOperators;
}

std::string ShellCommand::Render() const {
    if (!verbatim.empty()) {
        return verbatim;
    }
    std::string line;
    for (const auto& token : tokens) {
        if (!line.empty()) {
            line.push_back(' ');
        }
        line += token.raw;
    }
    return line;
}

nlohmann::json ShellVerdict::ToJson() const {
    nlohmann::json data;
    data["accepted"] = accepted;
    if (!accepted) {
        data["reason"] = reason;
    }
    data["commands"] = commands;
    data["operators"] = operators;
    nlohmann::json tokens = nlohmann::json::array();
    for (const auto& token : command.tokens) {
        tokens.push_back({
            {"kind", token.kind == ShellTokenKind::kWord ? "word" : "operator"},
            {"text", token.text}
        });
    }
    data["tokens"] = tokens;
    data["rendered"] = command.Render();
    return data;
}

ShellVerdict ShellGuard::Validate(const std::string& command_line, const ShellPolicy& policy) {
    ShellVerdict verdict{};
    const auto trimmed = utils::Trim(command_line);
    if (trimmed.empty()) {
        verdict.reason = "Empty command.";
        return verdict;
    }
    ShellLexer lexer(trimmed);
    auto lexed = lexer.Tokenize();
    if (!lexed.ok) {
        if (policy.bypass_shell_safety) {
            verdict.accepted = true;
            verdict.command.verbatim = trimmed;
            return verdict;
        }
        verdict.reason = lexed.error;
        return verdict;
    }

    Validator validator(policy);
    std::string violation;
    auto reject = [&](const std::string& reason) {
        if (violation.empty()) {
            violation = reason;
        }
    };

    bool expect_command = true;
    bool expect_redirect_target = false;
    std::string current_command;
    // Last assignment of the segment still waiting for its command.
    std::string pending_assignment;
    auto end_segment = [&]() {
        if (expect_command && !pending_assignment.empty() && !policy.bypass_shell_safety) {
            reject("Variable assignment '" + pending_assignment + "' without a command is not allowed.");
        }
        pending_assignment.clear();
        expect_command = true;
        current_command.clear();
    };
    for (const auto& token : lexed.tokens) {
        if (token.kind == ShellTokenKind::kOperator) {
            verdict.operators.push_back(token.text);
            if (!validator.OperatorAllowed(token.text)) {
                reject("Control operator '" + token.text + "' is not allowed.");
            }
            if (ShellLexer::IsRedirection(token.text)) {
                expect_redirect_target = true;
            } else {
                end_segment();
            }
            continue;
        }
        if (!token.substitution.empty()) {
            verdict.operators.push_back(token.substitution);
            if (!validator.OperatorAllowed(token.substitution)) {
                reject("Control operator '" + token.substitution + "' is not allowed.");
            }
        }
        if (expect_redirect_target) {
            expect_redirect_target = false;
            continue;
        }
        if (expect_command) {
            // The name must be spelled unquoted; the value may be quoted.
            if (IsAssignment(token.raw)) {
                const auto name = token.raw.substr(0, token.raw.find('='));
                if (IsSensitiveVariable(name) && !policy.bypass_shell_safety) {
                    reject("Assignment to variable '" + name + "' is not allowed.");
                }
                pending_assignment = token.raw;
                continue;
            }
            pending_assignment.clear();
            expect_command = false;
            current_command = token.text;
            verdict.commands.push_back(token.text);
            if (!validator.CommandAllowed(token.text)) {
                reject("Command '" + token.text + "' is not in the list of safe commands.");
            }
            continue;
        }
        if (!current_command.empty() && validator.ArgumentsGuarded(current_command) &&
            IsForbiddenArgument(current_command, token.text)) {
            reject("Argument '" + token.text + "' is not allowed for command '" + current_command + "'.");
        }
    }

    end_segment();

    verdict.command.tokens = std::move(lexed.tokens);
    if (!violation.empty()) {
        verdict.reason = violation;
        return verdict;
    }
    if (verdict.commands.empty() && !policy.bypass_shell_safety) {
        verdict.reason = "Empty command.";
        return verdict;
    }
    verdict.accepted = true;
    return verdict;
}

}  // namespace sandcell::shell
