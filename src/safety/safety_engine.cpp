#include "safety/safety_engine.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <unordered_set>

#include "safety/python_parser.hpp"
#include "safety/string_folding.hpp"
#include "utils/common.hpp"

namespace sandcell::safety {
namespace {

struct Finding {
    std::string reason;
    std::string construct;
    int line = 0;
};

bool Contains(const std::vector<std::string>& items, const std::string& value) {
    return std::find(items.begin(), items.end(), value) != items.end();
}

bool IsBuiltinsObject(const Node* node) {
    return node && (node->IsName("builtins") || node->IsName("__builtins__"));
}

bool IsNamespaceObject(const Node* node) {
    if (!node) {
        return false;
    }
    if (node->kind == NodeKind::kCall && node->Child(0) && node->Child(0)->kind == NodeKind::kName) {
        const auto& name = node->Child(0)->text;
        return name == "globals" || name == "vars" || name == "locals";
    }
    return node->kind == NodeKind::kAttribute && node->text == "__dict__";
}

bool ContainsDunderFragment(const Node& node) {
    if (node.kind == NodeKind::kConstant && node.value.find("__") != std::string::npos) {
        return true;
    }
    return std::any_of(node.children.begin(), node.children.end(), [](const NodePtr& child) {
        return child && ContainsDunderFragment(*child);
    });
}

bool IsComputation(const Node& node) {
    switch (node.kind) {
        case NodeKind::kBinOp:
        case NodeKind::kCall:
        case NodeKind::kSubscript:
            return true;
        case NodeKind::kJoinedStr:
            return node.children.size() > 1;
        default:
            return false;
    }
}

std::vector<std::string> Identifiers(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (char c : text) {
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            current.push_back(c);
        } else if (!current.empty()) {
            words.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) {
        words.push_back(current);
    }
    return words;
}

Finding ObfuscationFinding(const std::string& detail, int line) {
    return Finding{"Possible string obfuscation: " + detail + ".", "string obfuscation", line};
}

class Checker {
public:
    explicit Checker(const EnforcementPolicy& policy)
        : policy_(policy) {}

    std::optional<Finding> CheckStatement(const Statement& statement) {
        if (statement.kind == StatementKind::kUnparsed) {
            return ScanTokens(statement);
        }
        if (statement.kind != StatementKind::kExpression) {
            return std::nullopt;
        }
        for (std::size_t i = 0; i < statement.expressions.size(); ++i) {
            const auto* expression = statement.expressions[i].get();
            auto finding = i < statement.target_count ? VisitTarget(expression) : Visit(expression, false);
            if (finding) {
                return finding;
            }
        }
        return std::nullopt;
    }

    bool IsSensitiveName(const std::string& name) const {
        if (IsFunctionBlocked(policy_, name) || Contains(DangerousAttributes(), name)) {
            return true;
        }
        return IsRestrictedModule(name);
    }

    bool IsRestrictedModule(const std::string& name) const {
        return Contains(policy_.denied_modules, name) && !DecideModule(policy_, name).allowed;
    }

private:
    static Finding CallFinding(const std::string& name, int line) {
        if (name == "__import__" || name == "builtins.__import__") {
            return Finding{"Usage of " + name + " is not allowed in untrusted code.", "call to " + name, line};
        }
        return Finding{"Call to '" + name + "' is not allowed in untrusted code.", "call to " + name, line};
    }

    static Finding ReferenceFinding(const std::string& name, int line) {
        return Finding{"Reference to '" + name + "' is not allowed in untrusted code.",
                       "reference to " + name, line};
    }

    static Finding AttributeFinding(const std::string& name, int line) {
        return Finding{"Access to attribute '" + name + "' is not allowed in untrusted code.",
                       "attribute access " + name, line};
    }

    Finding ImportFinding(const std::string& module, int line) const {
        return Finding{ImportRejectionReason(policy_, {ModuleRoot(module)}), "import " + module, line};
    }

    std::optional<Finding> Visit(const Node* node, bool inside_folded) {
        if (!node) {
            return std::nullopt;
        }
        if (auto finding = CheckNode(*node, inside_folded)) {
            return finding;
        }
        const bool folded_here = inside_folded ||
                                 (IsComputation(*node) && FoldString(*node).has_value());
        const auto target = BindingChild(*node);
        for (std::size_t i = 0; i < node->children.size(); ++i) {
            const auto* child = node->children[i].get();
            auto finding = i == target ? VisitTarget(child) : Visit(child, folded_here);
            if (finding) {
                return finding;
            }
        }
        return std::nullopt;
    }

    // Names being bound shadow a built-in instead of referencing it.
    std::optional<Finding> VisitTarget(const Node* node) {
        if (!node || node->kind == NodeKind::kName) {
            return std::nullopt;
        }
        if (node->kind == NodeKind::kTuple || node->kind == NodeKind::kList ||
            node->kind == NodeKind::kStarred) {
            for (const auto& child : node->children) {
                if (auto finding = VisitTarget(child.get())) {
                    return finding;
                }
            }
            return std::nullopt;
        }
        return Visit(node, false);
    }

    static std::size_t BindingChild(const Node& node) {
        if (node.kind == NodeKind::kNamedExpr) {
            return 0;
        }
        if (node.kind == NodeKind::kComprehension) {
            return node.text == "dict" ? 2 : 1;
        }
        return static_cast<std::size_t>(-1);
    }

    std::optional<Finding> CheckNode(const Node& node, bool inside_folded) {
        switch (node.kind) {
            case NodeKind::kName:
                if (node.text == "__builtins__") {
                    return AttributeFinding(node.text, node.line);
                }
                // Decorators, containers and arguments all hand the built-in on.
                if (IsFunctionBlocked(policy_, node.text)) {
                    return ReferenceFinding(node.text, node.line);
                }
                break;
            case NodeKind::kAttribute:
                if (Contains(DangerousAttributes(), node.text)) {
                    return AttributeFinding(node.text, node.line);
                }
                if (IsBuiltinsObject(node.Child(0)) && IsFunctionBlocked(policy_, node.text)) {
                    return ReferenceFinding(DescribeNode(node), node.line);
                }
                // Modules re-export what they import, e.g. json.codecs.sys.
                if (IsRestrictedModule(node.text)) {
                    return AttributeFinding(node.text, node.line);
                }
                break;
            case NodeKind::kCall:
                if (auto finding = CheckCall(node)) {
                    return finding;
                }
                break;
            case NodeKind::kSubscript:
                if (IsNamespaceObject(node.Child(0)) && node.Child(1)) {
                    if (auto finding = CheckNamespaceKey(*node.Child(0), *node.Child(1), node.line)) {
                        return finding;
                    }
                }
                break;
            default:
                break;
        }
        if (policy_.check_string_obfuscation) {
            return CheckObfuscation(node, inside_folded);
        }
        return std::nullopt;
    }

    std::optional<Finding> CheckCall(const Node& call) {
        const auto* func = call.Child(0);
        if (!func) {
            return std::nullopt;
        }
        if (func->kind == NodeKind::kName && IsFunctionBlocked(policy_, func->text)) {
            return CallFinding(func->text, call.line);
        }
        if (func->kind == NodeKind::kAttribute && IsBuiltinsObject(func->Child(0)) &&
            IsFunctionBlocked(policy_, func->text)) {
            return CallFinding("builtins." + func->text, call.line);
        }

        const auto callee = CalleeName(call);
        const Node* first = nullptr;
        const Node* second = nullptr;
        std::size_t positional = 0;
        for (std::size_t i = 1; i < call.children.size(); ++i) {
            const auto* arg = call.Child(i);
            if (!arg) {
                continue;
            }
            if (arg->kind == NodeKind::kKeyword || arg->kind == NodeKind::kStarred) {
                continue;
            }
            if (positional == 0) {
                first = arg;
            } else if (positional == 1) {
                second = arg;
            }
            ++positional;
        }

        if ((callee == "__import__" || callee == "import_module") && first) {
            if (auto module = FoldString(*first)) {
                if (!DecideModule(policy_, *module).allowed) {
                    return ImportFinding(*module, call.line);
                }
            }
        }

        if (func->kind == NodeKind::kName &&
            (callee == "getattr" || callee == "setattr" || callee == "delattr" || callee == "hasattr") &&
            second) {
            if (auto finding = CheckAttributeName(callee, *second, call.line)) {
                return finding;
            }
        }

        if (func->kind == NodeKind::kAttribute && IsNamespaceObject(func->Child(0)) && first &&
            (callee == "get" || callee == "pop" || callee == "setdefault" || callee == "__getitem__")) {
            if (auto finding = CheckNamespaceKey(*func->Child(0), *first, call.line)) {
                return finding;
            }
        }
        return std::nullopt;
    }

    std::optional<Finding> CheckAttributeName(const std::string& accessor, const Node& name, int line) {
        if (auto folded = FoldString(name)) {
            if (Contains(DangerousAttributes(), *folded)) {
                return AttributeFinding(*folded, line);
            }
            if (IsFunctionBlocked(policy_, *folded)) {
                return ReferenceFinding(*folded, line);
            }
            if (policy_.check_string_obfuscation && IsComputation(name) && IsSensitiveName(*folded)) {
                return ObfuscationFinding(accessor + "() with computed name '" + *folded + "'", line);
            }
            return std::nullopt;
        }
        if (policy_.check_string_obfuscation && SuspiciousComputedName(name)) {
            return ObfuscationFinding(accessor + "() with a computed attribute name", line);
        }
        return std::nullopt;
    }

    std::optional<Finding> CheckNamespaceKey(const Node& object, const Node& key, int line) {
        if (auto folded = FoldString(key)) {
            if (IsSensitiveName(*folded)) {
                return Finding{"Reference to '" + *folded + "' through " + DescribeNode(object) +
                                   " is not allowed in untrusted code.",
                               "reference to " + *folded, line};
            }
            return std::nullopt;
        }
        if (policy_.check_string_obfuscation && key.kind != NodeKind::kName &&
            key.kind != NodeKind::kConstant && key.kind != NodeKind::kAttribute) {
            return ObfuscationFinding(DescribeNode(object) + " subscripted with a computed key", line);
        }
        return std::nullopt;
    }

    static bool SuspiciousComputedName(const Node& name) {
        if (name.kind == NodeKind::kName || name.kind == NodeKind::kConstant ||
            name.kind == NodeKind::kAttribute) {
            return false;
        }
        if (ContainsDunderFragment(name)) {
            return true;
        }
        if (name.kind != NodeKind::kCall) {
            return false;
        }
        static const std::unordered_set<std::string> kBuilders = {
            "chr", "join", "decode", "bytes", "bytearray", "reversed", "format"
        };
        return IsDecodeCall(name) || kBuilders.count(CalleeName(name)) > 0;
    }

    std::optional<Finding> CheckObfuscation(const Node& node, bool inside_folded) {
        if (IsDecodeCall(node)) {
            if (auto decoded = FoldString(node)) {
                for (const auto& word : Identifiers(*decoded)) {
                    if (IsSensitiveName(word)) {
                        return ObfuscationFinding("decoded literal contains the restricted name '" + word + "'",
                                                  node.line);
                    }
                }
            }
        }
        if (!IsComputation(node)) {
            return std::nullopt;
        }
        if (CountCharacterCodes(node) >= 2) {
            return ObfuscationFinding("string assembled from character codes", node.line);
        }
        if (!inside_folded) {
            if (auto folded = FoldString(node)) {
                if (IsSensitiveName(*folded)) {
                    return ObfuscationFinding("expression builds the restricted name '" + *folded + "'",
                                              node.line);
                }
            }
        }
        return std::nullopt;
    }

    std::optional<Finding> ScanTokens(const Statement& statement) {
        const auto& tokens = statement.tokens;
        for (std::size_t i = 0; i < tokens.size(); ++i) {
            const auto& token = tokens[i];
            if (token.kind != TokenKind::kName) {
                continue;
            }
            const bool called = i + 1 < tokens.size() && tokens[i + 1].kind == TokenKind::kOperator &&
                                tokens[i + 1].text == "(";
            const bool qualified = i > 0 && tokens[i - 1].kind == TokenKind::kOperator &&
                                   tokens[i - 1].text == ".";
            if (Contains(DangerousAttributes(), token.text) || (qualified && IsRestrictedModule(token.text))) {
                return AttributeFinding(token.text, token.line);
            }
            if (called && IsFunctionBlocked(policy_, token.text)) {
                if (!qualified) {
                    return CallFinding(token.text, token.line);
                }
                if (i >= 2 && (tokens[i - 2].text == "builtins" || tokens[i - 2].text == "__builtins__")) {
                    return CallFinding("builtins." + token.text, token.line);
                }
            }
        }
        return std::nullopt;
    }

    const EnforcementPolicy& policy_;
};

struct ImportUse {
    std::string module;
    int line = 0;
};

// Literal imports from token streams, for lines the parser gave up on.
std::vector<ImportUse> ImportsFromTokens(const std::vector<Token>& tokens) {
    std::vector<ImportUse> uses;
    auto read_dotted = [&](std::size_t& i) {
        std::string name;
        while (i < tokens.size() && tokens[i].kind == TokenKind::kName) {
            name += tokens[i].text;
            if (i + 1 < tokens.size() && tokens[i + 1].text == "." &&
                i + 2 < tokens.size() && tokens[i + 2].kind == TokenKind::kName) {
                name += ".";
                i += 2;
                continue;
            }
            ++i;
            break;
        }
        return name;
    };
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind != TokenKind::kName) {
            continue;
        }
        if (tokens[i].text == "import") {
            std::size_t j = i + 1;
            while (j < tokens.size()) {
                auto name = read_dotted(j);
                if (name.empty()) {
                    break;
                }
                uses.push_back(ImportUse{name, tokens[i].line});
                if (j < tokens.size() && tokens[j].text == "as") {
                    j += 2;
                }
                if (j >= tokens.size() || tokens[j].text != ",") {
                    break;
                }
                ++j;
            }
        } else if (tokens[i].text == "from" && i + 1 < tokens.size() &&
                   tokens[i + 1].kind == TokenKind::kName) {
            std::size_t j = i + 1;
            auto name = read_dotted(j);
            if (!name.empty() && j < tokens.size() && tokens[j].text == "import") {
                uses.push_back(ImportUse{name, tokens[i].line});
            }
        }
    }
    return uses;
}

// Last resort when the source does not even tokenize. The interpreter will
// refuse such code, but literal attempts are still reported.
std::optional<Finding> ScanRawText(const std::string& source,
                                   int from_line,
                                   const EnforcementPolicy& policy,
                                   std::vector<ImportUse>& imports) {
    static const std::regex kImportLine(R"(^\s*import\s+(.+)$)");
    static const std::regex kFromLine(R"(^\s*from\s+([A-Za-z_][\w.]*)\s+import\b)");
    std::istringstream stream(source);
    std::string text;
    int line = 0;
    std::optional<Finding> call;
    while (std::getline(stream, text)) {
        ++line;
        if (line < from_line) {
            continue;
        }
        std::smatch match;
        if (std::regex_search(text, match, kFromLine)) {
            imports.push_back(ImportUse{match[1].str(), line});
        } else if (std::regex_search(text, match, kImportLine)) {
            for (const auto& part : utils::SplitCsv(match[1].str())) {
                const auto name = part.substr(0, part.find_first_of(" \t;#"));
                if (!name.empty()) {
                    imports.push_back(ImportUse{name, line});
                }
            }
        }
        if (call) {
            continue;
        }
        for (const auto& name : policy.blocked_functions) {
            const std::regex pattern("(^|[^\\w.])" + name + "\\s*\\(");
            if (std::regex_search(text, pattern)) {
                call = Finding{"Call to '" + name + "' is not allowed in untrusted code.",
                               "call to " + name, line};
                break;
            }
        }
    }
    return call;
}

}  // namespace

nlohmann::json SafetyVerdict::ToJson() const {
    nlohmann::json data;
    data["accepted"] = accepted;
    if (!accepted) {
        data["reason"] = reason;
        data["construct"] = construct;
        data["line"] = line;
    }
    data["policy"] = policy.ToJson();
    data["warnings"] = warnings;
    return data;
}

SafetyVerdict SafetyEngine::Analyze(const std::string& source,
                                    const EnforcementConfig& config,
                                    bool trusted) {
    SafetyVerdict verdict{};
    verdict.policy = ResolvePolicy(config, trusted);
    if (trusted) {
        return verdict;
    }
    const auto& policy = verdict.policy;
    auto parsed = PythonParser::Parse(source);

    std::vector<ImportUse> imports;
    std::optional<Finding> raw_call;
    if (!parsed.ok) {
        verdict.warnings.push_back("Source does not tokenize (line " + std::to_string(parsed.error_line) +
                                   ": " + parsed.error + "); the interpreter will reject it.");
        raw_call = ScanRawText(source, parsed.error_line, policy, imports);
    }
    for (const auto& statement : parsed.statements) {
        if (statement.kind == StatementKind::kImport) {
            for (const auto& alias : statement.names) {
                imports.push_back(ImportUse{alias.name, statement.line});
            }
        } else if (statement.kind == StatementKind::kImportFrom && statement.level == 0) {
            imports.push_back(ImportUse{statement.module, statement.line});
        } else if (statement.kind == StatementKind::kUnparsed) {
            verdict.warnings.push_back("Line " + std::to_string(statement.line) +
                                       " was not fully parsed; only literal imports and calls were checked.");
            auto found = ImportsFromTokens(statement.tokens);
            imports.insert(imports.end(), found.begin(), found.end());
        }
    }
    std::sort(imports.begin(), imports.end(), [](const ImportUse& a, const ImportUse& b) {
        return a.line < b.line;
    });

    std::set<std::string> blocked;
    std::set<std::string> authorized_dangerous;
    const ImportUse* first_blocked = nullptr;
    for (const auto& use : imports) {
        const auto decision = DecideModule(policy, use.module);
        const auto root = ModuleRoot(use.module);
        if (!decision.allowed) {
            blocked.insert(root);
            if (!first_blocked) {
                first_blocked = &use;
            }
        } else if (decision.denied_but_authorized && authorized_dangerous.insert(root).second) {
            verdict.warnings.push_back("Importing dangerous module '" + root +
                                       "' was allowed due to authorized_imports configuration.");
        }
    }
    if (first_blocked) {
        verdict.accepted = false;
        verdict.reason = ImportRejectionReason(policy, {blocked.begin(), blocked.end()});
        verdict.construct = "import " + first_blocked->module;
        verdict.line = first_blocked->line;
        return verdict;
    }

    Checker checker(policy);
    for (const auto& statement : parsed.statements) {
        if (auto finding = checker.CheckStatement(statement)) {
            verdict.accepted = false;
            verdict.reason = finding->reason;
            verdict.construct = finding->construct;
            verdict.line = finding->line;
            return verdict;
        }
    }
    if (raw_call) {
        verdict.accepted = false;
        verdict.reason = raw_call->reason;
        verdict.construct = raw_call->construct;
        verdict.line = raw_call->line;
    }
    return verdict;
}

}  // namespace sandcell::safety
