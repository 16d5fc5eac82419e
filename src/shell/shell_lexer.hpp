#pragma once

#include <string>
#include <vector>

namespace sandcell::shell {

enum class ShellTokenKind {
    kWord,
    kOperator
};

struct ShellToken {
    ShellTokenKind kind = ShellTokenKind::kWord;
    // Words: the value after quote removal. Operators: the operator itself
    // (a newline is reported as ";").
    std::string text;
    // Exact spelling in the command line.
    std::string raw;
    // "$(" or "`" when the word contains a command substitution.
    std::string substitution;
    bool quoted = false;
};

struct ShellLexResult {
    bool ok = true;
    std::string error;
    std::vector<ShellToken> tokens;
};

// POSIX-flavoured tokenizer: single quotes, double quotes with backslash
// escapes, backslash escapes outside quotes, comments, control and
// redirection operators. Substitutions stay inside their word.
class ShellLexer {
public:
    explicit ShellLexer(std::string line);

    ShellLexResult Tokenize();

    static bool IsRedirection(const std::string& op);

private:
    char Peek(std::size_t offset = 0) const;
    bool AtEnd() const { return pos_ >= line_.size(); }

    bool LexWord(ShellToken& token, std::string& error);
    bool LexOperator(ShellToken& token);
    bool ConsumeSubstitution(ShellToken& token, std::string& error);

    std::string line_;
    std::size_t pos_ = 0;
};

}  // namespace sandcell::shell
