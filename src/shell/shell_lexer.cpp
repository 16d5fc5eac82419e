#include "shell/shell_lexer.hpp"

#include <cctype>
#include <cstring>

namespace sandcell::shell {
namespace {

// Longest first.
const char* const kOperators[] = {
    "&>>", "<<<", ";;", "&&", "||", "|&", ">>", "<<", ">|", "&>", ">&", "<&", "<>",
    ";", "|", "&", "(", ")", ">", "<",
};

const char* const kUnterminatedQuote = "Unterminated quote in command line.";
const char* const kUnterminatedSubstitution = "Unterminated command substitution in command line.";

bool IsWordBreak(char c) {
    return std::strchr(" \t\r\n;&|()<>", c) != nullptr;
}

}  // namespace

ShellLexer::ShellLexer(std::string line)
    : line_(std::move(line)) {}

bool ShellLexer::IsRedirection(const std::string& op) {
    return op.find('>') != std::string::npos || op.find('<') != std::string::npos;
}

char ShellLexer::Peek(std::size_t offset) const {
    const auto index = pos_ + offset;
    return index < line_.size() ? line_[index] : '\0';
}

ShellLexResult ShellLexer::Tokenize() {
    ShellLexResult result{};
    while (!AtEnd()) {
        const char c = Peek();
        if (c == ' ' || c == '\t' || c == '\r') {
            ++pos_;
            continue;
        }
        if (c == '\\' && Peek(1) == '\n') {
            pos_ += 2;
            continue;
        }
        if (c == '\n') {
            result.tokens.push_back(ShellToken{ShellTokenKind::kOperator, ";", "\n", {}, false});
            ++pos_;
            continue;
        }
        if (c == '#') {
            while (!AtEnd() && Peek() != '\n') {
                ++pos_;
            }
            continue;
        }
        ShellToken token{};
        if (LexOperator(token)) {
            result.tokens.push_back(std::move(token));
            continue;
        }
        std::string error;
        if (!LexWord(token, error)) {
            result.ok = false;
            result.error = error;
            return result;
        }
        result.tokens.push_back(std::move(token));
    }
    return result;
}

bool ShellLexer::LexOperator(ShellToken& token) {
    std::size_t digits = 0;
    while (std::isdigit(static_cast<unsigned char>(Peek(digits)))) {
        ++digits;
    }
    const auto start = pos_ + digits;
    for (const char* op : kOperators) {
        const auto length = std::strlen(op);
        if (line_.compare(start, length, op) != 0) {
            continue;
        }
        const bool redirection = op[0] == '>' || op[0] == '<';
        if (digits > 0 && !redirection) {
            return false;
        }
        auto end = start + length;
        // Descriptor duplication: >&2, 2>&1, <&-
        if (std::strcmp(op, ">&") == 0 || std::strcmp(op, "<&") == 0) {
            if (end < line_.size() && line_[end] == '-') {
                ++end;
            } else {
                while (end < line_.size() && std::isdigit(static_cast<unsigned char>(line_[end]))) {
                    ++end;
                }
            }
        }
        token.kind = ShellTokenKind::kOperator;
        token.text = line_.substr(pos_, end - pos_);
        token.raw = token.text;
        pos_ = end;
        return true;
    }
    return false;
}

bool ShellLexer::ConsumeSubstitution(ShellToken& token, std::string& error) {
    const auto start = pos_;
    if (Peek() == '`') {
        ++pos_;
        while (!AtEnd() && Peek() != '`') {
            pos_ += Peek() == '\\' ? 2 : 1;
        }
        if (AtEnd()) {
            error = kUnterminatedSubstitution;
            return false;
        }
        ++pos_;
        if (token.substitution.empty()) {
            token.substitution = "`";
        }
    } else {
        pos_ += 2;  // "$("
        int depth = 1;
        while (!AtEnd() && depth > 0) {
            const char c = Peek();
            if (c == '\\') {
                pos_ += 2;
                continue;
            }
            if (c == '\'') {
                const auto close = line_.find('\'', pos_ + 1);
                if (close == std::string::npos) {
                    error = kUnterminatedQuote;
                    return false;
                }
                pos_ = close + 1;
                continue;
            }
            if (c == '(') {
                ++depth;
            } else if (c == ')') {
                --depth;
            }
            ++pos_;
        }
        if (depth > 0) {
            error = kUnterminatedSubstitution;
            return false;
        }
        if (token.substitution.empty()) {
            token.substitution = "$(";
        }
    }
    token.text += line_.substr(start, pos_ - start);
    return true;
}

bool ShellLexer::LexWord(ShellToken& token, std::string& error) {
    const auto start = pos_;
    token.kind = ShellTokenKind::kWord;
    while (!AtEnd() && !IsWordBreak(Peek())) {
        const char c = Peek();
        if (c == '\\') {
            if (Peek(1) == '\n') {
                pos_ += 2;
            } else if (pos_ + 1 < line_.size()) {
                token.text.push_back(Peek(1));
                pos_ += 2;
            } else {
                token.text.push_back(c);
                ++pos_;
            }
            continue;
        }
        if (c == '\'') {
            const auto close = line_.find('\'', pos_ + 1);
            if (close == std::string::npos) {
                error = kUnterminatedQuote;
                return false;
            }
            token.text += line_.substr(pos_ + 1, close - pos_ - 1);
            token.quoted = true;
            pos_ = close + 1;
            continue;
        }
        if (c == '"') {
            token.quoted = true;
            ++pos_;
            bool closed = false;
            while (!AtEnd()) {
                const char inner = Peek();
                if (inner == '"') {
                    ++pos_;
                    closed = true;
                    break;
                }
                if (inner == '\\') {
                    const char next = Peek(1);
                    if (next == '$' || next == '`' || next == '"' || next == '\\') {
                        token.text.push_back(next);
                        pos_ += 2;
                    } else if (next == '\n') {
                        pos_ += 2;
                    } else {
                        token.text.push_back(inner);
                        ++pos_;
                    }
                    continue;
                }
                if ((inner == '$' && Peek(1) == '(') || inner == '`') {
                    if (!ConsumeSubstitution(token, error)) {
                        return false;
                    }
                    continue;
                }
                token.text.push_back(inner);
                ++pos_;
            }
            if (!closed) {
                error = kUnterminatedQuote;
                return false;
            }
            continue;
        }
        if ((c == '$' && Peek(1) == '(') || c == '`') {
            if (!ConsumeSubstitution(token, error)) {
                return false;
            }
            continue;
        }
        if (c == '$' && Peek(1) == '{') {
            const auto close = line_.find('}', pos_);
            if (close == std::string::npos) {
                error = kUnterminatedSubstitution;
                return false;
            }
            const auto expansion = line_.substr(pos_, close - pos_ + 1);
            if (token.substitution.empty() &&
                (expansion.find("$(") != std::string::npos || expansion.find('`') != std::string::npos)) {
                token.substitution = "$(";
            }
            token.text += expansion;
            pos_ = close + 1;
            continue;
        }
        token.text.push_back(c);
        ++pos_;
    }
    token.raw = line_.substr(start, pos_ - start);
    return true;
}

}  // namespace sandcell::shell
