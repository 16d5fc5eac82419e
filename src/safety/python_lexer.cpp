#include "safety/python_lexer.hpp"

#include <cstring>
#include <unordered_set>

#include "utils/common.hpp"

namespace sandcell::safety {
namespace {

bool IsNameStart(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool IsNameChar(char c) {
    const auto u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool IsStringPrefix(const std::string& prefix) {
    static const std::unordered_set<std::string> kPrefixes = {
        "r", "u", "b", "f", "t", "br", "rb", "fr", "rf", "tr", "rt"
    };
    return kPrefixes.count(utils::ToLower(prefix)) > 0;
}

void AppendUtf8(std::string& out, unsigned long code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Longest operators first.
const char* const kOperators[] = {
    "**=", "//=", ">>=", "<<=", "...", "!=",
    "->", ":=", "**", "//", "<<", ">>", "<=", ">=", "==",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "@=",
};

}  // namespace

std::string DecodeStringEscapes(const std::string& body, bool is_bytes) {
    std::string out;
    out.reserve(body.size());
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c != '\\' || i + 1 >= body.size()) {
            out.push_back(c);
            continue;
        }
        const char next = body[++i];
        switch (next) {
            case '\n': break;
            case '\\': out.push_back('\\'); break;
            case '\'': out.push_back('\''); break;
            case '"': out.push_back('"'); break;
            case 'a': out.push_back('\a'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'v': out.push_back('\v'); break;
            case 'x': {
                unsigned long value = 0;
                std::size_t digits = 0;
                while (digits < 2 && i + 1 < body.size() && HexValue(body[i + 1]) >= 0) {
                    value = value * 16 + static_cast<unsigned long>(HexValue(body[++i]));
                    ++digits;
                }
                if (is_bytes) {
                    out.push_back(static_cast<char>(value));
                } else {
                    AppendUtf8(out, value);
                }
                break;
            }
            case 'u':
            case 'U': {
                if (is_bytes) {
                    out.push_back('\\');
                    out.push_back(next);
                    break;
                }
                const std::size_t width = next == 'u' ? 4 : 8;
                unsigned long value = 0;
                std::size_t digits = 0;
                while (digits < width && i + 1 < body.size() && HexValue(body[i + 1]) >= 0) {
                    value = value * 16 + static_cast<unsigned long>(HexValue(body[++i]));
                    ++digits;
                }
                AppendUtf8(out, value);
                break;
            }
            default:
                if (next >= '0' && next <= '7') {
                    unsigned long value = static_cast<unsigned long>(next - '0');
                    std::size_t digits = 1;
                    while (digits < 3 && i + 1 < body.size() && body[i + 1] >= '0' && body[i + 1] <= '7') {
                        value = value * 8 + static_cast<unsigned long>(body[++i] - '0');
                        ++digits;
                    }
                    if (is_bytes) {
                        out.push_back(static_cast<char>(value & 0xFF));
                    } else {
                        AppendUtf8(out, value);
                    }
                } else {
                    // Unknown escapes (including \N{...}) are kept verbatim.
                    out.push_back('\\');
                    out.push_back(next);
                }
                break;
        }
    }
    return out;
}

PythonLexer::PythonLexer(std::string source)
    : source_(std::move(source)) {}

bool PythonLexer::IsKeyword(const std::string& name) {
    static const std::unordered_set<std::string> kKeywords = {
        "False", "None", "True", "and", "as", "assert", "async", "await",
        "break", "class", "continue", "def", "del", "elif", "else", "except",
        "finally", "for", "from", "global", "if", "import", "in", "is",
        "lambda", "nonlocal", "not", "or", "pass", "raise", "return", "try",
        "while", "with", "yield"
    };
    return kKeywords.count(name) > 0;
}

char PythonLexer::Peek(std::size_t offset) const {
    const auto index = pos_ + offset;
    return index < source_.size() ? source_[index] : '\0';
}

void PythonLexer::Advance(std::size_t count) {
    for (std::size_t i = 0; i < count && pos_ < source_.size(); ++i) {
        if (source_[pos_] == '\n') {
            ++line_;
            column_ = 0;
        } else {
            ++column_;
        }
        ++pos_;
    }
}

void PythonLexer::FlushLine(LexResult& result) {
    if (!current_.tokens.empty()) {
        result.lines.push_back(std::move(current_));
    }
    current_ = LogicalLine{};
}

LexResult PythonLexer::Tokenize() {
    LexResult result{};
    while (!AtEnd()) {
        const char c = Peek();
        if (c == '\n') {
            Advance();
            if (depth_ == 0) {
                FlushLine(result);
            }
            continue;
        }
        if (c == ' ' || c == '\t' || c == '\r' || c == '\f') {
            Advance();
            continue;
        }
        if (c == '#') {
            while (!AtEnd() && Peek() != '\n') {
                Advance();
            }
            continue;
        }
        if (c == '\\' && (Peek(1) == '\n' || (Peek(1) == '\r' && Peek(2) == '\n'))) {
            Advance(Peek(1) == '\r' ? 3 : 2);
            continue;
        }

        Token token{};
        token.line = line_;
        token.column = column_;
        if (current_.tokens.empty()) {
            current_.line = line_;
        }

        if (c == '"' || c == '\'') {
            std::string error;
            if (!LexString(token, error)) {
                result.ok = false;
                result.error = error;
                result.error_line = token.line;
                FlushLine(result);
                return result;
            }
        } else if (std::isdigit(static_cast<unsigned char>(c)) ||
                   (c == '.' && std::isdigit(static_cast<unsigned char>(Peek(1))))) {
            LexNumber(token);
        } else if (IsNameStart(c)) {
            // A short run of prefix letters directly followed by a quote is a string.
            std::size_t length = 0;
            while (length < 3 && IsNameChar(Peek(length))) {
                ++length;
            }
            const char after = Peek(length);
            if (length <= 2 && (after == '"' || after == '\'') &&
                IsStringPrefix(source_.substr(pos_, length))) {
                std::string error;
                if (!LexString(token, error)) {
                    result.ok = false;
                    result.error = error;
                    result.error_line = token.line;
                    FlushLine(result);
                    return result;
                }
            } else {
                LexName(token);
            }
        } else {
            LexOperator(token);
            if (token.text == "(" || token.text == "[" || token.text == "{") {
                ++depth_;
            } else if (token.text == ")" || token.text == "]" || token.text == "}") {
                if (depth_ == 0) {
                    result.ok = false;
                    result.error = "unmatched '" + token.text + "'";
                    result.error_line = token.line;
                    FlushLine(result);
                    return result;
                }
                --depth_;
            }
        }
        current_.tokens.push_back(std::move(token));
    }
    if (depth_ != 0) {
        result.ok = false;
        result.error = "unexpected EOF: unclosed bracket";
        result.error_line = line_;
    }
    FlushLine(result);
    return result;
}

bool PythonLexer::LexString(Token& token, std::string& error) {
    const auto start = pos_;
    std::string prefix;
    while (Peek() != '"' && Peek() != '\'') {
        prefix.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(Peek()))));
        Advance();
    }
    token.kind = TokenKind::kString;
    token.is_bytes = prefix.find('b') != std::string::npos;
    token.is_raw = prefix.find('r') != std::string::npos;
    token.is_fstring = prefix.find('f') != std::string::npos || prefix.find('t') != std::string::npos;

    const char quote = Peek();
    const bool triple = Peek(1) == quote && Peek(2) == quote;
    Advance(triple ? 3 : 1);

    std::string body;
    bool closed = false;
    while (!AtEnd()) {
        const char c = Peek();
        if (c == '\\') {
            body.push_back(c);
            Advance();
            if (!AtEnd()) {
                body.push_back(Peek());
                Advance();
            }
            continue;
        }
        if (c == quote) {
            if (!triple) {
                Advance();
                closed = true;
                break;
            }
            if (Peek(1) == quote && Peek(2) == quote) {
                Advance(3);
                closed = true;
                break;
            }
        }
        if (c == '\n' && !triple) {
            break;
        }
        body.push_back(c);
        Advance();
    }
    if (!closed) {
        error = triple ? "unterminated triple-quoted string literal"
                       : "unterminated string literal";
        return false;
    }
    token.text = source_.substr(start, pos_ - start);
    if (token.is_fstring || token.is_raw) {
        token.value = body;
    } else {
        token.value = DecodeStringEscapes(body, token.is_bytes);
    }
    return true;
}

void PythonLexer::LexNumber(Token& token) {
    const auto start = pos_;
    token.kind = TokenKind::kNumber;
    while (!AtEnd()) {
        const char c = Peek();
        if ((c == 'e' || c == 'E') && (Peek(1) == '+' || Peek(1) == '-') &&
            !(source_.size() > start + 1 && source_[start] == '0' &&
              (source_[start + 1] == 'x' || source_[start + 1] == 'X'))) {
            Advance(2);
            continue;
        }
        if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
            Advance();
            continue;
        }
        break;
    }
    token.text = source_.substr(start, pos_ - start);
}

void PythonLexer::LexName(Token& token) {
    const auto start = pos_;
    token.kind = TokenKind::kName;
    while (!AtEnd() && IsNameChar(Peek())) {
        Advance();
    }
    token.text = source_.substr(start, pos_ - start);
}

void PythonLexer::LexOperator(Token& token) {
    token.kind = TokenKind::kOperator;
    for (const char* op : kOperators) {
        const auto length = std::strlen(op);
        if (source_.compare(pos_, length, op) == 0) {
            token.text = op;
            Advance(length);
            return;
        }
    }
    token.text = std::string(1, Peek());
    Advance();
}

}  // namespace sandcell::safety
