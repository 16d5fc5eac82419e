#pragma once

#include <string>
#include <vector>

namespace sandcell::safety {

enum class TokenKind {
    kName,
    kNumber,
    kString,
    kOperator
};

struct Token {
    TokenKind kind = TokenKind::kOperator;
    std::string text;
    int line = 0;
    int column = 0;

    // String tokens only. For f-strings `value` holds the undecoded body so
    // the parser can extract replacement fields.
    std::string value;
    bool is_bytes = false;
    bool is_raw = false;
    bool is_fstring = false;
};

struct LogicalLine {
    int line = 0;
    std::vector<Token> tokens;
};

struct LexResult {
    bool ok = true;
    std::string error;
    int error_line = 0;
    std::vector<LogicalLine> lines;
};

// Splits Python 3 source into logical lines of tokens. Indentation and
// comments are dropped; bracket nesting and backslashes join physical lines.
class PythonLexer {
public:
    explicit PythonLexer(std::string source);

    LexResult Tokenize();

    static bool IsKeyword(const std::string& name);

private:
    char Peek(std::size_t offset = 0) const;
    bool AtEnd() const { return pos_ >= source_.size(); }
    void Advance(std::size_t count = 1);

    bool LexString(Token& token, std::string& error);
    void LexNumber(Token& token);
    void LexName(Token& token);
    void LexOperator(Token& token);
    void FlushLine(LexResult& result);

    std::string source_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int column_ = 0;
    int depth_ = 0;
    LogicalLine current_;
};

// Decodes backslash escapes of a non-raw string body. Bytes bodies keep
// \u and \N sequences verbatim as Python does.
std::string DecodeStringEscapes(const std::string& body, bool is_bytes);

}  // namespace sandcell::safety
