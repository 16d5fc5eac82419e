#include "safety/python_parser.hpp"

#include <stdexcept>
#include <unordered_set>

namespace sandcell::safety {
namespace {

// Deeper lines are left to the token scan; the tree walks and node
// destructors recurse once per level.
constexpr int kMaxNesting = 600;

class ParseError : public std::runtime_error {
public:
    explicit ParseError(const std::string& message)
        : std::runtime_error(message) {}
};

bool IsAugAssign(const std::string& text) {
    static const std::unordered_set<std::string> kOps = {
        "+=", "-=", "*=", "/=", "//=", "%=", "**=", ">>=", "<<=", "&=", "|=", "^=", "@="
    };
    return kOps.count(text) > 0;
}

bool IsOpening(const Token& token) {
    return token.kind == TokenKind::kOperator &&
           (token.text == "(" || token.text == "[" || token.text == "{");
}

bool IsClosing(const Token& token) {
    return token.kind == TokenKind::kOperator &&
           (token.text == ")" || token.text == "]" || token.text == "}");
}

void AppendFStringFields(const std::string& body, bool is_raw, int line, Node& joined);

class LineParser {
public:
    LineParser(const std::vector<Token>& tokens, int line)
        : tokens_(tokens), line_(line) {}

    void ParseLine(std::vector<Statement>& out) {
        if (AtEnd()) {
            return;
        }
        ParseCompoundHeader(out);
        while (!AtEnd()) {
            ParseSimpleStatement(out);
            if (!Accept(";")) {
                break;
            }
        }
        if (!AtEnd()) {
            Fail("unexpected token '" + Current()->text + "'");
        }
    }

    NodePtr ParseWholeExpression() {
        auto node = ParseTestListStarExpr();
        if (!AtEnd()) {
            Fail("unexpected token '" + Current()->text + "'");
        }
        return node;
    }

private:
    // Levels of tree added by one parsing frame, released when it returns.
    class DepthScope {
    public:
        explicit DepthScope(LineParser& parser)
            : parser_(parser) {}
        ~DepthScope() { parser_.depth_ -= added_; }

        void Deeper() {
            ++added_;
            if (++parser_.depth_ > kMaxNesting) {
                parser_.Fail("expression nested too deeply");
            }
        }

    private:
        LineParser& parser_;
        int added_ = 0;
    };

    const Token* At(std::size_t offset) const {
        const auto index = pos_ + offset;
        return index < tokens_.size() ? &tokens_[index] : nullptr;
    }
    const Token* Current() const { return At(0); }
    bool AtEnd() const { return pos_ >= tokens_.size(); }
    void Advance() { ++pos_; }

    bool IsAt(std::size_t offset, const std::string& text) const {
        const auto* token = At(offset);
        return token && token->kind != TokenKind::kString &&
               token->kind != TokenKind::kNumber && token->text == text;
    }
    bool Check(const std::string& text) const { return IsAt(0, text); }

    bool Accept(const std::string& text) {
        if (!Check(text)) {
            return false;
        }
        Advance();
        return true;
    }

    void Expect(const std::string& text) {
        if (!Accept(text)) {
            Fail("expected '" + text + "'");
        }
    }

    bool CheckName(std::size_t offset = 0) const {
        const auto* token = At(offset);
        return token && token->kind == TokenKind::kName && !PythonLexer::IsKeyword(token->text);
    }

    std::string ExpectName() {
        if (!CheckName()) {
            Fail("expected a name");
        }
        auto name = Current()->text;
        Advance();
        return name;
    }

    int CurrentLine() const {
        const auto* token = Current();
        if (token) {
            return token->line;
        }
        return tokens_.empty() ? line_ : tokens_.back().line;
    }

    [[noreturn]] void Fail(const std::string& message) const {
        throw ParseError(message);
    }

    // Stops a comma separated list without consuming the terminator.
    bool AtListTerminator() const {
        if (AtEnd()) {
            return true;
        }
        static const std::unordered_set<std::string> kTerminators = {
            ";", "=", ":", ")", "]", "}", "in"
        };
        const auto* token = Current();
        return token->kind != TokenKind::kString && token->kind != TokenKind::kNumber &&
               (kTerminators.count(token->text) > 0 || IsAugAssign(token->text));
    }

    bool CheckComprehensionStart() const {
        return Check("for") || (Check("async") && IsAt(1, "for"));
    }

    std::size_t MatchingClose(std::size_t open_index) const {
        int depth = 0;
        for (auto i = open_index; i < tokens_.size(); ++i) {
            if (IsOpening(tokens_[i])) {
                ++depth;
            } else if (IsClosing(tokens_[i])) {
                if (--depth == 0) {
                    return i;
                }
            }
        }
        return tokens_.size();
    }

    bool HasTopLevelColon() const {
        int depth = 0;
        for (auto i = pos_; i < tokens_.size(); ++i) {
            const auto& token = tokens_[i];
            if (IsOpening(token)) {
                ++depth;
            } else if (IsClosing(token)) {
                --depth;
            } else if (depth == 0 && token.kind == TokenKind::kOperator && token.text == ":") {
                return true;
            }
        }
        return false;
    }

    // "match" and "case" are only keywords when they open a block header.
    bool IsSoftKeywordHeader() const {
        const auto* next = At(1);
        if (!next) {
            return false;
        }
        if (next->kind == TokenKind::kOperator) {
            static const std::unordered_set<std::string> kNotHeader = {
                "=", ".", ",", ")", "]", "}", ":", ";", ":="
            };
            if (kNotHeader.count(next->text) > 0 || IsAugAssign(next->text)) {
                return false;
            }
        }
        if (next->kind == TokenKind::kName && PythonLexer::IsKeyword(next->text) &&
            next->text != "None" && next->text != "True" && next->text != "False" &&
            next->text != "not" && next->text != "lambda" && next->text != "await") {
            return false;
        }
        return HasTopLevelColon();
    }

    void SkipTypeParams() {
        if (Check("[")) {
            pos_ = MatchingClose(pos_) + 1;
        }
    }

    void ParseCompoundHeader(std::vector<Statement>& out) {
        const auto* first = Current();
        Statement statement{};
        statement.line = first->line;
        auto& exprs = statement.expressions;

        if (Accept("@")) {
            exprs.push_back(ParseNamedExpression());
            out.push_back(std::move(statement));
            return;
        }
        if (first->kind != TokenKind::kName) {
            return;
        }
        if (Check("async") && (IsAt(1, "def") || IsAt(1, "for") || IsAt(1, "with"))) {
            Advance();
        }
        const auto keyword = Current()->text;
        if (keyword == "if" || keyword == "elif" || keyword == "while") {
            Advance();
            exprs.push_back(ParseNamedExpression());
        } else if (keyword == "else" || keyword == "try" || keyword == "finally") {
            Advance();
        } else if (keyword == "for") {
            Advance();
            statement.target_count = 1;
            exprs.push_back(ParseTargetList());
            Expect("in");
            exprs.push_back(ParseTestListStarExpr());
        } else if (keyword == "with") {
            Advance();
            ParseWithItems(exprs);
        } else if (keyword == "except") {
            Advance();
            Accept("*");
            if (!Check(":")) {
                exprs.push_back(ParseTest());
                if (Accept("as")) {
                    ExpectName();
                }
            }
        } else if (keyword == "def") {
            Advance();
            ExpectName();
            SkipTypeParams();
            Expect("(");
            ParseParameters(")", exprs, true);
            Expect(")");
            if (Accept("->")) {
                exprs.push_back(ParseTest());
            }
        } else if (keyword == "class") {
            Advance();
            ExpectName();
            SkipTypeParams();
            if (Accept("(")) {
                for (auto& arg : ParseArguments()) {
                    exprs.push_back(std::move(arg));
                }
            }
        } else if (keyword == "match" && IsSoftKeywordHeader()) {
            Advance();
            exprs.push_back(ParseTestListStarExpr());
        } else if (keyword == "case" && IsSoftKeywordHeader()) {
            Advance();
            ParseCaseHeader(exprs);
        } else {
            return;
        }
        Expect(":");
        out.push_back(std::move(statement));
    }

    // Patterns only bind names and look up classes; the guard is the only
    // part of a case header that evaluates arbitrary code.
    void ParseCaseHeader(std::vector<NodePtr>& exprs) {
        int depth = 0;
        while (!AtEnd()) {
            const auto& token = *Current();
            if (IsOpening(token)) {
                ++depth;
            } else if (IsClosing(token)) {
                --depth;
            } else if (depth == 0 && (Check(":") || Check("if"))) {
                break;
            }
            Advance();
        }
        if (Accept("if")) {
            exprs.push_back(ParseNamedExpression());
        }
    }

    void ParseWithItems(std::vector<NodePtr>& exprs) {
        bool parenthesized = false;
        if (Check("(")) {
            const auto close = MatchingClose(pos_);
            if (close + 1 < tokens_.size() && tokens_[close + 1].kind == TokenKind::kOperator &&
                tokens_[close + 1].text == ":") {
                int depth = 0;
                for (auto i = pos_; i < close; ++i) {
                    if (IsOpening(tokens_[i])) {
                        ++depth;
                    } else if (IsClosing(tokens_[i])) {
                        --depth;
                    } else if (depth == 1 && tokens_[i].kind == TokenKind::kName &&
                               tokens_[i].text == "as") {
                        parenthesized = true;
                    }
                }
            }
        }
        if (parenthesized) {
            Advance();
        }
        while (!AtEnd()) {
            if (parenthesized && Check(")")) {
                break;
            }
            exprs.push_back(ParseTest());
            if (Accept("as")) {
                exprs.push_back(ParseTarget());
            }
            if (!Accept(",")) {
                break;
            }
        }
        if (parenthesized) {
            Expect(")");
        }
    }

    void ParseParameters(const std::string& close, std::vector<NodePtr>& out, bool annotations) {
        while (!AtEnd() && !Check(close)) {
            if (Accept("/")) {
                // positional-only marker
            } else if (Accept("*") || Accept("**")) {
                if (CheckName()) {
                    Advance();
                    if (annotations && Accept(":")) {
                        out.push_back(ParseStarOrNamed());
                    }
                }
            } else {
                ExpectName();
                if (annotations && Accept(":")) {
                    out.push_back(ParseTest());
                }
                if (Accept("=")) {
                    out.push_back(ParseTest());
                }
            }
            if (!Accept(",")) {
                break;
            }
        }
    }

    std::string ParseDottedName() {
        auto name = ExpectName();
        while (Check(".") && CheckName(1)) {
            Advance();
            name += "." + ExpectName();
        }
        return name;
    }

    void ParseSimpleStatement(std::vector<Statement>& out) {
        const auto* first = Current();
        Statement statement{};
        statement.line = first->line;
        auto& exprs = statement.expressions;

        if (Accept("import")) {
            statement.kind = StatementKind::kImport;
            do {
                ImportAlias alias{};
                alias.name = ParseDottedName();
                if (Accept("as")) {
                    alias.asname = ExpectName();
                }
                statement.names.push_back(std::move(alias));
            } while (Accept(","));
            out.push_back(std::move(statement));
            return;
        }
        if (Accept("from")) {
            statement.kind = StatementKind::kImportFrom;
            while (Check(".") || Check("...")) {
                statement.level += static_cast<int>(Current()->text.size());
                Advance();
            }
            if (!Check("import")) {
                statement.module = ParseDottedName();
            }
            Expect("import");
            if (Accept("*")) {
                statement.names.push_back(ImportAlias{"*", {}});
            } else {
                const bool parenthesized = Accept("(");
                do {
                    if (parenthesized && Check(")")) {
                        break;
                    }
                    ImportAlias alias{};
                    alias.name = ExpectName();
                    if (Accept("as")) {
                        alias.asname = ExpectName();
                    }
                    statement.names.push_back(std::move(alias));
                } while (Accept(","));
                if (parenthesized) {
                    Expect(")");
                }
            }
            out.push_back(std::move(statement));
            return;
        }
        if (Accept("pass") || Accept("break") || Accept("continue")) {
            return;
        }
        if (Accept("return")) {
            if (!AtEnd() && !Check(";")) {
                exprs.push_back(ParseTestListStarExpr());
            }
        } else if (Accept("raise")) {
            if (!AtEnd() && !Check(";")) {
                exprs.push_back(ParseTest());
                if (Accept("from")) {
                    exprs.push_back(ParseTest());
                }
            }
        } else if (Accept("del")) {
            statement.target_count = 1;
            exprs.push_back(ParseTargetList());
        } else if (Accept("assert")) {
            exprs.push_back(ParseTest());
            if (Accept(",")) {
                exprs.push_back(ParseTest());
            }
        } else if (Accept("global") || Accept("nonlocal")) {
            ExpectName();
            while (Accept(",")) {
                ExpectName();
            }
        } else if (Check("type") && CheckName(1) && (IsAt(2, "=") || IsAt(2, "["))) {
            Advance();
            ExpectName();
            SkipTypeParams();
            Expect("=");
            exprs.push_back(ParseTest());
        } else {
            auto target = ParseYieldOrTestList();
            if (Accept(":")) {
                statement.target_count = 1;
                exprs.push_back(std::move(target));
                exprs.push_back(ParseTest());
                if (Accept("=")) {
                    exprs.push_back(ParseYieldOrTestList());
                }
            } else if (!AtEnd() && Current()->kind == TokenKind::kOperator &&
                       IsAugAssign(Current()->text)) {
                Advance();
                statement.target_count = 1;
                exprs.push_back(std::move(target));
                exprs.push_back(ParseYieldOrTestList());
            } else {
                exprs.push_back(std::move(target));
                while (Accept("=")) {
                    exprs.push_back(ParseYieldOrTestList());
                }
                statement.target_count = exprs.size() - 1;
            }
        }
        out.push_back(std::move(statement));
    }

    NodePtr ParseYieldOrTestList() {
        if (Check("yield")) {
            return ParseYield();
        }
        return ParseTestListStarExpr();
    }

    NodePtr ParseYield() {
        auto node = MakeNode(NodeKind::kYield, CurrentLine());
        Expect("yield");
        if (Accept("from")) {
            node->text = "from";
            node->children.push_back(ParseTest());
        } else if (AtListTerminator()) {
            node->children.push_back(nullptr);
        } else {
            node->children.push_back(ParseTestListStarExpr());
        }
        return node;
    }

    NodePtr ParseTestListStarExpr() {
        const int line = CurrentLine();
        auto first = ParseStarOrNamed();
        if (!Check(",")) {
            return first;
        }
        auto tuple = MakeNode(NodeKind::kTuple, line);
        tuple->children.push_back(std::move(first));
        while (Accept(",")) {
            if (AtListTerminator()) {
                break;
            }
            tuple->children.push_back(ParseStarOrNamed());
        }
        return tuple;
    }

    NodePtr ParseTarget() {
        if (Check("*")) {
            auto star = MakeNode(NodeKind::kStarred, CurrentLine(), "*");
            Advance();
            star->children.push_back(ParseBinary(0));
            return star;
        }
        return ParseBinary(0);
    }

    NodePtr ParseTargetList() {
        const int line = CurrentLine();
        auto first = ParseTarget();
        if (!Check(",")) {
            return first;
        }
        auto tuple = MakeNode(NodeKind::kTuple, line);
        tuple->children.push_back(std::move(first));
        while (Accept(",")) {
            if (AtListTerminator()) {
                break;
            }
            tuple->children.push_back(ParseTarget());
        }
        return tuple;
    }

    NodePtr ParseStarOrNamed() {
        if (Check("*")) {
            auto star = MakeNode(NodeKind::kStarred, CurrentLine(), "*");
            Advance();
            star->children.push_back(ParseBinary(0));
            return star;
        }
        return ParseNamedExpression();
    }

    NodePtr ParseNamedExpression() {
        if (CheckName() && IsAt(1, ":=")) {
            auto node = MakeNode(NodeKind::kNamedExpr, CurrentLine());
            node->children.push_back(MakeNode(NodeKind::kName, CurrentLine(), Current()->text));
            Advance();
            Advance();
            node->children.push_back(ParseTest());
            return node;
        }
        return ParseTest();
    }

    NodePtr ParseTest() {
        DepthScope scope(*this);
        scope.Deeper();
        if (Check("lambda")) {
            return ParseLambda();
        }
        const int line = CurrentLine();
        auto body = ParseOrTest();
        if (!Accept("if")) {
            return body;
        }
        auto node = MakeNode(NodeKind::kIfExp, line);
        node->children.push_back(std::move(body));
        node->children.push_back(ParseOrTest());
        Expect("else");
        node->children.push_back(ParseTest());
        return node;
    }

    NodePtr ParseLambda() {
        auto node = MakeNode(NodeKind::kLambda, CurrentLine());
        Expect("lambda");
        std::vector<NodePtr> defaults;
        ParseParameters(":", defaults, false);
        Expect(":");
        node->children.push_back(ParseTest());
        for (auto& value : defaults) {
            node->children.push_back(std::move(value));
        }
        return node;
    }

    NodePtr ParseBoolChain(const std::string& op, NodePtr (LineParser::*operand)()) {
        const int line = CurrentLine();
        auto first = (this->*operand)();
        if (!Check(op)) {
            return first;
        }
        auto node = MakeNode(NodeKind::kBoolOp, line, op);
        node->children.push_back(std::move(first));
        while (Accept(op)) {
            node->children.push_back((this->*operand)());
        }
        return node;
    }

    NodePtr ParseOrTest() { return ParseBoolChain("or", &LineParser::ParseAndTest); }
    NodePtr ParseAndTest() { return ParseBoolChain("and", &LineParser::ParseNotTest); }

    NodePtr ParseNotTest() {
        DepthScope scope(*this);
        scope.Deeper();
        if (Check("not")) {
            auto node = MakeNode(NodeKind::kUnaryOp, CurrentLine(), "not");
            Advance();
            node->children.push_back(ParseNotTest());
            return node;
        }
        return ParseComparison();
    }

    std::string AcceptComparisonOperator() {
        static const std::unordered_set<std::string> kSymbols = {
            "<", ">", "==", ">=", "<=", "!="
        };
        const auto* token = Current();
        if (!token) {
            return {};
        }
        if (token->kind == TokenKind::kOperator && kSymbols.count(token->text) > 0) {
            Advance();
            return token->text;
        }
        if (Accept("in")) {
            return "in";
        }
        if (Check("not") && IsAt(1, "in")) {
            Advance();
            Advance();
            return "not in";
        }
        if (Accept("is")) {
            return Accept("not") ? "is not" : "is";
        }
        return {};
    }

    NodePtr ParseComparison() {
        const int line = CurrentLine();
        auto first = ParseBinary(0);
        auto op = AcceptComparisonOperator();
        if (op.empty()) {
            return first;
        }
        auto node = MakeNode(NodeKind::kCompare, line);
        node->children.push_back(std::move(first));
        std::string ops;
        while (!op.empty()) {
            ops += ops.empty() ? op : " " + op;
            node->children.push_back(ParseBinary(0));
            op = AcceptComparisonOperator();
        }
        node->text = ops;
        return node;
    }

    NodePtr ParseBinary(std::size_t level) {
        static const std::vector<std::unordered_set<std::string>> kLevels = {
            {"|"}, {"^"}, {"&"}, {"<<", ">>"}, {"+", "-"}, {"*", "/", "//", "%", "@"}
        };
        if (level >= kLevels.size()) {
            return ParseFactor();
        }
        DepthScope scope(*this);
        auto left = ParseBinary(level + 1);
        while (!AtEnd() && Current()->kind == TokenKind::kOperator &&
               kLevels[level].count(Current()->text) > 0) {
            scope.Deeper();
            auto node = MakeNode(NodeKind::kBinOp, Current()->line, Current()->text);
            Advance();
            node->children.push_back(std::move(left));
            node->children.push_back(ParseBinary(level + 1));
            left = std::move(node);
        }
        return left;
    }

    NodePtr ParseFactor() {
        DepthScope scope(*this);
        scope.Deeper();
        if (Check("+") || Check("-") || Check("~")) {
            auto node = MakeNode(NodeKind::kUnaryOp, CurrentLine(), Current()->text);
            Advance();
            node->children.push_back(ParseFactor());
            return node;
        }
        return ParsePower();
    }

    NodePtr ParsePower() {
        const int line = CurrentLine();
        NodePtr base;
        if (Accept("await")) {
            base = MakeNode(NodeKind::kAwait, line);
            base->children.push_back(ParsePrimary());
        } else {
            base = ParsePrimary();
        }
        if (!Accept("**")) {
            return base;
        }
        auto node = MakeNode(NodeKind::kBinOp, line, "**");
        node->children.push_back(std::move(base));
        node->children.push_back(ParseFactor());
        return node;
    }

    NodePtr ParsePrimary() {
        DepthScope scope(*this);
        auto node = ParseAtom();
        while (!AtEnd()) {
            const int line = CurrentLine();
            if (Check(".") || Check("(") || Check("[")) {
                scope.Deeper();
            }
            if (Accept(".")) {
                auto attribute = MakeNode(NodeKind::kAttribute, line, ExpectName());
                attribute->children.push_back(std::move(node));
                node = std::move(attribute);
            } else if (Accept("(")) {
                auto call = MakeNode(NodeKind::kCall, line);
                call->children.push_back(std::move(node));
                for (auto& arg : ParseArguments()) {
                    call->children.push_back(std::move(arg));
                }
                node = std::move(call);
            } else if (Accept("[")) {
                auto subscript = MakeNode(NodeKind::kSubscript, line);
                subscript->children.push_back(std::move(node));
                subscript->children.push_back(ParseSubscriptList());
                Expect("]");
                node = std::move(subscript);
            } else {
                break;
            }
        }
        return node;
    }

    // Expects the opening parenthesis to be consumed; consumes the closing one.
    std::vector<NodePtr> ParseArguments() {
        std::vector<NodePtr> args;
        while (!AtEnd() && !Check(")")) {
            const int line = CurrentLine();
            if (Check("*") || Check("**")) {
                auto star = MakeNode(NodeKind::kStarred, line, Current()->text);
                Advance();
                star->children.push_back(ParseTest());
                args.push_back(std::move(star));
            } else if (CheckName() && IsAt(1, "=")) {
                auto keyword = MakeNode(NodeKind::kKeyword, line, Current()->text);
                Advance();
                Advance();
                keyword->children.push_back(ParseTest());
                args.push_back(std::move(keyword));
            } else {
                auto value = ParseNamedExpression();
                if (CheckComprehensionStart()) {
                    std::vector<NodePtr> elements;
                    elements.push_back(std::move(value));
                    value = ParseComprehension("gen", std::move(elements), line);
                }
                args.push_back(std::move(value));
            }
            if (!Accept(",")) {
                break;
            }
        }
        Expect(")");
        return args;
    }

    NodePtr ParseSubscriptList() {
        const int line = CurrentLine();
        auto first = ParseSliceItem();
        if (!Check(",")) {
            return first;
        }
        auto tuple = MakeNode(NodeKind::kTuple, line);
        tuple->children.push_back(std::move(first));
        while (Accept(",")) {
            if (Check("]")) {
                break;
            }
            tuple->children.push_back(ParseSliceItem());
        }
        return tuple;
    }

    bool AtSliceBoundary() const {
        return AtEnd() || Check(":") || Check("]") || Check(",");
    }

    NodePtr ParseSliceItem() {
        const int line = CurrentLine();
        NodePtr lower;
        if (!Check(":")) {
            lower = ParseStarOrNamed();
            if (!Check(":")) {
                return lower;
            }
        }
        auto slice = MakeNode(NodeKind::kSlice, line);
        Expect(":");
        slice->children.push_back(std::move(lower));
        slice->children.push_back(AtSliceBoundary() ? nullptr : ParseTest());
        if (Accept(":")) {
            slice->children.push_back(AtSliceBoundary() ? nullptr : ParseTest());
        } else {
            slice->children.push_back(nullptr);
        }
        return slice;
    }

    NodePtr ParseComprehension(const std::string& type, std::vector<NodePtr> elements, int line) {
        auto node = MakeNode(NodeKind::kComprehension, line, type);
        node->children = std::move(elements);
        while (CheckComprehensionStart()) {
            Accept("async");
            Expect("for");
            node->children.push_back(ParseTargetList());
            Expect("in");
            node->children.push_back(ParseOrTest());
            while (Accept("if")) {
                node->children.push_back(ParseOrTest());
            }
        }
        return node;
    }

    NodePtr ParseAtom() {
        const auto* token = Current();
        if (!token) {
            Fail("unexpected end of line");
        }
        const int line = token->line;
        if (token->kind == TokenKind::kNumber) {
            auto node = MakeNode(NodeKind::kConstant, line, token->text);
            node->constant = ConstantKind::kNumber;
            node->value = token->text;
            Advance();
            return node;
        }
        if (token->kind == TokenKind::kString) {
            return ParseStrings();
        }
        if (token->kind == TokenKind::kName) {
            if (token->text == "True" || token->text == "False") {
                auto node = MakeNode(NodeKind::kConstant, line, token->text);
                node->constant = ConstantKind::kBool;
                node->value = token->text;
                Advance();
                return node;
            }
            if (token->text == "None") {
                auto node = MakeNode(NodeKind::kConstant, line, token->text);
                node->constant = ConstantKind::kNone;
                Advance();
                return node;
            }
            if (PythonLexer::IsKeyword(token->text)) {
                Fail("unexpected keyword '" + token->text + "'");
            }
            Advance();
            return MakeNode(NodeKind::kName, line, token->text);
        }
        if (Check("(")) {
            return ParseParenthesized();
        }
        if (Check("[")) {
            return ParseListDisplay();
        }
        if (Check("{")) {
            return ParseBraceDisplay();
        }
        if (Accept("...")) {
            auto node = MakeNode(NodeKind::kConstant, line, "...");
            node->constant = ConstantKind::kEllipsis;
            return node;
        }
        Fail("unexpected token '" + token->text + "'");
    }

    NodePtr ParseStrings() {
        const int line = CurrentLine();
        bool formatted = false;
        bool bytes = false;
        const auto start = pos_;
        while (!AtEnd() && Current()->kind == TokenKind::kString) {
            formatted = formatted || Current()->is_fstring;
            bytes = bytes || Current()->is_bytes;
            Advance();
        }
        if (!formatted) {
            auto node = MakeNode(NodeKind::kConstant, line);
            node->constant = bytes ? ConstantKind::kBytes : ConstantKind::kString;
            for (auto i = start; i < pos_; ++i) {
                node->value += tokens_[i].value;
                node->text += tokens_[i].text;
            }
            return node;
        }
        auto joined = MakeNode(NodeKind::kJoinedStr, line);
        for (auto i = start; i < pos_; ++i) {
            const auto& part = tokens_[i];
            joined->text += part.text;
            if (part.is_fstring) {
                AppendFStringFields(part.value, part.is_raw, part.line, *joined);
            } else {
                auto literal = MakeNode(NodeKind::kConstant, part.line, part.text);
                literal->constant = ConstantKind::kString;
                literal->value = part.value;
                joined->children.push_back(std::move(literal));
            }
        }
        return joined;
    }

    NodePtr ParseParenthesized() {
        const int line = CurrentLine();
        Expect("(");
        if (Accept(")")) {
            return MakeNode(NodeKind::kTuple, line);
        }
        if (Check("yield")) {
            auto node = ParseYield();
            Expect(")");
            return node;
        }
        auto first = ParseStarOrNamed();
        if (CheckComprehensionStart()) {
            std::vector<NodePtr> elements;
            elements.push_back(std::move(first));
            auto node = ParseComprehension("gen", std::move(elements), line);
            Expect(")");
            return node;
        }
        if (Accept(")")) {
            return first;
        }
        auto tuple = MakeNode(NodeKind::kTuple, line);
        tuple->children.push_back(std::move(first));
        while (Accept(",")) {
            if (Check(")")) {
                break;
            }
            tuple->children.push_back(ParseStarOrNamed());
        }
        Expect(")");
        return tuple;
    }

    NodePtr ParseListDisplay() {
        const int line = CurrentLine();
        Expect("[");
        auto list = MakeNode(NodeKind::kList, line);
        if (Accept("]")) {
            return list;
        }
        auto first = ParseStarOrNamed();
        if (CheckComprehensionStart()) {
            std::vector<NodePtr> elements;
            elements.push_back(std::move(first));
            auto node = ParseComprehension("list", std::move(elements), line);
            Expect("]");
            return node;
        }
        list->children.push_back(std::move(first));
        while (Accept(",")) {
            if (Check("]")) {
                break;
            }
            list->children.push_back(ParseStarOrNamed());
        }
        Expect("]");
        return list;
    }

    void ParseDictEntry(std::vector<NodePtr>& out) {
        if (Check("**")) {
            auto star = MakeNode(NodeKind::kStarred, CurrentLine(), "**");
            Advance();
            star->children.push_back(ParseBinary(0));
            out.push_back(std::move(star));
            return;
        }
        auto key = ParseTest();
        Expect(":");
        out.push_back(std::move(key));
        out.push_back(ParseTest());
    }

    NodePtr ParseBraceDisplay() {
        const int line = CurrentLine();
        Expect("{");
        if (Accept("}")) {
            return MakeNode(NodeKind::kDict, line);
        }
        if (Check("**")) {
            auto dict = MakeNode(NodeKind::kDict, line);
            ParseDictEntry(dict->children);
            while (Accept(",")) {
                if (Check("}")) {
                    break;
                }
                ParseDictEntry(dict->children);
            }
            Expect("}");
            return dict;
        }
        auto first = ParseStarOrNamed();
        if (Accept(":")) {
            std::vector<NodePtr> entries;
            entries.push_back(std::move(first));
            entries.push_back(ParseTest());
            if (CheckComprehensionStart()) {
                auto node = ParseComprehension("dict", std::move(entries), line);
                Expect("}");
                return node;
            }
            auto dict = MakeNode(NodeKind::kDict, line);
            dict->children = std::move(entries);
            while (Accept(",")) {
                if (Check("}")) {
                    break;
                }
                ParseDictEntry(dict->children);
            }
            Expect("}");
            return dict;
        }
        if (CheckComprehensionStart()) {
            std::vector<NodePtr> elements;
            elements.push_back(std::move(first));
            auto node = ParseComprehension("set", std::move(elements), line);
            Expect("}");
            return node;
        }
        auto set = MakeNode(NodeKind::kSet, line);
        set->children.push_back(std::move(first));
        while (Accept(",")) {
            if (Check("}")) {
                break;
            }
            set->children.push_back(ParseStarOrNamed());
        }
        Expect("}");
        return set;
    }

    const std::vector<Token>& tokens_;
    int depth_ = 0;
    int line_ = 0;
    std::size_t pos_ = 0;
};

// Returns the index just past the replacement field opened at `start`
// (which points after the '{'). `expr_end` receives the end of the
// expression part and `spec_begin` the start of the format spec, or npos.
std::size_t ScanReplacementField(const std::string& body,
                                 std::size_t start,
                                 std::size_t& expr_end,
                                 std::size_t& spec_begin) {
    int depth = 0;
    char quote = '\0';
    expr_end = std::string::npos;
    spec_begin = std::string::npos;
    for (auto i = start; i < body.size(); ++i) {
        const char c = body[i];
        if (quote != '\0') {
            if (c == quote) {
                quote = '\0';
            }
            continue;
        }
        if (expr_end == std::string::npos) {
            if (c == '\'' || c == '"') {
                quote = c;
            } else if (c == '(' || c == '[' || c == '{') {
                ++depth;
            } else if ((c == ')' || c == ']') && depth > 0) {
                --depth;
            } else if (c == '}' && depth > 0) {
                --depth;
            } else if (c == '}' && depth == 0) {
                expr_end = i;
                return i + 1;
            } else if (depth == 0 && c == '!' && (i + 1 >= body.size() || body[i + 1] != '=')) {
                expr_end = i;
            } else if (depth == 0 && c == ':') {
                expr_end = i;
                spec_begin = i + 1;
            }
            continue;
        }
        // Inside the conversion or format spec; nested fields are balanced.
        if (c == ':' && spec_begin == std::string::npos) {
            spec_begin = i + 1;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (depth == 0) {
                return i + 1;
            }
            --depth;
        }
    }
    throw ParseError("unterminated f-string replacement field");
}

std::string StripDebugMarker(const std::string& text) {
    auto end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos || text[end] != '=') {
        return text;
    }
    if (end > 0) {
        const char before = text[end - 1];
        if (before == '=' || before == '!' || before == '<' || before == '>') {
            return text;
        }
    }
    return text.substr(0, end);
}

void AppendFStringFields(const std::string& body, bool is_raw, int line, Node& joined) {
    std::string literal;
    auto flush = [&]() {
        if (literal.empty()) {
            return;
        }
        auto node = MakeNode(NodeKind::kConstant, line);
        node->constant = ConstantKind::kString;
        node->value = is_raw ? literal : DecodeStringEscapes(literal, false);
        joined.children.push_back(std::move(node));
        literal.clear();
    };
    for (std::size_t i = 0; i < body.size(); ++i) {
        const char c = body[i];
        if (c == '{' && i + 1 < body.size() && body[i + 1] == '{') {
            literal.push_back('{');
            ++i;
            continue;
        }
        if (c == '}' && i + 1 < body.size() && body[i + 1] == '}') {
            literal.push_back('}');
            ++i;
            continue;
        }
        if (c != '{') {
            literal.push_back(c);
            continue;
        }
        flush();
        std::size_t expr_end = 0;
        std::size_t spec_begin = 0;
        const auto next = ScanReplacementField(body, i + 1, expr_end, spec_begin);
        const auto expression_text = StripDebugMarker(body.substr(i + 1, expr_end - i - 1));
        auto expression = PythonParser::ParseExpression(expression_text, line);
        if (!expression) {
            throw ParseError("invalid f-string replacement field");
        }
        joined.children.push_back(std::move(expression));
        if (spec_begin != std::string::npos && spec_begin < next - 1) {
            // Only the nested fields of a format spec are code.
            Node spec{};
            AppendFStringFields(body.substr(spec_begin, next - 1 - spec_begin), is_raw, line, spec);
            for (auto& child : spec.children) {
                if (child && child->kind != NodeKind::kConstant) {
                    joined.children.push_back(std::move(child));
                }
            }
        }
        i = next - 1;
    }
    flush();
}

}  // namespace

ParseResult PythonParser::Parse(const std::string& source) {
    ParseResult result{};
    PythonLexer lexer(source);
    auto lexed = lexer.Tokenize();
    if (!lexed.ok) {
        result.ok = false;
        result.error = lexed.error;
        result.error_line = lexed.error_line;
    }
    for (auto& line : lexed.lines) {
        std::vector<Statement> statements;
        try {
            LineParser parser(line.tokens, line.line);
            parser.ParseLine(statements);
        } catch (const ParseError&) {
            statements.clear();
            Statement unparsed{};
            unparsed.kind = StatementKind::kUnparsed;
            unparsed.line = line.line;
            unparsed.tokens = std::move(line.tokens);
            statements.push_back(std::move(unparsed));
        }
        for (auto& statement : statements) {
            result.statements.push_back(std::move(statement));
        }
    }
    return result;
}

NodePtr PythonParser::ParseExpression(const std::string& source, int line) {
    // Parenthesized so that newlines inside the field join.
    PythonLexer lexer("(" + source + ")");
    auto lexed = lexer.Tokenize();
    if (!lexed.ok || lexed.lines.size() != 1) {
        return nullptr;
    }
    auto& tokens = lexed.lines.front().tokens;
    for (auto& token : tokens) {
        token.line += line - 1;
    }
    try {
        LineParser parser(tokens, line);
        return parser.ParseWholeExpression();
    } catch (const ParseError&) {
        return nullptr;
    }
}

}  // namespace sandcell::safety
