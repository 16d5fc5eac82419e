#pragma once

#include <memory>
#include <string>
#include <vector>

#include "safety/python_lexer.hpp"

namespace sandcell::safety {

enum class NodeKind {
    kName,
    kConstant,
    kJoinedStr,
    kAttribute,
    kCall,
    kKeyword,
    kSubscript,
    kSlice,
    kBinOp,
    kUnaryOp,
    kBoolOp,
    kCompare,
    kIfExp,
    kLambda,
    kTuple,
    kList,
    kSet,
    kDict,
    kComprehension,
    kStarred,
    kAwait,
    kYield,
    kNamedExpr
};

enum class ConstantKind {
    kNone,
    kString,
    kBytes,
    kNumber,
    kBool,
    kEllipsis
};

struct Node;
using NodePtr = std::unique_ptr<Node>;

// Child layout per kind:
//   Attribute      [object]            text = attribute name
//   Call           [func, args...]     keyword args are kKeyword, *a / **k are kStarred
//   Keyword        [value]             text = argument name
//   Subscript      [value, index]
//   Slice          [lower, upper, step] any of them may be null
//   BinOp/UnaryOp  operands            text = operator
//   BoolOp         operands            text = "and" | "or"
//   Compare        operands            text = operators separated by spaces
//   IfExp          [body, test, orelse]
//   Lambda         [body, defaults...]
//   Dict           [key, value, ...]   a **mapping entry is a single kStarred
//   Comprehension  [element(s), target, iter, conditions...] text = list|set|dict|gen
//   Starred        [value]             text = "*" | "**"
//   Await/Yield    [value]             value may be null
//   NamedExpr      [target, value]
struct Node {
    NodeKind kind = NodeKind::kName;
    int line = 0;
    std::string text;
    ConstantKind constant = ConstantKind::kNone;
    std::string value;
    std::vector<NodePtr> children;

    const Node* Child(std::size_t index) const {
        return index < children.size() ? children[index].get() : nullptr;
    }
    bool IsName(const std::string& id) const {
        return kind == NodeKind::kName && text == id;
    }
    bool IsStringConstant() const {
        return kind == NodeKind::kConstant && constant == ConstantKind::kString;
    }
};

inline NodePtr MakeNode(NodeKind kind, int line, std::string text = {}) {
    auto node = std::make_unique<Node>();
    node->kind = kind;
    node->line = line;
    node->text = std::move(text);
    return node;
}

enum class StatementKind {
    kImport,
    kImportFrom,
    kExpression,
    kUnparsed
};

struct ImportAlias {
    std::string name;
    std::string asname;
};

// One simple statement or compound-statement header. Imports carry their
// module names; everything else carries the expressions it evaluates
// (targets included). Lines the parser cannot handle keep their raw tokens.
struct Statement {
    StatementKind kind = StatementKind::kExpression;
    int line = 0;
    std::string module;
    int level = 0;
    std::vector<ImportAlias> names;
    std::vector<NodePtr> expressions;
    // Leading entries of `expressions` that are binding targets.
    std::size_t target_count = 0;
    std::vector<Token> tokens;
};

}  // namespace sandcell::safety
