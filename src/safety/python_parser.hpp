#pragma once

#include <string>
#include <vector>

#include "safety/python_ast.hpp"

namespace sandcell::safety {

struct ParseResult {
    bool ok = true;
    std::string error;
    int error_line = 0;
    std::vector<Statement> statements;
};

// Statement-level parser for the subset of Python needed to inspect
// imports, calls and attribute access. Block structure is not tracked:
// each logical line is parsed on its own, so indentation errors are left
// to the interpreter. A line that does not parse becomes kUnparsed.
class PythonParser {
public:
    static ParseResult Parse(const std::string& source);

    // Parses a single expression, e.g. an f-string replacement field.
    // Returns null when the text is not an expression.
    static NodePtr ParseExpression(const std::string& source, int line);
};

}  // namespace sandcell::safety
