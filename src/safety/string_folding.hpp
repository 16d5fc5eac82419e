#pragma once

#include <optional>
#include <string>

#include "safety/python_ast.hpp"

namespace sandcell::safety {

// Evaluates expressions built only from literals: concatenation, repetition,
// slicing, join, chr(<int>), bytes([...]), str/encode/decode and the common
// decoders (b64decode, bytes.fromhex, codecs.decode with rot13/hex/base64).
// Anything that depends on a runtime value yields nullopt.
std::optional<std::string> FoldString(const Node& node);

std::optional<long long> FoldInteger(const Node& node);

// Calls whose purpose is turning an encoded literal back into text.
bool IsDecodeCall(const Node& node);

// Number of chr(<int literal>) calls and byte-list literals with at least
// two integer codes found directly in a concatenation or join.
int CountCharacterCodes(const Node& node);

// Dotted rendering of a callee or attribute chain, e.g. "base64.b64decode".
std::string DescribeNode(const Node& node);

// The final name of a callee: "b64decode" for base64.b64decode(...).
std::string CalleeName(const Node& call);

}  // namespace sandcell::safety
