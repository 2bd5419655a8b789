#pragma once
#include <string>
#include <string_view>
#include <vector>

#include "corvo/token.hpp"

namespace corvo {

/// Untyped parse tree produced by the grammar. `rule` names the sentence
/// form ("assignment", "if_else", "binary", "number", ...); `token` is the
/// leading keyword, operator or leaf token of that form.
struct ParseNode {
    std::string rule;
    Token token{};
    std::vector<ParseNode> children{};

    int line() const { return token.line; }
};

/// Deepest nesting of blocks, brackets and parentheses the grammar accepts.
constexpr int kMaxNesting = 256;

/// Match `source` against the Corvo grammar. The root has rule "start" and one
/// child per top-level statement. Throws SyntaxError with line/column.
ParseNode parse_tree(std::string_view source);

/// Indented multi-line dump of a parse tree, one node per line.
std::string pretty(const ParseNode& node);

} // namespace corvo
