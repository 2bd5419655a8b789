#include "corvo/parser.hpp"
#include "corvo/error.hpp"

#include <utility>

namespace corvo {

const char* op_name(BinOp op) noexcept {
    switch (op) {
        case BinOp::Plus:      return "plus";
        case BinOp::Minus:     return "minus";
        case BinOp::Times:     return "times";
        case BinOp::Divide:    return "divided by";
        case BinOp::IsEqual:   return "is equal to";
        case BinOp::IsGreater: return "is greater than";
        case BinOp::IsLess:    return "is less than";
        case BinOp::And:       return "and";
        case BinOp::Or:        return "or";
    }
    return "?";
}

bool is_condition_op(BinOp op) noexcept {
    return op == BinOp::IsEqual || op == BinOp::IsGreater || op == BinOp::IsLess ||
           op == BinOp::And || op == BinOp::Or;
}

namespace {

[[noreturn]] void malformed(const ParseNode& n) {
    throw SyntaxError("Malformed '" + n.rule + "' node", n.line(), n.token.column);
}

const ParseNode& child(const ParseNode& n, std::size_t i) {
    if (i >= n.children.size()) malformed(n);
    return n.children[i];
}

const std::string& word(const ParseNode& n) {
    if (n.rule != "word") malformed(n);
    return n.token.text;
}

BinOp binop_for(const ParseNode& n) {
    switch (n.token.kind) {
        case TokKind::Plus:          return BinOp::Plus;
        case TokKind::Minus:         return BinOp::Minus;
        case TokKind::Times:         return BinOp::Times;
        case TokKind::DividedBy:     return BinOp::Divide;
        case TokKind::IsEqualTo:     return BinOp::IsEqual;
        case TokKind::IsGreaterThan: return BinOp::IsGreater;
        case TokKind::IsLessThan:    return BinOp::IsLess;
        case TokKind::And:           return BinOp::And;
        case TokKind::Or:            return BinOp::Or;
        default:                     malformed(n);
    }
}

StmtPtr build_stmt(const ParseNode& n);

ExprPtr build_expr(const ParseNode& n) {
    const int line = n.line();
    const std::string& r = n.rule;

    if (r == "number") return make_expr(ast::Literal{Value{n.token.number}}, line);
    if (r == "string") return make_expr(ast::Literal{Value{n.token.text}}, line);
    if (r == "word")   return make_expr(ast::VarRef{n.token.text}, line);

    if (r == "binary" || r == "comparison" || r == "and" || r == "or") {
        return make_expr(ast::Binary{binop_for(n), build_expr(child(n, 0)), build_expr(child(n, 1))}, line);
    }
    if (r == "list") {
        ast::ListLiteral lit;
        lit.items.reserve(n.children.size());
        for (const auto& c : n.children) lit.items.push_back(build_expr(c));
        return make_expr(std::move(lit), line);
    }
    if (r == "index_access") {
        return make_expr(ast::IndexAccess{build_expr(child(n, 0)), build_expr(child(n, 1))}, line);
    }
    if (r == "row_access") {
        // get row R from T  ==  T at R
        return make_expr(ast::IndexAccess{build_expr(child(n, 1)), build_expr(child(n, 0))}, line);
    }
    if (r == "count")  return make_expr(ast::ListCount{build_expr(child(n, 0))}, line);
    if (r == "length") return make_expr(ast::Length{build_expr(child(n, 0))}, line);
    if (r == "column_access") {
        return make_expr(ast::ColumnAccess{build_expr(child(n, 1)), build_expr(child(n, 0))}, line);
    }
    if (r == "cell_access") {
        return make_expr(ast::CellAccess{build_expr(child(n, 2)), build_expr(child(n, 0)),
                                         build_expr(child(n, 1))}, line);
    }
    malformed(n);
}

BlockPtr build_block(const ParseNode& n) {
    auto block = std::make_shared<Block>();
    if (n.rule == "block") {
        block->reserve(n.children.size());
        for (const auto& c : n.children) block->push_back(build_stmt(c));
    } else {
        block->push_back(build_stmt(n)); // single-line body
    }
    return block;
}

StmtPtr build_stmt(const ParseNode& n) {
    const int line = n.line();
    const std::string& r = n.rule;

    if (r == "assignment") return make_stmt(ast::Assign{word(child(n, 0)), build_expr(child(n, 1))}, line);
    if (r == "display")    return make_stmt(ast::Display{build_expr(child(n, 0))}, line);
    if (r == "input")      return make_stmt(ast::Ask{build_expr(child(n, 0)), word(child(n, 1))}, line);
    if (r == "if_only") {
        return make_stmt(ast::If{build_expr(child(n, 0)), build_block(child(n, 1)), nullptr}, line);
    }
    if (r == "if_else") {
        return make_stmt(ast::If{build_expr(child(n, 0)), build_block(child(n, 1)), build_block(child(n, 2))},
                         line);
    }
    if (r == "repeat") return make_stmt(ast::Repeat{build_expr(child(n, 0)), build_block(child(n, 1))}, line);
    if (r == "while")  return make_stmt(ast::While{build_expr(child(n, 0)), build_block(child(n, 1))}, line);
    if (r == "for_loop") {
        return make_stmt(ast::ForEach{word(child(n, 0)), build_expr(child(n, 1)), build_block(child(n, 2))},
                         line);
    }
    if (r == "section_def")  return make_stmt(ast::SectionDef{word(child(n, 0)), build_block(child(n, 1))}, line);
    if (r == "section_call") return make_stmt(ast::SectionCall{word(child(n, 0))}, line);

    // append/remove are written value-first: `append V to L`
    if (r == "list_append") {
        return make_stmt(ast::ListAppend{build_expr(child(n, 1)), build_expr(child(n, 0))}, line);
    }
    if (r == "list_remove") {
        return make_stmt(ast::ListRemove{build_expr(child(n, 1)), build_expr(child(n, 0))}, line);
    }
    if (r == "write")     return make_stmt(ast::FileWrite{build_expr(child(n, 0)), build_expr(child(n, 1))}, line);
    if (r == "csv_write") return make_stmt(ast::CsvWrite{build_expr(child(n, 0)), build_expr(child(n, 1))}, line);
    if (r == "read")      return make_stmt(ast::FileRead{build_expr(child(n, 0)), word(child(n, 1))}, line);
    if (r == "csv_read")  return make_stmt(ast::CsvRead{build_expr(child(n, 0)), word(child(n, 1))}, line);
    if (r == "csv_set") {
        return make_stmt(ast::CsvSetCell{build_expr(child(n, 0)), build_expr(child(n, 1)),
                                         build_expr(child(n, 2)), build_expr(child(n, 3))}, line);
    }
    malformed(n);
}

} // namespace

Program build_program(const ParseNode& root) {
    if (root.rule != "start") malformed(root);
    Program p;
    p.statements.reserve(root.children.size());
    for (const auto& c : root.children) p.statements.push_back(build_stmt(c));
    return p;
}

Program parse(std::string_view source) {
    return build_program(parse_tree(source));
}

} // namespace corvo
