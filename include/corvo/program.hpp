#pragma once

#include <memory>
#include <string>
#include <variant>
#include <vector>

#include "corvo/value.hpp"

namespace corvo {

enum class BinOp {
    Plus,
    Minus,
    Times,
    Divide,
    IsEqual,
    IsGreater,
    IsLess,
    And,
    Or,
};

const char* op_name(BinOp op) noexcept;
bool is_condition_op(BinOp op) noexcept;

struct Expr;
struct Stmt;
using ExprPtr  = std::shared_ptr<const Expr>;
using StmtPtr  = std::shared_ptr<const Stmt>;
using Block    = std::vector<StmtPtr>;
using BlockPtr = std::shared_ptr<const Block>;

namespace ast {

// ---- expressions ----
struct Literal     { Value value; };
struct VarRef      { std::string name; };
struct Binary      { BinOp op; ExprPtr lhs, rhs; };
struct ListLiteral { std::vector<ExprPtr> items; };
struct IndexAccess { ExprPtr target, index; };   // `x at i`, `get row i from t`
struct ListCount   { ExprPtr target; };          // `count of x`
struct Length      { ExprPtr target; };          // `length of x`
struct ColumnAccess{ ExprPtr table, column; };   // `get column c from t`
struct CellAccess  { ExprPtr table, row, column; };

// ---- statements ----
struct Assign      { std::string name; ExprPtr value; };
struct Display     { ExprPtr value; };
struct Ask         { ExprPtr prompt; std::string target; };
struct If          { ExprPtr cond; BlockPtr then_block; BlockPtr else_block; }; // else may be null
struct While       { ExprPtr cond; BlockPtr body; };
struct Repeat      { ExprPtr count; BlockPtr body; };
struct ForEach     { std::string item; ExprPtr list; BlockPtr body; };
struct SectionDef  { std::string name; BlockPtr body; };
struct SectionCall { std::string name; };
struct ListAppend  { ExprPtr list, value; };
struct ListRemove  { ExprPtr list, value; };
struct FileWrite   { ExprPtr content, path; };
struct FileRead    { ExprPtr path; std::string target; };
struct CsvRead     { ExprPtr path; std::string target; };
struct CsvWrite    { ExprPtr table, path; };
struct CsvSetCell  { ExprPtr table, row, column, value; };

} // namespace ast

struct Expr {
    using Node = std::variant<ast::Literal, ast::VarRef, ast::Binary, ast::ListLiteral,
                              ast::IndexAccess, ast::ListCount, ast::Length,
                              ast::ColumnAccess, ast::CellAccess>;
    Node node;
    int line{0};
};

struct Stmt {
    using Node = std::variant<ast::Assign, ast::Display, ast::Ask, ast::If, ast::While,
                              ast::Repeat, ast::ForEach, ast::SectionDef, ast::SectionCall,
                              ast::ListAppend, ast::ListRemove, ast::FileWrite, ast::FileRead,
                              ast::CsvRead, ast::CsvWrite, ast::CsvSetCell>;
    Node node;
    int line{0};
};

template <class Node>
ExprPtr make_expr(Node n, int line) {
    return std::make_shared<const Expr>(Expr{Expr::Node{std::move(n)}, line});
}

template <class Node>
StmtPtr make_stmt(Node n, int line) {
    return std::make_shared<const Stmt>(Stmt{Stmt::Node{std::move(n)}, line});
}

/// A parsed program: the top-level statement sequence.
struct Program {
    Block statements;
};

} // namespace corvo
