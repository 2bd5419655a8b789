#pragma once

#include <cstddef>
#include <iosfwd>
#include <string_view>

#include "corvo/config.hpp"
#include "corvo/environment.hpp"
#include "corvo/program.hpp"

namespace corvo {

/// Tree-walking evaluator. `display` writes to `out`, `ask` reads lines from
/// `in`. Any corvo::Error aborts the run and propagates to the caller with
/// the failing statement's line attached.
class Interpreter {
public:
    Interpreter(std::ostream& out, std::istream& in, Config cfg = {});

    void run(const Program& program);

    /// parse + run.
    void run_source(std::string_view source);

    Value evaluate(const Expr& e);
    bool test(const Expr& cond);

    Environment& environment() noexcept { return env_; }
    const Environment& environment() const noexcept { return env_; }
    const Config& config() const noexcept { return cfg_; }

private:
    bool test_node(const ast::Binary& b);
    void exec_block(const Block& block);
    void exec(const Stmt& s);

    void exec_node(const ast::Assign& s);
    void exec_node(const ast::Display& s);
    void exec_node(const ast::Ask& s);
    void exec_node(const ast::If& s);
    void exec_node(const ast::While& s);
    void exec_node(const ast::Repeat& s);
    void exec_node(const ast::ForEach& s);
    void exec_node(const ast::SectionDef& s);
    void exec_node(const ast::SectionCall& s);
    void exec_node(const ast::ListAppend& s);
    void exec_node(const ast::ListRemove& s);
    void exec_node(const ast::FileWrite& s);
    void exec_node(const ast::FileRead& s);
    void exec_node(const ast::CsvRead& s);
    void exec_node(const ast::CsvWrite& s);
    void exec_node(const ast::CsvSetCell& s);

    Value eval_node(const ast::Literal& e);
    Value eval_node(const ast::VarRef& e);
    Value eval_node(const ast::Binary& e);
    Value eval_node(const ast::ListLiteral& e);
    Value eval_node(const ast::IndexAccess& e);
    Value eval_node(const ast::ListCount& e);
    Value eval_node(const ast::Length& e);
    Value eval_node(const ast::ColumnAccess& e);
    Value eval_node(const ast::CellAccess& e);

    std::ostream& out_;
    std::istream& in_;
    Config cfg_;
    Environment env_;
    std::size_t depth_{0};
    int line_{0}; // line of the statement being executed
};

} // namespace corvo
