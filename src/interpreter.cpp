#include "corvo/interpreter.hpp"
#include "corvo/csv.hpp"
#include "corvo/error.hpp"
#include "corvo/io.hpp"
#include "corvo/parser.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <istream>
#include <ostream>
#include <utility>

namespace corvo {

// -----------------------------
// value coercions
// -----------------------------
namespace {

// "string \"abc\"", "number 3", "list" ... for error messages
std::string show(const Value& v) {
    if (std::holds_alternative<std::string>(v)) return fmt::format("string \"{}\"", std::get<std::string>(v));
    if (std::holds_alternative<double>(v)) return "number " + format_number(std::get<double>(v));
    return kind_name(v);
}

double as_number(const Value& v, const char* context) {
    if (const auto* d = std::get_if<double>(&v)) return *d;
    throw TypeMismatchError(fmt::format("{} needs a number but got {}", context, show(v)));
}

const std::string& as_string(const Value& v, const char* context) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    throw TypeMismatchError(fmt::format("{} needs a string but got {}", context, show(v)));
}

const ListPtr& as_list(const Value& v, const char* context) {
    if (const auto* l = std::get_if<ListPtr>(&v)) return *l;
    throw TypeMismatchError(fmt::format("{} needs a list but got {}", context, show(v)));
}

const TablePtr& as_table(const Value& v, const char* context) {
    if (const auto* t = std::get_if<TablePtr>(&v)) return *t;
    throw TypeMismatchError(fmt::format("{} needs a table but got {}", context, show(v)));
}

// 1-based user index -> 0-based position, bounds-checked against `size`.
std::size_t to_index(const Value& v, std::size_t size, const char* what) {
    double d = as_number(v, what);
    if (d != std::trunc(d)) {
        throw InvalidIndexError(fmt::format("{} {} is not a whole number", what, format_number(d)));
    }
    if (d < 1 || d > static_cast<double>(size)) {
        if (size == 0) throw InvalidIndexError(fmt::format("{} {} is out of range: there is nothing to index", what, format_number(d)));
        throw InvalidIndexError(fmt::format("{} {} is out of range (valid range is 1 to {})",
                                            what, format_number(d), size));
    }
    return static_cast<std::size_t>(d) - 1;
}

Value row_as_list(const std::vector<std::string>& row) {
    std::vector<Value> items(row.begin(), row.end());
    return make_list(std::move(items));
}

double checked(double r, BinOp op) {
    if (!std::isfinite(r)) {
        throw InvalidArgumentError(fmt::format("The result of '{}' is too large to represent", op_name(op)));
    }
    return r;
}

Value arithmetic(BinOp op, const Value& a, const Value& b) {
    if (op == BinOp::Plus && (std::holds_alternative<std::string>(a) || std::holds_alternative<std::string>(b))) {
        return to_display(a) + to_display(b);
    }

    const bool nums = std::holds_alternative<double>(a) && std::holds_alternative<double>(b);
    if (!nums) {
        throw TypeMismatchError(fmt::format("Cannot apply '{}' to {} and {}", op_name(op), show(a), show(b)));
    }
    double x = std::get<double>(a);
    double y = std::get<double>(b);
    switch (op) {
        case BinOp::Plus:  return checked(x + y, op);
        case BinOp::Minus: return checked(x - y, op);
        case BinOp::Times: return checked(x * y, op);
        case BinOp::Divide:
            if (y == 0.0) throw InvalidArgumentError(fmt::format("Division by zero ({} divided by 0)", format_number(x)));
            return checked(x / y, op);
        default: break;
    }
    throw TypeMismatchError(fmt::format("'{}' is not an arithmetic operator", op_name(op)));
}

bool compare(BinOp op, const Value& a, const Value& b) {
    const bool nums = std::holds_alternative<double>(a) && std::holds_alternative<double>(b);
    if (op == BinOp::IsEqual) {
        if (nums) return std::get<double>(a) == std::get<double>(b);
        if (std::holds_alternative<std::string>(a) && std::holds_alternative<std::string>(b)) {
            return std::get<std::string>(a) == std::get<std::string>(b);
        }
    } else if (nums) {
        double x = std::get<double>(a);
        double y = std::get<double>(b);
        return op == BinOp::IsGreater ? x > y : x < y;
    }
    throw TypeMismatchError(fmt::format("Cannot compare {} with {} using '{}'", show(a), show(b), op_name(op)));
}

struct DepthGuard {
    explicit DepthGuard(std::size_t& d) : d_(d) { ++d_; }
    ~DepthGuard() { --d_; }
    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;
    std::size_t& d_;
};

} // namespace

Interpreter::Interpreter(std::ostream& out, std::istream& in, Config cfg)
    : out_(out), in_(in), cfg_(cfg) {}

void Interpreter::run(const Program& program) {
    spdlog::debug("running program with {} top-level statements", program.statements.size());
    exec_block(program.statements);
}

void Interpreter::run_source(std::string_view source) {
    run(parse(source));
}

// -----------------------------
// statements
// -----------------------------
void Interpreter::exec_block(const Block& block) {
    for (const auto& s : block) exec(*s);
}

void Interpreter::exec(const Stmt& s) {
    line_ = s.line;
    spdlog::trace("line {}", s.line);
    try {
        std::visit([this](const auto& node) { exec_node(node); }, s.node);
    } catch (Error& e) {
        if (e.line() < 0) e.set_line(s.line);
        throw;
    }
}

void Interpreter::exec_node(const ast::Assign& s) {
    env_.set(s.name, evaluate(*s.value));
}

void Interpreter::exec_node(const ast::Display& s) {
    out_ << to_display(evaluate(*s.value)) << '\n';
}

void Interpreter::exec_node(const ast::Ask& s) {
    Value prompt = evaluate(*s.prompt);
    out_ << as_string(prompt, "ask") << std::flush;

    std::string line;
    if (!std::getline(in_, line)) {
        spdlog::warn("line {}: input ended before '{}' was answered; storing an empty string", line_, s.target);
        line.clear();
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();
    env_.set(s.target, std::move(line));
}

void Interpreter::exec_node(const ast::If& s) {
    if (test(*s.cond)) {
        exec_block(*s.then_block);
    } else if (s.else_block) {
        exec_block(*s.else_block);
    }
}

void Interpreter::exec_node(const ast::While& s) {
    const int line = line_;
    std::size_t n = 0;
    for (;;) {
        if (cfg_.while_limit != 0 && n >= cfg_.while_limit) {
            spdlog::warn("line {}: while loop stopped after {} iterations", line, n);
            break;
        }
        if (!test(*s.cond)) break;
        exec_block(*s.body);
        ++n;
    }
}

void Interpreter::exec_node(const ast::Repeat& s) {
    double c = as_number(evaluate(*s.count), "repeat");
    if (c < 0) throw InvalidArgumentError("Cannot repeat a negative number of times (" + format_number(c) + ")");
    if (c >= 18446744073709551616.0) { // 2^64
        throw InvalidArgumentError("Cannot repeat " + format_number(c) + " times: the count is too large");
    }

    auto times = static_cast<std::uint64_t>(std::trunc(c));
    for (std::uint64_t i = 0; i < times; ++i) exec_block(*s.body);
}

void Interpreter::exec_node(const ast::ForEach& s) {
    Value source = evaluate(*s.list);

    // Iterate a snapshot so the body may edit the list freely.
    std::vector<Value> items;
    if (const auto* l = std::get_if<ListPtr>(&source)) {
        items = (*l)->items;
    } else if (const auto* t = std::get_if<TablePtr>(&source)) {
        for (const auto& row : (*t)->rows) items.push_back(row_as_list(row));
    } else {
        throw TypeMismatchError("for each needs a list or table but got " + show(source));
    }

    for (auto& item : items) {
        env_.set(s.item, std::move(item));
        exec_block(*s.body);
    }
}

void Interpreter::exec_node(const ast::SectionDef& s) {
    spdlog::debug("line {}: section '{}' defined ({} statements)", line_, s.name, s.body->size());
    env_.define_section(s.name, s.body);
}

void Interpreter::exec_node(const ast::SectionCall& s) {
    BlockPtr body = env_.section(s.name);
    if (depth_ >= cfg_.max_call_depth) {
        throw RecursionLimitError(fmt::format("Section '{}' was called more than {} levels deep",
                                              s.name, cfg_.max_call_depth));
    }
    DepthGuard guard(depth_);
    spdlog::debug("line {}: entering section '{}' (depth {})", line_, s.name, depth_);
    exec_block(*body);
}

void Interpreter::exec_node(const ast::ListAppend& s) {
    Value target = evaluate(*s.list);
    const ListPtr& list = as_list(target, "append");
    list->items.push_back(deep_copy(evaluate(*s.value)));
}

void Interpreter::exec_node(const ast::ListRemove& s) {
    Value target = evaluate(*s.list);
    const ListPtr& list = as_list(target, "remove");
    Value v = evaluate(*s.value);

    auto& items = list->items;
    auto it = std::find_if(items.begin(), items.end(), [&](const Value& x) { return values_equal(x, v); });
    if (it == items.end()) {
        throw InvalidArgumentError("Cannot remove " + show(v) + ": it is not in the list");
    }
    items.erase(it);
}

void Interpreter::exec_node(const ast::FileWrite& s) {
    // Content is rendered before the file is touched.
    std::string text = to_display(evaluate(*s.content));
    Value path = evaluate(*s.path);
    write_text_file(as_string(path, "write"), text);
}

void Interpreter::exec_node(const ast::FileRead& s) {
    Value path = evaluate(*s.path);
    env_.set(s.target, read_text_file(as_string(path, "read from")));
}

void Interpreter::exec_node(const ast::CsvRead& s) {
    Value path = evaluate(*s.path);
    Table t = read_csv_file(as_string(path, "read csv"));
    env_.set(s.target, std::make_shared<Table>(std::move(t)));
}

void Interpreter::exec_node(const ast::CsvWrite& s) {
    Value data = evaluate(*s.table);
    Value path = evaluate(*s.path);
    const std::string& p = as_string(path, "write to csv");

    if (const auto* t = std::get_if<TablePtr>(&data)) {
        write_csv_file(**t, p);
        return;
    }

    // A list is written one element per row.
    const ListPtr& list = as_list(data, "write to csv");
    Table t;
    for (const auto& item : list->items) {
        std::vector<std::string> row;
        if (const auto* inner = std::get_if<ListPtr>(&item)) {
            for (const auto& cell : (*inner)->items) row.push_back(to_display(cell));
        } else {
            row.push_back(to_display(item));
        }
        t.rows.push_back(std::move(row));
    }
    write_csv_file(t, p);
}

void Interpreter::exec_node(const ast::CsvSetCell& s) {
    Value target = evaluate(*s.table);
    const TablePtr& table = as_table(target, "set");
    std::size_t r = to_index(evaluate(*s.row), table->row_count(), "Row");
    std::size_t c = to_index(evaluate(*s.column), table->column_count(), "Column");
    table->rows[r][c] = to_display(evaluate(*s.value));
}

// -----------------------------
// expressions
// -----------------------------
Value Interpreter::evaluate(const Expr& e) {
    return std::visit([this](const auto& node) { return eval_node(node); }, e.node);
}

bool Interpreter::test(const Expr& cond) {
    const auto* b = std::get_if<ast::Binary>(&cond.node);
    if (!b || !is_condition_op(b->op)) {
        throw TypeMismatchError("A condition must use 'is equal to', 'is greater than' or 'is less than'");
    }
    return test_node(*b);
}

bool Interpreter::test_node(const ast::Binary& b) {
    switch (b.op) {
        case BinOp::And: return test(*b.lhs) && test(*b.rhs);
        case BinOp::Or:  return test(*b.lhs) || test(*b.rhs);
        default: break;
    }
    Value l = evaluate(*b.lhs);
    Value r = evaluate(*b.rhs);
    return compare(b.op, l, r);
}

Value Interpreter::eval_node(const ast::Literal& e) {
    return e.value;
}

Value Interpreter::eval_node(const ast::VarRef& e) {
    return env_.get(e.name);
}

Value Interpreter::eval_node(const ast::Binary& e) {
    if (is_condition_op(e.op)) return test_node(e) ? 1.0 : 0.0;

    Value l = evaluate(*e.lhs);
    Value r = evaluate(*e.rhs);
    return arithmetic(e.op, l, r);
}

Value Interpreter::eval_node(const ast::ListLiteral& e) {
    std::vector<Value> items;
    items.reserve(e.items.size());
    for (const auto& item : e.items) items.push_back(deep_copy(evaluate(*item)));
    return make_list(std::move(items));
}

Value Interpreter::eval_node(const ast::IndexAccess& e) {
    Value target = evaluate(*e.target);
    Value index = evaluate(*e.index);

    if (const auto* l = std::get_if<ListPtr>(&target)) {
        return (*l)->items[to_index(index, (*l)->items.size(), "Index")];
    }
    if (const auto* t = std::get_if<TablePtr>(&target)) {
        return row_as_list((*t)->rows[to_index(index, (*t)->row_count(), "Row")]);
    }
    throw TypeMismatchError("'at' needs a list or table but got " + show(target));
}

Value Interpreter::eval_node(const ast::ListCount& e) {
    Value target = evaluate(*e.target);
    if (const auto* l = std::get_if<ListPtr>(&target)) return static_cast<double>((*l)->items.size());
    if (const auto* t = std::get_if<TablePtr>(&target)) return static_cast<double>((*t)->row_count());
    throw TypeMismatchError("count of needs a list or table but got " + show(target));
}

Value Interpreter::eval_node(const ast::Length& e) {
    Value target = evaluate(*e.target);
    if (const auto* s = std::get_if<std::string>(&target)) return static_cast<double>(s->size());
    if (const auto* l = std::get_if<ListPtr>(&target)) return static_cast<double>((*l)->items.size());
    if (const auto* t = std::get_if<TablePtr>(&target)) return static_cast<double>((*t)->row_count());
    if (const auto* d = std::get_if<double>(&target)) return static_cast<double>(format_number(*d).size());
    throw TypeMismatchError("length of needs a value but got " + show(target));
}

Value Interpreter::eval_node(const ast::ColumnAccess& e) {
    Value target = evaluate(*e.table);
    const TablePtr& table = as_table(target, "get column");
    std::size_t c = to_index(evaluate(*e.column), table->column_count(), "Column");

    std::vector<Value> column;
    column.reserve(table->row_count());
    for (const auto& row : table->rows) column.emplace_back(row[c]);
    return make_list(std::move(column));
}

Value Interpreter::eval_node(const ast::CellAccess& e) {
    Value target = evaluate(*e.table);
    const TablePtr& table = as_table(target, "get row ... column");
    std::size_t r = to_index(evaluate(*e.row), table->row_count(), "Row");
    std::size_t c = to_index(evaluate(*e.column), table->column_count(), "Column");
    return table->rows[r][c];
}

} // namespace corvo
