#include "corvo/grammar.hpp"
#include "corvo/error.hpp"
#include "corvo/lexer.hpp"

#include <utility>

namespace corvo {

namespace {

bool is_comparator(TokKind k) {
    return k == TokKind::IsEqualTo || k == TokKind::IsGreaterThan || k == TokKind::IsLessThan;
}

ParseNode leaf(const char* rule, Token t) {
    return ParseNode{rule, std::move(t), {}};
}

// Recursive descent over the token stream. Each method consumes one sentence
// form and returns its node; nothing here interprets values.
class Grammar {
public:
    explicit Grammar(std::vector<Token> toks) : ts_(std::move(toks)) {}

    ParseNode program() {
        ParseNode root{"start", ts_.front(), {}};
        while (peek().kind != TokKind::End) {
            if (peek().kind == TokKind::RBracket) fail("Unmatched ']'");
            root.children.push_back(statement());
        }
        return root;
    }

private:
    const Token& peek(std::size_t ahead = 0) const {
        std::size_t j = i_ + ahead;
        return j < ts_.size() ? ts_[j] : ts_.back();
    }

    Token pop() {
        Token t = peek();
        if (i_ < ts_.size() - 1) ++i_;
        return t;
    }

    bool match(TokKind k) {
        if (peek().kind != k) return false;
        pop();
        return true;
    }

    [[noreturn]] void fail(const std::string& msg) const {
        throw SyntaxError(msg, peek().line, peek().column);
    }

    struct Nested {
        explicit Nested(int& d) : d_(d) { ++d_; }
        ~Nested() { --d_; }
        Nested(const Nested&) = delete;
        Nested& operator=(const Nested&) = delete;
        int& d_;
    };

    // Statements and primaries are the only places the grammar recurses.
    Nested nest() {
        if (depth_ >= kMaxNesting) fail("Blocks nested too deeply");
        return Nested(depth_);
    }

    Token expect(TokKind k, const char* what) {
        if (peek().kind != k) fail(std::string("Expected ") + what + " but found " + describe(peek()));
        return pop();
    }

    // ---- statements ----
    ParseNode statement() {
        auto nested = nest();
        const Token& t = peek();
        switch (t.kind) {
            case TokKind::The: {
                ParseNode n{"assignment", pop(), {}};
                n.children.push_back(leaf("word", expect(TokKind::Word, "a variable name after 'the'")));
                expect(TokKind::Is, "'is'");
                n.children.push_back(expr());
                return n;
            }
            case TokKind::Display: {
                ParseNode n{"display", pop(), {}};
                n.children.push_back(expr());
                return n;
            }
            case TokKind::Ask: {
                ParseNode n{"input", pop(), {}};
                n.children.push_back(expr());
                expect(TokKind::RememberAs, "'remember as'");
                n.children.push_back(leaf("word", expect(TokKind::Word, "a variable name")));
                return n;
            }
            case TokKind::If: {
                Token kw = pop();
                ParseNode c = condition();
                expect(TokKind::Then, "'then'");
                ParseNode then_body = body();
                if (match(TokKind::Otherwise)) {
                    return ParseNode{"if_else", std::move(kw), {std::move(c), std::move(then_body), body()}};
                }
                return ParseNode{"if_only", std::move(kw), {std::move(c), std::move(then_body)}};
            }
            case TokKind::Repeat: {
                ParseNode n{"repeat", pop(), {}};
                n.children.push_back(expr());
                expect(TokKind::Loops, "'loops'");
                n.children.push_back(body());
                return n;
            }
            case TokKind::While: {
                ParseNode n{"while", pop(), {}};
                n.children.push_back(condition());
                expect(TokKind::Do, "'do'");
                n.children.push_back(body());
                return n;
            }
            case TokKind::For: {
                ParseNode n{"for_loop", pop(), {}};
                expect(TokKind::Each, "'each'");
                n.children.push_back(leaf("word", expect(TokKind::Word, "a loop variable name")));
                expect(TokKind::In, "'in'");
                n.children.push_back(expr());
                n.children.push_back(body());
                return n;
            }
            case TokKind::Section: {
                ParseNode n{"section_def", pop(), {}};
                n.children.push_back(leaf("word", expect(TokKind::Word, "a section name")));
                expect(TokKind::Is, "'is'");
                n.children.push_back(body());
                return n;
            }
            case TokKind::Append: {
                ParseNode n{"list_append", pop(), {}};
                n.children.push_back(expr());
                expect(TokKind::To, "'to'");
                n.children.push_back(expr());
                return n;
            }
            case TokKind::Remove: {
                ParseNode n{"list_remove", pop(), {}};
                n.children.push_back(expr());
                expect(TokKind::From, "'from'");
                n.children.push_back(expr());
                return n;
            }
            case TokKind::Write: {
                Token kw = pop();
                ParseNode first = expr();
                if (match(TokKind::ToCsv)) {
                    return ParseNode{"csv_write", std::move(kw), {std::move(first), expr()}};
                }
                expect(TokKind::To, "'to' or 'to csv'");
                return ParseNode{"write", std::move(kw), {std::move(first), expr()}};
            }
            case TokKind::ReadFrom:
            case TokKind::ReadCsv: {
                ParseNode n{t.kind == TokKind::ReadCsv ? "csv_read" : "read", pop(), {}};
                n.children.push_back(expr());
                expect(TokKind::RememberAs, "'remember as'");
                n.children.push_back(leaf("word", expect(TokKind::Word, "a variable name")));
                return n;
            }
            case TokKind::Set: {
                ParseNode n{"csv_set", pop(), {}};
                n.children.push_back(expr());
                expect(TokKind::Row, "'row'");
                n.children.push_back(expr());
                expect(TokKind::Column, "'column'");
                n.children.push_back(expr());
                expect(TokKind::To, "'to'");
                n.children.push_back(expr());
                return n;
            }
            case TokKind::Word: {
                Token name = pop();
                return ParseNode{"section_call", name, {leaf("word", name)}};
            }
            default:
                fail("Expected a statement but found " + describe(t));
        }
    }

    // [":"] "[" statement* "]"  |  statement
    ParseNode body() {
        bool colon = match(TokKind::Colon);
        if (peek().kind != TokKind::LBracket) {
            if (colon) fail("Expected '[' after ':' but found " + describe(peek()));
            return statement();
        }
        ParseNode n{"block", pop(), {}};
        while (peek().kind != TokKind::RBracket) {
            if (peek().kind == TokKind::End) {
                throw SyntaxError("Missing ']' for block opened here", n.token.line, n.token.column);
            }
            n.children.push_back(statement());
        }
        pop();
        return n;
    }

    // ---- conditions: or < and < comparison ----
    ParseNode condition() {
        ParseNode left = conjunction();
        while (peek().kind == TokKind::Or) {
            Token op = pop();
            left = ParseNode{"or", std::move(op), {std::move(left), conjunction()}};
        }
        return left;
    }

    ParseNode conjunction() {
        ParseNode left = comparison();
        while (peek().kind == TokKind::And) {
            Token op = pop();
            left = ParseNode{"and", std::move(op), {std::move(left), comparison()}};
        }
        return left;
    }

    ParseNode comparison() {
        ParseNode left = expr();
        if (!is_comparator(peek().kind)) {
            fail("Expected 'is equal to', 'is greater than' or 'is less than' but found " + describe(peek()));
        }
        Token op = pop();
        return ParseNode{"comparison", std::move(op), {std::move(left), expr()}};
    }

    // ---- expressions ----
    ParseNode expr() {
        ParseNode left = term();
        while (peek().kind == TokKind::Plus || peek().kind == TokKind::Minus) {
            Token op = pop();
            left = ParseNode{"binary", std::move(op), {std::move(left), term()}};
        }
        return left;
    }

    ParseNode term() {
        ParseNode left = postfix();
        while (peek().kind == TokKind::Times || peek().kind == TokKind::DividedBy) {
            Token op = pop();
            left = ParseNode{"binary", std::move(op), {std::move(left), postfix()}};
        }
        return left;
    }

    ParseNode postfix() {
        ParseNode left = primary();
        while (peek().kind == TokKind::At) {
            Token op = pop();
            left = ParseNode{"index_access", std::move(op), {std::move(left), primary()}};
        }
        return left;
    }

    ParseNode primary() {
        auto nested = nest();
        const Token& t = peek();
        switch (t.kind) {
            case TokKind::Number: return leaf("number", pop());
            case TokKind::String: return leaf("string", pop());
            case TokKind::Word:   return leaf("word", pop());
            case TokKind::LBracket: {
                ParseNode n{"list", pop(), {}};
                if (match(TokKind::RBracket)) return n;
                for (;;) {
                    n.children.push_back(expr());
                    if (match(TokKind::RBracket)) break;
                    if (peek().kind == TokKind::End) {
                        throw SyntaxError("Missing ']' for list opened here", n.token.line, n.token.column);
                    }
                    expect(TokKind::Comma, "',' or ']' in list");
                }
                return n;
            }
            case TokKind::LParen: {
                pop();
                ParseNode inner = expr();
                expect(TokKind::RParen, "')'");
                return inner;
            }
            case TokKind::LengthOf: {
                ParseNode n{"length", pop(), {}};
                n.children.push_back(postfix());
                return n;
            }
            case TokKind::CountOf: {
                ParseNode n{"count", pop(), {}};
                n.children.push_back(postfix());
                return n;
            }
            case TokKind::Get: {
                Token kw = pop();
                if (match(TokKind::Column)) {
                    ParseNode col = expr();
                    expect(TokKind::From, "'from'");
                    return ParseNode{"column_access", std::move(kw), {std::move(col), postfix()}};
                }
                expect(TokKind::Row, "'row' or 'column' after 'get'");
                ParseNode row = expr();
                if (match(TokKind::Column)) {
                    ParseNode col = expr();
                    expect(TokKind::From, "'from'");
                    return ParseNode{"cell_access", std::move(kw), {std::move(row), std::move(col), postfix()}};
                }
                expect(TokKind::From, "'column' or 'from'");
                return ParseNode{"row_access", std::move(kw), {std::move(row), postfix()}};
            }
            default:
                fail("Expected a value but found " + describe(t));
        }
    }

    std::vector<Token> ts_;
    std::size_t i_{0};
    int depth_{0};
};

void pretty_into(const ParseNode& n, int depth, std::string& out) {
    out.append(static_cast<std::size_t>(depth) * 2, ' ');
    out += n.rule;
    if (n.children.empty()) {
        out += ' ';
        out += describe(n.token);
    }
    out += '\n';
    for (const auto& c : n.children) pretty_into(c, depth + 1, out);
}

} // namespace

ParseNode parse_tree(std::string_view source) {
    Lexer lex(source);
    Grammar g(lex.tokenize());
    return g.program();
}

std::string pretty(const ParseNode& node) {
    std::string out;
    pretty_into(node, 0, out);
    return out;
}

} // namespace corvo
