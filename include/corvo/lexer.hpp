#pragma once
#include <string_view>
#include <vector>
#include "corvo/token.hpp"

namespace corvo {

class Lexer {
public:
    explicit Lexer(std::string_view s) : s_(s) {}

    /// Next token; throws SyntaxError on characters outside the language.
    Token next();

    /// Whole input, terminated by a single End token.
    std::vector<Token> tokenize();

private:
    void skip_ws_and_comments();
    bool is_end() const { return i_ >= s_.size(); }
    char peek_char(std::size_t ahead = 0) const {
        return i_ + ahead < s_.size() ? s_[i_ + ahead] : '\0';
    }
    void bump();

    Token word_or_keyword();
    Token number();
    Token string();

    std::string_view s_;
    std::size_t i_{0};
    int line_{1};
    int col_{1};
};

} // namespace corvo
