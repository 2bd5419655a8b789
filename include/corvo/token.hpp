#pragma once
#include <string>

namespace corvo {

enum class TokKind {
    Word,
    Number,
    String,

    LBracket, RBracket,
    LParen, RParen,
    Comma, Colon,
    End,

    // keywords
    The, Is, Display, Ask, RememberAs,
    If, Then, Otherwise, And, Or,
    IsEqualTo, IsGreaterThan, IsLessThan,
    Repeat, Loops, While, Do, For, Each, In,
    Write, To, ToCsv, ReadFrom, ReadCsv,
    Set, Row, Column, Get, From,
    Section, Append, Remove,
    At, Plus, Minus, Times, DividedBy,
    LengthOf, CountOf,
};

struct Token {
    TokKind kind{TokKind::End};
    std::string text{}; // Word name / String contents / keyword spelling
    double number{0.0}; // Number
    int line{1};
    int column{1};
};

/// Human-readable spelling used in syntax error messages.
std::string describe(const Token& t);

} // namespace corvo
