#include <gtest/gtest.h>
#include <corvo/error.hpp>
#include <corvo/lexer.hpp>

#include <string>
#include <vector>

namespace {

using corvo::TokKind;

std::vector<TokKind> kinds(const std::string& src) {
    std::vector<TokKind> out;
    for (const auto& t : corvo::Lexer(src).tokenize()) out.push_back(t.kind);
    return out;
}

TEST(Lexer, PhrasesAreSingleTokens) {
    EXPECT_EQ(kinds("x is equal to 3"),
              (std::vector<TokKind>{TokKind::Word, TokKind::IsEqualTo, TokKind::Number, TokKind::End}));
    EXPECT_EQ(kinds("ask \"q\" remember as a"),
              (std::vector<TokKind>{TokKind::Ask, TokKind::String, TokKind::RememberAs, TokKind::Word,
                                    TokKind::End}));
    EXPECT_EQ(kinds("write t to csv p"),
              (std::vector<TokKind>{TokKind::Write, TokKind::Word, TokKind::ToCsv, TokKind::Word, TokKind::End}));
}

TEST(Lexer, PhraseToleratesExtraHorizontalSpace) {
    auto toks = corvo::Lexer("a is  greater\tthan b").tokenize();
    ASSERT_EQ(toks.size(), 4u);
    EXPECT_EQ(toks[1].kind, TokKind::IsGreaterThan);
}

TEST(Lexer, PartialPhraseFallsBackToWords) {
    // "count" without "of" is an ordinary name
    EXPECT_EQ(kinds("the count is 5"),
              (std::vector<TokKind>{TokKind::The, TokKind::Word, TokKind::Is, TokKind::Number, TokKind::End}));
    EXPECT_EQ(kinds("x is\nequal"),
              (std::vector<TokKind>{TokKind::Word, TokKind::Is, TokKind::Word, TokKind::End}));
}

TEST(Lexer, CommentsAndPositions) {
    auto toks = corvo::Lexer("display 1 # note\n  display 2").tokenize();
    ASSERT_EQ(toks.size(), 5u);
    EXPECT_EQ(toks[2].kind, TokKind::Display);
    EXPECT_EQ(toks[2].line, 2);
    EXPECT_EQ(toks[2].column, 3);
    EXPECT_EQ(toks[3].line, 2);
    EXPECT_DOUBLE_EQ(toks[3].number, 2.0);
}

TEST(Lexer, NumbersAndStrings) {
    auto toks = corvo::Lexer("3.25 \"a\\nb \\\"q\\\"\"").tokenize();
    ASSERT_EQ(toks.size(), 3u);
    EXPECT_DOUBLE_EQ(toks[0].number, 3.25);
    EXPECT_EQ(toks[1].kind, TokKind::String);
    EXPECT_EQ(toks[1].text, "a\nb \"q\"");
}

TEST(Lexer, Errors) {
    try {
        corvo::Lexer("display \"open").tokenize();
        FAIL() << "expected SyntaxError";
    } catch (const corvo::SyntaxError& e) {
        EXPECT_EQ(e.line(), 1);
        EXPECT_EQ(e.column, 9);
        EXPECT_EQ(std::string(e.what()), "Unterminated string");
    }

    EXPECT_THROW(corvo::Lexer("display 12abc").tokenize(), corvo::SyntaxError);

    try {
        corvo::Lexer("display " + std::string(400, '9')).tokenize();
        FAIL() << "expected SyntaxError";
    } catch (const corvo::SyntaxError& e) {
        EXPECT_EQ(std::string(e.what()), "Number is too large");
        EXPECT_EQ(e.column, 9);
    }
    EXPECT_DOUBLE_EQ(corvo::Lexer(std::string(300, '9')).tokenize()[0].number, 1e300);

    try {
        corvo::Lexer("display 1\ndisplay @").tokenize();
        FAIL() << "expected SyntaxError";
    } catch (const corvo::SyntaxError& e) {
        EXPECT_EQ(e.line(), 2);
        EXPECT_EQ(e.column, 9);
    }
}

} // namespace
