#include "corvo/lexer.hpp"
#include "corvo/error.hpp"

#include <cctype>
#include <cmath>
#include <cstdlib>
#include <string>

namespace corvo {

namespace {

struct Keyword {
    const char* text;
    TokKind kind;
};

// Multi-word phrases are matched before single words, so "is equal to"
// never lexes as `is` followed by an identifier.
struct Phrase {
    const char* words[3]; // unused trailing slots are null
    TokKind kind;
};

const Phrase kPhrases[] = {
    {{"is", "equal", "to"},     TokKind::IsEqualTo},
    {{"is", "greater", "than"}, TokKind::IsGreaterThan},
    {{"is", "less", "than"},    TokKind::IsLessThan},
    {{"remember", "as"},        TokKind::RememberAs},
    {{"read", "from"},          TokKind::ReadFrom},
    {{"read", "csv"},           TokKind::ReadCsv},
    {{"to", "csv"},             TokKind::ToCsv},
    {{"divided", "by"},         TokKind::DividedBy},
    {{"length", "of"},          TokKind::LengthOf},
    {{"count", "of"},           TokKind::CountOf},
};

const Keyword kKeywords[] = {
    {"the", TokKind::The},         {"is", TokKind::Is},
    {"display", TokKind::Display}, {"ask", TokKind::Ask},
    {"if", TokKind::If},           {"then", TokKind::Then},
    {"otherwise", TokKind::Otherwise},
    {"and", TokKind::And},         {"or", TokKind::Or},
    {"repeat", TokKind::Repeat},   {"loops", TokKind::Loops},
    {"while", TokKind::While},     {"do", TokKind::Do},
    {"for", TokKind::For},         {"each", TokKind::Each},
    {"in", TokKind::In},           {"write", TokKind::Write},
    {"to", TokKind::To},           {"set", TokKind::Set},
    {"row", TokKind::Row},         {"column", TokKind::Column},
    {"get", TokKind::Get},         {"from", TokKind::From},
    {"section", TokKind::Section}, {"append", TokKind::Append},
    {"remove", TokKind::Remove},   {"at", TokKind::At},
    {"plus", TokKind::Plus},       {"minus", TokKind::Minus},
    {"times", TokKind::Times},
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}
bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::string describe(const Token& t) {
    switch (t.kind) {
        case TokKind::End:      return "end of input";
        case TokKind::Word:     return "name '" + t.text + "'";
        case TokKind::Number:   return "number " + t.text;
        case TokKind::String:   return "string \"" + t.text + "\"";
        case TokKind::LBracket: return "'['";
        case TokKind::RBracket: return "']'";
        case TokKind::LParen:   return "'('";
        case TokKind::RParen:   return "')'";
        case TokKind::Comma:    return "','";
        case TokKind::Colon:    return "':'";
        default:                return "'" + t.text + "'";
    }
}

void Lexer::bump() {
    if (s_[i_] == '\n') {
        ++line_;
        col_ = 1;
    } else {
        ++col_;
    }
    ++i_;
}

void Lexer::skip_ws_and_comments() {
    while (!is_end()) {
        char c = s_[i_];
        if (std::isspace(static_cast<unsigned char>(c))) {
            bump();
        } else if (c == '#') {
            while (!is_end() && s_[i_] != '\n') bump();
        } else {
            break;
        }
    }
}

Token Lexer::next() {
    skip_ws_and_comments();
    Token t;
    t.line = line_;
    t.column = col_;
    if (is_end()) return t;

    char c = s_[i_];
    switch (c) {
        case '[': t.kind = TokKind::LBracket; break;
        case ']': t.kind = TokKind::RBracket; break;
        case '(': t.kind = TokKind::LParen; break;
        case ')': t.kind = TokKind::RParen; break;
        case ',': t.kind = TokKind::Comma; break;
        case ':': t.kind = TokKind::Colon; break;
        default: break;
    }
    if (t.kind != TokKind::End) {
        t.text = std::string(1, c);
        bump();
        return t;
    }

    if (c == '"') return string();
    if (std::isdigit(static_cast<unsigned char>(c))) return number();
    if (is_ident_start(c)) return word_or_keyword();

    throw SyntaxError(std::string("Unexpected character '") + c + "'", line_, col_);
}

Token Lexer::word_or_keyword() {
    Token t{TokKind::Word};
    t.line = line_;
    t.column = col_;

    auto read_word = [this]() {
        std::size_t start = i_;
        while (!is_end() && is_ident_char(s_[i_])) bump();
        return s_.substr(start, i_ - start);
    };

    std::string_view first = read_word();

    for (const auto& ph : kPhrases) {
        if (first != ph.words[0]) continue;

        // Tentatively match the remaining words; roll back on mismatch.
        std::size_t save_i = i_;
        int save_line = line_, save_col = col_;
        bool ok = true;
        for (std::size_t w = 1; w < 3 && ph.words[w]; ++w) {
            std::size_t gap = i_;
            while (!is_end() && (s_[i_] == ' ' || s_[i_] == '\t')) bump();
            if (i_ == gap || is_end() || !is_ident_start(s_[i_]) || read_word() != ph.words[w]) {
                ok = false;
                break;
            }
        }
        if (ok) {
            t.kind = ph.kind;
            t.text = std::string(s_.substr(save_i - first.size(), i_ - (save_i - first.size())));
            return t;
        }
        i_ = save_i;
        line_ = save_line;
        col_ = save_col;
    }

    t.text = std::string(first);
    for (const auto& kw : kKeywords) {
        if (first == kw.text) {
            t.kind = kw.kind;
            break;
        }
    }
    return t;
}

Token Lexer::number() {
    Token t{TokKind::Number};
    t.line = line_;
    t.column = col_;

    std::size_t start = i_;
    while (!is_end() && std::isdigit(static_cast<unsigned char>(s_[i_]))) bump();
    if (peek_char() == '.' && std::isdigit(static_cast<unsigned char>(peek_char(1)))) {
        bump();
        while (!is_end() && std::isdigit(static_cast<unsigned char>(s_[i_]))) bump();
    }
    if (!is_end() && is_ident_start(s_[i_])) {
        throw SyntaxError("Invalid number", t.line, t.column);
    }
    t.text = std::string(s_.substr(start, i_ - start));
    t.number = std::strtod(t.text.c_str(), nullptr);
    if (!std::isfinite(t.number)) throw SyntaxError("Number is too large", t.line, t.column);
    return t;
}

Token Lexer::string() {
    Token t{TokKind::String};
    t.line = line_;
    t.column = col_;

    bump(); // opening quote
    std::string out;
    for (;;) {
        if (is_end()) throw SyntaxError("Unterminated string", t.line, t.column);
        char c = s_[i_];
        if (c == '"') {
            bump();
            break;
        }
        if (c == '\\' && i_ + 1 < s_.size()) {
            char e = s_[i_ + 1];
            switch (e) {
                case 'n':  out.push_back('\n'); break;
                case 't':  out.push_back('\t'); break;
                case '"':  out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                default:   out.push_back('\\'); out.push_back(e); break;
            }
            bump();
            bump();
            continue;
        }
        out.push_back(c);
        bump();
    }
    t.text = std::move(out);
    return t;
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> out;
    for (;;) {
        Token t = next();
        bool done = t.kind == TokKind::End;
        out.push_back(std::move(t));
        if (done) break;
    }
    return out;
}

} // namespace corvo
