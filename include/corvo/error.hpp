#pragma once

#include <stdexcept>
#include <string>

namespace corvo {

enum class ErrorKind {
    Syntax,
    UndefinedVariable,
    UndefinedSection,
    TypeMismatch,
    InvalidIndex,
    InvalidArgument,
    FileNotFound,
    FileAccess,
    MalformedCsv,
    RecursionLimit,
};

/// Base of every failure the engine reports. `line` is -1 until the
/// statement that raised it stamps its own source line.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& msg, int line = -1)
        : std::runtime_error(msg), kind_(kind), line_(line) {}

    ErrorKind kind() const noexcept { return kind_; }
    int line() const noexcept { return line_; }
    void set_line(int line) noexcept { line_ = line; }

private:
    ErrorKind kind_;
    int line_;
};

struct SyntaxError : Error {
    SyntaxError(const std::string& msg, int line = -1, int column = -1)
        : Error(ErrorKind::Syntax, msg, line), column(column) {}
    int column;
};

struct UndefinedVariableError : Error {
    explicit UndefinedVariableError(const std::string& msg) : Error(ErrorKind::UndefinedVariable, msg) {}
};

struct UndefinedSectionError : Error {
    explicit UndefinedSectionError(const std::string& msg) : Error(ErrorKind::UndefinedSection, msg) {}
};

struct TypeMismatchError : Error {
    explicit TypeMismatchError(const std::string& msg) : Error(ErrorKind::TypeMismatch, msg) {}
};

struct InvalidIndexError : Error {
    explicit InvalidIndexError(const std::string& msg) : Error(ErrorKind::InvalidIndex, msg) {}
};

struct InvalidArgumentError : Error {
    explicit InvalidArgumentError(const std::string& msg) : Error(ErrorKind::InvalidArgument, msg) {}
};

struct FileNotFoundError : Error {
    explicit FileNotFoundError(const std::string& msg) : Error(ErrorKind::FileNotFound, msg) {}
};

struct FileAccessError : Error {
    explicit FileAccessError(const std::string& msg) : Error(ErrorKind::FileAccess, msg) {}
};

struct MalformedCsvError : Error {
    explicit MalformedCsvError(const std::string& msg) : Error(ErrorKind::MalformedCsv, msg) {}
};

struct RecursionLimitError : Error {
    explicit RecursionLimitError(const std::string& msg) : Error(ErrorKind::RecursionLimit, msg) {}
};

const char* error_kind_name(ErrorKind kind) noexcept;

/// One-line message for the user: "<Kind> on line <n>: <message>".
std::string format_error(const Error& e);

} // namespace corvo
