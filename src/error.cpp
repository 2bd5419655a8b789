#include "corvo/error.hpp"

#include <fmt/format.h>

namespace corvo {

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Syntax:            return "SyntaxError";
        case ErrorKind::UndefinedVariable: return "UndefinedVariableError";
        case ErrorKind::UndefinedSection:  return "UndefinedSectionError";
        case ErrorKind::TypeMismatch:      return "TypeMismatchError";
        case ErrorKind::InvalidIndex:      return "InvalidIndexError";
        case ErrorKind::InvalidArgument:   return "InvalidArgumentError";
        case ErrorKind::FileNotFound:      return "FileNotFoundError";
        case ErrorKind::FileAccess:        return "FileAccessError";
        case ErrorKind::MalformedCsv:      return "MalformedCsvError";
        case ErrorKind::RecursionLimit:    return "RecursionLimitError";
    }
    return "Error";
}

std::string format_error(const Error& e) {
    if (e.line() < 0) return fmt::format("{}: {}", error_kind_name(e.kind()), e.what());

    if (const auto* se = dynamic_cast<const SyntaxError*>(&e); se && se->column > 0) {
        return fmt::format("{} on line {}, column {}: {}",
                           error_kind_name(e.kind()), e.line(), se->column, e.what());
    }
    return fmt::format("{} on line {}: {}", error_kind_name(e.kind()), e.line(), e.what());
}

} // namespace corvo
