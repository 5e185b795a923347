#include "errors.h"

namespace kisexpr {

static std::string with_position(const std::string& msg, int line, int column) {
    if (line <= 0) return msg;
    return msg + " at line " + std::to_string(line) + ", column " + std::to_string(column);
}

SexprError::SexprError(const std::string& msg, int line, int column)
    : std::runtime_error(with_position(msg, line, column))
    , line_(line)
    , column_(column) {}

SyntaxError::SyntaxError(Kind kind, const std::string& msg, int line, int column)
    : SexprError("syntax error: " + msg, line, column)
    , kind_(kind) {}

ParseError::ParseError(Kind kind, const std::string& msg, int line, int column)
    : SexprError("parse error: " + msg, line, column)
    , kind_(kind) {}

MissingFieldError::MissingFieldError(const std::string& field)
    : SexprError("required token '" + field + "' not found")
    , field_(field) {}

} // namespace kisexpr
