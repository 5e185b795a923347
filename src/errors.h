#pragma once

#include <stdexcept>
#include <string>

namespace kisexpr {

// Base for every error raised by the engine. Carries the 1-based source
// position where one is known (0 otherwise).
class SexprError : public std::runtime_error {
public:
    SexprError(const std::string& msg, int line = 0, int column = 0);

    int line() const { return line_; }
    int column() const { return column_; }

private:
    int line_;
    int column_;
};

class SyntaxError : public SexprError {
public:
    enum Kind { UNTERMINATED_STRING, INVALID_CHARACTER };

    SyntaxError(Kind kind, const std::string& msg, int line, int column);

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

class ParseError : public SexprError {
public:
    enum Kind { UNEXPECTED_TOKEN, UNTERMINATED_LIST, NESTING_TOO_DEEP };

    ParseError(Kind kind, const std::string& msg, int line, int column);

    Kind kind() const { return kind_; }

private:
    Kind kind_;
};

// Raised by the get_required_* accessors when the token is absent and the
// caller supplied no default.
class MissingFieldError : public SexprError {
public:
    explicit MissingFieldError(const std::string& field);

    const std::string& field() const { return field_; }

private:
    std::string field_;
};

} // namespace kisexpr
