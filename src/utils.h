#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace kisexpr {

// Numeric literal classification used by the tokenizer:
// [+-]?(digits(.digits?)?|.digits)([eE][+-]?digits)?
bool is_number_literal(const std::string& s);

// True if the literal carries a '.' or an exponent (i.e. reads as Float).
bool is_float_literal(const std::string& s);

// Whole-string conversions; nullopt on any trailing garbage or overflow.
std::optional<int64_t> parse_int64(const std::string& s);
std::optional<double> parse_double(const std::string& s);

// Shortest decimal text that reads back to the same double, fixed notation,
// always with a '.' (2 -> "2.0", 1e-5 -> "0.00001"). Infinity and NaN
// come out as "inf", "-inf" and "nan" with no '.'.
std::string format_float_shortest(double val);

// Fixed notation with at most `precision` decimals, trailing zeros trimmed
// down to ".0"; "-0.0" is written as "0.0".
std::string format_float_fixed(double val, int precision = 6);

// Quote and escape a string atom: '"' and '\' are backslash-escaped,
// LF and CR become \n and \r.
std::string quote_string(const std::string& s);

// Trim whitespace
std::string trim(const std::string& s);

// Drop empty lines and lines whose first non-blank character is '#'.
std::string strip_comment_lines(const std::string& text);

// Surround text with parentheses so several top-level expressions read as
// one list.
std::string wrap_expressions(const std::string& text);

} // namespace kisexpr
