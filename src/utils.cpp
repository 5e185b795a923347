#include "utils.h"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace kisexpr {

static bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool is_number_literal(const std::string& s) {
    size_t i = 0;
    const size_t n = s.size();
    if (i < n && (s[i] == '+' || s[i] == '-')) i++;

    size_t int_digits = 0;
    while (i < n && is_digit(s[i])) { i++; int_digits++; }

    size_t frac_digits = 0;
    if (i < n && s[i] == '.') {
        i++;
        while (i < n && is_digit(s[i])) { i++; frac_digits++; }
    }
    if (int_digits == 0 && frac_digits == 0) return false;

    if (i < n && (s[i] == 'e' || s[i] == 'E')) {
        i++;
        if (i < n && (s[i] == '+' || s[i] == '-')) i++;
        size_t exp_digits = 0;
        while (i < n && is_digit(s[i])) { i++; exp_digits++; }
        if (exp_digits == 0) return false;
    }
    return i == n;
}

bool is_float_literal(const std::string& s) {
    return s.find_first_of(".eE") != std::string::npos;
}

std::optional<int64_t> parse_int64(const std::string& s) {
    if (s.empty()) return std::nullopt;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') first++;
    int64_t value = 0;
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
    return value;
}

std::optional<double> parse_double(const std::string& s) {
    if (!is_number_literal(s)) return std::nullopt;
    const char* first = s.data();
    const char* last = s.data() + s.size();
    if (*first == '+') first++;
    double value = 0.0;
    auto res = std::from_chars(first, last, value);
    if (res.ec != std::errc() || res.ptr != last) return std::nullopt;
    return value;
}

std::string format_float_shortest(double val) {
    char buf[512];
    auto res = std::to_chars(buf, buf + sizeof(buf), val, std::chars_format::fixed);
    if (res.ec != std::errc()) {
        return format_float_fixed(val);
    }
    std::string s(buf, res.ptr);
    // inf and nan have no decimal form; they are written as-is
    if (s.find_first_not_of("+-0123456789") == std::string::npos) {
        s += ".0";
    }
    return s;
}

std::string format_float_fixed(double val, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << val;
    std::string s = oss.str();
    auto dot = s.find('.');
    if (dot != std::string::npos) {
        size_t last_nonzero = s.find_last_not_of('0');
        if (last_nonzero == dot) {
            s.erase(dot + 2); // keep one zero after the dot
        } else {
            s.erase(last_nonzero + 1);
        }
    } else if (s.find_first_not_of("+-0123456789") == std::string::npos) {
        s += ".0";
    }
    if (s == "-0.0") s = "0.0";
    return s;
}

std::string quote_string(const std::string& s) {
    std::string result;
    result.reserve(s.size() + 2);
    result += '"';
    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            default:   result += c;
        }
    }
    result += '"';
    return result;
}

std::string trim(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string strip_comment_lines(const std::string& text) {
    std::istringstream in(text);
    std::string out;
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

std::string wrap_expressions(const std::string& text) {
    return "(" + text + "\n)";
}

} // namespace kisexpr
