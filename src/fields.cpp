#include "fields.h"
#include "errors.h"
#include "utils.h"

#include <cmath>
#include <regex>

namespace kisexpr {

// --- Lookup ---

const Node* find_token(const Node& list, const std::string& name) {
    if (!list.is_list()) return nullptr;
    for (const auto& item : list) {
        if (item.is_token(name)) return &item;
    }
    return nullptr;
}

std::vector<const Node*> find_all_tokens(const Node& list, const std::string& name) {
    std::vector<const Node*> results;
    if (!list.is_list()) return results;
    for (const auto& item : list) {
        if (item.is_token(name)) results.push_back(&item);
    }
    return results;
}

bool has_token(const Node& list, const std::string& name) {
    return find_token(list, name) != nullptr;
}

bool has_symbol(const Node& list, const std::string& name) {
    if (!list.is_list()) return false;
    for (const auto& item : list) {
        if (item.is_symbol(name)) return true;
    }
    return false;
}

const Node* get_value(const Node& list, size_t index) {
    if (!list.is_list() || index >= list.size()) return nullptr;
    return &list[index];
}

const Node& get_value(const Node& list, size_t index, const Node& fallback) {
    const Node* v = get_value(list, index);
    return v ? *v : fallback;
}

const Node* get_symbol_value(const Node& list, const std::string& name) {
    if (!list.is_list()) return nullptr;
    for (size_t i = 0; i + 1 < list.size(); i++) {
        if (list[i].is_symbol(name)) return &list[i + 1];
    }
    return nullptr;
}

bool validate_token_length(const Node* token, size_t min_length) {
    return token && token->is_list() && token->size() >= min_length;
}

// --- Coercions ---

std::optional<std::string> to_str(const Node* value) {
    if (!value) return std::nullopt;
    switch (value->kind()) {
        case Node::SYMBOL:
        case Node::STRING:
            return value->text();
        case Node::INTEGER:
            return std::to_string(value->int_value());
        case Node::FLOAT:
            return format_float_shortest(value->float_value());
        case Node::LIST:
            break;
    }
    return std::nullopt;
}

std::optional<double> to_float(const Node* value) {
    if (!value) return std::nullopt;
    switch (value->kind()) {
        case Node::INTEGER:
            return static_cast<double>(value->int_value());
        case Node::FLOAT:
            return value->float_value();
        case Node::SYMBOL:
        case Node::STRING:
            return parse_double(trim(value->text()));
        case Node::LIST:
            break;
    }
    return std::nullopt;
}

std::optional<int64_t> to_int(const Node* value) {
    if (!value) return std::nullopt;
    switch (value->kind()) {
        case Node::INTEGER:
            return value->int_value();
        case Node::FLOAT: {
            double v = std::trunc(value->float_value());
            // 2^63 is exactly representable; anything at or beyond it overflows
            if (!std::isfinite(v) || v < -9223372036854775808.0 || v >= 9223372036854775808.0) {
                return std::nullopt;
            }
            return static_cast<int64_t>(v);
        }
        case Node::SYMBOL:
        case Node::STRING:
            return parse_int64(trim(value->text()));
        case Node::LIST:
            break;
    }
    return std::nullopt;
}

std::optional<bool> to_bool(const Node* value) {
    if (!value) return std::nullopt;
    if (value->is_integer()) {
        if (value->int_value() == 1) return true;
        if (value->int_value() == 0) return false;
        return std::nullopt;
    }
    if (value->is_symbol() || value->is_string()) {
        const std::string& s = value->text();
        if (s == "yes" || s == "true" || s == "1") return true;
        if (s == "no" || s == "false" || s == "0") return false;
    }
    return std::nullopt;
}

std::string safe_get_str(const Node& list, size_t index, const std::string& default_val) {
    return to_str(get_value(list, index)).value_or(default_val);
}

int64_t safe_get_int(const Node& list, size_t index, int64_t default_val) {
    return to_int(get_value(list, index)).value_or(default_val);
}

double safe_get_float(const Node& list, size_t index, double default_val) {
    return to_float(get_value(list, index)).value_or(default_val);
}

// --- Optional fields ---

std::optional<std::string> get_optional_str(const Node& list, const std::string& name,
                                            size_t index) {
    const Node* token = find_token(list, name);
    if (!token) return std::nullopt;
    return to_str(get_value(*token, index));
}

std::optional<double> get_optional_float(const Node& list, const std::string& name,
                                         size_t index) {
    const Node* token = find_token(list, name);
    if (!token) return std::nullopt;
    return to_float(get_value(*token, index));
}

std::optional<int64_t> get_optional_int(const Node& list, const std::string& name,
                                        size_t index) {
    const Node* token = find_token(list, name);
    if (!token) return std::nullopt;
    return to_int(get_value(*token, index));
}

std::optional<Position> get_optional_position(const Node& list, const std::string& name) {
    const Node* token = find_token(list, name);
    if (!token) return std::nullopt;
    if (token->size() >= 2 && (*token)[1].is_token("xyz")) {
        const Node& xyz = (*token)[1];
        auto x = to_float(get_value(xyz, 1));
        auto y = to_float(get_value(xyz, 2));
        auto z = to_float(get_value(xyz, 3));
        if (!x || !y || !z) return std::nullopt;
        Position pos(*x, *y);
        pos.z = *z;
        return pos;
    }
    auto x = to_float(get_value(*token, 1));
    auto y = to_float(get_value(*token, 2));
    if (!x || !y) return std::nullopt;
    return Position(*x, *y, safe_get_float(*token, 3));
}

std::optional<bool> get_optional_bool_flag(const Node& list, const std::string& name) {
    if (has_symbol(list, name)) return true;
    return std::nullopt;
}

bool get_yes_no(const Node& list, const std::string& name, bool default_val) {
    if (const Node* token = find_token(list, name)) {
        if (token->size() < 2) return true;
        return to_bool(get_value(*token, 1)).value_or(default_val);
    }
    if (has_symbol(list, name)) return true;
    return default_val;
}

// --- Required fields ---

std::string get_required_str(const Node& list, const std::string& name,
                             const std::optional<std::string>& default_val, size_t index) {
    const Node* token = find_token(list, name);
    if (!token) {
        if (default_val) return *default_val;
        throw MissingFieldError(name);
    }
    return to_str(get_value(*token, index)).value_or(default_val.value_or(""));
}

double get_required_float(const Node& list, const std::string& name,
                          std::optional<double> default_val, size_t index) {
    const Node* token = find_token(list, name);
    if (!token) {
        if (default_val) return *default_val;
        throw MissingFieldError(name);
    }
    return to_float(get_value(*token, index)).value_or(default_val.value_or(0.0));
}

int64_t get_required_int(const Node& list, const std::string& name,
                         std::optional<int64_t> default_val, size_t index) {
    const Node* token = find_token(list, name);
    if (!token) {
        if (default_val) return *default_val;
        throw MissingFieldError(name);
    }
    return to_int(get_value(*token, index)).value_or(default_val.value_or(0));
}

Position get_required_position(const Node& list, const std::string& name,
                               const std::optional<Position>& default_val) {
    const Node* token = find_token(list, name);
    if (!token) {
        if (default_val) return *default_val;
        throw MissingFieldError(name);
    }
    return Position::from_node(*token);
}

Position get_position_with_default(const Node& list, const std::string& name,
                                   double default_x, double default_y) {
    const Node* token = find_token(list, name);
    if (!token) return Position(default_x, default_y);
    return Position(safe_get_float(*token, 1, default_x),
                    safe_get_float(*token, 2, default_y),
                    safe_get_float(*token, 3));
}

// --- Text compatibility ---

std::string normalize_text(const std::string& text) {
    if (text == "~") return "";
    static const std::regex old_overbar("~([^~{}]+)~");
    return std::regex_replace(text, old_overbar, "~{$1}");
}

} // namespace kisexpr
