#pragma once

#include "geometry.h"
#include "node.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace kisexpr {

// Field extraction over named lists. Every lookup treats a non-list input as
// an empty list; nothing here performs I/O, and only the get_required_*
// family can throw (MissingFieldError).

// --- Lookup ---

// First direct child list whose head is Symbol(name), or nullptr.
const Node* find_token(const Node& list, const std::string& name);

// All direct child lists headed by Symbol(name), in document order.
std::vector<const Node*> find_all_tokens(const Node& list, const std::string& name);

bool has_token(const Node& list, const std::string& name);

// True iff a direct child atom is Symbol(name): bare flags such as
// `locked`, `hide`, `fields_autoplaced`.
bool has_symbol(const Node& list, const std::string& name);

// Positional access; nullptr (or fallback) when out of range.
const Node* get_value(const Node& list, size_t index);
const Node& get_value(const Node& list, size_t index, const Node& fallback);

// The child following a bare Symbol(name), e.g. `(pin_names offset 0.5)`.
const Node* get_symbol_value(const Node& list, const std::string& name);

bool validate_token_length(const Node* token, size_t min_length);

// --- Total coercions ---

// Symbol/String give their text, numbers their rendered form; lists nullopt.
std::optional<std::string> to_str(const Node* value);
// Numbers, or Symbol/String text holding a numeric literal.
std::optional<double> to_float(const Node* value);
// Integers, Floats (truncated toward zero) and integer text.
std::optional<int64_t> to_int(const Node* value);
// yes/true/1 and no/false/0.
std::optional<bool> to_bool(const Node* value);

inline std::optional<std::string> to_str(const Node& value) { return to_str(&value); }
inline std::optional<double> to_float(const Node& value) { return to_float(&value); }
inline std::optional<int64_t> to_int(const Node& value) { return to_int(&value); }
inline std::optional<bool> to_bool(const Node& value) { return to_bool(&value); }

std::string safe_get_str(const Node& list, size_t index, const std::string& default_val = "");
int64_t safe_get_int(const Node& list, size_t index, int64_t default_val = 0);
double safe_get_float(const Node& list, size_t index, double default_val = 0.0);

// --- Optional fields: nullopt when the token is absent or the slot is
// missing or not coercible ---

std::optional<std::string> get_optional_str(const Node& list, const std::string& name,
                                            size_t index = 1);
std::optional<double> get_optional_float(const Node& list, const std::string& name,
                                         size_t index = 1);
std::optional<int64_t> get_optional_int(const Node& list, const std::string& name,
                                        size_t index = 1);
std::optional<Position> get_optional_position(const Node& list, const std::string& name);

// true when the bare flag is present, nullopt otherwise.
std::optional<bool> get_optional_bool_flag(const Node& list, const std::string& name);

// `(name yes|no)`; a bare `name` flag or a value-less `(name)` reads as
// true (older file versions).
bool get_yes_no(const Node& list, const std::string& name, bool default_val = false);

// --- Required fields ---
// Token absent: the default if one was given, else MissingFieldError.
// Token present but the slot missing or not coercible: the default, or the
// type's zero value.

std::string get_required_str(const Node& list, const std::string& name,
                             const std::optional<std::string>& default_val = std::nullopt,
                             size_t index = 1);
double get_required_float(const Node& list, const std::string& name,
                          std::optional<double> default_val = std::nullopt,
                          size_t index = 1);
int64_t get_required_int(const Node& list, const std::string& name,
                         std::optional<int64_t> default_val = std::nullopt,
                         size_t index = 1);
Position get_required_position(const Node& list, const std::string& name,
                               const std::optional<Position>& default_val = std::nullopt);

Position get_position_with_default(const Node& list, const std::string& name,
                                   double default_x = 0.0, double default_y = 0.0);

// --- Closed enumerations ---

template <typename E>
struct EnumEntry {
    const char* name;
    E value;
};

// Map an atom onto a member of a closed table. Unknown or missing values
// return `fallback`, which lets readers accept tokens from newer or older
// file versions.
template <typename E, size_t N>
E parse_enum(const Node* value, const EnumEntry<E> (&table)[N], E fallback) {
    auto text = to_str(value);
    if (!text) return fallback;
    for (const auto& e : table) {
        if (*text == e.name) return e.value;
    }
    return fallback;
}

template <typename E, size_t N>
E parse_enum(const Node& value, const EnumEntry<E> (&table)[N], E fallback) {
    return parse_enum(&value, table, fallback);
}

// Enum read from a token slot, e.g. `(type dash)`.
template <typename E, size_t N>
E get_enum(const Node& list, const std::string& name, const EnumEntry<E> (&table)[N],
           E fallback, size_t index = 1) {
    const Node* token = find_token(list, name);
    if (!token) return fallback;
    return parse_enum(get_value(*token, index), table, fallback);
}

// Token text for a member; empty if the table lacks it.
template <typename E, size_t N>
std::string enum_name(E value, const EnumEntry<E> (&table)[N]) {
    for (const auto& e : table) {
        if (e.value == value) return e.name;
    }
    return "";
}

// --- Text compatibility ---

// "~" (old empty marker) becomes "", old overbar ~TEXT~ becomes ~{TEXT}.
std::string normalize_text(const std::string& text);

} // namespace kisexpr
