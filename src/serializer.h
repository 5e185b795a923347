#pragma once

#include "node.h"

#include <functional>
#include <ostream>
#include <set>
#include <string>

namespace kisexpr {

// Render strategy. Passed by value into render(); there is no global
// formatting state.
struct RenderOptions {
    // Multi-line KiCad layout; false puts every list on one line.
    bool pretty = true;
    // One indentation unit.
    std::string indent = "\t";
    // Head symbols of document roots that get a trailing blank line.
    std::set<std::string> root_tokens = {"kicad_symbol_lib"};
    // Float atom text; must always contain a '.' to keep Float apart from
    // Integer on the next parse. Unset means format_float_shortest.
    // Non-finite values have no KiCad spelling: they are written as the
    // bare words inf, -inf and nan, which read back as Symbols. Callers
    // that need a round trip must not store them in a Float.
    std::function<std::string(double)> format_float;
};

// Render a tree to text. Total: every tree renders, malformed ones included.
std::string render(const Node& node, const RenderOptions& opts = {});

// Render the children of a synthetic list (see parse_multi) one after the
// other, separated by newlines.
std::string render_multi(const Node& list, const RenderOptions& opts = {});

// Single-line rendering, mostly for diagnostics and test output.
std::ostream& operator<<(std::ostream& os, const Node& node);

} // namespace kisexpr
