#pragma once

#include "node.h"
#include "tokenizer.h"

#include <string>
#include <vector>

namespace kisexpr {

struct ParseOptions {
    // Deepest list nesting accepted before NESTING_TOO_DEEP is raised.
    int max_depth = 512;
};

// Parse exactly one expression (a list or a bare atom). Throws SyntaxError
// or ParseError; nothing is returned on failure.
Node parse(const std::string& text, const ParseOptions& opts = {});
Node parse(Tokenizer& tokens, const ParseOptions& opts = {});
Node parse(const std::vector<Token>& tokens, const ParseOptions& opts = {});

// Parse text holding zero or more top-level expressions, with '#' comment
// lines (.kicad_dru style) removed first. Returns the synthetic list that
// wraps them; comment-only input yields "()".
Node parse_multi(const std::string& text, const ParseOptions& opts = {});

} // namespace kisexpr
