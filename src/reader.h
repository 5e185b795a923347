#pragma once

#include "node.h"
#include "parser.h"

#include <istream>
#include <string>
#include <vector>

namespace kisexpr {

struct ReaderOptions {
    ParseOptions parse;
    bool multi = false;    // several top-level expressions with '#' comments (.kicad_dru)
    bool verbose = false;
};

// Stream front-end for the parser. Failures are reported through warnings()
// and a false return; the output node is left untouched in that case.
class SexprReader {
public:
    explicit SexprReader(const ReaderOptions& opts = {});

    // Read the whole stream and parse it. Returns true on success.
    bool read(std::istream& in, Node& out);

    // Parse text already in memory.
    bool read_text(const std::string& text, Node& out);

    // Get any parse errors/warnings
    const std::vector<std::string>& warnings() const { return warnings_; }

private:
    ReaderOptions opts_;
    std::vector<std::string> warnings_;

    void log(const std::string& msg);
    void warn(const std::string& msg);
};

} // namespace kisexpr
