#include "writer.h"

#include <iostream>

namespace kisexpr {

SexprWriter::SexprWriter(const WriterOptions& opts)
    : opts_(opts) {}

bool SexprWriter::write(std::ostream& out, const Node& node) {
    std::string text = opts_.multi ? render_multi(node, opts_.render)
                                   : render(node, opts_.render);
    out << text;
    out.flush();
    if (!out.good()) {
        std::cerr << "Error: failed to write output" << std::endl;
        return false;
    }

    log("Wrote " + std::to_string(text.size()) + " bytes" +
        (opts_.render.pretty ? "" : " (compact)"));
    return true;
}

void SexprWriter::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[SEXPR] " << msg << std::endl;
    }
}

} // namespace kisexpr
