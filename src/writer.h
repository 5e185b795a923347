#pragma once

#include "node.h"
#include "serializer.h"

#include <ostream>

namespace kisexpr {

struct WriterOptions {
    RenderOptions render;
    bool multi = false;    // node is a synthetic list of top-level expressions
    bool verbose = false;
};

class SexprWriter {
public:
    explicit SexprWriter(const WriterOptions& opts = {});

    // Render the tree to the stream. Returns false if the stream fails.
    bool write(std::ostream& out, const Node& node);

private:
    WriterOptions opts_;

    void log(const std::string& msg);
};

} // namespace kisexpr
