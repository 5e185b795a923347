#include "reader.h"
#include "errors.h"

#include <iostream>
#include <iterator>
#include <utility>

namespace kisexpr {

SexprReader::SexprReader(const ReaderOptions& opts)
    : opts_(opts) {}

bool SexprReader::read(std::istream& in, Node& out) {
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        warn("Failed to read input stream");
        return false;
    }
    return read_text(text, out);
}

bool SexprReader::read_text(const std::string& text, Node& out) {
    log("Input: " + std::to_string(text.size()) + " bytes");

    std::string body = text;
    if (body.size() >= 3 && body.compare(0, 3, "\xEF\xBB\xBF") == 0) {
        body.erase(0, 3);
        log("Skipped UTF-8 byte order mark");
    }

    try {
        Node root = opts_.multi ? parse_multi(body, opts_.parse) : parse(body, opts_.parse);
        if (opts_.multi) {
            log("Parsed " + std::to_string(root.size()) + " top-level expressions");
        } else if (!root.head_name().empty()) {
            log("Parsed (" + root.head_name() + ") with " +
                std::to_string(root.size() - 1) + " children");
        } else {
            log(std::string("Parsed a bare ") + kind_name(root.kind()));
        }
        out = std::move(root);
        return true;
    } catch (const SexprError& e) {
        warn(e.what());
        return false;
    }
}

void SexprReader::log(const std::string& msg) {
    if (opts_.verbose) {
        std::cerr << "[SEXPR] " << msg << std::endl;
    }
}

void SexprReader::warn(const std::string& msg) {
    warnings_.push_back(msg);
    std::cerr << "[WARNING] " << msg << std::endl;
}

} // namespace kisexpr
