#include "serializer.h"
#include "utils.h"

namespace kisexpr {

namespace {

class Renderer {
public:
    explicit Renderer(const RenderOptions& opts)
        : opts_(opts) {}

    std::string run(const Node& node) {
        out_.clear();
        write(node, 0);
        if (opts_.pretty && node.is_list() && opts_.root_tokens.count(node.head_name()) > 0) {
            out_ += '\n';
        }
        return out_;
    }

private:
    const RenderOptions& opts_;
    std::string out_;

    void write_atom(const Node& node) {
        switch (node.kind()) {
            case Node::SYMBOL:
                out_ += node.text();
                break;
            case Node::STRING:
                out_ += quote_string(node.text());
                break;
            case Node::INTEGER:
                out_ += std::to_string(node.int_value());
                break;
            case Node::FLOAT:
                out_ += opts_.format_float ? opts_.format_float(node.float_value())
                                           : format_float_shortest(node.float_value());
                break;
            case Node::LIST:
                break;
        }
    }

    void write_indent(int depth) {
        for (int i = 0; i < depth; i++) out_ += opts_.indent;
    }

    void write(const Node& node, int depth) {
        if (node.is_atom()) {
            write_atom(node);
            return;
        }

        const auto& items = node.children();
        if (items.empty()) {
            out_ += "()";
            return;
        }

        bool has_nested = false;
        for (size_t i = 1; i < items.size(); i++) {
            if (items[i].is_list()) {
                has_nested = true;
                break;
            }
        }

        out_ += '(';
        if (!opts_.pretty || !has_nested) {
            for (size_t i = 0; i < items.size(); i++) {
                if (i > 0) out_ += ' ';
                write(items[i], depth);
            }
            out_ += ')';
            return;
        }

        // Head plus the leading run of atoms stay on the opening line;
        // everything from the first nested list on gets its own line.
        write(items[0], depth);
        size_t i = 1;
        for (; i < items.size() && items[i].is_atom(); i++) {
            out_ += ' ';
            write_atom(items[i]);
        }
        for (; i < items.size(); i++) {
            out_ += '\n';
            write_indent(depth + 1);
            write(items[i], depth + 1);
        }
        out_ += '\n';
        write_indent(depth);
        out_ += ')';
    }
};

} // namespace

std::string render(const Node& node, const RenderOptions& opts) {
    Renderer r(opts);
    return r.run(node);
}

std::string render_multi(const Node& list, const RenderOptions& opts) {
    if (!list.is_list()) return render(list, opts);
    std::string result;
    for (size_t i = 0; i < list.size(); i++) {
        if (i > 0) result += '\n';
        result += render(list[i], opts);
    }
    return result;
}

std::ostream& operator<<(std::ostream& os, const Node& node) {
    RenderOptions opts;
    opts.pretty = false;
    return os << render(node, opts);
}

} // namespace kisexpr
