#include "node_json.h"
#include "reader.h"
#include "writer.h"

#include <iostream>
#include <string>

static void print_help() {
    std::cout << "Usage: kisexpr-fmt [options] < input > output\n"
              << "\n"
              << "Re-format KiCad S-expression text (.kicad_sym, .kicad_mod, .kicad_pcb,\n"
              << ".kicad_sch, .kicad_wks, .kicad_dru) the way KiCad writes it.\n"
              << "\n"
              << "Options:\n"
              << "  --compact             Render every list on one line\n"
              << "  --multi               Input holds several top-level expressions\n"
              << "                        and '#' comment lines (.kicad_dru)\n"
              << "  --export-json         Write the parsed tree as JSON\n"
              << "  --import-json         Read a JSON tree instead of S-expression text\n"
              << "  --max-depth <n>       Nesting limit for the parser (default 512)\n"
              << "  --verbose             Verbose output on stderr\n"
              << "  -h, --help            Show help\n";
}

int main(int argc, char* argv[]) {
    bool compact = false;
    bool multi = false;
    bool export_json = false;
    bool import_json = false;
    bool verbose = false;
    int max_depth = 512;

    // Parse arguments
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            print_help();
            return 0;
        } else if (arg == "--compact") {
            compact = true;
        } else if (arg == "--multi") {
            multi = true;
        } else if (arg == "--export-json") {
            export_json = true;
        } else if (arg == "--import-json") {
            import_json = true;
        } else if (arg == "--max-depth") {
            if (i + 1 >= argc) {
                std::cerr << "Error: --max-depth requires an argument\n";
                return 1;
            }
            std::string value = argv[++i];
            if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos ||
                value.size() > 6 || std::stoi(value) == 0) {
                std::cerr << "Error: --max-depth must be a positive number\n";
                return 1;
            }
            max_depth = std::stoi(value);
        } else if (arg == "--verbose") {
            verbose = true;
        } else {
            std::cerr << "Error: unknown option '" << arg << "'\n";
            print_help();
            return 1;
        }
    }

    kisexpr::Node root;

    if (import_json) {
        if (verbose) {
            std::cerr << "Importing from JSON\n";
        }
        if (!kisexpr::read_json(std::cin, root, max_depth)) {
            std::cerr << "Error: failed to parse JSON input\n";
            return 1;
        }
    } else {
        kisexpr::ReaderOptions reader_opts;
        reader_opts.parse.max_depth = max_depth;
        reader_opts.multi = multi;
        reader_opts.verbose = verbose;

        kisexpr::SexprReader reader(reader_opts);
        if (!reader.read(std::cin, root)) {
            std::cerr << "Error: failed to parse input\n";
            return 1;
        }
    }

    if (export_json) {
        kisexpr::write_json(std::cout, root, compact ? -1 : 2);
        return 0;
    }

    kisexpr::WriterOptions writer_opts;
    writer_opts.render.pretty = !compact;
    writer_opts.multi = multi;
    writer_opts.verbose = verbose;

    kisexpr::SexprWriter writer(writer_opts);
    if (!writer.write(std::cout, root)) {
        return 1;
    }
    return 0;
}
