#include "cli_utils.h"
#include "constants.h"

#include <cstring>
#include <iostream>

static void print_usage(const char* prog) {
    std::cout << "Metric Interpreter\n";
    std::cout << "Usage: " << prog << " [options] <program" << metric::SOURCE_FILE_EXTENSION << ">\n\n";
    std::cout << "Options:\n";
    std::cout << "  --check      Tokenize, validate, parse and type check without executing\n";
    std::cout << "  --no-style   Skip the style validator\n";
    std::cout << "  --no-color   Print diagnostics without ANSI colors\n";
    std::cout << "  --no-timing  Omit the execution time line\n";
    std::cout << "  -v           Verbose output\n";
    std::cout << "  -h           Show this help\n";
}

int main(int argc, char** argv) {
    metric::Interpreter::Options opts;

    for (int i = 1; i < argc; i++) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (metric::try_parse_interpreter_option(argv[i], opts)) {
            continue;
        } else if (argv[i][0] == '-') {
            std::cerr << "Error: Unknown option: " << argv[i] << "\n";
            return 1;
        } else {
            if (!opts.input_file.empty()) {
                std::cerr << "Error: Multiple input files specified ('" << opts.input_file
                          << "' and '" << argv[i] << "')\n";
                return 1;
            }
            opts.input_file = argv[i];
        }
    }

    if (opts.input_file.empty()) {
        std::cerr << "Error: No input file specified\n";
        print_usage(argv[0]);
        return 1;
    }

    return metric::run_interpreter_with_diagnostics(opts, std::cout, std::cerr);
}
