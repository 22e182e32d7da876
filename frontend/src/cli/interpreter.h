#pragma once
#include "frontend_pipeline.h"

#include <iostream>
#include <string>

namespace metric {

// Interpreter runs one Metric source file end to end:
// 1. Reading the source file
// 2. Tokenizing and style validation
// 3. Parsing and type checking
// 4. Execution with operation counting
class Interpreter {
public:
    struct Options {
        std::string input_file;   // Source file to run
        bool verbose;             // Enable verbose output
        bool check_only;          // Stop after type checking
        bool validate_style;      // Run the style linter
        bool color;               // Wrap diagnostics in ANSI red
        bool show_timing;         // Report execution time after the run

        Options() : verbose(false), check_only(false), validate_style(true),
                    color(true), show_timing(true) {}
    };

    Interpreter(const Options& opts);
    PipelineResult run(std::ostream& out = std::cout);

private:
    Options options;
};

}
