#pragma once

#include "evaluator.h"
#include "runtime_value.h"

#include <iostream>
#include <string>
#include <vector>

namespace metric {

struct PipelineOptions {
    std::string filename;        // Reported in source locations
    bool verbose = false;        // Print one line per stage
    bool validate_style = true;  // Run the style linter between tokenizing and parsing
    bool check_only = false;     // Stop after type checking
};

struct PipelineResult {
    std::vector<RuntimeValue> print_results;
    int64_t cost = 0;
    double elapsed_seconds = 0.0;  // Wall time spent in execution only
    bool executed = false;
};

// Runs tokenize -> validate_style -> parse -> type_check -> execute.
// Program output goes to out; stage errors propagate as CompileError.
PipelineResult run_pipeline(const std::string& source,
                            const PipelineOptions& options,
                            std::ostream& out = std::cout);

} // namespace metric
