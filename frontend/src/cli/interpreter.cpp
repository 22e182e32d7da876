#include "interpreter.h"
#include "io_utils.h"

#include <iostream>

namespace metric {

Interpreter::Interpreter(const Options& opts) : options(opts) {}

PipelineResult Interpreter::run(std::ostream& out) {
    if (options.verbose) {
        std::cout << "Running: " << options.input_file << std::endl;
    }

    std::string source = read_text_file_or_throw(options.input_file);

    PipelineOptions pipeline_options;
    pipeline_options.filename = options.input_file;
    pipeline_options.verbose = options.verbose;
    pipeline_options.validate_style = options.validate_style;
    pipeline_options.check_only = options.check_only;

    PipelineResult result = run_pipeline(source, pipeline_options, out);

    if (options.verbose) {
        std::cout << (result.executed ? "Execution finished" : "Checks passed") << std::endl;
    }
    return result;
}

}
