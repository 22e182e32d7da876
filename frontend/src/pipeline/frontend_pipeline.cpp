#include "frontend_pipeline.h"

#include "lexer.h"
#include "parser.h"
#include "style_validator.h"
#include "typechecker.h"

#include <chrono>

namespace metric {

PipelineResult run_pipeline(const std::string& source,
                            const PipelineOptions& options,
                            std::ostream& out) {
    PipelineResult result;

    if (options.verbose) std::cout << "Tokenizing..." << std::endl;
    std::vector<Token> tokens = tokenize(source, options.filename);

    if (options.validate_style) {
        if (options.verbose) std::cout << "Validating style..." << std::endl;
        validate_style(source, tokens);
    }

    if (options.verbose) std::cout << "Parsing..." << std::endl;
    std::vector<StmtPtr> program = parse(tokens);

    if (options.verbose) std::cout << "Type checking..." << std::endl;
    type_check(program);

    if (options.check_only) {
        return result;
    }

    if (options.verbose) std::cout << "Executing..." << std::endl;
    auto start = std::chrono::steady_clock::now();
    ExecutionResult execution = execute(program, out);
    auto end = std::chrono::steady_clock::now();

    result.print_results = std::move(execution.print_results);
    result.cost = execution.cost;
    result.elapsed_seconds = std::chrono::duration<double>(end - start).count();
    result.executed = true;
    return result;
}

} // namespace metric
