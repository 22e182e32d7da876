#include "cli_utils.h"
#include "common.h"
#include "constants.h"
#include "io_utils.h"

#include <cstring>
#include <iomanip>

namespace metric {

namespace {

constexpr const char* kAnsiRed = "\033[91m";
constexpr const char* kAnsiReset = "\033[0m";

void print_summary(const PipelineResult& result, const Interpreter::Options& opts, std::ostream& out) {
    if (!result.executed) {
        out << "OK" << std::endl;
        return;
    }
    if (opts.show_timing) {
        out << "Execution time: " << std::fixed << std::setprecision(4)
            << result.elapsed_seconds << " seconds" << std::endl;
    }
    out << "Operation count: " << result.cost << std::endl;
}

} // namespace

bool try_parse_interpreter_option(const char* arg, Interpreter::Options& opts) {
    if (std::strcmp(arg, "-v") == 0) {
        opts.verbose = true;
        return true;
    }
    if (std::strcmp(arg, "--check") == 0) {
        opts.check_only = true;
        return true;
    }
    if (std::strcmp(arg, "--no-style") == 0) {
        opts.validate_style = false;
        return true;
    }
    if (std::strcmp(arg, "--no-color") == 0) {
        opts.color = false;
        return true;
    }
    if (std::strcmp(arg, "--no-timing") == 0) {
        opts.show_timing = false;
        return true;
    }
    return false;
}

std::string format_diagnostic(const std::string& message, bool color) {
    if (!color) return message;
    return std::string(kAnsiRed) + message + kAnsiReset;
}

int run_interpreter_with_diagnostics(const Interpreter::Options& opts, std::ostream& out, std::ostream& err) {
    if (!has_source_extension(opts.input_file)) {
        err << format_diagnostic("Error: File '" + opts.input_file + "' does not have " +
                                 SOURCE_FILE_EXTENSION + " extension", opts.color) << "\n";
        err << "Metric programs should use the " << SOURCE_FILE_EXTENSION << " file extension\n";
        return 1;
    }

    try {
        Interpreter interpreter(opts);
        PipelineResult result = interpreter.run(out);
        print_summary(result, opts, out);
        return 0;
    } catch (const CompileError& e) {
        out.flush();
        if (e.location.line == 0) {
            err << format_diagnostic(std::string("Error: ") + e.what(), opts.color) << "\n";
        } else {
            err << format_diagnostic(e.formatted(), opts.color) << "\n";
        }
        return 1;
    } catch (const std::exception& e) {
        err << format_diagnostic(std::string("Error: ") + e.what(), opts.color) << "\n";
        return 1;
    }
}

} // namespace metric
