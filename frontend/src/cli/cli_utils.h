#pragma once

#include "interpreter.h"

#include <ostream>
#include <string>

namespace metric {

// Applies arg to opts when it is an interpreter flag. Returns false for
// anything else so the caller can treat it as an input file or an error.
bool try_parse_interpreter_option(const char* arg, Interpreter::Options& opts);

std::string format_diagnostic(const std::string& message, bool color);

// Runs the interpreter, prints the execution summary to out and any
// diagnostic to err. Returns the process exit status.
int run_interpreter_with_diagnostics(const Interpreter::Options& opts, std::ostream& out, std::ostream& err);

} // namespace metric
