#include "evaluator.h"
#include "evaluator_internal.h"

namespace metric {

namespace {

// Keeps the call depth balanced when a call unwinds through an exception.
class CallDepthGuard {
    int& depth;

public:
    explicit CallDepthGuard(int& d) : depth(d) { depth++; }
    ~CallDepthGuard() { depth--; }
};

} // namespace

RuntimeValue Evaluator::eval_call(const Environment& env, const ExprPtr& expr) {
    StmtPtr decl = env.get_function(expr->name);
    if (!decl) {
        throw EvaluationError("Undefined function: " + expr->name, expr->location);
    }

    std::vector<RuntimeValue> args;
    args.reserve(expr->args.size());
    for (const auto& arg : expr->args) {
        args.push_back(evaluate(env, arg));
    }
    if (args.size() != decl->params.size()) {
        throw EvaluationError("Function '" + expr->name + "' expects " + std::to_string(decl->params.size()) +
                              " arguments, got " + std::to_string(args.size()), expr->location);
    }

    // The call itself, separate from argument evaluation
    env.increment_cost();

    if (call_depth >= MAX_CALL_DEPTH) {
        throw EvaluationError("Maximum recursion depth exceeded in call to '" + expr->name + "'", expr->location);
    }
    CallDepthGuard guard(call_depth);

    // Callee sees its parameters and the function table, nothing else
    Environment local = env.child();
    for (size_t i = 0; i < args.size(); i++) {
        local = local.add(decl->params[i].name, args[i]);
    }

    // Output printed inside the body is written but not collected
    for (const auto& stmt : decl->body) {
        StmtOutcome outcome = execute_statement(local, stmt);
        if (outcome.kind == StmtOutcome::Kind::Returned) {
            return outcome.value;
        }
        local = std::move(outcome.env);
    }

    throw EvaluationError("Function '" + expr->name + "' did not return a value", expr->location);
}

}
