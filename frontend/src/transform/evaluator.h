#pragma once
#include "ast.h"
#include "environment.h"
#include "runtime_value.h"
#include <iostream>
#include <vector>

namespace metric {

// Result of executing one statement. Returned carries the value of a
// return statement up to the enclosing call; Continue carries the updated
// environment to the next statement.
struct StmtOutcome {
    enum class Kind { Continue, Returned };
    Kind kind = Kind::Continue;
    Environment env;
    std::vector<RuntimeValue> printed;
    RuntimeValue value = static_cast<int64_t>(0);

    static StmtOutcome continue_with(Environment env, std::vector<RuntimeValue> printed = {});
    static StmtOutcome returned(Environment env, RuntimeValue value, std::vector<RuntimeValue> printed = {});
};

struct ExecutionResult {
    std::vector<RuntimeValue> print_results;
    int64_t cost = 0;
};

// Tree-walking interpreter. Each semantic step adds one to the shared
// operation counter of the environment it runs in.
class Evaluator {
    std::ostream& out;
    int call_depth = 0;
    static const int MAX_CALL_DEPTH = 1000;

public:
    explicit Evaluator(std::ostream& out_stream = std::cout) : out(out_stream) {}

    ExecutionResult execute(const std::vector<StmtPtr>& program);
    RuntimeValue evaluate(const Environment& env, const ExprPtr& expr);
    StmtOutcome execute_statement(const Environment& env, const StmtPtr& stmt);

private:
    StmtOutcome execute_block(const Environment& env, const std::vector<StmtPtr>& body);

    StmtOutcome exec_let(const Environment& env, const StmtPtr& stmt);
    StmtOutcome exec_set(const Environment& env, const StmtPtr& stmt);
    StmtOutcome exec_list_assign(const Environment& env, const StmtPtr& stmt);
    StmtOutcome exec_print(const Environment& env, const StmtPtr& stmt);
    StmtOutcome exec_if(const Environment& env, const StmtPtr& stmt);
    StmtOutcome exec_while(const Environment& env, const StmtPtr& stmt);
    StmtOutcome exec_func_decl(const Environment& env, const StmtPtr& stmt);

    RuntimeValue eval_variable(const Environment& env, const ExprPtr& expr);
    RuntimeValue eval_unary(const Environment& env, const ExprPtr& expr);
    RuntimeValue eval_binary(const Environment& env, const ExprPtr& expr);
    RuntimeValue eval_arithmetic(BinaryOp op, const RuntimeValue& left, const RuntimeValue& right,
                                 const SourceLocation& loc);
    RuntimeValue eval_comparison(BinaryOp op, const RuntimeValue& left, const RuntimeValue& right,
                                 const SourceLocation& loc);
    RuntimeValue eval_call(const Environment& env, const ExprPtr& expr);
    RuntimeValue eval_list_literal(const Environment& env, const ExprPtr& expr);
    RuntimeValue eval_list_access(const Environment& env, const ExprPtr& expr);
    RuntimeValue eval_repeat(const Environment& env, const ExprPtr& expr);
    RuntimeValue eval_len(const Environment& env, const ExprPtr& expr);
};

ExecutionResult execute(const std::vector<StmtPtr>& program, std::ostream& out = std::cout);

}
