#include "evaluator.h"
#include "evaluator_internal.h"
#include <new>
#include <string>

namespace metric {

StmtOutcome StmtOutcome::continue_with(Environment env, std::vector<RuntimeValue> printed) {
    StmtOutcome outcome;
    outcome.kind = Kind::Continue;
    outcome.env = std::move(env);
    outcome.printed = std::move(printed);
    return outcome;
}

StmtOutcome StmtOutcome::returned(Environment env, RuntimeValue value, std::vector<RuntimeValue> printed) {
    StmtOutcome outcome;
    outcome.kind = Kind::Returned;
    outcome.env = std::move(env);
    outcome.value = std::move(value);
    outcome.printed = std::move(printed);
    return outcome;
}

ExecutionResult Evaluator::execute(const std::vector<StmtPtr>& program) {
    Environment env = Environment::empty();
    ExecutionResult result;

    for (const auto& stmt : program) {
        StmtOutcome outcome = execute_statement(env, stmt);
        result.print_results.insert(result.print_results.end(),
                                    outcome.printed.begin(), outcome.printed.end());
        if (outcome.kind == StmtOutcome::Kind::Returned) {
            throw EvaluationError("Return statement outside of function", stmt->location);
        }
        env = std::move(outcome.env);
    }

    result.cost = env.cost();
    return result;
}

RuntimeValue Evaluator::evaluate(const Environment& env, const ExprPtr& expr) {
    switch (expr->kind) {
        // Constants cost nothing
        case Expr::Kind::IntLiteral:
            return expr->int_val;
        case Expr::Kind::FloatLiteral:
            return expr->float_val;
        case Expr::Kind::BoolLiteral:
            return expr->bool_val;

        case Expr::Kind::Variable:
            return eval_variable(env, expr);
        case Expr::Kind::Unary:
            return eval_unary(env, expr);
        case Expr::Kind::Binary:
            return eval_binary(env, expr);
        case Expr::Kind::Call:
            return eval_call(env, expr);
        case Expr::Kind::ListLiteral:
            return eval_list_literal(env, expr);
        case Expr::Kind::ListAccess:
            return eval_list_access(env, expr);
        case Expr::Kind::Repeat:
            return eval_repeat(env, expr);
        case Expr::Kind::Len:
            return eval_len(env, expr);
    }
    throw EvaluationError("Unknown expression kind", expr->location);
}

RuntimeValue Evaluator::eval_variable(const Environment& env, const ExprPtr& expr) {
    env.increment_cost();
    std::optional<RuntimeValue> value = env.find(expr->name);
    if (!value) {
        throw EvaluationError("Undefined variable: " + expr->name, expr->location);
    }
    return *value;
}

RuntimeValue Evaluator::eval_list_literal(const Environment& env, const ExprPtr& expr) {
    env.increment_cost();
    std::vector<RuntimeValue> elements;
    elements.reserve(expr->elements.size());
    for (const auto& element : expr->elements) {
        RuntimeValue value = evaluate(env, element);
        if (!is_scalar_value(value)) {
            throw EvaluationError("List elements must be int, bool, or float, got " + runtime_value_kind(value),
                                  element->location);
        }
        elements.push_back(std::move(value));
    }
    return make_list_value(std::move(elements));
}

RuntimeValue Evaluator::eval_list_access(const Environment& env, const ExprPtr& expr) {
    RuntimeValue list_val = evaluate(env, expr->operand);
    RuntimeValue index_val = evaluate(env, expr->index);

    if (!is_list_value(list_val) || !std::get<std::shared_ptr<RuntimeList>>(list_val)) {
        throw EvaluationError("Cannot index into non-list value", expr->location);
    }
    if (!is_int_value(index_val)) {
        throw EvaluationError("List index must be integer", expr->index->location);
    }

    const RuntimeList& list = *std::get<std::shared_ptr<RuntimeList>>(list_val);
    int64_t index = std::get<int64_t>(index_val);
    int64_t length = static_cast<int64_t>(list.elements.size());
    if (index < 0 || index >= length) {
        throw EvaluationError("List index " + std::to_string(index) + " out of bounds (length " +
                              std::to_string(length) + ")", expr->location);
    }

    env.increment_cost();
    return list.elements[static_cast<size_t>(index)];
}

RuntimeValue Evaluator::eval_repeat(const Environment& env, const ExprPtr& expr) {
    RuntimeValue value = evaluate(env, expr->operand);
    RuntimeValue count_val = evaluate(env, expr->count);

    if (!is_int_value(count_val)) {
        throw EvaluationError("Repeat count must be integer", expr->count->location);
    }
    int64_t count = std::get<int64_t>(count_val);
    if (count < 0) {
        throw EvaluationError("Repeat count cannot be negative", expr->count->location);
    }
    if (!is_scalar_value(value)) {
        throw EvaluationError("Repeat value must be int, bool, or float, got " + runtime_value_kind(value),
                              expr->operand->location);
    }

    std::vector<RuntimeValue> elements;
    if (static_cast<uint64_t>(count) > elements.max_size()) {
        throw EvaluationError("Repeat count too large: " + std::to_string(count), expr->count->location);
    }
    try {
        elements.assign(static_cast<size_t>(count), value);
    } catch (const std::bad_alloc&) {
        throw EvaluationError("Out of memory creating list of " + std::to_string(count) + " elements",
                              expr->location);
    }

    env.increment_cost();
    return make_list_value(std::move(elements));
}

RuntimeValue Evaluator::eval_len(const Environment& env, const ExprPtr& expr) {
    RuntimeValue value = evaluate(env, expr->operand);
    const RuntimeList& list = expect_list(value, expr->location);
    env.increment_cost();
    return static_cast<int64_t>(list.elements.size());
}

StmtOutcome Evaluator::execute_statement(const Environment& env, const StmtPtr& stmt) {
    switch (stmt->kind) {
        case Stmt::Kind::Let:
            return exec_let(env, stmt);
        case Stmt::Kind::Set:
            return exec_set(env, stmt);
        case Stmt::Kind::ListAssign:
            return exec_list_assign(env, stmt);
        case Stmt::Kind::Print:
            return exec_print(env, stmt);
        case Stmt::Kind::If:
            return exec_if(env, stmt);
        case Stmt::Kind::While:
            return exec_while(env, stmt);
        case Stmt::Kind::Comment:
            return StmtOutcome::continue_with(env);
        case Stmt::Kind::FuncDecl:
            return exec_func_decl(env, stmt);
        case Stmt::Kind::Return:
            return StmtOutcome::returned(env, evaluate(env, stmt->expr));
    }
    throw EvaluationError("Unknown statement kind", stmt->location);
}

StmtOutcome Evaluator::execute_block(const Environment& env, const std::vector<StmtPtr>& body) {
    Environment current = env;
    std::vector<RuntimeValue> printed;
    for (const auto& stmt : body) {
        StmtOutcome outcome = execute_statement(current, stmt);
        printed.insert(printed.end(), outcome.printed.begin(), outcome.printed.end());
        if (outcome.kind == StmtOutcome::Kind::Returned) {
            return StmtOutcome::returned(std::move(outcome.env), std::move(outcome.value), std::move(printed));
        }
        current = std::move(outcome.env);
    }
    return StmtOutcome::continue_with(std::move(current), std::move(printed));
}

StmtOutcome Evaluator::exec_let(const Environment& env, const StmtPtr& stmt) {
    if (env.mem(stmt->name)) {
        throw EvaluationError("Variable already bound: " + stmt->name, stmt->location);
    }
    RuntimeValue value = evaluate(env, stmt->expr);
    Environment next = env.add(stmt->name, value);
    next.increment_cost();
    return StmtOutcome::continue_with(std::move(next));
}

StmtOutcome Evaluator::exec_set(const Environment& env, const StmtPtr& stmt) {
    if (!env.mem(stmt->name)) {
        throw EvaluationError("Cannot set undefined variable: " + stmt->name, stmt->location);
    }
    RuntimeValue value = evaluate(env, stmt->expr);
    Environment next = env.set(stmt->name, value);
    next.increment_cost();
    return StmtOutcome::continue_with(std::move(next));
}

StmtOutcome Evaluator::exec_list_assign(const Environment& env, const StmtPtr& stmt) {
    if (!env.mem(stmt->name)) {
        throw EvaluationError("Cannot set undefined variable: " + stmt->name, stmt->location);
    }
    RuntimeValue index_val = evaluate(env, stmt->index);
    if (!is_int_value(index_val)) {
        throw EvaluationError("List index must be integer", stmt->index->location);
    }
    RuntimeValue value = evaluate(env, stmt->expr);

    Environment next;
    try {
        next = env.set_list_element(stmt->name, std::get<int64_t>(index_val), value);
    } catch (const EvaluationError& e) {
        throw EvaluationError(e.what(), stmt->location);
    }
    next.increment_cost();
    return StmtOutcome::continue_with(std::move(next));
}

StmtOutcome Evaluator::exec_print(const Environment& env, const StmtPtr& stmt) {
    RuntimeValue value = evaluate(env, stmt->expr);
    env.increment_cost();
    out << format_runtime_value(value) << std::endl;
    // A printed list is recorded element by element
    if (is_list_value(value)) {
        return StmtOutcome::continue_with(env, std::get<std::shared_ptr<RuntimeList>>(value)->elements);
    }
    return StmtOutcome::continue_with(env, {value});
}

StmtOutcome Evaluator::exec_if(const Environment& env, const StmtPtr& stmt) {
    RuntimeValue cond = evaluate(env, stmt->condition);
    if (!std::holds_alternative<bool>(cond)) {
        throw EvaluationError("If condition must be boolean", stmt->condition->location);
    }
    env.increment_cost();

    if (!std::get<bool>(cond)) {
        return StmtOutcome::continue_with(env);
    }
    // No new scope: bindings made in the body stay visible afterwards
    return execute_block(env, stmt->body);
}

StmtOutcome Evaluator::exec_while(const Environment& env, const StmtPtr& stmt) {
    Environment current = env;
    std::vector<RuntimeValue> printed;

    while (true) {
        RuntimeValue cond = evaluate(current, stmt->condition);
        if (!std::holds_alternative<bool>(cond)) {
            throw EvaluationError("While condition must be boolean", stmt->condition->location);
        }
        current.increment_cost();
        if (!std::get<bool>(cond)) break;

        StmtOutcome outcome = execute_block(current, stmt->body);
        printed.insert(printed.end(), outcome.printed.begin(), outcome.printed.end());
        if (outcome.kind == StmtOutcome::Kind::Returned) {
            return StmtOutcome::returned(std::move(outcome.env), std::move(outcome.value), std::move(printed));
        }
        current = std::move(outcome.env);
    }

    return StmtOutcome::continue_with(std::move(current), std::move(printed));
}

StmtOutcome Evaluator::exec_func_decl(const Environment& env, const StmtPtr& stmt) {
    if (env.has_function(stmt->name)) {
        throw EvaluationError("Function already declared: " + stmt->name, stmt->location);
    }
    return StmtOutcome::continue_with(env.add_function(stmt->name, stmt));
}

ExecutionResult execute(const std::vector<StmtPtr>& program, std::ostream& out) {
    Evaluator evaluator(out);
    return evaluator.execute(program);
}

}
