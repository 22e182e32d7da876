#include "evaluator.h"
#include "evaluator_internal.h"

namespace metric {

RuntimeValue Evaluator::eval_unary(const Environment& env, const ExprPtr& expr) {
    RuntimeValue operand = evaluate(env, expr->operand);
    env.increment_cost();
    switch (expr->unary_op) {
        case UnaryOp::Not:
            return !runtime_value_truthy(operand);
    }
    throw EvaluationError("Unknown unary operator: " + unary_op_name(expr->unary_op), expr->location);
}

RuntimeValue Evaluator::eval_binary(const Environment& env, const ExprPtr& expr) {
    RuntimeValue left = evaluate(env, expr->left);

    // The skipped right operand still costs one for the short-circuited result
    if (expr->binary_op == BinaryOp::And) {
        if (!runtime_value_truthy(left)) {
            env.increment_cost();
            return false;
        }
        RuntimeValue right = evaluate(env, expr->right);
        env.increment_cost();
        return runtime_value_truthy(right);
    }
    if (expr->binary_op == BinaryOp::Or) {
        if (runtime_value_truthy(left)) {
            env.increment_cost();
            return true;
        }
        RuntimeValue right = evaluate(env, expr->right);
        env.increment_cost();
        return runtime_value_truthy(right);
    }

    RuntimeValue right = evaluate(env, expr->right);
    env.increment_cost();

    switch (expr->binary_op) {
        case BinaryOp::Add:
        case BinaryOp::Sub:
        case BinaryOp::Mul:
        case BinaryOp::Div:
        case BinaryOp::Mod:
            return eval_arithmetic(expr->binary_op, left, right, expr->location);
        case BinaryOp::Less:
        case BinaryOp::Greater:
        case BinaryOp::LessEqual:
        case BinaryOp::GreaterEqual:
            return eval_comparison(expr->binary_op, left, right, expr->location);
        case BinaryOp::Equal:
            return runtime_values_equal(left, right);
        case BinaryOp::NotEqual:
            return !runtime_values_equal(left, right);
        case BinaryOp::And:
        case BinaryOp::Or:
            break;
    }
    throw EvaluationError("Unknown binary operator: " + binary_op_name(expr->binary_op), expr->location);
}

RuntimeValue Evaluator::eval_arithmetic(BinaryOp op, const RuntimeValue& left, const RuntimeValue& right,
                                        const SourceLocation& loc) {
    expect_number(left, loc);
    expect_number(right, loc);

    if (is_int_value(left) && is_int_value(right)) {
        int64_t l = std::get<int64_t>(left);
        int64_t r = std::get<int64_t>(right);
        switch (op) {
            case BinaryOp::Add: return checked_add(l, r, loc);
            case BinaryOp::Sub: return checked_sub(l, r, loc);
            case BinaryOp::Mul: return checked_mul(l, r, loc);
            case BinaryOp::Div:
                if (r == 0) throw EvaluationError("Division by zero", loc);
                return floor_div(l, r, loc);
            case BinaryOp::Mod:
                if (r == 0) throw EvaluationError("Modulus by zero", loc);
                return floor_mod(l, r);
            default:
                break;
        }
        throw EvaluationError("Unknown binary operator: " + binary_op_name(op), loc);
    }

    // Either side float: the whole operation is carried out in floating point
    double l = to_float(left);
    double r = to_float(right);
    switch (op) {
        case BinaryOp::Add: return l + r;
        case BinaryOp::Sub: return l - r;
        case BinaryOp::Mul: return l * r;
        case BinaryOp::Div:
            if (r == 0.0) throw EvaluationError("Division by zero", loc);
            return l / r;
        case BinaryOp::Mod:
            if (r == 0.0) throw EvaluationError("Modulus by zero", loc);
            return floor_mod(l, r);
        default:
            break;
    }
    throw EvaluationError("Unknown binary operator: " + binary_op_name(op), loc);
}

RuntimeValue Evaluator::eval_comparison(BinaryOp op, const RuntimeValue& left, const RuntimeValue& right,
                                        const SourceLocation& loc) {
    expect_number(left, loc);
    expect_number(right, loc);

    int order = compare_numeric_values(left, right);
    if (order == NUMERIC_UNORDERED) {
        return false;
    }
    switch (op) {
        case BinaryOp::Less: return order < 0;
        case BinaryOp::Greater: return order > 0;
        case BinaryOp::LessEqual: return order <= 0;
        case BinaryOp::GreaterEqual: return order >= 0;
        default: break;
    }
    throw EvaluationError("Unknown binary operator: " + binary_op_name(op), loc);
}

}
