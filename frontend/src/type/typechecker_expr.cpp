#include "typechecker.h"

namespace metric {

namespace {

enum class OperatorCategory {
    Arithmetic,
    Modulus,
    Ordering,
    Equality,
    Logical
};

OperatorCategory category_of(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add:
        case BinaryOp::Sub:
        case BinaryOp::Mul:
        case BinaryOp::Div:
            return OperatorCategory::Arithmetic;
        case BinaryOp::Mod:
            return OperatorCategory::Modulus;
        case BinaryOp::Less:
        case BinaryOp::Greater:
        case BinaryOp::LessEqual:
        case BinaryOp::GreaterEqual:
            return OperatorCategory::Ordering;
        case BinaryOp::Equal:
        case BinaryOp::NotEqual:
            return OperatorCategory::Equality;
        case BinaryOp::And:
        case BinaryOp::Or:
            return OperatorCategory::Logical;
    }
    return OperatorCategory::Arithmetic;
}

} // namespace

Type TypeChecker::check_expr(const ExprPtr& expr) {
    switch (expr->kind) {
        case Expr::Kind::IntLiteral:
            return Type::make_primitive(PrimitiveType::Integer);
        case Expr::Kind::FloatLiteral:
            return Type::make_primitive(PrimitiveType::Float);
        case Expr::Kind::BoolLiteral:
            return Type::make_primitive(PrimitiveType::Boolean);
        case Expr::Kind::Variable:
            return check_variable(expr);
        case Expr::Kind::Unary:
            return check_unary(expr);
        case Expr::Kind::Binary:
            return check_binary(expr);
        case Expr::Kind::Call:
            return check_call(expr);
        case Expr::Kind::ListLiteral:
            return check_list_literal(expr);
        case Expr::Kind::ListAccess:
            return check_list_access(expr);
        case Expr::Kind::Repeat:
            return check_repeat(expr);
        case Expr::Kind::Len:
            return check_len(expr);
    }
    throw TypeCheckError("Unknown expression kind", expr->location);
}

Type TypeChecker::check_variable(const ExprPtr& expr) {
    auto it = symbols.find(expr->name);
    if (it == symbols.end()) {
        throw TypeCheckError("Variable '" + expr->name + "' is not declared", expr->location);
    }
    return it->second;
}

Type TypeChecker::check_binary(const ExprPtr& expr) {
    Type left = check_expr(expr->left);
    Type right = check_expr(expr->right);
    std::string op_name = binary_op_name(expr->binary_op);

    switch (category_of(expr->binary_op)) {
        case OperatorCategory::Arithmetic:
            if (!left.is_numeric() || !right.is_numeric()) {
                throw TypeCheckError("Operator " + op_name + " requires numeric operands", expr->location);
            }
            // Integer op Float promotes to Float
            if (left.is_primitive(PrimitiveType::Float) || right.is_primitive(PrimitiveType::Float)) {
                return Type::make_primitive(PrimitiveType::Float);
            }
            return Type::make_primitive(PrimitiveType::Integer);

        case OperatorCategory::Modulus:
            if (!left.is_primitive(PrimitiveType::Integer) || !right.is_primitive(PrimitiveType::Integer)) {
                throw TypeCheckError("Operator " + op_name + " requires integer operands", expr->location);
            }
            return Type::make_primitive(PrimitiveType::Integer);

        case OperatorCategory::Ordering:
            if (!left.is_numeric() || !right.is_numeric()) {
                throw TypeCheckError("Operator " + op_name + " requires numeric operands", expr->location);
            }
            return Type::make_primitive(PrimitiveType::Boolean);

        case OperatorCategory::Equality:
            if (left != right) {
                throw TypeCheckError("Operator " + op_name + " requires operands of same type", expr->location);
            }
            return Type::make_primitive(PrimitiveType::Boolean);

        case OperatorCategory::Logical:
            if (!left.is_primitive(PrimitiveType::Boolean) || !right.is_primitive(PrimitiveType::Boolean)) {
                throw TypeCheckError("Operator " + op_name + " requires boolean operands", expr->location);
            }
            return Type::make_primitive(PrimitiveType::Boolean);
    }
    throw TypeCheckError("Unknown binary operator: " + op_name, expr->location);
}

Type TypeChecker::check_unary(const ExprPtr& expr) {
    Type operand = check_expr(expr->operand);
    switch (expr->unary_op) {
        case UnaryOp::Not:
            if (!operand.is_primitive(PrimitiveType::Boolean)) {
                throw TypeCheckError("Operator 'not' requires boolean operand, got " + operand.to_string(),
                                     expr->location);
            }
            return Type::make_primitive(PrimitiveType::Boolean);
    }
    throw TypeCheckError("Unknown unary operator: " + unary_op_name(expr->unary_op), expr->location);
}

Type TypeChecker::check_call(const ExprPtr& expr) {
    auto it = functions.find(expr->name);
    if (it == functions.end()) {
        throw TypeCheckError("Function '" + expr->name + "' is not declared", expr->location);
    }
    const FunctionSignature& sig = it->second;

    if (expr->args.size() != sig.param_types.size()) {
        throw TypeCheckError("Function '" + expr->name + "' expects " + std::to_string(sig.param_types.size()) +
                             " arguments, got " + std::to_string(expr->args.size()), expr->location);
    }

    // No implicit widening at call boundaries
    for (size_t i = 0; i < expr->args.size(); i++) {
        Type arg_type = check_expr(expr->args[i]);
        if (arg_type != sig.param_types[i]) {
            throw TypeCheckError("Argument " + std::to_string(i + 1) + " to function '" + expr->name +
                                 "': expected " + sig.param_types[i].to_string() + ", got " + arg_type.to_string(),
                                 expr->args[i]->location);
        }
    }

    return sig.return_type;
}

Type TypeChecker::check_list_literal(const ExprPtr& expr) {
    if (expr->elements.empty()) {
        throw TypeCheckError("Cannot infer type of empty list literal", expr->location);
    }

    Type first = check_expr(expr->elements[0]);
    for (size_t i = 1; i < expr->elements.size(); i++) {
        Type elem = check_expr(expr->elements[i]);
        if (elem != first) {
            throw TypeCheckError("List elements must be homogeneous: element 0 is " + first.to_string() +
                                 ", element " + std::to_string(i) + " is " + elem.to_string(),
                                 expr->elements[i]->location);
        }
    }

    if (first.is_list()) {
        throw TypeCheckError("Nested lists are not supported", expr->location);
    }
    return Type::make_list(first.primitive);
}

Type TypeChecker::check_list_access(const ExprPtr& expr) {
    Type list_type = check_expr(expr->operand);
    if (!list_type.is_list()) {
        throw TypeCheckError("Cannot index into non-list expression of type " + list_type.to_string(),
                             expr->location);
    }

    Type index_type = check_expr(expr->index);
    if (!index_type.is_primitive(PrimitiveType::Integer)) {
        throw TypeCheckError("List index must be integer, got " + index_type.to_string(), expr->index->location);
    }

    return list_type.element_type();
}

Type TypeChecker::check_repeat(const ExprPtr& expr) {
    Type value_type = check_expr(expr->operand);
    if (value_type.is_list()) {
        throw TypeCheckError("Cannot repeat a list value", expr->location);
    }

    Type count_type = check_expr(expr->count);
    if (!count_type.is_primitive(PrimitiveType::Integer)) {
        throw TypeCheckError("Repeat count must be integer, got " + count_type.to_string(), expr->count->location);
    }

    return Type::make_list(value_type.primitive);
}

Type TypeChecker::check_len(const ExprPtr& expr) {
    Type list_type = check_expr(expr->operand);
    if (!list_type.is_list()) {
        throw TypeCheckError("Cannot get length of non-list expression of type " + list_type.to_string(),
                             expr->location);
    }
    return Type::make_primitive(PrimitiveType::Integer);
}

}
