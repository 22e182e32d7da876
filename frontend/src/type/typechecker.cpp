#include "typechecker.h"

namespace metric {

void TypeChecker::check_program(const std::vector<StmtPtr>& program) {
    for (const auto& stmt : program) {
        check_stmt(stmt);
    }
}

void TypeChecker::check_stmt(const StmtPtr& stmt) {
    switch (stmt->kind) {
        case Stmt::Kind::Let:
            check_let(stmt);
            break;
        case Stmt::Kind::Set:
            check_set(stmt);
            break;
        case Stmt::Kind::ListAssign:
            check_list_assign(stmt);
            break;
        case Stmt::Kind::Print:
            check_expr(stmt->expr);
            break;
        case Stmt::Kind::If:
            check_condition(stmt->condition, "If");
            check_body(stmt->body);
            break;
        case Stmt::Kind::While:
            check_condition(stmt->condition, "While");
            check_body(stmt->body);
            break;
        case Stmt::Kind::Comment:
            break;
        case Stmt::Kind::FuncDecl:
            check_func_decl(stmt);
            break;
        case Stmt::Kind::Return:
            check_return(stmt);
            break;
    }
}

void TypeChecker::check_let(const StmtPtr& stmt) {
    if (symbols.count(stmt->name)) {
        throw TypeCheckError("Variable '" + stmt->name + "' is already declared", stmt->location);
    }

    Type expr_type = check_expr(stmt->expr);
    if (expr_type != stmt->var_type) {
        throw TypeCheckError("Type mismatch: cannot assign " + expr_type.to_string() + " to variable '" +
                             stmt->name + "' of type " + stmt->var_type.to_string(), stmt->location);
    }

    symbols[stmt->name] = stmt->var_type;
}

void TypeChecker::check_set(const StmtPtr& stmt) {
    auto it = symbols.find(stmt->name);
    if (it == symbols.end()) {
        throw TypeCheckError("Variable '" + stmt->name + "' is not declared", stmt->location);
    }
    Type var_type = it->second;

    Type expr_type = check_expr(stmt->expr);
    if (expr_type != var_type) {
        throw TypeCheckError("Type mismatch: cannot assign " + expr_type.to_string() + " to variable '" +
                             stmt->name + "' of type " + var_type.to_string(), stmt->location);
    }
}

void TypeChecker::check_list_assign(const StmtPtr& stmt) {
    auto it = symbols.find(stmt->name);
    if (it == symbols.end()) {
        throw TypeCheckError("Variable '" + stmt->name + "' is not declared", stmt->location);
    }
    Type var_type = it->second;
    if (!var_type.is_list()) {
        throw TypeCheckError("Cannot index into non-list variable '" + stmt->name + "' of type " +
                             var_type.to_string(), stmt->location);
    }

    Type index_type = check_expr(stmt->index);
    if (!index_type.is_primitive(PrimitiveType::Integer)) {
        throw TypeCheckError("List index must be integer, got " + index_type.to_string(),
                             stmt->index->location);
    }

    Type value_type = check_expr(stmt->expr);
    if (value_type != var_type.element_type()) {
        throw TypeCheckError("Type mismatch: cannot assign " + value_type.to_string() +
                             " to list element of type " + var_type.element_type().to_string(),
                             stmt->location);
    }
}

void TypeChecker::check_condition(const ExprPtr& condition, const std::string& statement_name) {
    Type cond_type = check_expr(condition);
    if (!cond_type.is_primitive(PrimitiveType::Boolean)) {
        throw TypeCheckError(statement_name + " condition must be boolean, got " + cond_type.to_string(),
                             condition->location);
    }
}

void TypeChecker::check_body(const std::vector<StmtPtr>& body) {
    // Control-flow bodies share the enclosing scope
    for (const auto& stmt : body) {
        check_stmt(stmt);
    }
}

bool TypeChecker::contains_return(const std::vector<StmtPtr>& body) {
    for (const auto& stmt : body) {
        if (stmt->kind == Stmt::Kind::Return) return true;
        if ((stmt->kind == Stmt::Kind::If || stmt->kind == Stmt::Kind::While) && contains_return(stmt->body)) {
            return true;
        }
    }
    return false;
}

void TypeChecker::check_func_decl(const StmtPtr& stmt) {
    if (functions.count(stmt->name)) {
        throw TypeCheckError("Function '" + stmt->name + "' is already declared", stmt->location);
    }

    // Registered before the body is checked so the function may call itself
    FunctionSignature sig;
    for (const auto& param : stmt->params) {
        sig.param_types.push_back(param.type);
    }
    sig.return_type = stmt->return_type;
    functions[stmt->name] = sig;

    // The body sees its parameters only. Names already visible in the
    // enclosing scope may not be reused as parameters.
    std::unordered_map<std::string, Type> function_symbols;
    for (const auto& param : stmt->params) {
        if (symbols.count(param.name) || function_symbols.count(param.name)) {
            throw TypeCheckError("Parameter '" + param.name + "' conflicts with existing variable",
                                 param.location);
        }
        function_symbols[param.name] = param.type;
    }

    std::unordered_map<std::string, Type> saved_symbols = std::move(symbols);
    std::optional<Type> saved_return_type = current_return_type;
    symbols = std::move(function_symbols);
    current_return_type = stmt->return_type;

    for (const auto& body_stmt : stmt->body) {
        check_stmt(body_stmt);
    }

    if (!contains_return(stmt->body)) {
        throw TypeCheckError("Function '" + stmt->name + "' must have a return statement", stmt->location);
    }

    symbols = std::move(saved_symbols);
    current_return_type = saved_return_type;
}

void TypeChecker::check_return(const StmtPtr& stmt) {
    if (!current_return_type) {
        throw TypeCheckError("Return statement must be inside a function", stmt->location);
    }

    Type expr_type = check_expr(stmt->expr);
    if (expr_type != *current_return_type) {
        throw TypeCheckError("Return type mismatch: expected " + current_return_type->to_string() +
                             ", got " + expr_type.to_string(), stmt->location);
    }
}

void type_check(const std::vector<StmtPtr>& program) {
    TypeChecker checker;
    checker.check_program(program);
}

}
