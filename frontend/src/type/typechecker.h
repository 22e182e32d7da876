#pragma once
#include "ast.h"
#include <optional>
#include <unordered_map>
#include <vector>

namespace metric {

struct FunctionSignature {
    std::vector<Type> param_types;
    Type return_type;
};

// Static checker over a parsed program. Statements update the symbol and
// function tables; expressions return their computed type. The first
// violation throws TypeCheckError.
class TypeChecker {
    std::unordered_map<std::string, Type> symbols;
    std::unordered_map<std::string, FunctionSignature> functions;
    std::optional<Type> current_return_type;

public:
    void check_program(const std::vector<StmtPtr>& program);
    void check_stmt(const StmtPtr& stmt);
    Type check_expr(const ExprPtr& expr);

    const std::unordered_map<std::string, Type>& symbol_table() const { return symbols; }
    const std::unordered_map<std::string, FunctionSignature>& function_table() const { return functions; }

private:
    void check_let(const StmtPtr& stmt);
    void check_set(const StmtPtr& stmt);
    void check_list_assign(const StmtPtr& stmt);
    void check_condition(const ExprPtr& condition, const std::string& statement_name);
    void check_body(const std::vector<StmtPtr>& body);
    void check_func_decl(const StmtPtr& stmt);
    void check_return(const StmtPtr& stmt);

    Type check_variable(const ExprPtr& expr);
    Type check_binary(const ExprPtr& expr);
    Type check_unary(const ExprPtr& expr);
    Type check_call(const ExprPtr& expr);
    Type check_list_literal(const ExprPtr& expr);
    Type check_list_access(const ExprPtr& expr);
    Type check_repeat(const ExprPtr& expr);
    Type check_len(const ExprPtr& expr);

    static bool contains_return(const std::vector<StmtPtr>& body);
};

void type_check(const std::vector<StmtPtr>& program);

}
