#include "lexer.h"
#include "parser.h"
#include "test_support.h"
#include "typechecker.h"

#include <string>

using namespace metric;
using metric_test::check;
using metric_test::check_equal;
using metric_test::check_no_throw;
using metric_test::check_throws;

namespace {

void check_source(const std::string& source) {
    type_check(parse(tokenize(source)));
}

void expect_ok(const std::string& source, const std::string& what) {
    check_no_throw([&] { check_source(source); }, what);
}

void expect_type_error(const std::string& source, const std::string& message) {
    check_throws<TypeCheckError>([&] { check_source(source); }, message, "type error: " + message);
}

Type type_of(const std::string& declarations, const std::string& expr_source) {
    std::string source = declarations.empty() ? "print " + expr_source : declarations + "\nprint " + expr_source;
    std::vector<StmtPtr> program = parse(tokenize(source));
    TypeChecker checker;
    for (size_t i = 0; i + 1 < program.size(); i++) {
        checker.check_stmt(program[i]);
    }
    return checker.check_expr(program.back()->expr);
}

void test_declarations() {
    expect_ok("let x integer = 5\nset x = 6\nprint x", "let, set and print");
    expect_ok("let xs list of boolean = [true, false]\nset xs[0] = false", "list element assignment");
    expect_ok("let f float = 1 + 2.5", "let accepts a promoted float");

    expect_type_error("let x integer = 1\nlet x integer = 2", "Variable 'x' is already declared");
    expect_type_error("let x integer = 2.5",
                      "Type mismatch: cannot assign float to variable 'x' of type integer");
    expect_type_error("let f float = 2",
                      "Type mismatch: cannot assign integer to variable 'f' of type float");
    expect_type_error("let xs list of integer = [1.0]",
                      "Type mismatch: cannot assign list of float to variable 'xs' of type list of integer");
    expect_type_error("set y = 1", "Variable 'y' is not declared");
    expect_type_error("let b boolean = true\nset b = 1",
                      "Type mismatch: cannot assign integer to variable 'b' of type boolean");
    expect_type_error("print z", "Variable 'z' is not declared");
}

void test_list_assignment() {
    expect_type_error("let n integer = 1\nset n[0] = 2",
                      "Cannot index into non-list variable 'n' of type integer");
    expect_type_error("let xs list of integer = [1]\nset xs[true] = 2", "List index must be integer, got boolean");
    expect_type_error("let xs list of integer = [1]\nset xs[0] = 2.0",
                      "Type mismatch: cannot assign float to list element of type integer");
    expect_type_error("set ys[0] = 1", "Variable 'ys' is not declared");
}

void test_operators() {
    check_equal(type_of("", "1 + 2").to_string(), "integer", "integer addition");
    check_equal(type_of("", "1 + 2.0").to_string(), "float", "integer plus float promotes");
    check_equal(type_of("", "1.5 * 2").to_string(), "float", "float times integer promotes");
    check_equal(type_of("", "7 / 2").to_string(), "integer", "integer division stays integer");
    check_equal(type_of("", "7 % 2").to_string(), "integer", "modulus");
    check_equal(type_of("", "1 < 2.5").to_string(), "boolean", "mixed ordering");
    check_equal(type_of("", "true == false").to_string(), "boolean", "equality");
    check_equal(type_of("", "not (1 < 2) and true").to_string(), "boolean", "logical");

    expect_type_error("print 1 + true", "Operator Addition requires numeric operands");
    expect_type_error("print 1.0 % 2", "Operator Modulus requires integer operands");
    expect_type_error("print true < false", "Operator LessThan requires numeric operands");
    expect_type_error("print 1 == 1.0", "Operator EqualEqual requires operands of same type");
    expect_type_error("print 1 != true", "Operator NotEqual requires operands of same type");
    expect_type_error("print 1 and true", "Operator And requires boolean operands");
    expect_type_error("print true or 0", "Operator Or requires boolean operands");
    expect_type_error("print not 1", "Operator 'not' requires boolean operand, got integer");
}

void test_conditions() {
    expect_ok("let n integer = 5\nif n > 3\n    print n", "boolean if condition");
    expect_type_error("if 1\n    print 1", "If condition must be boolean, got integer");
    expect_type_error("while 1.5\n    print 1", "While condition must be boolean, got float");

    // Control-flow bodies share the enclosing scope
    expect_ok("if true\n    let inner integer = 1\nprint inner", "binding in if body is visible afterwards");
    expect_type_error("let x integer = 1\nif true\n    let x integer = 2", "Variable 'x' is already declared");
}

void test_functions() {
    expect_ok("def add(x integer, y integer) returns integer\n    return x + y\nprint add(3, 4)",
              "simple function");
    expect_ok("def fact(n integer) returns integer\n"
              "    if n <= 1\n"
              "        return 1\n"
              "    return n * fact(n - 1)\n"
              "print fact(5)",
              "recursive function");
    expect_ok("def pick(b boolean) returns integer\n"
              "    while b\n"
              "        return 1\n"
              "print pick(true)",
              "return nested in a loop satisfies the return rule");
    expect_ok("def total(xs list of integer) returns integer\n    return len(xs)\nprint total(repeat(0, 3))",
              "list parameter");

    expect_type_error("def f() returns integer\n    return 1\ndef f() returns integer\n    return 2",
                      "Function 'f' is already declared");
    expect_type_error("def f() returns integer\n    print 1", "Function 'f' must have a return statement");
    expect_type_error("def f() returns integer\n    return true", "Return type mismatch: expected integer, got boolean");
    expect_type_error("return 1", "Return statement must be inside a function");
    expect_type_error("print g(1)", "Function 'g' is not declared");
    expect_type_error("def f(x integer) returns integer\n    return x\nprint f(1, 2)",
                      "Function 'f' expects 1 arguments, got 2");
    expect_type_error("def f(x float) returns float\n    return x\nprint f(1)",
                      "Argument 1 to function 'f': expected float, got integer");
}

void test_function_scope() {
    // Bodies see only their parameters
    expect_type_error("let g integer = 1\ndef f() returns integer\n    return g", "Variable 'g' is not declared");
    expect_type_error("let x integer = 1\ndef f(x integer) returns integer\n    return x",
                      "Parameter 'x' conflicts with existing variable");
    expect_type_error("def f(a integer, a integer) returns integer\n    return a",
                      "Parameter 'a' conflicts with existing variable");

    // The enclosing scope is restored after the declaration
    expect_ok("let x integer = 1\ndef f(y integer) returns integer\n    return y\nprint x + f(2)",
              "outer variables visible after declaration");
    expect_type_error("def f(y integer) returns integer\n    return y\nprint y", "Variable 'y' is not declared");
}

void test_lists() {
    check_equal(type_of("", "[1.0, 2.0]").to_string(), "list of float", "list literal type");
    check_equal(type_of("", "repeat(true, 3)").to_string(), "list of boolean", "repeat type");
    check_equal(type_of("let xs list of float = [1.0]", "xs[0]").to_string(), "float", "list access type");
    check_equal(type_of("let xs list of float = [1.0]", "len(xs)").to_string(), "integer", "len type");

    expect_type_error("print []", "Cannot infer type of empty list literal");
    expect_type_error("print [1, 2.0]", "List elements must be homogeneous: element 0 is integer, element 1 is float");
    expect_type_error("let xs list of integer = [1]\nprint [xs, xs]", "Nested lists are not supported");
    expect_type_error("let n integer = 1\nprint n[0]", "Cannot index into non-list expression of type integer");
    expect_type_error("let xs list of integer = [1]\nprint xs[1.0]", "List index must be integer, got float");
    expect_type_error("let xs list of integer = [1]\nprint repeat(xs, 2)", "Cannot repeat a list value");
    expect_type_error("print repeat(1, 2.0)", "Repeat count must be integer, got float");
    expect_type_error("print len(5)", "Cannot get length of non-list expression of type integer");
}

void test_tables_and_locations() {
    TypeChecker checker;
    checker.check_program(parse(tokenize("let x integer = 1\ndef f(a boolean) returns float\n    return 1.0")));
    check_equal(checker.symbol_table().size(), 1, "one global symbol");
    check(checker.symbol_table().at("x") == Type::make_primitive(PrimitiveType::Integer), "symbol type");
    check_equal(checker.function_table().size(), 1, "one function");
    check_equal(checker.function_table().at("f").return_type.to_string(), "float", "function return type");

    try {
        check_source("let a integer = 1\nprint a + true");
        check(false, "mixed addition should fail");
    } catch (const TypeCheckError& e) {
        check_equal(e.formatted(), "[Line 2, Column 9] TypeCheck Error | Operator Addition requires numeric operands",
                    "formatted type error");
    }
}

} // namespace

int main() {
    test_declarations();
    test_list_assignment();
    test_operators();
    test_conditions();
    test_functions();
    test_function_scope();
    test_lists();
    test_tables_and_locations();
    return metric_test::report("typechecker");
}
