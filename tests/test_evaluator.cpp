#include "environment.h"
#include "evaluator.h"
#include "lexer.h"
#include "parser.h"
#include "test_support.h"
#include "typechecker.h"

#include <cmath>
#include <sstream>
#include <string>

using namespace metric;
using metric_test::check;
using metric_test::check_equal;
using metric_test::check_no_throw;
using metric_test::check_throws;

namespace {

struct Run {
    ExecutionResult result;
    std::string output;
};

Run run(const std::string& source) {
    std::vector<StmtPtr> program = parse(tokenize(source));
    type_check(program);
    std::ostringstream out;
    Run r;
    r.result = execute(program, out);
    r.output = out.str();
    return r;
}

std::string printed(const ExecutionResult& result) {
    std::string out;
    for (const auto& value : result.print_results) {
        if (!out.empty()) out += " | ";
        out += format_runtime_value(value);
    }
    return out;
}

void expect_run(const std::string& source, const std::string& output, long long cost, const std::string& what) {
    try {
        Run r = run(source);
        check_equal(r.output, output, what + " output");
        check_equal(r.result.cost, cost, what + " cost");
    } catch (const CompileError& e) {
        check(false, what + ": unexpected error " + e.formatted());
    }
}

void expect_runtime_error(const std::string& source, const std::string& message) {
    check_throws<EvaluationError>([&] { run(source); }, message, "runtime error: " + message);
}

void test_scenarios() {
    Run r = run("let x integer = 5\nlet y integer = 10\nprint x + y");
    check_equal(r.output, "15\n", "sum output");
    check_equal(printed(r.result), "15", "sum print results");
    check_equal(r.result.cost, 6, "sum cost");

    expect_run("let nums list of integer = [1, 2, 3]\nset nums[1] = 99\nprint nums", "[1, 99, 3]\n", 5,
               "list element update");

    r = run("let n integer = 5\nif n > 3\n    print n");
    check_equal(r.output, "5\n", "taken branch output");
    check_equal(r.result.cost, 6, "taken branch cost");
    r = run("let n integer = 2\nif n > 3\n    print n");
    check_equal(r.output, "", "skipped branch prints nothing");
    check(r.result.print_results.empty(), "skipped branch print results");
    check_equal(r.result.cost, 4, "skipped branch cost");

    expect_run("def add(x integer, y integer) returns integer\n    return x + y\nprint add(3, 4)", "7\n", 5,
               "function call");

    expect_runtime_error("let nums list of integer = [1, 2, 3]\nprint nums[5]", "out of bounds");
    expect_runtime_error("let nums list of integer = [1, 2, 3]\nprint nums[5]", "List index 5 out of bounds (length 3)");
}

void test_cost_model() {
    check_equal(run("# nothing but a comment").result.cost, 0, "comment costs nothing");
    check_equal(run("print 1").result.cost, 1, "literal is free, print costs one");
    expect_run("let i integer = 0\nwhile i < 3\n    set i = i + 1\nprint i", "3\n", 24,
               "every loop test is counted");
    expect_run("let a boolean = false and 1 / 0 == 1\nprint a", "false\n", 4, "and short circuit");
    expect_run("print true or 1 / 0 == 0", "true\n", 2, "or short circuit");
    expect_run("print true and false", "false\n", 2, "and evaluating both sides");
    expect_run("print not true", "false\n", 2, "not");
    expect_run("print repeat(1, 3)", "[1, 1, 1]\n", 2, "repeat");
    expect_run("let xs list of integer = [1, 2]\nprint len(xs)", "2\n", 5, "len");
    expect_run("let xs list of integer = [4, 5]\nprint xs[1]", "5\n", 5, "list access");
    expect_run("def f() returns integer\n    return 1", "", 0, "declaration is free");
}

void test_arithmetic() {
    expect_run("print -7 / 2", "-4\n", 2, "floor division");
    expect_run("print 7 / -2", "-4\n", 2, "floor division with negative divisor");
    expect_run("print -7 % 3", "2\n", 2, "modulus takes divisor sign");
    expect_run("print 7 % -3", "-2\n", 2, "modulus with negative divisor");
    expect_run("print 7.0 / 2", "3.5\n", 2, "float division");
    expect_run("print 1 + 2.5", "3.5\n", 2, "promotion");
    expect_run("print 2.5 * 4", "10.0\n", 2, "float keeps decimal point");
    expect_run("print 0.1 + 0.2", "0.30000000000000004\n", 2, "shortest round trip");
    expect_run("print 1 / 3.0", "0.3333333333333333\n", 2, "repeating fraction");
    expect_run("print 3 >= 3.0", "true\n", 2, "mixed comparison");
    expect_run("print 2 == 3", "false\n", 2, "equality");
    expect_run("print 9007199254740993 > 9007199254740992.0", "true\n", 2, "large integer against float is exact");
    expect_run("print 9007199254740993 <= 9007199254740992.0", "false\n", 2, "large integer ordering");
    expect_run("print 2.5 > 2", "true\n", 2, "float against integer");

    RuntimeValue big = static_cast<int64_t>(9007199254740993LL);
    check(!runtime_values_equal(big, 9007199254740992.0), "large integer is not equal to its rounded float");
    check(runtime_values_equal(static_cast<int64_t>(3), 3.0), "integer equals float of same value");
    check_equal(compare_numeric_values(static_cast<int64_t>(-3), -2.5), -1, "negative integer below float");
    check_equal(compare_numeric_values(std::nan(""), static_cast<int64_t>(1)), NUMERIC_UNORDERED, "NaN is unordered");

    expect_runtime_error("print 1 / 0", "Division by zero");
    expect_runtime_error("print 1.5 / 0.0", "Division by zero");
    expect_runtime_error("print 1 % 0", "Modulus by zero");
    expect_runtime_error("print 9223372036854775807 + 1", "Integer overflow");
    expect_runtime_error("print -9223372036854775807 - 2", "Integer overflow");
    expect_runtime_error("print 4611686018427387904 * 2", "Integer overflow");
}

void test_formatting() {
    check_equal(format_float(5.0), "5.0", "integral float");
    check_equal(format_float(-0.5), "-0.5", "negative float");
    check_equal(format_float(0.0001), "0.0001", "small decimal");
    check_equal(format_float(0.00001), "1e-05", "small scientific");
    check_equal(format_float(123456789.0), "123456789.0", "large decimal");
    check_equal(format_float(1e16), "1e+16", "large scientific");
    check_equal(format_float(1.5e300), "1.5e+300", "huge");
    check_equal(format_runtime_value(true), "true", "boolean");
    check_equal(format_runtime_value(static_cast<int64_t>(-3)), "-3", "integer");
    check_equal(format_runtime_value(make_list_value({1.0, 2.5})), "[1.0, 2.5]", "float list");
    check_equal(format_runtime_value(make_list_value({false, true})), "[false, true]", "boolean list");
}

void test_statements() {
    expect_run("if true\n    let y integer = 1\nprint y", "1\n", 4, "if body bindings stay visible");
    expect_run("let xs list of boolean = repeat(false, 2)\nset xs[0] = true\nprint xs", "[true, false]\n", 5,
               "repeat then assign");

    Run r = run("def f(x integer) returns integer\n    print x\n    return x\nprint f(2)");
    check_equal(r.output, "2\n2\n", "prints inside a function reach the output");
    check_equal(printed(r.result), "2", "only top-level prints are collected");
    check_equal(r.result.cost, 5, "call with inner print");

    r = run("let i integer = 0\nwhile i < 2\n    print i\n    set i = i + 1");
    check_equal(printed(r.result), "0 | 1", "prints in loops are collected");

    r = run("let nums list of integer = [1, 2, 3]\nprint nums\nprint len(nums)");
    check_equal(r.output, "[1, 2, 3]\n3\n", "a printed list is one output line");
    check_equal(printed(r.result), "1 | 2 | 3 | 3", "a printed list is recorded element by element");

    r = run("if true\n    print [true, false]");
    check_equal(printed(r.result), "true | false", "list printed in a block is flattened");

    expect_run("def fact(n integer) returns integer\n"
               "    if n <= 1\n"
               "        return 1\n"
               "    return n * fact(n - 1)\n"
               "print fact(5)",
               "120\n", 37, "recursion");

    expect_run("def first(xs list of integer) returns integer\n"
               "    let i integer = 0\n"
               "    while i < len(xs)\n"
               "        if xs[i] > 2\n"
               "            return xs[i]\n"
               "        set i = i + 1\n"
               "    return 0 - 1\n"
               "print first([1, 5, 3])",
               "5\n", 30, "return from inside a loop");
}

void test_runtime_errors() {
    expect_runtime_error("print repeat(1, -1)", "Repeat count cannot be negative");
    expect_runtime_error("print len(repeat(0, 4611686018427387904))", "Repeat count too large: 4611686018427387904");
    expect_runtime_error("let xs list of integer = [1]\nset xs[3] = 2", "List index 3 out of bounds (list length: 1)");
    expect_runtime_error("let i integer = 0\nwhile i < 2\n    let t integer = i\n    set i = i + 1",
                         "Variable already bound: t");
    expect_runtime_error("def f(n integer) returns integer\n    return f(n + 1)\nprint f(0)",
                         "Maximum recursion depth exceeded in call to 'f'");

    try {
        run("let xs list of integer = [1]\nprint xs[1]");
        check(false, "out of bounds should fail");
    } catch (const EvaluationError& e) {
        check_equal(e.location.line, 2, "runtime error line");
        check_equal(e.formatted(), "[Line 2, Column 7] Evaluation Error | List index 1 out of bounds (length 1)",
                    "formatted runtime error");
    }
}

void test_hand_built_trees() {
    Evaluator evaluator;
    Environment env = Environment::empty();

    RuntimeValue sum = evaluator.evaluate(env, Expr::make_binary(Expr::make_int(2), BinaryOp::Add, Expr::make_float(0.5)));
    check(std::holds_alternative<double>(sum) && std::get<double>(sum) == 2.5, "mixed addition");
    check_equal(env.cost(), 1, "binary costs one");

    check_throws<EvaluationError>([&] { evaluator.evaluate(env, Expr::make_variable("q")); },
                                  "Undefined variable: q", "undefined variable");
    check_throws<EvaluationError>([&] { evaluator.evaluate(env, Expr::make_call("nope", {})); },
                                  "Undefined function: nope", "undefined function");
    check_throws<EvaluationError>([&] {
        evaluator.evaluate(env, Expr::make_binary(Expr::make_bool(true), BinaryOp::Add, Expr::make_int(1)));
    }, "Expected number, got bool", "arithmetic on a boolean");
    check_throws<EvaluationError>([&] { evaluator.evaluate(env, Expr::make_len(Expr::make_int(1))); },
                                  "Expected list, got int", "len of a scalar");
    check_throws<EvaluationError>([&] {
        evaluator.evaluate(env, Expr::make_list_access(Expr::make_int(1), Expr::make_int(0)));
    }, "Cannot index into non-list value", "index a scalar");
    check_throws<EvaluationError>([&] {
        evaluator.execute_statement(env, Stmt::make_if(Expr::make_int(1), {}));
    }, "If condition must be boolean", "non-boolean if condition");

    StmtPtr no_return = Stmt::make_func("f", {}, Type::make_primitive(PrimitiveType::Integer),
                                        {Stmt::make_print(Expr::make_int(1))});
    StmtOutcome declared = evaluator.execute_statement(env, no_return);
    check(declared.kind == StmtOutcome::Kind::Continue, "declaration continues");
    std::ostringstream sink;
    Evaluator quiet(sink);
    check_throws<EvaluationError>([&] { quiet.evaluate(declared.env, Expr::make_call("f", {})); },
                                  "Function 'f' did not return a value", "missing return at runtime");
    check_throws<EvaluationError>([&] {
        quiet.evaluate(declared.env, Expr::make_call("f", {Expr::make_int(1)}));
    }, "Function 'f' expects 0 arguments, got 1", "argument count at runtime");
    check_throws<EvaluationError>([&] { evaluator.execute_statement(declared.env, no_return); },
                                  "Function already declared: f", "duplicate declaration at runtime");

    StmtOutcome ret = evaluator.execute_statement(env, Stmt::make_return(Expr::make_int(3)));
    check(ret.kind == StmtOutcome::Kind::Returned, "return produces a returned outcome");
    check(std::holds_alternative<int64_t>(ret.value) && std::get<int64_t>(ret.value) == 3, "returned value");

    check_throws<EvaluationError>([] {
        std::ostringstream out;
        execute({Stmt::make_return(Expr::make_int(1))}, out);
    }, "Return statement outside of function", "top-level return");

    std::ostringstream out;
    check_equal(execute({}, out).cost, 0, "empty program costs nothing");
}

void test_environment() {
    Environment root = Environment::empty();
    Environment with_x = root.add("x", static_cast<int64_t>(1));
    check(!root.mem("x"), "add leaves the original untouched");
    check(with_x.mem("x"), "add binds in the new environment");

    Environment updated = with_x.set("x", static_cast<int64_t>(2));
    check(std::get<int64_t>(*with_x.find("x")) == 1, "set leaves the original untouched");
    check(std::get<int64_t>(*updated.find("x")) == 2, "set rebinds");
    check(!root.find("x").has_value(), "find on a missing name");
    check_throws<EvaluationError>([&] { root.set("y", static_cast<int64_t>(0)); },
                                  "Cannot set undefined variable: y", "set on a missing name");

    Environment with_list = root.add("xs", make_list_value({static_cast<int64_t>(1), static_cast<int64_t>(2)}));
    Environment changed = with_list.set_list_element("xs", 0, static_cast<int64_t>(9));
    check_equal(format_runtime_value(*with_list.find("xs")), "[1, 2]", "list update copies");
    check_equal(format_runtime_value(*changed.find("xs")), "[9, 2]", "list update applied");
    check_throws<EvaluationError>([&] { with_x.set_list_element("x", 0, static_cast<int64_t>(1)); },
                                  "Variable 'x' is not a list", "element update on a scalar");
    check_throws<EvaluationError>([&] { with_list.set_list_element("xs", -1, static_cast<int64_t>(1)); },
                                  "List index -1 out of bounds (list length: 2)", "negative index");

    changed.increment_cost();
    check_equal(root.cost(), 1, "derived environments share one counter");
    Environment child = updated.child();
    check(child.shares_cost_with(root), "child shares the counter");
    check(!child.mem("x"), "child starts without bindings");
}

void test_determinism() {
    const std::string source = "let i integer = 0\nlet acc float = 0.5\n"
                               "while i < 5\n    set acc = acc * 2\n    set i = i + 1\nprint acc";
    Run first = run(source);
    Run second = run(source);
    check_equal(first.output, second.output, "repeatable output");
    check_equal(first.result.cost, second.result.cost, "repeatable cost");
    check_equal(first.output, "16.0\n", "float doubling");
}

} // namespace

int main() {
    test_scenarios();
    test_cost_model();
    test_arithmetic();
    test_formatting();
    test_statements();
    test_runtime_errors();
    test_hand_built_trees();
    test_environment();
    test_determinism();
    return metric_test::report("evaluator");
}
