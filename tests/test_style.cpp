#include "lexer.h"
#include "style_validator.h"
#include "test_support.h"

#include <string>

using namespace metric;
using metric_test::check;
using metric_test::check_equal;
using metric_test::check_no_throw;
using metric_test::check_throws;

namespace {

void lint(const std::string& source) {
    validate_style(source, tokenize(source));
}

void expect_style_error(const std::string& source, const std::string& message) {
    check_throws<StyleError>([&] { lint(source); }, message, "style error: " + message);
}

void expect_position(const std::string& source, int line, int column, const std::string& what) {
    try {
        lint(source);
        check(false, what + ": no error raised");
    } catch (const StyleError& e) {
        check_equal(e.location.line, line, what + " line");
        check_equal(e.location.column, column, what + " column");
    }
}

void test_clean_programs() {
    check_no_throw([] { lint("let x integer = 5\nprint x"); }, "simple program");
    check_no_throw([] {
        lint("# sum the list\n"
             "let xs list of integer = [1, 2, 3]\n"
             "let total integer = 0\n"
             "let i integer = 0\n"
             "\n"
             "while i < len(xs)\n"
             "    set total = total + xs[i]\n"
             "    set i = i + 1\n"
             "print total # done");
    }, "program with comments and one blank line");
    check_no_throw([] {
        lint("def add(x integer, y integer) returns integer\n    return x + y\nprint add(3, -4)");
    }, "function declaration and call");
}

void test_layout() {
    expect_style_error("", "Program must not be empty");
    expect_style_error("   ", "Program must not be empty");
    expect_style_error("print 1\r\nprint 2", "Carriage return newlines not allowed; use \\n only");
    expect_style_error("\nprint 1", "Leading newlines not allowed");
    expect_style_error("print 1\n", "Trailing newlines not allowed");
    expect_style_error("print 1\n\n\nprint 2", "Too many consecutive newlines: maximum 2 allowed");
    expect_style_error("print 1 ", "Trailing spaces not allowed");

    expect_position("print 1\n", 2, 1, "trailing newline");
    expect_position("print 1   ", 1, 8, "trailing spaces");
    expect_position("print 1\r\nprint 2", 1, 8, "carriage return");

    // A leading CR is whitespace to the tokenizer and a layout error to the linter
    std::string leading_cr = "\rlet x integer = 5\nprint x";
    check_no_throw([&] { tokenize(leading_cr); }, "leading carriage return tokenizes");
    try {
        lint(leading_cr);
        check(false, "leading carriage return should fail");
    } catch (const StyleError& e) {
        check_equal(e.formatted(),
                    "[Line 1, Column 1] Style Error | Carriage return newlines not allowed; use \\n only",
                    "leading carriage return diagnostic");
    }
}

void test_indentation_multiple() {
    // The tokenizer already rejects such indentation; the linter checks the raw text independently
    check_throws<StyleError>([] { validate_style("  print 1", tokenize("print 1")); },
                             "Indentation must be in multiples of 4 spaces", "two-space indent");
}

void test_statements_per_line() {
    expect_style_error("print 1 print 2", "Statements must be separated by a newline");
    expect_position("print 1 print 2", 1, 9, "second statement keyword");
    check_no_throw([] { lint("print 1 # let print"); }, "keywords inside a comment");
}

void test_token_spacing() {
    expect_style_error("print  1", "Multiple spaces not allowed between tokens");
    expect_position("print  1", 1, 6, "double space");
    expect_style_error("print x+1", "Expected space before operator '+'");
    expect_position("print x+1", 1, 8, "operator after identifier");
    expect_style_error("let y boolean = x==1", "Expected space before operator '='");
    expect_style_error("let x1 integer = 5", "Expected space after identifier 'x'");
    expect_style_error("print 5x", "Expected space after number '5'");
    check_no_throw([] { lint("print -5 - -3"); }, "negative literals after operators");
}

void test_comment_spacing() {
    expect_style_error("print 1# note", "Comments must be separated from code by exactly one space");
    // Indentation counts as the separator, so an indented comment line has too many spaces
    expect_style_error("if true\n    # indented note\n    print 1",
                       "Comments must be separated from code by exactly one space");
    expect_position("if true\n    # indented note\n    print 1", 2, 5, "indented comment position");
    check_no_throw([] { lint("print 1 # note"); }, "single space before comment");
}

void test_comma_spacing() {
    expect_style_error("print [1 , 2]", "Space before comma not allowed");
    expect_style_error("print [1,2]", "Space required after comma");
    expect_position("print [1,2]", 1, 9, "comma position");
}

void test_formatting() {
    try {
        lint("print 1 ");
        check(false, "trailing space should fail");
    } catch (const StyleError& e) {
        check_equal(e.formatted(), "[Line 1, Column 8] Style Error | Trailing spaces not allowed",
                    "formatted style error");
    }
}

} // namespace

int main() {
    test_clean_programs();
    test_layout();
    test_indentation_multiple();
    test_statements_per_line();
    test_token_spacing();
    test_comment_spacing();
    test_comma_spacing();
    test_formatting();
    return metric_test::report("style");
}
