#pragma once
#include "lexer.h"
#include "ast.h"

namespace metric {

// Recursive-descent parser. The first mismatch throws ParseError; there is
// no recovery.
class Parser {
    std::vector<Token> tokens;
    size_t pos;

public:
    Parser(std::vector<Token> toks);
    std::vector<StmtPtr> parse_program();

private:
    bool at_end() const;
    size_t remaining() const;
    const Token& current() const;
    const Token& peek(int offset = 1) const;
    SourceLocation current_location() const;
    bool check(TokenType type) const;
    bool check_at(size_t offset, TokenType type) const;
    bool match(TokenType type);
    Token consume(TokenType type, const std::string& msg);
    [[noreturn]] void fail(const std::string& msg) const;

    StmtPtr parse_stmt();
    StmtPtr parse_let();
    StmtPtr parse_print();
    StmtPtr parse_set();
    StmtPtr parse_comment();
    StmtPtr parse_control_flow(TokenType keyword, const std::string& keyword_name);
    StmtPtr parse_func_decl();
    StmtPtr parse_return();
    std::vector<StmtPtr> parse_indented_block();
    std::vector<Parameter> parse_parameters();

    Type parse_type();
    PrimitiveType parse_type_annotation();

    ExprPtr parse_expr();
    ExprPtr parse_logic_or();
    ExprPtr parse_logic_and();
    ExprPtr parse_logic_not();
    ExprPtr parse_compare();
    ExprPtr parse_sum();
    ExprPtr parse_prod();
    ExprPtr parse_factor();
    ExprPtr parse_identifier_factor();
    ExprPtr parse_list_literal();
    ExprPtr parse_repeat();
    ExprPtr parse_len();
};

std::vector<StmtPtr> parse(const std::vector<Token>& tokens);

}
