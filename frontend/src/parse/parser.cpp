#include "parser.h"

namespace metric {

namespace {

const char* const FACTOR_EXPECTED = "Expected integer, float, identifier, boolean, or opening parenthesis";
const char* const STATEMENT_EXPECTED =
    "Expected 'let', 'print', 'if', 'while', 'set', 'def', 'return', or comment statement";

} // namespace

Parser::Parser(std::vector<Token> toks)
    : tokens(std::move(toks)), pos(0) {}

bool Parser::at_end() const {
    return pos >= tokens.size();
}

size_t Parser::remaining() const {
    return at_end() ? 0 : tokens.size() - pos;
}

const Token& Parser::current() const {
    if (pos >= tokens.size()) return tokens.back();
    return tokens[pos];
}

const Token& Parser::peek(int offset) const {
    size_t p = pos + offset;
    if (p >= tokens.size()) return tokens.back();
    return tokens[p];
}

SourceLocation Parser::current_location() const {
    if (tokens.empty()) return SourceLocation();
    return current().location;
}

bool Parser::check(TokenType type) const {
    return !at_end() && tokens[pos].type == type;
}

bool Parser::check_at(size_t offset, TokenType type) const {
    size_t p = pos + offset;
    return p < tokens.size() && tokens[p].type == type;
}

bool Parser::match(TokenType type) {
    if (check(type)) {
        pos++;
        return true;
    }
    return false;
}

Token Parser::consume(TokenType type, const std::string& msg) {
    if (!check(type)) {
        fail(msg);
    }
    return tokens[pos++];
}

void Parser::fail(const std::string& msg) const {
    throw ParseError(msg, current_location());
}

std::vector<StmtPtr> Parser::parse_program() {
    std::vector<StmtPtr> program;
    while (!at_end()) {
        if (match(TokenType::StatementSeparator)) continue;
        program.push_back(parse_stmt());
        match(TokenType::StatementSeparator);
    }
    return program;
}

StmtPtr Parser::parse_stmt() {
    if (at_end()) fail(STATEMENT_EXPECTED);

    switch (current().type) {
        case TokenType::Let: return parse_let();
        case TokenType::Print: return parse_print();
        case TokenType::If: return parse_control_flow(TokenType::If, "if");
        case TokenType::While: return parse_control_flow(TokenType::While, "while");
        case TokenType::Set: return parse_set();
        case TokenType::Comment: return parse_comment();
        case TokenType::Def: return parse_func_decl();
        case TokenType::Return: return parse_return();
        default:
            fail(STATEMENT_EXPECTED);
    }
}

StmtPtr Parser::parse_let() {
    if (remaining() < 5 || !check_at(1, TokenType::Identifier)) {
        fail("Expected 'let identifier type = expression'");
    }
    SourceLocation loc = current().location;
    std::string name = peek(1).lexeme;
    pos += 2;

    Type type = parse_type();
    consume(TokenType::Assign, "Expected '=' after type annotation");
    ExprPtr init = parse_expr();
    return Stmt::make_let(name, type, init, loc);
}

StmtPtr Parser::parse_print() {
    SourceLocation loc = current().location;
    pos++;
    return Stmt::make_print(parse_expr(), loc);
}

StmtPtr Parser::parse_set() {
    if (remaining() < 4 || !check_at(1, TokenType::Identifier)) {
        fail("Expected 'set identifier = expression'");
    }
    SourceLocation loc = current().location;
    std::string name = peek(1).lexeme;
    pos += 2;

    if (match(TokenType::LeftBracket)) {
        ExprPtr index = parse_expr();
        consume(TokenType::RightBracket, "Expected ']' after list index");
        consume(TokenType::Assign, "Expected '=' after list index");
        ExprPtr value = parse_expr();
        return Stmt::make_list_assign(name, index, value, loc);
    }

    if (match(TokenType::Assign)) {
        return Stmt::make_set(name, parse_expr(), loc);
    }

    fail("Expected 'set identifier = expression'");
}

StmtPtr Parser::parse_comment() {
    SourceLocation loc = current().location;
    pos++;
    return Stmt::make_comment(loc);
}

StmtPtr Parser::parse_control_flow(TokenType keyword, const std::string& keyword_name) {
    SourceLocation loc = current().location;
    pos++;

    if (at_end()) {
        fail("Expected expression after '" + keyword_name + "'");
    }
    ExprPtr condition = parse_expr();

    consume(TokenType::StatementSeparator, "Expected newline after '" + keyword_name + "' condition");
    consume(TokenType::Indent, "Expected indented block after '" + keyword_name + "'");
    std::vector<StmtPtr> body = parse_indented_block();
    consume(TokenType::Dedent, "Expected dedent after '" + keyword_name + "' body");

    if (keyword == TokenType::While) {
        return Stmt::make_while(condition, std::move(body), loc);
    }
    return Stmt::make_if(condition, std::move(body), loc);
}

std::vector<StmtPtr> Parser::parse_indented_block() {
    std::vector<StmtPtr> body;
    while (!at_end() && !check(TokenType::Dedent)) {
        // Blank separators and stray nested indents are tolerated inside blocks
        if (match(TokenType::StatementSeparator) || match(TokenType::Indent)) continue;
        body.push_back(parse_stmt());
    }
    return body;
}

StmtPtr Parser::parse_func_decl() {
    if (remaining() < 6) {
        fail("Expected 'def identifier(parameters) returns type'");
    }
    SourceLocation loc = current().location;
    pos++; // def

    if (!check(TokenType::Identifier)) fail("Expected function name");
    std::string name = current().lexeme;
    pos++;

    consume(TokenType::LeftParen, "Expected '(' after function name");
    std::vector<Parameter> params = parse_parameters();
    consume(TokenType::RightParen, "Expected ')' after parameters");
    consume(TokenType::Returns, "Expected 'returns'");
    if (at_end()) fail("Expected return type");
    Type return_type = parse_type();

    consume(TokenType::StatementSeparator, "Expected newline after function signature");
    consume(TokenType::Indent, "Expected indented function body");

    std::vector<StmtPtr> body;
    while (!at_end() && !check(TokenType::Dedent)) {
        body.push_back(parse_stmt());
        match(TokenType::StatementSeparator);
    }
    consume(TokenType::Dedent, "Expected dedent after function body");

    return Stmt::make_func(name, std::move(params), return_type, std::move(body), loc);
}

std::vector<Parameter> Parser::parse_parameters() {
    std::vector<Parameter> params;
    if (check(TokenType::RightParen)) return params;

    bool first = true;
    do {
        if (!check(TokenType::Identifier)) {
            fail(first ? "Expected parameter name" : "Expected parameter name after comma");
        }
        const Token& name_tok = current();
        std::string name = name_tok.lexeme;
        SourceLocation loc = name_tok.location;
        pos++;

        if (at_end()) fail("Expected parameter type");
        Type type = parse_type();
        params.emplace_back(name, type, loc);
        first = false;
    } while (match(TokenType::Comma));

    return params;
}

StmtPtr Parser::parse_return() {
    if (remaining() < 2) {
        fail("Expected 'return expression'");
    }
    SourceLocation loc = current().location;
    pos++;
    return Stmt::make_return(parse_expr(), loc);
}

Type Parser::parse_type() {
    if (at_end()) fail("Expected type");

    if (check(TokenType::List)) {
        if (remaining() < 3 || !check_at(1, TokenType::Of)) {
            fail("Expected 'of' after 'list'");
        }
        pos += 2;
        return Type::make_list(parse_type_annotation());
    }
    return Type::make_primitive(parse_type_annotation());
}

PrimitiveType Parser::parse_type_annotation() {
    if (!at_end()) {
        switch (current().type) {
            case TokenType::IntegerType: pos++; return PrimitiveType::Integer;
            case TokenType::BooleanType: pos++; return PrimitiveType::Boolean;
            case TokenType::FloatType: pos++; return PrimitiveType::Float;
            default: break;
        }
    }
    fail("Expected type annotation (integer, boolean, or float)");
}

// Expressions, lowest precedence first

ExprPtr Parser::parse_expr() {
    return parse_logic_or();
}

ExprPtr Parser::parse_logic_or() {
    ExprPtr left = parse_logic_and();
    while (check(TokenType::Or)) {
        SourceLocation loc = current().location;
        pos++;
        ExprPtr right = parse_logic_and();
        left = Expr::make_binary(left, BinaryOp::Or, right, loc);
    }
    return left;
}

ExprPtr Parser::parse_logic_and() {
    ExprPtr left = parse_logic_not();
    while (check(TokenType::And)) {
        SourceLocation loc = current().location;
        pos++;
        ExprPtr right = parse_logic_not();
        left = Expr::make_binary(left, BinaryOp::And, right, loc);
    }
    return left;
}

ExprPtr Parser::parse_logic_not() {
    if (check(TokenType::Not)) {
        SourceLocation loc = current().location;
        pos++;
        ExprPtr operand = parse_logic_not();
        return Expr::make_unary(UnaryOp::Not, operand, loc);
    }
    return parse_compare();
}

ExprPtr Parser::parse_compare() {
    ExprPtr left = parse_sum();
    while (!at_end()) {
        BinaryOp op;
        switch (current().type) {
            case TokenType::Less: op = BinaryOp::Less; break;
            case TokenType::Greater: op = BinaryOp::Greater; break;
            case TokenType::LessEqual: op = BinaryOp::LessEqual; break;
            case TokenType::GreaterEqual: op = BinaryOp::GreaterEqual; break;
            case TokenType::Equal: op = BinaryOp::Equal; break;
            case TokenType::NotEqual: op = BinaryOp::NotEqual; break;
            default: return left;
        }
        SourceLocation loc = current().location;
        pos++;
        ExprPtr right = parse_sum();
        left = Expr::make_binary(left, op, right, loc);
    }
    return left;
}

ExprPtr Parser::parse_sum() {
    ExprPtr left = parse_prod();
    while (check(TokenType::Plus) || check(TokenType::Minus)) {
        BinaryOp op = check(TokenType::Plus) ? BinaryOp::Add : BinaryOp::Sub;
        SourceLocation loc = current().location;
        pos++;
        ExprPtr right = parse_prod();
        left = Expr::make_binary(left, op, right, loc);
    }
    return left;
}

ExprPtr Parser::parse_prod() {
    ExprPtr left = parse_factor();
    while (!at_end()) {
        BinaryOp op;
        switch (current().type) {
            case TokenType::Star: op = BinaryOp::Mul; break;
            case TokenType::Slash: op = BinaryOp::Div; break;
            case TokenType::Percent: op = BinaryOp::Mod; break;
            default: return left;
        }
        SourceLocation loc = current().location;
        pos++;
        ExprPtr right = parse_factor();
        left = Expr::make_binary(left, op, right, loc);
    }
    return left;
}

ExprPtr Parser::parse_factor() {
    if (at_end()) fail(FACTOR_EXPECTED);

    const Token& tok = current();
    SourceLocation loc = tok.location;
    switch (tok.type) {
        case TokenType::IntLiteral:
            pos++;
            return Expr::make_int(tok.int_value(), loc);
        case TokenType::FloatLiteral:
            pos++;
            return Expr::make_float(tok.float_value(), loc);
        case TokenType::True:
            pos++;
            return Expr::make_bool(true, loc);
        case TokenType::False:
            pos++;
            return Expr::make_bool(false, loc);
        case TokenType::Identifier:
            return parse_identifier_factor();
        case TokenType::LeftParen: {
            pos++;
            ExprPtr inner = parse_expr();
            consume(TokenType::RightParen, "Expected closing parenthesis");
            return inner;
        }
        case TokenType::LeftBracket:
            return parse_list_literal();
        case TokenType::Repeat:
            return parse_repeat();
        case TokenType::Len:
            return parse_len();
        default:
            fail(FACTOR_EXPECTED);
    }
}

ExprPtr Parser::parse_identifier_factor() {
    SourceLocation loc = current().location;
    std::string name = current().lexeme;
    pos++;

    if (match(TokenType::LeftParen)) {
        std::vector<ExprPtr> args;
        if (!at_end() && !check(TokenType::RightParen)) {
            args.push_back(parse_expr());
            while (match(TokenType::Comma)) {
                args.push_back(parse_expr());
            }
        }
        consume(TokenType::RightParen, "Expected ')' after function arguments");
        return Expr::make_call(name, std::move(args), loc);
    }

    // Indexing applies only to a bare identifier
    if (match(TokenType::LeftBracket)) {
        ExprPtr index = parse_expr();
        consume(TokenType::RightBracket, "Expected ']' after list index");
        return Expr::make_list_access(Expr::make_variable(name, loc), index, loc);
    }

    return Expr::make_variable(name, loc);
}

ExprPtr Parser::parse_list_literal() {
    SourceLocation loc = current().location;
    pos++; // [

    std::vector<ExprPtr> elements;
    if (match(TokenType::RightBracket)) {
        return Expr::make_list(std::move(elements), loc);
    }
    if (!at_end()) {
        elements.push_back(parse_expr());
    }
    while (match(TokenType::Comma)) {
        elements.push_back(parse_expr());
    }
    consume(TokenType::RightBracket, "Expected ']' after list elements");
    return Expr::make_list(std::move(elements), loc);
}

ExprPtr Parser::parse_repeat() {
    SourceLocation loc = current().location;
    if (!check_at(1, TokenType::LeftParen)) {
        fail("Expected '(' after 'repeat'");
    }
    pos += 2;

    ExprPtr value = parse_expr();
    consume(TokenType::Comma, "Expected ',' after repeat value");
    ExprPtr count = parse_expr();
    consume(TokenType::RightParen, "Expected ')' after repeat arguments");
    return Expr::make_repeat(value, count, loc);
}

ExprPtr Parser::parse_len() {
    SourceLocation loc = current().location;
    if (!check_at(1, TokenType::LeftParen)) {
        fail("Expected '(' after 'len'");
    }
    pos += 2;

    ExprPtr list = parse_expr();
    consume(TokenType::RightParen, "Expected ')' after len argument");
    return Expr::make_len(list, loc);
}

std::vector<StmtPtr> parse(const std::vector<Token>& tokens) {
    Parser parser(tokens);
    return parser.parse_program();
}

}
