#pragma once
#include "common.h"
#include <variant>

namespace metric {

enum class TokenType {
    // Literals
    IntLiteral, FloatLiteral,
    // Identifiers
    Identifier,
    // Statement keywords
    Let, Print, Set, If, While, Def, Returns, Return,
    // Value keywords
    True, False,
    // Type keywords
    IntegerType, BooleanType, FloatType, List, Of,
    // Builtins
    Repeat, Len,
    // Logical operators
    And, Or, Not,
    // Operators
    Plus, Minus, Star, Slash, Percent,
    Assign, Equal, NotEqual, Less, LessEqual, Greater, GreaterEqual,
    Comma,
    // Brackets
    LeftParen, RightParen, LeftBracket, RightBracket,
    // Layout
    StatementSeparator, Indent, Dedent,
    // Special
    Comment
};

std::string token_type_name(TokenType type);

struct Token {
    TokenType type;
    std::string lexeme;
    SourceLocation location;
    std::variant<int64_t, double> value;

    Token(TokenType t, const std::string& lex, const SourceLocation& loc)
        : type(t), lexeme(lex), location(loc) {}

    int64_t int_value() const { return std::get<int64_t>(value); }
    double float_value() const { return std::get<double>(value); }
};

// Line-oriented scanner. Leading spaces are turned into Indent/Dedent tokens
// (four spaces per level) and every non-empty line except the last one is
// followed by a StatementSeparator.
class Lexer {
    std::string source;
    std::string filename;

    // Current line being scanned. pos indexes into line_text.
    std::string line_text;
    size_t pos;
    size_t line_end;
    int line;

public:
    Lexer(const std::string& src, const std::string& fname = "");
    std::vector<Token> tokenize();

private:
    char peek(int offset = 0) const;
    char advance();
    SourceLocation location_at(size_t index) const;
    SourceLocation current_location() const;

    void handle_indentation(size_t spaces, std::vector<size_t>& indent_stack,
                            std::vector<Token>& tokens);
    void scan_line(std::vector<Token>& tokens);
    void scan_code(size_t end, std::vector<Token>& tokens);

    Token read_number();
    Token read_identifier();
};

std::vector<Token> tokenize(const std::string& source, const std::string& filename = "");

}
