#include "lexer.h"
#include "constants.h"
#include <cctype>
#include <unordered_map>

namespace metric {

namespace {

const std::unordered_map<std::string, TokenType>& keyword_table() {
    static const std::unordered_map<std::string, TokenType> keywords = {
        {"let", TokenType::Let},
        {"print", TokenType::Print},
        {"true", TokenType::True},
        {"false", TokenType::False},
        {"if", TokenType::If},
        {"while", TokenType::While},
        {"set", TokenType::Set},
        {"integer", TokenType::IntegerType},
        {"boolean", TokenType::BooleanType},
        {"float", TokenType::FloatType},
        {"def", TokenType::Def},
        {"returns", TokenType::Returns},
        {"return", TokenType::Return},
        {"list", TokenType::List},
        {"of", TokenType::Of},
        {"repeat", TokenType::Repeat},
        {"len", TokenType::Len},
        {"and", TokenType::And},
        {"or", TokenType::Or},
        {"not", TokenType::Not},
    };
    return keywords;
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::vector<std::string> split_lines(const std::string& source) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = source.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(source.substr(start));
            break;
        }
        lines.push_back(source.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

} // namespace

std::string token_type_name(TokenType type) {
    switch (type) {
        case TokenType::IntLiteral: return "Integer";
        case TokenType::FloatLiteral: return "Float";
        case TokenType::Identifier: return "Identifier";
        case TokenType::Let: return "Let";
        case TokenType::Print: return "Print";
        case TokenType::Set: return "Set";
        case TokenType::If: return "If";
        case TokenType::While: return "While";
        case TokenType::Def: return "Def";
        case TokenType::Returns: return "Returns";
        case TokenType::Return: return "Return";
        case TokenType::True: return "True";
        case TokenType::False: return "False";
        case TokenType::IntegerType: return "IntegerType";
        case TokenType::BooleanType: return "BooleanType";
        case TokenType::FloatType: return "FloatType";
        case TokenType::List: return "List";
        case TokenType::Of: return "Of";
        case TokenType::Repeat: return "Repeat";
        case TokenType::Len: return "Len";
        case TokenType::And: return "And";
        case TokenType::Or: return "Or";
        case TokenType::Not: return "Not";
        case TokenType::Plus: return "Plus";
        case TokenType::Minus: return "Minus";
        case TokenType::Star: return "Multiply";
        case TokenType::Slash: return "Divide";
        case TokenType::Percent: return "Modulus";
        case TokenType::Assign: return "Equals";
        case TokenType::Equal: return "EqualEqual";
        case TokenType::NotEqual: return "NotEqual";
        case TokenType::Less: return "LessThan";
        case TokenType::LessEqual: return "LessThanOrEqual";
        case TokenType::Greater: return "GreaterThan";
        case TokenType::GreaterEqual: return "GreaterThanOrEqual";
        case TokenType::Comma: return "Comma";
        case TokenType::LeftParen: return "LeftParenthesis";
        case TokenType::RightParen: return "RightParenthesis";
        case TokenType::LeftBracket: return "LeftBracket";
        case TokenType::RightBracket: return "RightBracket";
        case TokenType::StatementSeparator: return "StatementSeparator";
        case TokenType::Indent: return "Indent";
        case TokenType::Dedent: return "Dedent";
        case TokenType::Comment: return "Comment";
    }
    return "Unknown";
}

Lexer::Lexer(const std::string& src, const std::string& fname)
    : source(src), filename(fname), pos(0), line_end(0), line(0) {}

char Lexer::peek(int offset) const {
    if (pos + offset >= line_end) return '\0';
    return line_text[pos + offset];
}

char Lexer::advance() {
    if (pos >= line_end) return '\0';
    return line_text[pos++];
}

SourceLocation Lexer::location_at(size_t index) const {
    return SourceLocation(filename, line, static_cast<int>(index) + 1);
}

SourceLocation Lexer::current_location() const {
    return location_at(pos);
}

void Lexer::handle_indentation(size_t spaces, std::vector<size_t>& indent_stack,
                               std::vector<Token>& tokens) {
    SourceLocation loc = location_at(spaces);
    if (spaces % INDENT_WIDTH != 0) {
        throw TokenizerError("Invalid indentation: expected multiples of 4 spaces", location_at(0));
    }
    size_t depth = spaces / INDENT_WIDTH;

    if (depth > indent_stack.back()) {
        if (depth != indent_stack.back() + 1) {
            throw TokenizerError("Invalid indentation: expected " +
                                 std::to_string((indent_stack.back() + 1) * INDENT_WIDTH) + " spaces",
                                 location_at(0));
        }
        indent_stack.push_back(depth);
        tokens.emplace_back(TokenType::Indent, "", loc);
    } else if (depth < indent_stack.back()) {
        while (indent_stack.size() > 1 && indent_stack.back() > depth) {
            indent_stack.pop_back();
            tokens.emplace_back(TokenType::Dedent, "", loc);
        }
        if (indent_stack.back() != depth) {
            throw TokenizerError("Invalid indentation: expected " +
                                 std::to_string(indent_stack.back() * INDENT_WIDTH) + " spaces",
                                 location_at(0));
        }
    }
}

Token Lexer::read_number() {
    SourceLocation loc = current_location();
    std::string num;
    if (peek() == '-') {
        num += advance();
    }
    while (isdigit(static_cast<unsigned char>(peek()))) {
        num += advance();
    }

    if (peek() == '.') {
        num += advance();
        if (!isdigit(static_cast<unsigned char>(peek()))) {
            throw TokenizerError("Invalid float: missing digits after decimal point", loc);
        }
        while (isdigit(static_cast<unsigned char>(peek()))) {
            num += advance();
        }
        try {
            double val = std::stod(num);
            Token t(TokenType::FloatLiteral, num, loc);
            t.value = val;
            return t;
        } catch (const std::exception& e) {
            throw TokenizerError("Float literal out of range: " + num, loc);
        }
    }

    try {
        int64_t val = std::stoll(num);
        Token t(TokenType::IntLiteral, num, loc);
        t.value = val;
        return t;
    } catch (const std::exception& e) {
        throw TokenizerError("Integer literal out of range: " + num, loc);
    }
}

Token Lexer::read_identifier() {
    SourceLocation loc = current_location();
    std::string id;
    while (isalpha(static_cast<unsigned char>(peek()))) {
        id += advance();
    }
    const auto& keywords = keyword_table();
    auto it = keywords.find(id);
    if (it != keywords.end()) {
        return Token(it->second, id, loc);
    }
    return Token(TokenType::Identifier, id, loc);
}

void Lexer::scan_code(size_t end, std::vector<Token>& tokens) {
    line_end = end;
    while (pos < line_end) {
        SourceLocation loc = current_location();
        char c = peek();

        if (c == ' ') {
            advance();
            continue;
        }

        if (isdigit(static_cast<unsigned char>(c)) ||
            (c == '-' && isdigit(static_cast<unsigned char>(peek(1))))) {
            tokens.push_back(read_number());
            continue;
        }

        if (isalpha(static_cast<unsigned char>(c))) {
            tokens.push_back(read_identifier());
            continue;
        }

        // Two-character operators first
        if (peek(1) == '=') {
            TokenType two;
            bool matched = true;
            switch (c) {
                case '=': two = TokenType::Equal; break;
                case '!': two = TokenType::NotEqual; break;
                case '<': two = TokenType::LessEqual; break;
                case '>': two = TokenType::GreaterEqual; break;
                default: matched = false; two = TokenType::Assign; break;
            }
            if (matched) {
                std::string lexeme = line_text.substr(pos, 2);
                advance();
                advance();
                tokens.emplace_back(two, lexeme, loc);
                continue;
            }
        }

        advance();
        switch (c) {
            case '+': tokens.emplace_back(TokenType::Plus, "+", loc); break;
            case '-': tokens.emplace_back(TokenType::Minus, "-", loc); break;
            case '*': tokens.emplace_back(TokenType::Star, "*", loc); break;
            case '/': tokens.emplace_back(TokenType::Slash, "/", loc); break;
            case '%': tokens.emplace_back(TokenType::Percent, "%", loc); break;
            case '(': tokens.emplace_back(TokenType::LeftParen, "(", loc); break;
            case ')': tokens.emplace_back(TokenType::RightParen, ")", loc); break;
            case '[': tokens.emplace_back(TokenType::LeftBracket, "[", loc); break;
            case ']': tokens.emplace_back(TokenType::RightBracket, "]", loc); break;
            case ',': tokens.emplace_back(TokenType::Comma, ",", loc); break;
            case '=': tokens.emplace_back(TokenType::Assign, "=", loc); break;
            case '<': tokens.emplace_back(TokenType::Less, "<", loc); break;
            case '>': tokens.emplace_back(TokenType::Greater, ">", loc); break;
            case '\t':
                throw TokenizerError("Unexpected character: \\t", loc);
            default:
                throw TokenizerError("Unexpected character: " + std::string(1, c), loc);
        }
    }
}

void Lexer::scan_line(std::vector<Token>& tokens) {
    size_t hash = line_text.find('#', pos);
    if (hash == std::string::npos || hash >= line_end) {
        scan_code(line_end, tokens);
        return;
    }

    size_t code_end = hash;
    while (code_end > pos && isspace(static_cast<unsigned char>(line_text[code_end - 1]))) {
        code_end--;
    }
    scan_code(code_end, tokens);
    tokens.emplace_back(TokenType::Comment, line_text.substr(hash), location_at(hash));
}

std::vector<Token> Lexer::tokenize() {
    std::vector<Token> tokens;
    std::vector<std::string> lines = split_lines(source);
    std::vector<size_t> indent_stack = {0};

    size_t last_code_line = 0;
    bool has_code = false;
    for (size_t i = 0; i < lines.size(); i++) {
        if (!is_blank(lines[i])) {
            last_code_line = i;
            has_code = true;
        }
    }
    if (!has_code) {
        return tokens;
    }

    for (size_t i = 0; i <= last_code_line; i++) {
        if (is_blank(lines[i])) continue;

        line_text = lines[i];
        line = static_cast<int>(i) + 1;
        pos = 0;
        line_end = line_text.size();
        while (line_end > 0 && isspace(static_cast<unsigned char>(line_text[line_end - 1]))) {
            line_end--;
        }

        size_t spaces = 0;
        while (spaces < line_end && line_text[spaces] == ' ') {
            spaces++;
        }
        handle_indentation(spaces, indent_stack, tokens);

        size_t content_end = line_end;
        pos = spaces;
        // Other leading whitespace is stripped here and left for the style checks
        while (pos < line_end && isspace(static_cast<unsigned char>(line_text[pos]))) {
            pos++;
        }
        scan_line(tokens);

        if (i < last_code_line) {
            tokens.emplace_back(TokenType::StatementSeparator, "\n", location_at(content_end));
        }
        line_end = content_end;
    }

    // Close any blocks still open at end of input
    SourceLocation eof_loc = location_at(line_end);
    while (indent_stack.size() > 1) {
        indent_stack.pop_back();
        tokens.emplace_back(TokenType::Dedent, "", eof_loc);
    }

    return tokens;
}

std::vector<Token> tokenize(const std::string& source, const std::string& filename) {
    Lexer lexer(source, filename);
    return lexer.tokenize();
}

}
