#include "style_validator.h"
#include "constants.h"
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace metric {

namespace {

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

std::string code_part(const std::string& line) {
    size_t hash = line.find('#');
    return hash == std::string::npos ? line : line.substr(0, hash);
}

bool is_blank(const std::string& text) {
    for (char c : text) {
        if (!isspace(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

bool is_alpha(char c) { return isalpha(static_cast<unsigned char>(c)) != 0; }
bool is_digit(char c) { return isdigit(static_cast<unsigned char>(c)) != 0; }
bool is_alnum(char c) { return isalnum(static_cast<unsigned char>(c)) != 0; }

[[noreturn]] void style_error(const std::string& msg, size_t line, size_t column) {
    throw StyleError(msg, SourceLocation("", static_cast<int>(line), static_cast<int>(column)));
}

void check_line_endings(const std::string& source) {
    size_t line = 1;
    size_t column = 1;
    for (char c : source) {
        if (c == '\r') {
            style_error("Carriage return newlines not allowed; use \\n only", line, column);
        }
        if (c == '\n') {
            line++;
            column = 1;
        } else {
            column++;
        }
    }
}

void check_leading_trailing_newlines(const std::string& source) {
    if (source.empty()) return;
    if (source.front() == '\n') {
        style_error("Leading newlines not allowed", 1, 1);
    }
    if (source.back() == '\n') {
        size_t newlines = 0;
        for (char c : source) {
            if (c == '\n') newlines++;
        }
        style_error("Trailing newlines not allowed", newlines + 1, 1);
    }
}

void check_consecutive_newlines(const std::string& source) {
    size_t consecutive = 0;
    size_t line = 1;
    for (char c : source) {
        if (c == '\n') {
            consecutive++;
            if (consecutive > 2) {
                style_error("Too many consecutive newlines: maximum 2 allowed", line, 1);
            }
            line++;
        } else {
            consecutive = 0;
        }
    }
}

void check_line_whitespace(const std::vector<std::string>& lines) {
    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i];

        if (!line.empty() && line.back() == ' ') {
            size_t end = line.size();
            while (end > 0 && isspace(static_cast<unsigned char>(line[end - 1]))) {
                end--;
            }
            style_error("Trailing spaces not allowed", i + 1, end + 1);
        }

        size_t leading = 0;
        while (leading < line.size() && line[leading] == ' ') {
            leading++;
        }
        if (leading % INDENT_WIDTH != 0) {
            style_error("Indentation must be in multiples of 4 spaces", i + 1,
                        (leading / INDENT_WIDTH) * INDENT_WIDTH + 1);
        }
    }
}

void check_one_statement_per_line(const std::vector<std::string>& lines) {
    static const std::unordered_set<std::string> statement_keywords = {
        "let", "print", "if", "while", "set", "def", "return"
    };

    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i];
        std::istringstream words(code_part(line));
        std::string word;
        int keyword_count = 0;
        size_t search_from = 0;
        while (words >> word) {
            size_t word_pos = line.find(word, search_from);
            if (statement_keywords.count(word)) {
                keyword_count++;
                if (keyword_count == 2) {
                    style_error("Statements must be separated by a newline", i + 1, word_pos + 1);
                }
            }
            search_from = word_pos + word.size();
        }
    }
}

void check_multiple_spaces(const std::string& code, size_t line_num) {
    size_t i = 0;
    while (i < code.size() && code[i] == ' ') {
        i++;
    }
    for (; i + 1 < code.size(); i++) {
        if (code[i] == ' ' && code[i + 1] == ' ') {
            style_error("Multiple spaces not allowed between tokens", line_num, i + 1);
        }
    }
}

void check_operator_spacing(const std::string& code, size_t line_num) {
    static const std::string operators = "+-*/%=<>!";
    for (size_t i = 1; i < code.size(); i++) {
        if (operators.find(code[i]) != std::string::npos && is_alnum(code[i - 1])) {
            style_error(std::string("Expected space before operator '") + code[i] + "'", line_num, i + 1);
        }
    }
}

void check_identifier_number_spacing(const std::string& code, size_t line_num) {
    size_t i = 0;
    while (i < code.size()) {
        if (is_alpha(code[i])) {
            size_t start = i;
            while (i < code.size() && is_alpha(code[i])) {
                i++;
            }
            if (i < code.size() && is_alnum(code[i])) {
                style_error("Expected space after identifier '" + code.substr(start, i - start) + "'",
                            line_num, i + 1);
            }
        } else if (is_digit(code[i])) {
            size_t start = i;
            while (i < code.size() && (is_digit(code[i]) || code[i] == '.')) {
                i++;
            }
            if (i < code.size() && is_alnum(code[i])) {
                style_error("Expected space after number '" + code.substr(start, i - start) + "'",
                            line_num, i + 1);
            }
        } else {
            i++;
        }
    }
}

void check_token_spacing(const std::vector<std::string>& lines) {
    for (size_t i = 0; i < lines.size(); i++) {
        std::string code = code_part(lines[i]);
        if (is_blank(code)) continue;
        check_multiple_spaces(code, i + 1);
        check_operator_spacing(code, i + 1);
        check_identifier_number_spacing(code, i + 1);
    }
}

void check_comment_spacing(const std::vector<std::string>& lines) {
    for (size_t i = 0; i < lines.size(); i++) {
        const std::string& line = lines[i];
        size_t hash = line.find('#');
        if (hash == std::string::npos || hash == 0) continue;

        if (line[hash - 1] != ' ' || (hash > 1 && line[hash - 2] == ' ')) {
            style_error("Comments must be separated from code by exactly one space", i + 1, hash + 1);
        }
    }
}

void check_comma_spacing(const std::vector<std::string>& lines) {
    for (size_t i = 0; i < lines.size(); i++) {
        std::string code = code_part(lines[i]);
        for (size_t c = 0; c < code.size(); c++) {
            if (code[c] != ',') continue;
            if (c > 0 && code[c - 1] == ' ') {
                style_error("Space before comma not allowed", i + 1, c + 1);
            }
            if (c + 1 >= code.size() || code[c + 1] != ' ') {
                style_error("Space required after comma", i + 1, c + 1);
            }
        }
    }
}

} // namespace

void validate_style(const std::string& source, const std::vector<Token>& tokens) {
    // A source without a single token is blank or whitespace only
    if (tokens.empty()) {
        style_error("Program must not be empty", 1, 1);
    }
    check_line_endings(source);
    check_leading_trailing_newlines(source);
    check_consecutive_newlines(source);

    std::vector<std::string> lines = split_lines(source);
    check_line_whitespace(lines);
    check_one_statement_per_line(lines);
    check_token_spacing(lines);
    check_comment_spacing(lines);
    check_comma_spacing(lines);
}

}
