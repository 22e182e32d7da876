#pragma once
#include <string>
#include <vector>
#include <memory>
#include <unordered_map>
#include <cstdint>
#include <stdexcept>
#include <iostream>

namespace metric {

struct SourceLocation {
    std::string filename;
    int line;
    int column;
    SourceLocation(const std::string& f = "", int l = 0, int c = 0)
        : filename(f), line(l), column(c) {}
};

// Base of every pipeline error. what() is the bare message; formatted() is
// the user-facing rendering "[Line L, Column C] <Kind> Error | <message>".
class CompileError : public std::runtime_error {
public:
    SourceLocation location;
    CompileError(const std::string& msg, const SourceLocation& loc = SourceLocation())
        : std::runtime_error(msg), location(loc) {}

    virtual const char* kind() const { return "Compile"; }

    std::string formatted() const {
        return "[Line " + std::to_string(location.line) + ", Column " +
               std::to_string(location.column) + "] " + kind() + " Error | " + what();
    }
};

class TokenizerError : public CompileError {
public:
    using CompileError::CompileError;
    const char* kind() const override { return "Tokenizer"; }
};

class StyleError : public CompileError {
public:
    using CompileError::CompileError;
    const char* kind() const override { return "Style"; }
};

class ParseError : public CompileError {
public:
    using CompileError::CompileError;
    const char* kind() const override { return "Parse"; }
};

class TypeCheckError : public CompileError {
public:
    using CompileError::CompileError;
    const char* kind() const override { return "TypeCheck"; }
};

class EvaluationError : public CompileError {
public:
    using CompileError::CompileError;
    const char* kind() const override { return "Evaluation"; }
};

enum class PrimitiveType {
    Integer,
    Boolean,
    Float
};

inline std::string primitive_name(PrimitiveType t) {
    switch(t) {
        case PrimitiveType::Integer: return "integer";
        case PrimitiveType::Boolean: return "boolean";
        case PrimitiveType::Float: return "float";
    }
    return "";
}

inline bool is_numeric(PrimitiveType t) {
    return t == PrimitiveType::Integer || t == PrimitiveType::Float;
}

}
