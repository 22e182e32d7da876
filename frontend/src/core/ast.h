#pragma once
#include "common.h"

namespace metric {

struct Expr;
struct Stmt;

using ExprPtr = std::shared_ptr<Expr>;
using StmtPtr = std::shared_ptr<Stmt>;

// Static type of a value. Lists are not nestable, so a list type is fully
// described by its scalar element type.
struct Type {
    enum class Kind { Primitive, List };
    Kind kind = Kind::Primitive;
    // For Primitive: the type itself. For List: the element type.
    PrimitiveType primitive = PrimitiveType::Integer;

    static Type make_primitive(PrimitiveType p);
    static Type make_list(PrimitiveType element);

    bool is_list() const { return kind == Kind::List; }
    bool is_primitive(PrimitiveType p) const { return kind == Kind::Primitive && primitive == p; }
    bool is_numeric() const { return kind == Kind::Primitive && metric::is_numeric(primitive); }
    Type element_type() const { return make_primitive(primitive); }

    bool operator==(const Type& other) const {
        return kind == other.kind && primitive == other.primitive;
    }
    bool operator!=(const Type& other) const { return !(*this == other); }

    std::string to_string() const;
};

enum class BinaryOp {
    Add, Sub, Mul, Div, Mod,
    Less, Greater, LessEqual, GreaterEqual,
    Equal, NotEqual,
    And, Or
};

enum class UnaryOp {
    Not
};

std::string binary_op_name(BinaryOp op);
std::string unary_op_name(UnaryOp op);

struct Expr {
    enum class Kind {
        IntLiteral, FloatLiteral, BoolLiteral,
        Variable, Unary, Binary, Call,
        ListLiteral, ListAccess, Repeat, Len
    };
    Kind kind;
    SourceLocation location;

    // Literals
    int64_t int_val = 0;
    double float_val = 0.0;
    bool bool_val = false;

    // Variable, Call
    std::string name;

    // Binary/Unary
    BinaryOp binary_op = BinaryOp::Add;
    UnaryOp unary_op = UnaryOp::Not;
    ExprPtr left, right;
    ExprPtr operand;

    // Call
    std::vector<ExprPtr> args;

    // ListLiteral
    std::vector<ExprPtr> elements;

    // ListAccess stores the list in operand and the index in index.
    // Len stores the list in operand.
    // Repeat stores the repeated value in operand and the count in count.
    ExprPtr index;
    ExprPtr count;

    static ExprPtr make_int(int64_t val, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_float(double val, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_bool(bool val, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_variable(const std::string& name, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_unary(UnaryOp op, ExprPtr operand, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_binary(ExprPtr l, BinaryOp op, ExprPtr r, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_call(const std::string& name, std::vector<ExprPtr> args, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_list(std::vector<ExprPtr> elems, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_list_access(ExprPtr list, ExprPtr idx, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_repeat(ExprPtr value, ExprPtr count, const SourceLocation& loc = SourceLocation());
    static ExprPtr make_len(ExprPtr list, const SourceLocation& loc = SourceLocation());
};

struct Parameter {
    std::string name;
    Type type;
    SourceLocation location;

    Parameter(const std::string& n, const Type& t, const SourceLocation& loc = SourceLocation())
        : name(n), type(t), location(loc) {}
};

struct Stmt {
    enum class Kind {
        Let, Set, ListAssign, Print, If, While, Comment, FuncDecl, Return
    };
    Kind kind;
    SourceLocation location;

    // Let/Set/ListAssign target, FuncDecl name
    std::string name;

    // Let
    Type var_type;

    // Value of Let/Set/ListAssign/Print/Return
    ExprPtr expr;

    // ListAssign
    ExprPtr index;

    // If/While
    ExprPtr condition;

    // If/While/FuncDecl
    std::vector<StmtPtr> body;

    // FuncDecl
    std::vector<Parameter> params;
    Type return_type;

    static StmtPtr make_let(const std::string& name, const Type& type, ExprPtr init,
                            const SourceLocation& loc = SourceLocation());
    static StmtPtr make_set(const std::string& name, ExprPtr value, const SourceLocation& loc = SourceLocation());
    static StmtPtr make_list_assign(const std::string& name, ExprPtr idx, ExprPtr value,
                                    const SourceLocation& loc = SourceLocation());
    static StmtPtr make_print(ExprPtr e, const SourceLocation& loc = SourceLocation());
    static StmtPtr make_if(ExprPtr cond, std::vector<StmtPtr> body, const SourceLocation& loc = SourceLocation());
    static StmtPtr make_while(ExprPtr cond, std::vector<StmtPtr> body, const SourceLocation& loc = SourceLocation());
    static StmtPtr make_comment(const SourceLocation& loc = SourceLocation());
    static StmtPtr make_func(const std::string& name, std::vector<Parameter> params, const Type& ret,
                             std::vector<StmtPtr> body, const SourceLocation& loc = SourceLocation());
    static StmtPtr make_return(ExprPtr e, const SourceLocation& loc = SourceLocation());
};

}
