#include "ast.h"

namespace metric {

// Type factory methods
Type Type::make_primitive(PrimitiveType p) {
    Type t;
    t.kind = Kind::Primitive;
    t.primitive = p;
    return t;
}

Type Type::make_list(PrimitiveType element) {
    Type t;
    t.kind = Kind::List;
    t.primitive = element;
    return t;
}

std::string Type::to_string() const {
    switch (kind) {
        case Kind::Primitive:
            return primitive_name(primitive);
        case Kind::List:
            return "list of " + primitive_name(primitive);
    }
    return "";
}

std::string binary_op_name(BinaryOp op) {
    switch (op) {
        case BinaryOp::Add: return "Addition";
        case BinaryOp::Sub: return "Subtraction";
        case BinaryOp::Mul: return "Multiplication";
        case BinaryOp::Div: return "Division";
        case BinaryOp::Mod: return "Modulus";
        case BinaryOp::Less: return "LessThan";
        case BinaryOp::Greater: return "GreaterThan";
        case BinaryOp::LessEqual: return "LessThanOrEqual";
        case BinaryOp::GreaterEqual: return "GreaterThanOrEqual";
        case BinaryOp::Equal: return "EqualEqual";
        case BinaryOp::NotEqual: return "NotEqual";
        case BinaryOp::And: return "And";
        case BinaryOp::Or: return "Or";
    }
    return "";
}

std::string unary_op_name(UnaryOp op) {
    switch (op) {
        case UnaryOp::Not: return "Not";
    }
    return "";
}

// Expr factory methods
ExprPtr Expr::make_int(int64_t val, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::IntLiteral;
    e->int_val = val;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_float(double val, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::FloatLiteral;
    e->float_val = val;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_bool(bool val, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::BoolLiteral;
    e->bool_val = val;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_variable(const std::string& name, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::Variable;
    e->name = name;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_unary(UnaryOp op, ExprPtr operand, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::Unary;
    e->unary_op = op;
    e->operand = operand;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_binary(ExprPtr l, BinaryOp op, ExprPtr r, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::Binary;
    e->binary_op = op;
    e->left = l;
    e->right = r;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_call(const std::string& name, std::vector<ExprPtr> args, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::Call;
    e->name = name;
    e->args = std::move(args);
    e->location = loc;
    return e;
}

ExprPtr Expr::make_list(std::vector<ExprPtr> elems, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::ListLiteral;
    e->elements = std::move(elems);
    e->location = loc;
    return e;
}

ExprPtr Expr::make_list_access(ExprPtr list, ExprPtr idx, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::ListAccess;
    e->operand = list;
    e->index = idx;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_repeat(ExprPtr value, ExprPtr count, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::Repeat;
    e->operand = value;
    e->count = count;
    e->location = loc;
    return e;
}

ExprPtr Expr::make_len(ExprPtr list, const SourceLocation& loc) {
    auto e = std::make_shared<Expr>();
    e->kind = Kind::Len;
    e->operand = list;
    e->location = loc;
    return e;
}

// Stmt factory methods
StmtPtr Stmt::make_let(const std::string& name, const Type& type, ExprPtr init, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::Let;
    s->name = name;
    s->var_type = type;
    s->expr = init;
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_set(const std::string& name, ExprPtr value, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::Set;
    s->name = name;
    s->expr = value;
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_list_assign(const std::string& name, ExprPtr idx, ExprPtr value, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::ListAssign;
    s->name = name;
    s->index = idx;
    s->expr = value;
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_print(ExprPtr e, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::Print;
    s->expr = e;
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_if(ExprPtr cond, std::vector<StmtPtr> body, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::If;
    s->condition = cond;
    s->body = std::move(body);
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_while(ExprPtr cond, std::vector<StmtPtr> body, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::While;
    s->condition = cond;
    s->body = std::move(body);
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_comment(const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::Comment;
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_func(const std::string& name, std::vector<Parameter> params, const Type& ret,
                        std::vector<StmtPtr> body, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::FuncDecl;
    s->name = name;
    s->params = std::move(params);
    s->return_type = ret;
    s->body = std::move(body);
    s->location = loc;
    return s;
}

StmtPtr Stmt::make_return(ExprPtr e, const SourceLocation& loc) {
    auto s = std::make_shared<Stmt>();
    s->kind = Kind::Return;
    s->expr = e;
    s->location = loc;
    return s;
}

}
