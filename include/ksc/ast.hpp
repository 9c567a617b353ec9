// KSC abstract syntax tree handed to the lowering engine by an external front end.
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ksc::ast {

struct Expression;
struct Statement;
using ExprPtr = std::shared_ptr<Expression>;
using StmtPtr = std::shared_ptr<Statement>;

// A Block is only legal as an expression statement; it yields no value.
struct Block { std::vector<StmtPtr> statements; };

struct ExpressionStatement {
    std::variant<ExprPtr, Block> node;
    bool is_block() const { return std::holds_alternative<Block>(node); }
};

enum class BinaryOp { Add, Sub, Mul, Div, IntDiv, Rem, Eq, Ne, Lt, Gt, Le, Ge };

inline bool is_comparison(BinaryOp op){ return op>=BinaryOp::Eq; }

inline const char* op_name(BinaryOp op){
    switch(op){
        case BinaryOp::Add: return "add";
        case BinaryOp::Sub: return "sub";
        case BinaryOp::Mul: return "mul";
        case BinaryOp::Div: return "div";
        case BinaryOp::IntDiv: return "integer-div";
        case BinaryOp::Rem: return "remainder";
        case BinaryOp::Eq: return "eq";
        case BinaryOp::Ne: return "ne";
        case BinaryOp::Lt: return "lt";
        case BinaryOp::Gt: return "gt";
        case BinaryOp::Le: return "le";
        case BinaryOp::Ge: return "ge";
    }
    return "?";
}

struct FunctionCall { std::string callee; std::vector<ExprPtr> args; };
// Empty type_name means "infer from init".
struct VariableDeclaration { std::string type_name; std::string name; ExprPtr init; };
struct IfExpression { ExprPtr condition; ExpressionStatement then_branch; ExpressionStatement else_branch; };
struct ForExpression { std::string loop_as; std::string pump_from; ExpressionStatement content; };
struct WhileExpression { ExprPtr condition; ExpressionStatement content; };
struct StringLiteral { std::string text; };
struct NumberLiteral { double value = 0.0; };
struct BinaryOperator { BinaryOp op; ExprPtr left; ExprPtr right; };
struct VariableReference { std::string name; };

struct Expression {
    std::variant<FunctionCall, VariableDeclaration, IfExpression, ForExpression, WhileExpression,
                 StringLiteral, NumberLiteral, BinaryOperator, VariableReference> node;
    int line = -1;
    int col = -1;
};

struct Param { std::string type_name; std::string name; };

struct FunctionDeclaration {
    std::string name;
    std::vector<Param> params;
    ExpressionStatement body;
    std::optional<std::string> return_type; // inferred from the body when absent
};

// Declare-only function (no body), e.g. a runtime hook provided at link time.
struct ExternDeclaration {
    std::string name;
    std::string return_type;
    std::vector<std::string> param_types;
};

struct Statement {
    std::variant<ExpressionStatement, FunctionDeclaration, ExternDeclaration> node;
};

struct Program { std::vector<StmtPtr> statements; };

// --- construction helpers (used by hosts and tests building trees by hand) ---
template<class T>
inline ExprPtr make_expr(T v, int line = -1, int col = -1){
    auto e = std::make_shared<Expression>();
    e->node = std::move(v); e->line = line; e->col = col;
    return e;
}
inline ExprPtr num(double v){ return make_expr(NumberLiteral{v}); }
inline ExprPtr str(std::string s){ return make_expr(StringLiteral{std::move(s)}); }
inline ExprPtr var(std::string name){ return make_expr(VariableReference{std::move(name)}); }
inline ExprPtr bin(BinaryOp op, ExprPtr l, ExprPtr r){ return make_expr(BinaryOperator{op, std::move(l), std::move(r)}); }
inline ExprPtr call(std::string callee, std::vector<ExprPtr> args){ return make_expr(FunctionCall{std::move(callee), std::move(args)}); }
inline ExprPtr let(std::string type, std::string name, ExprPtr init){ return make_expr(VariableDeclaration{std::move(type), std::move(name), std::move(init)}); }
inline ExpressionStatement expr_stmt(ExprPtr e){ return ExpressionStatement{std::move(e)}; }
inline ExpressionStatement block_stmt(std::vector<StmtPtr> stmts){ return ExpressionStatement{Block{std::move(stmts)}}; }
inline ExprPtr if_(ExprPtr c, ExpressionStatement t, ExpressionStatement e){ return make_expr(IfExpression{std::move(c), std::move(t), std::move(e)}); }
inline ExprPtr while_(ExprPtr c, ExpressionStatement body){ return make_expr(WhileExpression{std::move(c), std::move(body)}); }
inline ExprPtr for_(std::string as, std::string from, ExpressionStatement body){ return make_expr(ForExpression{std::move(as), std::move(from), std::move(body)}); }
inline StmtPtr stmt(ExpressionStatement s){ return std::make_shared<Statement>(Statement{std::move(s)}); }
inline StmtPtr stmt(ExprPtr e){ return stmt(expr_stmt(std::move(e))); }
inline StmtPtr fn(std::string name, std::optional<std::string> ret, std::vector<Param> params, ExpressionStatement body){
    return std::make_shared<Statement>(Statement{FunctionDeclaration{std::move(name), std::move(params), std::move(body), std::move(ret)}});
}
inline StmtPtr extern_fn(std::string name, std::string ret, std::vector<std::string> params){
    return std::make_shared<Statement>(Statement{ExternDeclaration{std::move(name), std::move(ret), std::move(params)}});
}

} // namespace ksc::ast
