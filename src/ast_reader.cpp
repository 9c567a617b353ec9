#include "ksc/ast_reader.hpp"

#include <unordered_map>

namespace ksc {

namespace {

[[noreturn]] void fail(const node_ptr& n, const std::string& msg){
    std::string where = n && n->line >= 0 ? std::to_string(n->line) + ":" + std::to_string(n->col) + ": " : std::string();
    throw parse_error(where + msg);
}

const std::unordered_map<std::string, ast::BinaryOp>& operators(){
    static const std::unordered_map<std::string, ast::BinaryOp> ops = {
        {"+", ast::BinaryOp::Add}, {"-", ast::BinaryOp::Sub}, {"*", ast::BinaryOp::Mul},
        {"/", ast::BinaryOp::Div}, {"//", ast::BinaryOp::IntDiv}, {"%", ast::BinaryOp::Rem},
        {"==", ast::BinaryOp::Eq}, {"!=", ast::BinaryOp::Ne}, {"<", ast::BinaryOp::Lt},
        {">", ast::BinaryOp::Gt}, {"<=", ast::BinaryOp::Le}, {">=", ast::BinaryOp::Ge}};
    return ops;
}

bool is_type_form(const node_ptr& n){
    if(symbol_name(n)) return true;
    auto* v = vector_elems(n);
    return v && v->size() == 1 && is_type_form((*v)[0]);
}

std::string read_type(const node_ptr& n){
    if(auto* s = symbol_name(n)) return *s;
    if(auto* v = vector_elems(n); v && v->size() == 1) return "[" + read_type((*v)[0]) + "]";
    fail(n, "expected a type name or [T], got " + to_string(n));
}

std::string read_name(const node_ptr& n, const char* what){
    if(auto* s = symbol_name(n)) return *s;
    fail(n, std::string("expected ") + what + ", got " + to_string(n));
}

void expect_arity(const node_ptr& n, const std::vector<node_ptr>& l, size_t count, const char* form){
    if(l.size() != count) fail(n, std::string("'") + form + "' takes " + std::to_string(count - 1) + " operand(s)");
}

ast::StmtPtr read_stmt(const node_ptr& n);
ast::ExprPtr read_expr(const node_ptr& n);

ast::ExpressionStatement read_expr_stmt(const node_ptr& n){
    auto* l = list_elems(n);
    if(l && !l->empty()){
        if(auto* head = symbol_name((*l)[0]); head && *head == "block"){
            std::vector<ast::StmtPtr> stmts;
            for(size_t i = 1; i < l->size(); ++i) stmts.push_back(read_stmt((*l)[i]));
            return ast::block_stmt(std::move(stmts));
        }
    }
    return ast::expr_stmt(read_expr(n));
}

ast::ExprPtr read_list_expr(const node_ptr& n, const std::vector<node_ptr>& l){
    if(l.empty()) fail(n, "empty form");
    const std::string* head = symbol_name(l[0]);
    if(!head) fail(n, "form must start with a symbol");
    const std::string& h = *head;
    if(h == "call"){
        if(l.size() < 2) fail(n, "'call' needs a callee");
        std::vector<ast::ExprPtr> args;
        for(size_t i = 2; i < l.size(); ++i) args.push_back(read_expr(l[i]));
        return ast::make_expr(ast::FunctionCall{read_name(l[1], "callee name"), std::move(args)}, n->line, n->col);
    }
    if(h == "let"){
        expect_arity(n, l, 4, "let");
        std::string type = read_type(l[1]);
        if(type == "_") type.clear();
        return ast::make_expr(ast::VariableDeclaration{type, read_name(l[2], "variable name"), read_expr(l[3])}, n->line, n->col);
    }
    if(h == "if"){
        expect_arity(n, l, 4, "if");
        return ast::make_expr(ast::IfExpression{read_expr(l[1]), read_expr_stmt(l[2]), read_expr_stmt(l[3])}, n->line, n->col);
    }
    if(h == "while"){
        expect_arity(n, l, 3, "while");
        return ast::make_expr(ast::WhileExpression{read_expr(l[1]), read_expr_stmt(l[2])}, n->line, n->col);
    }
    if(h == "for"){
        expect_arity(n, l, 4, "for");
        return ast::make_expr(ast::ForExpression{read_name(l[1], "loop variable"), read_name(l[2], "list variable"),
                                                 read_expr_stmt(l[3])}, n->line, n->col);
    }
    if(auto it = operators().find(h); it != operators().end()){
        expect_arity(n, l, 3, h.c_str());
        return ast::make_expr(ast::BinaryOperator{it->second, read_expr(l[1]), read_expr(l[2])}, n->line, n->col);
    }
    if(h == "block") fail(n, "a block is not an expression");
    if(h == "fn" || h == "extern") fail(n, "'" + h + "' is only allowed as a statement");
    fail(n, "unknown form '" + h + "'");
}

ast::ExprPtr read_expr(const node_ptr& n){
    if(!n) fail(n, "missing expression");
    struct V {
        const node_ptr& n;
        ast::ExprPtr operator()(int64_t i) const { return ast::make_expr(ast::NumberLiteral{(double)i}, n->line, n->col); }
        ast::ExprPtr operator()(double d) const { return ast::make_expr(ast::NumberLiteral{d}, n->line, n->col); }
        ast::ExprPtr operator()(const std::string& s) const { return ast::make_expr(ast::StringLiteral{s}, n->line, n->col); }
        ast::ExprPtr operator()(const symbol& s) const { return ast::make_expr(ast::VariableReference{s.name}, n->line, n->col); }
        ast::ExprPtr operator()(const list& l) const { return read_list_expr(n, l.elems); }
        ast::ExprPtr operator()(std::monostate) const { fail(n, "nil is not an expression"); }
        ast::ExprPtr operator()(bool) const { fail(n, "booleans are written as comparisons or numbers"); }
        ast::ExprPtr operator()(const keyword& k) const { fail(n, "unexpected keyword :" + k.name); }
        ast::ExprPtr operator()(const vector_t&) const { fail(n, "unexpected vector"); }
    };
    return std::visit(V{n}, n->data);
}

ast::StmtPtr read_fn(const node_ptr& n, const std::vector<node_ptr>& l){
    // (fn name [RetType] [(Type param)*] body)
    if(l.size() != 4 && l.size() != 5) fail(n, "'fn' expects (fn name [RetType] [params] body)");
    std::string name = read_name(l[1], "function name");
    size_t i = 2;
    std::optional<std::string> ret;
    if(l.size() == 5){
        if(!is_type_form(l[2])) fail(l[2], "expected a return type");
        ret = read_type(l[2]);
        i = 3;
    }
    auto* ps = vector_elems(l[i]);
    if(!ps) fail(l[i], "expected a parameter vector");
    std::vector<ast::Param> params;
    for(auto& p: *ps){
        auto* pl = list_elems(p);
        if(!pl || pl->size() != 2) fail(p, "parameter must be (Type name)");
        params.push_back(ast::Param{read_type((*pl)[0]), read_name((*pl)[1], "parameter name")});
    }
    return ast::fn(std::move(name), std::move(ret), std::move(params), read_expr_stmt(l[i + 1]));
}

ast::StmtPtr read_extern(const node_ptr& n, const std::vector<node_ptr>& l){
    expect_arity(n, l, 4, "extern");
    auto* ps = vector_elems(l[3]);
    if(!ps) fail(l[3], "expected a vector of parameter types");
    std::vector<std::string> types;
    for(auto& p: *ps) types.push_back(read_type(p));
    return ast::extern_fn(read_name(l[1], "function name"), read_type(l[2]), std::move(types));
}

ast::StmtPtr read_stmt(const node_ptr& n){
    if(auto* l = list_elems(n); l && !l->empty()){
        if(auto* head = symbol_name((*l)[0])){
            if(*head == "fn") return read_fn(n, *l);
            if(*head == "extern") return read_extern(n, *l);
        }
    }
    return ast::stmt(read_expr_stmt(n));
}

} // namespace

ast::Program read_program(const node_ptr& root){
    auto* l = list_elems(root);
    if(!l || l->empty() || !symbol_name((*l)[0]) || *symbol_name((*l)[0]) != "program")
        fail(root, "expected (program ...)");
    ast::Program prog;
    for(size_t i = 1; i < l->size(); ++i) prog.statements.push_back(read_stmt((*l)[i]));
    return prog;
}

ast::Program read_program(std::string_view text){
    return read_program(parse(text));
}

} // namespace ksc
