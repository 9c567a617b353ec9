#include "ksc/compiler.hpp"
#include "ksc/diagnostics_json.hpp"
#include "ksc/ir/call_ops.hpp"
#include "ksc/ir/compare_ops.hpp"
#include "ksc/ir/const_ops.hpp"
#include "ksc/ir/control_ops.hpp"
#include "ksc/ir/core_ops.hpp"
#include "ksc/ir/types.hpp"
#include "ksc/ir/variable_ops.hpp"

#include <cstdio>
#include <stdexcept>
#include <tuple>
#include <type_traits>

#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

namespace ksc {

namespace {

// A numeric literal, or arithmetic over numeric literals only. Such an operand takes its
// type from its context instead of defaulting to Number.
bool flexible(const ast::Expression& e){
    if(std::holds_alternative<ast::NumberLiteral>(e.node)) return true;
    if(auto* b = std::get_if<ast::BinaryOperator>(&e.node))
        return !ast::is_comparison(b->op) && flexible(*b->left) && flexible(*b->right);
    return false;
}

bool flexible(const ast::ExpressionStatement& es){
    return !es.is_block() && flexible(*std::get<ast::ExprPtr>(es.node));
}

// Pushes an inference frame for the lifetime of the guard.
struct FrameGuard {
    std::vector<std::unordered_map<std::string, TypeId>>& frames;
    explicit FrameGuard(std::vector<std::unordered_map<std::string, TypeId>>& f) : frames(f) { frames.emplace_back(); }
    ~FrameGuard(){ frames.pop_back(); }
};

void annotate(compile_error& err, const ast::Expression& e){
    if(err.error.line < 0 && e.line >= 0){ err.error.line = e.line; err.error.col = e.col; }
}

} // namespace

Compiler::Compiler() : Compiler(detectEnv()) {}

Compiler::Compiler(EmitEnv env)
    : env_(std::move(env)),
      llctx_(std::make_unique<llvm::LLVMContext>()),
      builder_(*llctx_),
      scopes_(tctx_),
      S_{builder_, *llctx_, tctx_, scopes_, functions_,
         [this](TypeId id){ return ir::map_type(tctx_, *llctx_, id); }, warnings_} {
    S_.debug = env_.debugLower;
}

Compiler::~Compiler() = default;

void Compiler::setEnv(EmitEnv e){
    env_ = std::move(e);
    S_.debug = env_.debugLower;
}

// --- session API -------------------------------------------------------------

void Compiler::create_module(const std::string& name){
    ir::module_builder::create_module(S_, module_, name, env_);
}

ir::module_builder::FunctionHandle Compiler::declare_function(const std::string& name, const std::string& retType,
                                                              const std::vector<std::string>& paramTypes){
    return ir::module_builder::declare_function(S_, name, retType, paramTypes);
}

ir::module_builder::FunctionHandle Compiler::define_function(const std::string& name, const std::string& retType,
                                                             const std::vector<ast::Param>& params){
    std::vector<std::pair<std::string, std::string>> ps;
    for(auto& p: params) ps.emplace_back(p.type_name, p.name);
    return ir::module_builder::define_function(S_, name, retType, ps);
}

void Compiler::finish_function(const TypedValue& result){
    ir::module_builder::finish_function(S_, result);
}

std::string Compiler::render() const {
    if(!module_) return {};
    std::string out;
    llvm::raw_string_ostream os(out);
    module_->print(os, nullptr);
    os.flush();
    return out;
}

// --- whole program -----------------------------------------------------------

llvm::Module* Compiler::compile(const ast::Program& prog, CompileResult& result, const std::string& moduleName){
    result = CompileResult{};
    // a module from an earlier compile stays owned by this session and is never reset here
    bool created = false;
    try {
        create_module(moduleName);
        created = true;
        register_program(prog);
        for(auto& st: prog.statements){
            if(auto* fn = std::get_if<ast::FunctionDeclaration>(&st->node)){
                auto h = ir::module_builder::open_body(S_, fn->name);
                TypeId ret = tctx_.at(h.fnType).ret;
                finish_function(lower_body(*fn, ret));
            } else if(auto* es = std::get_if<ast::ExpressionStatement>(&st->node)){
                lower_expr_stmt(*es, std::nullopt);
            }
        }
        decls_.clear();
        externs_.clear();
        if(env_.verifyIR){
            std::string err;
            llvm::raw_string_ostream os(err);
            if(llvm::verifyModule(*module_, &os)){
                os.flush();
                throw std::logic_error("IR verification failed: " + err);
            }
        }
        result.success = true;
        result.warnings = warnings_;
    } catch(const compile_error& e){
        if(S_.debug) fprintf(stderr, "[dbg][lower] abort: %s\n", e.what());
        result.errors.push_back(e.error);
        if(created){
            result.warnings = warnings_;
            reset_session();
        }
    }
    if(env_.diagJson) print_json(result);
    return result.success ? module_.get() : nullptr;
}

// Pre-pass: every top-level signature is registered (in source order) before any body is
// lowered, so forward and recursive calls resolve.
void Compiler::register_program(const ast::Program& prog){
    decls_.clear(); externs_.clear(); inferredRet_.clear();
    for(auto& st: prog.statements){
        if(auto* fn = std::get_if<ast::FunctionDeclaration>(&st->node)) decls_.emplace(fn->name, fn);
        else if(auto* ex = std::get_if<ast::ExternDeclaration>(&st->node)) externs_.emplace(ex->name, ex);
    }
    for(auto& st: prog.statements){
        if(auto* ex = std::get_if<ast::ExternDeclaration>(&st->node)){
            ir::module_builder::declare_function(S_, ex->name, ex->return_type, ex->param_types);
        } else if(auto* fn = std::get_if<ast::FunctionDeclaration>(&st->node)){
            TypeId ret = *resolve_return(*fn);
            std::vector<TypeId> ps;
            std::vector<std::string> names;
            for(auto& p: fn->params){ ps.push_back(scopes_.resolve_type(p.type_name)); names.push_back(p.name); }
            ir::module_builder::declare_signature(S_, fn->name, ret, ps, std::move(names), true);
        }
    }
}

void Compiler::reset_session(){
    decls_.clear(); externs_.clear(); inferredRet_.clear(); pending_.clear(); overlay_.clear();
    while(scopes_.depth() > 1) scopes_.pop_scope();
    S_.fn = nullptr;
    builder_.ClearInsertionPoint();
    functions_ = ir::builder::FunctionTable{};
    S_.module = nullptr;
    module_.reset();
    S_.cfCounter = 0;
    warnings_.clear();
}

TypedValue Compiler::lower_body(const ast::FunctionDeclaration& fn, TypeId ret){
    const bool isVoid = tctx_.is_void(ret);
    if(S_.debug) fprintf(stderr, "[dbg][fn] body %s -> %s\n", fn.name.c_str(), tctx_.name(ret).c_str());
    if(!fn.body.is_block()){
        TypedValue v = compile_expression(*std::get<ast::ExprPtr>(fn.body.node),
                                          isVoid ? std::nullopt : std::optional<TypeId>(ret));
        return isVoid ? TypedValue{tctx_.void_type(), nullptr} : v;
    }
    const auto& blk = std::get<ast::Block>(fn.body.node);
    if(blk.statements.empty() && !isVoid)
        throw type_mismatch("body of '" + fn.name + "'", tctx_.name(ret), "Void");
    TypedValue v{tctx_.void_type(), nullptr};
    scopes_.push_scope();
    try {
        for(size_t i = 0; i < blk.statements.size(); ++i){
            const ast::Statement& st = *blk.statements[i];
            if(i + 1 == blk.statements.size() && !isVoid){
                // tail expression is the return value
                auto* es = std::get_if<ast::ExpressionStatement>(&st.node);
                if(!es || es->is_block())
                    throw type_mismatch("body of '" + fn.name + "'", tctx_.name(ret), "Void");
                v = compile_expression(*std::get<ast::ExprPtr>(es->node), ret);
            } else {
                compile_statement(st);
            }
        }
    } catch(...) { scopes_.pop_scope(); throw; }
    scopes_.pop_scope();
    return isVoid ? TypedValue{tctx_.void_type(), nullptr} : v;
}

// --- statements --------------------------------------------------------------

TypedValue Compiler::compile_statement(const ast::Statement& s){
    return std::visit([&](const auto& n) -> TypedValue {
        using T = std::decay_t<decltype(n)>;
        if constexpr (std::is_same_v<T, ast::ExpressionStatement>) return lower_expr_stmt(n, std::nullopt);
        else if constexpr (std::is_same_v<T, ast::FunctionDeclaration>) throw unsupported_construct("nested function declaration '" + n.name + "'");
        else throw unsupported_construct("nested extern declaration '" + n.name + "'");
    }, s.node);
}

TypedValue Compiler::lower_expr_stmt(const ast::ExpressionStatement& es, std::optional<TypeId> expected){
    if(es.is_block()) return lower_block(std::get<ast::Block>(es.node));
    return compile_expression(*std::get<ast::ExprPtr>(es.node), expected);
}

TypedValue Compiler::lower_block(const ast::Block& b){
    scopes_.push_scope();
    try {
        for(auto& st: b.statements) compile_statement(*st);
    } catch(...) { scopes_.pop_scope(); throw; }
    scopes_.pop_scope();
    return TypedValue{tctx_.void_type(), nullptr};
}

// --- expressions -------------------------------------------------------------

TypedValue Compiler::compile_expression(const ast::Expression& e, std::optional<TypeId> expected){
    try {
        return std::visit([&](const auto& n) -> TypedValue {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ast::NumberLiteral>)
                return ir::const_ops::number(S_, n.value, expected.value_or(tctx_.number()));
            else if constexpr (std::is_same_v<T, ast::StringLiteral>)
                return ir::const_ops::string(S_, n.text, expected.value_or(tctx_.get_list(tctx_.int32())));
            else if constexpr (std::is_same_v<T, ast::VariableReference>) return lower_reference(n);
            else if constexpr (std::is_same_v<T, ast::VariableDeclaration>) return lower_let(n);
            else if constexpr (std::is_same_v<T, ast::BinaryOperator>) return lower_binary(n, expected);
            else if constexpr (std::is_same_v<T, ast::FunctionCall>) return lower_call(n);
            else if constexpr (std::is_same_v<T, ast::IfExpression>) {
                size_t before = warnings_.size();
                TypedValue v = lower_if(n, expected);
                for(size_t i = before; i < warnings_.size(); ++i){ warnings_[i].line = e.line; warnings_[i].col = e.col; }
                return v;
            }
            else if constexpr (std::is_same_v<T, ast::WhileExpression>) {
                ir::control_ops::Context C{S_,
                    [this](const ast::Expression& c){ return compile_expression(c); },
                    [this](const ast::ExpressionStatement& es){ return lower_expr_stmt(es, std::nullopt); },
                    [this](const ast::ExpressionStatement& es){ return infer_stmt(es, std::nullopt); }};
                return ir::control_ops::lower_while(C, n);
            }
            else {
                static_assert(std::is_same_v<T, ast::ForExpression>);
                ir::control_ops::Context C{S_,
                    [this](const ast::Expression& c){ return compile_expression(c); },
                    [this](const ast::ExpressionStatement& es){ return lower_expr_stmt(es, std::nullopt); },
                    [this](const ast::ExpressionStatement& es){ return infer_stmt(es, std::nullopt); }};
                return ir::control_ops::lower_for(C, n);
            }
        }, e.node);
    } catch(compile_error& err){
        annotate(err, e);
        throw;
    }
}

TypedValue Compiler::lower_reference(const ast::VariableReference& r){
    if(scopes_.find(r.name)) return ir::variable_ops::load(S_, r.name);
    // a module function used as a value
    if(auto* rec = functions_.find(r.name)) return TypedValue{rec->fnType, rec->function};
    throw undefined_variable(r.name);
}

TypedValue Compiler::lower_let(const ast::VariableDeclaration& d){
    std::optional<TypeId> ty;
    if(!d.type_name.empty()){
        ty = scopes_.resolve_type(d.type_name);
        if(tctx_.is_void(*ty)) throw type_mismatch("declaration of '" + d.name + "'", "a value type", "Void");
    }
    ir::builder::require_function(S_, "declaration of '" + d.name + "'");
    {
        FrameGuard g(overlay_);
        if(auto it = infer(*d.init, ty)){
            if(tctx_.is_void(*it)) throw type_mismatch("initializer of '" + d.name + "'", "a value type", "Void");
            if(ty && *it != *ty)
                throw type_mismatch("initializer of '" + d.name + "'", tctx_.name(*ty), tctx_.name(*it));
        }
    }
    // the name is bound only after its initializer is lowered
    TypedValue init = compile_expression(*d.init, ty);
    if(ty && init.type != *ty)
        throw type_mismatch("initializer of '" + d.name + "'", tctx_.name(*ty), tctx_.name(init.type));
    return ir::variable_ops::declare(S_, d.name, init);
}

std::pair<std::optional<TypeId>, std::optional<TypeId>>
Compiler::operand_expectations(const ast::BinaryOperator& b, std::optional<TypeId> expected){
    bool lf = flexible(*b.left), rf = flexible(*b.right);
    auto scalar = [&](std::optional<TypeId> t){ return (t && tctx_.is_scalar(*t)) ? t : std::nullopt; };
    if(lf && !rf) return {scalar(infer(*b.right)), std::nullopt};
    if(rf && !lf) return {std::nullopt, scalar(infer(*b.left))};
    if(lf && rf && !ast::is_comparison(b.op)) return {expected, expected};
    return {std::nullopt, std::nullopt};
}

TypedValue Compiler::lower_binary(const ast::BinaryOperator& b, std::optional<TypeId> expected){
    std::optional<TypeId> lex, rex, lt, rt;
    {
        // operand types are checked before anything is emitted
        FrameGuard g(overlay_);
        std::tie(lex, rex) = operand_expectations(b, expected);
        lt = infer(*b.left, lex);
        rt = infer(*b.right, rex);
    }
    if(lt && rt){
        if(*lt != *rt)
            throw type_mismatch(std::string("operands of '") + ast::op_name(b.op) + "'", tctx_.name(*lt), tctx_.name(*rt));
        if(ast::is_comparison(b.op)) ir::compare_ops::result_type(tctx_, b.op, *lt);
        else ir::core_ops::result_type(tctx_, b.op, *lt);
    }
    ir::builder::require_function(S_, std::string("operator '") + ast::op_name(b.op) + "'");
    TypedValue l = compile_expression(*b.left, lex);
    TypedValue r = compile_expression(*b.right, rex);
    if(ast::is_comparison(b.op)) return ir::compare_ops::compare(S_, b.op, l, r);
    return ir::core_ops::arith(S_, b.op, l, r);
}

TypedValue Compiler::lower_call(const ast::FunctionCall& c){
    auto callee = ir::call_ops::resolve(S_, c.callee);
    ir::call_ops::check_arity(S_, callee, c.args.size());
    ir::builder::require_function(S_, "call to '" + c.callee + "'");
    const std::vector<TypeId> params = tctx_.at(callee.fnType).params;
    {
        // every argument is checked before the first one is emitted
        FrameGuard g(overlay_);
        for(size_t i = 0; i < c.args.size(); ++i){
            auto t = infer(*c.args[i], params[i]);
            if(t && *t != params[i])
                throw type_mismatch("argument " + std::to_string(i + 1) + " of '" + c.callee + "'",
                                    tctx_.name(params[i]), tctx_.name(*t));
        }
    }
    std::vector<TypedValue> args;
    args.reserve(c.args.size());
    for(size_t i = 0; i < c.args.size(); ++i){
        args.push_back(compile_expression(*c.args[i], params[i]));
        if(args.back().type != params[i])
            throw type_mismatch("argument " + std::to_string(i + 1) + " of '" + c.callee + "'",
                                tctx_.name(params[i]), tctx_.name(args.back().type));
    }
    return ir::call_ops::emit(S_, callee, args);
}

TypedValue Compiler::lower_if(const ast::IfExpression& e, std::optional<TypeId> expected){
    // a literal branch takes the type of the other branch
    std::optional<TypeId> branchEx = expected;
    if(!branchEx){
        bool tf = flexible(e.then_branch), ef = flexible(e.else_branch);
        std::optional<TypeId> other;
        if(tf && !ef) other = infer_stmt(e.else_branch, std::nullopt);
        else if(ef && !tf) other = infer_stmt(e.then_branch, std::nullopt);
        if(other && tctx_.is_scalar(*other)) branchEx = other;
    }
    ir::control_ops::Context C{S_,
        [this](const ast::Expression& c){ return compile_expression(c); },
        [this, branchEx](const ast::ExpressionStatement& es){ return lower_expr_stmt(es, branchEx); },
        [this, branchEx](const ast::ExpressionStatement& es){ return infer_stmt(es, branchEx); }};
    return ir::control_ops::lower_if(C, e);
}

// --- static inference ----------------------------------------------------------

std::optional<TypeId> Compiler::infer(const ast::Expression& e, std::optional<TypeId> expected){
    try {
        return std::visit([&](const auto& n) -> std::optional<TypeId> {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, ast::NumberLiteral>) return expected.value_or(tctx_.number());
            else if constexpr (std::is_same_v<T, ast::StringLiteral>) return expected.value_or(tctx_.get_list(tctx_.int32()));
            else if constexpr (std::is_same_v<T, ast::VariableReference>) return infer_variable(n.name);
            else if constexpr (std::is_same_v<T, ast::VariableDeclaration>) {
                std::optional<TypeId> t = n.type_name.empty() ? infer(*n.init)
                                                              : std::optional<TypeId>(scopes_.resolve_type(n.type_name));
                if(t && !overlay_.empty()) overlay_.back()[n.name] = *t;
                return t;
            }
            else if constexpr (std::is_same_v<T, ast::BinaryOperator>) {
                auto [lex, rex] = operand_expectations(n, expected);
                auto lt = infer(*n.left, lex);
                auto rt = infer(*n.right, rex);
                if(lt && rt && *lt != *rt)
                    throw type_mismatch(std::string("operands of '") + ast::op_name(n.op) + "'", tctx_.name(*lt), tctx_.name(*rt));
                auto t = lt ? lt : rt;
                if(ast::is_comparison(n.op)){
                    if(t) ir::compare_ops::result_type(tctx_, n.op, *t);
                    return tctx_.boolean();
                }
                if(!t) return std::nullopt;
                return ir::core_ops::result_type(tctx_, n.op, *t);
            }
            else if constexpr (std::is_same_v<T, ast::FunctionCall>) {
                auto fty = infer_callee(n.callee);
                if(!fty) return std::nullopt;
                const Type& F = tctx_.at(*fty);
                if(F.params.size() != n.args.size()) throw parameter_count_mismatch(n.callee, F.params.size(), n.args.size());
                return F.ret;
            }
            else if constexpr (std::is_same_v<T, ast::IfExpression>) {
                auto t = infer_stmt(n.then_branch, expected);
                auto f = infer_stmt(n.else_branch, expected);
                if(!expected){
                    bool tf = flexible(n.then_branch), ef = flexible(n.else_branch);
                    if(tf && !ef && f && tctx_.is_scalar(*f)) t = f;
                    else if(ef && !tf && t && tctx_.is_scalar(*t)) f = t;
                }
                if(!t) return f;
                if(!f) return t;
                if(*t == *f) return t;
                if(tctx_.is_void(*t) || tctx_.is_void(*f)) return tctx_.void_type();
                throw type_mismatch("if branches", tctx_.name(*t), tctx_.name(*f));
            }
            else return tctx_.void_type(); // loops
        }, e.node);
    } catch(compile_error& err){
        annotate(err, e);
        throw;
    }
}

// Type of one branch/body statement in its own frame. Blocks are Void.
std::optional<TypeId> Compiler::infer_stmt(const ast::ExpressionStatement& es, std::optional<TypeId> expected){
    FrameGuard g(overlay_);
    if(!es.is_block()) return infer(*std::get<ast::ExprPtr>(es.node), expected);
    for(auto& st: std::get<ast::Block>(es.node).statements){
        auto* inner = std::get_if<ast::ExpressionStatement>(&st->node);
        if(!inner) continue;
        if(inner->is_block()) infer_stmt(*inner, std::nullopt);
        else infer(*std::get<ast::ExprPtr>(inner->node));
    }
    return tctx_.void_type();
}

// Like infer_stmt, except a Block yields the type of its tail expression.
std::optional<TypeId> Compiler::infer_body(const ast::ExpressionStatement& body){
    if(!body.is_block()) return infer(*std::get<ast::ExprPtr>(body.node));
    FrameGuard g(overlay_);
    std::optional<TypeId> t = tctx_.void_type();
    for(auto& st: std::get<ast::Block>(body.node).statements){
        auto* inner = std::get_if<ast::ExpressionStatement>(&st->node);
        t = tctx_.void_type();
        if(!inner) continue;
        if(inner->is_block()) infer_stmt(*inner, std::nullopt);
        else t = infer(*std::get<ast::ExprPtr>(inner->node));
    }
    return t;
}

std::optional<TypeId> Compiler::infer_variable(const std::string& name){
    for(auto it = overlay_.rbegin(); it != overlay_.rend(); ++it)
        if(auto f = it->find(name); f != it->end()) return f->second;
    if(auto* tv = scopes_.find(name)) return tv->type;
    std::optional<TypeId> fty;
    if(lookup_declared(name, fty)) return fty;
    throw undefined_variable(name);
}

std::optional<TypeId> Compiler::infer_callee(const std::string& name){
    std::optional<TypeId> fty;
    if(lookup_declared(name, fty)) return fty;
    std::optional<TypeId> vt;
    for(auto it = overlay_.rbegin(); it != overlay_.rend() && !vt; ++it)
        if(auto f = it->find(name); f != it->end()) vt = f->second;
    if(!vt) if(auto* tv = scopes_.find(name)) vt = tv->type;
    if(vt && tctx_.kind(*vt) == Type::Kind::Function) return vt;
    throw undefined_function(name);
}

// Function type of a registered or not-yet-registered top-level function; fnType stays
// empty while that function's return type is pending.
bool Compiler::lookup_declared(const std::string& name, std::optional<TypeId>& fnType){
    if(auto* rec = functions_.find(name)){ fnType = rec->fnType; return true; }
    if(auto it = decls_.find(name); it != decls_.end()){ fnType = signature_of(*it->second); return true; }
    if(auto it = externs_.find(name); it != externs_.end()){
        std::vector<TypeId> ps;
        for(auto& p: it->second->param_types) ps.push_back(scopes_.resolve_type(p));
        fnType = tctx_.get_function(ps, scopes_.resolve_type(it->second->return_type));
        return true;
    }
    return false;
}

std::optional<TypeId> Compiler::signature_of(const ast::FunctionDeclaration& fn){
    std::vector<TypeId> ps;
    for(auto& p: fn.params) ps.push_back(scopes_.resolve_type(p.type_name));
    auto ret = resolve_return(fn);
    if(!ret) return std::nullopt;
    return tctx_.get_function(ps, *ret);
}

std::optional<TypeId> Compiler::resolve_return(const ast::FunctionDeclaration& fn){
    if(fn.return_type) return scopes_.resolve_type(*fn.return_type);
    if(auto it = inferredRet_.find(fn.name); it != inferredRet_.end()) return it->second;
    if(pending_.count(fn.name)) return std::nullopt;

    // infer from the body with only the parameters visible
    pending_.insert(fn.name);
    std::vector<InferFrame> saved;
    saved.swap(overlay_);
    std::optional<TypeId> t;
    try {
        overlay_.emplace_back();
        for(auto& p: fn.params) overlay_.back()[p.name] = scopes_.resolve_type(p.type_name);
        t = infer_body(fn.body);
    } catch(...) {
        overlay_.swap(saved);
        pending_.erase(fn.name);
        throw;
    }
    overlay_.swap(saved);
    pending_.erase(fn.name);
    if(!t) throw unresolved_return_type(fn.name);
    if(S_.debug) fprintf(stderr, "[dbg][fn] inferred %s -> %s\n", fn.name.c_str(), tctx_.name(*t).c_str());
    inferredRet_[fn.name] = *t;
    return t;
}

} // namespace ksc
