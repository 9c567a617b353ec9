#include "ksc/ir/control_ops.hpp"
#include "ksc/ir/phi_ops.hpp"
#include "ksc/ir/variable_ops.hpp"

#include <cstdio>
#include <stdexcept>

#include <llvm/IR/Constants.h>
#include <llvm/IR/IRBuilder.h>

namespace ksc::ir::control_ops {

llvm::BasicBlock* new_block(builder::State& S, const std::string& purpose, int n){
    llvm::Function* F = builder::require_function(S, purpose);
    return llvm::BasicBlock::Create(S.llctx, purpose + "." + std::to_string(n), F);
}

static void ensure_open(builder::State& S, const char* what){
    auto* bb = S.builder.GetInsertBlock();
    if(!bb) throw std::logic_error(std::string(what) + ": no open block");
    if(bb->getTerminator())
        throw std::logic_error(std::string(what) + ": block '" + bb->getName().str() + "' already terminated");
}

void branch_conditional(builder::State& S, const TypedValue& cond, llvm::BasicBlock* thenBB, llvm::BasicBlock* elseBB){
    if(cond.type != S.tctx.boolean()) throw type_mismatch("condition", "Bool", S.tctx.name(cond.type));
    ensure_open(S, "branch_conditional");
    S.builder.CreateCondBr(cond.value, thenBB, elseBB);
}

void branch_unconditional(builder::State& S, llvm::BasicBlock* target){
    ensure_open(S, "branch_unconditional");
    S.builder.CreateBr(target);
}

void position(builder::State& S, llvm::BasicBlock* block){ S.builder.SetInsertPoint(block); }

TypedValue to_condition(builder::State& S, const TypedValue& v){
    auto& B = S.builder;
    switch(S.tctx.kind(v.type)){
        case Type::Kind::Bool: return v;
        case Type::Kind::Int32:
            return TypedValue{S.tctx.boolean(), B.CreateICmpNE(v.value, llvm::ConstantInt::get(B.getInt32Ty(), 0), "cond")};
        case Type::Kind::Number:
            return TypedValue{S.tctx.boolean(), B.CreateFCmpONE(v.value, llvm::ConstantFP::get(B.getDoubleTy(), 0.0), "cond")};
        default:
            throw type_mismatch("condition", "Bool", S.tctx.name(v.type));
    }
}

// Lower one branch in its own scope; the scope is popped on the error path as well so a
// session can keep going after a recorded diagnostic.
static TypedValue lower_scoped(Context& C, const ast::ExpressionStatement& body){
    C.S.scopes.push_scope();
    TypedValue v;
    try { v = C.lower_branch(body); }
    catch(...) { C.S.scopes.pop_scope(); throw; }
    C.S.scopes.pop_scope();
    return v;
}

// Conditions get their own scope; a name declared in one is not visible past the construct.
static TypedValue lower_condition(Context& C, const ast::Expression& cond){
    C.S.scopes.push_scope();
    TypedValue v;
    try { v = to_condition(C.S, C.lower_expr(cond)); }
    catch(...) { C.S.scopes.pop_scope(); throw; }
    C.S.scopes.pop_scope();
    return v;
}

TypedValue lower_if(Context& C, const ast::IfExpression& e){
    auto& S = C.S;
    builder::require_function(S, "if");
    auto thenT = C.infer_branch(e.then_branch);
    auto elseT = C.infer_branch(e.else_branch);
    if(thenT && elseT && *thenT != *elseT && !S.tctx.is_void(*thenT) && !S.tctx.is_void(*elseT))
        throw type_mismatch("if branches", S.tctx.name(*thenT), S.tctx.name(*elseT));

    TypedValue cond = lower_condition(C, *e.condition);
    int n = builder::next_label(S);
    auto* thenBB = new_block(S, "if.then", n);
    auto* elseBB = new_block(S, "if.else", n);
    auto* endBB = new_block(S, "if.end", n);
    if(S.debug) fprintf(stderr, "[dbg][cf] if.%d\n", n);
    branch_conditional(S, cond, thenBB, elseBB);

    position(S, thenBB);
    TypedValue tv = lower_scoped(C, e.then_branch);
    llvm::BasicBlock* thenEnd = S.builder.GetInsertBlock();
    branch_unconditional(S, endBB);

    position(S, elseBB);
    TypedValue ev = lower_scoped(C, e.else_branch);
    llvm::BasicBlock* elseEnd = S.builder.GetInsertBlock();
    branch_unconditional(S, endBB);

    position(S, endBB);
    bool thenVoid = S.tctx.is_void(tv.type), elseVoid = S.tctx.is_void(ev.type);
    if(!thenVoid && !elseVoid)
        return phi_ops::merge_phi(S, tv, thenEnd, ev, elseEnd, n);
    if(thenVoid != elseVoid){
        CompileWarning w{"W0601", "if branch value discarded", "give both branches a value of the same type", -1, -1, {}};
        w.notes.push_back({std::string(thenVoid ? "else" : "then") + " branch has type " + S.tctx.name(thenVoid ? ev.type : tv.type)});
        S.warnings.push_back(std::move(w));
    }
    return TypedValue{S.tctx.void_type(), nullptr};
}

TypedValue lower_while(Context& C, const ast::WhileExpression& e){
    auto& S = C.S;
    builder::require_function(S, "while");
    int n = builder::next_label(S);
    auto* condBB = new_block(S, "while.cond", n);
    auto* bodyBB = new_block(S, "while.body", n);
    auto* endBB = new_block(S, "while.end", n);
    if(S.debug) fprintf(stderr, "[dbg][cf] while.%d\n", n);
    branch_unconditional(S, condBB);

    position(S, condBB);
    TypedValue cond = lower_condition(C, *e.condition);
    branch_conditional(S, cond, bodyBB, endBB);

    position(S, bodyBB);
    lower_scoped(C, e.content);
    branch_unconditional(S, condBB);

    position(S, endBB);
    return TypedValue{S.tctx.void_type(), nullptr};
}

TypedValue lower_for(Context& C, const ast::ForExpression& e){
    auto& S = C.S;
    auto& B = S.builder;
    const TypedValue listSlot = S.scopes.lookup(e.pump_from);
    if(S.tctx.kind(listSlot.type) != Type::Kind::List)
        throw unsupported_operation(S.tctx.name(listSlot.type), "for");
    builder::require_function(S, "for");
    TypeId elemT = S.tctx.at(listSlot.type).elem;
    llvm::Type* elemLL = S.map_type(elemT);

    int n = builder::next_label(S);
    auto* idx = variable_ops::entry_slot(S, B.getInt64Ty(), "for.idx." + std::to_string(n));
    B.CreateStore(B.getInt64(0), idx);
    llvm::Value* list = B.CreateLoad(S.map_type(listSlot.type), listSlot.value, e.pump_from);
    llvm::Value* len = B.CreateExtractValue(list, {0}, e.pump_from + ".len");
    llvm::Value* data = B.CreateExtractValue(list, {1}, e.pump_from + ".data");

    auto* condBB = new_block(S, "for.cond", n);
    auto* bodyBB = new_block(S, "for.body", n);
    auto* endBB = new_block(S, "for.end", n);
    if(S.debug) fprintf(stderr, "[dbg][cf] for.%d over %s : %s\n", n, e.pump_from.c_str(), S.tctx.name(listSlot.type).c_str());
    branch_unconditional(S, condBB);

    position(S, condBB);
    llvm::Value* i = B.CreateLoad(B.getInt64Ty(), idx, "i");
    branch_conditional(S, TypedValue{S.tctx.boolean(), B.CreateICmpSLT(i, len, "for.more")}, bodyBB, endBB);

    position(S, bodyBB);
    S.scopes.push_scope();
    try {
        llvm::Value* at = B.CreateGEP(elemLL, data, i, e.loop_as + ".ptr");
        llvm::Value* elem = B.CreateLoad(elemLL, at, e.loop_as);
        variable_ops::declare(S, e.loop_as, TypedValue{elemT, elem});
        C.lower_branch(e.content);
    } catch(...) { S.scopes.pop_scope(); throw; }
    S.scopes.pop_scope();
    llvm::Value* cur = B.CreateLoad(B.getInt64Ty(), idx, "i");
    B.CreateStore(B.CreateAdd(cur, B.getInt64(1), "i.next"), idx);
    branch_unconditional(S, condBB);

    position(S, endBB);
    return TypedValue{S.tctx.void_type(), nullptr};
}

} // namespace ksc::ir::control_ops
