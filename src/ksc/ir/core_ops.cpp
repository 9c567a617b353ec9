#include "ksc/ir/core_ops.hpp"

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Intrinsics.h>

namespace ksc::ir::core_ops {

using ast::BinaryOp;

TypeId result_type(TypeContext& tctx, BinaryOp op, TypeId t){
    if(!tctx.is_numeric(t)) throw unsupported_operation(tctx.name(t), ast::op_name(op));
    return t;
}

TypedValue arith(builder::State& S, BinaryOp op, const TypedValue& l, const TypedValue& r){
    if(l.type != r.type)
        throw type_mismatch(std::string("operands of '") + ast::op_name(op) + "'", S.tctx.name(l.type), S.tctx.name(r.type));
    TypeId ty = result_type(S.tctx, op, l.type);
    auto& B = S.builder;
    llvm::Value* v = nullptr;
    if(S.tctx.kind(ty) == Type::Kind::Int32){
        switch(op){
            case BinaryOp::Add: v = B.CreateAdd(l.value, r.value, "add"); break;
            case BinaryOp::Sub: v = B.CreateSub(l.value, r.value, "sub"); break;
            case BinaryOp::Mul: v = B.CreateMul(l.value, r.value, "mul"); break;
            case BinaryOp::Div: v = B.CreateSDiv(l.value, r.value, "div"); break;
            case BinaryOp::IntDiv: v = B.CreateSDiv(l.value, r.value, "idiv"); break;
            case BinaryOp::Rem: v = B.CreateSRem(l.value, r.value, "rem"); break;
            default: throw unsupported_operation(S.tctx.name(ty), ast::op_name(op));
        }
    } else {
        switch(op){
            case BinaryOp::Add: v = B.CreateFAdd(l.value, r.value, "add"); break;
            case BinaryOp::Sub: v = B.CreateFSub(l.value, r.value, "sub"); break;
            case BinaryOp::Mul: v = B.CreateFMul(l.value, r.value, "mul"); break;
            case BinaryOp::Div: v = B.CreateFDiv(l.value, r.value, "div"); break;
            case BinaryOp::IntDiv: {
                llvm::Value* q = B.CreateFDiv(l.value, r.value, "div");
                v = B.CreateUnaryIntrinsic(llvm::Intrinsic::trunc, q, nullptr, "idiv");
                break;
            }
            case BinaryOp::Rem: v = B.CreateFRem(l.value, r.value, "rem"); break;
            default: throw unsupported_operation(S.tctx.name(ty), ast::op_name(op));
        }
    }
    return TypedValue{ty, v};
}

} // namespace ksc::ir::core_ops
