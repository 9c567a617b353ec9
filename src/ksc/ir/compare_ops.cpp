#include "ksc/ir/compare_ops.hpp"

#include <llvm/IR/IRBuilder.h>

namespace ksc::ir::compare_ops {

using ast::BinaryOp;

TypeId result_type(TypeContext& tctx, BinaryOp op, TypeId t){
    bool ok = tctx.is_numeric(t) ||
              (tctx.kind(t) == Type::Kind::Bool && (op == BinaryOp::Eq || op == BinaryOp::Ne));
    if(!ok) throw unsupported_operation(tctx.name(t), ast::op_name(op));
    return tctx.boolean();
}

static llvm::CmpInst::Predicate int_pred(BinaryOp op){
    switch(op){
        case BinaryOp::Eq: return llvm::CmpInst::ICMP_EQ;
        case BinaryOp::Ne: return llvm::CmpInst::ICMP_NE;
        case BinaryOp::Lt: return llvm::CmpInst::ICMP_SLT;
        case BinaryOp::Gt: return llvm::CmpInst::ICMP_SGT;
        case BinaryOp::Le: return llvm::CmpInst::ICMP_SLE;
        default: return llvm::CmpInst::ICMP_SGE;
    }
}

static llvm::CmpInst::Predicate float_pred(BinaryOp op){
    switch(op){
        case BinaryOp::Eq: return llvm::CmpInst::FCMP_OEQ;
        case BinaryOp::Ne: return llvm::CmpInst::FCMP_ONE;
        case BinaryOp::Lt: return llvm::CmpInst::FCMP_OLT;
        case BinaryOp::Gt: return llvm::CmpInst::FCMP_OGT;
        case BinaryOp::Le: return llvm::CmpInst::FCMP_OLE;
        default: return llvm::CmpInst::FCMP_OGE;
    }
}

TypedValue compare(builder::State& S, BinaryOp op, const TypedValue& l, const TypedValue& r){
    if(l.type != r.type)
        throw type_mismatch(std::string("operands of '") + ast::op_name(op) + "'", S.tctx.name(l.type), S.tctx.name(r.type));
    TypeId b = result_type(S.tctx, op, l.type);
    auto& B = S.builder;
    llvm::Value* v = S.tctx.kind(l.type) == Type::Kind::Number
        ? B.CreateFCmp(float_pred(op), l.value, r.value, ast::op_name(op))
        : B.CreateICmp(int_pred(op), l.value, r.value, ast::op_name(op)); // Int32 and Bool
    return TypedValue{b, v};
}

} // namespace ksc::ir::compare_ops
