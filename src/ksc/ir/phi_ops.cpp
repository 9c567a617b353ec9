#include "ksc/ir/phi_ops.hpp"
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/Instructions.h>

namespace ksc::ir::phi_ops {

TypedValue merge_phi(builder::State& S,
                     const TypedValue& thenValue, llvm::BasicBlock* thenBlock,
                     const TypedValue& elseValue, llvm::BasicBlock* elseBlock,
                     int n){
    if(thenValue.type != elseValue.type)
        throw type_mismatch("if branches", S.tctx.name(thenValue.type), S.tctx.name(elseValue.type));
    if(S.tctx.is_void(thenValue.type))
        throw type_mismatch("if value", "a value type", "Void");
    auto* merge = S.builder.GetInsertBlock();
    if(!merge || merge->getTerminator())
        throw std::logic_error("merge_phi: cursor is not in an open merge block");
    llvm::PHINode* phi = S.builder.CreatePHI(S.map_type(thenValue.type), 2, "if.value." + std::to_string(n));
    phi->addIncoming(thenValue.value, thenBlock);
    phi->addIncoming(elseValue.value, elseBlock);
    if(S.debug) fprintf(stderr, "[dbg][cf] phi if.value.%d : %s from %s, %s\n", n, S.tctx.name(thenValue.type).c_str(),
                        thenBlock->getName().str().c_str(), elseBlock->getName().str().c_str());
    return TypedValue{thenValue.type, phi};
}

} // namespace ksc::ir::phi_ops
