#include "ksc/ir/variable_ops.hpp"

#include <cstdio>
#include <llvm/IR/IRBuilder.h>

namespace ksc::ir::variable_ops {

llvm::AllocaInst* entry_slot(builder::State& S, TypeId ty, const std::string& name){
    return entry_slot(S, S.map_type(ty), name);
}

llvm::AllocaInst* entry_slot(builder::State& S, llvm::Type* ty, const std::string& name){
    llvm::Function* F = builder::require_function(S, "variable '" + name + "'");
    llvm::BasicBlock& entry = F->getEntryBlock();
    // keep allocas grouped at the top of entry, ahead of any other instruction
    llvm::IRBuilder<> eb(&entry, entry.begin());
    for(auto it = entry.begin(); it != entry.end() && llvm::isa<llvm::AllocaInst>(*it); ++it)
        eb.SetInsertPoint(&entry, std::next(it));
    return eb.CreateAlloca(ty, nullptr, name);
}

TypedValue declare(builder::State& S, const std::string& name, const TypedValue& init){
    if(S.tctx.is_void(init.type)) throw type_mismatch("initializer of '" + name + "'", "a value type", "Void");
    auto* slot = entry_slot(S, init.type, name + ".slot");
    S.builder.CreateStore(init.value, slot);
    S.scopes.bind(name, TypedValue{init.type, slot});
    if(S.debug) fprintf(stderr, "[dbg][lower] let %s : %s (depth=%zu)\n", name.c_str(), S.tctx.name(init.type).c_str(), S.scopes.depth());
    return init;
}

TypedValue load(builder::State& S, const std::string& name){
    const TypedValue& slot = S.scopes.lookup(name);
    builder::require_function(S, "variable '" + name + "'");
    return TypedValue{slot.type, S.builder.CreateLoad(S.map_type(slot.type), slot.value, name)};
}

} // namespace ksc::ir::variable_ops
