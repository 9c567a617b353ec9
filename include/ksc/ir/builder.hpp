#pragma once

#include <string>
#include <unordered_map>
#include <vector>
#include <functional>

#include <llvm/IR/Function.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "ksc/types.hpp"
#include "ksc/diagnostics.hpp"
#include "ksc/ir/scope.hpp"

namespace ksc::ir::builder {

struct FunctionRecord {
    std::string name;
    llvm::Function* function = nullptr;
    TypeId fnType{};
    std::vector<std::string> paramNames;
    bool declaredOnly = true;
};

// Module function table; records keep declaration order.
struct FunctionTable {
    std::vector<FunctionRecord> records;
    std::unordered_map<std::string, size_t> index;

    FunctionRecord* find(const std::string& name){
        auto it = index.find(name);
        return it == index.end() ? nullptr : &records[it->second];
    }
};

// Shared state for lowering helpers. Holds the single insertion cursor (builder) and
// references to the session-owned registries.
struct State {
    llvm::IRBuilder<>& builder;
    llvm::LLVMContext& llctx;
    TypeContext& tctx;
    ScopeStack& scopes;
    FunctionTable& functions;
    std::function<llvm::Type*(TypeId)> map_type;
    std::vector<CompileWarning>& warnings;

    llvm::Module* module = nullptr;  // null until create_module
    llvm::Function* fn = nullptr;    // function whose body is being lowered
    int cfCounter = 0;               // block/value label numbering, reset per module
    bool debug = false;
};

inline llvm::Module& require_module(State& S){
    if(!S.module) throw no_module();
    return *S.module;
}

// The cursor must be inside a function body for anything that emits instructions.
inline llvm::Function* require_function(State& S, const std::string& construct){
    if(!S.fn) throw no_enclosing_function(construct);
    if(!S.builder.GetInsertBlock()) throw std::logic_error("emit with no open block in '" + S.fn->getName().str() + "'");
    return S.fn;
}

inline int next_label(State& S){ return S.cfCounter++; }

} // namespace ksc::ir::builder
