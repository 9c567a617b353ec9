#pragma once

#include <string>
#include <vector>

#include <llvm/IR/DerivedTypes.h>

#include "ksc/ir/builder.hpp"

namespace ksc::ir::call_ops {

struct Callee {
    std::string name;
    TypeId fnType{};
    llvm::Value* target = nullptr; // llvm::Function*, or null for an indirect call
    TypedValue slot{};             // Function-typed variable slot for indirect calls
};

// Module function table first, then a Function-typed variable. UndefinedFunction otherwise.
Callee resolve(builder::State& S, const std::string& name);

// ParameterCountMismatch unless argCount matches the signature. Emits nothing.
void check_arity(builder::State& S, const Callee& c, size_t argCount);

// Emit the call. Arguments must already carry the parameter types.
TypedValue emit(builder::State& S, const Callee& c, const std::vector<TypedValue>& args);

}
