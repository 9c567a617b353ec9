#pragma once

#include <string>

#include <llvm/IR/Instructions.h>

#include "ksc/ir/builder.hpp"

namespace ksc::ir::variable_ops {

// Allocate a storage slot in the entry block of the current function, independent of
// where the cursor currently is.
llvm::AllocaInst* entry_slot(builder::State& S, TypeId ty, const std::string& name);
llvm::AllocaInst* entry_slot(builder::State& S, llvm::Type* ty, const std::string& name);

// Spill init into a fresh "<name>.slot" and bind name in the innermost scope.
// Returns the stored value.
TypedValue declare(builder::State& S, const std::string& name, const TypedValue& init);

// Load the current value of a bound variable.
TypedValue load(builder::State& S, const std::string& name);

}
