#pragma once

#include <llvm/IR/BasicBlock.h>

#include "ksc/ir/builder.hpp"

namespace ksc::ir::phi_ops {

// Merge two branch values at the cursor (which must be the merge block) with a
// two-edge phi named "if.value.<n>". The incoming blocks are the blocks the branches
// actually ended in, not necessarily their entry blocks.
TypedValue merge_phi(builder::State& S,
                     const TypedValue& thenValue, llvm::BasicBlock* thenBlock,
                     const TypedValue& elseValue, llvm::BasicBlock* elseBlock,
                     int n);

}
