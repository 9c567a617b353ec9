#pragma once

#include <string>
#include <optional>
#include <functional>

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Function.h>

#include "ksc/ast.hpp"
#include "ksc/ir/builder.hpp"

namespace ksc::ir::control_ops {

// Block primitives. Labels are "<purpose>.<n>".
llvm::BasicBlock* new_block(builder::State& S, const std::string& purpose, int n);
void branch_conditional(builder::State& S, const TypedValue& cond, llvm::BasicBlock* thenBB, llvm::BasicBlock* elseBB);
void branch_unconditional(builder::State& S, llvm::BasicBlock* target);
void position(builder::State& S, llvm::BasicBlock* block);

// Bool passes through; Int32 -> icmp ne 0; Number -> fcmp one 0.0; anything else is a TypeMismatch.
TypedValue to_condition(builder::State& S, const TypedValue& v);

// Callbacks into the expression compiler for nested lowering.
struct Context {
    builder::State& S;
    std::function<TypedValue(const ast::Expression&)> lower_expr;
    std::function<TypedValue(const ast::ExpressionStatement&)> lower_branch;
    // Static branch type; nullopt while the type depends on a pending recursive call.
    std::function<std::optional<TypeId>(const ast::ExpressionStatement&)> infer_branch;
};

TypedValue lower_if(Context& C, const ast::IfExpression& e);
TypedValue lower_while(Context& C, const ast::WhileExpression& e);
TypedValue lower_for(Context& C, const ast::ForExpression& e);

}
