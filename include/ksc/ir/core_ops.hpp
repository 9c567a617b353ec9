#pragma once

#include "ksc/ast.hpp"
#include "ksc/ir/builder.hpp"

namespace ksc::ir::core_ops {

// Result type of an arithmetic op over operands of type t (no emission).
// Only Number and Int32 support arithmetic.
TypeId result_type(TypeContext& tctx, ast::BinaryOp op, TypeId t);

// Emit arithmetic on two operands of identical type.
TypedValue arith(builder::State& S, ast::BinaryOp op, const TypedValue& l, const TypedValue& r);

}
