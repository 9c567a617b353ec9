#pragma once

#include "ksc/ast.hpp"
#include "ksc/ir/builder.hpp"

namespace ksc::ir::compare_ops {

// Comparisons yield Bool. Int32 and Number support all six; Bool supports eq/ne only.
TypeId result_type(TypeContext& tctx, ast::BinaryOp op, TypeId t);

TypedValue compare(builder::State& S, ast::BinaryOp op, const TypedValue& l, const TypedValue& r);

}
