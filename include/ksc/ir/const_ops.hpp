#pragma once

#include <string>

#include "ksc/ir/builder.hpp"

namespace ksc::ir::const_ops {

// Materialize a numeric literal as type ty: Number (double), Int32 (llround, range
// checked) or Bool (value != 0). Other types raise InvalidConstantForType.
TypedValue number(builder::State& S, double v, TypeId ty);

// Materialize a string literal as a List of code units ([Int32] or [Number]) backed
// by a private global ".str.<n>".
TypedValue string(builder::State& S, const std::string& text, TypeId ty);

}
