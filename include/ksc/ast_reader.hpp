// Reads the EDN encoding of a KSC AST:
//
//   (program stmt*)
//   stmt := (fn name [RetType] [(Type param)*] body) | (extern name RetType [Type*])
//         | (block stmt*) | expr
//   expr := number | "string" | symbol | (call f expr*) | (let Type|_ name expr)
//         | (if expr stmt stmt) | (while expr stmt) | (for name name stmt) | (op expr expr)
//
// with op one of + - * / // % == != < > <= >=. A list type is written [T].
#pragma once
#include "ksc/ast.hpp"
#include "ksc/edn.hpp"

namespace ksc {

// Throws parse_error ("line:col: message") on a malformed form.
ast::Program read_program(const node_ptr& root);

// Convenience: parse + read_program.
ast::Program read_program(std::string_view text);

} // namespace ksc
