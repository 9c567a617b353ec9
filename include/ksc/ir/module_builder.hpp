#pragma once
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <llvm/IR/Function.h>
#include <llvm/IR/Module.h>

#include "ksc/ir/builder.hpp"
#include "ksc/ir/context.hpp"

namespace ksc::ir::module_builder {

struct FunctionHandle {
    llvm::Function* function = nullptr;
    TypeId fnType{};
};

// Creates the session's single module; applies env (target triple).
void create_module(builder::State& S, std::unique_ptr<llvm::Module>& owner,
                   const std::string& name, const EmitEnv& env);

// Registers a signature by TypeId. With forDefinition the record waits for open_body;
// otherwise it is declare-only.
FunctionHandle declare_signature(builder::State& S, const std::string& name, TypeId ret,
                                 const std::vector<TypeId>& params,
                                 std::vector<std::string> paramNames, bool forDefinition);

// Registers a body-less callable. Type names resolve through the scope stack.
FunctionHandle declare_function(builder::State& S, const std::string& name,
                                const std::string& retType,
                                const std::vector<std::string>& paramTypes);

// Registers the signature and opens its body (see open_body).
FunctionHandle define_function(builder::State& S, const std::string& name,
                               const std::string& retType,
                               const std::vector<std::pair<std::string, std::string>>& params); // (type, name)

// Second phase of a definition whose signature was registered earlier: opens `entry`,
// pushes the function scope and spills each parameter into "<param>.slot".
FunctionHandle open_body(builder::State& S, const std::string& name);

// Emits the return of the body value (ret void for Void functions), pops the function
// scope and clears the cursor.
void finish_function(builder::State& S, const TypedValue& result);

const builder::FunctionRecord* find_function(builder::State& S, const std::string& name);

} // namespace ksc::ir::module_builder
