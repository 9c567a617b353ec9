// Compiler: one compilation session lowering a KSC Program into one LLVM module.
#pragma once
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

#include <llvm/IR/IRBuilder.h>
#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>

#include "ksc/ast.hpp"
#include "ksc/diagnostics.hpp"
#include "ksc/types.hpp"
#include "ksc/ir/builder.hpp"
#include "ksc/ir/context.hpp"
#include "ksc/ir/module_builder.hpp"
#include "ksc/ir/scope.hpp"

namespace ksc {

class Compiler {
public:
    Compiler();
    explicit Compiler(EmitEnv env);
    ~Compiler();
    Compiler(const Compiler&) = delete;
    Compiler& operator=(const Compiler&) = delete;

    // Lower a whole program. Diagnostics are recorded in result; on error returns nullptr.
    llvm::Module* compile(const ast::Program& prog, CompileResult& result,
                          const std::string& moduleName = "ksc.module");

    // Session API for hosts driving the lowering step by step. These throw compile_error.
    void create_module(const std::string& name);
    ir::module_builder::FunctionHandle declare_function(const std::string& name, const std::string& retType,
                                                        const std::vector<std::string>& paramTypes);
    ir::module_builder::FunctionHandle define_function(const std::string& name, const std::string& retType,
                                                       const std::vector<ast::Param>& params);
    void finish_function(const TypedValue& result);
    TypedValue compile_expression(const ast::Expression& e, std::optional<TypeId> expected = std::nullopt);
    TypedValue compile_statement(const ast::Statement& s);

    // Static type of e without emitting anything; nullopt while it depends on a function
    // whose return type is still being inferred.
    std::optional<TypeId> infer(const ast::Expression& e, std::optional<TypeId> expected = std::nullopt);

    ScopeStack& scopes() { return scopes_; }
    TypeContext& types() { return tctx_; }
    llvm::LLVMContext& context() { return *llctx_; }
    llvm::Module* module() { return module_.get(); }
    ir::builder::State& state() { return S_; }
    // Registered functions in declaration order.
    const std::vector<ir::builder::FunctionRecord>& functions() const { return functions_.records; }

    // LLVM textual IR of the current module (empty without one).
    std::string render() const;
    const std::vector<CompileWarning>& warnings() const { return warnings_; }

    const EmitEnv& env() const { return env_; }
    void setEnv(EmitEnv e);

private:
    using InferFrame = std::unordered_map<std::string, TypeId>;

    TypedValue lower_expr_stmt(const ast::ExpressionStatement& es, std::optional<TypeId> expected);
    TypedValue lower_block(const ast::Block& b);
    TypedValue lower_binary(const ast::BinaryOperator& b, std::optional<TypeId> expected);
    TypedValue lower_call(const ast::FunctionCall& c);
    TypedValue lower_let(const ast::VariableDeclaration& d);
    TypedValue lower_reference(const ast::VariableReference& r);
    TypedValue lower_if(const ast::IfExpression& e, std::optional<TypeId> expected);
    TypedValue lower_body(const ast::FunctionDeclaration& fn, TypeId ret);

    std::optional<TypeId> infer_stmt(const ast::ExpressionStatement& es, std::optional<TypeId> expected);
    std::optional<TypeId> infer_body(const ast::ExpressionStatement& body);
    std::optional<TypeId> infer_variable(const std::string& name);
    std::optional<TypeId> infer_callee(const std::string& name);
    bool lookup_declared(const std::string& name, std::optional<TypeId>& fnType);
    std::optional<TypeId> resolve_return(const ast::FunctionDeclaration& fn);
    std::optional<TypeId> signature_of(const ast::FunctionDeclaration& fn);
    std::pair<std::optional<TypeId>, std::optional<TypeId>> operand_expectations(const ast::BinaryOperator& b,
                                                                                 std::optional<TypeId> expected);

    void register_program(const ast::Program& prog);
    void reset_session();

    EmitEnv env_;
    std::unique_ptr<llvm::LLVMContext> llctx_;
    llvm::IRBuilder<> builder_;
    TypeContext tctx_;
    ScopeStack scopes_;
    ir::builder::FunctionTable functions_;
    std::vector<CompileWarning> warnings_;
    std::unique_ptr<llvm::Module> module_;
    ir::builder::State S_;

    // return-type inference state
    std::vector<InferFrame> overlay_;
    std::unordered_set<std::string> pending_;
    std::unordered_map<std::string, const ast::FunctionDeclaration*> decls_;
    std::unordered_map<std::string, const ast::ExternDeclaration*> externs_;
    std::unordered_map<std::string, TypeId> inferredRet_;
};

} // namespace ksc
