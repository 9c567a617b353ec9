#pragma once
#include <memory>
#include <string>
#include <vector>

#include <llvm/IR/BasicBlock.h>
#include <llvm/IR/Function.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/Verifier.h>
#include <llvm/Support/raw_ostream.h>

#include "ksc/ast_reader.hpp"
#include "ksc/compiler.hpp"

namespace ksc_test {

// Compiler plus the outcome of compiling one EDN program. The env is explicit so the
// process environment does not leak into tests.
struct Compiled {
    std::unique_ptr<ksc::Compiler> compiler;
    ksc::CompileResult result;
    llvm::Module* module = nullptr;
};

inline Compiled compile_edn(const std::string& src, ksc::EmitEnv env = {}){
    Compiled c;
    c.compiler = std::make_unique<ksc::Compiler>(env);
    auto prog = ksc::read_program(src);
    c.module = c.compiler->compile(prog, c.result, "test");
    return c;
}

// Code of the first error, or "ok".
inline std::string first_code(const Compiled& c){
    return c.result.errors.empty() ? std::string("ok") : c.result.errors.front().code;
}

template<class F>
std::string code_of(F&& f){
    try { f(); }
    catch(const ksc::compile_error& e){ return e.error.code; }
    return "none";
}

inline bool verifies(llvm::Module& M){
    return !llvm::verifyModule(M, &llvm::errs());
}

inline llvm::BasicBlock* block_named(llvm::Function& F, const std::string& name){
    for(auto& bb: F) if(bb.getName() == name) return &bb;
    return nullptr;
}

template<class I>
std::vector<I*> insts(llvm::Function& F){
    std::vector<I*> out;
    for(auto& bb: F) for(auto& inst: bb) if(auto* i = llvm::dyn_cast<I>(&inst)) out.push_back(i);
    return out;
}

} // namespace ksc_test
