#include "ksc/ir/module_builder.hpp"
#include "ksc/ir/types.hpp"

#include <cstdio>
#include <stdexcept>

#include <llvm/IR/Type.h>

namespace ksc::ir::module_builder {

void create_module(builder::State& S, std::unique_ptr<llvm::Module>& owner,
                   const std::string& name, const EmitEnv& env){
    if(S.module) throw module_already_created(S.module->getName().str());
    owner = std::make_unique<llvm::Module>(name, S.llctx);
    applyEnvToModule(*owner, env);
    S.module = owner.get();
    S.cfCounter = 0;
    if(S.debug) fprintf(stderr, "[dbg][fn] module '%s' created\n", name.c_str());
}

FunctionHandle declare_signature(builder::State& S, const std::string& name, TypeId ret,
                                 const std::vector<TypeId>& params,
                                 std::vector<std::string> paramNames, bool forDefinition){
    auto& M = builder::require_module(S);
    for(auto t: params)
        if(S.tctx.is_void(t)) throw type_mismatch("parameter of '" + name + "'", "a value type", "Void");
    if(S.functions.find(name)) throw duplicate_function(name);
    TypeId fty = S.tctx.get_function(params, ret);
    auto* F = llvm::Function::Create(function_type(S.tctx, S.llctx, fty),
                                     llvm::Function::ExternalLinkage, name, &M);
    for(size_t i = 0; i < paramNames.size() && i < F->arg_size(); ++i)
        F->getArg((unsigned)i)->setName(paramNames[i]);
    S.functions.index[name] = S.functions.records.size();
    S.functions.records.push_back(builder::FunctionRecord{name, F, fty, std::move(paramNames), !forDefinition});
    if(S.debug) fprintf(stderr, "[dbg][fn] %s %s : %s\n", forDefinition ? "signature" : "declare", name.c_str(), S.tctx.name(fty).c_str());
    return FunctionHandle{F, fty};
}

static FunctionHandle register_signature(builder::State& S, const std::string& name,
                                         const std::string& retType,
                                         const std::vector<std::string>& paramTypes,
                                         std::vector<std::string> paramNames, bool forDefinition){
    builder::require_module(S);
    // resolve every type name before touching the module
    TypeId ret = S.scopes.resolve_type(retType);
    std::vector<TypeId> ps; ps.reserve(paramTypes.size());
    for(auto& p: paramTypes) ps.push_back(S.scopes.resolve_type(p));
    return declare_signature(S, name, ret, ps, std::move(paramNames), forDefinition);
}

FunctionHandle declare_function(builder::State& S, const std::string& name,
                                const std::string& retType,
                                const std::vector<std::string>& paramTypes){
    return register_signature(S, name, retType, paramTypes, {}, false);
}

FunctionHandle define_function(builder::State& S, const std::string& name,
                               const std::string& retType,
                               const std::vector<std::pair<std::string, std::string>>& params){
    std::vector<std::string> types, names;
    for(auto& p: params){ types.push_back(p.first); names.push_back(p.second); }
    register_signature(S, name, retType, types, std::move(names), true);
    return open_body(S, name);
}

FunctionHandle open_body(builder::State& S, const std::string& name){
    auto* rec = S.functions.find(name);
    if(!rec) throw undefined_function(name);
    if(rec->declaredOnly || !rec->function->empty()) throw duplicate_function(name);
    if(S.fn) throw unsupported_construct("nested function definition '" + name + "'");
    llvm::Function* F = rec->function;
    auto* entry = llvm::BasicBlock::Create(S.llctx, "entry", F);
    S.builder.SetInsertPoint(entry);
    S.fn = F;
    S.scopes.push_scope();
    const Type& FT = S.tctx.at(rec->fnType);
    unsigned ai = 0;
    for(auto& arg: F->args()){
        TypeId pty = FT.params[ai];
        std::string pname = ai < rec->paramNames.size() ? rec->paramNames[ai] : ("arg" + std::to_string(ai));
        auto* slot = S.builder.CreateAlloca(S.map_type(pty), nullptr, pname + ".slot");
        S.builder.CreateStore(&arg, slot);
        S.scopes.bind(pname, TypedValue{pty, slot});
        ++ai;
    }
    if(S.debug) fprintf(stderr, "[dbg][fn] define %s (%u params)\n", name.c_str(), ai);
    return FunctionHandle{F, rec->fnType};
}

void finish_function(builder::State& S, const TypedValue& result){
    llvm::Function* F = builder::require_function(S, "function body");
    auto* rec = S.functions.find(F->getName().str());
    TypeId ret = S.tctx.at(rec->fnType).ret;
    if(S.builder.GetInsertBlock()->getTerminator())
        throw std::logic_error("finish_function: block already terminated in '" + F->getName().str() + "'");
    if(S.tctx.is_void(ret)){
        S.builder.CreateRetVoid();
    } else {
        if(result.type != ret) throw type_mismatch("return value of '" + rec->name + "'", S.tctx.name(ret), S.tctx.name(result.type));
        S.builder.CreateRet(result.value);
    }
    S.scopes.pop_scope();
    S.fn = nullptr;
    S.builder.ClearInsertionPoint();
}

const builder::FunctionRecord* find_function(builder::State& S, const std::string& name){
    return S.functions.find(name);
}

} // namespace ksc::ir::module_builder
