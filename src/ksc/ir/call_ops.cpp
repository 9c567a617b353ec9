#include "ksc/ir/call_ops.hpp"
#include "ksc/ir/types.hpp"

#include <cstdio>
#include <llvm/IR/IRBuilder.h>

namespace ksc::ir::call_ops {

Callee resolve(builder::State& S, const std::string& name){
    if(auto* rec = S.functions.find(name)) return Callee{name, rec->fnType, rec->function, {}};
    if(auto* tv = S.scopes.find(name); tv && S.tctx.kind(tv->type) == Type::Kind::Function)
        return Callee{name, tv->type, nullptr, *tv};
    throw undefined_function(name);
}

void check_arity(builder::State& S, const Callee& c, size_t argCount){
    size_t expected = S.tctx.at(c.fnType).params.size();
    if(expected != argCount) throw parameter_count_mismatch(c.name, expected, argCount);
}

TypedValue emit(builder::State& S, const Callee& c, const std::vector<TypedValue>& args){
    builder::require_function(S, "call to '" + c.name + "'");
    check_arity(S, c, args.size());
    const Type& FT = S.tctx.at(c.fnType);
    std::vector<llvm::Value*> vals; vals.reserve(args.size());
    for(size_t i = 0; i < args.size(); ++i){
        if(args[i].type != FT.params[i])
            throw type_mismatch("argument " + std::to_string(i + 1) + " of '" + c.name + "'",
                                S.tctx.name(FT.params[i]), S.tctx.name(args[i].type));
        vals.push_back(args[i].value);
    }
    auto& B = S.builder;
    llvm::Value* target = c.target;
    if(!target) target = B.CreateLoad(S.map_type(c.fnType), c.slot.value, c.name);
    bool isVoid = S.tctx.is_void(FT.ret);
    if(S.debug) fprintf(stderr, "[dbg][lower] call %s%s\n", c.name.c_str(), c.target ? "" : " (indirect)");
    llvm::CallInst* call = B.CreateCall(function_type(S.tctx, S.llctx, c.fnType), target, vals,
                                        isVoid ? "" : c.name + ".result");
    return TypedValue{FT.ret, isVoid ? nullptr : call};
}

} // namespace ksc::ir::call_ops
