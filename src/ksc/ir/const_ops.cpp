#include "ksc/ir/const_ops.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <llvm/IR/Constants.h>
#include <llvm/IR/GlobalVariable.h>

namespace ksc::ir::const_ops {

TypedValue number(builder::State& S, double v, TypeId ty){
    auto& B = S.builder;
    switch(S.tctx.kind(ty)){
        case Type::Kind::Number:
            return TypedValue{ty, llvm::ConstantFP::get(B.getDoubleTy(), v)};
        case Type::Kind::Int32: {
            if(!std::isfinite(v)) throw invalid_constant_for_type(S.tctx.name(ty), "not a finite value");
            // half away from zero
            long long r = std::llround(v);
            if(r < std::numeric_limits<int32_t>::min() || r > std::numeric_limits<int32_t>::max())
                throw invalid_constant_for_type(S.tctx.name(ty), "out of range");
            return TypedValue{ty, llvm::ConstantInt::get(B.getInt32Ty(), (uint64_t)(int64_t)r, /*isSigned*/ true)};
        }
        case Type::Kind::Bool:
            return TypedValue{ty, llvm::ConstantInt::get(B.getInt1Ty(), v != 0.0 ? 1 : 0)};
        default:
            throw invalid_constant_for_type(S.tctx.name(ty));
    }
}

TypedValue string(builder::State& S, const std::string& text, TypeId ty){
    if(S.tctx.kind(ty) != Type::Kind::List || !S.tctx.is_numeric(S.tctx.at(ty).elem))
        throw invalid_constant_for_type(S.tctx.name(ty), "string literal");
    auto& M = builder::require_module(S);
    auto& B = S.builder;
    TypeId elemT = S.tctx.at(ty).elem;
    llvm::Type* elemLL = S.map_type(elemT);
    std::vector<llvm::Constant*> units; units.reserve(text.size());
    for(unsigned char c: text){
        if(S.tctx.kind(elemT) == Type::Kind::Int32) units.push_back(llvm::ConstantInt::get(elemLL, c));
        else units.push_back(llvm::ConstantFP::get(elemLL, (double)c));
    }
    auto* arrTy = llvm::ArrayType::get(elemLL, units.size());
    int n = builder::next_label(S);
    auto* gv = new llvm::GlobalVariable(M, arrTy, /*isConstant*/ true, llvm::GlobalValue::PrivateLinkage,
                                        llvm::ConstantArray::get(arrTy, units), ".str." + std::to_string(n));
    gv->setUnnamedAddr(llvm::GlobalValue::UnnamedAddr::Global);
    llvm::Constant* zero = B.getInt64(0);
    llvm::Constant* idx[] = {zero, zero};
    llvm::Constant* data = llvm::ConstantExpr::getInBoundsGetElementPtr(arrTy, gv, idx);
    auto* listTy = llvm::cast<llvm::StructType>(S.map_type(ty));
    llvm::Constant* v = llvm::ConstantStruct::get(listTy, {B.getInt64(text.size()), data});
    return TypedValue{ty, v};
}

} // namespace ksc::ir::const_ops
