#pragma once
#include "ksc/types.hpp"
#include <vector>

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Type.h>
#include <llvm/IR/DerivedTypes.h>

namespace ksc::ir {

inline llvm::FunctionType* function_type(TypeContext& tctx, llvm::LLVMContext& llctx, TypeId id);

// Map a KSC TypeId to an LLVM type.
inline llvm::Type* map_type(TypeContext& tctx, llvm::LLVMContext& llctx, TypeId id){
    const Type& T = tctx.at(id);
    switch(T.kind){
        case Type::Kind::Number: return llvm::Type::getDoubleTy(llctx);
        case Type::Kind::Int32: return llvm::Type::getInt32Ty(llctx);
        case Type::Kind::Bool: return llvm::Type::getInt1Ty(llctx);
        case Type::Kind::Void: return llvm::Type::getVoidTy(llctx);
        case Type::Kind::Function:
            return llvm::PointerType::getUnqual(function_type(tctx, llctx, id));
        case Type::Kind::Struct: {
            auto* ST = llvm::StructType::getTypeByName(llctx, "struct."+T.name);
            if(!ST) ST = llvm::StructType::create(llctx, "struct."+T.name);
            if(ST->isOpaque()){
                std::vector<llvm::Type*> elems; elems.reserve(T.params.size());
                for(auto f: T.params) elems.push_back(map_type(tctx, llctx, f));
                ST->setBody(elems, /*isPacked*/ false);
            }
            return ST;
        }
        case Type::Kind::List:
            // { length, data }
            return llvm::StructType::get(llctx, {llvm::Type::getInt64Ty(llctx),
                llvm::PointerType::getUnqual(map_type(tctx, llctx, T.elem))});
    }
    return llvm::Type::getVoidTy(llctx);
}

// The LLVM function type behind a Function TypeId (map_type yields a pointer to it).
inline llvm::FunctionType* function_type(TypeContext& tctx, llvm::LLVMContext& llctx, TypeId id){
    const Type& T = tctx.at(id);
    std::vector<llvm::Type*> ps; ps.reserve(T.params.size());
    for(auto p: T.params) ps.push_back(map_type(tctx, llctx, p));
    return llvm::FunctionType::get(map_type(tctx, llctx, T.ret), ps, false);
}

} // namespace ksc::ir
