// Lexical scope stack: scoped type names and variable slots for one compilation session.
#pragma once
#include <string>
#include <unordered_map>
#include <vector>

#include <llvm/IR/Value.h>

#include "ksc/types.hpp"

namespace ksc {

// A typed SSA value. value is null exactly when type is Void.
struct TypedValue {
    TypeId type{0};
    llvm::Value* value{nullptr};
};

class ScopeStack {
public:
    // Seeds the outermost scope with Number, Int32, Bool and Void.
    explicit ScopeStack(TypeContext& tctx);

    // Type Registry ------------------------------------------------------
    void define_type(const std::string& name, TypeId id);
    // Innermost to outermost; "[T]" resolves to the List of T.
    TypeId resolve_type(const std::string& name) const;

    // Symbol Stack -------------------------------------------------------
    // Binding holds the storage slot; rebinding in the same scope shadows.
    void bind(const std::string& name, TypedValue slot);
    const TypedValue& lookup(const std::string& name) const;
    const TypedValue* find(const std::string& name) const;

    void push_scope();
    void pop_scope();
    size_t depth() const { return scopes_.size(); }

private:
    struct Scope {
        std::unordered_map<std::string, TypeId> types;
        std::unordered_map<std::string, TypedValue> values;
    };
    TypeContext& tctx_;
    std::vector<Scope> scopes_;
};

} // namespace ksc
