#include "ksc/ir/scope.hpp"
#include "ksc/diagnostics.hpp"

#include <stdexcept>

namespace ksc {

ScopeStack::ScopeStack(TypeContext& tctx) : tctx_(tctx) {
    scopes_.emplace_back();
    auto& builtins = scopes_.back().types;
    builtins["Number"] = tctx.number();
    builtins["Int32"] = tctx.int32();
    builtins["Bool"] = tctx.boolean();
    builtins["Void"] = tctx.void_type();
}

void ScopeStack::define_type(const std::string& name, TypeId id){
    auto& types = scopes_.back().types;
    if(types.count(name)) throw duplicate_type(name);
    types.emplace(name, id);
}

TypeId ScopeStack::resolve_type(const std::string& name) const {
    if(name.size() > 2 && name.front()=='[' && name.back()==']'){
        TypeId elem = resolve_type(name.substr(1, name.size()-2));
        if(tctx_.is_void(elem)) throw type_mismatch("element of '" + name + "'", "a value type", "Void");
        return tctx_.get_list(elem);
    }
    for(auto it = scopes_.rbegin(); it != scopes_.rend(); ++it){
        if(auto f = it->types.find(name); f != it->types.end()) return f->second;
    }
    throw undefined_type(name);
}

void ScopeStack::bind(const std::string& name, TypedValue slot){
    scopes_.back().values[name] = slot;
}

const TypedValue* ScopeStack::find(const std::string& name) const {
    for(auto it = scopes_.rbegin(); it != scopes_.rend(); ++it){
        if(auto f = it->values.find(name); f != it->values.end()) return &f->second;
    }
    return nullptr;
}

const TypedValue& ScopeStack::lookup(const std::string& name) const {
    if(auto* tv = find(name)) return *tv;
    throw undefined_variable(name);
}

void ScopeStack::push_scope(){ scopes_.emplace_back(); }

void ScopeStack::pop_scope(){
    if(scopes_.size() <= 1) throw std::logic_error("pop_scope: outermost scope cannot be popped");
    scopes_.pop_back();
}

} // namespace ksc
