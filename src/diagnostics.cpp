#include "ksc/diagnostics.hpp"

namespace ksc {

const char* error_code(ErrorKind k){
    switch(k){
        case ErrorKind::UndefinedType: return "E0101";
        case ErrorKind::DuplicateType: return "E0102";
        case ErrorKind::UndefinedVariable: return "E0201";
        case ErrorKind::UndefinedFunction: return "E0301";
        case ErrorKind::DuplicateFunction: return "E0302";
        case ErrorKind::ParameterCountMismatch: return "E0303";
        case ErrorKind::TypeMismatch: return "E0401";
        case ErrorKind::InvalidConstantForType: return "E0402";
        case ErrorKind::UnsupportedOperation: return "E0403";
        case ErrorKind::NoModule: return "E0501";
        case ErrorKind::ModuleAlreadyCreated: return "E0502";
        case ErrorKind::NoEnclosingFunction: return "E0503";
        case ErrorKind::UnsupportedConstruct: return "E0601";
        case ErrorKind::UnresolvedReturnType: return "E0602";
    }
    return "EGEN";
}

static compile_error make(ErrorKind k, std::string message, std::string hint, std::string name = {}){
    CompileError e{k, error_code(k), std::move(message), std::move(hint), std::move(name), {}, {}, -1, -1, {}};
    return compile_error(std::move(e));
}

compile_error undefined_type(const std::string& name){
    return make(ErrorKind::UndefinedType, "undefined type '"+name+"'", "define the type before use or check the spelling", name);
}
compile_error duplicate_type(const std::string& name){
    return make(ErrorKind::DuplicateType, "type '"+name+"' already defined in this scope", "choose a unique type name", name);
}
compile_error undefined_variable(const std::string& name){
    return make(ErrorKind::UndefinedVariable, "undefined variable '"+name+"'", "declare the variable in an enclosing scope", name);
}
compile_error undefined_function(const std::string& name){
    return make(ErrorKind::UndefinedFunction, "undefined function '"+name+"'", "declare or define the function", name);
}
compile_error duplicate_function(const std::string& name){
    return make(ErrorKind::DuplicateFunction, "function '"+name+"' already exists", "choose a unique function name", name);
}
compile_error parameter_count_mismatch(const std::string& callee, size_t expected, size_t actual){
    auto err = make(ErrorKind::ParameterCountMismatch, "call to '"+callee+"' has wrong argument count", "pass exactly "+std::to_string(expected)+" argument(s)", callee);
    err.error.expected = std::to_string(expected);
    err.error.actual = std::to_string(actual);
    err.error.notes.push_back({"expected: "+err.error.expected});
    err.error.notes.push_back({"   found: "+err.error.actual});
    return err;
}
compile_error type_mismatch(const std::string& role, const std::string& expected, const std::string& actual){
    auto err = make(ErrorKind::TypeMismatch, role+" type mismatch", "ensure "+role+" has type "+expected, role);
    err.error.expected = expected;
    err.error.actual = actual;
    err.error.notes.push_back({"expected: "+expected});
    err.error.notes.push_back({"   found: "+actual});
    return err;
}
compile_error invalid_constant_for_type(const std::string& type, const std::string& why){
    return make(ErrorKind::InvalidConstantForType, "literal cannot be materialized as '"+type+"'"+(why.empty()?"":": "+why), "use a Number, Int32 or Bool context", type);
}
compile_error unsupported_operation(const std::string& type, const std::string& op){
    auto err = make(ErrorKind::UnsupportedOperation, "operation '"+op+"' not supported for type '"+type+"'", "operate on Number or Int32 values", op);
    err.error.actual = type;
    return err;
}
compile_error no_module(){
    return make(ErrorKind::NoModule, "no module has been created", "call create_module first");
}
compile_error module_already_created(const std::string& name){
    return make(ErrorKind::ModuleAlreadyCreated, "module already created (existing: '"+name+"')", "use one compilation session per module", name);
}
compile_error no_enclosing_function(const std::string& construct){
    return make(ErrorKind::NoEnclosingFunction, construct+" used outside of a function body", "move the expression into a function", construct);
}
compile_error unsupported_construct(const std::string& construct){
    return make(ErrorKind::UnsupportedConstruct, "unsupported construct: "+construct, "restructure the program", construct);
}
compile_error unresolved_return_type(const std::string& fn){
    return make(ErrorKind::UnresolvedReturnType, "cannot infer return type of '"+fn+"'", "annotate the function with a return type", fn);
}

} // namespace ksc
