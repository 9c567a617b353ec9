// Compile diagnostics: error taxonomy, coded errors with notes, and the session result.
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

namespace ksc {

enum class ErrorKind {
    UndefinedType,
    DuplicateType,
    UndefinedVariable,
    UndefinedFunction,
    DuplicateFunction,
    ParameterCountMismatch,
    TypeMismatch,
    InvalidConstantForType,
    UnsupportedOperation,
    NoModule,
    ModuleAlreadyCreated,
    NoEnclosingFunction,
    UnsupportedConstruct,
    UnresolvedReturnType
};

// Stable diagnostic code (E0101 ...) for an error kind.
const char* error_code(ErrorKind k);

struct CompileNote { std::string message; };

struct CompileError {
    ErrorKind kind;
    std::string code;
    std::string message;
    std::string hint;
    std::string name;     // offending symbol/type/operator, if any
    std::string expected; // TypeMismatch / ParameterCountMismatch
    std::string actual;
    int line = -1;
    int col = -1;
    std::vector<CompileNote> notes;
};

struct CompileWarning { std::string code; std::string message; std::string hint; int line=-1; int col=-1; std::vector<CompileNote> notes; };

struct CompileResult { bool success = false; std::vector<CompileError> errors; std::vector<CompileWarning> warnings; };

// Thrown by lowering routines; caught at the session boundary and recorded in CompileResult.
struct compile_error : std::runtime_error {
    CompileError error;
    explicit compile_error(CompileError e) : std::runtime_error(e.code + ": " + e.message), error(std::move(e)) {}
};

// Factories, one per taxonomy entry.
compile_error undefined_type(const std::string& name);
compile_error duplicate_type(const std::string& name);
compile_error undefined_variable(const std::string& name);
compile_error undefined_function(const std::string& name);
compile_error duplicate_function(const std::string& name);
compile_error parameter_count_mismatch(const std::string& callee, size_t expected, size_t actual);
compile_error type_mismatch(const std::string& role, const std::string& expected, const std::string& actual);
compile_error invalid_constant_for_type(const std::string& type, const std::string& why = "");
compile_error unsupported_operation(const std::string& type, const std::string& op);
compile_error no_module();
compile_error module_already_created(const std::string& name);
compile_error no_enclosing_function(const std::string& construct);
compile_error unsupported_construct(const std::string& construct);
compile_error unresolved_return_type(const std::string& fn);

} // namespace ksc
