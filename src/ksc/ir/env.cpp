#include "ksc/ir/context.hpp"
#include <cstdlib>
#include <string>

namespace ksc {

EmitEnv detectEnv(){
    EmitEnv e{};
    auto get = [](const char* k)->const char*{ const char* v = std::getenv(k); return (v && *v) ? v : nullptr; };

    if (const char* v = get("KSC_VERIFY_IR")) e.verifyIR = (std::string(v) == "1");
    if (const char* v = get("KSC_DEBUG_LOWER")) e.debugLower = (std::string(v) == "1");
    if (const char* v = get("KSC_DIAG_JSON")) e.diagJson = (std::string(v) == "1");

    // Target triple (optional)
    if (const char* v = get("KSC_TARGET_TRIPLE")) e.targetTriple = v;

    return e;
}

void applyEnvToModule(llvm::Module& M, const EmitEnv& env){
    if(!env.targetTriple.empty()){
        M.setTargetTriple(env.targetTriple);
    }
}

} // namespace ksc
