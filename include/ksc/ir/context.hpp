#pragma once
#include <string>

#include <llvm/IR/Module.h>

namespace ksc {

struct EmitEnv {
    bool verifyIR = false;   // run llvm::verifyModule after lowering
    bool debugLower = false; // [dbg][...] traces on stderr
    bool diagJson = false;   // print diagnostics JSON after a compile
    std::string targetTriple; // empty = default
};

// Detect emission environment from process env vars (KSC_VERIFY_IR, KSC_DEBUG_LOWER,
// KSC_DIAG_JSON, KSC_TARGET_TRIPLE).
EmitEnv detectEnv();

// Apply environment configuration to a module (target triple). Safe to call with defaults.
void applyEnvToModule(llvm::Module& M, const EmitEnv& env);

} // namespace ksc
