#include <gtest/gtest.h>
#include <cstdlib>
#include "ksc/ast.hpp"
#include "test_util.hpp"

using namespace ksc;
using namespace ksc::ast;
using ksc_test::code_of;

TEST(ModuleBuilder, OperationsNeedAModule){
    Compiler c{EmitEnv{}};
    EXPECT_EQ(code_of([&]{ c.declare_function("f", "Void", {}); }), "E0501");
    EXPECT_EQ(code_of([&]{ c.define_function("f", "Void", {}); }), "E0501");
    EXPECT_EQ(c.module(), nullptr);
    EXPECT_EQ(c.render(), "");
}

TEST(ModuleBuilder, ModuleIsCreatedOnce){
    Compiler c{EmitEnv{}};
    c.create_module("one");
    EXPECT_EQ(code_of([&]{ c.create_module("two"); }), "E0502");
    EXPECT_EQ(c.module()->getName(), "one");
}

TEST(ModuleBuilder, TargetTripleFromEnv){
    EmitEnv env;
    env.targetTriple = "x86_64-unknown-linux-gnu";
    Compiler c{env};
    c.create_module("m");
    EXPECT_EQ(c.module()->getTargetTriple(), "x86_64-unknown-linux-gnu");
}

TEST(ModuleBuilder, EnvironmentFlags){
    setenv("KSC_VERIFY_IR", "1", 1);
    setenv("KSC_DEBUG_LOWER", "0", 1);
    setenv("KSC_TARGET_TRIPLE", "aarch64-unknown-linux-gnu", 1);
    EmitEnv e = detectEnv();
    unsetenv("KSC_VERIFY_IR");
    unsetenv("KSC_DEBUG_LOWER");
    unsetenv("KSC_TARGET_TRIPLE");
    EXPECT_TRUE(e.verifyIR);
    EXPECT_FALSE(e.debugLower);
    EXPECT_FALSE(e.diagJson);
    EXPECT_EQ(e.targetTriple, "aarch64-unknown-linux-gnu");
    EXPECT_TRUE(detectEnv().targetTriple.empty());
}

TEST(ModuleBuilder, DeclareResolvesTypesFirst){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    EXPECT_EQ(code_of([&]{ c.declare_function("f", "Number", {"Nope"}); }), "E0101");
    EXPECT_EQ(c.module()->getFunction("f"), nullptr);
    auto h = c.declare_function("f", "Number", {"Int32", "[Number]"});
    ASSERT_NE(h.function, nullptr);
    EXPECT_TRUE(h.function->isDeclaration());
    EXPECT_EQ(c.types().name(h.fnType), "fn(Int32, [Number]) -> Number");
    EXPECT_TRUE(h.function->getReturnType()->isDoubleTy());
    EXPECT_TRUE(h.function->getArg(1)->getType()->isStructTy());
    EXPECT_EQ(code_of([&]{ c.declare_function("f", "Void", {}); }), "E0302");
    EXPECT_EQ(code_of([&]{ c.define_function("f", "Number", {}); }), "E0302");
}

TEST(ModuleBuilder, DefineSpillsParametersIntoSlots){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    auto h = c.define_function("add", "Int32", {{"Int32", "a"}, {"Int32", "b"}});
    llvm::Function* F = h.function;
    EXPECT_FALSE(F->isDeclaration());
    ASSERT_EQ(F->size(), 1u);
    EXPECT_EQ(F->getEntryBlock().getName(), "entry");
    auto allocas = ksc_test::insts<llvm::AllocaInst>(*F);
    ASSERT_EQ(allocas.size(), 2u);
    EXPECT_EQ(allocas[0]->getName(), "a.slot");
    EXPECT_EQ(allocas[1]->getName(), "b.slot");
    EXPECT_EQ(ksc_test::insts<llvm::StoreInst>(*F).size(), 2u);
    ASSERT_NE(c.scopes().find("a"), nullptr);
    EXPECT_EQ(c.scopes().find("a")->type, c.types().int32());
    EXPECT_EQ(F->getArg(0)->getName(), "a");

    auto sum = c.compile_expression(*bin(BinaryOp::Add, var("a"), var("b")));
    c.finish_function(sum);
    // the function scope is gone again
    EXPECT_EQ(c.scopes().find("a"), nullptr);
    EXPECT_EQ(c.scopes().depth(), 1u);
    auto* ret = llvm::dyn_cast<llvm::ReturnInst>(F->getEntryBlock().getTerminator());
    ASSERT_NE(ret, nullptr);
    EXPECT_EQ(ret->getReturnValue(), sum.value);
    EXPECT_TRUE(ksc_test::verifies(*c.module()));
}

TEST(ModuleBuilder, VoidFunctionReturnsVoid){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    auto h = c.define_function("noop", "Void", {});
    c.finish_function(TypedValue{c.types().void_type(), nullptr});
    auto* ret = llvm::cast<llvm::ReturnInst>(h.function->getEntryBlock().getTerminator());
    EXPECT_EQ(ret->getReturnValue(), nullptr);
    EXPECT_TRUE(ksc_test::verifies(*c.module()));
}

TEST(ModuleBuilder, FinishChecksReturnType){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    c.define_function("f", "Int32", {});
    auto v = c.compile_expression(*num(1.5));
    EXPECT_EQ(code_of([&]{ c.finish_function(v); }), "E0401");
}

TEST(ModuleBuilder, FunctionTableKeepsDeclarationOrder){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    c.declare_function("b", "Void", {});
    c.declare_function("a", "Void", {});
    auto& recs = c.functions();
    ASSERT_EQ(recs.size(), 2u);
    EXPECT_EQ(recs[0].name, "b");
    EXPECT_EQ(recs[1].name, "a");
    EXPECT_TRUE(recs[0].declaredOnly);
    EXPECT_NE(ksc::ir::module_builder::find_function(c.state(), "a"), nullptr);
    EXPECT_EQ(ksc::ir::module_builder::find_function(c.state(), "zzz"), nullptr);
}

TEST(ModuleBuilder, VoidParameterIsRejected){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    EXPECT_EQ(code_of([&]{ c.declare_function("f", "Void", {"Void"}); }), "E0401");
}
