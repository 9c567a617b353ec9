#include <gtest/gtest.h>
#include <stdexcept>
#include "ksc/ast.hpp"
#include "ksc/ir/control_ops.hpp"
#include "test_util.hpp"

using namespace ksc;
using namespace ksc::ast;
using ksc_test::block_named;
using ksc_test::code_of;
using ksc_test::compile_edn;
using ksc_test::first_code;
using ksc_test::insts;

TEST(ControlFlow, IfProducesThreeBlocksAndOnePhi){
    auto c = compile_edn("(program (fn pick Number [(Bool c)] (if c 1 2)))");
    ASSERT_TRUE(c.result.success) << first_code(c);
    llvm::Function* F = c.module->getFunction("pick");
    ASSERT_EQ(F->size(), 4u);
    EXPECT_NE(block_named(*F, "if.then.0"), nullptr);
    EXPECT_NE(block_named(*F, "if.else.0"), nullptr);
    llvm::BasicBlock* end = block_named(*F, "if.end.0");
    ASSERT_NE(end, nullptr);
    auto phis = insts<llvm::PHINode>(*F);
    ASSERT_EQ(phis.size(), 1u);
    llvm::PHINode* phi = phis[0];
    EXPECT_EQ(phi->getParent(), end);
    EXPECT_EQ(phi->getName(), "if.value.0");
    EXPECT_TRUE(phi->getType()->isDoubleTy());
    ASSERT_EQ(phi->getNumIncomingValues(), 2u);
    EXPECT_EQ(phi->getIncomingBlock(0)->getName(), "if.then.0");
    EXPECT_EQ(phi->getIncomingBlock(1)->getName(), "if.else.0");
    // Bool conditions are used directly
    EXPECT_TRUE(insts<llvm::ICmpInst>(*F).empty());
    EXPECT_TRUE(ksc_test::verifies(*c.module));
}

TEST(ControlFlow, NestedIfUsesActualPredecessorBlocks){
    auto c = compile_edn(R"((program
        (fn sign Int32 [(Number x)]
          (if (< x 0)
            (if (< x -100) -2 -1)
            1))))");
    ASSERT_TRUE(c.result.success) << first_code(c);
    llvm::Function* F = c.module->getFunction("sign");
    auto phis = insts<llvm::PHINode>(*F);
    ASSERT_EQ(phis.size(), 2u);
    llvm::PHINode* outer = nullptr;
    for(auto* p: phis) if(p->getName() == "if.value.0") outer = p;
    ASSERT_NE(outer, nullptr);
    EXPECT_EQ(outer->getIncomingBlock(0)->getName(), "if.end.1");
    EXPECT_EQ(outer->getIncomingBlock(1)->getName(), "if.else.0");
    EXPECT_TRUE(outer->getType()->isIntegerTy(32));
    EXPECT_TRUE(ksc_test::verifies(*c.module));
}

TEST(ControlFlow, NumericConditionsAreConverted){
    auto c = compile_edn(R"((program
        (fn a Number [(Int32 n)] (if n 1 2))
        (fn b Number [(Number n)] (if n 1 2))))");
    ASSERT_TRUE(c.result.success) << first_code(c);
    auto icmps = insts<llvm::ICmpInst>(*c.module->getFunction("a"));
    ASSERT_EQ(icmps.size(), 1u);
    EXPECT_EQ(icmps[0]->getPredicate(), llvm::CmpInst::ICMP_NE);
    auto fcmps = insts<llvm::FCmpInst>(*c.module->getFunction("b"));
    ASSERT_EQ(fcmps.size(), 1u);
    EXPECT_EQ(fcmps[0]->getPredicate(), llvm::CmpInst::FCMP_ONE);
    EXPECT_TRUE(ksc_test::verifies(*c.module));
}

TEST(ControlFlow, NonScalarConditionIsTypeMismatch){
    auto c = compile_edn("(program (fn f Number [] (if \"ab\" 1 2)))");
    EXPECT_FALSE(c.result.success);
    EXPECT_EQ(first_code(c), "E0401");
    EXPECT_EQ(c.module, nullptr);
}

TEST(ControlFlow, BranchTypeMismatchIsRejectedBeforeEmission){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    auto h = c.define_function("f", "Number", {{"Bool", "c"}});
    auto e = if_(var("c"), expr_stmt(let("Int32", "x", num(1))), expr_stmt(num(2.5)));
    EXPECT_EQ(code_of([&]{ c.compile_expression(*e, c.types().number()); }), "E0401");
    EXPECT_EQ(h.function->size(), 1u);
    EXPECT_TRUE(insts<llvm::LoadInst>(*h.function).empty());
}

TEST(ControlFlow, DiscardedBranchValueWarns){
    auto c = compile_edn("(program (fn f Void [(Bool c)] (if c 1 (block))))");
    ASSERT_TRUE(c.result.success) << first_code(c);
    ASSERT_EQ(c.result.warnings.size(), 1u);
    EXPECT_EQ(c.result.warnings[0].code, "W0601");
    EXPECT_TRUE(insts<llvm::PHINode>(*c.module->getFunction("f")).empty());
}

TEST(ControlFlow, VoidIfUsedAsValueFails){
    auto c = compile_edn("(program (fn f Number [(Bool c)] (if c 1 (block))))");
    EXPECT_EQ(first_code(c), "E0401");
}

TEST(ControlFlow, WhileLoopShape){
    auto c = compile_edn("(program (fn spin Void [(Int32 n)] (while (< n 10) (let Int32 k 1))))");
    ASSERT_TRUE(c.result.success) << first_code(c);
    llvm::Function* F = c.module->getFunction("spin");
    llvm::BasicBlock* cond = block_named(*F, "while.cond.0");
    llvm::BasicBlock* body = block_named(*F, "while.body.0");
    llvm::BasicBlock* end = block_named(*F, "while.end.0");
    ASSERT_TRUE(cond && body && end);
    auto* back = llvm::dyn_cast<llvm::BranchInst>(body->getTerminator());
    ASSERT_NE(back, nullptr);
    EXPECT_EQ(back->getSuccessor(0), cond);
    auto* test = llvm::dyn_cast<llvm::BranchInst>(cond->getTerminator());
    ASSERT_TRUE(test && test->isConditional());
    EXPECT_EQ(test->getSuccessor(0), body);
    EXPECT_EQ(test->getSuccessor(1), end);
    EXPECT_TRUE(insts<llvm::PHINode>(*F).empty());
    EXPECT_TRUE(ksc_test::verifies(*c.module));
}

TEST(ControlFlow, LoopBodyScopeIsDropped){
    auto c = compile_edn("(program (fn f Int32 [(Int32 n)] (block (while (< n 0) (let Int32 k 1)) k)))");
    EXPECT_EQ(first_code(c), "E0201");
}

TEST(ControlFlow, ForIteratesOverList){
    auto c = compile_edn(R"((program
        (extern printNumber Void [Int32])
        (fn f Void [] (block
            (let [Int32] s "ab")
            (for ch s (call printNumber ch))))))");
    ASSERT_TRUE(c.result.success) << first_code(c);
    llvm::Function* F = c.module->getFunction("f");
    // .str.0 took the first label number
    EXPECT_NE(block_named(*F, "for.cond.1"), nullptr);
    EXPECT_NE(block_named(*F, "for.body.1"), nullptr);
    EXPECT_NE(block_named(*F, "for.end.1"), nullptr);
    EXPECT_NE(c.module->getGlobalVariable(".str.0", true), nullptr);
    // all slots live in the entry block
    for(auto* a: insts<llvm::AllocaInst>(*F)) EXPECT_EQ(a->getParent(), &F->getEntryBlock());
    EXPECT_TRUE(ksc_test::verifies(*c.module));
}

TEST(ControlFlow, ForOverNonListIsUnsupported){
    auto c = compile_edn("(program (fn f Void [(Int32 n)] (for x n (let Int32 d x))))");
    ASSERT_EQ(first_code(c), "E0403");
    EXPECT_EQ(c.result.errors[0].name, "for");
}

TEST(ControlFlow, DoubleTerminationIsADefect){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    auto h = c.define_function("f", "Void", {});
    auto& S = c.state();
    auto* bb = ir::control_ops::new_block(S, "extra", 99);
    EXPECT_EQ(bb->getName(), "extra.99");
    ir::control_ops::branch_unconditional(S, bb);
    ir::control_ops::position(S, &h.function->getEntryBlock());
    EXPECT_THROW(ir::control_ops::branch_unconditional(S, bb), std::logic_error);
}

TEST(ControlFlow, ConditionalBranchRequiresBool){
    Compiler c{EmitEnv{}};
    c.create_module("m");
    c.define_function("f", "Void", {{"Int32", "n"}});
    auto& S = c.state();
    auto n = c.compile_expression(*var("n"));
    auto* a = ir::control_ops::new_block(S, "a", 0);
    auto* b = ir::control_ops::new_block(S, "b", 0);
    EXPECT_EQ(code_of([&]{ ir::control_ops::branch_conditional(S, n, a, b); }), "E0401");
    auto cond = ir::control_ops::to_condition(S, n);
    EXPECT_EQ(cond.type, c.types().boolean());
    ir::control_ops::branch_conditional(S, cond, a, b);
    EXPECT_NE(S.builder.GetInsertBlock()->getTerminator(), nullptr);
}

TEST(ControlFlow, ConditionBindingsStayInsideTheConstruct){
    EXPECT_EQ(first_code(compile_edn("(program (fn f Int32 [] (block (while (let Int32 k 0) 1) k)))")), "E0201");
    EXPECT_EQ(first_code(compile_edn("(program (fn f Int32 [] (block (if (let Int32 k 1) 2 3) k)))")), "E0201");
    auto ok = compile_edn("(program (fn f Void [] (while (let Int32 k 0) (block))))");
    EXPECT_TRUE(ok.result.success) << first_code(ok);
}
