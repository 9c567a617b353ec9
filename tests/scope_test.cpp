#include <gtest/gtest.h>
#include <stdexcept>
#include "ksc/ir/scope.hpp"
#include "ksc/diagnostics.hpp"
#include "test_util.hpp"

using namespace ksc;
using ksc_test::code_of;

TEST(ScopeStack, BuiltinsResolveInOutermostScope){
    TypeContext tctx;
    ScopeStack s(tctx);
    EXPECT_EQ(s.depth(), 1u);
    EXPECT_EQ(s.resolve_type("Number"), tctx.number());
    EXPECT_EQ(s.resolve_type("Int32"), tctx.int32());
    EXPECT_EQ(s.resolve_type("Bool"), tctx.boolean());
    EXPECT_EQ(s.resolve_type("Void"), tctx.void_type());
    EXPECT_EQ(code_of([&]{ s.resolve_type("Float"); }), "E0101");
}

TEST(ScopeStack, ListTypeNames){
    TypeContext tctx;
    ScopeStack s(tctx);
    TypeId l = s.resolve_type("[Int32]");
    EXPECT_EQ(tctx.kind(l), Type::Kind::List);
    EXPECT_EQ(tctx.name(l), "[Int32]");
    EXPECT_EQ(tctx.at(l).elem, tctx.int32());
    EXPECT_EQ(s.resolve_type("[Int32]"), l);
    EXPECT_EQ(tctx.name(s.resolve_type("[[Number]]")), "[[Number]]");
    EXPECT_EQ(code_of([&]{ s.resolve_type("[Nope]"); }), "E0101");
}

TEST(ScopeStack, ListOfVoidIsRejected){
    TypeContext tctx;
    ScopeStack s(tctx);
    EXPECT_EQ(code_of([&]{ s.resolve_type("[Void]"); }), "E0401");
    EXPECT_EQ(code_of([&]{ s.resolve_type("[[Void]]"); }), "E0401");

    ksc::EmitEnv env; env.verifyIR = true;
    auto ext = ksc_test::compile_edn("(program (extern f Void [[Void]]))", env);
    EXPECT_EQ(ksc_test::first_code(ext), "E0401");
    auto param = ksc_test::compile_edn("(program (fn f Void [([Void] x)] (let _ y x)))", env);
    EXPECT_EQ(ksc_test::first_code(param), "E0401");
}

TEST(ScopeStack, DuplicateTypeOnlyWithinOneScope){
    TypeContext tctx;
    ScopeStack s(tctx);
    TypeId point = tctx.get_struct("Point", {tctx.number(), tctx.number()});
    s.define_type("Point", point);
    EXPECT_EQ(code_of([&]{ s.define_type("Point", point); }), "E0102");
    EXPECT_EQ(code_of([&]{ s.define_type("Number", point); }), "E0102");
    s.push_scope();
    s.define_type("Number", point); // shadowing an outer binding is legal
    EXPECT_EQ(s.resolve_type("Number"), point);
    s.pop_scope();
    EXPECT_EQ(s.resolve_type("Number"), tctx.number());
}

TEST(ScopeStack, PopDropsTypesAndValues){
    TypeContext tctx;
    ScopeStack s(tctx);
    s.push_scope();
    s.define_type("Local", tctx.get_struct("Local", {}));
    s.bind("x", TypedValue{tctx.int32(), nullptr});
    EXPECT_NE(s.find("x"), nullptr);
    s.pop_scope();
    EXPECT_EQ(s.find("x"), nullptr);
    EXPECT_EQ(code_of([&]{ s.lookup("x"); }), "E0201");
    EXPECT_EQ(code_of([&]{ s.resolve_type("Local"); }), "E0101");
}

TEST(ScopeStack, InnermostBindingWinsAndRebindShadows){
    TypeContext tctx;
    ScopeStack s(tctx);
    s.push_scope();
    s.bind("v", TypedValue{tctx.number(), nullptr});
    s.push_scope();
    s.bind("v", TypedValue{tctx.int32(), nullptr});
    EXPECT_EQ(s.lookup("v").type, tctx.int32());
    s.bind("v", TypedValue{tctx.boolean(), nullptr});
    EXPECT_EQ(s.lookup("v").type, tctx.boolean());
    s.pop_scope();
    EXPECT_EQ(s.lookup("v").type, tctx.number());
}

TEST(ScopeStack, OutermostScopeCannotBePopped){
    TypeContext tctx;
    ScopeStack s(tctx);
    EXPECT_THROW(s.pop_scope(), std::logic_error);
    EXPECT_EQ(s.resolve_type("Void"), tctx.void_type());
}

TEST(TypeContext, InterningIsStable){
    TypeContext tctx;
    TypeId f1 = tctx.get_function({tctx.number(), tctx.int32()}, tctx.boolean());
    TypeId f2 = tctx.get_function({tctx.number(), tctx.int32()}, tctx.boolean());
    EXPECT_EQ(f1, f2);
    EXPECT_EQ(tctx.name(f1), "fn(Number, Int32) -> Bool");
    EXPECT_NE(tctx.get_function({tctx.number()}, tctx.boolean()), f1);
    EXPECT_EQ(tctx.get_struct("P", {tctx.number()}), tctx.get_struct("P", {tctx.int32()}));
    EXPECT_TRUE(tctx.is_scalar(tctx.boolean()));
    EXPECT_FALSE(tctx.is_numeric(tctx.boolean()));
}
