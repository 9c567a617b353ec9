#include <gtest/gtest.h>
#include "ksc/edn.hpp"

using namespace ksc;

TEST(EdnReader, ParsesNestedCollections){
    auto n = parse("(program [a 1 2.5] \"s\" :k)");
    auto* l = list_elems(n);
    ASSERT_NE(l, nullptr);
    ASSERT_EQ(l->size(), 4u);
    EXPECT_EQ(*symbol_name((*l)[0]), "program");
    auto* v = vector_elems((*l)[1]);
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->size(), 3u);
    EXPECT_EQ(std::get<int64_t>((*v)[1]->data), 1);
    EXPECT_DOUBLE_EQ(std::get<double>((*v)[2]->data), 2.5);
    EXPECT_EQ(std::get<std::string>((*l)[2]->data), "s");
    EXPECT_EQ(std::get<keyword>((*l)[3]->data).name, "k");
}

TEST(EdnReader, OperatorSymbolsAndSignedNumbers){
    auto n = parse("(+ - // <= -3 +4)");
    auto& l = *list_elems(n);
    EXPECT_EQ(*symbol_name(l[0]), "+");
    EXPECT_EQ(*symbol_name(l[1]), "-");
    EXPECT_EQ(*symbol_name(l[2]), "//");
    EXPECT_EQ(*symbol_name(l[3]), "<=");
    EXPECT_EQ(std::get<int64_t>(l[4]->data), -3);
    EXPECT_EQ(std::get<int64_t>(l[5]->data), 4);
}

TEST(EdnReader, TracksLineAndColumn){
    auto n = parse("(a\n  (b c))");
    auto& l = *list_elems(n);
    EXPECT_EQ(n->line, 1);
    EXPECT_EQ(n->col, 1);
    EXPECT_EQ(l[1]->line, 2);
    EXPECT_EQ(l[1]->col, 3);
}

TEST(EdnReader, CommentsAndCommasAreWhitespace){
    auto n = parse("; header\n[1, 2 ,3] ; trailing");
    EXPECT_EQ(vector_elems(n)->size(), 3u);
}

TEST(EdnReader, ListTypeVectorClosesCleanly){
    auto n = parse("[Int32]");
    auto* v = vector_elems(n);
    ASSERT_NE(v, nullptr);
    ASSERT_EQ(v->size(), 1u);
    EXPECT_EQ(*symbol_name((*v)[0]), "Int32");
}

TEST(EdnReader, Literals){
    auto root = parse("(nil true false \"a\\nb\")");
    auto& l = *list_elems(root);
    EXPECT_TRUE(std::holds_alternative<std::monostate>(l[0]->data));
    EXPECT_TRUE(std::get<bool>(l[1]->data));
    EXPECT_FALSE(std::get<bool>(l[2]->data));
    EXPECT_EQ(std::get<std::string>(l[3]->data), "a\nb");
}

TEST(EdnReader, Errors){
    EXPECT_THROW(parse("(a b"), parse_error);
    EXPECT_THROW(parse("\"open"), parse_error);
    EXPECT_THROW(parse("(a) (b)"), parse_error);
    EXPECT_THROW(parse(""), parse_error);
    EXPECT_THROW(parse("(a @)"), parse_error);
}

TEST(EdnReader, ToStringRoundTripsShape){
    EXPECT_EQ(to_string(parse("(fn f [(Int32 x)] :k)")), "(fn f [(Int32 x)] :k)");
}
