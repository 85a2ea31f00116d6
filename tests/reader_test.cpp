#include <gtest/gtest.h>
#include "eqgen/edn.hpp"

using namespace eqgen;

TEST(Reader, RecordsLineAndColumn){
    auto n = parse("(class\n  :name Address)");
    ASSERT_TRUE(as_list(n));
    EXPECT_EQ(line(*n), 1);
    EXPECT_EQ(col(*n), 1);
    auto &elems = as_list(n)->elems;
    ASSERT_EQ(elems.size(), 3u);
    EXPECT_EQ(line(*elems[1]), 2);
    EXPECT_EQ(col(*elems[1]), 3);
    EXPECT_EQ(name_of(elems[2]), "Address");
    EXPECT_EQ(head_of(n), "class");
}

TEST(Reader, CommasAndCommentsAreWhitespace){
    auto n = parse("; leading comment\n[1, 2 ,3] ; trailing");
    auto* v = as_vector(n);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->elems.size(), 3u);
}

TEST(Reader, ScalarsAndStrings){
    EXPECT_EQ(std::get<int64_t>(parse("-5")->data), -5);
    EXPECT_DOUBLE_EQ(std::get<double>(parse("1.5")->data), 1.5);
    EXPECT_EQ(std::get<std::string>(parse("\"a\\nb\"")->data), "a\nb");
    EXPECT_TRUE(std::get<bool>(parse("true")->data));
    EXPECT_TRUE(is_nil(parse("nil")));
    ASSERT_TRUE(as_keyword(parse(":order-matters")));
    EXPECT_EQ(as_keyword(parse(":order-matters"))->name, "order-matters");
}

TEST(Reader, SetsAndPrinting){
    auto n = parse("[1 :k \"s\" #{x} {:a 1}]");
    EXPECT_EQ(to_string(n), "[1 :k \"s\" #{x} {:a 1}]");
    ASSERT_TRUE(elements(as_vector(n)->elems[3]));
    EXPECT_EQ(elements(as_vector(n)->elems[3])->size(), 1u);
}

TEST(Reader, ErrorsCarryPositions){
    try {
        (void)parse("(a b");
        FAIL() << "expected parse_error";
    } catch(const parse_error& e){
        EXPECT_EQ(e.line, 1);
        EXPECT_EQ(e.col, 1);
    }
    EXPECT_THROW((void)parse("a b"), parse_error);
    EXPECT_THROW((void)parse("\"open"), parse_error);
    EXPECT_THROW((void)parse("{:a}"), parse_error);
    EXPECT_THROW((void)parse(""), parse_error);
}
