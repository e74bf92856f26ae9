// Attribute tests
//
// Structural equality, hashing, printing and typed access

#include "ir/attribute.hpp"

#include <gtest/gtest.h>
#include <unordered_set>

using namespace irkit;
using namespace irkit::ir;

TEST(AttributeTest, DefaultIsUnit) {
    Attribute attr;
    EXPECT_TRUE(attr.is<UnitAttr>());
    EXPECT_EQ(attr.to_string(), "unit");
    EXPECT_STREQ(attr.kind_name(), "unit");
}

TEST(AttributeTest, StructuralEquality) {
    EXPECT_EQ(int_attr(5), int_attr(5));
    EXPECT_FALSE(int_attr(5) == int_attr(6));
    // Same value, different width
    EXPECT_FALSE(int_attr(5, 32) == int_attr(5, 64));
    EXPECT_EQ(i32(), Attribute(IntegerType{32}));
    EXPECT_FALSE(i32() == i64());
    EXPECT_EQ(string_attr("x"), string_attr("x"));
}

TEST(AttributeTest, ArrayEquality) {
    Attribute a = ArrayAttr{{i32(), int_attr(1)}};
    Attribute b = ArrayAttr{{i32(), int_attr(1)}};
    Attribute c = ArrayAttr{{i32()}};

    EXPECT_EQ(a, b);
    EXPECT_FALSE(a == c);
}

TEST(AttributeTest, HashFollowsEquality) {
    EXPECT_EQ(int_attr(7).hash(), int_attr(7).hash());
    EXPECT_EQ(Attribute(ArrayAttr{{i1(), f64()}}).hash(), Attribute(ArrayAttr{{i1(), f64()}}).hash());

    std::unordered_set<Attribute> set;
    set.insert(int_attr(1));
    set.insert(int_attr(1));
    set.insert(int_attr(2));
    set.insert(i64());
    EXPECT_EQ(set.size(), 3u);
}

TEST(AttributeTest, Printing) {
    EXPECT_EQ(i32().to_string(), "i32");
    EXPECT_EQ(f64().to_string(), "f64");
    EXPECT_EQ(index_type().to_string(), "index");
    EXPECT_EQ(int_attr(-3, 16).to_string(), "-3 : i16");
    EXPECT_EQ(string_attr("hi").to_string(), "\"hi\"");
    EXPECT_EQ(Attribute(BoolAttr{true}).to_string(), "true");
    EXPECT_EQ(Attribute(ArrayAttr{{i1(), int_attr(2)}}).to_string(), "[i1, 2 : i64]");
}

TEST(AttributeTest, DictPrintsInNameOrder) {
    AttrDict attrs;
    attrs["value"] = int_attr(4);
    attrs["name"] = string_attr("c");
    EXPECT_EQ(to_string(attrs), "{name = \"c\", value = 4 : i64}");
    EXPECT_EQ(to_string(AttrDict{}), "{}");
}

TEST(AttributeTest, TypedAccess) {
    Attribute attr = int_attr(9);

    ASSERT_NE(attr.get_if<IntegerAttr>(), nullptr);
    EXPECT_EQ(attr.get_if<IntegerAttr>()->value, 9);
    EXPECT_EQ(attr.get_if<StringAttr>(), nullptr);

    auto ok = attr.as<IntegerAttr>();
    ASSERT_TRUE(is_ok(ok));
    EXPECT_EQ(unwrap(ok).type.width, 64u);

    auto bad = attr.as<StringAttr>();
    ASSERT_TRUE(is_err(bad));
    EXPECT_EQ(unwrap_err(bad).kind, IrErrorKind::AttributeKindMismatch);
    EXPECT_EQ(unwrap_err(bad).subject, "9 : i64");
}

TEST(AttributeTest, CopiesShareStorage) {
    Attribute a = string_attr("shared");
    Attribute b = a;
    EXPECT_EQ(a, b);
    EXPECT_EQ(&a.kind(), &b.kind());
}
