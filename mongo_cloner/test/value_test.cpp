#include "mongo_cloner/value.hpp"

#include <cmath>
#include <limits>
#include <stdexcept>

#include <gtest/gtest.h>

namespace
{
using namespace mongo_cloner;

TEST(Value, DefaultIsNull)
{
    value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type(), value_type::null_type);
}

TEST(Value, IntegerWidthsAreDistinct)
{
    EXPECT_EQ(value(std::int32_t(7)).type(), value_type::int32_type);
    EXPECT_EQ(value(std::int64_t(7)).type(), value_type::int64_type);
    EXPECT_NE(value(std::int32_t(7)), value(std::int64_t(7)));
}

TEST(Value, WrongAccessorThrows)
{
    value v("text");
    EXPECT_EQ(v.as_string(), "text");
    EXPECT_THROW(v.as_int32(), std::logic_error);
}

TEST(Value, NanEqualsNanButSignedZerosDiffer)
{
    double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_EQ(value(nan), value(nan));
    EXPECT_NE(value(0.0), value(-0.0));
}

TEST(Value, NestedEqualityIsDeep)
{
    document a{{"tags", array{value("x"), value(1)}}, {"meta", document{{"n", 1}}}};
    document b{{"tags", array{value("x"), value(1)}}, {"meta", document{{"n", 1}}}};
    document c{{"tags", array{value("x"), value(2)}}, {"meta", document{{"n", 1}}}};

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

TEST(Document, FieldOrderMatters)
{
    document a{{"x", 1}, {"y", 2}};
    document b{{"y", 2}, {"x", 1}};
    EXPECT_NE(a, b);
}

TEST(Document, IdLookup)
{
    document doc{{"name", "A"}, {"_id", 1}};

    ASSERT_TRUE(doc.has_id());
    EXPECT_EQ(doc.id(), value(1));
    EXPECT_EQ(doc.find("name")->as_string(), "A");
    EXPECT_EQ(doc.find("missing"), nullptr);
}

TEST(Document, MissingIdThrows)
{
    document doc{{"name", "A"}};

    EXPECT_FALSE(doc.has_id());
    EXPECT_THROW(doc.id(), std::out_of_range);
}
TEST(Value, DeprecatedKindsCompareByContent)
{
    object_id oid{};
    oid[11] = 1;

    EXPECT_EQ(value(undefined_value()), value(undefined_value()));
    EXPECT_NE(value(undefined_value()), value(nullptr));
    EXPECT_EQ(value(symbol_value{"s"}), value(symbol_value{"s"}));
    EXPECT_NE(value(symbol_value{"s"}), value("s"));
    EXPECT_NE(value(db_pointer_value{"a.b", oid}), value(db_pointer_value{"a.b", object_id{}}));
    EXPECT_EQ(value(code_with_scope_value{"f", document{{"x", 1}}}), value(code_with_scope_value{"f", document{{"x", 1}}}));
    EXPECT_NE(value(code_with_scope_value{"f", document{{"x", 1}}}), value(code_with_scope_value{"f", document{{"x", 2}}}));
    EXPECT_THROW(value(code_value{"f"}).as_code_with_scope(), std::logic_error);
}
}
