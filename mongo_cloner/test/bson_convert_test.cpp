#include "mongo_cloner/bson_convert.hpp"
#include "mongo_cloner/errors.hpp"
#include "mongo_cloner/extended_json.hpp"
#include <bson/bson.h>

#include <limits>

#include <gtest/gtest.h>

namespace
{
using namespace mongo_cloner;

struct bson_holder
{
    bson_t _bson;

    bson_holder() { bson_init(&_bson); }
    ~bson_holder() { bson_destroy(&_bson); }
};

TEST(BsonConvert, RoundTripsEveryKind)
{
    object_id oid;
    ASSERT_TRUE(extended_json::oid_from_hex("65a1b2c3d4e5f60718293a4b", oid));

    document doc{
          {"_id", oid}
        , {"null", nullptr}
        , {"flag", false}
        , {"i32", std::int32_t(2147483647)}
        , {"i64", std::int64_t(-9223372036854775807LL)}
        , {"dbl", 2.5}
        , {"nan", std::numeric_limits<double>::quiet_NaN()}
        , {"dec", decimal128_value{"1.5E+3"}}
        , {"str", std::string("a\0b", 3)}
        , {"arr", array{value(1), value(document{{"k", "v"}}), value(array())}}
        , {"doc", document{{"inner", date_time{1600000000123LL}}}}
        , {"ts", timestamp_value{42u, 1u}}
        , {"bin", binary_value{4, {1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12, 13, 14, 15, 16}}}
        , {"re", regex_value{"ab+c", "i"}}
        , {"code", code_value{"x = 1"}}
        , {"min", min_key()}
        , {"max", max_key()}
    };

    bson_holder b;
    to_bson(doc, &b._bson);

    EXPECT_EQ(from_bson(&b._bson), doc);
}

TEST(BsonConvert, ArraysUseIndexKeys)
{
    bson_holder b;
    to_bson(document{{"a", array{value(1), value(2)}}}, &b._bson);

    char* json = bson_as_relaxed_extended_json(&b._bson, NULL);
    ASSERT_NE(json, nullptr);
    std::string text(json);
    bson_free(json);

    EXPECT_EQ(text, "{ \"a\" : [ 1, 2 ] }");
}

TEST(BsonConvert, InvalidDecimalIsRejected)
{
    bson_holder b;
    EXPECT_THROW(to_bson(document{{"d", decimal128_value{"not a number"}}}, &b._bson), decode_error);
}

TEST(BsonConvert, CarriesDeprecatedKinds)
{
    bson_oid_t raw;
    bson_oid_init_from_string(&raw, "0123456789abcdef01234567");

    bson_holder scope;
    ASSERT_TRUE(bson_append_int32(&scope._bson, "x", -1, 5));

    bson_holder b;
    ASSERT_TRUE(bson_append_undefined(&b._bson, "legacy", -1));
    ASSERT_TRUE(bson_append_symbol(&b._bson, "sym", -1, "name", -1));
    ASSERT_TRUE(bson_append_dbpointer(&b._bson, "ptr", -1, "app.users", &raw));
    ASSERT_TRUE(bson_append_code_with_scope(&b._bson, "fn", -1, "return x;", &scope._bson));

    document doc = from_bson(&b._bson);

    EXPECT_EQ(doc.find("legacy")->type(), value_type::undefined_type);
    EXPECT_EQ(doc.find("sym")->as_symbol()._symbol, "name");
    EXPECT_EQ(doc.find("ptr")->as_db_pointer()._collection, "app.users");
    EXPECT_EQ(extended_json::oid_to_hex(doc.find("ptr")->as_db_pointer()._oid), "0123456789abcdef01234567");
    EXPECT_EQ(doc.find("fn")->as_code_with_scope()._code, "return x;");
    EXPECT_EQ(doc.find("fn")->as_code_with_scope()._scope, (document{{"x", 5}}));

    bson_holder copy;
    to_bson(doc, &copy._bson);

    EXPECT_TRUE(bson_equal(&b._bson, &copy._bson));
}
}
