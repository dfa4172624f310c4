#include "mongo_cloner/errors.hpp"
#include "mongo_cloner/extended_json.hpp"

#include <cmath>
#include <limits>

#include <gtest/gtest.h>

namespace
{
using namespace mongo_cloner;
namespace ej = mongo_cloner::extended_json;

object_id sample_oid()
{
    object_id oid;
    ej::oid_from_hex("5f1b2c3d4e5f60718293a4b5", oid);
    return oid;
}

// One document carrying every kind the value model knows.
document every_kind()
{
    return document{
          {"_id", sample_oid()}
        , {"null", nullptr}
        , {"flag", true}
        , {"small", std::int32_t(-42)}
        , {"big", std::int64_t(9007199254740993LL)}
        , {"ratio", 0.1}
        , {"whole", 3.0}
        , {"neg_zero", -0.0}
        , {"nan", std::numeric_limits<double>::quiet_NaN()}
        , {"inf", -std::numeric_limits<double>::infinity()}
        , {"price", decimal128_value{"1234.5678901234567890"}}
        , {"name", "Zoë \"quoted\"\n\ttab"}
        , {"list", array{value(1), value("two"), value(array{value(3.5)})}}
        , {"nested", document{{"a", document{{"b", std::int64_t(1)}}}}}
        , {"created", date_time{-86400000LL}}
        , {"optime", timestamp_value{1700000000u, 7u}}
        , {"blob", binary_value{0x80, {0x00, 0xff, 0x10, 0x20}}}
        , {"empty_blob", binary_value{0x00, {}}}
        , {"pattern", regex_value{"^a.*z$", "im"}}
        , {"script", code_value{"function() { return 1; }"}}
        , {"low", min_key()}
        , {"high", max_key()}
        , {"empty_doc", document()}
        , {"empty_list", array()}
        , {"legacy", undefined_value()}
        , {"sym", symbol_value{"name"}}
        , {"ptr", db_pointer_value{"app.users", sample_oid()}}
        , {"scoped", code_with_scope_value{"return x;", document{{"x", 1}}}}
    };
}

TEST(ExtendedJson, RoundTripsEveryKind)
{
    document doc = every_kind();
    EXPECT_EQ(ej::decode(ej::encode(doc)), doc);
}

TEST(ExtendedJson, EncodesOnOneLine)
{
    std::string line = ej::encode(every_kind());
    EXPECT_EQ(line.find('\n'), std::string::npos);
    EXPECT_EQ(line.find('\r'), std::string::npos);
}

TEST(ExtendedJson, WritesCanonicalTags)
{
    document doc{
          {"_id", sample_oid()}
        , {"n", 1}
        , {"l", std::int64_t(2)}
        , {"d", 2.0}
        , {"t", date_time{1577836800000LL}}
        , {"b", binary_value{0, {1, 2, 3}}}
        , {"ts", timestamp_value{5u, 6u}}
        , {"dec", decimal128_value{"10.25"}}
    };

    std::string line = ej::encode(doc);

    EXPECT_NE(line.find("{ \"$oid\" : \"5f1b2c3d4e5f60718293a4b5\" }"), std::string::npos);
    EXPECT_NE(line.find("{ \"$numberInt\" : \"1\" }"), std::string::npos);
    EXPECT_NE(line.find("{ \"$numberLong\" : \"2\" }"), std::string::npos);
    EXPECT_NE(line.find("{ \"$numberDouble\" : \"2.0\" }"), std::string::npos);
    EXPECT_NE(line.find("{ \"$date\" : { \"$numberLong\" : \"1577836800000\" } }"), std::string::npos);
    EXPECT_NE(line.find("\"base64\" : \"AQID\""), std::string::npos);
    EXPECT_NE(line.find("{ \"$timestamp\" : { \"t\" : 5, \"i\" : 6 } }"), std::string::npos);
    EXPECT_NE(line.find("{ \"$numberDecimal\" : \"10.25\" }"), std::string::npos);
}

TEST(ExtendedJson, PlainNumbersPickTheNarrowestInteger)
{
    document doc = ej::decode("{\"a\":1,\"b\":4294967296,\"c\":1.5}");

    EXPECT_EQ(doc.find("a")->type(), value_type::int32_type);
    EXPECT_EQ(doc.find("b")->as_int64(), 4294967296LL);
    EXPECT_EQ(doc.find("c")->as_double(), 1.5);
}

TEST(ExtendedJson, DoublesKeepFullPrecision)
{
    document doc{{"x", 0.30000000000000004}, {"y", 1.7976931348623157e308}, {"z", 5e-324}};
    EXPECT_EQ(ej::decode(ej::encode(doc)), doc);
}

TEST(ExtendedJson, AcceptsRelaxedAndLegacyForms)
{
    document doc = ej::decode(
        "{\"a\":{\"$date\":\"2020-01-01T00:00:00Z\"},"
        "\"b\":{\"$date\":\"2020-01-01T00:00:00.250Z\"},"
        "\"c\":{\"$date\":{\"$numberLong\":\"-1\"}},"
        "\"bin\":{\"$binary\":\"AQID\",\"$type\":\"05\"},"
        "\"re\":{\"$regex\":\"^x\",\"$options\":\"i\"},"
        "\"l\":{\"$numberLong\":\"7\"}}");

    EXPECT_EQ(doc.find("a")->as_date()._millis, 1577836800000LL);
    EXPECT_EQ(doc.find("b")->as_date()._millis, 1577836800250LL);
    EXPECT_EQ(doc.find("c")->as_date()._millis, -1LL);

    binary_value bin = doc.find("bin")->as_binary();
    EXPECT_EQ(bin._subtype, 5);
    EXPECT_EQ(bin._bytes, (std::vector<std::uint8_t>{1, 2, 3}));

    EXPECT_EQ(doc.find("re")->as_regex()._pattern, "^x");
    EXPECT_EQ(doc.find("re")->as_regex()._options, "i");
    EXPECT_EQ(doc.find("l")->as_int64(), 7);
}

TEST(ExtendedJson, ObjectIdHex)
{
    object_id oid;

    EXPECT_TRUE(ej::oid_from_hex("5f1b2c3d4e5f60718293a4b5", oid));
    EXPECT_EQ(ej::oid_to_hex(oid), "5f1b2c3d4e5f60718293a4b5");
    EXPECT_FALSE(ej::oid_from_hex("5f1b2c3d", oid));
    EXPECT_FALSE(ej::oid_from_hex("zz1b2c3d4e5f60718293a4b5", oid));
}

TEST(ExtendedJson, RejectsMalformedLines)
{
    EXPECT_THROW(ej::decode("{\"a\":"), decode_error);
    EXPECT_THROW(ej::decode("not json"), decode_error);
    EXPECT_THROW(ej::decode("[1,2]"), decode_error);
    EXPECT_THROW(ej::decode(""), decode_error);
}

TEST(ExtendedJson, RejectsMalformedEnvelopes)
{
    EXPECT_THROW(ej::decode("{\"a\":{\"$oid\":\"xyz\"}}"), decode_error);
    EXPECT_THROW(ej::decode("{\"a\":{\"$numberLong\":\"12x\"}}"), decode_error);
    EXPECT_THROW(ej::decode("{\"a\":{\"$date\":\"yesterday\"}}"), decode_error);
}

TEST(ExtendedJson, RejectsInvalidDecimal)
{
    EXPECT_THROW(ej::decode("{\"_id\":1,\"d\":{\"$numberDecimal\":\"garbage\"}}"), decode_error);
    EXPECT_THROW(ej::decode("{\"_id\":1,\"d\":{ \"$numberDecimal\" : \"1.2.3\" }}"), decode_error);

    document doc = ej::decode("{\"_id\":1,\"d\":{\"$numberDecimal\":\"NaN\"},\"e\":{\"$numberDecimal\":\"-1.5E+3\"}}");
    EXPECT_EQ(doc.find("d")->type(), value_type::decimal128_type);
    EXPECT_EQ(doc.find("e")->type(), value_type::decimal128_type);
}

TEST(ExtendedJson, DecimalTagInsideAStringIsData)
{
    document doc = ej::decode("{\"_id\":1,\"note\":\"\\\"$numberDecimal\\\": \\\"x\\\"\"}");
    EXPECT_EQ(doc.find("note")->as_string(), "\"$numberDecimal\": \"x\"");
}
}
