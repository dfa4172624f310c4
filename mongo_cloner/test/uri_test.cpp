#include "mongo_cloner/uri.hpp"

#include <gtest/gtest.h>

namespace
{
using mongo_cloner::normalize_uri;

TEST(NormalizeUri, StripsDotBeforePort)
{
    EXPECT_EQ(normalize_uri("mongodb://10.0.0.15.:27017"), "mongodb://10.0.0.15:27017");
    EXPECT_EQ(normalize_uri("mongodb://a.example.:27017,b.example.:27018/db"), "mongodb://a.example:27017,b.example:27018/db");
}

TEST(NormalizeUri, LeavesValidStringsAlone)
{
    EXPECT_EQ(normalize_uri("mongodb://10.0.0.15:27017/?replicaSet=rs0"), "mongodb://10.0.0.15:27017/?replicaSet=rs0");
    EXPECT_EQ(normalize_uri("mongodb+srv://cluster0.example.net/db"), "mongodb+srv://cluster0.example.net/db");
}

TEST(NormalizeUri, OnlyTouchesPortSeparators)
{
    // A '.' before a ':' that does not start a port (password) stays.
    EXPECT_EQ(normalize_uri("mongodb://user.:p@host:27017"), "mongodb://user.:p@host:27017");
    EXPECT_EQ(normalize_uri(""), "");
    EXPECT_EQ(normalize_uri(".:"), ".:");
}
}
