#include "advertising/bytes.hpp"

#include <gtest/gtest.h>
#include <stdexcept>

using namespace blueadv::advertising;

TEST(BytesTest, ParsesHexWithSeparators)
{
    EXPECT_EQ(parse_hex_bytes("0102030405"), (Bytes{1, 2, 3, 4, 5}));
    EXPECT_EQ(parse_hex_bytes("de:ad-BE ef"), (Bytes{0xDE, 0xAD, 0xBE, 0xEF}));
    EXPECT_TRUE(parse_hex_bytes("").empty());
}

TEST(BytesTest, RejectsBadHex)
{
    EXPECT_THROW(parse_hex_bytes("abc"), std::invalid_argument);
    EXPECT_THROW(parse_hex_bytes("0g"), std::invalid_argument);
}

TEST(BytesTest, FormatsHex)
{
    EXPECT_EQ(to_hex(Bytes{0x01, 0xAB}), "01ab");
    EXPECT_EQ(to_hex(Bytes{0x01, 0xAB}, " "), "01 ab");
    EXPECT_EQ(to_hex(Bytes{}), "");
}

TEST(BytesTest, ParsesCompanyIds)
{
    EXPECT_EQ(parse_company_id("0x0123"), 0x0123);
    EXPECT_EQ(parse_company_id("0XFFFF"), 0xFFFF);
    EXPECT_EQ(parse_company_id("291"), 0x0123);
    // Leading zeros are decimal, not octal
    EXPECT_EQ(parse_company_id("0123"), 123);
}

TEST(BytesTest, RejectsBadCompanyIds)
{
    EXPECT_THROW(parse_company_id(""), std::invalid_argument);
    EXPECT_THROW(parse_company_id("0x10000"), std::invalid_argument);
    EXPECT_THROW(parse_company_id("65536"), std::invalid_argument);
    EXPECT_THROW(parse_company_id("12ab"), std::invalid_argument);
    EXPECT_THROW(parse_company_id("-1"), std::invalid_argument);
    EXPECT_THROW(parse_company_id("0x"), std::invalid_argument);
}
