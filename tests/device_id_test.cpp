// SPDX-License-Identifier: Apache-2.0
// Copyright 2025 Synaptics Incorporated

#include <gtest/gtest.h>

#include "device_id.hpp"

TEST(DeviceIDTest, ParsesHexPair)
{
    DeviceID id = ParseDeviceID("1d6b:0002");
    EXPECT_EQ(id.m_vendorId, 0x1d6b);
    EXPECT_EQ(id.m_productId, 0x0002);
}

TEST(DeviceIDTest, ParsingIsCaseInsensitive)
{
    EXPECT_EQ(ParseDeviceID("ABCD:EF01"), ParseDeviceID("abcd:ef01"));
    EXPECT_EQ(ParseDeviceID("aBcD:eF01"), (DeviceID{0xabcd, 0xef01}));
}

TEST(DeviceIDTest, ParsesBounds)
{
    EXPECT_EQ(ParseDeviceID("0:0"), (DeviceID{0, 0}));
    EXPECT_EQ(ParseDeviceID("ffff:FFFF"), (DeviceID{0xffff, 0xffff}));
    EXPECT_EQ(ParseDeviceID("0000ffff:1"), (DeviceID{0xffff, 0x1}));
}

TEST(DeviceIDTest, IgnoresExtraFields)
{
    EXPECT_EQ(ParseDeviceID("1234:5678:garbage"), (DeviceID{0x1234, 0x5678}));
}

TEST(DeviceIDTest, MissingSeparator)
{
    for (const char *text : {"", "1d6b", "1d6b-0002", "1d6b0002"}) {
        try {
            ParseDeviceID(text);
            FAIL() << "expected failure for '" << text << "'";
        } catch (const DeviceIDParseError& e) {
            EXPECT_EQ(e.GetKind(), DEVICE_ID_PARSE_ERROR_MISSING_SEPARATOR);
            EXPECT_STREQ(e.what(), "missing : separator");
        }
    }
}

TEST(DeviceIDTest, InvalidVendorId)
{
    for (const char *token : {"xyz", "10000", "", "-1", "+1d6b", "0x12"}) {
        try {
            ParseDeviceID(std::string(token) + ":0002");
            FAIL() << "expected failure for vendor '" << token << "'";
        } catch (const DeviceIDParseError& e) {
            EXPECT_EQ(e.GetKind(), DEVICE_ID_PARSE_ERROR_INVALID_VENDOR_ID);
            EXPECT_EQ(e.GetToken(), token);
            EXPECT_EQ(std::string(e.what()), std::string("invalid hex VID ") + token);
        }
    }
}

TEST(DeviceIDTest, InvalidProductId)
{
    for (const char *token : {"g", "12345", "", " 1"}) {
        try {
            ParseDeviceID(std::string("1d6b:") + token);
            FAIL() << "expected failure for product '" << token << "'";
        } catch (const DeviceIDParseError& e) {
            EXPECT_EQ(e.GetKind(), DEVICE_ID_PARSE_ERROR_INVALID_PRODUCT_ID);
            EXPECT_EQ(e.GetToken(), token);
        }
    }
}

TEST(DeviceIDTest, VendorIsCheckedBeforeProduct)
{
    try {
        ParseDeviceID("zz:zz");
        FAIL();
    } catch (const DeviceIDParseError& e) {
        EXPECT_EQ(e.GetKind(), DEVICE_ID_PARSE_ERROR_INVALID_VENDOR_ID);
        EXPECT_EQ(e.GetToken(), "zz");
    }
}

TEST(DeviceIDTest, FormatsLowercaseWithoutPadding)
{
    EXPECT_EQ((DeviceID{0x1d6b, 0x0002}).ToString(), "1d6b:2");
    EXPECT_EQ((DeviceID{0xABCD, 0x00EF}).ToString(), "abcd:ef");
}

TEST(DeviceIDTest, FormatsList)
{
    EXPECT_EQ(DeviceIDListToString({}), "[]");
    EXPECT_EQ(DeviceIDListToString({DeviceID{0x1, 0x2}}), "[1:2]");
    EXPECT_EQ(DeviceIDListToString({DeviceID{0x1, 0x2}, DeviceID{0xa, 0xb}}), "[1:2, a:b]");
}
