//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: GoogleTests for the JSON parser, serializer and field accessors
//==========================================================================================================

#include <gtest/gtest.h>
#include "deskauth/JSONValue.h"
#include <stdexcept>

using namespace deskauth;

TEST(Json, ParsesTokenResponse) {
    JSONValue v = parseJSON(R"({"access_token":"AT","expires_in":3599,"id_token":"IT","scope":"openid email"})");
    ASSERT_TRUE(v.isObject());
    EXPECT_EQ(getStringField(v, "access_token").value_or(""), "AT");
    EXPECT_EQ(getIntField(v, "expires_in").value_or(0), 3599);
    EXPECT_FALSE(getStringField(v, "refresh_token").has_value());
    EXPECT_FALSE(getStringField(v, "expires_in").has_value());
}

TEST(Json, NumericStringAndDoubleAcceptedAsInt) {
    JSONValue v = parseJSON(R"({"a":"3600","b":12.0,"c":"12x"})");
    EXPECT_EQ(getIntField(v, "a").value_or(0), 3600);
    EXPECT_EQ(getIntField(v, "b").value_or(0), 12);
    EXPECT_FALSE(getIntField(v, "c").has_value());
}

TEST(Json, NestedObjects) {
    JSONValue v = parseJSON(R"({"user":{"uid":"u1","email":"a@b.c"},"list":[1,2,{"x":null}]})");
    const JSONValue* user = getObjectField(v, "user");
    ASSERT_NE(user, nullptr);
    EXPECT_EQ(getStringField(*user, "uid").value_or(""), "u1");
    EXPECT_EQ(getObjectField(v, "list"), nullptr);
}

TEST(Json, UnicodeEscapes) {
    JSONValue v = parseJSON(R"({"n":"caf\u00e9 \ud83d\ude00","lone":"\ud83d"})");
    EXPECT_EQ(getStringField(v, "n").value_or(""), "caf\xC3\xA9 \xF0\x9F\x98\x80");
    EXPECT_EQ(getStringField(v, "lone").value_or(""), "\xEF\xBF\xBD");
}

TEST(Json, RejectsMalformedInput) {
    EXPECT_THROW(parseJSON(""), std::runtime_error);
    EXPECT_THROW(parseJSON("{"), std::runtime_error);
    EXPECT_THROW(parseJSON(R"({"a":1} trailing)"), std::runtime_error);
    EXPECT_THROW(parseJSON("<html>502 Bad Gateway</html>"), std::runtime_error);
}

TEST(Json, RejectsExcessiveNesting) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_THROW(parseJSON(deep), std::runtime_error);
}

TEST(Json, SerializeEscapesStrings) {
    JSONValue::Object o;
    o["code"] = std::make_shared<JSONValue>(std::string("a\"b\\c\n"));
    std::string s = serializeJSONValue(JSONValue(std::move(o)));
    EXPECT_EQ(s, R"({"code":"a\"b\\c\n"})");
    JSONValue back = parseJSON(s);
    EXPECT_EQ(getStringField(back, "code").value_or(""), "a\"b\\c\n");
}
