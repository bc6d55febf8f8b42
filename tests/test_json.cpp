//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json.cpp
// Purpose: GoogleTests for the JSON document parser/serializer and JSON-RPC envelope helpers
//==========================================================================================================

#include <gtest/gtest.h>

#include <string>

#include "hostmcp/JSONRPCTypes.h"

using namespace hostmcp;

TEST(JSONParse, ScalarsKeepTheirTypes) {
    EXPECT_TRUE(ParseJSON("null").isNull());
    EXPECT_TRUE(std::get<bool>(ParseJSON(" true ").value));
    EXPECT_EQ(std::get<int64_t>(ParseJSON("-42").value), -42);
    EXPECT_DOUBLE_EQ(std::get<double>(ParseJSON("2.5e1").value), 25.0);
    EXPECT_EQ(std::get<std::string>(ParseJSON("\"a\\tb\"").value), "a\tb");
}

TEST(JSONParse, ObjectMembersAndNestedArrays) {
    auto v = ParseJSON(R"({"a":[1,2,{"b":null}],"c":"x"})");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = v.find("a");
    ASSERT_NE(a, nullptr);
    ASSERT_TRUE(a->isArray());
    const auto& arr = std::get<JSONValue::Array>(a->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_EQ(std::get<int64_t>(arr[1]->value), 2);
    ASSERT_NE(arr[2]->find("b"), nullptr);
    EXPECT_TRUE(arr[2]->find("b")->isNull());
    EXPECT_EQ(v.find("missing"), nullptr);
}

TEST(JSONParse, SurrogatePairDecodesToUtf8) {
    auto v = ParseJSON(R"("\ud83d\ude00")");
    EXPECT_EQ(std::get<std::string>(v.value), "\xF0\x9F\x98\x80");
}

TEST(JSONParse, RejectsMalformedDocuments) {
    EXPECT_THROW(ParseJSON(""), JSONParseError);
    EXPECT_THROW(ParseJSON("{"), JSONParseError);
    EXPECT_THROW(ParseJSON("[1,]"), JSONParseError);
    EXPECT_THROW(ParseJSON("{\"a\" 1}"), JSONParseError);
    EXPECT_THROW(ParseJSON("\"unterminated"), JSONParseError);
    EXPECT_THROW(ParseJSON("01x"), JSONParseError);
    EXPECT_THROW(ParseJSON("{} {}"), JSONParseError);
    EXPECT_THROW(ParseJSON("\"\x01\""), JSONParseError);
}

TEST(JSONParse, NestingDepthIsCapped) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_THROW(ParseJSON(deep), JSONParseError);

    std::string shallow(20, '[');
    shallow += std::string(20, ']');
    EXPECT_NO_THROW(ParseJSON(shallow));
}

TEST(JSONSerialize, CompactOutputEscapesStrings) {
    JSONValue::Object obj;
    obj["s"] = MakeJSON(std::string("line\n\"q\""));
    EXPECT_EQ(SerializeJSON(JSONValue(obj)), R"({"s":"line\n\"q\""})");
    EXPECT_EQ(SerializeJSON(JSONValue(1.5)), "1.5");
    EXPECT_EQ(SerializeJSON(JSONValue(2.0)), "2.0");
    EXPECT_EQ(SerializeJSON(JSONValue(int64_t{7})), "7");
}

TEST(JSONSerialize, PrettyOutputSortsKeys) {
    auto v = ParseJSON(R"({"b":1,"a":[true]})");
    EXPECT_EQ(SerializeJSONPretty(v), "{\n  \"a\": [\n    true\n  ],\n  \"b\": 1\n}");
}

TEST(JSONSerialize, ParseOfSerializedDocumentIsEquivalent) {
    const std::string text = R"({"id":3,"list":[1,"two",null,false],"nested":{"x":-0.25}})";
    auto once = ParseJSON(text);
    auto twice = ParseJSON(SerializeJSON(once));
    EXPECT_EQ(SerializeJSONPretty(once), SerializeJSONPretty(twice));
}

TEST(JSONRPCEnvelope, ResponseCarriesExactlyOneOfResultOrError) {
    JSONRPCResponse ok(int64_t{5}, JSONValue(JSONValue::Object{}));
    auto okJson = ok.ToJSON();
    EXPECT_NE(okJson.find("result"), nullptr);
    EXPECT_EQ(okJson.find("error"), nullptr);
    EXPECT_EQ(std::get<int64_t>(okJson.find("id")->value), 5);
    EXPECT_EQ(std::get<std::string>(okJson.find("jsonrpc")->value), "2.0");

    auto err = CreateErrorResponse(std::string("abc"), JSONRPCErrorCodes::MethodNotFound, "Method not found: x");
    auto errJson = err->ToJSON();
    EXPECT_EQ(errJson.find("result"), nullptr);
    const JSONValue* e = errJson.find("error");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(std::get<int64_t>(e->find("code")->value), JSONRPCErrorCodes::MethodNotFound);
    EXPECT_EQ(std::get<std::string>(e->find("message")->value), "Method not found: x");
    EXPECT_EQ(e->find("data"), nullptr);
    EXPECT_EQ(std::get<std::string>(errJson.find("id")->value), "abc");
}

TEST(JSONRPCEnvelope, NullIdSerializesAsNull) {
    auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Invalid JSON");
    auto parsed = ParseJSON(err->Serialize());
    ASSERT_NE(parsed.find("id"), nullptr);
    EXPECT_TRUE(parsed.find("id")->isNull());
}

TEST(JSONRPCEnvelope, IdToStringHandlesEveryVariant) {
    EXPECT_EQ(IdToString(JSONRPCId{std::string("req-1")}), "req-1");
    EXPECT_EQ(IdToString(JSONRPCId{int64_t{12}}), "12");
    EXPECT_EQ(IdToString(JSONRPCId{nullptr}), "");
}
