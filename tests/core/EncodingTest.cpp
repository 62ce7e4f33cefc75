#include "reqkit/util/Encoding.hpp"
#include "reqkit/Auth.hpp"
#include "reqkit/Method.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace reqkit;
using namespace reqkit::util;

TEST(EncodingTest, PercentEncodeLeavesUnreserved) {
    EXPECT_EQ(percentEncode("AZaz09-._~"), "AZaz09-._~");
}

TEST(EncodingTest, PercentEncodeEscapesReserved) {
    EXPECT_EQ(percentEncode("a b&c=d/e?"), "a%20b%26c%3Dd%2Fe%3F");
    EXPECT_EQ(percentEncode("\xC3\xA9"), "%C3%A9");
    EXPECT_EQ(percentEncode(""), "");
}

TEST(EncodingTest, Base64Padding) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foo"), "Zm9v");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");
}

TEST(EncodingTest, Utf8Validation) {
    EXPECT_TRUE(isValidUtf8(""));
    EXPECT_TRUE(isValidUtf8("plain ascii"));
    EXPECT_TRUE(isValidUtf8("caf\xC3\xA9"));
    EXPECT_TRUE(isValidUtf8("\xF0\x9F\x98\x80"));     // U+1F600
    EXPECT_FALSE(isValidUtf8("\xFF\xFE"));
    EXPECT_FALSE(isValidUtf8("\xC3"));                 // truncated
    EXPECT_FALSE(isValidUtf8("\xC0\xAF"));             // overlong '/'
    EXPECT_FALSE(isValidUtf8("\xED\xA0\x80"));         // surrogate
    EXPECT_FALSE(isValidUtf8("\xF4\x90\x80\x80"));     // > U+10FFFF
}

TEST(EncodingTest, CaseInsensitiveHelpers) {
    EXPECT_TRUE(iequals("Content-Type", "content-type"));
    EXPECT_FALSE(iequals("Accept", "Accept-Encoding"));
    EXPECT_EQ(toLower("HeLLo"), "hello");
}

TEST(AuthTest, BasicAndBearer) {
    EXPECT_EQ(Auth::basic("user", "pass").value(), "Basic dXNlcjpwYXNz");
    EXPECT_EQ(Auth::bearer("tok").value(), "Bearer tok");
    EXPECT_EQ((Auth{"Token", "abc"}).value(), "Token abc");
}

TEST(MethodTest, RoundTripsVerbs) {
    EXPECT_STREQ(toString(Method::Get), "GET");
    EXPECT_STREQ(toString(Method::Patch), "PATCH");
    EXPECT_EQ(parseMethod("post"), Method::Post);
    EXPECT_EQ(parseMethod("DeLeTe"), Method::Delete);
    EXPECT_FALSE(parseMethod("FETCH").has_value());
}
