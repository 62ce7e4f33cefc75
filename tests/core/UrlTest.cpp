#include "reqkit/util/Url.hpp"
#include <gtest/gtest.h>

using namespace reqkit::util;

TEST(UrlTest, HttpsDefaults) {
    auto u = parseUrl("https://api.example.com/todos");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "https");
    EXPECT_EQ(u->host, "api.example.com");
    EXPECT_EQ(u->port, 443);
    EXPECT_FALSE(u->explicitPort);
    EXPECT_EQ(u->target, "/todos");
    EXPECT_TRUE(u->secure());
    EXPECT_EQ(u->hostHeader(), "api.example.com");
}

TEST(UrlTest, ExplicitPortQueryAndFragment) {
    auto u = parseUrl("HTTP://localhost:8080/a/b?x=1#frag");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->scheme, "http");
    EXPECT_EQ(u->port, 8080);
    EXPECT_TRUE(u->explicitPort);
    EXPECT_EQ(u->target, "/a/b?x=1");
    EXPECT_EQ(u->fragment, "frag");
    EXPECT_EQ(u->hostHeader(), "localhost:8080");
}

TEST(UrlTest, EmptyPathBecomesSlash) {
    auto u = parseUrl("http://example.com");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->target, "/");

    auto q = parseUrl("http://example.com?x=1");
    ASSERT_TRUE(q.has_value());
    EXPECT_EQ(q->target, "/?x=1");
}

TEST(UrlTest, Ipv6Literal) {
    auto u = parseUrl("http://[::1]:9000/");
    ASSERT_TRUE(u.has_value());
    EXPECT_EQ(u->host, "::1");
    EXPECT_EQ(u->port, 9000);
    EXPECT_EQ(u->hostHeader(), "[::1]:9000");
}

TEST(UrlTest, Rejects) {
    EXPECT_FALSE(parseUrl("").has_value());
    EXPECT_FALSE(parseUrl("/relative/path").has_value());
    EXPECT_FALSE(parseUrl("ftp://example.com/").has_value());
    EXPECT_FALSE(parseUrl("http://").has_value());
    EXPECT_FALSE(parseUrl("http://user:pw@example.com/").has_value());
    EXPECT_FALSE(parseUrl("http://example.com:0/").has_value());
    EXPECT_FALSE(parseUrl("http://example.com:70000/").has_value());
    EXPECT_FALSE(parseUrl("http://example.com:80x/").has_value());
    EXPECT_FALSE(parseUrl("http://example.com/a b").has_value());
    EXPECT_FALSE(parseUrl("http://[::1/").has_value());
}
