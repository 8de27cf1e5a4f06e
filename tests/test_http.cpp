/**
 * @file test_http.cpp
 * @brief Tests for transport helpers
 */

#include <geminiweb/http.hpp>
#include <gtest/gtest.h>

using namespace geminiweb;

TEST(HttpHelpersTest, ParsesSetCookieHeader) {
    auto cookie = parse_set_cookie("Set-Cookie: __Secure-1PSIDTS=sidts-new; Path=/; Secure; HttpOnly\r\n");

    ASSERT_TRUE(cookie.has_value());
    EXPECT_EQ(cookie->first, "__Secure-1PSIDTS");
    EXPECT_EQ(cookie->second, "sidts-new");
}

TEST(HttpHelpersTest, SetCookieIsCaseInsensitive) {
    auto cookie = parse_set_cookie("set-cookie: NID=abc");

    ASSERT_TRUE(cookie.has_value());
    EXPECT_EQ(cookie->first, "NID");
}

TEST(HttpHelpersTest, IgnoresOtherHeaders) {
    EXPECT_FALSE(parse_set_cookie("Content-Type: text/html\r\n").has_value());
    EXPECT_FALSE(parse_set_cookie("Set-Cookie: novalue").has_value());
    EXPECT_FALSE(parse_set_cookie("HTTP/2 200\r\n").has_value());
}

TEST(HttpHelpersTest, FormatsCookieHeader) {
    CookieJar cookies = {{"__Secure-1PSID", "a"}, {"__Secure-1PSIDTS", "b"}};

    EXPECT_EQ(format_cookie_header(cookies), "__Secure-1PSID=a; __Secure-1PSIDTS=b");
    EXPECT_EQ(format_cookie_header({}), "");
}

TEST(HttpHelpersTest, UrlEncodesForm) {
    FormFields form = {{"at", "tok:1"}, {"f.req", "[null,\"x y\"]"}};

    EXPECT_EQ(url_encode_form(form), "at=tok%3A1&f.req=%5Bnull%2C%22x%20y%22%5D");
}
