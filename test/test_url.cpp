#include <unity.h>
#include "url.h"

void test_url_parse_wss_default_port() {
    ParsedUrl u;
    TEST_ASSERT_EQUAL(VOX_OK, parseUrl("wss://api.example.com/v1/convai/conversation?agent_id=a1", u));
    TEST_ASSERT_EQUAL_STRING("wss", u.scheme.c_str());
    TEST_ASSERT_EQUAL_STRING("api.example.com", u.host.c_str());
    TEST_ASSERT_EQUAL_STRING("443", u.port.c_str());
    TEST_ASSERT_EQUAL_STRING("/v1/convai/conversation?agent_id=a1", u.target.c_str());
    TEST_ASSERT_TRUE(u.secure);
    TEST_ASSERT_EQUAL_STRING("api.example.com", u.hostHeader().c_str());
}

void test_url_parse_explicit_port_and_fragment() {
    ParsedUrl u;
    TEST_ASSERT_EQUAL(VOX_OK, parseUrl("HTTP://user@localhost:8080/hook#top", u));
    TEST_ASSERT_EQUAL_STRING("http", u.scheme.c_str());
    TEST_ASSERT_EQUAL_STRING("localhost", u.host.c_str());
    TEST_ASSERT_EQUAL_STRING("8080", u.port.c_str());
    TEST_ASSERT_EQUAL_STRING("/hook", u.target.c_str());
    TEST_ASSERT_FALSE(u.secure);
    TEST_ASSERT_EQUAL_STRING("localhost:8080", u.hostHeader().c_str());
}

void test_url_parse_ipv6_and_bare_query() {
    ParsedUrl u;
    TEST_ASSERT_EQUAL(VOX_OK, parseUrl("ws://[::1]:9000?x=1", u));
    TEST_ASSERT_EQUAL_STRING("::1", u.host.c_str());
    TEST_ASSERT_EQUAL_STRING("9000", u.port.c_str());
    TEST_ASSERT_EQUAL_STRING("/?x=1", u.target.c_str());
    TEST_ASSERT_EQUAL_STRING("[::1]:9000", u.hostHeader().c_str());

    TEST_ASSERT_EQUAL(VOX_OK, parseUrl("https://example.com", u));
    TEST_ASSERT_EQUAL_STRING("/", u.target.c_str());
}

void test_url_parse_rejects_bad_input() {
    ParsedUrl u;
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, parseUrl("example.com/path", u));
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, parseUrl("ftp://example.com", u));
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, parseUrl("wss:///path", u));
    TEST_ASSERT_EQUAL(VOX_ERR_INVALID_ARG, parseUrl("wss://host:80a/", u));
}

void test_url_encode_reserved_bytes() {
    TEST_ASSERT_EQUAL_STRING("abc-_.~", urlEncode("abc-_.~").c_str());
    TEST_ASSERT_EQUAL_STRING("a%20b%26c%3D", urlEncode("a b&c=").c_str());
    TEST_ASSERT_EQUAL_STRING("%E4%BD%A0", urlEncode("\xE4\xBD\xA0").c_str());
}

void test_url_append_query_param() {
    TEST_ASSERT_EQUAL_STRING("wss://h/p?agent_id=x%2Fy",
                             appendQueryParam("wss://h/p", "agent_id", "x/y").c_str());
    TEST_ASSERT_EQUAL_STRING("https://h/p?a=1&userId=u1",
                             appendQueryParam("https://h/p?a=1", "userId", "u1").c_str());
    TEST_ASSERT_EQUAL_STRING("https://h/p?k=v#frag",
                             appendQueryParam("https://h/p#frag", "k", "v").c_str());
}

void run_url_tests() {
    RUN_TEST(test_url_parse_wss_default_port);
    RUN_TEST(test_url_parse_explicit_port_and_fragment);
    RUN_TEST(test_url_parse_ipv6_and_bare_query);
    RUN_TEST(test_url_parse_rejects_bad_input);
    RUN_TEST(test_url_encode_reserved_bytes);
    RUN_TEST(test_url_append_query_param);
}
