#include <catch2/catch_test_macros.hpp>
#include "core/url.hpp"

using namespace keygate;

TEST_CASE("parse_url splits scheme, host, port and target", "[url]") {
    auto url = parse_url("HTTPS://idp.example.com:8443/realms/x?y=1#frag");
    REQUIRE(url.has_value());
    CHECK(url->scheme == "https");
    CHECK(url->host == "idp.example.com");
    CHECK(url->port == 8443);
    CHECK(url->target == "/realms/x?y=1");
    CHECK(url->origin() == "https://idp.example.com:8443");
    CHECK(url->dial_address() == "idp.example.com:8443");
}

TEST_CASE("parse_url defaults the target to /", "[url]") {
    auto url = parse_url("http://backend");
    REQUIRE(url.has_value());
    CHECK(url->target == "/");
    CHECK_FALSE(url->has_explicit_port());

    auto query_only = parse_url("http://backend?x=1");
    REQUIRE(query_only.has_value());
    CHECK(query_only->target == "/?x=1");
}

TEST_CASE("Url effective port follows the scheme", "[url]") {
    CHECK(parse_url("http://a")->effective_port() == 80);
    CHECK(parse_url("ws://a")->effective_port() == 80);
    CHECK(parse_url("https://a")->effective_port() == 443);
    CHECK(parse_url("wss://a")->effective_port() == 443);
    CHECK(parse_url("http://a:8080")->effective_port() == 8080);

    CHECK(parse_url("ws://a")->is_plaintext());
    CHECK_FALSE(parse_url("wss://a")->is_plaintext());
}

TEST_CASE("Url http_origin spells websocket schemes as HTTP", "[url]") {
    CHECK(parse_url("ws://backend:8080/socket")->http_origin() == "http://backend:8080");
    CHECK(parse_url("wss://backend")->http_origin() == "https://backend");
    CHECK(parse_url("https://backend:8443")->http_origin() == "https://backend:8443");

    CHECK(parse_url("wss://backend")->is_web_scheme());
    CHECK(parse_url("HTTP://backend")->is_web_scheme());
    CHECK_FALSE(parse_url("ftp://backend")->is_web_scheme());
}

TEST_CASE("parse_url handles IPv6 literals and userinfo", "[url]") {
    auto v6 = parse_url("https://[::1]:9443/x");
    REQUIRE(v6.has_value());
    CHECK(v6->host == "[::1]");
    CHECK(v6->bare_host() == "::1");
    CHECK(v6->port == 9443);
    CHECK(v6->dial_address() == "[::1]:9443");

    auto userinfo = parse_url("http://user:pw@host:81/");
    REQUIRE(userinfo.has_value());
    CHECK(userinfo->host == "host");
    CHECK(userinfo->port == 81);
}

TEST_CASE("parse_url rejects malformed input", "[url]") {
    CHECK_FALSE(parse_url("").has_value());
    CHECK_FALSE(parse_url("backend:8080").has_value());
    CHECK_FALSE(parse_url("://host").has_value());
    CHECK_FALSE(parse_url("http://").has_value());
    CHECK_FALSE(parse_url("http://:80/").has_value());
    CHECK_FALSE(parse_url("http://host:0").has_value());
    CHECK_FALSE(parse_url("http://host:65536").has_value());
    CHECK_FALSE(parse_url("http://host:http").has_value());
    CHECK_FALSE(parse_url("http://[::1/").has_value());
}

TEST_CASE("url_encode keeps only unreserved characters", "[url]") {
    CHECK(url_encode("abc-_.~XYZ09") == "abc-_.~XYZ09");
    CHECK(url_encode("a b&c=/") == "a%20b%26c%3D%2F");
    CHECK(url_encode("openid email") == "openid%20email");
}

TEST_CASE("url_decode reverses percent-encoding", "[url]") {
    CHECK(url_decode("a%20b%26c") == "a b&c");
    CHECK(url_decode("a+b") == "a b");
    CHECK(url_decode("%2Fpath%2f") == "/path/");
    CHECK(url_decode("100%") == "100%");
    CHECK(url_decode("%zz") == "%zz");
}

TEST_CASE("parse_query decodes pairs", "[url]") {
    auto params = parse_query("?code=abc%2F123&state=%2Fapp%3Fx%3D1&flag");
    CHECK(params["code"] == "abc/123");
    CHECK(params["state"] == "/app?x=1");
    CHECK(params.count("flag") == 1);
    CHECK(params["flag"].empty());

    CHECK(parse_query("").empty());
    CHECK(parse_query("&&").empty());
}
