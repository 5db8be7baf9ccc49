#include <catch2/catch_test_macros.hpp>
#include "auth/http_transport.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <thread>

using namespace keygate;
using namespace std::chrono_literals;

namespace {

// httplib::Server on a loopback port for the lifetime of the fixture
class LocalServer {
public:
    LocalServer() {
        server_.Get("/.well-known/openid-configuration",
                    [](const httplib::Request& req, httplib::Response& res) {
            res.set_header("Cache-Control", "max-age=60");
            res.set_content(std::string(R"({"accept":")") + req.get_header_value("Accept") + "\"}",
                            "application/json");
        });
        server_.Post("/token", [](const httplib::Request& req, httplib::Response& res) {
            res.set_content(req.get_header_value("Authorization") + "|" +
                            req.get_param_value("grant_type") + "|" +
                            req.get_param_value("code"),
                            "text/plain");
        });
        port_ = server_.bind_to_any_port("127.0.0.1");
        REQUIRE(port_ > 0);
        thread_ = std::jthread([this] { server_.listen_after_bind(); });
        server_.wait_until_ready();
    }

    ~LocalServer() {
        server_.stop();
    }

    [[nodiscard]] std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    httplib::Server server_;
    int port_ = 0;
    std::jthread thread_;
};

HttpTransport make_transport() {
    HttpTransport::Config config;
    config.request_timeout = 2s;
    return HttpTransport(config);
}

} // anonymous namespace

TEST_CASE("HttpTransport GET returns status, body and lower-cased headers", "[http_transport]") {
    LocalServer server;
    auto transport = make_transport();

    auto res = transport.get(server.url("/.well-known/openid-configuration"));
    REQUIRE(res.is_ok());
    CHECK(res.value().status == 200);
    CHECK(res.value().body == R"({"accept":"application/json"})");
    CHECK(res.value().header("cache-control") == "max-age=60");
    CHECK(res.value().header("content-type") == "application/json");
}

TEST_CASE("HttpTransport passes HTTP errors through as responses", "[http_transport]") {
    LocalServer server;
    auto transport = make_transport();

    auto res = transport.get(server.url("/missing"));
    REQUIRE(res.is_ok());
    CHECK(res.value().status == 404);
}

TEST_CASE("HttpTransport POSTs forms with basic credentials", "[http_transport]") {
    LocalServer server;
    auto transport = make_transport();

    auto res = transport.post_form(server.url("/token"),
                                   {{"grant_type", "authorization_code"}, {"code", "a b"}},
                                   "client", "secret");
    REQUIRE(res.is_ok());
    CHECK(res.value().status == 200);
    // base64("client:secret")
    CHECK(res.value().body == "Basic Y2xpZW50OnNlY3JldA==|authorization_code|a b");
}

TEST_CASE("HttpTransport reports unusable URLs and unreachable servers", "[http_transport]") {
    auto transport = make_transport();

    auto bad = transport.get("not-a-url");
    REQUIRE(bad.is_error());
    CHECK(bad.error_category() == ErrorCategory::PROVIDER_ERROR);

    // Bind and release a port so nothing is listening on it
    const int scratch = ::socket(AF_INET, SOCK_STREAM, 0);
    REQUIRE(scratch >= 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    REQUIRE(::bind(scratch, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);
    socklen_t len = sizeof(addr);
    REQUIRE(::getsockname(scratch, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    const int port = ntohs(addr.sin_port);
    ::close(scratch);

    auto refused = transport.get("http://127.0.0.1:" + std::to_string(port) + "/x");
    REQUIRE(refused.is_error());
    CHECK(refused.error_category() == ErrorCategory::PROVIDER_ERROR);
}
