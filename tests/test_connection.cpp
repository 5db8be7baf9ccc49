#include <catch2/catch_test_macros.hpp>
#include "core/utils.hpp"
#include "mocks/test_certificates.hpp"
#include "security/trust_store.hpp"
#include "server/connection.hpp"

#include <openssl/ssl.h>

#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <csignal>
#include <memory>
#include <string>
#include <thread>

using namespace keygate;
using namespace keygate::testing;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<SSL_CTX> make_unverified_client_context() {
    std::shared_ptr<SSL_CTX> ctx(SSL_CTX_new(TLS_client_method()), SSL_CTX_free);
    REQUIRE(ctx != nullptr);
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
    return ctx;
}

/**
 * TLS session over a socketpair: `server` is the accepted side as the proxy
 * would hold it, `client` a connected peer.
 */
struct TlsPair {
    std::shared_ptr<SSL_CTX> server_ctx;
    std::shared_ptr<SSL_CTX> client_ctx;
    std::unique_ptr<TlsConnection> server;
    std::unique_ptr<TlsConnection> client;

    TlsPair() {
        std::signal(SIGPIPE, SIG_IGN);
        const auto pem = make_self_signed("localhost", 1);
        auto identity = parse_certificate(pem.cert, pem.key);
        REQUIRE(identity.is_ok());
        server_ctx = identity.value().make_server_context();
        client_ctx = make_unverified_client_context();

        int sv[2];
        REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);

        using Accepted = Result<std::unique_ptr<TlsConnection>>;
        Accepted accepted = Accepted::error(ErrorCategory::NONE, "not run");
        {
            std::jthread acceptor([&] { accepted = TlsConnection::accept(sv[0], server_ctx.get()); });
            auto connected = TlsConnection::connect(sv[1], client_ctx.get(), "localhost", 2000ms);
            REQUIRE(connected.is_ok());
            client = std::move(connected.value());
        }
        REQUIRE(accepted.is_ok());
        server = std::move(accepted.value());
    }
};

} // anonymous namespace

TEST_CASE("SocketConnection read gives up after the read timeout", "[connection]") {
    int sv[2];
    REQUIRE(::socketpair(AF_UNIX, SOCK_STREAM, 0, sv) == 0);
    SocketConnection conn(sv[0]);
    conn.set_read_timeout(200ms);

    char buf[16];
    utils::Timer timer;
    CHECK(conn.read(buf, sizeof(buf)) == -1);
    CHECK(timer.elapsed_ms().count() < 2000);

    REQUIRE(::send(sv[1], "hi", 2, MSG_NOSIGNAL) == 2);
    CHECK(conn.read(buf, sizeof(buf)) == 2);
    ::close(sv[1]);
}

TEST_CASE("TlsConnection read honours the read timeout", "[connection]") {
    TlsPair pair;
    char buf[16];

    SECTION("idle peer times out") {
        pair.server->set_read_timeout(300ms);
        utils::Timer timer;
        CHECK(pair.server->read(buf, sizeof(buf)) == -1);
        const auto elapsed = timer.elapsed_ms().count();
        CHECK(elapsed >= 250);
        CHECK(elapsed < 2000);
    }

    SECTION("data before the deadline is returned") {
        pair.server->set_read_timeout(2000ms);
        REQUIRE(pair.client->write_all("ping", 4));
        REQUIRE(pair.server->read(buf, sizeof(buf)) == 4);
        CHECK(std::string(buf, 4) == "ping");
    }

    SECTION("zero disables the timeout") {
        pair.server->set_read_timeout(300ms);
        pair.server->set_read_timeout(0ms);
        std::jthread late_writer([&] {
            std::this_thread::sleep_for(600ms);
            (void)pair.client->write_all("late", 4);
        });
        REQUIRE(pair.server->read(buf, sizeof(buf)) == 4);
        CHECK(std::string(buf, 4) == "late");
    }
}

TEST_CASE("TlsConnection half-close and abort", "[connection]") {
    TlsPair pair;
    char buf[16];

    SECTION("shutdown_write is seen as EOF while the other direction stays open") {
        pair.client->shutdown_write();
        CHECK(pair.server->read(buf, sizeof(buf)) == 0);

        REQUIRE(pair.server->write_all("bye", 3));
        REQUIRE(pair.client->read(buf, sizeof(buf)) == 3);
        CHECK(std::string(buf, 3) == "bye");
    }

    SECTION("abort unblocks a reader on another thread") {
        ssize_t result = 1;
        {
            std::jthread reader([&] { result = pair.server->read(buf, sizeof(buf)); });
            std::this_thread::sleep_for(100ms);
            pair.server->abort();
        }
        CHECK(result == -1);
        CHECK_FALSE(pair.server->write_all("x", 1));
    }
}
