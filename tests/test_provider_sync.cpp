#include <catch2/catch_test_macros.hpp>
#include "auth/provider_sync.hpp"
#include "core/utils.hpp"
#include "mocks/mock_http_transport.hpp"

using namespace keygate;
using namespace keygate::testing;
using namespace std::chrono_literals;

namespace {

const std::string kIssuer = "https://idp.example.com";

std::shared_ptr<IdentityClient> make_client(const std::shared_ptr<MockHttpTransport>& transport) {
    auto cfg = parse_provider_config(discovery_json(kIssuer), kIssuer);
    REQUIRE(cfg.is_ok());
    IdentityClientConfig config;
    config.credentials = {"keygate", "s3cret"};
    config.redirect_url = IdentityClient::make_redirect_url("https://app.example.com");
    config.scopes = IdentityClient::merge_scopes({});
    return std::make_shared<IdentityClient>(
        std::move(config), std::make_shared<const ProviderConfig>(std::move(cfg.value())),
        transport);
}

} // anonymous namespace

TEST_CASE("next_sync_after is half the remaining lifetime, clamped", "[provider_sync]") {
    const auto now = utils::now();
    ProviderConfig cfg;

    SECTION("no expiry waits the maximum") {
        CHECK(ProviderSync::next_sync_after(cfg, now) == ProviderSync::kMaxSyncInterval);
    }

    SECTION("two hours left") {
        cfg.expires_at = now + 2h;
        CHECK(ProviderSync::next_sync_after(cfg, now) == 1h);
    }

    SECTION("short lifetimes wait the minimum") {
        cfg.expires_at = now + 30s;
        CHECK(ProviderSync::next_sync_after(cfg, now) == ProviderSync::kMinSyncInterval);
        cfg.expires_at = now - 1h;
        CHECK(ProviderSync::next_sync_after(cfg, now) == ProviderSync::kMinSyncInterval);
    }

    SECTION("long lifetimes wait the maximum") {
        cfg.expires_at = now + 24h * 10;
        CHECK(ProviderSync::next_sync_after(cfg, now) == ProviderSync::kMaxSyncInterval);
    }
}

TEST_CASE("sync_once publishes a fresh config", "[provider_sync]") {
    auto transport = std::make_shared<MockHttpTransport>();
    script_provider(*transport, kIssuer, {{"cache-control", "max-age=7200"}});
    auto client = make_client(transport);
    const auto original = client->current_config();
    REQUIRE(original->signing_keys.empty());

    ProviderSync sync(client, ProviderConfigFetcher(transport), kIssuer, 1s);
    const auto next = sync.sync_once();

    CHECK(sync.successful_syncs() == 1);
    CHECK(sync.failed_syncs() == 0);
    const auto updated = client->current_config();
    CHECK(updated != original);
    CHECK(updated->find_key("sig-1") != nullptr);
    CHECK(next > 3500s);
    CHECK(next <= 3600s);
}

TEST_CASE("sync_once backs off on failure and keeps the old config", "[provider_sync]") {
    auto transport = std::make_shared<MockHttpTransport>();
    transport->set_failing(true);
    auto client = make_client(transport);
    const auto original = client->current_config();

    ProviderSync sync(client, ProviderConfigFetcher(transport), kIssuer, 10s);
    CHECK(sync.sync_once() == 10s);
    CHECK(sync.sync_once() == 20s);
    CHECK(sync.sync_once() == 40s);
    CHECK(sync.sync_once() == 60s);
    CHECK(sync.sync_once() == 60s);
    CHECK(sync.failed_syncs() == 5);
    CHECK(client->current_config() == original);

    // Success resets the backoff
    transport->set_failing(false);
    script_provider(*transport, kIssuer);
    CHECK(sync.sync_once() == ProviderSync::kMaxSyncInterval);
    transport->set_failing(true);
    CHECK(sync.sync_once() == 10s);
}

TEST_CASE("ProviderSync start and stop", "[provider_sync]") {
    auto transport = std::make_shared<MockHttpTransport>();
    auto client = make_client(transport);

    ProviderSync sync(client, ProviderConfigFetcher(transport), kIssuer, 1s);
    CHECK_FALSE(sync.is_running());
    sync.start();
    CHECK(sync.is_running());

    utils::Timer timer;
    sync.stop();
    CHECK_FALSE(sync.is_running());
    CHECK(timer.elapsed_ms() < 1000ms);
    // The first round is scheduled a day out
    CHECK(transport->get_count() == 0);
}
