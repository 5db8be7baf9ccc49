#pragma once

#include "auth/identity_client.hpp"
#include "auth/provider_config.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>

namespace keygate {

/**
 * @brief Background re-fetch of provider metadata and signing keys
 *
 * Keeps the IdentityClient's config snapshot current so signing-key
 * rotations at the provider are picked up. Each successful fetch is
 * published with IdentityClient::replace_config(); readers never see a
 * partially updated config.
 *
 * Schedule:
 * - after success: half the time left until the config's expiry, clamped
 *   to [kMinSyncInterval, kMaxSyncInterval]; no expiry → kMaxSyncInterval
 * - after failure: retry interval, doubling up to kMaxFailureBackoff
 *
 * Runs on a single std::jthread with stop-token aware sleep.
 */
class ProviderSync {
public:
    static constexpr std::chrono::seconds kMinSyncInterval{60};
    static constexpr std::chrono::seconds kMaxSyncInterval{24 * 60 * 60};
    static constexpr std::chrono::seconds kMaxFailureBackoff{60};

    ProviderSync(std::shared_ptr<IdentityClient> client,
                 ProviderConfigFetcher fetcher,
                 std::string issuer_url,
                 std::chrono::milliseconds retry_interval = std::chrono::seconds{3});

    ~ProviderSync();

    ProviderSync(const ProviderSync&) = delete;
    ProviderSync& operator=(const ProviderSync&) = delete;

    /**
     * @brief Start syncing; the first fetch happens after next_sync_after()
     *        of the client's current config
     */
    void start();

    // Joins the background thread
    void stop();

    [[nodiscard]] bool is_running() const { return running_.load(); }

    /**
     * @brief One fetch-and-publish round
     * @return Delay until the next round
     */
    std::chrono::milliseconds sync_once();

    [[nodiscard]] static std::chrono::seconds next_sync_after(
        const ProviderConfig& config,
        std::chrono::system_clock::time_point now);

    [[nodiscard]] uint64_t successful_syncs() const { return successes_.load(); }
    [[nodiscard]] uint64_t failed_syncs() const { return failures_.load(); }

private:
    void sync_loop(std::stop_token stop);

    std::shared_ptr<IdentityClient> client_;
    ProviderConfigFetcher fetcher_;
    std::string issuer_url_;
    std::chrono::milliseconds retry_interval_;
    std::chrono::milliseconds failure_backoff_;

    std::atomic<uint64_t> successes_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<bool> running_{false};
    std::jthread sync_thread_;
};

} // namespace keygate
