#include "auth/provider_sync.hpp"
#include "core/utils.hpp"
#include "security/trust_store.hpp"

#include <algorithm>

namespace keygate {

ProviderSync::ProviderSync(std::shared_ptr<IdentityClient> client,
                           ProviderConfigFetcher fetcher,
                           std::string issuer_url,
                           std::chrono::milliseconds retry_interval)
    : client_(std::move(client)),
      fetcher_(std::move(fetcher)),
      issuer_url_(std::move(issuer_url)),
      retry_interval_(retry_interval),
      failure_backoff_(retry_interval) {}

ProviderSync::~ProviderSync() {
    stop();
}

void ProviderSync::start() {
    if (running_.load()) return;
    running_.store(true);
    sync_thread_ = std::jthread([this](std::stop_token stop) {
        sync_loop(std::move(stop));
    });
    utils::log::info("Provider sync started for " + issuer_url_);
}

void ProviderSync::stop() {
    if (!running_.load()) return;
    running_.store(false);
    if (sync_thread_.joinable()) {
        sync_thread_.request_stop();
        sync_thread_.join();
    }
    utils::log::info("Provider sync stopped");
}

std::chrono::seconds ProviderSync::next_sync_after(const ProviderConfig& config,
                                                   std::chrono::system_clock::time_point now) {
    if (!config.expires_at) {
        return kMaxSyncInterval;
    }
    const auto wait = refresh_within(*config.expires_at, 0.5, now);
    return std::clamp(wait, kMinSyncInterval, kMaxSyncInterval);
}

std::chrono::milliseconds ProviderSync::sync_once() {
    auto result = fetcher_.fetch(issuer_url_);
    if (result.is_error()) {
        ++failures_;
        const auto delay = failure_backoff_;
        failure_backoff_ = std::min<std::chrono::milliseconds>(failure_backoff_ * 2,
                                                               kMaxFailureBackoff);
        utils::log::warn("Provider sync failed: " + result.error_message() +
                         " (retrying in " + std::to_string(delay.count()) + "ms)");
        return delay;
    }

    ++successes_;
    failure_backoff_ = retry_interval_;

    auto config = std::make_shared<const ProviderConfig>(std::move(result.value()));
    const auto next = next_sync_after(*config, utils::now());
    client_->replace_config(std::move(config));
    utils::log::debug("Provider config refreshed, next sync in " +
                      std::to_string(next.count()) + "s");
    return next;
}

void ProviderSync::sync_loop(std::stop_token stop) {
    std::chrono::milliseconds delay = next_sync_after(*client_->current_config(), utils::now());

    while (!stop.stop_requested()) {
        // Sleep in 100ms increments for responsive shutdown
        const auto deadline = std::chrono::steady_clock::now() + delay;
        while (!stop.stop_requested() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds{100});
        }

        if (stop.stop_requested()) break;

        try {
            delay = sync_once();
        } catch (const std::exception& e) {
            utils::log::error(std::string("Provider sync error: ") + e.what());
            delay = retry_interval_;
        }
    }
}

} // namespace keygate
