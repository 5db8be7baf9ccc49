#include "auth/provider_bootstrap.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace keygate {

namespace {

// Shared between the waiting caller and the (possibly detached) worker
struct DiscoveryState {
    std::mutex mutex;
    std::condition_variable done;
    std::condition_variable_any pause;
    std::optional<ProviderConfig> config;
    int attempts = 0;
};

void discovery_loop(std::stop_token stop,
                    const std::shared_ptr<DiscoveryState>& state,
                    const ProviderConfigFetcher& fetcher,
                    const std::string& issuer_url,
                    const RetryPolicy& retry) {
    auto delay = retry.interval;

    while (!stop.stop_requested()) {
        int attempt = 0;
        {
            std::lock_guard lock(state->mutex);
            attempt = ++state->attempts;
        }

        auto result = fetcher.fetch(issuer_url);
        if (result.is_ok()) {
            std::lock_guard lock(state->mutex);
            if (stop.stop_requested()) {
                utils::log::debug("Discovery succeeded after the deadline, discarding");
                return;
            }
            state->config = std::move(result.value());
            state->done.notify_all();
            return;
        }

        utils::log::warn("Discovery attempt " + std::to_string(attempt) + " failed: " +
                         result.error_message() + " (retrying in " +
                         std::to_string(delay.count()) + "ms)");

        std::unique_lock lock(state->mutex);
        state->pause.wait_for(lock, stop, delay, [] { return false; });
        delay = retry.next(delay);
    }
}

} // anonymous namespace

std::chrono::milliseconds RetryPolicy::next(std::chrono::milliseconds current) const {
    if (multiplier <= 1.0) return current;
    const auto grown = std::chrono::milliseconds{
        static_cast<int64_t>(static_cast<double>(current.count()) * multiplier)};
    return std::min(grown, std::max(max_interval, interval));
}

Result<BootstrapResult> bootstrap(const BootstrapOptions& options,
                                  std::shared_ptr<IHttpTransport> transport) {
    using R = Result<BootstrapResult>;

    const std::string issuer_url = normalize_issuer_url(options.discovery_url);
    if (!transport) {
        HttpTransport::Config http_config;
        http_config.skip_tls_verify = options.skip_tls_verify;
        http_config.request_timeout = options.request_timeout;
        transport = std::make_shared<HttpTransport>(http_config);
    }
    if (options.skip_tls_verify) {
        utils::log::warn("TLS verification disabled for identity provider " + issuer_url);
    }

    ProviderConfigFetcher fetcher(transport);
    auto state = std::make_shared<DiscoveryState>();

    utils::Timer timer;
    std::jthread worker([state, fetcher, issuer_url, retry = options.retry](std::stop_token stop) {
        discovery_loop(stop, state, fetcher, issuer_url, retry);
    });

    const auto deadline = std::chrono::steady_clock::now() + options.timeout;
    std::unique_lock lock(state->mutex);
    const bool found = state->done.wait_until(lock, deadline, [&state] {
        return state->config.has_value();
    });

    if (!found) {
        const int attempts = state->attempts;
        lock.unlock();
        worker.request_stop();
        worker.detach();
        return R::error(ErrorCategory::DISCOVERY_TIMEOUT,
            "no provider config from " + issuer_url + " after " +
            std::to_string(attempts) + " attempts in " +
            std::to_string(timer.elapsed_ms().count()) + "ms");
    }

    auto config = std::make_shared<const ProviderConfig>(std::move(*state->config));
    lock.unlock();
    worker.join();

    utils::log::info("Discovered provider " + config->issuer + " in " +
                     std::to_string(timer.elapsed_ms().count()) + "ms");

    IdentityClientConfig client_config;
    client_config.credentials = {options.client_id, options.client_secret};
    client_config.redirect_url = IdentityClient::make_redirect_url(options.redirection_url);
    client_config.scopes = IdentityClient::merge_scopes(options.scopes);

    BootstrapResult result;
    result.client = std::make_shared<IdentityClient>(std::move(client_config), config, transport);
    result.config = config;
    result.transport = transport;
    result.sync = std::make_unique<ProviderSync>(result.client, fetcher, issuer_url,
                                                 options.retry.interval);
    if (options.start_sync) {
        result.sync->start();
    }
    return R::ok(std::move(result));
}

} // namespace keygate
