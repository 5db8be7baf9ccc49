#pragma once

#include "auth/http_transport.hpp"
#include "auth/identity_client.hpp"
#include "auth/provider_config.hpp"
#include "auth/provider_sync.hpp"
#include "core/error.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace keygate {

/**
 * @brief Pause between discovery attempts
 *
 * multiplier 1.0 keeps a fixed interval; larger values grow the pause
 * geometrically up to max_interval.
 */
struct RetryPolicy {
    std::chrono::milliseconds interval{3000};
    double multiplier = 1.0;
    std::chrono::milliseconds max_interval{30000};

    [[nodiscard]] std::chrono::milliseconds next(std::chrono::milliseconds current) const;
};

struct BootstrapOptions {
    std::string discovery_url;      // Issuer URL, with or without the well-known suffix
    std::string client_id;
    std::string client_secret;
    std::string redirection_url;    // Base URL; "/oauth/callback" is appended
    std::vector<std::string> scopes;
    bool skip_tls_verify = false;
    std::chrono::milliseconds timeout{30000};
    RetryPolicy retry;
    std::chrono::seconds request_timeout{10};
    bool start_sync = true;
};

struct BootstrapResult {
    std::shared_ptr<IdentityClient> client;
    ProviderConfigPtr config;
    std::shared_ptr<IHttpTransport> transport;
    std::unique_ptr<ProviderSync> sync;    // Running unless start_sync was false
};

/**
 * @brief Obtain provider metadata with retries under an overall deadline
 *
 * Discovery attempts run on a worker std::jthread, pausing per the retry
 * policy after every failure, while the caller waits on a condition
 * variable until a config arrives or the deadline passes. On timeout the
 * worker is asked to stop and detached: it finishes at most the attempt in
 * flight (bounded by the transport's request timeout) and its result, if
 * any, is dropped.
 *
 * @param transport HTTP transport to use; nullptr builds a cpp-httplib
 *        HttpTransport honouring skip_tls_verify and request_timeout
 * @return DISCOVERY_TIMEOUT when no attempt succeeded before the deadline
 */
[[nodiscard]] Result<BootstrapResult> bootstrap(const BootstrapOptions& options,
                                                std::shared_ptr<IHttpTransport> transport = nullptr);

} // namespace keygate
