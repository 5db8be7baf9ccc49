#pragma once

#include "auth/http_transport.hpp"
#include "auth/provider_config.hpp"
#include "core/error.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

namespace keygate {

inline constexpr std::string_view kCallbackPath = "/oauth/callback";

struct ClientCredentials {
    std::string id;
    std::string secret;
};

struct IdentityClientConfig {
    ClientCredentials credentials;
    std::string redirect_url;           // Absolute callback URL
    std::vector<std::string> scopes;    // Already merged with the default scopes
};

struct TokenResponse {
    std::string access_token;
    std::string id_token;
    std::string refresh_token;
    std::string token_type;
    std::string scope;
    std::chrono::seconds expires_in{0};
};

/**
 * @brief OAuth2 / OpenID Connect relying-party client
 *
 * Holds the client credentials and the current provider metadata snapshot.
 * The snapshot is swapped by ProviderSync while request threads read it.
 */
class IdentityClient {
public:
    IdentityClient(IdentityClientConfig config,
                   ProviderConfigPtr provider,
                   std::shared_ptr<IHttpTransport> transport);

    // Configured scopes followed by openid, email, profile; duplicates dropped
    [[nodiscard]] static std::vector<std::string> merge_scopes(
        const std::vector<std::string>& configured);

    // Base URL with trailing slashes trimmed, plus "/oauth/callback"
    [[nodiscard]] static std::string make_redirect_url(std::string_view base_url);

    [[nodiscard]] ProviderConfigPtr current_config() const;
    void replace_config(ProviderConfigPtr provider);

    /**
     * @brief Authorization endpoint URL that starts the code flow
     *
     * response_type=code with client_id, redirect_uri, space-joined scope
     * and the opaque `state`.
     */
    [[nodiscard]] std::string auth_code_url(std::string_view state) const;

    /**
     * @brief Redeem an authorization code at the token endpoint
     * @return PROVIDER_ERROR for transport failures, non-200 responses or a
     *         response without access_token
     */
    [[nodiscard]] Result<TokenResponse> exchange_code(std::string_view code) const;

    // refresh_token grant; same error reporting as exchange_code()
    [[nodiscard]] Result<TokenResponse> refresh(std::string_view refresh_token) const;

    [[nodiscard]] const std::string& client_id() const { return config_.credentials.id; }
    [[nodiscard]] const std::string& redirect_url() const { return config_.redirect_url; }
    [[nodiscard]] const std::vector<std::string>& scopes() const { return config_.scopes; }

private:
    [[nodiscard]] Result<TokenResponse> token_request(const FormParams& form) const;

    IdentityClientConfig config_;
    std::shared_ptr<IHttpTransport> transport_;

    mutable std::shared_mutex provider_mutex_;
    ProviderConfigPtr provider_;
};

} // namespace keygate
