#include "auth/identity_client.hpp"
#include "core/json.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <mutex>

namespace keygate {

namespace {

constexpr const char* kDefaultScopes[] = {"openid", "email", "profile"};

std::string join_scopes(const std::vector<std::string>& scopes) {
    std::string out;
    for (const auto& s : scopes) {
        if (!out.empty()) out += ' ';
        out += s;
    }
    return out;
}

} // anonymous namespace

IdentityClient::IdentityClient(IdentityClientConfig config,
                               ProviderConfigPtr provider,
                               std::shared_ptr<IHttpTransport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      provider_(std::move(provider)) {}

std::vector<std::string> IdentityClient::merge_scopes(const std::vector<std::string>& configured) {
    std::vector<std::string> merged;
    auto add = [&merged](const std::string& scope) {
        if (scope.empty()) return;
        if (std::find(merged.begin(), merged.end(), scope) == merged.end()) {
            merged.push_back(scope);
        }
    };
    for (const auto& s : configured) add(s);
    for (const char* s : kDefaultScopes) add(s);
    return merged;
}

std::string IdentityClient::make_redirect_url(std::string_view base_url) {
    while (!base_url.empty() && base_url.back() == '/') {
        base_url.remove_suffix(1);
    }
    return std::string(base_url) + std::string(kCallbackPath);
}

ProviderConfigPtr IdentityClient::current_config() const {
    std::shared_lock lock(provider_mutex_);
    return provider_;
}

void IdentityClient::replace_config(ProviderConfigPtr provider) {
    std::unique_lock lock(provider_mutex_);
    provider_ = std::move(provider);
}

std::string IdentityClient::auth_code_url(std::string_view state) const {
    const auto provider = current_config();
    std::string url = provider->authorization_endpoint;
    url += (url.find('?') == std::string::npos) ? '?' : '&';
    url += "response_type=code";
    url += "&client_id=" + url_encode(config_.credentials.id);
    url += "&redirect_uri=" + url_encode(config_.redirect_url);
    url += "&scope=" + url_encode(join_scopes(config_.scopes));
    url += "&state=" + url_encode(state);
    return url;
}

Result<TokenResponse> IdentityClient::exchange_code(std::string_view code) const {
    return token_request({
        {"grant_type", "authorization_code"},
        {"code", std::string(code)},
        {"redirect_uri", config_.redirect_url},
    });
}

Result<TokenResponse> IdentityClient::refresh(std::string_view refresh_token) const {
    return token_request({
        {"grant_type", "refresh_token"},
        {"refresh_token", std::string(refresh_token)},
    });
}

Result<TokenResponse> IdentityClient::token_request(const FormParams& form) const {
    using R = Result<TokenResponse>;

    const auto provider = current_config();
    auto response = transport_->post_form(provider->token_endpoint, form,
                                          config_.credentials.id,
                                          config_.credentials.secret);
    if (response.is_error()) return R::error_from(response);

    const auto& res = response.value();
    JsonValue doc;
    try {
        doc = JsonValue::parse(res.body);
    } catch (const JsonValue::parse_error&) {
        return R::error(ErrorCategory::PROVIDER_ERROR,
            "token endpoint returned HTTP " + std::to_string(res.status) + " with non-JSON body");
    }

    if (res.status != 200) {
        std::string message = "token endpoint returned HTTP " + std::to_string(res.status);
        const auto error = doc.value("error", std::string{});
        if (!error.empty()) {
            message += ": " + error;
            const auto description = doc.value("error_description", std::string{});
            if (!description.empty()) message += " (" + description + ")";
        }
        return R::error(ErrorCategory::PROVIDER_ERROR, message);
    }

    TokenResponse token;
    token.access_token = doc.value("access_token", std::string{});
    token.id_token = doc.value("id_token", std::string{});
    token.refresh_token = doc.value("refresh_token", std::string{});
    token.token_type = doc.value("token_type", std::string{});
    token.scope = doc.value("scope", std::string{});
    token.expires_in = std::chrono::seconds{doc.value<int64_t>("expires_in", 0)};

    if (token.access_token.empty()) {
        return R::error(ErrorCategory::PROVIDER_ERROR, "token response has no access_token");
    }
    return R::ok(std::move(token));
}

} // namespace keygate
