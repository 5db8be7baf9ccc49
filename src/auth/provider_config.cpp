#include "auth/provider_config.hpp"
#include "core/json.hpp"
#include "core/utils.hpp"

#include <charconv>

namespace keygate {

namespace {

std::string strip_trailing_slashes(std::string_view url) {
    while (!url.empty() && url.back() == '/') {
        url.remove_suffix(1);
    }
    return std::string(url);
}

} // anonymous namespace

const JsonWebKey* ProviderConfig::find_key(std::string_view kid) const {
    for (const auto& key : signing_keys) {
        if (key.kid == kid) return &key;
    }
    return nullptr;
}

std::string normalize_issuer_url(std::string_view url) {
    std::string out = strip_trailing_slashes(url);
    if (out.size() >= kDiscoverySuffix.size() &&
        std::string_view(out).substr(out.size() - kDiscoverySuffix.size()) == kDiscoverySuffix) {
        out.resize(out.size() - kDiscoverySuffix.size());
    }
    return strip_trailing_slashes(out);
}

std::string discovery_document_url(std::string_view issuer_url) {
    return normalize_issuer_url(issuer_url) + std::string(kDiscoverySuffix);
}

std::optional<std::chrono::seconds> parse_max_age(std::string_view cache_control) {
    for (const auto& directive : utils::split(std::string(cache_control), ',')) {
        const std::string d = utils::trim(directive);
        const auto eq = d.find('=');
        if (eq == std::string::npos) continue;
        if (!utils::iequals(utils::trim(d.substr(0, eq)), "max-age")) continue;

        std::string value = utils::trim(d.substr(eq + 1));
        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }
        int64_t seconds = 0;
        const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), seconds);
        if (ec != std::errc{} || ptr != value.data() + value.size() || seconds < 0) {
            return std::nullopt;
        }
        return std::chrono::seconds{seconds};
    }
    return std::nullopt;
}

Result<ProviderConfig> parse_provider_config(const std::string& body,
                                             std::string_view expected_issuer) {
    using R = Result<ProviderConfig>;

    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return R::error(ErrorCategory::PROVIDER_ERROR, "discovery document is not valid JSON");
    }
    if (!doc.is_object()) {
        return R::error(ErrorCategory::PROVIDER_ERROR, "discovery document is not a JSON object");
    }

    ProviderConfig cfg;
    cfg.issuer = doc.value("issuer", std::string{});
    cfg.authorization_endpoint = doc.value("authorization_endpoint", std::string{});
    cfg.token_endpoint = doc.value("token_endpoint", std::string{});
    cfg.userinfo_endpoint = doc.value("userinfo_endpoint", std::string{});
    cfg.jwks_uri = doc.value("jwks_uri", std::string{});
    cfg.end_session_endpoint = doc.value("end_session_endpoint", std::string{});
    cfg.scopes_supported = doc.string_array("scopes_supported");
    cfg.response_types_supported = doc.string_array("response_types_supported");
    cfg.grant_types_supported = doc.string_array("grant_types_supported");
    cfg.id_token_signing_alg_values_supported =
        doc.string_array("id_token_signing_alg_values_supported");
    cfg.token_endpoint_auth_methods_supported =
        doc.string_array("token_endpoint_auth_methods_supported");

    for (const auto& [field, value] : {
             std::pair<const char*, const std::string*>{"issuer", &cfg.issuer},
             {"authorization_endpoint", &cfg.authorization_endpoint},
             {"token_endpoint", &cfg.token_endpoint},
             {"jwks_uri", &cfg.jwks_uri}}) {
        if (value->empty()) {
            return R::error(ErrorCategory::PROVIDER_ERROR,
                std::string("discovery document missing ") + field);
        }
    }

    if (!expected_issuer.empty() &&
        strip_trailing_slashes(cfg.issuer) != normalize_issuer_url(expected_issuer)) {
        return R::error(ErrorCategory::PROVIDER_ERROR,
            "issuer mismatch: expected " + normalize_issuer_url(expected_issuer) +
            ", got " + cfg.issuer);
    }

    return R::ok(std::move(cfg));
}

Result<std::vector<JsonWebKey>> parse_jwks(const std::string& body) {
    using R = Result<std::vector<JsonWebKey>>;

    JsonValue doc;
    try {
        doc = JsonValue::parse(body);
    } catch (const JsonValue::parse_error&) {
        return R::error(ErrorCategory::PROVIDER_ERROR, "JWKS is not valid JSON");
    }
    if (!doc["keys"].is_array()) {
        return R::error(ErrorCategory::PROVIDER_ERROR, "JWKS has no keys array");
    }

    std::vector<JsonWebKey> keys;
    for (const auto& k : doc.elements("keys")) {
        if (!k.is_object()) continue;

        JsonWebKey key;
        key.kid = k.value("kid", std::string{});
        key.kty = k.value("kty", std::string{});
        key.alg = k.value("alg", std::string{});
        key.use = k.value("use", std::string{});
        key.n   = k.value("n",   std::string{});
        key.e   = k.value("e",   std::string{});
        key.crv = k.value("crv", std::string{});
        key.x   = k.value("x",   std::string{});
        key.y   = k.value("y",   std::string{});

        if (key.use == "enc") continue;
        if (key.kid.empty() || key.kty.empty()) continue;
        keys.push_back(std::move(key));
    }
    return R::ok(std::move(keys));
}

// ============================================================================
// ProviderConfigFetcher
// ============================================================================

ProviderConfigFetcher::ProviderConfigFetcher(std::shared_ptr<IHttpTransport> transport)
    : transport_(std::move(transport)) {}

Result<ProviderConfig> ProviderConfigFetcher::fetch(const std::string& issuer_url) const {
    using R = Result<ProviderConfig>;

    const std::string url = discovery_document_url(issuer_url);
    auto discovery = transport_->get(url);
    if (discovery.is_error()) return R::error_from(discovery);
    if (discovery.value().status != 200) {
        return R::error(ErrorCategory::PROVIDER_ERROR,
            "discovery endpoint " + url + " returned HTTP " +
            std::to_string(discovery.value().status));
    }

    auto cfg = parse_provider_config(discovery.value().body, issuer_url);
    if (cfg.is_error()) return cfg;

    auto jwks = transport_->get(cfg.value().jwks_uri);
    if (jwks.is_error()) return R::error_from(jwks);
    if (jwks.value().status != 200) {
        return R::error(ErrorCategory::PROVIDER_ERROR,
            "JWKS endpoint " + cfg.value().jwks_uri + " returned HTTP " +
            std::to_string(jwks.value().status));
    }

    auto keys = parse_jwks(jwks.value().body);
    if (keys.is_error()) return R::error_from(keys);
    cfg.value().signing_keys = std::move(keys.value());

    if (const auto max_age = parse_max_age(discovery.value().header("cache-control"))) {
        cfg.value().expires_at = utils::now() + *max_age;
    }

    utils::log::debug("Fetched provider config for " + cfg.value().issuer + " (" +
                      std::to_string(cfg.value().signing_keys.size()) + " signing keys)");
    return cfg;
}

} // namespace keygate
