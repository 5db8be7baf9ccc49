#include "config/config_loader.hpp"
#include "core/json.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"
#include "security/session_codec.hpp"

#include <toml++/toml.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std::string_literals;

namespace keygate {

// ============================================================================
// Parsing Helpers (env expansion, JSON → TOML tree)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    "Unclosed env var substitution at position " + std::to_string(i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// JSON numbers are doubles; whole values become TOML integers so that
// integer keys read the same from either format
toml::array json_to_array(const glz::json_t::array_t& arr);

toml::table json_to_table(const glz::json_t::object_t& obj) {
    toml::table tbl;
    for (const auto& [key, val] : obj) {
        if (val.is_string()) {
            tbl.insert(key, val.get<std::string>());
        } else if (val.is_boolean()) {
            tbl.insert(key, val.get<bool>());
        } else if (val.is_number()) {
            const double d = val.get<double>();
            if (std::floor(d) == d && std::fabs(d) < 9.0e15) {
                tbl.insert(key, static_cast<int64_t>(d));
            } else {
                tbl.insert(key, d);
            }
        } else if (val.is_object()) {
            tbl.insert(key, json_to_table(val.get_object()));
        } else if (val.is_array()) {
            tbl.insert(key, json_to_array(val.get_array()));
        }
    }
    return tbl;
}

toml::array json_to_array(const glz::json_t::array_t& arr) {
    toml::array out;
    for (const auto& val : arr) {
        if (val.is_string()) {
            out.push_back(val.get<std::string>());
        } else if (val.is_boolean()) {
            out.push_back(val.get<bool>());
        } else if (val.is_number()) {
            out.push_back(val.get<double>());
        } else if (val.is_object()) {
            out.push_back(json_to_table(val.get_object()));
        } else if (val.is_array()) {
            out.push_back(json_to_array(val.get_array()));
        }
    }
    return out;
}

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

std::chrono::milliseconds seconds_value(const toml::table& tbl, std::string_view key,
                                        std::chrono::milliseconds fallback) {
    const double fallback_seconds = static_cast<double>(fallback.count()) / 1000.0;
    const double seconds = tbl[key].value_or(fallback_seconds);
    return std::chrono::milliseconds{static_cast<int64_t>(seconds * 1000.0)};
}

// ---- Section extractors ----------------------------------------------------

ServerConfig extract_server(const toml::table& root) {
    ServerConfig cfg;
    const auto* server = root["server"].as_table();
    if (!server) return cfg;
    const auto& s = *server;

    cfg.host = s["host"].value_or(cfg.host);
    // Out-of-range ports become 0 so validation reports them
    const int64_t port = s["port"].value_or(int64_t{cfg.port});
    cfg.port = (port > 0 && port <= 65535) ? static_cast<uint16_t>(port) : 0;
    cfg.max_connections = static_cast<uint32_t>(s["max_connections"].value_or(int64_t{cfg.max_connections}));
    cfg.max_header_bytes = static_cast<size_t>(s["max_header_bytes"].value_or(static_cast<int64_t>(cfg.max_header_bytes)));
    cfg.read_timeout = seconds_value(s, "read_timeout_seconds", cfg.read_timeout);

    if (const auto* tls = s["tls"].as_table()) {
        cfg.tls.cert_file = (*tls)["cert_file"].value_or(""s);
        cfg.tls.key_file = (*tls)["key_file"].value_or(""s);
        cfg.tls.enabled = (*tls)["enabled"].value_or(!cfg.tls.cert_file.empty());
    }
    return cfg;
}

UpstreamConfig extract_upstream(const toml::table& root) {
    UpstreamConfig cfg;
    const auto* upstream = root["upstream"].as_table();
    if (!upstream) return cfg;
    const auto& u = *upstream;

    cfg.url = u["url"].value_or(""s);
    cfg.verify_tls = u["verify_tls"].value_or(true);
    cfg.ca_file = u["ca_file"].value_or(""s);
    cfg.connect_timeout = seconds_value(u, "connect_timeout_seconds", cfg.connect_timeout);
    return cfg;
}

OidcConfig extract_oidc(const toml::table& root) {
    OidcConfig cfg;
    const auto* oidc = root["oidc"].as_table();
    if (!oidc) return cfg;
    const auto& o = *oidc;

    cfg.discovery_url = o["discovery_url"].value_or(""s);
    cfg.client_id = o["client_id"].value_or(""s);
    cfg.client_secret = o["client_secret"].value_or(""s);
    cfg.redirection_url = o["redirection_url"].value_or(""s);
    cfg.scopes = toml_string_array(o, "scopes");
    cfg.skip_tls_verify = o["skip_tls_verify"].value_or(false);
    cfg.bootstrap_timeout = std::chrono::seconds{
        o["bootstrap_timeout_seconds"].value_or(int64_t{cfg.bootstrap_timeout.count()})};
    cfg.retry_interval = seconds_value(o, "retry_interval_seconds", cfg.retry_interval);
    cfg.retry_multiplier = o["retry_multiplier"].value_or(cfg.retry_multiplier);
    cfg.retry_max_interval = seconds_value(o, "retry_max_interval_seconds", cfg.retry_max_interval);
    cfg.request_timeout = std::chrono::seconds{
        o["request_timeout_seconds"].value_or(int64_t{cfg.request_timeout.count()})};
    return cfg;
}

SessionConfig extract_session(const toml::table& root) {
    SessionConfig cfg;
    const auto* session = root["session"].as_table();
    if (!session) return cfg;
    const auto& s = *session;

    cfg.encryption_key = s["encryption_key"].value_or(""s);
    cfg.cookie_name = s["cookie_name"].value_or(cfg.cookie_name);
    cfg.lifetime = std::chrono::seconds{
        s["lifetime_seconds"].value_or(int64_t{cfg.lifetime.count()})};
    cfg.secure_cookie = s["secure_cookie"].value_or(true);
    return cfg;
}

LoggingConfig extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or(cfg.level);
    return cfg;
}

ProxyConfig extract_all_sections(const toml::table& root) {
    ProxyConfig config;
    config.server = extract_server(root);
    config.upstream = extract_upstream(root);
    config.oidc = extract_oidc(root);
    config.session = extract_session(root);
    config.logging = extract_logging(root);
    return config;
}

ConfigLoader::LoadResult validate_and_return(ProxyConfig config) {
    const auto errors = ConfigLoader::validate_config(config);
    if (errors.empty()) {
        return ConfigLoader::LoadResult::ok(std::move(config));
    }
    std::string message = "Invalid config:";
    for (const auto& e : errors) {
        message += "\n  - " + e;
    }
    return ConfigLoader::LoadResult::error(std::move(message));
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream in(path, std::ios::binary);
    if (!in) return false;
    std::ostringstream ss;
    ss << in.rdbuf();
    out = ss.str();
    return true;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    const std::string extension =
        utils::to_lower(std::filesystem::path(config_path).extension().string());
    if (extension == ".json") {
        std::string content;
        if (!read_file(config_path, content)) {
            return LoadResult::error("Failed to load config: cannot read " + config_path);
        }
        return load_from_json(content);
    }

    try {
        auto tbl = toml::parse_file(config_path);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::string("Failed to load config: ") + e.what());
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::string("Failed to parse config: ") + e.what());
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_json(const std::string& json_content) {
    try {
        const JsonValue doc = JsonValue::parse(json_content);
        if (!doc.is_object()) {
            return LoadResult::error("Failed to parse config: top level must be a JSON object");
        }
        auto tbl = json_to_table(doc.raw().get_object());
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::string("Failed to parse config: ") + e.what());
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ProxyConfig& config) {
    std::vector<std::string> errors;

    if (config.server.port == 0) {
        errors.push_back("server.port must be 1-65535");
    }
    if (config.server.max_connections == 0) {
        errors.push_back("server.max_connections must be positive");
    }
    if (config.server.tls.enabled) {
        if (config.server.tls.cert_file.empty()) {
            errors.push_back("server.tls.cert_file required when TLS is enabled");
        }
        if (config.server.tls.key_file.empty()) {
            errors.push_back("server.tls.key_file required when TLS is enabled");
        }
    }

    if (const auto upstream = parse_url(config.upstream.url); !upstream) {
        errors.push_back("upstream.url must be an absolute URL, got '" + config.upstream.url + "'");
    } else if (!upstream->is_web_scheme()) {
        errors.push_back("upstream.url scheme must be http, https, ws or wss, got '" +
                         upstream->scheme + "'");
    }

    if (!parse_url(config.oidc.discovery_url)) {
        errors.push_back("oidc.discovery_url must be an absolute URL");
    }
    if (config.oidc.client_id.empty()) {
        errors.push_back("oidc.client_id must not be empty");
    }
    if (!parse_url(config.oidc.redirection_url)) {
        errors.push_back("oidc.redirection_url must be an absolute URL");
    }
    if (config.oidc.bootstrap_timeout.count() <= 0) {
        errors.push_back("oidc.bootstrap_timeout_seconds must be positive");
    }
    if (config.oidc.retry_interval.count() <= 0) {
        errors.push_back("oidc.retry_interval_seconds must be positive");
    }
    if (config.oidc.retry_multiplier < 1.0) {
        errors.push_back("oidc.retry_multiplier must be >= 1.0");
    }

    // Never echo the key itself
    if (!SessionCodec::is_supported_key_length(config.session.encryption_key.size())) {
        errors.push_back("session.encryption_key must be 16, 24 or 32 bytes, got " +
                         std::to_string(config.session.encryption_key.size()));
    }
    if (config.session.cookie_name.empty()) {
        errors.push_back("session.cookie_name must not be empty");
    }
    if (config.session.lifetime.count() <= 0) {
        errors.push_back("session.lifetime_seconds must be positive");
    }

    return errors;
}

} // namespace keygate
