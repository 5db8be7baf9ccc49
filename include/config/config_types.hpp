#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace keygate {

// ============================================================================
// Server Config
// ============================================================================

struct TlsConfig {
    bool enabled = false;
    std::string cert_file;
    std::string key_file;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    uint16_t port = 3000;
    uint32_t max_connections = 1024;
    size_t max_header_bytes = 64 * 1024;
    std::chrono::milliseconds read_timeout{30000};
    TlsConfig tls;
};

// ============================================================================
// Upstream Config
// ============================================================================

struct UpstreamConfig {
    std::string url;
    bool verify_tls = true;
    std::string ca_file;
    std::chrono::milliseconds connect_timeout{10000};
};

// ============================================================================
// OIDC Config
// ============================================================================

struct OidcConfig {
    std::string discovery_url;
    std::string client_id;
    std::string client_secret;
    std::string redirection_url;
    std::vector<std::string> scopes;
    bool skip_tls_verify = false;
    std::chrono::seconds bootstrap_timeout{30};
    std::chrono::milliseconds retry_interval{3000};
    double retry_multiplier = 1.0;
    std::chrono::milliseconds retry_max_interval{30000};
    std::chrono::seconds request_timeout{10};
};

// ============================================================================
// Session Config
// ============================================================================

struct SessionConfig {
    std::string encryption_key;     // 16, 24 or 32 bytes
    std::string cookie_name = "kc-state";
    std::chrono::seconds lifetime{3600};
    bool secure_cookie = true;
};

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Top-level Config
// ============================================================================

struct ProxyConfig {
    ServerConfig server;
    UpstreamConfig upstream;
    OidcConfig oidc;
    SessionConfig session;
    LoggingConfig logging;
};

} // namespace keygate
