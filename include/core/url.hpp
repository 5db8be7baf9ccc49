#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace keygate {

/**
 * @brief Absolute URL split into the parts keygate needs for dialing
 *
 * "https://idp.example.com:8443/realms/x?y=1" →
 *   scheme "https", host "idp.example.com", port 8443, target "/realms/x?y=1"
 * IPv6 literals keep their brackets in host ("[::1]").
 */
struct Url {
    std::string scheme;         // Lower-cased
    std::string host;
    uint16_t port = 0;          // 0 when the URL names no explicit port
    std::string target = "/";   // Path + query, always starts with '/'

    [[nodiscard]] bool has_explicit_port() const { return port != 0; }

    // True for schemes dialed as plaintext TCP ("http", "ws")
    [[nodiscard]] bool is_plaintext() const;

    // Explicit port, else 80 for plaintext schemes and 443 otherwise
    [[nodiscard]] uint16_t effective_port() const;

    // "host:port" with the effective port filled in
    [[nodiscard]] std::string dial_address() const;

    // Host without IPv6 brackets, for getaddrinfo / SNI
    [[nodiscard]] std::string bare_host() const;

    // scheme://host[:port] (no target)
    [[nodiscard]] std::string origin() const;

    // origin() with ws/wss spelled http/https, for plain HTTP clients
    [[nodiscard]] std::string http_origin() const;

    // One of http, https, ws, wss
    [[nodiscard]] bool is_web_scheme() const;
};

/**
 * @brief Parse an absolute http(s)/ws(s) URL
 * @return std::nullopt when there is no "scheme://" prefix, the host is empty
 *         or the port is not a number in 1..65535
 */
[[nodiscard]] std::optional<Url> parse_url(std::string_view text);

// Percent-encode for a query component (RFC 3986 unreserved set kept as-is)
[[nodiscard]] std::string url_encode(std::string_view value);

// Percent-decode; '+' becomes a space. Malformed escapes are copied through.
[[nodiscard]] std::string url_decode(std::string_view value);

// Parse "a=1&b=two" (leading '?' tolerated); values are url-decoded
[[nodiscard]] std::unordered_map<std::string, std::string> parse_query(std::string_view query);

} // namespace keygate
