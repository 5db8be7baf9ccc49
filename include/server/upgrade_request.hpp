#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace keygate {

/**
 * @brief Parsed HTTP/1.x request head
 *
 * Header order and spelling are preserved so the head can be written to the
 * upstream as received. Lookups are case-insensitive.
 */
struct UpgradeRequest {
    std::string method;
    std::string target;                 // Origin-form, e.g. "/socket?x=1"
    std::string version = "HTTP/1.1";
    std::vector<std::pair<std::string, std::string>> headers;

    // First value of `name`, empty if absent
    [[nodiscard]] std::string header(std::string_view name) const;
    [[nodiscard]] bool has_header(std::string_view name) const;

    // Replace every `name` header with one value, appended if absent
    void set_header(std::string_view name, std::string value);
    void remove_header(std::string_view name);

    // Non-empty Upgrade header
    [[nodiscard]] bool is_upgrade() const;

    // Value of cookie `name` from the Cookie header(s)
    [[nodiscard]] std::optional<std::string> cookie(std::string_view name) const;

    [[nodiscard]] std::string path() const;
    [[nodiscard]] std::string query() const;

    // Content-Length, 0 when absent or malformed
    [[nodiscard]] size_t content_length() const;

    // Request line + headers + blank line, CRLF-terminated
    [[nodiscard]] std::string serialize() const;

    /**
     * @brief Parse a request head (up to and including the blank line)
     * @return std::nullopt for a malformed request line or header
     */
    [[nodiscard]] static std::optional<UpgradeRequest> parse(std::string_view head);
};

// Offset just past "\r\n\r\n" in `buffer`, or npos
[[nodiscard]] size_t find_head_end(std::string_view buffer);

} // namespace keygate
