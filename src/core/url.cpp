#include "core/url.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <charconv>

namespace keygate {

bool Url::is_plaintext() const {
    return scheme == "http" || scheme == "ws";
}

uint16_t Url::effective_port() const {
    if (port != 0) return port;
    return is_plaintext() ? 80 : 443;
}

std::string Url::dial_address() const {
    return host + ":" + std::to_string(effective_port());
}

std::string Url::bare_host() const {
    if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
        return host.substr(1, host.size() - 2);
    }
    return host;
}

std::string Url::http_origin() const {
    if (scheme == "ws" || scheme == "wss") {
        Url http = *this;
        http.scheme = scheme == "ws" ? "http" : "https";
        return http.origin();
    }
    return origin();
}

bool Url::is_web_scheme() const {
    return scheme == "http" || scheme == "https" || scheme == "ws" || scheme == "wss";
}

std::string Url::origin() const {
    std::string out = scheme + "://" + host;
    if (port != 0) {
        out += ':';
        out += std::to_string(port);
    }
    return out;
}

std::optional<Url> parse_url(std::string_view text) {
    const auto scheme_end = text.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) return std::nullopt;

    Url url;
    url.scheme = utils::to_lower(text.substr(0, scheme_end));

    const std::string_view rest = text.substr(scheme_end + 3);
    const auto target_pos = rest.find_first_of("/?#");
    std::string_view authority = rest.substr(0, target_pos);
    if (target_pos != std::string_view::npos) {
        std::string_view target = rest.substr(target_pos);
        if (const auto frag = target.find('#'); frag != std::string_view::npos) {
            target = target.substr(0, frag);
        }
        url.target = (!target.empty() && target.front() == '/')
            ? std::string(target)
            : "/" + std::string(target);
    }

    // Drop userinfo
    if (const auto at = authority.rfind('@'); at != std::string_view::npos) {
        authority = authority.substr(at + 1);
    }

    std::string_view port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) return std::nullopt;
        url.host = std::string(authority.substr(0, close + 1));
        const std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') return std::nullopt;
            port_text = after.substr(1);
        }
    } else {
        const auto colon = authority.rfind(':');
        url.host = std::string(authority.substr(0, colon));
        if (colon != std::string_view::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) return std::nullopt;

    if (!port_text.empty()) {
        unsigned int port = 0;
        const auto [ptr, ec] = std::from_chars(port_text.data(),
                                               port_text.data() + port_text.size(), port);
        if (ec != std::errc{} || ptr != port_text.data() + port_text.size() ||
            port == 0 || port > 65535) {
            return std::nullopt;
        }
        url.port = static_cast<uint16_t>(port);
    }

    return url;
}

std::string url_encode(std::string_view value) {
    static constexpr char kHex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (const char ch : value) {
        const auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += ch;
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string url_decode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '+') {
            out += ' ';
        } else if (value[i] == '%' && i + 2 < value.size()) {
            std::string decoded;
            if (utils::hex_to_bytes(value.substr(i + 1, 2), decoded)) {
                out += decoded;
                i += 2;
            } else {
                out += value[i];
            }
        } else {
            out += value[i];
        }
    }
    return out;
}

std::unordered_map<std::string, std::string> parse_query(std::string_view query) {
    std::unordered_map<std::string, std::string> params;
    if (!query.empty() && query.front() == '?') query.remove_prefix(1);

    while (!query.empty()) {
        const auto amp = query.find('&');
        const std::string_view pair = query.substr(0, amp);
        if (!pair.empty()) {
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                params[url_decode(pair)] = "";
            } else {
                params[url_decode(pair.substr(0, eq))] = url_decode(pair.substr(eq + 1));
            }
        }
        if (amp == std::string_view::npos) break;
        query.remove_prefix(amp + 1);
    }
    return params;
}

} // namespace keygate
