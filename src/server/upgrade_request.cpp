#include "server/upgrade_request.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace keygate {

namespace {

bool is_token_char(char c) {
    // RFC 9110 tchar
    return std::isalnum(static_cast<unsigned char>(c)) ||
           std::string_view("!#$%&'*+-.^_`|~").find(c) != std::string_view::npos;
}

} // anonymous namespace

std::string UpgradeRequest::header(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (utils::iequals(key, name)) return value;
    }
    return {};
}

bool UpgradeRequest::has_header(std::string_view name) const {
    return std::any_of(headers.begin(), headers.end(), [name](const auto& h) {
        return utils::iequals(h.first, name);
    });
}

void UpgradeRequest::set_header(std::string_view name, std::string value) {
    remove_header(name);
    headers.emplace_back(std::string(name), std::move(value));
}

void UpgradeRequest::remove_header(std::string_view name) {
    headers.erase(std::remove_if(headers.begin(), headers.end(), [name](const auto& h) {
        return utils::iequals(h.first, name);
    }), headers.end());
}

bool UpgradeRequest::is_upgrade() const {
    return !utils::trim(header("Upgrade")).empty();
}

std::optional<std::string> UpgradeRequest::cookie(std::string_view name) const {
    for (const auto& [key, value] : headers) {
        if (!utils::iequals(key, "Cookie")) continue;
        for (const auto& pair : utils::split(value, ';')) {
            const std::string entry = utils::trim(pair);
            const auto eq = entry.find('=');
            if (eq == std::string::npos) continue;
            if (utils::trim(entry.substr(0, eq)) != name) continue;
            std::string v = utils::trim(entry.substr(eq + 1));
            if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
                v = v.substr(1, v.size() - 2);
            }
            return v;
        }
    }
    return std::nullopt;
}

std::string UpgradeRequest::path() const {
    const auto q = target.find('?');
    return q == std::string::npos ? target : target.substr(0, q);
}

std::string UpgradeRequest::query() const {
    const auto q = target.find('?');
    return q == std::string::npos ? std::string{} : target.substr(q + 1);
}

size_t UpgradeRequest::content_length() const {
    const std::string value = utils::trim(header("Content-Length"));
    size_t len = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), len);
    if (ec != std::errc{} || ptr != value.data() + value.size()) return 0;
    return len;
}

std::string UpgradeRequest::serialize() const {
    std::string out;
    out.reserve(256);
    out += method;
    out += ' ';
    out += target;
    out += ' ';
    out += version;
    out += "\r\n";
    for (const auto& [key, value] : headers) {
        out += key;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += "\r\n";
    return out;
}

std::optional<UpgradeRequest> UpgradeRequest::parse(std::string_view head) {
    UpgradeRequest req;

    size_t pos = head.find("\r\n");
    if (pos == std::string_view::npos) return std::nullopt;

    // Request line: METHOD SP target SP version
    const std::string_view line = head.substr(0, pos);
    const auto sp1 = line.find(' ');
    const auto sp2 = line.rfind(' ');
    if (sp1 == std::string_view::npos || sp1 == sp2) return std::nullopt;

    req.method = std::string(line.substr(0, sp1));
    req.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
    req.version = std::string(line.substr(sp2 + 1));
    if (req.method.empty() || req.target.empty() ||
        !std::all_of(req.method.begin(), req.method.end(), is_token_char) ||
        req.version.rfind("HTTP/1.", 0) != 0) {
        return std::nullopt;
    }

    pos += 2;
    while (pos < head.size()) {
        const auto eol = head.find("\r\n", pos);
        if (eol == std::string_view::npos) return std::nullopt;
        if (eol == pos) break;  // Blank line ends the head

        const std::string_view field = head.substr(pos, eol - pos);
        const auto colon = field.find(':');
        if (colon == std::string_view::npos || colon == 0) return std::nullopt;
        const std::string_view name = field.substr(0, colon);
        if (!std::all_of(name.begin(), name.end(), is_token_char)) return std::nullopt;

        req.headers.emplace_back(std::string(name), utils::trim(field.substr(colon + 1)));
        pos = eol + 2;
    }

    return req;
}

size_t find_head_end(std::string_view buffer) {
    const auto pos = buffer.find("\r\n\r\n");
    return pos == std::string_view::npos ? std::string_view::npos : pos + 4;
}

} // namespace keygate
