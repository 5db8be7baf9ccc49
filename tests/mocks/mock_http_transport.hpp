#pragma once

#include "auth/http_transport.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <string>

namespace keygate::testing {

/**
 * @brief Scripted IHttpTransport for provider and token endpoint tests
 *
 * Responses are keyed by exact URL. Unscripted URLs answer 404. While
 * failing, every call returns PROVIDER_ERROR as an unreachable server would.
 * fail_first(n) makes only the first n calls fail.
 */
class MockHttpTransport : public IHttpTransport {
public:
    void set_response(const std::string& url, int status, std::string body,
                      std::unordered_map<std::string, std::string> headers = {}) {
        std::lock_guard lock(mutex_);
        HttpResponse response;
        response.status = status;
        response.body = std::move(body);
        response.headers = std::move(headers);
        responses_[url] = std::move(response);
    }

    void set_failing(bool failing) { failing_.store(failing); }

    void fail_first(uint64_t calls) { fail_first_.store(calls); }

    [[nodiscard]] Result<HttpResponse> get(const std::string& url) override {
        get_count_.fetch_add(1, std::memory_order_relaxed);
        return respond(url);
    }

    [[nodiscard]] Result<HttpResponse> post_form(
        const std::string& url,
        const FormParams& form,
        const std::string& basic_user,
        const std::string& basic_password) override {
        post_count_.fetch_add(1, std::memory_order_relaxed);
        {
            std::lock_guard lock(mutex_);
            last_form_ = form;
            last_user_ = basic_user;
            last_password_ = basic_password;
        }
        return respond(url);
    }

    [[nodiscard]] uint64_t get_count() const { return get_count_.load(); }
    [[nodiscard]] uint64_t post_count() const { return post_count_.load(); }

    [[nodiscard]] std::string last_form_value(const std::string& key) const {
        std::lock_guard lock(mutex_);
        for (const auto& [k, v] : last_form_) {
            if (k == key) return v;
        }
        return {};
    }

    [[nodiscard]] std::string last_user() const {
        std::lock_guard lock(mutex_);
        return last_user_;
    }

    [[nodiscard]] std::string last_password() const {
        std::lock_guard lock(mutex_);
        return last_password_;
    }

private:
    Result<HttpResponse> respond(const std::string& url) {
        const uint64_t call = calls_.fetch_add(1);
        if (failing_.load() || call < fail_first_.load()) {
            return Result<HttpResponse>::error(ErrorCategory::PROVIDER_ERROR,
                                               "connection refused: " + url);
        }
        std::lock_guard lock(mutex_);
        const auto it = responses_.find(url);
        if (it == responses_.end()) {
            HttpResponse not_found;
            not_found.status = 404;
            return Result<HttpResponse>::ok(std::move(not_found));
        }
        return Result<HttpResponse>::ok(it->second);
    }

    mutable std::mutex mutex_;
    std::map<std::string, HttpResponse> responses_;
    FormParams last_form_;
    std::string last_user_;
    std::string last_password_;

    std::atomic<bool> failing_{false};
    std::atomic<uint64_t> fail_first_{0};
    std::atomic<uint64_t> calls_{0};
    std::atomic<uint64_t> get_count_{0};
    std::atomic<uint64_t> post_count_{0};
};

// Discovery document for an issuer whose endpoints live under it
inline std::string discovery_json(const std::string& issuer) {
    return R"({"issuer":")" + issuer + R"(",)"
           R"("authorization_endpoint":")" + issuer + R"(/auth",)"
           R"("token_endpoint":")" + issuer + R"(/token",)"
           R"("userinfo_endpoint":")" + issuer + R"(/userinfo",)"
           R"("jwks_uri":")" + issuer + R"(/certs",)"
           R"("scopes_supported":["openid","email","profile"],)"
           R"("response_types_supported":["code"],)"
           R"("id_token_signing_alg_values_supported":["RS256"]})";
}

inline std::string jwks_json() {
    return R"({"keys":[)"
           R"({"kid":"sig-1","kty":"RSA","alg":"RS256","use":"sig","n":"0vx7","e":"AQAB"},)"
           R"({"kid":"enc-1","kty":"RSA","use":"enc","n":"abcd","e":"AQAB"}]})";
}

// Script a healthy provider at `issuer`
inline void script_provider(MockHttpTransport& transport, const std::string& issuer,
                            std::unordered_map<std::string, std::string> discovery_headers = {}) {
    transport.set_response(issuer + "/.well-known/openid-configuration", 200,
                           discovery_json(issuer), std::move(discovery_headers));
    transport.set_response(issuer + "/certs", 200, jwks_json());
}

} // namespace keygate::testing
