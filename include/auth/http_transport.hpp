#pragma once

#include "core/error.hpp"

#include <chrono>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace keygate {

struct HttpResponse {
    int status = 0;
    std::string body;
    std::unordered_map<std::string, std::string> headers;  // Lower-cased names

    [[nodiscard]] std::string header(const std::string& lower_name) const {
        const auto it = headers.find(lower_name);
        return it != headers.end() ? it->second : std::string{};
    }
};

using FormParams = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Outbound HTTP used to talk to the identity provider
 *
 * Failures to reach the server come back as PROVIDER_ERROR; any HTTP status
 * is a successful transport result and left for the caller to judge.
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;

    [[nodiscard]] virtual Result<HttpResponse> get(const std::string& url) = 0;

    // application/x-www-form-urlencoded POST with HTTP Basic credentials
    [[nodiscard]] virtual Result<HttpResponse> post_form(
        const std::string& url,
        const FormParams& form,
        const std::string& basic_user,
        const std::string& basic_password) = 0;
};

/**
 * @brief cpp-httplib backed transport
 *
 * One short-lived httplib::Client per call, so the transport itself holds no
 * sockets and can be shared between the bootstrap thread, the sync thread
 * and request threads.
 */
class HttpTransport : public IHttpTransport {
public:
    struct Config {
        bool skip_tls_verify = false;
        std::chrono::seconds request_timeout{10};
        std::string ca_file;  // Empty = system trust store
    };

    HttpTransport();
    explicit HttpTransport(Config config);

    [[nodiscard]] Result<HttpResponse> get(const std::string& url) override;

    [[nodiscard]] Result<HttpResponse> post_form(
        const std::string& url,
        const FormParams& form,
        const std::string& basic_user,
        const std::string& basic_password) override;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace keygate
