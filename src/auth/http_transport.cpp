#include "auth/http_transport.hpp"
#include "core/url.hpp"
#include "core/utils.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <exception>

namespace keygate {

namespace {

using R = Result<HttpResponse>;

HttpResponse to_response(const httplib::Response& res) {
    HttpResponse out;
    out.status = res.status;
    out.body = res.body;
    for (const auto& [name, value] : res.headers) {
        // First occurrence wins
        out.headers.emplace(utils::to_lower(name), value);
    }
    return out;
}

void configure(httplib::Client& client, const HttpTransport::Config& config) {
    const auto timeout = static_cast<time_t>(config.request_timeout.count());
    client.set_connection_timeout(timeout, 0);
    client.set_read_timeout(timeout, 0);
    client.set_write_timeout(timeout, 0);
    client.enable_server_certificate_verification(!config.skip_tls_verify);
    if (!config.ca_file.empty()) {
        client.set_ca_cert_path(config.ca_file);
    }
}

} // anonymous namespace

HttpTransport::HttpTransport() : HttpTransport(Config{}) {}

HttpTransport::HttpTransport(Config config)
    : config_(std::move(config)) {}

Result<HttpResponse> HttpTransport::get(const std::string& url) {
    const auto parsed = parse_url(url);
    if (!parsed) {
        return R::error(ErrorCategory::PROVIDER_ERROR, "invalid URL: " + url);
    }

    try {
        httplib::Client client(parsed->origin());
        configure(client, config_);

        httplib::Headers headers{{"Accept", "application/json"}};
        auto res = client.Get(parsed->target, headers);
        if (!res) {
            return R::error(ErrorCategory::PROVIDER_ERROR,
                "GET " + url + " failed: " + httplib::to_string(res.error()));
        }
        return R::ok(to_response(*res));
    } catch (const std::exception& e) {
        return R::error(ErrorCategory::PROVIDER_ERROR,
            "GET " + url + " failed: " + e.what());
    }
}

Result<HttpResponse> HttpTransport::post_form(const std::string& url,
                                              const FormParams& form,
                                              const std::string& basic_user,
                                              const std::string& basic_password) {
    const auto parsed = parse_url(url);
    if (!parsed) {
        return R::error(ErrorCategory::PROVIDER_ERROR, "invalid URL: " + url);
    }

    try {
        httplib::Client client(parsed->origin());
        configure(client, config_);
        if (!basic_user.empty()) {
            client.set_basic_auth(basic_user, basic_password);
        }

        httplib::Params params;
        for (const auto& [key, value] : form) {
            params.emplace(key, value);
        }

        httplib::Headers headers{{"Accept", "application/json"}};
        auto res = client.Post(parsed->target, headers, params);
        if (!res) {
            return R::error(ErrorCategory::PROVIDER_ERROR,
                "POST " + url + " failed: " + httplib::to_string(res.error()));
        }
        return R::ok(to_response(*res));
    } catch (const std::exception& e) {
        return R::error(ErrorCategory::PROVIDER_ERROR,
            "POST " + url + " failed: " + e.what());
    }
}

} // namespace keygate
