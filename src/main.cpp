#include "auth/provider_bootstrap.hpp"
#include "config/config_loader.hpp"
#include "core/utils.hpp"
#include "security/session_codec.hpp"
#include "security/trust_store.hpp"
#include "server/proxy_server.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

using namespace keygate;

namespace {

std::atomic<int> g_signal{0};

void signal_handler(int signal) {
    g_signal.store(signal);
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        utils::log::info("keygate starting...");

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGPIPE, SIG_IGN);

        std::string config_file = "config/keygate.toml";
        if (argc > 1) {
            config_file = argv[1];
        }

        // =====================================================================
        // [1/5] Configuration
        // =====================================================================
        utils::log::info("[1/5] Loading configuration from " + config_file);
        auto config_result = ConfigLoader::load_from_file(config_file);
        if (!config_result.success) {
            utils::log::error(config_result.error_message);
            return 1;
        }
        const ProxyConfig& cfg = config_result.config;
        utils::log::set_level(utils::log::parse_level(cfg.logging.level));

        // =====================================================================
        // [2/5] TLS identity
        // =====================================================================
        std::shared_ptr<SSL_CTX> tls_context;
        if (cfg.server.tls.enabled) {
            utils::log::info("[2/5] Loading TLS identity from " + cfg.server.tls.cert_file);
            auto identity = load_certificate(cfg.server.tls.cert_file, cfg.server.tls.key_file);
            if (identity.is_error()) {
                utils::log::error(std::string("TLS identity: ") +
                                  error_category_name(identity.error_category()) + ": " +
                                  identity.error_message());
                return 1;
            }
            tls_context = identity.value().make_server_context();
            const auto renew_in = refresh_within(identity.value().not_after(), 0.8);
            utils::log::info("TLS identity " + identity.value().subject() + ", renew within " +
                             std::to_string(renew_in.count() / 3600) + "h");
        } else {
            utils::log::info("[2/5] TLS termination disabled");
        }

        // =====================================================================
        // [3/5] Session codec
        // =====================================================================
        utils::log::info("[3/5] Session codec");
        auto codec = SessionCodec::create(cfg.session.encryption_key);
        if (codec.is_error()) {
            utils::log::error("Session codec: " + codec.error_message());
            return 1;
        }

        // =====================================================================
        // [4/5] Identity provider
        // =====================================================================
        utils::log::info("[4/5] Discovering identity provider " + cfg.oidc.discovery_url);
        BootstrapOptions options;
        options.discovery_url = cfg.oidc.discovery_url;
        options.client_id = cfg.oidc.client_id;
        options.client_secret = cfg.oidc.client_secret;
        options.redirection_url = cfg.oidc.redirection_url;
        options.scopes = cfg.oidc.scopes;
        options.skip_tls_verify = cfg.oidc.skip_tls_verify;
        options.timeout = cfg.oidc.bootstrap_timeout;
        options.retry.interval = cfg.oidc.retry_interval;
        options.retry.multiplier = cfg.oidc.retry_multiplier;
        options.retry.max_interval = cfg.oidc.retry_max_interval;
        options.request_timeout = cfg.oidc.request_timeout;

        auto provider = bootstrap(options);
        if (provider.is_error()) {
            utils::log::error("Identity provider: " + provider.error_message());
            return 1;
        }
        auto& bootstrapped = provider.value();

        // =====================================================================
        // [5/5] Proxy server
        // =====================================================================
        utils::log::info("[5/5] Starting proxy");
        ProxyServer server(cfg.server, cfg.upstream, cfg.session,
                           std::move(codec.value()), bootstrapped.client, tls_context);
        server.start();

        while (g_signal.load() == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds{200});
        }

        utils::log::info("Received signal " + std::to_string(g_signal.load()) +
                         ", shutting down...");
        server.stop();
        if (bootstrapped.sync) {
            bootstrapped.sync->stop();
        }

    } catch (const std::exception& e) {
        utils::log::error(std::string("Fatal: ") + e.what());
        return 1;
    }

    return 0;
}
