#pragma once

#include "auth/identity_client.hpp"
#include "auth/session_state.hpp"
#include "config/config_types.hpp"
#include "core/url.hpp"
#include "security/session_codec.hpp"
#include "server/client_transport.hpp"
#include "server/session_cache.hpp"
#include "server/upgrade_request.hpp"
#include "server/upgrade_tunnel.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

typedef struct ssl_ctx_st SSL_CTX;

namespace keygate {

/**
 * @brief Authenticating reverse proxy front end
 *
 * One thread per accepted connection, one request per connection
 * (responses carry Connection: close). Each request is handled as:
 *   /oauth/callback      → redeem the code, set the session cookie, redirect
 *   no valid session     → 307 to the provider (GET) or 401
 *   Upgrade request      → UpgradeTunnel
 *   anything else        → forwarded upstream with cpp-httplib
 *
 * Sessions that decrypted successfully are cached by cache_key() until
 * they expire, so repeat requests skip the AES-GCM open.
 */
class ProxyServer {
public:
    static constexpr size_t kMaxCachedSessions = 10000;
    static constexpr size_t kMaxForwardBodyBytes = 64 * 1024 * 1024;

    /**
     * @throws std::runtime_error if the upstream URL does not parse or its
     *         scheme is not http, https, ws or wss
     */
    ProxyServer(ServerConfig server_config,
                UpstreamConfig upstream_config,
                SessionConfig session_config,
                SessionCodec codec,
                std::shared_ptr<IdentityClient> identity,
                std::shared_ptr<SSL_CTX> tls_context = nullptr);

    ~ProxyServer();

    ProxyServer(const ProxyServer&) = delete;
    ProxyServer& operator=(const ProxyServer&) = delete;

    /**
     * @brief Bind, listen and spawn the accept thread
     * @throws std::runtime_error on socket/bind/listen failure
     */
    void start();

    void stop();

    // Bound port; differs from the configured one when that was 0
    [[nodiscard]] uint16_t port() const { return bound_port_; }

    [[nodiscard]] uint32_t active_connections() const { return active_connections_.load(); }

    /**
     * @brief Serve one parsed request on an accepted connection
     *
     * The response (or tunnel) is complete when this returns.
     */
    void handle_exchange(ConnectionTransport& transport,
                         const UpgradeRequest& request,
                         const std::string& remote_addr);

    // Session from the request's cookie, if present, authentic and unexpired
    [[nodiscard]] std::optional<SessionState> authenticate(const UpgradeRequest& request);

private:
    using Headers = std::vector<std::pair<std::string, std::string>>;

    void accept_loop();
    void handle_connection(int client_fd, std::string remote_addr);
    void reap_finished_workers();

    void handle_callback(IConnection& conn, const UpgradeRequest& request);
    void forward(ConnectionTransport& transport, const UpgradeRequest& request,
                 const SessionState& session, const std::string& remote_addr);

    // Writes a complete Connection: close response
    static void write_response(IConnection& conn, int status, const Headers& headers,
                               const std::string& body);
    static void write_redirect(IConnection& conn, const std::string& location,
                               Headers extra_headers = {});

    ServerConfig server_config_;
    UpstreamConfig upstream_config_;
    SessionConfig session_config_;
    SessionCodec codec_;
    std::shared_ptr<IdentityClient> identity_;
    std::shared_ptr<SSL_CTX> tls_context_;
    Url upstream_;
    UpgradeTunnel tunnel_;

    SessionCache session_cache_{kMaxCachedSessions};

    // Server socket
    int server_fd_ = -1;
    uint16_t bound_port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<uint32_t> active_connections_{0};

    // Client sockets still open, shut down by stop()
    std::mutex client_fds_mutex_;
    std::unordered_set<int> client_fds_;

    // Thread management
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::jthread accept_thread_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace keygate
