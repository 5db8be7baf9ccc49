#include "server/proxy_server.hpp"
#include "core/utils.hpp"
#include "security/trust_store.hpp"
#include "server/http_constants.hpp"

#define CPPHTTPLIB_OPENSSL_SUPPORT
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
#include <httplib.h>
#pragma GCC diagnostic pop

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace keygate {

namespace {

bool is_hop_by_hop(std::string_view name) {
    return std::any_of(http::kHopByHopHeaders.begin(), http::kHopByHopHeaders.end(),
                       [name](std::string_view h) { return utils::iequals(h, name); });
}

// Only local absolute paths are accepted as post-login targets
std::string safe_redirect_target(const std::string& state) {
    if (!state.empty() && state[0] == '/' &&
        (state.size() == 1 || (state[1] != '/' && state[1] != '\\'))) {
        return state;
    }
    return "/";
}

void set_socket_read_timeout(int fd, std::chrono::milliseconds timeout) {
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

} // anonymous namespace

ProxyServer::ProxyServer(ServerConfig server_config,
                         UpstreamConfig upstream_config,
                         SessionConfig session_config,
                         SessionCodec codec,
                         std::shared_ptr<IdentityClient> identity,
                         std::shared_ptr<SSL_CTX> tls_context)
    : server_config_(std::move(server_config)),
      upstream_config_(std::move(upstream_config)),
      session_config_(std::move(session_config)),
      codec_(std::move(codec)),
      identity_(std::move(identity)),
      tls_context_(std::move(tls_context)) {
    const auto upstream = parse_url(upstream_config_.url);
    if (!upstream) {
        throw std::runtime_error("Proxy: invalid upstream URL: " + upstream_config_.url);
    }
    if (!upstream->is_web_scheme()) {
        throw std::runtime_error("Proxy: unsupported upstream scheme: " + upstream->scheme);
    }
    upstream_ = *upstream;

    UpgradeTunnel::Config tunnel_config;
    tunnel_config.verify_upstream_tls = upstream_config_.verify_tls;
    tunnel_config.upstream_ca_file = upstream_config_.ca_file;
    tunnel_config.connect_timeout = upstream_config_.connect_timeout;
    tunnel_ = UpgradeTunnel(tunnel_config);

    if (!upstream_config_.verify_tls) {
        utils::log::warn("Upstream TLS verification disabled for " + upstream_.origin());
    }
}

ProxyServer::~ProxyServer() {
    stop();
}

void ProxyServer::start() {
    if (running_.load()) return;

    server_fd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (server_fd_ < 0) {
        throw std::runtime_error(std::string("Proxy: socket() failed: ") + std::strerror(errno));
    }

    int opt = 1;
    ::setsockopt(server_fd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(server_config_.port);
    if (::inet_aton(server_config_.host.c_str(), &addr.sin_addr) == 0) {
        ::close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Proxy: invalid listen address " + server_config_.host);
    }

    if (::bind(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Proxy: bind(" + server_config_.host + ":" +
                                 std::to_string(server_config_.port) + ") failed: " + reason);
    }

    if (::listen(server_fd_, 128) < 0) {
        const std::string reason = std::strerror(errno);
        ::close(server_fd_);
        server_fd_ = -1;
        throw std::runtime_error("Proxy: listen() failed: " + reason);
    }

    socklen_t addr_len = sizeof(addr);
    ::getsockname(server_fd_, reinterpret_cast<struct sockaddr*>(&addr), &addr_len);
    bound_port_ = ntohs(addr.sin_port);

    running_.store(true);
    accept_thread_ = std::jthread([this](std::stop_token) { accept_loop(); });

    utils::log::info("Proxy listening on " + server_config_.host + ":" +
                     std::to_string(bound_port_) + (tls_context_ ? " (TLS)" : "") +
                     ", upstream " + upstream_.origin());
}

void ProxyServer::stop() {
    if (!running_.exchange(false)) return;

    // Wakes the blocked accept(); the fd is closed once the loop has exited
    if (server_fd_ >= 0) {
        ::shutdown(server_fd_, SHUT_RDWR);
    }

    if (accept_thread_.joinable()) {
        accept_thread_.request_stop();
        accept_thread_.join();
    }

    if (server_fd_ >= 0) {
        ::close(server_fd_);
        server_fd_ = -1;
    }

    {
        std::lock_guard lock(client_fds_mutex_);
        for (const int fd : client_fds_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    std::vector<Worker> workers;
    {
        std::lock_guard lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }

    utils::log::info("Proxy stopped");
}

void ProxyServer::accept_loop() {
    while (running_.load()) {
        struct sockaddr_in client_addr{};
        socklen_t addr_len = sizeof(client_addr);

        const int client_fd = ::accept4(server_fd_,
            reinterpret_cast<struct sockaddr*>(&client_addr), &addr_len, SOCK_CLOEXEC);

        if (client_fd < 0) {
            if (!running_.load()) break;  // Shutting down
            continue;
        }

        reap_finished_workers();

        // Check connection limit
        if (active_connections_.load() >= server_config_.max_connections) {
            utils::log::warn("Proxy: connection limit reached, rejecting client");
            ::close(client_fd);
            continue;
        }

        char ip[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &client_addr.sin_addr, ip, sizeof(ip));

        // Spawn worker thread for this connection
        active_connections_.fetch_add(1);
        auto done = std::make_shared<std::atomic<bool>>(false);
        std::lock_guard lock(workers_mutex_);
        workers_.push_back(Worker{
            std::jthread([this, client_fd, addr = std::string(ip), done]() {
                handle_connection(client_fd, addr);
                active_connections_.fetch_sub(1);
                done->store(true);
            }),
            done});
    }
}

void ProxyServer::reap_finished_workers() {
    std::lock_guard lock(workers_mutex_);
    auto it = std::remove_if(workers_.begin(), workers_.end(), [](Worker& w) {
        if (!w.done->load()) return false;
        if (w.thread.joinable()) w.thread.join();
        return true;
    });
    workers_.erase(it, workers_.end());
}

void ProxyServer::handle_connection(int client_fd, std::string remote_addr) {
    {
        std::lock_guard lock(client_fds_mutex_);
        client_fds_.insert(client_fd);
    }
    struct Unregister {
        ProxyServer* self;
        int fd;
        ~Unregister() {
            std::lock_guard lock(self->client_fds_mutex_);
            self->client_fds_.erase(fd);
        }
    } unregister{this, client_fd};

    // Bounds the blocking TLS handshake
    set_socket_read_timeout(client_fd, server_config_.read_timeout);

    std::unique_ptr<IConnection> conn;
    if (tls_context_) {
        auto tls = TlsConnection::accept(client_fd, tls_context_.get());
        if (tls.is_error()) {
            utils::log::debug(remote_addr + ": " + tls.error_message());
            return;
        }
        conn = std::move(tls.value());
    } else {
        conn = std::make_unique<SocketConnection>(client_fd);
    }
    conn->set_read_timeout(server_config_.read_timeout);

    std::string buffer;
    char chunk[8192];
    size_t head_end = std::string::npos;
    while ((head_end = find_head_end(buffer)) == std::string::npos) {
        if (buffer.size() > server_config_.max_header_bytes) break;
        const ssize_t n = conn->read(chunk, sizeof(chunk));
        if (n <= 0) return;  // Closed or timed out before a full head
        buffer.append(chunk, static_cast<size_t>(n));
    }

    if (head_end == std::string::npos || head_end > server_config_.max_header_bytes) {
        write_response(*conn, 431, {}, "request head too large\n");
        return;
    }

    const auto request = UpgradeRequest::parse(std::string_view(buffer).substr(0, head_end));
    if (!request) {
        write_response(*conn, 400, {}, "malformed request\n");
        return;
    }

    ConnectionTransport transport(std::move(conn), buffer.substr(head_end));
    try {
        handle_exchange(transport, *request, remote_addr);
    } catch (const std::exception& e) {
        utils::log::error(remote_addr + ": " + request->method + " " + request->path() +
                          " failed: " + e.what());
    }
}

// ============================================================================
// Request handling
// ============================================================================

void ProxyServer::handle_exchange(ConnectionTransport& transport,
                                  const UpgradeRequest& request,
                                  const std::string& remote_addr) {
    IConnection* conn = transport.connection();
    if (!conn) return;

    if (request.path() == kCallbackPath) {
        handle_callback(*conn, request);
        return;
    }

    const auto session = authenticate(request);
    if (!session) {
        if (request.method == "GET" && !request.is_upgrade()) {
            write_redirect(*conn, identity_->auth_code_url(request.target));
        } else {
            write_response(*conn, 401, {}, "authentication required\n");
        }
        return;
    }

    if (request.is_upgrade()) {
        UpgradeRequest upstream_request = request;
        upstream_request.set_header(http::kAuthorizationHeader,
                                    std::string(http::kBearerPrefix) + session->token);

        // Tunnels can idle indefinitely
        conn->set_read_timeout(std::chrono::milliseconds{0});

        auto result = tunnel_.tunnel(transport, upstream_request, upstream_);
        if (result.is_error()) {
            utils::log::warn(remote_addr + ": upgrade " + request.path() + " failed: " +
                             result.error_message());
            if (IConnection* still_owned = transport.connection()) {
                write_response(*still_owned, 502, {}, "upstream unavailable\n");
            }
            return;
        }
        utils::log::info(remote_addr + ": upgrade " + request.path() + " closed (" +
                         std::to_string(result.value().bytes_to_upstream) + " up, " +
                         std::to_string(result.value().bytes_to_client) + " down)");
        return;
    }

    forward(transport, request, *session, remote_addr);
}

std::optional<SessionState> ProxyServer::authenticate(const UpgradeRequest& request) {
    const auto cookie = request.cookie(session_config_.cookie_name);
    if (!cookie || cookie->empty()) return std::nullopt;

    const auto now = utils::now();
    const std::string key = cache_key(*cookie);
    if (auto cached = session_cache_.find(key, now)) {
        return cached;
    }

    auto opened = open_session(codec_, *cookie, now);
    if (opened.is_error()) {
        utils::log::debug("Rejected session " + key + ": " + opened.error_message());
        return std::nullopt;
    }

    if (!session_cache_.store(key, opened.value(), now)) {
        utils::log::warn("Session digest unavailable, not caching");
    }
    return opened.value();
}

void ProxyServer::handle_callback(IConnection& conn, const UpgradeRequest& request) {
    auto params = parse_query(request.query());
    const std::string code = params["code"];
    if (code.empty()) {
        write_response(conn, 400, {}, "missing authorization code\n");
        return;
    }

    auto token = identity_->exchange_code(code);
    if (token.is_error()) {
        utils::log::warn("Authorization code exchange failed: " + token.error_message());
        write_response(conn, 403, {}, "authorization failed\n");
        return;
    }

    auto lifetime = session_config_.lifetime;
    if (token.value().expires_in.count() > 0 && token.value().expires_in < lifetime) {
        lifetime = token.value().expires_in;
    }

    SessionState state;
    state.expires_at = utils::now() + lifetime;
    state.token = token.value().access_token;

    auto sealed = seal_session(codec_, state);
    if (sealed.is_error()) {
        utils::log::error("Failed to seal session: " + sealed.error_message());
        write_response(conn, 500, {}, "internal error\n");
        return;
    }

    std::string cookie = session_config_.cookie_name + "=" + sealed.value() +
                         "; Path=/; Max-Age=" + std::to_string(lifetime.count()) +
                         "; HttpOnly; SameSite=Lax";
    if (session_config_.secure_cookie) cookie += "; Secure";

    utils::log::info("Session established " + cache_key(sealed.value()));
    write_redirect(conn, safe_redirect_target(params["state"]), {{"Set-Cookie", cookie}});
}

void ProxyServer::forward(ConnectionTransport& transport, const UpgradeRequest& request,
                          const SessionState& session, const std::string& remote_addr) {
    IConnection& conn = *transport.connection();

    if (request.has_header("Transfer-Encoding")) {
        write_response(conn, 411, {}, "chunked request bodies are not supported\n");
        return;
    }
    const size_t length = request.content_length();
    if (length > kMaxForwardBodyBytes) {
        write_response(conn, 413, {}, "request body too large\n");
        return;
    }

    std::string body = std::move(transport.buffered());
    char chunk[16384];
    while (body.size() < length) {
        const ssize_t n = conn.read(chunk, sizeof(chunk));
        if (n <= 0) return;
        body.append(chunk, static_cast<size_t>(n));
    }
    body.resize(length);

    httplib::Client client(upstream_.http_origin());
    const auto connect_ms = upstream_config_.connect_timeout.count();
    const auto read_ms = server_config_.read_timeout.count();
    client.set_connection_timeout(static_cast<time_t>(connect_ms / 1000),
                                  static_cast<time_t>((connect_ms % 1000) * 1000));
    client.set_read_timeout(static_cast<time_t>(read_ms / 1000),
                            static_cast<time_t>((read_ms % 1000) * 1000));
    client.enable_server_certificate_verification(upstream_config_.verify_tls);
    if (!upstream_config_.ca_file.empty()) {
        client.set_ca_cert_path(upstream_config_.ca_file);
    }

    httplib::Request req;
    req.method = request.method;
    req.path = request.target;
    std::string forwarded_for;
    for (const auto& [name, value] : request.headers) {
        if (is_hop_by_hop(name) || utils::iequals(name, "Host") ||
            utils::iequals(name, "Content-Length") ||
            utils::iequals(name, http::kAuthorizationHeader)) {
            continue;
        }
        if (utils::iequals(name, "X-Forwarded-For")) {
            forwarded_for = value;
            continue;
        }
        req.headers.emplace(name, value);
    }
    req.headers.emplace(http::kAuthorizationHeader,
                        std::string(http::kBearerPrefix) + session.token);
    req.headers.emplace("X-Forwarded-For",
                        forwarded_for.empty() ? remote_addr : forwarded_for + ", " + remote_addr);
    req.headers.emplace("X-Forwarded-Proto", tls_context_ ? "https" : "http");
    req.body = std::move(body);

    auto res = client.send(req);
    if (!res) {
        utils::log::warn(remote_addr + ": " + request.method + " " + request.path() +
                         " upstream error: " + httplib::to_string(res.error()));
        write_response(conn, 502, {}, "upstream unavailable\n");
        return;
    }

    Headers headers;
    for (const auto& [name, value] : res->headers) {
        if (is_hop_by_hop(name) || utils::iequals(name, "Content-Length")) continue;
        headers.emplace_back(name, value);
    }
    write_response(conn, res->status, headers, request.method == "HEAD" ? std::string{} : res->body);
    utils::log::debug(remote_addr + ": " + request.method + " " + request.path() +
                      " -> " + std::to_string(res->status));
}

// ============================================================================
// Response writing
// ============================================================================

void ProxyServer::write_response(IConnection& conn, int status, const Headers& headers,
                                 const std::string& body) {
    std::string out = "HTTP/1.1 " + std::to_string(status) + " " + http::reason_phrase(status) + "\r\n";
    bool has_content_type = false;
    for (const auto& [name, value] : headers) {
        if (utils::iequals(name, "Content-Type")) has_content_type = true;
        out += name + ": " + value + "\r\n";
    }
    if (!has_content_type && !body.empty()) {
        out += std::string("Content-Type: ") + http::kTextContentType + "\r\n";
    }
    out += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    out += "Connection: close\r\n\r\n";
    out += body;
    if (!conn.write_all(out.data(), out.size())) {
        utils::log::debug("Client went away before the " + std::to_string(status) +
                          " response was written");
    }
}

void ProxyServer::write_redirect(IConnection& conn, const std::string& location,
                                 Headers extra_headers) {
    extra_headers.emplace_back("Location", location);
    extra_headers.emplace_back("Cache-Control", "no-store");
    write_response(conn, 307, extra_headers, {});
}

} // namespace keygate
