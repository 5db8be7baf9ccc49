#include "server/connection.hpp"
#include "core/utils.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>

namespace keygate {

namespace {

std::string last_ssl_error() {
    const unsigned long code = ERR_get_error();
    ERR_clear_error();
    if (code == 0) return "unknown TLS error";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return buf;
}

bool set_nonblocking(int fd, bool enabled) {
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    const int wanted = enabled ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    return ::fcntl(fd, F_SETFL, wanted) == 0;
}

struct timeval to_timeval(std::chrono::milliseconds timeout) {
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return tv;
}

void set_io_timeouts(int fd, std::chrono::milliseconds timeout) {
    const struct timeval tv = to_timeval(timeout);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool is_ip_literal(const std::string& host) {
    unsigned char buf[sizeof(struct in6_addr)];
    return ::inet_pton(AF_INET, host.c_str(), buf) == 1 ||
           ::inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

bool connect_with_timeout(int fd, const sockaddr* addr, socklen_t addr_len,
                          std::chrono::milliseconds timeout, std::string& error) {
    if (!set_nonblocking(fd, true)) {
        error = std::strerror(errno);
        return false;
    }

    if (::connect(fd, addr, addr_len) != 0) {
        if (errno != EINPROGRESS) {
            error = std::strerror(errno);
            return false;
        }
        struct pollfd pfd{fd, POLLOUT, 0};
        int rc = 0;
        do {
            rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        } while (rc < 0 && errno == EINTR);
        if (rc == 0) {
            error = "connect timed out";
            return false;
        }
        if (rc < 0) {
            error = std::strerror(errno);
            return false;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) != 0 || so_error != 0) {
            error = std::strerror(so_error != 0 ? so_error : errno);
            return false;
        }
    }

    return set_nonblocking(fd, false);
}

int connect_tcp(const std::string& host, uint16_t port,
                std::chrono::milliseconds timeout, std::string& error) {
    struct addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* result = nullptr;
    const std::string port_str = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &result);
    if (rc != 0 || !result) {
        error = "cannot resolve " + host + (rc != 0 ? std::string(": ") + gai_strerror(rc) : "");
        return -1;
    }
    std::unique_ptr<struct addrinfo, decltype(&freeaddrinfo)> guard(result, freeaddrinfo);

    for (const auto* ai = result; ai != nullptr; ai = ai->ai_next) {
        const int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
        if (fd < 0) {
            error = std::strerror(errno);
            continue;
        }
        if (connect_with_timeout(fd, ai->ai_addr, ai->ai_addrlen, timeout, error)) {
            int one = 1;
            ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
            return fd;
        }
        ::close(fd);
    }
    return -1;
}

std::shared_ptr<SSL_CTX> make_client_context(const DialOptions& options, std::string& error) {
    std::shared_ptr<SSL_CTX> ctx(SSL_CTX_new(TLS_client_method()), SSL_CTX_free);
    if (!ctx) {
        error = "failed to create SSL_CTX: " + last_ssl_error();
        return nullptr;
    }

    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
#ifdef SSL_OP_IGNORE_UNEXPECTED_EOF
    SSL_CTX_set_options(ctx.get(), SSL_OP_IGNORE_UNEXPECTED_EOF);
#endif

    if (!options.verify_tls) {
        SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_NONE, nullptr);
        return ctx;
    }

    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    const int loaded = options.ca_file.empty()
        ? SSL_CTX_set_default_verify_paths(ctx.get())
        : SSL_CTX_load_verify_locations(ctx.get(), options.ca_file.c_str(), nullptr);
    if (loaded != 1) {
        error = "failed to load trust anchors: " + last_ssl_error();
        return nullptr;
    }
    return ctx;
}

} // anonymous namespace

// ============================================================================
// SocketConnection
// ============================================================================

SocketConnection::SocketConnection(int fd) : fd_(fd) {}

SocketConnection::~SocketConnection() {
    close();
}

ssize_t SocketConnection::read(void* buf, size_t len) {
    const int fd = fd_.load();
    if (fd < 0) return -1;

    while (true) {
        const ssize_t n = ::recv(fd, buf, len, 0);
        if (n < 0 && errno == EINTR) continue;
        return n < 0 ? -1 : n;
    }
}

bool SocketConnection::write_all(const void* buf, size_t len) {
    const int fd = fd_.load();
    if (fd < 0) return false;

    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        const ssize_t n = ::send(fd, ptr, remaining, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        ptr += n;
        remaining -= static_cast<size_t>(n);
    }
    return true;
}

void SocketConnection::set_read_timeout(std::chrono::milliseconds timeout) {
    const int fd = fd_.load();
    if (fd < 0) return;
    const struct timeval tv = to_timeval(timeout);
    ::setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
}

void SocketConnection::shutdown_write() {
    const int fd = fd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_WR);
}

void SocketConnection::abort() {
    const int fd = fd_.load();
    if (fd >= 0) ::shutdown(fd, SHUT_RDWR);
}

void SocketConnection::close() {
    const int fd = fd_.exchange(-1);
    if (fd >= 0) ::close(fd);
}

// ============================================================================
// TlsConnection
// ============================================================================

TlsConnection::TlsConnection(Passkey, int fd, SSL* ssl) : ssl_(ssl), fd_(fd) {}

TlsConnection::~TlsConnection() {
    close();
}

Result<std::unique_ptr<TlsConnection>> TlsConnection::accept(int fd, SSL_CTX* ctx) {
    using R = Result<std::unique_ptr<TlsConnection>>;

    SSL* ssl = ctx ? SSL_new(ctx) : nullptr;
    if (!ssl) {
        ::close(fd);
        return R::error(ErrorCategory::IO_ERROR, "TLS: SSL_new failed");
    }

    ERR_clear_error();
    if (SSL_set_fd(ssl, fd) != 1 || SSL_accept(ssl) != 1) {
        const std::string reason = last_ssl_error();
        SSL_free(ssl);
        ::close(fd);
        return R::error(ErrorCategory::IO_ERROR, "TLS handshake with client failed: " + reason);
    }

    set_nonblocking(fd, true);
    return R::ok(std::make_unique<TlsConnection>(Passkey{}, fd, ssl));
}

Result<std::unique_ptr<TlsConnection>> TlsConnection::connect(
        int fd, SSL_CTX* ctx, const std::string& host,
        std::chrono::milliseconds handshake_timeout) {
    using R = Result<std::unique_ptr<TlsConnection>>;

    SSL* ssl = ctx ? SSL_new(ctx) : nullptr;
    if (!ssl) {
        ::close(fd);
        return R::error(ErrorCategory::DIAL_ERROR, "TLS: SSL_new failed");
    }

    if (is_ip_literal(host)) {
        X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), host.c_str());
    } else {
        SSL_set_tlsext_host_name(ssl, host.c_str());
        SSL_set1_host(ssl, host.c_str());
    }

    set_io_timeouts(fd, handshake_timeout);
    ERR_clear_error();
    if (SSL_set_fd(ssl, fd) != 1 || SSL_connect(ssl) != 1) {
        std::string reason = last_ssl_error();
        const long verify = SSL_get_verify_result(ssl);
        if (verify != X509_V_OK) {
            reason = X509_verify_cert_error_string(verify);
        }
        SSL_free(ssl);
        ::close(fd);
        return R::error(ErrorCategory::DIAL_ERROR, "TLS handshake with " + host + " failed: " + reason);
    }
    set_io_timeouts(fd, std::chrono::milliseconds{0});

    set_nonblocking(fd, true);
    return R::ok(std::make_unique<TlsConnection>(Passkey{}, fd, ssl));
}

bool TlsConnection::wait_ready(short events, Deadline deadline) const {
    struct pollfd pfd{fd_, events, 0};
    while (!aborted_.load()) {
        // 250 ms slices so abort() is noticed
        int slice_ms = 250;
        if (deadline != Deadline::max()) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) return false;
            slice_ms = static_cast<int>(std::min<int64_t>(left, slice_ms));
        }

        const int rc = ::poll(&pfd, 1, slice_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (rc > 0) return (pfd.revents & POLLNVAL) == 0;
    }
    return false;
}

void TlsConnection::set_read_timeout(std::chrono::milliseconds timeout) {
    read_timeout_ms_.store(timeout.count());
}

ssize_t TlsConnection::read(void* buf, size_t len) {
    const int want = static_cast<int>(std::min<size_t>(len, INT_MAX));
    const int64_t timeout_ms = read_timeout_ms_.load();
    const Deadline deadline = timeout_ms > 0
        ? std::chrono::steady_clock::now() + std::chrono::milliseconds{timeout_ms}
        : Deadline::max();

    while (!aborted_.load()) {
        int ret = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard lock(ssl_mutex_);
            if (closed_) return -1;
            ERR_clear_error();
            ret = SSL_read(ssl_, buf, want);
            if (ret > 0) return ret;
            err = SSL_get_error(ssl_, ret);
        }

        switch (err) {
            case SSL_ERROR_ZERO_RETURN:
                return 0;
            case SSL_ERROR_WANT_READ:
                if (!wait_ready(POLLIN, deadline)) return -1;
                break;
            case SSL_ERROR_WANT_WRITE:
                if (!wait_ready(POLLOUT, deadline)) return -1;
                break;
            case SSL_ERROR_SYSCALL:
                // TCP FIN without close_notify
                return (ret == 0 && ERR_peek_error() == 0) ? 0 : -1;
            default:
                return -1;
        }
    }
    return -1;
}

bool TlsConnection::write_all(const void* buf, size_t len) {
    const auto* ptr = static_cast<const uint8_t*>(buf);
    size_t remaining = len;

    while (remaining > 0) {
        if (aborted_.load()) return false;

        int ret = 0;
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard lock(ssl_mutex_);
            if (closed_) return false;
            ERR_clear_error();
            ret = SSL_write(ssl_, ptr, static_cast<int>(std::min<size_t>(remaining, INT_MAX)));
            if (ret <= 0) err = SSL_get_error(ssl_, ret);
        }

        if (ret > 0) {
            ptr += ret;
            remaining -= static_cast<size_t>(ret);
            continue;
        }
        if (err == SSL_ERROR_WANT_WRITE) {
            if (!wait_ready(POLLOUT)) return false;
        } else if (err == SSL_ERROR_WANT_READ) {
            if (!wait_ready(POLLIN)) return false;
        } else {
            return false;
        }
    }
    return true;
}

void TlsConnection::shutdown_write() {
    // close_notify first, then the TCP FIN for peers that ignore it
    for (int attempt = 0; attempt < 8 && !aborted_.load(); ++attempt) {
        int err = SSL_ERROR_NONE;
        {
            std::lock_guard lock(ssl_mutex_);
            if (closed_) return;
            ERR_clear_error();
            const int ret = SSL_shutdown(ssl_);
            if (ret >= 0) break;
            err = SSL_get_error(ssl_, ret);
        }
        if (err != SSL_ERROR_WANT_WRITE || !wait_ready(POLLOUT)) break;
    }
    ERR_clear_error();
    ::shutdown(fd_, SHUT_WR);
}

void TlsConnection::abort() {
    aborted_.store(true);
    ::shutdown(fd_, SHUT_RDWR);
}

void TlsConnection::close() {
    std::lock_guard lock(ssl_mutex_);
    if (closed_) return;
    closed_ = true;
    SSL_free(ssl_);
    ssl_ = nullptr;
    ::close(fd_);
}

// ============================================================================
// Dialing
// ============================================================================

Result<std::unique_ptr<IConnection>> dial(const Url& url, const DialOptions& options) {
    using R = Result<std::unique_ptr<IConnection>>;

    std::string error;
    const int fd = connect_tcp(url.bare_host(), url.effective_port(),
                               options.connect_timeout, error);
    if (fd < 0) {
        return R::error(ErrorCategory::DIAL_ERROR, "dial " + url.dial_address() + ": " + error);
    }

    if (url.is_plaintext()) {
        return R::ok(std::make_unique<SocketConnection>(fd));
    }

    const auto ctx = make_client_context(options, error);
    if (!ctx) {
        ::close(fd);
        return R::error(ErrorCategory::DIAL_ERROR, "dial " + url.dial_address() + ": " + error);
    }

    auto tls = TlsConnection::connect(fd, ctx.get(), url.bare_host(), options.connect_timeout);
    if (tls.is_error()) return R::error_from(tls);
    return R::ok(std::move(tls.value()));
}

} // namespace keygate
