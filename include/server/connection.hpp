#pragma once

#include "core/error.hpp"
#include "core/url.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

// Forward-declare OpenSSL types
typedef struct ssl_st SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace keygate {

/**
 * @brief Bidirectional byte stream (plain TCP or TLS)
 *
 * read() and write_all() may be called concurrently from two threads, one
 * reading and one writing, which is how the tunnel relays. abort() may be
 * called from any thread to unblock both.
 */
class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief Read up to `len` bytes
     * @return Bytes read, 0 on EOF, -1 on error
     */
    virtual ssize_t read(void* buf, size_t len) = 0;

    // Write all bytes; false on error
    virtual bool write_all(const void* buf, size_t len) = 0;

    // Bound each read() to `timeout` (-1 when it expires); zero disables
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    // Half-close: the peer sees EOF, reading remains possible
    virtual void shutdown_write() = 0;

    // Tear the stream down so blocked read()/write_all() calls return
    virtual void abort() = 0;

    // Release the descriptor; idempotent
    virtual void close() = 0;
};

/**
 * @brief Plain TCP connection owning a socket fd
 */
class SocketConnection : public IConnection {
public:
    explicit SocketConnection(int fd);
    ~SocketConnection() override;

    SocketConnection(const SocketConnection&) = delete;
    SocketConnection& operator=(const SocketConnection&) = delete;

    ssize_t read(void* buf, size_t len) override;
    bool write_all(const void* buf, size_t len) override;
    void set_read_timeout(std::chrono::milliseconds timeout) override;
    void shutdown_write() override;
    void abort() override;
    void close() override;

    [[nodiscard]] int fd() const { return fd_.load(); }

private:
    std::atomic<int> fd_;
};

/**
 * @brief TLS connection over a socket fd
 *
 * The handshake runs in blocking mode; afterwards the socket is switched to
 * non-blocking and every SSL call is serialized by a mutex, with poll()
 * outside the lock, so one thread can sit in read() while another writes.
 * Socket-level receive timeouts no longer apply once non-blocking, so the
 * read timeout is enforced as a deadline on the poll() wait.
 */
class TlsConnection : public IConnection {
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    TlsConnection(Passkey, int fd, SSL* ssl);

    /**
     * @brief Server-side handshake on an accepted socket
     * @return IO_ERROR if the handshake fails (the fd is closed)
     */
    [[nodiscard]] static Result<std::unique_ptr<TlsConnection>> accept(int fd, SSL_CTX* ctx);

    /**
     * @brief Client-side handshake on a connected socket
     *
     * Sends SNI for `host` (unless it is an IP literal) and, when the context
     * verifies peers, checks the certificate against `host`.
     * @return DIAL_ERROR if the handshake fails (the fd is closed)
     */
    [[nodiscard]] static Result<std::unique_ptr<TlsConnection>> connect(
        int fd, SSL_CTX* ctx, const std::string& host,
        std::chrono::milliseconds handshake_timeout);

    ~TlsConnection() override;

    TlsConnection(const TlsConnection&) = delete;
    TlsConnection& operator=(const TlsConnection&) = delete;

    ssize_t read(void* buf, size_t len) override;
    bool write_all(const void* buf, size_t len) override;
    void set_read_timeout(std::chrono::milliseconds timeout) override;
    void shutdown_write() override;
    void abort() override;
    void close() override;

private:
    using Deadline = std::chrono::steady_clock::time_point;

    // Block until the socket is ready for `events`; false when aborted or
    // once `deadline` passes
    bool wait_ready(short events, Deadline deadline = Deadline::max()) const;

    std::mutex ssl_mutex_;
    SSL* ssl_ = nullptr;
    int fd_ = -1;
    std::atomic<bool> aborted_{false};
    std::atomic<int64_t> read_timeout_ms_{0};
    bool closed_ = false;
};

struct DialOptions {
    bool verify_tls = true;
    std::string ca_file;        // Empty = system trust store
    std::chrono::milliseconds connect_timeout{10000};
};

/**
 * @brief Connect to the upstream named by `url`
 *
 * Plain TCP for http/ws, TLS for every other scheme. Port defaults to 80 or
 * 443 accordingly.
 * @return DIAL_ERROR when resolution, connect or the TLS handshake fails
 */
[[nodiscard]] Result<std::unique_ptr<IConnection>> dial(const Url& url, const DialOptions& options);

} // namespace keygate
