#pragma once

#include "core/error.hpp"
#include "server/connection.hpp"

#include <memory>
#include <string>

namespace keygate {

// Raw connection handed over by the HTTP layer, plus bytes it had already
// read past the request head
struct HijackedConnection {
    std::unique_ptr<IConnection> connection;
    std::string buffered;
};

/**
 * @brief Client side of an HTTP exchange that may be taken over for raw I/O
 */
class ClientTransport {
public:
    virtual ~ClientTransport() = default;

    [[nodiscard]] virtual bool can_hijack() const = 0;

    /**
     * @brief Take ownership of the underlying connection
     * @return HIJACK_UNSUPPORTED if the transport cannot be taken over or was
     *         already hijacked
     */
    [[nodiscard]] virtual Result<HijackedConnection> hijack() = 0;
};

/**
 * @brief ClientTransport over a connection accepted by ProxyServer
 *
 * The connection stays usable for ordinary responses until hijack() moves
 * it out. Hijacking succeeds at most once.
 */
class ConnectionTransport : public ClientTransport {
public:
    explicit ConnectionTransport(std::unique_ptr<IConnection> connection,
                                 std::string buffered = {});

    [[nodiscard]] bool can_hijack() const override { return connection_ != nullptr; }

    [[nodiscard]] Result<HijackedConnection> hijack() override;

    // nullptr once hijacked
    [[nodiscard]] IConnection* connection() const { return connection_.get(); }

    // Bytes read past the current request head
    [[nodiscard]] std::string& buffered() { return buffered_; }

private:
    std::unique_ptr<IConnection> connection_;
    std::string buffered_;
};

} // namespace keygate
