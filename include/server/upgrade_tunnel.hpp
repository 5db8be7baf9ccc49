#pragma once

#include "core/error.hpp"
#include "core/url.hpp"
#include "server/client_transport.hpp"
#include "server/connection.hpp"
#include "server/upgrade_request.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace keygate {

struct TunnelStats {
    uint64_t bytes_to_upstream = 0;   // Excludes the forwarded request head
    uint64_t bytes_to_client = 0;
};

/**
 * @brief Bridges a protocol-upgrade request to the upstream as a raw stream
 *
 * Steps, in order:
 * 1. the request must carry an Upgrade header and the transport must be
 *    hijackable
 * 2. dial the upstream (plain TCP for http/ws, TLS otherwise)
 * 3. hijack the client connection
 * 4. write the request head, then any bytes already buffered past it
 * 5. copy bytes both ways on two threads until both directions finish
 *
 * A direction that reaches EOF half-closes its destination; an I/O error
 * aborts both connections so the opposite copy unblocks. Both connections
 * are closed before tunnel() returns, on every path. Nothing is retried.
 */
class UpgradeTunnel {
public:
    struct Config {
        bool verify_upstream_tls = true;
        std::string upstream_ca_file;
        std::chrono::milliseconds connect_timeout{10000};
        size_t buffer_size = 32 * 1024;
    };

    UpgradeTunnel();
    explicit UpgradeTunnel(Config config);

    /**
     * @return HIJACK_UNSUPPORTED, DIAL_ERROR, or IO_ERROR if the handshake
     *         cannot be written upstream; otherwise the relayed byte counts
     */
    [[nodiscard]] Result<TunnelStats> tunnel(ClientTransport& client,
                                             const UpgradeRequest& request,
                                             const Url& upstream) const;

    /**
     * @brief Copy bytes between two connections until both directions end
     *
     * Does not close either connection.
     */
    [[nodiscard]] TunnelStats relay(IConnection& client, IConnection& upstream) const;

    [[nodiscard]] const Config& config() const { return config_; }

private:
    Config config_;
};

} // namespace keygate
