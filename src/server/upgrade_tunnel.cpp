#include "server/upgrade_tunnel.hpp"
#include "core/utils.hpp"

#include <memory>
#include <thread>
#include <vector>

namespace keygate {

namespace {

/**
 * Copy src → dst until EOF or error. EOF half-closes dst; an error aborts
 * both so the opposite direction stops too.
 */
uint64_t copy_stream(IConnection& src, IConnection& dst, size_t buffer_size) {
    std::vector<char> buf(buffer_size);
    uint64_t total = 0;

    while (true) {
        const ssize_t n = src.read(buf.data(), buf.size());
        if (n == 0) {
            dst.shutdown_write();
            return total;
        }
        if (n < 0 || !dst.write_all(buf.data(), static_cast<size_t>(n))) {
            src.abort();
            dst.abort();
            return total;
        }
        total += static_cast<uint64_t>(n);
    }
}

} // anonymous namespace

UpgradeTunnel::UpgradeTunnel() : UpgradeTunnel(Config{}) {}

UpgradeTunnel::UpgradeTunnel(Config config)
    : config_(std::move(config)) {}

TunnelStats UpgradeTunnel::relay(IConnection& client, IConnection& upstream) const {
    TunnelStats stats;
    {
        std::jthread to_upstream([&] {
            stats.bytes_to_upstream = copy_stream(client, upstream, config_.buffer_size);
        });
        std::jthread to_client([&] {
            stats.bytes_to_client = copy_stream(upstream, client, config_.buffer_size);
        });
    }  // Both copies joined here
    return stats;
}

Result<TunnelStats> UpgradeTunnel::tunnel(ClientTransport& client,
                                          const UpgradeRequest& request,
                                          const Url& upstream) const {
    using R = Result<TunnelStats>;

    if (!request.is_upgrade()) {
        return R::error(ErrorCategory::HIJACK_UNSUPPORTED, "request has no Upgrade header");
    }
    if (!client.can_hijack()) {
        return R::error(ErrorCategory::HIJACK_UNSUPPORTED, "client transport cannot be hijacked");
    }

    DialOptions dial_options;
    dial_options.verify_tls = config_.verify_upstream_tls;
    dial_options.ca_file = config_.upstream_ca_file;
    dial_options.connect_timeout = config_.connect_timeout;

    auto dialed = dial(upstream, dial_options);
    if (dialed.is_error()) return R::error_from(dialed);
    // Connections close in their destructors on every exit path
    std::unique_ptr<IConnection> upstream_conn = std::move(dialed.value());

    auto hijacked = client.hijack();
    if (hijacked.is_error()) return R::error_from(hijacked);
    std::unique_ptr<IConnection> client_conn = std::move(hijacked.value().connection);

    const std::string head = request.serialize();
    if (!upstream_conn->write_all(head.data(), head.size())) {
        return R::error(ErrorCategory::IO_ERROR,
            "failed to forward upgrade request to " + upstream.dial_address());
    }

    TunnelStats stats;
    const std::string& buffered = hijacked.value().buffered;
    if (!buffered.empty()) {
        if (!upstream_conn->write_all(buffered.data(), buffered.size())) {
            return R::error(ErrorCategory::IO_ERROR,
                "failed to forward buffered client bytes to " + upstream.dial_address());
        }
        stats.bytes_to_upstream += buffered.size();
    }

    utils::log::debug("Tunnel open: " + request.method + " " + request.path() +
                      " -> " + upstream.dial_address() +
                      " (" + request.header("Upgrade") + ")");

    const TunnelStats relayed = relay(*client_conn, *upstream_conn);
    stats.bytes_to_upstream += relayed.bytes_to_upstream;
    stats.bytes_to_client += relayed.bytes_to_client;

    utils::log::debug("Tunnel closed: " + std::to_string(stats.bytes_to_upstream) +
                      " bytes up, " + std::to_string(stats.bytes_to_client) + " bytes down");
    return R::ok(stats);
}

} // namespace keygate
