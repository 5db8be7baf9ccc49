#include "server/client_transport.hpp"

namespace keygate {

ConnectionTransport::ConnectionTransport(std::unique_ptr<IConnection> connection,
                                         std::string buffered)
    : connection_(std::move(connection)),
      buffered_(std::move(buffered)) {}

Result<HijackedConnection> ConnectionTransport::hijack() {
    if (!connection_) {
        return Result<HijackedConnection>::error(ErrorCategory::HIJACK_UNSUPPORTED,
            "connection already hijacked");
    }

    HijackedConnection out;
    out.connection = std::move(connection_);
    out.buffered = std::move(buffered_);
    buffered_.clear();
    return Result<HijackedConnection>::ok(std::move(out));
}

} // namespace keygate
