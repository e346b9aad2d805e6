#pragma once

#include <optional>
#include <string>
#include "config.hpp"
#include "models/transfer_session.hpp"
#include "networking/discovery.hpp"
#include "storage/session_registry.hpp"
#include "transfer/connection.hpp"

namespace zipline::transfer {

// At most this many names travel in a transfer_request.
constexpr std::size_t kMaxRequestFileNames = 50;

// Builds the transfer_request payload for a pending session.
protocol::ControlPayload make_request_payload(const models::TransferSession& session,
                                              const std::string& signature);

// Writes the framed stream for session over connection, updating the
// session and the registry as bytes go out. Throws on failure; the
// session keeps its partial counters.
void push_session(Connection& connection, models::TransferSession& session, const Config& config,
                  storage::SessionRegistry& registry);

// Drives one outbound session from pending to a terminal status: request,
// wait for the answer, connect, push. Never throws.
class TransferSender {
public:
    TransferSender(const Config& config, networking::DiscoveryService& discovery,
                   storage::SessionRegistry& registry);

    // session must already be registered as started.
    models::TransferSession run(models::TransferSession session);

private:
    void await_acceptance(models::TransferSession& session, const Connection::CancelFlag& cancel);
    void transmit(models::TransferSession& session, const Connection::CancelFlag& cancel);

    const Config& config_;
    networking::DiscoveryService& discovery_;
    storage::SessionRegistry& registry_;
};

} // namespace zipline::transfer
