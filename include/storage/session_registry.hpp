#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "event_stream.hpp"
#include "models/transfer_session.hpp"
#include "storage/key_value_store.hpp"

namespace zipline::storage {

inline constexpr const char* kHistoryKey = "zipline_transfer_history";

// An incoming request we refused, or one the sender withdrew.
struct RequestRejection {
    std::string transfer_id;
    std::string address;
    std::string reason;
};

// Active and completed sessions. Owning transfer tasks push snapshots in;
// everyone else reads copies or subscribes. Cancelled sessions are reported
// on the failed stream with status CANCELLED.
class SessionRegistry {
public:
    using CancelToken = std::shared_ptr<std::atomic<bool>>;

    explicit SessionRegistry(std::shared_ptr<KeyValueStore> store);

    // Failures are logged and leave the history empty.
    void load_history();

    void start(const models::TransferSession& session);
    void update(const models::TransferSession& session);

    // Moves the session to the completed collection and persists history.
    void finish(const models::TransferSession& session);

    void reject_request(const RequestRejection& rejection);

    std::optional<models::TransferSession> find(const std::string& id) const;
    std::vector<models::TransferSession> active_sessions() const;
    std::vector<models::TransferSession> completed_sessions() const;
    bool is_active(const std::string& id) const;

    // Shared flag polled by the owning task; created on first use.
    CancelToken cancel_token(const std::string& id);

    // Raises the cancel flag. Returns false when id is not active.
    bool request_cancel(const std::string& id);

    void clear_history();

    EventStream<models::TransferSession> on_session_started;
    EventStream<models::TransferSession> on_session_progress;
    EventStream<models::TransferSession> on_session_completed;
    EventStream<models::TransferSession> on_session_failed;
    EventStream<RequestRejection> on_request_rejected;

private:
    void persist_locked();

    std::shared_ptr<KeyValueStore> store_;
    mutable std::mutex mutex_;
    std::map<std::string, models::TransferSession> active_;
    std::map<std::string, models::TransferSession> completed_;
    std::map<std::string, CancelToken> cancel_tokens_;
};

} // namespace zipline::storage
