#include "storage/session_registry.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace zipline::storage {

SessionRegistry::SessionRegistry(std::shared_ptr<KeyValueStore> store) : store_(std::move(store)) {}

void SessionRegistry::load_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_.clear();
    try {
        auto stored = store_->get(kHistoryKey);
        if (!stored) return;
        if (!stored->is_array()) {
            spdlog::warn("Transfer history is not an array, ignoring it");
            return;
        }
        for (const auto& entry : *stored) {
            auto session = entry.get<models::TransferSession>();
            completed_[session.id] = std::move(session);
        }
        spdlog::debug("Loaded {} sessions from history", completed_.size());
    } catch (const std::exception& e) {
        completed_.clear();
        spdlog::warn("Could not load transfer history: {}", e.what());
    }
}

void SessionRegistry::start(const models::TransferSession& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_[session.id] = session;
    }
    spdlog::info("Session {} started ({} {})", session.id,
                 session.direction == models::TransferDirection::SENDING ? "to" : "from",
                 session.peer.display_name());
    on_session_started.emit(session);
}

void SessionRegistry::update(const models::TransferSession& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(session.id);
        if (it == active_.end()) return;
        it->second = session;
    }
    on_session_progress.emit(session);
}

void SessionRegistry::finish(const models::TransferSession& session) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.erase(session.id);
        cancel_tokens_.erase(session.id);
        completed_[session.id] = session;
        persist_locked();
    }

    if (session.status == models::TransferStatus::COMPLETED) {
        spdlog::info("Session {} completed: {} files, {} bytes", session.id,
                     session.completed_files, session.transferred_size);
        on_session_completed.emit(session);
    } else {
        spdlog::info("Session {} {}: {}", session.id, models::to_string(session.status),
                     session.error.value_or(""));
        on_session_failed.emit(session);
    }
}

void SessionRegistry::reject_request(const RequestRejection& rejection) {
    spdlog::info("Request {} from {} rejected: {}", rejection.transfer_id, rejection.address,
                 rejection.reason);
    on_request_rejected.emit(rejection);
}

std::optional<models::TransferSession> SessionRegistry::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(id);
    if (it != active_.end()) return it->second;
    it = completed_.find(id);
    if (it != completed_.end()) return it->second;
    return std::nullopt;
}

std::vector<models::TransferSession> SessionRegistry::active_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<models::TransferSession> out;
    for (const auto& entry : active_) out.push_back(entry.second);
    return out;
}

std::vector<models::TransferSession> SessionRegistry::completed_sessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<models::TransferSession> out;
    for (const auto& entry : completed_) out.push_back(entry.second);
    return out;
}

bool SessionRegistry::is_active(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.count(id) > 0;
}

SessionRegistry::CancelToken SessionRegistry::cancel_token(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& token = cancel_tokens_[id];
    if (!token) token = std::make_shared<std::atomic<bool>>(false);
    return token;
}

bool SessionRegistry::request_cancel(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!active_.count(id)) return false;
    auto& token = cancel_tokens_[id];
    if (!token) token = std::make_shared<std::atomic<bool>>(false);
    token->store(true);
    return true;
}

void SessionRegistry::clear_history() {
    std::lock_guard<std::mutex> lock(mutex_);
    completed_.clear();
    persist_locked();
}

void SessionRegistry::persist_locked() {
    nlohmann::json history = nlohmann::json::array();
    for (const auto& entry : completed_) history.push_back(entry.second);
    try {
        store_->set(kHistoryKey, history);
    } catch (const Error& e) {
        spdlog::warn("Could not persist transfer history: {}", e.what());
    }
}

} // namespace zipline::storage
