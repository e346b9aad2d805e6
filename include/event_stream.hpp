#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <vector>

namespace zipline {

// Multi-subscriber event channel. Handlers run on the emitting thread,
// outside the internal lock, so a handler may subscribe or unsubscribe.
// Handlers must return quickly; long work belongs on the subscriber's own thread.
template <typename T>
class EventStream {
public:
    using Handler = std::function<void(const T&)>;
    using SubscriptionId = uint64_t;

    SubscriptionId subscribe(Handler handler) {
        std::lock_guard<std::mutex> lock(mutex_);
        SubscriptionId id = next_id_++;
        handlers_.emplace(id, std::move(handler));
        return id;
    }

    void unsubscribe(SubscriptionId id) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_.erase(id);
    }

    void emit(const T& event) const {
        std::vector<Handler> snapshot;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            snapshot.reserve(handlers_.size());
            for (const auto& entry : handlers_) snapshot.push_back(entry.second);
        }
        for (const auto& handler : snapshot) {
            if (handler) handler(event);
        }
    }

    size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_.size();
    }

private:
    mutable std::mutex mutex_;
    std::map<SubscriptionId, Handler> handlers_;
    SubscriptionId next_id_ = 1;
};

} // namespace zipline
