#pragma once
/**
 * @file event_queue.hpp
 * @brief Blocking multi-producer/single-consumer queue of watch notifications.
 *
 * Producers are client-library callback threads; the consumer is the
 * discovery watcher. Unbounded: notifications are small and the consumer
 * drains continuously.
 */

#include <condition_variable>
#include <deque>
#include <mutex>

#include "frontier/discovery/coordination.hpp"

namespace frontier::discovery {

class EventQueue final : public WatchStream {
public:
    /// Enqueue a notification. Dropped once the queue is closed.
    void push(WatchEvent ev) {
        {
            std::lock_guard<std::mutex> lk(mu_);
            if (closed_) return;
            events_.push_back(std::move(ev));
        }
        cv_.notify_one();
    }

    WatchEvent next() override {
        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait(lk, [this] { return closed_ || !events_.empty(); });
        if (closed_) {
            return WatchEvent{EventType::Session, SessionState::Closed, {}};
        }
        WatchEvent ev = std::move(events_.front());
        events_.pop_front();
        return ev;
    }

    void close() override {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
            events_.clear();
        }
        cv_.notify_all();
    }

    [[nodiscard]] bool closed() const {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

private:
    mutable std::mutex      mu_;
    std::condition_variable cv_;
    std::deque<WatchEvent>  events_;
    bool                    closed_{false};
};

} // namespace frontier::discovery
