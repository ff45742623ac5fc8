#pragma once

#include "errors.hpp"
#include "log.hpp"
#include "observation.hpp"
#include "scheduler.hpp"
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace tabula {

// ============================================================================
// broadcast<V> - multicast channel, no replay
//
// Each publish hands the value to every subscriber registered at that moment,
// through the channel's scheduler. A subscriber whose token is destroyed
// before a queued delivery runs does not receive it.
// ============================================================================

template<typename V>
class broadcast {
public:
    using callback_t = std::function<void(const V&)>;

    explicit broadcast(std::shared_ptr<scheduler> sched = nullptr)
        : state_(std::make_shared<state>()),
          sched_(sched ? std::move(sched) : std::make_shared<immediate_scheduler>()) {}

    broadcast(const broadcast&) = delete;
    broadcast& operator=(const broadcast&) = delete;

    /// Register a subscriber. Delivery stops when the token goes away.
    notification_token subscribe(callback_t callback) {
        uint64_t id;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            id = state_->next_id++;
            state_->subscribers.emplace(id, std::move(callback));
        }
        std::weak_ptr<state> weak = state_;
        return notification_token([weak, id] {
            if (auto s = weak.lock()) {
                std::lock_guard<std::mutex> lock(s->mutex);
                s->subscribers.erase(id);
            }
        });
    }

    /// Deliver `value` to all current subscribers.
    /// Throws channel_closed_error once the channel is closed.
    void publish(V value) {
        std::vector<uint64_t> targets;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->closed) {
                LOG_ERROR("broadcast", "publish on a closed channel");
                throw channel_closed_error("Cannot publish on a closed channel");
            }
            targets.reserve(state_->subscribers.size());
            for (const auto& [id, _] : state_->subscribers) {
                targets.push_back(id);
            }
        }

        auto snapshot = std::make_shared<const V>(std::move(value));
        std::weak_ptr<state> weak = state_;
        for (auto id : targets) {
            sched_->invoke([weak, id, snapshot] {
                auto s = weak.lock();
                if (!s) return;
                callback_t callback;
                {
                    std::lock_guard<std::mutex> lock(s->mutex);
                    auto it = s->subscribers.find(id);
                    if (it == s->subscribers.end()) return;
                    callback = it->second;
                }
                try {
                    callback(*snapshot);
                } catch (const std::exception& e) {
                    LOG_ERROR("broadcast", "Subscriber %llu threw: %s",
                              static_cast<unsigned long long>(id), e.what());
                }
            });
        }
    }

    /// Close the channel and drop every subscriber.
    void close() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->closed = true;
        state_->subscribers.clear();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->closed;
    }

    std::size_t subscriber_count() const {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->subscribers.size();
    }

private:
    struct state {
        mutable std::mutex mutex;
        std::map<uint64_t, callback_t> subscribers;
        uint64_t next_id = 0;
        bool closed = false;
    };

    std::shared_ptr<state> state_;
    std::shared_ptr<scheduler> sched_;
};

} // namespace tabula
