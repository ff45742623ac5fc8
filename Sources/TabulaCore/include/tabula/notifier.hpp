#pragma once

#include "broadcast.hpp"
#include "configuration.hpp"
#include "repository.hpp"
#include <atomic>
#include <vector>

namespace tabula {

// ============================================================================
// notifier<T> - keeps subscribers current with the full table contents
//
// Every mutation goes through the repository and is followed by a full
// re-fetch, which is published to all observers. A failed mutation publishes
// nothing. After dispose() any publish throws channel_closed_error.
// ============================================================================

template<typename T>
class notifier {
public:
    using snapshot_t = std::vector<T>;
    using callback_t = std::function<void(const snapshot_t&)>;

    explicit notifier(std::shared_ptr<store> backend, std::shared_ptr<scheduler> sched = nullptr)
        : repo_(std::move(backend)), channel_(std::move(sched)) {}

    notifier(std::shared_ptr<store> backend, const configuration& config)
        : repo_(std::move(backend)), channel_(config.sched) {}

    explicit notifier(repository<T> repo, std::shared_ptr<scheduler> sched = nullptr)
        : repo_(std::move(repo)), channel_(std::move(sched)) {}

    /// Receive every snapshot published from now on.
    [[nodiscard]] notification_token observe(callback_t callback) {
        return channel_.subscribe(std::move(callback));
    }

    /// Fetch the table and publish it.
    void get() {
        refresh_guard guard(refreshing_);
        auto snapshot = repo_.get();
        LOG_DEBUG("notifier", "publishing %zu rows of %s", snapshot.size(), repo_.table().c_str());
        channel_.publish(std::move(snapshot));
    }

    int64_t create(const T& obj) {
        auto result = repo_.create(obj);
        get();
        return result;
    }

    int64_t update(const T& obj) {
        auto result = repo_.update(obj);
        get();
        return result;
    }

    template<typename K, typename = std::enable_if_t<is_key_argument_v<K>>>
    int64_t remove(K&& key) {
        return remove(wire_value_t(std::forward<K>(key)));
    }

    int64_t remove(const wire_value_t& key) {
        auto result = repo_.remove(key);
        get();
        return result;
    }

    int64_t remove(const T& obj) {
        auto result = repo_.remove(obj);
        get();
        return result;
    }

    int64_t remove_all() {
        auto result = repo_.remove_all();
        get();
        return result;
    }

    /// Close the channel; the notifier must not be used afterwards.
    void dispose() {
        LOG_DEBUG("notifier", "disposing notifier for %s", repo_.table().c_str());
        channel_.close();
    }

    /// True while any get() is fetching or delivering.
    bool is_refreshing() const noexcept { return refreshing_.load() > 0; }
    bool is_disposed() const { return channel_.closed(); }
    std::size_t observer_count() const { return channel_.subscriber_count(); }

private:
    // Counts overlapping refreshes
    struct refresh_guard {
        explicit refresh_guard(std::atomic<int>& in_flight) : in_flight_(in_flight) { ++in_flight_; }
        ~refresh_guard() { --in_flight_; }
        std::atomic<int>& in_flight_;
    };

    repository<T> repo_;
    broadcast<snapshot_t> channel_;
    std::atomic<int> refreshing_{0};
};

} // namespace tabula
