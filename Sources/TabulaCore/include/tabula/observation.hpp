#pragma once

#include <functional>

namespace tabula {

// ============================================================================
// notification_token - Retains a subscription until destroyed (move-only)
// ============================================================================

class notification_token {
public:
    notification_token() = default;

    explicit notification_token(std::function<void()> unregister_fn)
        : unregister_(std::move(unregister_fn)) {}

    ~notification_token() {
        unregister();
    }

    notification_token(const notification_token&) = delete;
    notification_token& operator=(const notification_token&) = delete;

    notification_token(notification_token&& other) noexcept
        : unregister_(std::move(other.unregister_)) {
        other.unregister_ = nullptr;
    }

    notification_token& operator=(notification_token&& other) noexcept {
        if (this != &other) {
            unregister();
            unregister_ = std::move(other.unregister_);
            other.unregister_ = nullptr;
        }
        return *this;
    }

    /// Explicitly stop the subscription
    void unregister() {
        if (unregister_) {
            auto fn = std::move(unregister_);
            unregister_ = nullptr;
            fn();
        }
    }

    [[nodiscard]] bool is_valid() const noexcept {
        return unregister_ != nullptr;
    }

    explicit operator bool() const noexcept {
        return is_valid();
    }

private:
    std::function<void()> unregister_;
};

} // namespace tabula
