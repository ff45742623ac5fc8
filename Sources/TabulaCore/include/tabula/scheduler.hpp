#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace tabula {

// ============================================================================
// Scheduler interface - decides where subscriber callbacks run
// ============================================================================
//
// A notifier captures a scheduler when it is built and hands every published
// snapshot to it. Implementations:
// - immediate_scheduler: synchronously on the publishing thread (default)
// - std_thread_scheduler: on a dedicated worker thread
// - main_thread_scheduler: queued until the owner calls process_pending()

struct scheduler {
    virtual ~scheduler() = default;

    // Invoke the given function on this scheduler's execution context.
    // Can be called from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // Check if the caller is currently on this scheduler's thread/context.
    [[nodiscard]] virtual bool is_on_thread() const noexcept = 0;

    // Check if this scheduler wraps the same underlying context as another.
    [[nodiscard]] virtual bool is_same_as(const scheduler* other) const noexcept = 0;

    // May return false once the scheduler is shutting down.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Worker thread scheduler - runs callbacks on a dedicated thread, in order
// ============================================================================

class std_thread_scheduler : public scheduler {
public:
    std_thread_scheduler() : running_(true) {
        worker_ = std::thread([this] { run_loop(); });
        thread_id_ = worker_.get_id();
    }

    // Drains queued work before joining.
    ~std_thread_scheduler() override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
        }
        cv_.notify_one();
        if (worker_.joinable()) {
            worker_.join();
        }
    }

    std_thread_scheduler(const std_thread_scheduler&) = delete;
    std_thread_scheduler& operator=(const std_thread_scheduler&) = delete;

    void invoke(std::function<void()>&& fn) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!running_) return;
            queue_.push(std::move(fn));
        }
        cv_.notify_one();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == thread_id_;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        auto* g = dynamic_cast<const std_thread_scheduler*>(other);
        return g && g->thread_id_ == thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return running_;
    }

private:
    void run_loop() {
        while (true) {
            std::function<void()> fn;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return !queue_.empty() || !running_; });

                if (!running_ && queue_.empty()) {
                    return;
                }

                fn = std::move(queue_.front());
                queue_.pop();
            }

            if (fn) {
                fn();
            }
        }
    }

    std::thread worker_;
    std::thread::id thread_id_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::queue<std::function<void()>> queue_;
    std::atomic<bool> running_;
};

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on calling thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return true;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        return dynamic_cast<const immediate_scheduler*>(other) != nullptr;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

// ============================================================================
// Main thread scheduler - for applications with a main/UI loop
// ============================================================================
//
// Captures the constructing thread as the main thread and queues work until
// process_pending() is called from that thread's loop.

class main_thread_scheduler : public scheduler {
public:
    main_thread_scheduler() : main_thread_id_(std::this_thread::get_id()) {}

    void invoke(std::function<void()>&& fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(fn));
    }

    // Run everything queued so far; returns the number of callbacks run.
    std::size_t process_pending() {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            while (!queue_.empty()) {
                pending.push_back(std::move(queue_.front()));
                queue_.pop();
            }
        }
        for (auto& fn : pending) {
            if (fn) fn();
        }
        return pending.size();
    }

    [[nodiscard]] bool is_on_thread() const noexcept override {
        return std::this_thread::get_id() == main_thread_id_;
    }

    [[nodiscard]] bool is_same_as(const scheduler* other) const noexcept override {
        auto* m = dynamic_cast<const main_thread_scheduler*>(other);
        return m && m->main_thread_id_ == main_thread_id_;
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }

private:
    std::thread::id main_thread_id_;
    std::mutex mutex_;
    std::queue<std::function<void()>> queue_;
};

} // namespace tabula
