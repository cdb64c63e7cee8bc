/**
 * @file Channel.hpp
 * @brief Blocking multi-producer / single-consumer queue and cancellation
 *
 * Workers push completed outcomes into a Channel; the coordinator is the
 * only consumer and the only writer of the merge report.
 */

#ifndef TREEMERGE_CHANNEL_HPP
#define TREEMERGE_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <utility>

namespace treemerge {

template <typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /**
     * @brief Enqueue a value
     * @return false if the channel was already closed (value dropped)
     */
    bool push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return false;
            queue_.push_back(std::move(value));
        }
        cv_.notify_one();
        return true;
    }

    /**
     * @brief Block until a value is available or the channel is closed
     * @return The next value, or nullopt once closed and drained
     */
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
        if (queue_.empty()) return std::nullopt;
        T value = std::move(queue_.front());
        queue_.pop_front();
        return value;
    }

    /// No further pushes; pending values can still be popped
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> queue_;
    bool closed_ = false;
};

/**
 * @brief Cooperative cancellation flag shared by copies
 *
 * Copies share state; cancel() on any copy is observed by all. Workers
 * check it between actions, never in the middle of a copy.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }
    bool cancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Cancels a token once a polled condition turns true
 *
 * The condition is polled on a background thread until it fires, the
 * token is cancelled elsewhere, or the watcher is destroyed. If the
 * thread cannot be started the watcher is inactive and start_error()
 * says why.
 */
class CancellationWatcher {
public:
    CancellationWatcher(CancellationToken token, std::function<bool()> condition,
                        std::chrono::milliseconds interval = std::chrono::milliseconds(50))
        : token_(std::move(token))
        , condition_(std::move(condition))
        , interval_(interval)
    {
        try {
            thread_ = std::thread([this] { run(); });
        } catch (const std::system_error& e) {
            start_error_ = e.what();
        }
    }

    ~CancellationWatcher() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            done_ = true;
        }
        cv_.notify_all();
        if (thread_.joinable()) thread_.join();
    }

    CancellationWatcher(const CancellationWatcher&) = delete;
    CancellationWatcher& operator=(const CancellationWatcher&) = delete;

    bool active() const noexcept { return start_error_.empty(); }
    const std::string& start_error() const noexcept { return start_error_; }

private:
    void run() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!done_ && !token_.cancelled()) {
            if (condition_()) {
                token_.cancel();
                return;
            }
            cv_.wait_for(lock, interval_);
        }
    }

    CancellationToken token_;
    std::function<bool()> condition_;
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::condition_variable cv_;
    bool done_ = false;
    std::string start_error_;
    std::thread thread_;
};

} // namespace treemerge

#endif // TREEMERGE_CHANNEL_HPP
