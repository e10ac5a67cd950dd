#pragma once
#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace peerdrop {

/// Wake-up signal shared between a Selector and every channel it watches.
///
/// The epoch counter is bumped on every notification, so a waiter that
/// sampled the epoch before probing its channels can never miss a wake-up
/// that lands between the probe and the wait.
class Waker {
public:
    void Notify() {
        {
            std::lock_guard lock(mutex_);
            ++epoch_;
        }
        cv_.notify_all();
    }

    [[nodiscard]] uint64_t Epoch() const {
        std::lock_guard lock(mutex_);
        return epoch_;
    }

    void WaitForChange(const uint64_t seen) {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return epoch_ != seen; });
    }

    [[nodiscard]] bool WaitForChange(const uint64_t seen,
                                     const std::chrono::steady_clock::time_point deadline) {
        std::unique_lock lock(mutex_);
        return cv_.wait_until(lock, deadline, [&] { return epoch_ != seen; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t epoch_ = 0;
};

/// Unbounded multi-producer queue with close semantics.
///
/// Items sent before Close() are still delivered; Receive() reports the end
/// of the stream (std::nullopt) only once the queue is both closed and drained.
template<typename T>
class Channel {
public:
    Channel() = default;
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    bool Send(T value) {
        std::vector<std::shared_ptr<Waker>> wakers;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(value));
            wakers = wakers_;
        }
        cv_.notify_one();
        for (const auto& waker : wakers) {
            waker->Notify();
        }
        return true;
    }

    void Close() {
        std::vector<std::shared_ptr<Waker>> wakers;
        {
            std::lock_guard lock(mutex_);
            if (closed_) {
                return;
            }
            closed_ = true;
            wakers = wakers_;
        }
        cv_.notify_all();
        for (const auto& waker : wakers) {
            waker->Notify();
        }
    }

    [[nodiscard]] std::optional<T> Receive() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return !items_.empty() || closed_; });
        return PopLocked();
    }

    [[nodiscard]] std::optional<T> ReceiveUntil(const std::chrono::steady_clock::time_point deadline) {
        std::unique_lock lock(mutex_);
        cv_.wait_until(lock, deadline, [&] { return !items_.empty() || closed_; });
        return PopLocked();
    }

    [[nodiscard]] std::optional<T> TryReceive() {
        std::lock_guard lock(mutex_);
        return PopLocked();
    }

    [[nodiscard]] bool IsReady() const {
        std::lock_guard lock(mutex_);
        return !items_.empty() || closed_;
    }

    [[nodiscard]] bool IsClosed() const {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    [[nodiscard]] size_t Size() const {
        std::lock_guard lock(mutex_);
        return items_.size();
    }

    void Attach(std::shared_ptr<Waker> waker) {
        std::lock_guard lock(mutex_);
        wakers_.push_back(std::move(waker));
    }

    void Detach(const std::shared_ptr<Waker>& waker) {
        std::lock_guard lock(mutex_);
        wakers_.erase(std::remove(wakers_.begin(), wakers_.end(), waker), wakers_.end());
    }

private:
    std::optional<T> PopLocked() {
        if (items_.empty()) {
            return std::nullopt;
        }
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<T> items_;
    bool closed_ = false;
    std::vector<std::shared_ptr<Waker>> wakers_;
};

/// Multi-way wait over a fixed set of channels, optionally bounded by a deadline.
///
/// A slot is ready when its channel holds an item or has been closed. When
/// several slots are ready at once the scan starts after the slot chosen last
/// time, so a busy source cannot starve the others. The Selector must not
/// outlive the channels it watches.
class Selector {
public:
    Selector() : waker_(std::make_shared<Waker>()) {}
    Selector(const Selector&) = delete;
    Selector& operator=(const Selector&) = delete;

    ~Selector() {
        for (auto& detach : detachers_) {
            detach();
        }
    }

    template<typename T>
    size_t Watch(Channel<T>& channel) {
        channel.Attach(waker_);
        probes_.emplace_back([&channel] { return channel.IsReady(); });
        detachers_.emplace_back([&channel, waker = waker_] { channel.Detach(waker); });
        return probes_.size() - 1;
    }

    [[nodiscard]] size_t Wait() {
        while (true) {
            const uint64_t seen = waker_->Epoch();
            if (auto slot = FindReady()) {
                return *slot;
            }
            waker_->WaitForChange(seen);
        }
    }

    [[nodiscard]] std::optional<size_t> WaitUntil(const std::chrono::steady_clock::time_point deadline) {
        while (true) {
            const uint64_t seen = waker_->Epoch();
            if (auto slot = FindReady()) {
                return slot;
            }
            if (!waker_->WaitForChange(seen, deadline)) {
                return std::nullopt;
            }
        }
    }

private:
    std::optional<size_t> FindReady() {
        const size_t count = probes_.size();
        for (size_t step = 0; step < count; ++step) {
            const size_t slot = (next_start_ + step) % count;
            if (probes_[slot]()) {
                next_start_ = (slot + 1) % count;
                return slot;
            }
        }
        return std::nullopt;
    }

    std::shared_ptr<Waker> waker_;
    std::vector<std::function<bool()>> probes_;
    std::vector<std::function<void()>> detachers_;
    size_t next_start_ = 0;
};

}  // namespace peerdrop
