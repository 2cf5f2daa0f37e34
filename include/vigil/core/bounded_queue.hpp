#pragma once
// ============================================================================
// VIGIL - Bounded Queue (Drop-Oldest)
// ============================================================================
// Multi-producer queue with a hard capacity. A push never blocks: when the
// queue is full the oldest element is discarded and counted.
// ============================================================================

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace vigil {

enum class PushResult : uint8_t {
    Queued,
    EvictedOldest,  // Queued after discarding the oldest element
    Closed          // Refused; the element was not queued
};

template <typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("BoundedQueue capacity must be positive");
        }
    }

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    /// Push an element, evicting the oldest one when the queue is full
    PushResult push(T value) {
        PushResult result = PushResult::Queued;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) return PushResult::Closed;
            if (items_.size() >= capacity_) {
                items_.pop_front();
                ++dropped_;
                result = PushResult::EvictedOldest;
            }
            items_.push_back(std::move(value));
        }
        not_empty_.notify_one();
        return result;
    }

    [[nodiscard]] std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    /// Wait up to `timeout` for an element; returns nullopt on timeout or close
    template <typename Rep, typename Period>
    [[nodiscard]] std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty()) return std::nullopt;
        T value = std::move(items_.front());
        items_.pop_front();
        return value;
    }

    /// Wake all waiters and refuse further pushes
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
    }

    [[nodiscard]] size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    [[nodiscard]] bool empty() const { return size() == 0; }
    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }

    /// Number of elements evicted by overflow since construction
    [[nodiscard]] uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::deque<T> items_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

}  // namespace vigil
