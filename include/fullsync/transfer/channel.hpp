#pragma once

/**
 * @file channel.hpp
 * @brief Bounded blocking queue between a producing and a consuming side
 *
 * Carries snapshot chunks or record envelopes between threads. push()
 * blocks while the channel is full, which is what keeps a fast producer
 * from buffering a whole snapshot in memory.
 *
 * EXAMPLE:
 * BoundedChannel<RecordEnvelope> channel(400);
 * // producer thread
 * channel.push(std::move(envelope));
 * channel.close();
 * // consumer thread
 * while (auto envelope = channel.pop()) { ... }
 */

#include "fullsync/core/result.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <vector>

namespace fullsync::transfer {

template<typename T>
class BoundedChannel {
public:
    explicit BoundedChannel(std::size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel&) = delete;
    BoundedChannel& operator=(const BoundedChannel&) = delete;

    /// Blocks while full. Returns false once the channel is closed.
    bool push(T item) {
        {
            std::unique_lock lock(mutex_);
            not_full_.wait(lock, [this]() {
                return queue_.size() < capacity_ || closed_;
            });
            if (closed_) {
                return false;
            }
            queue_.push(std::move(item));
        }
        not_empty_.notify_one();
        return true;
    }

    /// Blocks until an item arrives; nullopt once closed and drained.
    std::optional<T> pop() {
        std::unique_lock lock(mutex_);
        not_empty_.wait(lock, [this]() {
            return !queue_.empty() || closed_;
        });
        return take(lock);
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this]() {
            return !queue_.empty() || closed_;
        })) {
            return std::nullopt;
        }
        return take(lock);
    }

    void close() {
        {
            std::unique_lock lock(mutex_);
            closed_ = true;
        }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::unique_lock lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::unique_lock lock(mutex_);
        return queue_.size();
    }

private:
    std::optional<T> take(std::unique_lock<std::mutex>& lock) {
        if (queue_.empty()) {
            return std::nullopt;
        }
        T item = std::move(queue_.front());
        queue_.pop();
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    std::queue<T> queue_;
    std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    bool closed_ = false;
};

using ChunkChannel = BoundedChannel<std::vector<std::uint8_t>>;

} // namespace fullsync::transfer
