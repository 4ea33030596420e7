#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace vigil::infra {

// Multi-producer hand-off queue with a hard cap. push() never blocks: when
// full, the oldest element is discarded to admit the new one.
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0)
            throw std::invalid_argument("BoundedQueue capacity must be > 0");
    }

    // Returns true if an element was dropped to make room.
    bool push(T item) {
        bool dropped = false;
        {
            std::lock_guard<std::mutex> lk(mtx_);
            if (q_.size() >= capacity_) {
                q_.pop_front();
                ++dropped_;
                dropped = true;
            }
            q_.push_back(std::move(item));
        }
        cv_.notify_one();
        return dropped;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lk(mtx_);
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    template<typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, timeout, [&]() { return !q_.empty(); }))
            return std::nullopt;
        T v = std::move(q_.front());
        q_.pop_front();
        return v;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return q_.size();
    }

    size_t capacity() const { return capacity_; }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return dropped_;
    }

private:
    const size_t            capacity_;
    mutable std::mutex      mtx_;
    std::condition_variable cv_;
    std::deque<T>           q_;
    uint64_t                dropped_ = 0;
};

} // namespace vigil::infra
