#pragma once

#include <cstddef>
#include <deque>
#include <stdexcept>

namespace vigil::infra {

// Most-recent-N window. Once full, each push silently drops the oldest
// record. Not synchronized; owners guard it with their own mutex.
template<typename T>
class RingWindow {
public:
    explicit RingWindow(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0)
            throw std::invalid_argument("RingWindow capacity must be > 0");
    }

    void push(T v) {
        if (buf_.size() == capacity_) buf_.pop_front();
        buf_.push_back(std::move(v));
    }

    size_t size() const { return buf_.size(); }
    size_t capacity() const { return capacity_; }
    bool empty() const { return buf_.empty(); }

    // Oldest first.
    typename std::deque<T>::const_iterator begin() const { return buf_.begin(); }
    typename std::deque<T>::const_iterator end() const { return buf_.end(); }

private:
    size_t        capacity_;
    std::deque<T> buf_;
};

} // namespace vigil::infra
