#pragma once

#include <vector>
#include <mutex>
#include <iterator>
#include <utility>
#include <cstddef>

// Hand-off queue between one producer thread and one consumer thread.
// The producer closes it once its source is exhausted; the consumer keeps
// draining until closed() and empty() both hold.
template <typename T>
class PendingQueue {
public:
    void push(T&& item) {
        std::lock_guard<std::mutex> lock(m_);
        if (closed_)
            return;
        q_.push_back(std::move(item));
    }

    void drain(std::vector<T>& out) {
        std::lock_guard<std::mutex> lock(m_);
        out.insert(out.end(), std::make_move_iterator(q_.begin()), std::make_move_iterator(q_.end()));
        q_.clear();
    }

    void close() {
        std::lock_guard<std::mutex> lock(m_);
        closed_ = true;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(m_);
        return closed_;
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(m_);
        return q_.empty();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(m_);
        return q_.size();
    }

private:
    mutable std::mutex m_;
    std::vector<T> q_;
    bool closed_ = false;
};
