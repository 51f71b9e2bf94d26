#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

//thread safe queue, used for the actor mailbox and the ui request list
//capacity 0 means unbounded. push() waits for room, push_nowait() never waits.
template <typename T>
class TSQueue {
public:
    explicit TSQueue(std::size_t capacity = 0) : capacity_(capacity) {}

    // false if the queue was closed, v is dropped in that case
    bool push(T v) {
        {
            std::unique_lock<std::mutex> lk(m_);
            not_full_.wait(lk, [&]{ return closed_ || capacity_ == 0 || q_.size() < capacity_; });
            if (closed_) return false;
            q_.push(std::move(v));
        }
        not_empty_.notify_one();
        return true;
    }

    // for producers that must never stall (library callbacks)
    bool push_nowait(T v) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (closed_) return false;
            q_.push(std::move(v));
        }
        not_empty_.notify_one();
        return true;
    }

    // blocks until an item arrives; nullopt once closed and drained
    std::optional<T> pop() {
        std::unique_lock<std::mutex> lk(m_);
        not_empty_.wait(lk, [&]{ return closed_ || !q_.empty(); });
        if (q_.empty()) return std::nullopt;
        T v = std::move(q_.front()); q_.pop();
        lk.unlock();
        not_full_.notify_one();
        return v;
    }

    bool try_pop(T& out) {
        {
            std::lock_guard<std::mutex> lk(m_);
            if (q_.empty()) return false;
            out = std::move(q_.front()); q_.pop();
        }
        not_full_.notify_one();
        return true;
    }

    // wakes every waiter; later pushes fail, pops drain what is left
    void close() {
        { std::lock_guard<std::mutex> lk(m_); closed_ = true; }
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(m_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lk(m_);
        return q_.size();
    }

private:
    mutable std::mutex m_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::queue<T> q_;
    std::size_t capacity_;
    bool closed_ = false;
};
