#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include "task_manager.hpp"

namespace sectorcast {

// Bounded queue whose blocking operations give up when the task manager
// stops.
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity) : capacity_(capacity ? capacity : 1) {}

    // Blocks while full. Returns false if tm stopped before the value fit.
    bool send(T v, TaskManager& tm) {
        bool stopping = false;
        StopCallback stop_cb(tm, [&] {
            std::lock_guard<std::mutex> lk(mtx_);
            stopping = true;
            cv_.notify_all();
        });
        std::unique_lock<std::mutex> lk(mtx_);
        cv_.wait(lk, [&] { return stopping || q_.size() < capacity_; });
        if (stopping)
            return false;
        q_.push_back(std::move(v));
        cv_.notify_all();
        return true;
    }

    bool try_recv(T& out) {
        std::lock_guard<std::mutex> lk(mtx_);
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        cv_.notify_all();
        return true;
    }

    // Returns false on timeout or stop.
    bool recv_for(T& out, TaskManager& tm, std::chrono::milliseconds d) {
        bool stopping = false;
        StopCallback stop_cb(tm, [&] {
            std::lock_guard<std::mutex> lk(mtx_);
            stopping = true;
            cv_.notify_all();
        });
        std::unique_lock<std::mutex> lk(mtx_);
        if (!cv_.wait_for(lk, d, [&] { return stopping || !q_.empty(); }))
            return false;
        if (q_.empty())
            return false;
        out = std::move(q_.front());
        q_.pop_front();
        cv_.notify_all();
        return true;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lk(mtx_);
        return q_.size();
    }

private:
    const size_t capacity_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::deque<T> q_;
};

} // namespace sectorcast
