#pragma once
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include "task_manager.hpp"

namespace sectorcast {

// Byte budget shared by every in-flight segment. Grants are served in
// arrival order and never exceed the configured limit in total.
class MemoryManager {
public:
    MemoryManager(uint64_t limit, TaskManager& tm);
    MemoryManager(const MemoryManager&) = delete;
    MemoryManager& operator=(const MemoryManager&) = delete;

    // Blocks until the bytes are granted. Returns false if the task manager
    // stopped first, or if the request can never fit.
    bool acquire(uint64_t bytes);
    // Non-blocking. Bytes beyond what is outstanding are ignored.
    void release(uint64_t bytes);

    uint64_t limit() const { return limit_; }
    uint64_t available() const;
    uint64_t outstanding() const;
    size_t waiters() const;

private:
    const uint64_t limit_;
    mutable std::mutex mtx_;
    std::condition_variable cv_;
    uint64_t available_;
    uint64_t next_ticket_{0};
    std::deque<uint64_t> queue_;
    bool stopping_{false};
    StopCallback stop_cb_;
};

} // namespace sectorcast
