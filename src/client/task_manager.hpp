#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>

namespace sectorcast {

// Admission guard for background tasks plus the process-wide stop signal.
// Every blocking wait in the upload path observes stopped().
class TaskManager {
public:
    TaskManager() = default;
    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    // Returns false once stop() has been called.
    bool add();
    void done();
    // Signals stop, runs the stop callbacks and waits for admitted tasks to
    // finish. Must not be called from inside an admitted task.
    void stop();
    bool stopped() const;
    // Sleeps up to d. Returns true if stop was signalled.
    bool wait_for_stop(std::chrono::milliseconds d);
    int active() const;

private:
    friend class StopCallback;
    uint64_t register_callback(std::function<void()> cb);
    void unregister_callback(uint64_t id);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool stopped_{false};
    int active_{0};

    // Held while callbacks run so unregister cannot race a running callback.
    std::mutex cb_mtx_;
    uint64_t next_cb_{1};
    std::map<uint64_t, std::function<void()>> callbacks_;
};

// Runs cb when the task manager stops, or immediately if it already has.
// The callback must not take locks that the owner holds while destroying
// this object.
class StopCallback {
public:
    StopCallback(TaskManager& tm, std::function<void()> cb);
    ~StopCallback();
    StopCallback(const StopCallback&) = delete;
    StopCallback& operator=(const StopCallback&) = delete;
private:
    TaskManager& tm_;
    uint64_t id_{0};
};

} // namespace sectorcast
