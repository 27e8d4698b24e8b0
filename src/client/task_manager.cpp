#include "task_manager.hpp"

namespace sectorcast {

bool TaskManager::add() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (stopped_)
    return false;
  active_++;
  return true;
}

void TaskManager::done() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (active_ > 0)
    active_--;
  cv_.notify_all();
}

void TaskManager::stop() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!stopped_) {
      stopped_ = true;
      cv_.notify_all();
    }
  }
  {
    std::lock_guard<std::mutex> lk(cb_mtx_);
    for (auto &kv : callbacks_)
      kv.second();
    callbacks_.clear();
  }
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [this] { return active_ == 0; });
}

bool TaskManager::stopped() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return stopped_;
}

bool TaskManager::wait_for_stop(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mtx_);
  return cv_.wait_for(lk, d, [this] { return stopped_; });
}

int TaskManager::active() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return active_;
}

uint64_t TaskManager::register_callback(std::function<void()> cb) {
  std::lock_guard<std::mutex> lk(cb_mtx_);
  if (stopped()) {
    cb();
    return 0;
  }
  uint64_t id = next_cb_++;
  callbacks_.emplace(id, std::move(cb));
  return id;
}

void TaskManager::unregister_callback(uint64_t id) {
  if (id == 0)
    return;
  std::lock_guard<std::mutex> lk(cb_mtx_);
  callbacks_.erase(id);
}

StopCallback::StopCallback(TaskManager &tm, std::function<void()> cb)
    : tm_(tm) {
  id_ = tm_.register_callback(std::move(cb));
}

StopCallback::~StopCallback() { tm_.unregister_callback(id_); }

} // namespace sectorcast
