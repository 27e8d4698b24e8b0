#include "memory_manager.hpp"
#include "logging.hpp"
#include <algorithm>

namespace sectorcast {

MemoryManager::MemoryManager(uint64_t limit, TaskManager &tm)
    : limit_(limit), available_(limit), stop_cb_(tm, [this] {
        std::lock_guard<std::mutex> lk(mtx_);
        stopping_ = true;
        cv_.notify_all();
      }) {}

bool MemoryManager::acquire(uint64_t bytes) {
  if (bytes > limit_) {
    Logger::instance().log(LogLevel::ERROR,
                           "memory request of %llu bytes exceeds limit %llu",
                           (unsigned long long)bytes,
                           (unsigned long long)limit_);
    return false;
  }
  std::unique_lock<std::mutex> lk(mtx_);
  if (stopping_)
    return false;
  if (bytes == 0)
    return true;

  uint64_t ticket = next_ticket_++;
  queue_.push_back(ticket);
  cv_.wait(lk, [&] {
    return stopping_ || (queue_.front() == ticket && available_ >= bytes);
  });
  if (stopping_) {
    queue_.erase(std::find(queue_.begin(), queue_.end(), ticket));
    cv_.notify_all();
    return false;
  }
  queue_.pop_front();
  available_ -= bytes;
  // The next waiter may fit into what is left.
  cv_.notify_all();
  return true;
}

void MemoryManager::release(uint64_t bytes) {
  if (bytes == 0)
    return;
  std::lock_guard<std::mutex> lk(mtx_);
  uint64_t outstanding = limit_ - available_;
  if (bytes > outstanding) {
    Logger::instance().log(LogLevel::WARN,
                           "returning %llu bytes but only %llu outstanding",
                           (unsigned long long)bytes,
                           (unsigned long long)outstanding);
    bytes = outstanding;
  }
  available_ += bytes;
  cv_.notify_all();
}

uint64_t MemoryManager::available() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return available_;
}

uint64_t MemoryManager::outstanding() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return limit_ - available_;
}

size_t MemoryManager::waiters() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return queue_.size();
}

} // namespace sectorcast
