#include "upload_heap.hpp"
#include <algorithm>

namespace sectorcast {

// std heap is a max-heap: "a < b" means b is served first.
bool UploadHeap::Lower::operator()(const Entry &a, const Entry &b) const {
  if (a.stuck != b.stuck)
    return !a.stuck;
  if (a.completion != b.completion)
    return a.completion > b.completion;
  return a.seq > b.seq;
}

UploadHeap::UploadHeap(size_t stuck_channel_capacity)
    : stuck_success_(stuck_channel_capacity) {}

bool UploadHeap::push(std::shared_ptr<UnfinishedSegment> uc) {
  if (!uc)
    return false;
  Entry e;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    e.stuck = uc->stuck;
    e.completion = uc->total_sectors
                       ? (double)uc->sectors_completed / uc->total_sectors
                       : 1.0;
  }
  std::lock_guard<std::mutex> lk(mtx_);
  if (queued_.count(uc->id) || pending_.count(uc->id))
    return false;
  e.seq = next_seq_++;
  queued_.insert(uc->id);
  e.segment = std::move(uc);
  heap_.push_back(std::move(e));
  std::push_heap(heap_.begin(), heap_.end(), Lower());
  cv_.notify_all();
  return true;
}

std::shared_ptr<UnfinishedSegment> UploadHeap::pop() {
  std::lock_guard<std::mutex> lk(mtx_);
  if (heap_.empty())
    return nullptr;
  std::pop_heap(heap_.begin(), heap_.end(), Lower());
  auto uc = std::move(heap_.back().segment);
  heap_.pop_back();
  queued_.erase(uc->id);
  pending_.insert(uc->id);
  return uc;
}

size_t UploadHeap::size() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return heap_.size();
}

bool UploadHeap::add_pending(const SegmentId &id) {
  std::lock_guard<std::mutex> lk(mtx_);
  return pending_.insert(id).second;
}

bool UploadHeap::remove_pending(const SegmentId &id) {
  std::lock_guard<std::mutex> lk(mtx_);
  bool removed = pending_.erase(id) > 0;
  cv_.notify_all();
  return removed;
}

bool UploadHeap::is_pending(const SegmentId &id) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return pending_.count(id) > 0;
}

size_t UploadHeap::pending_count() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return pending_.size();
}

bool UploadHeap::wait_for_work(TaskManager &tm, std::chrono::milliseconds d) {
  bool stopping = false;
  StopCallback stop_cb(tm, [&] {
    std::lock_guard<std::mutex> lk(mtx_);
    stopping = true;
    cv_.notify_all();
  });
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait_for(lk, d, [&] { return stopping || !heap_.empty(); });
  return !stopping && !heap_.empty();
}

bool UploadHeap::wait_idle(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lk(mtx_);
  return cv_.wait_for(lk, d,
                      [&] { return heap_.empty() && pending_.empty(); });
}

} // namespace sectorcast
