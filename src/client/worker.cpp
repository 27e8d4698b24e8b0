#include "worker.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "storage_client.hpp"
#include <algorithm>

namespace sectorcast {

Worker::Worker(asio::io_context &io, StorageClient &client,
               std::unique_ptr<HostSession> session, const WorkerConfig &cfg)
    : strand_(asio::make_strand(io)), client_(client),
      session_(std::move(session)), cfg_(cfg) {}

bool Worker::on_cooldown_locked(std::chrono::steady_clock::time_point now) const {
  if (consecutive_failures_ == 0)
    return false;
  int exp = std::min(consecutive_failures_, cfg_.max_cooldown_exponent);
  auto cooldown = cfg_.base_cooldown * (1ll << exp);
  return now - recent_failure_ < cooldown;
}

bool Worker::on_cooldown() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return on_cooldown_locked(std::chrono::steady_clock::now());
}

int Worker::consecutive_failures() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return consecutive_failures_;
}

size_t Worker::queued() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return queue_.size();
}

void Worker::record_failure() {
  std::lock_guard<std::mutex> lk(mtx_);
  consecutive_failures_++;
  recent_failure_ = std::chrono::steady_clock::now();
}

void Worker::record_success() {
  std::lock_guard<std::mutex> lk(mtx_);
  consecutive_failures_ = 0;
}

bool Worker::try_assign(const std::shared_ptr<UnfinishedSegment> &uc,
                        int index) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (killed_ || on_cooldown_locked(std::chrono::steady_clock::now()))
    return false;
  if (!session_->good_for_upload())
    return false;
  // A host stores at most one sector of a segment.
  if (!uc->unused_hosts.count(host_id()) || sector_index_map_.count(uc))
    return false;
  sector_index_map_[uc].push_back(index);
  return true;
}

std::vector<int>
Worker::assigned_sectors(const std::shared_ptr<UnfinishedSegment> &uc) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = sector_index_map_.find(uc);
  return it == sector_index_map_.end() ? std::vector<int>{} : it->second;
}

std::vector<int>
Worker::take_assignment(const std::shared_ptr<UnfinishedSegment> &uc) {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<int> out;
  auto it = sector_index_map_.find(uc);
  if (it != sector_index_map_.end()) {
    out = std::move(it->second);
    sector_index_map_.erase(it);
  }
  return out;
}

void Worker::signal_upload(std::shared_ptr<UnfinishedSegment> uc) {
  bool killed;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    killed = killed_;
    if (!killed && std::find(queue_.begin(), queue_.end(), uc) == queue_.end())
      queue_.push_back(uc);
  }
  if (killed) {
    drop_segment(uc, take_assignment(uc));
    return;
  }
  auto self = shared_from_this();
  asio::post(strand_, [self] { self->process_next(); });
}

void Worker::kill() {
  std::vector<std::pair<std::shared_ptr<UnfinishedSegment>, std::vector<int>>>
      drops;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    killed_ = true;
    for (auto &uc : queue_) {
      std::vector<int> assigned;
      auto it = sector_index_map_.find(uc);
      if (it != sector_index_map_.end()) {
        assigned = std::move(it->second);
        sector_index_map_.erase(it);
      }
      drops.emplace_back(uc, std::move(assigned));
    }
    queue_.clear();
  }
  for (auto &d : drops)
    drop_segment(d.first, d.second);
}

void Worker::process_next() {
  std::shared_ptr<UnfinishedSegment> uc;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (queue_.empty())
      return;
    uc = std::move(queue_.front());
    queue_.pop_front();
  }
  process_upload_segment(uc);
}

void Worker::drop_segment(const std::shared_ptr<UnfinishedSegment> &uc,
                          const std::vector<int> &assigned) {
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    for (int idx : assigned) {
      if (idx >= 0 && idx < (int)uc->sector_slots.size())
        uc->sector_slots[idx] = false;
    }
    if (uc->workers_remaining > 0)
      uc->workers_remaining--;
  }
  client_.cleanup_upload_segment(uc);
}

void Worker::process_upload_segment(
    const std::shared_ptr<UnfinishedSegment> &uc) {
  std::vector<int> assigned = take_assignment(uc);
  bool unusable;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    unusable = killed_ || on_cooldown_locked(std::chrono::steady_clock::now());
  }
  if (unusable || !session_->good_for_upload()) {
    drop_segment(uc, assigned);
    return;
  }

  if (assigned.empty()) {
    // Nothing for this worker yet. Stand by if the segment may still need
    // this host once another worker fails.
    {
      std::lock_guard<std::mutex> lk(uc->mu);
      bool candidate = uc->unused_hosts.count(host_id()) > 0;
      bool unfinished =
          !uc->released && uc->sectors_completed < uc->total_sectors;
      if (candidate && unfinished)
        uc->backup_workers.push_back(shared_from_this());
      else if (uc->workers_remaining > 0)
        uc->workers_remaining--;
    }
    client_.cleanup_upload_segment(uc);
    return;
  }

  // Claim the sector data and register the uploads in the same critical
  // section that retires this worker, so the segment never looks finished
  // in between.
  std::vector<int> indexes;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    if (uc->workers_remaining > 0)
      uc->workers_remaining--;
    uc->unused_hosts.erase(host_id());
    for (int idx : assigned) {
      if (idx < 0 || idx >= (int)uc->sector_slots.size())
        continue;
      if (idx >= (int)uc->physical_data.size() ||
          uc->physical_data[idx].empty()) {
        uc->sector_slots[idx] = false;
        continue;
      }
      uc->sectors_uploading++;
      indexes.push_back(idx);
    }
  }

  bool failed = false;
  for (int idx : indexes) {
    if (!upload_one(uc, idx))
      failed = true;
  }
  if (failed)
    client_.notify_backup_workers(uc);
  client_.cleanup_upload_segment(uc);
}

bool Worker::upload_one(const std::shared_ptr<UnfinishedSegment> &uc,
                        int index) {
  std::vector<uint8_t> data;
  bool encrypted;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    data = std::move(uc->physical_data[index]);
    uc->physical_data[index].clear();
    encrypted = uc->sector_encrypted[index];
  }

  FileEntry &entry = uc->file->entry();
  std::error_code ec;
  if (!encrypted) {
    if (entry.cipher()->encrypt(entry.id(), uc->id.index, (uint16_t)index,
                               data))
      encrypted = true;
    else
      ec = errc::encrypt_failed;
  }
  if (!ec)
    ec = session_->upload_sector(entry.id(), uc->id.index, (uint16_t)index,
                                 data, client_.tasks());

  uint64_t freed = 0;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    uc->sectors_uploading--;
    if (!ec) {
      uc->sectors_completed++;
      uc->memory_released += uc->sector_size;
      freed = uc->sector_size;
    } else {
      uc->sector_slots[index] = false;
      uc->physical_data[index] = std::move(data);
      uc->sector_encrypted[index] = encrypted;
    }
  }

  if (!ec) {
    entry.add_sector(uc->id.index, (uint16_t)index, host_id());
    client_.memory().release(freed);
    record_success();
    return true;
  }

  Logger::instance().log(LogLevel::DEBUG,
                         "worker %s: sector %d of segment %s failed: %s",
                         host_id().c_str(), index, uc->describe().c_str(),
                         ec.message().c_str());
  if (ec != errc::interrupted && ec != errc::encrypt_failed)
    record_failure();
  return false;
}

} // namespace sectorcast
