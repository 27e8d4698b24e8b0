#include "storage_client.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <set>

namespace sectorcast {

StorageClient::StorageClient(const ClientConfig &cfg, FileSet &files,
                             std::shared_ptr<Downloader> downloader)
    : cfg_(cfg), files_(files), downloader_(std::move(downloader)),
      memory_(cfg.memory_limit, tasks_), heap_(cfg.stuck_channel_capacity),
      rng_(cfg.seed), work_(asio::make_work_guard(io_)),
      lifecycle_pool_(cfg.lifecycle_threads > 0 ? cfg.lifecycle_threads : 1) {}

StorageClient::~StorageClient() { stop(); }

void StorageClient::start() {
  if (started_.exchange(true))
    return;
  int n = cfg_.io_threads > 0 ? cfg_.io_threads : 1;
  for (int i = 0; i < n; i++)
    io_threads_.emplace_back([this] { io_.run(); });
  repair_thread_ = std::thread([this] { repair_loop(); });
  stuck_thread_ = std::thread([this] { stuck_loop(); });
  Logger::instance().log(LogLevel::INFO,
                         "storage client started: %d io threads, %llu bytes "
                         "of upload memory",
                         n, (unsigned long long)memory_.limit());
}

void StorageClient::stop() {
  if (stopped_.exchange(true))
    return;
  tasks_.stop();
  work_.reset();
  io_.stop();
  for (auto &t : io_threads_) {
    if (t.joinable())
      t.join();
  }
  io_threads_.clear();
  lifecycle_pool_.join();
  if (repair_thread_.joinable())
    repair_thread_.join();
  if (stuck_thread_.joinable())
    stuck_thread_.join();
  Logger::instance().log(LogLevel::INFO, "storage client stopped");
}

bool StorageClient::online() const {
  if (tasks_.stopped())
    return false;
  std::lock_guard<std::mutex> lk(pool_mtx_);
  for (auto &kv : worker_pool_) {
    if (kv.second->good_for_upload())
      return true;
  }
  return false;
}

std::shared_ptr<Worker>
StorageClient::add_worker(std::unique_ptr<HostSession> session) {
  WorkerConfig wcfg;
  wcfg.base_cooldown = cfg_.upload_cooldown;
  wcfg.max_cooldown_exponent = cfg_.max_cooldown_exponent;
  auto w = std::make_shared<Worker>(io_, *this, std::move(session), wcfg);
  std::lock_guard<std::mutex> lk(pool_mtx_);
  if (!worker_pool_.emplace(w->host_id(), w).second) {
    Logger::instance().log(LogLevel::WARN, "host %s already in worker pool",
                           w->host_id().c_str());
    return nullptr;
  }
  return w;
}

bool StorageClient::remove_worker(const std::string &host_id) {
  std::shared_ptr<Worker> w;
  {
    std::lock_guard<std::mutex> lk(pool_mtx_);
    auto it = worker_pool_.find(host_id);
    if (it == worker_pool_.end())
      return false;
    w = std::move(it->second);
    worker_pool_.erase(it);
  }
  w->kill();
  return true;
}

std::vector<std::shared_ptr<Worker>> StorageClient::workers() const {
  std::lock_guard<std::mutex> lk(pool_mtx_);
  std::vector<std::shared_ptr<Worker>> out;
  out.reserve(worker_pool_.size());
  for (auto &kv : worker_pool_)
    out.push_back(kv.second);
  return out;
}

std::vector<std::shared_ptr<UnfinishedSegment>>
StorageClient::create_unfinished_segments(const std::string &path,
                                          bool stuck_repair) {
  std::vector<std::shared_ptr<UnfinishedSegment>> out;
  auto lookup = files_.open(path);
  if (!lookup) {
    Logger::instance().log(LogLevel::WARN, "no such file: %s", path.c_str());
    return out;
  }
  FileEntry &entry = lookup->entry();
  const ErasureCoder &ec = entry.erasure_code();
  const int min = ec.min_sectors();
  const int total = ec.num_sectors();
  const uint64_t ss = entry.sector_size();

  std::set<std::string> hosts;
  for (auto &w : workers())
    hosts.insert(w->host_id());

  for (uint64_t index = 0; index < entry.num_segments(); index++) {
    bool stuck = entry.stuck(index);
    if (stuck_repair && !stuck)
      continue;
    auto handle = files_.open(path);
    if (!handle)
      break;
    auto uc = std::make_shared<UnfinishedSegment>(
        SegmentId{entry.id(), index}, std::move(handle),
        index * entry.segment_size(), entry.segment_size(), min, total, ss);
    uc->memory_needed = ss * (uint64_t)(min + total);

    bool healthy;
    {
      std::lock_guard<std::mutex> lk(uc->mu);
      uc->stuck = stuck;
      uc->stuck_repair = stuck_repair;
      uc->unused_hosts = hosts;
      for (auto &loc : entry.sectors(index)) {
        // Sectors on hosts that left the pool no longer count.
        if (!hosts.count(loc.host_id) || loc.sector_index >= total)
          continue;
        if (!uc->sector_slots[loc.sector_index]) {
          uc->sector_slots[loc.sector_index] = true;
          uc->sectors_completed++;
        }
        uc->unused_hosts.erase(loc.host_id);
      }
      healthy = uc->sectors_completed >= total;
    }
    if (healthy)
      continue;
    out.push_back(std::move(uc));
  }
  return out;
}

size_t StorageClient::upload_file(const std::string &path, bool stuck_repair) {
  size_t queued = 0;
  for (auto &uc : create_unfinished_segments(path, stuck_repair)) {
    if (heap_.push(uc))
      queued++;
  }
  Logger::instance().log(LogLevel::DEBUG, "queued %zu segments of %s", queued,
                         path.c_str());
  return queued;
}

bool StorageClient::wait_idle(std::chrono::milliseconds timeout) {
  return heap_.wait_idle(timeout);
}

void StorageClient::repair_loop() {
  while (!tasks_.stopped()) {
    if (!heap_.wait_for_work(tasks_, cfg_.repair_poll))
      continue;
    auto uc = heap_.pop();
    if (uc)
      upload_segment(std::move(uc));
  }
}

void StorageClient::stuck_loop() {
  while (!tasks_.stopped()) {
    std::string path;
    if (!heap_.stuck_segment_success().recv_for(path, tasks_, cfg_.repair_poll))
      continue;
    stuck_repairs_++;
    // A repair just worked for this file, so its other stuck segments are
    // worth another try. Queued or pending segments are not added twice.
    size_t queued = upload_file(path, true);
    Logger::instance().log(LogLevel::INFO,
                           "stuck segment of %s repaired, %zu more queued",
                           path.c_str(), queued);
  }
}

bool StorageClient::upload_segment(std::shared_ptr<UnfinishedSegment> uc) {
  heap_.add_pending(uc->id);
  if (!memory_.acquire(uc->memory_needed)) {
    abandon_segment(uc, false);
    return false;
  }
  asio::post(lifecycle_pool_,
             [this, uc] { retrieve_data_and_dispatch_segment(uc); });
  return true;
}

void StorageClient::abandon_segment(const std::shared_ptr<UnfinishedSegment> &uc,
                                    bool memory_held) {
  uint64_t outstanding = 0;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    if (uc->released)
      return;
    uc->released = true;
    uc->workers_remaining = 0;
    if (memory_held) {
      outstanding = uc->memory_needed - uc->memory_released;
      uc->memory_released = uc->memory_needed;
    }
  }
  if (outstanding > 0)
    memory_.release(outstanding);
  uc->file->close();
  uc->set_state(SegmentState::Released);
  heap_.remove_pending(uc->id);
  Logger::instance().log(LogLevel::DEBUG, "segment %s abandoned",
                         uc->describe().c_str());
}

void StorageClient::retrieve_data_and_dispatch_segment(
    const std::shared_ptr<UnfinishedSegment> &uc) {
  if (!tasks_.add()) {
    abandon_segment(uc, true);
    return;
  }
  prepare_and_dispatch(uc);
  cleanup_upload_segment(uc);
  tasks_.done();
}

void StorageClient::abort_attempt(UnfinishedSegment &uc, uint64_t memory) {
  uc.logical_data.clear();
  uc.logical_data.shrink_to_fit();
  {
    std::lock_guard<std::mutex> lk(uc.mu);
    for (auto &s : uc.physical_data)
      std::vector<uint8_t>().swap(s);
    uc.workers_remaining = 0;
    uc.memory_released += memory;
  }
  memory_.release(memory);
}

void StorageClient::prepare_and_dispatch(
    const std::shared_ptr<UnfinishedSegment> &uc) {
  const uint64_t erasure_memory = uc->sector_size * uc->min_sectors;
  uint64_t completed_memory;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    completed_memory = uc->sector_size * uc->slots_claimed();
  }

  uc->set_state(SegmentState::RetrievingData);
  std::error_code ec = retrieve_logical_segment_data(*uc);
  if (ec) {
    abort_attempt(*uc, erasure_memory + completed_memory);
    Logger::instance().log(LogLevel::DEBUG,
                           "retrieve logical data of segment %s failed: %s",
                           uc->describe().c_str(), ec.message().c_str());
    return;
  }

  uc->set_state(SegmentState::Encoding);
  std::vector<std::vector<uint8_t>> sectors;
  const ErasureCoder &coder = uc->file->entry().erasure_code();
  if (!coder.encode(uc->logical_data, sectors) ||
      sectors.size() < (size_t)uc->total_sectors) {
    abort_attempt(*uc, erasure_memory + completed_memory);
    Logger::instance().log(LogLevel::DEBUG, "erasure encode of segment %s failed",
                           uc->describe().c_str());
    return;
  }
  uc->logical_data.clear();
  uc->logical_data.shrink_to_fit();
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    uc->physical_data = std::move(sectors);
    uc->memory_released += erasure_memory;
  }
  memory_.release(erasure_memory);

  uc->set_state(SegmentState::Encrypting);
  encrypt_sectors(*uc);
  if (completed_memory > 0) {
    {
      std::lock_guard<std::mutex> lk(uc->mu);
      uc->memory_released += completed_memory;
    }
    memory_.release(completed_memory);
  }

  uc->set_state(SegmentState::Dispatched);
  dispatch_segment(uc);
}

void StorageClient::encrypt_sectors(UnfinishedSegment &uc) {
  FileEntry &entry = uc.file->entry();
  std::shared_ptr<CryptoProvider> cipher = entry.cipher();
  std::lock_guard<std::mutex> lk(uc.mu);
  for (size_t i = 0; i < uc.sector_slots.size(); i++) {
    if (uc.sector_slots[i]) {
      std::vector<uint8_t>().swap(uc.physical_data[i]);
      continue;
    }
    if (cipher->encrypt(entry.id(), uc.id.index, (uint16_t)i,
                       uc.physical_data[i])) {
      uc.sector_encrypted[i] = true;
    } else {
      uc.sector_encrypted[i] = false;
      Logger::instance().log(LogLevel::WARN,
                             "encrypting sector %zu of segment %s failed, "
                             "deferred to upload",
                             i, uc.describe().c_str());
    }
  }
}

std::error_code StorageClient::retrieve_logical_segment_data(UnfinishedSegment &uc) {
  int completed;
  {
    std::lock_guard<std::mutex> lk(uc.mu);
    completed = uc.sectors_completed;
  }
  bool need = needs_download(completed, uc.min_sectors, uc.total_sectors,
                             cfg_.repair_download_threshold);

  FileEntry &entry = uc.file->entry();
  if (entry.local_path().empty()) {
    if (need)
      return download_logical_segment_data(uc);
    return errc::not_available_locally;
  }

  std::vector<uint8_t> buf;
  std::error_code ec = entry.read_range(uc.offset, uc.length, buf);
  if (ec == errc::open_failed || ec == errc::not_available_locally) {
    if (need)
      return download_logical_segment_data(uc);
    return make_error_code(errc::open_failed);
  }
  if (ec) {
    if (need) {
      Logger::instance().log(LogLevel::DEBUG,
                             "failed to read %s, downloading instead: %s",
                             entry.local_path().c_str(), ec.message().c_str());
      return download_logical_segment_data(uc);
    }
    Logger::instance().log(LogLevel::DEBUG, "failed to read %s: %s",
                           entry.local_path().c_str(), ec.message().c_str());
    return make_error_code(errc::read_failed);
  }
  uc.logical_data = std::move(buf);
  return {};
}

std::error_code StorageClient::download_logical_segment_data(UnfinishedSegment &uc) {
  if (!downloader_)
    return make_error_code(errc::download_failed);
  FileEntry &entry = uc.file->entry();

  uint64_t download_length = uc.length;
  if (uc.id.index == entry.num_segments() - 1 &&
      entry.file_size() % uc.length != 0)
    download_length = entry.file_size() % uc.length;

  DownloadParams p;
  p.destination = std::make_shared<DownloadBuffer>(uc.length, entry.sector_size());
  p.destination_type = "buffer";
  p.file = make_snapshot(entry);
  p.latency_target_ms = 200000;
  p.length = download_length;
  p.needs_memory = false; // covered by the segment's own reservation
  p.offset = uc.offset;
  p.overdrive = 0;
  p.priority = 0;

  std::error_code ec;
  auto d = downloader_->new_download(p, ec);
  if (ec)
    return ec;
  if (!d)
    return make_error_code(errc::download_failed);

  std::shared_ptr<FileEntry> shared = uc.file->shared_entry();
  d->on_complete([shared](std::error_code) {
    shared->set_time_access(Clock::now());
    return std::error_code();
  });

  ec = d->wait(tasks_);
  std::shared_ptr<DownloadBuffer> dest = d->destination();
  d->clear_destination();
  if (ec == errc::interrupted) {
    Logger::instance().log(LogLevel::DEBUG,
                           "repair download of segment %s interrupted by stop",
                           uc.describe().c_str());
    return ec;
  }
  if (ec)
    return ec;
  if (!dest)
    return make_error_code(errc::download_failed);
  uc.logical_data = std::move(dest->buf);
  return {};
}

void StorageClient::dispatch_segment(const std::shared_ptr<UnfinishedSegment> &uc) {
  heap_.add_pending(uc->id);
  auto ws = workers();
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    uc->workers_remaining += (int)ws.size();
  }
  int assigned = random_assign_sectors(ws, uc, rng_);
  Logger::instance().log(LogLevel::DEBUG,
                         "segment %s dispatched to %zu workers, %d sectors "
                         "assigned",
                         uc->describe().c_str(), ws.size(), assigned);
  for (auto &w : ws)
    w->signal_upload(uc);
}

void StorageClient::notify_backup_workers(
    const std::shared_ptr<UnfinishedSegment> &uc) {
  std::vector<std::shared_ptr<Worker>> backups;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    backups.swap(uc->backup_workers);
  }
  if (backups.empty())
    return;
  random_assign_sectors(backups, uc, rng_);
  for (auto &w : backups)
    w->signal_upload(uc);
}

void StorageClient::cleanup_upload_segment(
    const std::shared_ptr<UnfinishedSegment> &uc) {
  int available = 0;
  uint64_t freed = 0;
  bool release_now = false;
  uint64_t total_released;
  int workers_remaining, uploading;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    for (size_t i = 0; i < uc->sector_slots.size(); i++) {
      if (uc->sector_slots[i])
        continue;
      // Keep one free sector per worker still able to take it. The rest
      // are trimmed, later sectors first.
      if (available >= uc->workers_remaining) {
        freed += uc->sector_size;
        if (i < uc->physical_data.size())
          std::vector<uint8_t>().swap(uc->physical_data[i]);
        uc->sector_slots[i] = true;
      } else {
        available++;
      }
    }
    if (uc->upload_complete() && !uc->released) {
      uc->released = true;
      release_now = true;
    }
    uc->memory_released += freed;
    total_released = uc->memory_released;
    workers_remaining = uc->workers_remaining;
    uploading = uc->sectors_uploading;
  }

  // Free sectors only reappear after an upload failed, so this is when the
  // standby workers are needed.
  if (available > 0)
    notify_backup_workers(uc);
  if (freed > 0)
    memory_.release(freed);
  if (!release_now)
    return;

  update_upload_segment_stuck_status(uc);
  if (!uc->file->close())
    Logger::instance().log(LogLevel::DEBUG,
                           "file of segment %s already closed",
                           uc->describe().c_str());
  uc->set_state(SegmentState::Released);
  heap_.remove_pending(uc->id);

  if (total_released != uc->memory_needed) {
    Logger::instance().log(LogLevel::WARN,
                           "segment %s released with %llu of %llu bytes "
                           "returned (workers %d, uploading %d)",
                           uc->describe().c_str(),
                           (unsigned long long)total_released,
                           (unsigned long long)uc->memory_needed,
                           workers_remaining, uploading);
  }
}

void StorageClient::post_dir_update(const std::string &path) {
  if (!tasks_.add())
    return;
  asio::post(lifecycle_pool_, [this, path] {
    files_.update_dir_metadata(path);
    tasks_.done();
  });
}

void StorageClient::update_upload_segment_stuck_status(
    const std::shared_ptr<UnfinishedSegment> &uc) {
  uint64_t index;
  bool stuck, stuck_repair;
  int completed, total;
  {
    std::lock_guard<std::mutex> lk(uc->mu);
    index = uc->id.index;
    stuck = uc->stuck;
    stuck_repair = uc->stuck_repair;
    completed = uc->sectors_completed;
    total = uc->total_sectors;
  }

  bool successful =
      repair_successful(completed, total, cfg_.repair_download_threshold);
  bool offline = tasks_.stopped() || !online();
  if (!successful && offline) {
    Logger::instance().log(LogLevel::DEBUG,
                           "repair of segment %s unsuccessful, client offline",
                           uc->describe().c_str());
    return;
  }
  if (!successful)
    Logger::instance().log(LogLevel::DEBUG,
                           "repair of segment %s unsuccessful (%d/%d), marking "
                           "stuck",
                           uc->describe().c_str(), completed, total);
  else
    Logger::instance().log(LogLevel::DEBUG,
                           "repair of segment %s successful, marking not stuck",
                           uc->describe().c_str());

  FileEntry &entry = uc->file->entry();
  if (!entry.set_stuck(index, !successful))
    Logger::instance().log(LogLevel::DEBUG,
                           "could not set stuck status of segment %s",
                           uc->describe().c_str());
  uc->set_state(successful ? SegmentState::Completing : SegmentState::Stuck);
  post_dir_update(entry.path());

  if (stuck && successful && stuck_repair) {
    Logger::instance().log(LogLevel::DEBUG,
                           "stuck segment %s repaired, signalling %s",
                           uc->describe().c_str(), entry.path().c_str());
    if (!heap_.stuck_segment_success().send(entry.path(), tasks_))
      Logger::instance().log(LogLevel::DEBUG,
                             "stopped before stuck repair of %s was reported",
                             entry.path().c_str());
  }
}

} // namespace sectorcast
