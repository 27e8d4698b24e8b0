#include "download.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <cstring>

namespace sectorcast {

DownloadBuffer::DownloadBuffer(uint64_t length, uint64_t sector_size)
    : buf(length, 0), sector_size(sector_size) {}

bool DownloadBuffer::write_at(uint64_t offset, const uint8_t *data, size_t n) {
  if (offset > buf.size() || n > buf.size() - offset)
    return false;
  if (n)
    std::memcpy(buf.data() + offset, data, n);
  return true;
}

FileSnapshot make_snapshot(const FileEntry &entry) {
  FileSnapshot s;
  s.id = entry.id();
  s.path = entry.path();
  s.file_size = entry.file_size();
  s.segment_size = entry.segment_size();
  s.plan = ErasurePlan{(uint16_t)entry.erasure_code().min_sectors(),
                       (uint16_t)entry.erasure_code().num_sectors(),
                       (uint32_t)entry.sector_size()};
  s.sectors.reserve(entry.num_segments());
  for (uint64_t i = 0; i < entry.num_segments(); i++)
    s.sectors.push_back(entry.sectors(i));
  return s;
}

Download::Download(std::shared_ptr<DownloadBuffer> destination)
    : destination_(std::move(destination)) {}

void Download::run_callback(CompleteFn &cb, std::error_code ec) {
  std::error_code cb_err = cb(ec);
  if (cb_err)
    Logger::instance().log(LogLevel::DEBUG, "download completion hook: %s",
                           cb_err.message().c_str());
}

void Download::on_complete(CompleteFn cb) {
  std::error_code ec;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (!done_) {
      callbacks_.push_back(std::move(cb));
      return;
    }
    ec = err_;
  }
  run_callback(cb, ec);
}

void Download::complete(std::error_code ec) {
  std::vector<CompleteFn> cbs;
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (done_)
      return;
    done_ = true;
    err_ = ec;
    cbs.swap(callbacks_);
  }
  for (auto &cb : cbs)
    run_callback(cb, ec);
  // Waiters are released after the hooks so they observe their side effects.
  std::lock_guard<std::mutex> lk(mtx_);
  finished_ = true;
  cv_.notify_all();
}

std::error_code Download::wait(TaskManager &tm) {
  bool stopping = false;
  StopCallback stop_cb(tm, [&] {
    std::lock_guard<std::mutex> lk(mtx_);
    stopping = true;
    cv_.notify_all();
  });
  std::unique_lock<std::mutex> lk(mtx_);
  cv_.wait(lk, [&] { return finished_ || stopping; });
  if (!finished_)
    return errc::interrupted;
  return err_;
}

std::error_code Download::err() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return err_;
}

bool Download::completed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return finished_;
}

std::shared_ptr<DownloadBuffer> Download::destination() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return destination_;
}

void Download::clear_destination() {
  std::lock_guard<std::mutex> lk(mtx_);
  destination_.reset();
}

} // namespace sectorcast
