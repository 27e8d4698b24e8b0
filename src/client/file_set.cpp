#include "file_set.hpp"
#include "logging.hpp"
#include <fstream>

namespace sectorcast {

std::string parent_dir(const std::string &path) {
  auto pos = path.rfind('/');
  if (pos == std::string::npos || pos == 0)
    return "";
  return path.substr(0, pos);
}

FileEntry::FileEntry(FileId id, const FileInfo &info,
                     std::unique_ptr<ErasureCoder> ec,
                     std::unique_ptr<CryptoProvider> cipher)
    : id_(id), path_(info.path), file_size_(info.file_size), ec_(std::move(ec)),
      local_path_(info.local_path), cipher_(std::move(cipher)) {
  uint64_t seg = segment_size();
  num_segments_ = file_size_ == 0 ? 1 : (file_size_ + seg - 1) / seg;
  stuck_.assign(num_segments_, false);
  sectors_.resize(num_segments_);
}

std::string FileEntry::local_path() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return local_path_;
}

void FileEntry::set_local_path(const std::string &p) {
  std::lock_guard<std::mutex> lk(mtx_);
  local_path_ = p;
}

std::shared_ptr<CryptoProvider> FileEntry::cipher() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return cipher_;
}

void FileEntry::set_cipher(std::shared_ptr<CryptoProvider> cipher) {
  std::lock_guard<std::mutex> lk(mtx_);
  cipher_ = std::move(cipher);
}

std::error_code FileEntry::read_range(uint64_t offset, uint64_t length,
                                      std::vector<uint8_t> &out) const {
  std::string p = local_path();
  if (p.empty())
    return errc::not_available_locally;
  std::ifstream in(p, std::ios::binary);
  if (!in)
    return errc::open_failed;
  out.assign(length, 0);
  in.seekg((std::streamoff)offset);
  if (!in) {
    // Offset past the end: nothing to read, the buffer stays zeroed.
    return {};
  }
  in.read((char *)out.data(), (std::streamsize)length);
  if (in.bad())
    return errc::read_failed;
  return {};
}

bool FileEntry::stuck(uint64_t index) const {
  std::lock_guard<std::mutex> lk(mtx_);
  return index < stuck_.size() && stuck_[index];
}

bool FileEntry::set_stuck(uint64_t index, bool stuck) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (index >= stuck_.size())
    return false;
  stuck_[index] = stuck;
  return true;
}

uint64_t FileEntry::num_stuck_segments() const {
  std::lock_guard<std::mutex> lk(mtx_);
  uint64_t n = 0;
  for (bool s : stuck_)
    n += s ? 1 : 0;
  return n;
}

void FileEntry::add_sector(uint64_t index, uint16_t sector_index,
                           const std::string &host_id) {
  std::lock_guard<std::mutex> lk(mtx_);
  if (index >= sectors_.size())
    return;
  for (auto &loc : sectors_[index]) {
    if (loc.sector_index == sector_index && loc.host_id == host_id)
      return;
  }
  sectors_[index].push_back(SectorLocation{sector_index, host_id});
}

std::vector<SectorLocation> FileEntry::sectors(uint64_t index) const {
  std::lock_guard<std::mutex> lk(mtx_);
  if (index >= sectors_.size())
    return {};
  return sectors_[index];
}

void FileEntry::set_time_access(Clock::time_point t) {
  std::lock_guard<std::mutex> lk(mtx_);
  access_time_ = t;
}

Clock::time_point FileEntry::time_access() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return access_time_;
}

FileHandle::FileHandle(FileSet &set, std::shared_ptr<FileEntry> entry)
    : set_(set), entry_(std::move(entry)) {}

FileHandle::~FileHandle() { close(); }

bool FileHandle::close() {
  {
    std::lock_guard<std::mutex> lk(mtx_);
    if (closed_)
      return false;
    closed_ = true;
  }
  set_.close_entry(entry_->path());
  return true;
}

bool FileHandle::closed() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return closed_;
}

std::shared_ptr<FileEntry> FileSet::create(const FileInfo &info,
                                           std::string &err) {
  auto ec = std::make_unique<ReedSolomon>(info.plan);
  if (!ec->valid()) {
    err = "invalid erasure plan";
    return nullptr;
  }
  if (info.path.empty()) {
    err = "empty path";
    return nullptr;
  }
  if (info.key.empty()) {
    err = "missing encryption key";
    return nullptr;
  }
  auto cipher = std::make_unique<SodiumAead>();
  cipher->set_key(info.key);

  std::lock_guard<std::mutex> lk(mtx_);
  if (files_.count(info.path)) {
    err = "file already exists";
    return nullptr;
  }
  auto entry = std::make_shared<FileEntry>(next_id_++, info, std::move(ec),
                                           std::move(cipher));
  files_[info.path] = Record{entry, 0};
  return entry;
}

std::unique_ptr<FileHandle> FileSet::open(const std::string &path) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = files_.find(path);
  if (it == files_.end())
    return nullptr;
  it->second.open++;
  return std::make_unique<FileHandle>(*this, it->second.entry);
}

bool FileSet::remove(const std::string &path) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = files_.find(path);
  if (it == files_.end() || it->second.open > 0)
    return false;
  files_.erase(it);
  return true;
}

void FileSet::close_entry(const std::string &path) {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = files_.find(path);
  if (it == files_.end())
    return;
  if (it->second.open <= 0) {
    Logger::instance().log(LogLevel::WARN, "close of %s without open handle",
                           path.c_str());
    return;
  }
  it->second.open--;
}

int FileSet::open_count(const std::string &path) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = files_.find(path);
  return it == files_.end() ? 0 : it->second.open;
}

std::vector<std::string> FileSet::paths() const {
  std::lock_guard<std::mutex> lk(mtx_);
  std::vector<std::string> out;
  out.reserve(files_.size());
  for (auto &kv : files_)
    out.push_back(kv.first);
  return out;
}

void FileSet::update_dir_metadata(const std::string &path) {
  std::lock_guard<std::mutex> lk(mtx_);
  std::string dir = parent_dir(path);
  for (;;) {
    DirMetadata md;
    std::string prefix = dir.empty() ? "" : dir + "/";
    for (auto &kv : files_) {
      if (kv.first.compare(0, prefix.size(), prefix) != 0)
        continue;
      md.num_files++;
      md.num_stuck_segments += kv.second.entry->num_stuck_segments();
      md.aggregate_size += kv.second.entry->file_size();
    }
    md.updated = Clock::now();
    dirs_[dir] = md;
    if (dir.empty())
      break;
    dir = parent_dir(dir);
  }
  metadata_updates_++;
}

DirMetadata FileSet::dir_metadata(const std::string &dir) const {
  std::lock_guard<std::mutex> lk(mtx_);
  auto it = dirs_.find(dir);
  return it == dirs_.end() ? DirMetadata{} : it->second;
}

uint64_t FileSet::metadata_updates() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return metadata_updates_;
}

} // namespace sectorcast
