#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include "crypto.hpp"
#include "errors.hpp"
#include "fec.hpp"

namespace sectorcast {

using FileId = uint64_t;
using Clock = std::chrono::system_clock;

struct FileInfo {
    std::string path;        // path inside the storage namespace
    std::string local_path;  // may be empty if no local copy exists
    uint64_t file_size{0};
    ErasurePlan plan{};
    std::vector<uint8_t> key;
};

struct SectorLocation {
    uint16_t sector_index;
    std::string host_id;
};

struct DirMetadata {
    uint64_t num_files{0};
    uint64_t num_stuck_segments{0};
    uint64_t aggregate_size{0};
    Clock::time_point updated{};
};

class FileEntry {
public:
    FileEntry(FileId id, const FileInfo& info, std::unique_ptr<ErasureCoder> ec,
              std::unique_ptr<CryptoProvider> cipher);

    FileId id() const { return id_; }
    const std::string& path() const { return path_; }
    uint64_t file_size() const { return file_size_; }
    uint64_t sector_size() const { return ec_->sector_size(); }
    uint64_t segment_size() const { return sector_size() * ec_->min_sectors(); }
    uint64_t num_segments() const { return num_segments_; }
    const ErasureCoder& erasure_code() const { return *ec_; }

    std::string local_path() const;
    void set_local_path(const std::string& p);

    // Callers keep the returned cipher alive while they use it, so a
    // replacement never pulls it out from under an upload in progress.
    std::shared_ptr<CryptoProvider> cipher() const;
    void set_cipher(std::shared_ptr<CryptoProvider> cipher);

    // Reads [offset, offset+length) from the local copy into a zero padded
    // buffer of length bytes. A short read at end of file is not an error.
    std::error_code read_range(uint64_t offset, uint64_t length,
                               std::vector<uint8_t>& out) const;

    bool stuck(uint64_t index) const;
    bool set_stuck(uint64_t index, bool stuck);
    uint64_t num_stuck_segments() const;

    void add_sector(uint64_t index, uint16_t sector_index, const std::string& host_id);
    std::vector<SectorLocation> sectors(uint64_t index) const;

    void set_time_access(Clock::time_point t);
    Clock::time_point time_access() const;

private:
    const FileId id_;
    const std::string path_;
    const uint64_t file_size_;
    const std::unique_ptr<ErasureCoder> ec_;
    uint64_t num_segments_;

    mutable std::mutex mtx_;
    std::string local_path_;
    std::shared_ptr<CryptoProvider> cipher_;
    std::vector<bool> stuck_;
    std::vector<std::vector<SectorLocation>> sectors_;
    Clock::time_point access_time_{};
};

class FileSet;

// An open reference to a file entry. Closing is idempotent and the
// destructor closes.
class FileHandle {
public:
    FileHandle(FileSet& set, std::shared_ptr<FileEntry> entry);
    ~FileHandle();
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    FileEntry& entry() { return *entry_; }
    const FileEntry& entry() const { return *entry_; }
    FileEntry* operator->() { return entry_.get(); }
    std::shared_ptr<FileEntry> shared_entry() const { return entry_; }
    // Returns false if the handle was already closed.
    bool close();
    bool closed() const;

private:
    FileSet& set_;
    std::shared_ptr<FileEntry> entry_;
    mutable std::mutex mtx_;
    bool closed_{false};
};

class FileSet {
public:
    FileSet() = default;
    FileSet(const FileSet&) = delete;
    FileSet& operator=(const FileSet&) = delete;

    std::shared_ptr<FileEntry> create(const FileInfo& info, std::string& err);
    std::unique_ptr<FileHandle> open(const std::string& path);
    bool remove(const std::string& path);
    int open_count(const std::string& path) const;
    std::vector<std::string> paths() const;

    // Recomputes the aggregate metadata of every directory above path.
    void update_dir_metadata(const std::string& path);
    DirMetadata dir_metadata(const std::string& dir) const;
    uint64_t metadata_updates() const;

private:
    friend class FileHandle;
    void close_entry(const std::string& path);

    struct Record {
        std::shared_ptr<FileEntry> entry;
        int open{0};
    };

    mutable std::mutex mtx_;
    FileId next_id_{1};
    std::unordered_map<std::string, Record> files_;
    std::map<std::string, DirMetadata> dirs_;
    uint64_t metadata_updates_{0};
};

std::string parent_dir(const std::string& path);

} // namespace sectorcast
