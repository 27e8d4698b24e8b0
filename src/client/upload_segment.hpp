#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "file_set.hpp"

namespace sectorcast {

struct SegmentId {
    FileId fid{0};
    uint64_t index{0};

    bool operator==(const SegmentId& o) const { return fid == o.fid && index == o.index; }
    bool operator!=(const SegmentId& o) const { return !(*this == o); }
    bool operator<(const SegmentId& o) const {
        return fid != o.fid ? fid < o.fid : index < o.index;
    }
};

struct SegmentIdHash {
    size_t operator()(const SegmentId& id) const {
        return std::hash<uint64_t>()(id.fid * 0x9e3779b97f4a7c15ull ^ id.index);
    }
};

enum class SegmentState {
    Created,
    RetrievingData,
    Encoding,
    Encrypting,
    Dispatched,
    Completing,
    Stuck,
    Released
};

const char* segment_state_str(SegmentState s);

class Worker;

// A segment of a file that still needs sectors uploaded. Everything below
// the mutex is guarded by it.
struct UnfinishedSegment {
    UnfinishedSegment(SegmentId id, std::unique_ptr<FileHandle> file,
                      uint64_t offset, uint64_t length, int min_sectors,
                      int total_sectors, uint64_t sector_size);

    // Requires mu. True once every sector is uploaded, or nothing is in
    // flight and no worker is left to try.
    bool upload_complete() const;
    // Requires mu.
    int slots_claimed() const;

    SegmentState state() const;
    void set_state(SegmentState s);
    std::string describe() const;

    const SegmentId id;
    const std::unique_ptr<FileHandle> file;

    const uint64_t offset;
    const uint64_t length;
    const int min_sectors;
    const int total_sectors;
    const uint64_t sector_size;

    uint64_t memory_needed{0};

    // Only touched by the lifecycle task before the segment is dispatched.
    std::vector<uint8_t> logical_data;

    mutable std::mutex mu;
    uint64_t memory_released{0};
    bool stuck{false};
    bool stuck_repair{false};
    std::vector<std::vector<uint8_t>> physical_data;
    // False where encryption failed. Such a sector is encrypted again by the
    // worker that picks it up and is never sent in clear.
    std::vector<bool> sector_encrypted;
    // True if the sector is uploaded or a worker is trying to upload it.
    std::vector<bool> sector_slots;
    int sectors_completed{0};
    int sectors_uploading{0};
    bool released{false};
    std::set<std::string> unused_hosts;
    int workers_remaining{0};
    std::vector<std::shared_ptr<Worker>> backup_workers;

private:
    SegmentState state_{SegmentState::Created};
};

// Fraction of sectors that must be complete for a repair to count as a
// success.
bool repair_successful(int sectors_completed, int total_sectors, double threshold);

// Whether the segment should be rebuilt from the network rather than read
// from the local copy.
bool needs_download(int sectors_completed, int min_sectors, int total_sectors,
                    double threshold);

} // namespace sectorcast
