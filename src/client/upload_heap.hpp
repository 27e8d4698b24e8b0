#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>
#include "channel.hpp"
#include "task_manager.hpp"
#include "upload_segment.hpp"

namespace sectorcast {

// Segments waiting for work, ordered stuck first and then least complete,
// plus the exact set of segments currently being worked on.
class UploadHeap {
public:
    explicit UploadHeap(size_t stuck_channel_capacity);

    // Refused if the segment is already queued or pending.
    bool push(std::shared_ptr<UnfinishedSegment> uc);
    // Moves the best candidate from the queue to the pending set.
    std::shared_ptr<UnfinishedSegment> pop();
    size_t size() const;

    // Returns false if the id was already pending.
    bool add_pending(const SegmentId& id);
    // Returns false if the id was not pending.
    bool remove_pending(const SegmentId& id);
    bool is_pending(const SegmentId& id) const;
    size_t pending_count() const;

    // Returns true if the queue became non-empty before timeout or stop.
    bool wait_for_work(TaskManager& tm, std::chrono::milliseconds d);
    // Returns true once nothing is queued or pending.
    bool wait_idle(std::chrono::milliseconds d);

    Channel<std::string>& stuck_segment_success() { return stuck_success_; }

private:
    struct Entry {
        bool stuck;
        double completion;
        uint64_t seq;
        std::shared_ptr<UnfinishedSegment> segment;
    };
    struct Lower {
        bool operator()(const Entry& a, const Entry& b) const;
    };

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::vector<Entry> heap_;
    uint64_t next_seq_{0};
    std::unordered_set<SegmentId, SegmentIdHash> queued_;
    std::unordered_set<SegmentId, SegmentIdHash> pending_;
    Channel<std::string> stuck_success_;
};

} // namespace sectorcast
