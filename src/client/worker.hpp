#pragma once
#include <asio.hpp>
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <vector>
#include "host_session.hpp"
#include "upload_segment.hpp"

namespace sectorcast {

class StorageClient;

struct WorkerConfig {
    std::chrono::milliseconds base_cooldown{1000};
    int max_cooldown_exponent{10};
};

// Uploads sectors to a single host. Work arrives through signal_upload() and
// is run serially on the worker's strand.
class Worker : public std::enable_shared_from_this<Worker> {
public:
    Worker(asio::io_context& io, StorageClient& client,
           std::unique_ptr<HostSession> session, const WorkerConfig& cfg);

    const std::string& host_id() const { return session_->host_id(); }

    // Caller holds uc->mu. Records index as this worker's sector for uc if
    // the worker can take it.
    bool try_assign(const std::shared_ptr<UnfinishedSegment>& uc, int index);
    std::vector<int> assigned_sectors(const std::shared_ptr<UnfinishedSegment>& uc) const;

    void signal_upload(std::shared_ptr<UnfinishedSegment> uc);
    // Drops every queued segment. Later signals are dropped on arrival.
    void kill();

    bool on_cooldown() const;
    bool good_for_upload() const { return session_->good_for_upload(); }
    int consecutive_failures() const;
    size_t queued() const;

private:
    using Assignments = std::map<std::shared_ptr<UnfinishedSegment>, std::vector<int>>;

    void process_next();
    void process_upload_segment(const std::shared_ptr<UnfinishedSegment>& uc);
    std::vector<int> take_assignment(const std::shared_ptr<UnfinishedSegment>& uc);
    void drop_segment(const std::shared_ptr<UnfinishedSegment>& uc,
                      const std::vector<int>& assigned);
    bool upload_one(const std::shared_ptr<UnfinishedSegment>& uc, int index);
    bool on_cooldown_locked(std::chrono::steady_clock::time_point now) const;
    void record_failure();
    void record_success();

    asio::strand<asio::io_context::executor_type> strand_;
    StorageClient& client_;
    std::unique_ptr<HostSession> session_;
    WorkerConfig cfg_;

    mutable std::mutex mtx_;
    std::deque<std::shared_ptr<UnfinishedSegment>> queue_;
    Assignments sector_index_map_;
    bool killed_{false};
    int consecutive_failures_{0};
    std::chrono::steady_clock::time_point recent_failure_{};
};

} // namespace sectorcast
