#pragma once
#include <asio.hpp>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>
#include "client_config.hpp"
#include "dispatch.hpp"
#include "download.hpp"
#include "file_set.hpp"
#include "memory_manager.hpp"
#include "task_manager.hpp"
#include "upload_heap.hpp"
#include "upload_segment.hpp"
#include "worker.hpp"

namespace sectorcast {

// Owns the shared upload state (memory budget, upload heap, worker pool)
// and drives segments from retrieval through dispatch to cleanup.
class StorageClient {
public:
    StorageClient(const ClientConfig& cfg, FileSet& files,
                  std::shared_ptr<Downloader> downloader);
    ~StorageClient();
    StorageClient(const StorageClient&) = delete;
    StorageClient& operator=(const StorageClient&) = delete;

    // Starts the worker threads, the repair loop and the stuck loop.
    void start();
    void stop();
    bool online() const;

    std::shared_ptr<Worker> add_worker(std::unique_ptr<HostSession> session);
    bool remove_worker(const std::string& host_id);
    std::vector<std::shared_ptr<Worker>> workers() const;

    // Builds the segments of path that are missing sectors. With
    // stuck_repair only segments currently marked stuck are returned.
    std::vector<std::shared_ptr<UnfinishedSegment>>
    create_unfinished_segments(const std::string& path, bool stuck_repair);
    // Queues the unfinished segments of path. Returns how many were queued.
    size_t upload_file(const std::string& path, bool stuck_repair = false);
    bool wait_idle(std::chrono::milliseconds timeout);
    // Stuck segments reported repaired through the stuck-success channel.
    uint64_t stuck_repairs() const { return stuck_repairs_; }

    // Reserves memory for uc and hands it to a lifecycle task.
    bool upload_segment(std::shared_ptr<UnfinishedSegment> uc);
    // Lifecycle of one attempt. The caller holds uc->memory_needed bytes of
    // the memory budget; all of it is returned by the time uc is released.
    void retrieve_data_and_dispatch_segment(const std::shared_ptr<UnfinishedSegment>& uc);
    std::error_code retrieve_logical_segment_data(UnfinishedSegment& uc);
    std::error_code download_logical_segment_data(UnfinishedSegment& uc);

    void dispatch_segment(const std::shared_ptr<UnfinishedSegment>& uc);
    void notify_backup_workers(const std::shared_ptr<UnfinishedSegment>& uc);
    void cleanup_upload_segment(const std::shared_ptr<UnfinishedSegment>& uc);
    void update_upload_segment_stuck_status(const std::shared_ptr<UnfinishedSegment>& uc);

    MemoryManager& memory() { return memory_; }
    TaskManager& tasks() { return tasks_; }
    UploadHeap& upload_heap() { return heap_; }
    FileSet& files() { return files_; }
    const ClientConfig& config() const { return cfg_; }

private:
    void repair_loop();
    void stuck_loop();
    void prepare_and_dispatch(const std::shared_ptr<UnfinishedSegment>& uc);
    void encrypt_sectors(UnfinishedSegment& uc);
    void abort_attempt(UnfinishedSegment& uc, uint64_t memory);
    void abandon_segment(const std::shared_ptr<UnfinishedSegment>& uc, bool memory_held);
    void post_dir_update(const std::string& path);

    const ClientConfig cfg_;
    FileSet& files_;
    std::shared_ptr<Downloader> downloader_;

    TaskManager tasks_;
    MemoryManager memory_;
    UploadHeap heap_;
    SharedRng rng_;

    asio::io_context io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::vector<std::thread> io_threads_;
    asio::thread_pool lifecycle_pool_;
    std::thread repair_thread_;
    std::thread stuck_thread_;

    mutable std::mutex pool_mtx_;
    std::map<std::string, std::shared_ptr<Worker>> worker_pool_;

    std::atomic<bool> started_{false};
    std::atomic<bool> stopped_{false};
    std::atomic<uint64_t> stuck_repairs_{0};
};

} // namespace sectorcast
