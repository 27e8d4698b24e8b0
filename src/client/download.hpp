#pragma once
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <vector>
#include "file_set.hpp"
#include "task_manager.hpp"

namespace sectorcast {

// In-memory download destination, zero filled to its full length.
struct DownloadBuffer {
    DownloadBuffer(uint64_t length, uint64_t sector_size);
    bool write_at(uint64_t offset, const uint8_t* data, size_t n);

    std::vector<uint8_t> buf;
    uint64_t sector_size;
};

// Immutable view of a file's metadata taken when a download starts.
struct FileSnapshot {
    FileId id{0};
    std::string path;
    uint64_t file_size{0};
    uint64_t segment_size{0};
    ErasurePlan plan{};
    std::vector<std::vector<SectorLocation>> sectors;
};

FileSnapshot make_snapshot(const FileEntry& entry);

struct DownloadParams {
    std::shared_ptr<DownloadBuffer> destination;
    std::string destination_type;
    FileSnapshot file;
    uint64_t latency_target_ms{0};
    uint64_t length{0};
    bool needs_memory{false};
    uint64_t offset{0};
    uint32_t overdrive{0};
    int priority{0};
};

class Download {
public:
    using CompleteFn = std::function<std::error_code(std::error_code)>;

    explicit Download(std::shared_ptr<DownloadBuffer> destination);

    // Registers cb to run once the download finishes. Runs it right away if
    // it already has.
    void on_complete(CompleteFn cb);
    // Called by the download subsystem, once.
    void complete(std::error_code ec);
    // Blocks until the download finishes or tm stops.
    std::error_code wait(TaskManager& tm);

    std::error_code err() const;
    bool completed() const;
    std::shared_ptr<DownloadBuffer> destination() const;
    void clear_destination();

private:
    void run_callback(CompleteFn& cb, std::error_code ec);

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    bool done_{false};
    bool finished_{false};
    std::error_code err_;
    std::vector<CompleteFn> callbacks_;
    std::shared_ptr<DownloadBuffer> destination_;
};

class Downloader {
public:
    virtual ~Downloader() = default;
    virtual std::shared_ptr<Download> new_download(const DownloadParams& params,
                                                   std::error_code& ec) = 0;
};

} // namespace sectorcast
