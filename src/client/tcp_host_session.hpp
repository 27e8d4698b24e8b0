#pragma once
#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include "host_session.hpp"
#include "protocol.hpp"

namespace sectorcast {

// Host session over one TCP connection speaking the sector frame protocol.
// Calls are synchronous: each runs a private io_context in short slices so
// the stop signal and the per-request timeout are observed.
class TcpHostSession : public HostSession {
public:
    using tcp = asio::ip::tcp;

    TcpHostSession(std::string host, uint16_t port, std::chrono::milliseconds timeout);
    ~TcpHostSession() override;

    const std::string& host_id() const override { return host_id_; }
    bool good_for_upload() const override { return !full_; }
    std::error_code upload_sector(uint64_t file_id, uint64_t segment_index,
                                  uint16_t sector_index,
                                  const std::vector<uint8_t>& data,
                                  TaskManager& tm) override;

private:
    std::error_code connect(TaskManager& tm);
    std::error_code run_op(bool& done, TaskManager& tm,
                           std::chrono::steady_clock::time_point deadline);
    void drop_connection();

    const std::string host_;
    const uint16_t port_;
    const std::string host_id_;
    const std::chrono::milliseconds timeout_;

    std::mutex mtx_;
    asio::io_context io_;
    tcp::socket sock_;
    bool connected_{false};
    std::atomic<bool> full_{false};
};

} // namespace sectorcast
