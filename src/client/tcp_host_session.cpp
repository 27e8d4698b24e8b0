#include "tcp_host_session.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include <algorithm>

namespace sectorcast {

static const std::chrono::milliseconds kSlice(50);

TcpHostSession::TcpHostSession(std::string host, uint16_t port,
                               std::chrono::milliseconds timeout)
    : host_(std::move(host)), port_(port),
      host_id_(host_ + ":" + std::to_string(port)), timeout_(timeout),
      sock_(io_) {}

TcpHostSession::~TcpHostSession() {
  std::error_code ig;
  sock_.close(ig);
}

void TcpHostSession::drop_connection() {
  std::error_code ig;
  sock_.close(ig);
  connected_ = false;
  // Let the aborted handlers run so nothing refers to stack state.
  io_.restart();
  io_.run();
}

std::error_code
TcpHostSession::run_op(bool &done, TaskManager &tm,
                       std::chrono::steady_clock::time_point deadline) {
  while (!done) {
    if (tm.stopped()) {
      drop_connection();
      return make_error_code(errc::interrupted);
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline) {
      drop_connection();
      return make_error_code(errc::connection_failed);
    }
    if (io_.stopped())
      io_.restart();
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - now);
    io_.run_for(std::min(kSlice, left));
  }
  return {};
}

std::error_code TcpHostSession::connect(TaskManager &tm) {
  std::error_code ec;
  tcp::resolver res(io_);
  auto results = res.resolve(host_, std::to_string(port_), ec);
  if (ec) {
    Logger::instance().log(LogLevel::WARN, "resolve %s failed: %s",
                           host_id_.c_str(), ec.message().c_str());
    return make_error_code(errc::connection_failed);
  }
  bool done = false;
  std::error_code op_ec;
  asio::async_connect(sock_, results,
                      [&](std::error_code e, const tcp::endpoint &) {
                        op_ec = e;
                        done = true;
                      });
  ec = run_op(done, tm, std::chrono::steady_clock::now() + timeout_);
  if (ec)
    return ec;
  if (op_ec) {
    Logger::instance().log(LogLevel::WARN, "connect %s failed: %s",
                           host_id_.c_str(), op_ec.message().c_str());
    drop_connection();
    return make_error_code(errc::connection_failed);
  }
  sock_.set_option(tcp::no_delay(true), ec);
  connected_ = true;
  Logger::instance().log(LogLevel::INFO, "connected to host %s",
                         host_id_.c_str());
  return {};
}

std::error_code TcpHostSession::upload_sector(uint64_t file_id,
                                              uint64_t segment_index,
                                              uint16_t sector_index,
                                              const std::vector<uint8_t> &data,
                                              TaskManager &tm) {
  if (data.size() > kMaxPayload)
    return make_error_code(errc::oversized_request);
  std::lock_guard<std::mutex> lk(mtx_);
  if (!connected_) {
    std::error_code ec = connect(tm);
    if (ec)
      return ec;
  }

  std::vector<uint8_t> wire =
      serialize(make_sector_frame(file_id, segment_index, sector_index, data));
  auto deadline = std::chrono::steady_clock::now() + timeout_;

  bool done = false;
  std::error_code op_ec;
  asio::async_write(sock_, asio::buffer(wire),
                    [&](std::error_code e, std::size_t) {
                      op_ec = e;
                      done = true;
                    });
  std::error_code ec = run_op(done, tm, deadline);
  if (ec)
    return ec;
  if (op_ec) {
    Logger::instance().log(LogLevel::WARN, "write to %s failed: %s",
                           host_id_.c_str(), op_ec.message().c_str());
    drop_connection();
    return make_error_code(errc::connection_failed);
  }

  FrameHeader hdr;
  done = false;
  asio::async_read(sock_, asio::buffer(&hdr, sizeof(hdr)),
                   [&](std::error_code e, std::size_t) {
                     op_ec = e;
                     done = true;
                   });
  ec = run_op(done, tm, deadline);
  if (ec)
    return ec;
  if (op_ec) {
    Logger::instance().log(LogLevel::WARN, "read from %s failed: %s",
                           host_id_.c_str(), op_ec.message().c_str());
    drop_connection();
    return make_error_code(errc::connection_failed);
  }
  // Replies carry no payload, so anything else means the stream is lost.
  if (!header_valid(hdr) || hdr.payload_len != 0 || hdr.file_id != file_id ||
      hdr.segment_index != segment_index || hdr.sector_index != sector_index) {
    Logger::instance().log(LogLevel::WARN, "bad reply frame from %s",
                           host_id_.c_str());
    drop_connection();
    return make_error_code(errc::bad_frame);
  }

  if (hdr.flags & FF_ACK)
    return {};
  if (hdr.flags & FF_NACK) {
    NackReason reason = static_cast<NackReason>(hdr.status);
    if (reason == NackReason::NO_SPACE)
      full_ = true;
    Logger::instance().log(LogLevel::DEBUG, "host %s rejected sector: %u",
                           host_id_.c_str(), (unsigned)hdr.status);
    return make_error_code(errc::upload_rejected);
  }
  drop_connection();
  return make_error_code(errc::bad_frame);
}

} // namespace sectorcast
