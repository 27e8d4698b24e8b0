#include "sector_host.hpp"
#include "logging.hpp"
#include <cstdio>
#include <fstream>
#include <iterator>

namespace sectorcast {

bool HostConfig::validate(std::string &err) const {
  if (threads <= 0) {
    err = "threads must be positive";
    return false;
  }
  if (max_sector == 0 || max_sector > kMaxPayload) {
    err = "max sector size out of range";
    return false;
  }
  return true;
}

SectorHost::SectorHost(asio::io_context &io, const HostConfig &cfg)
    : io_(io), cfg_(cfg), acceptor_(io) {}

void SectorHost::start() {
  tcp::endpoint ep(asio::ip::make_address(cfg_.listen_host), cfg_.listen_port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen();
  Logger::instance().log(LogLevel::INFO, "sector host listening on %s:%u",
                         cfg_.listen_host.c_str(), (unsigned)port());
  do_accept();
}

void SectorHost::stop() {
  asio::post(io_, [this] {
    std::error_code ig;
    acceptor_.close(ig);
  });
}

uint16_t SectorHost::port() const {
  std::error_code ec;
  auto ep = acceptor_.local_endpoint(ec);
  return ec ? 0 : ep.port();
}

size_t SectorHost::stored_sectors() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return sectors_.size();
}

uint64_t SectorHost::stored_bytes() const {
  std::lock_guard<std::mutex> lk(mtx_);
  return used_;
}

bool SectorHost::sector(uint64_t file_id, uint64_t segment_index,
                        uint16_t sector_index,
                        std::vector<uint8_t> &out) const {
  Key k(file_id, segment_index, sector_index);
  {
    std::lock_guard<std::mutex> lk(mtx_);
    auto it = sectors_.find(k);
    if (it == sectors_.end())
      return false;
    if (cfg_.storage_dir.empty()) {
      out = it->second.data;
      return true;
    }
  }
  std::ifstream in(sector_path(k), std::ios::binary);
  if (!in)
    return false;
  out.assign(std::istreambuf_iterator<char>(in),
             std::istreambuf_iterator<char>());
  return true;
}

void SectorHost::do_accept() {
  auto c = std::make_shared<Conn>(io_);
  acceptor_.async_accept(c->sock, [this, c](std::error_code ec) {
    if (ec == asio::error::operation_aborted)
      return;
    if (!ec) {
      Logger::instance().log(LogLevel::DEBUG, "host accepted connection");
      read_header(c);
    } else {
      Logger::instance().log(LogLevel::WARN, "accept failed: %s",
                             ec.message().c_str());
    }
    do_accept();
  });
}

void SectorHost::read_header(std::shared_ptr<Conn> c) {
  asio::async_read(c->sock, asio::buffer(&c->hdr, sizeof(FrameHeader)),
                   [this, c](std::error_code ec, std::size_t) {
                     if (ec)
                       return;
                     if (!header_valid(c->hdr) || !(c->hdr.flags & FF_SECTOR)) {
                       // The stream cannot be resynchronised.
                       Logger::instance().log(LogLevel::WARN,
                                              "bad frame header, closing");
                       std::error_code ig;
                       c->sock.close(ig);
                       return;
                     }
                     read_payload(c);
                   });
}

void SectorHost::read_payload(std::shared_ptr<Conn> c) {
  c->payload.resize(c->hdr.payload_len);
  asio::async_read(c->sock, asio::buffer(c->payload),
                   [this, c](std::error_code ec, std::size_t) {
                     if (ec)
                       return;
                     handle_frame(c);
                     read_header(c);
                   });
}

void SectorHost::handle_frame(std::shared_ptr<Conn> c) {
  NackReason reason = NackReason::NONE;
  if (c->hdr.payload_len > cfg_.max_sector)
    reason = NackReason::TOO_LARGE;
  else if (!payload_valid(c->hdr, c->payload))
    reason = NackReason::BAD_CRC;
  else
    reason = store(c->hdr, std::move(c->payload));
  c->payload.clear();

  if (reason != NackReason::NONE)
    Logger::instance().log(LogLevel::DEBUG,
                           "rejecting sector %llu/%llu/%u: %u",
                           (unsigned long long)c->hdr.file_id,
                           (unsigned long long)c->hdr.segment_index,
                           (unsigned)c->hdr.sector_index, (unsigned)reason);
  send_via(c, make_reply_frame(c->hdr, reason == NackReason::NONE, reason));
}

std::string SectorHost::sector_path(const Key &k) const {
  char name[96];
  std::snprintf(name, sizeof(name), "/%llu-%llu-%u.sector",
                (unsigned long long)std::get<0>(k),
                (unsigned long long)std::get<1>(k), (unsigned)std::get<2>(k));
  return cfg_.storage_dir + name;
}

NackReason SectorHost::store(const FrameHeader &hdr,
                             std::vector<uint8_t> &&payload) {
  Key k(hdr.file_id, hdr.segment_index, hdr.sector_index);
  std::lock_guard<std::mutex> lk(mtx_);
  uint64_t old = 0;
  auto it = sectors_.find(k);
  if (it != sectors_.end())
    old = it->second.size;
  uint64_t size = payload.size();
  if (cfg_.capacity && used_ - old + size > cfg_.capacity)
    return NackReason::NO_SPACE;

  Stored rec;
  rec.size = size;
  if (cfg_.storage_dir.empty()) {
    rec.data = std::move(payload);
  } else {
    std::string path = sector_path(k);
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write((const char *)payload.data(), (std::streamsize)payload.size());
    if (!out) {
      Logger::instance().log(LogLevel::ERROR, "writing %s failed",
                             path.c_str());
      return NackReason::NO_SPACE;
    }
  }
  sectors_[k] = std::move(rec);
  used_ = used_ - old + size;
  return NackReason::NONE;
}

void SectorHost::do_write(std::shared_ptr<Conn> c) {
  if (c->write_q.empty())
    return;
  auto &front = c->write_q.front();
  asio::async_write(c->sock, asio::buffer(front),
                    [this, c](std::error_code ec, std::size_t) {
                      if (ec)
                        return;
                      c->write_q.pop_front();
                      if (!c->write_q.empty())
                        do_write(c);
                    });
}

void SectorHost::send_via(std::shared_ptr<Conn> c, Frame &&f) {
  c->write_q.emplace_back(serialize(f));
  if (c->write_q.size() == 1)
    do_write(c);
}

} // namespace sectorcast
