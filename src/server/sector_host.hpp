#pragma once
#include <asio.hpp>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <vector>
#include "protocol.hpp"

namespace sectorcast {

struct HostConfig {
    std::string listen_host{"0.0.0.0"};
    uint16_t listen_port{46080};
    int threads{4};
    uint64_t capacity{0};       // bytes, 0 for unlimited
    uint32_t max_sector{kMaxPayload};
    std::string storage_dir;    // sectors are kept in memory when empty

    bool validate(std::string& err) const;
};

// Accepts sector frames and stores each payload under its
// (file, segment, sector) key, answering every frame with an ACK or NACK.
class SectorHost {
public:
    using tcp = asio::ip::tcp;
    using Key = std::tuple<uint64_t, uint64_t, uint16_t>;

    struct Conn : public std::enable_shared_from_this<Conn> {
        tcp::socket sock;
        FrameHeader hdr{};
        std::vector<uint8_t> payload;
        std::deque<std::vector<uint8_t>> write_q;
        Conn(asio::io_context& io) : sock(asio::make_strand(io)) {}
    };

    SectorHost(asio::io_context& io, const HostConfig& cfg);
    // Binds and starts accepting. Throws std::system_error if the listen
    // address cannot be bound.
    void start();
    void stop();
    uint16_t port() const;

    size_t stored_sectors() const;
    uint64_t stored_bytes() const;
    bool sector(uint64_t file_id, uint64_t segment_index, uint16_t sector_index,
                std::vector<uint8_t>& out) const;

private:
    void do_accept();
    void read_header(std::shared_ptr<Conn> c);
    void read_payload(std::shared_ptr<Conn> c);
    void handle_frame(std::shared_ptr<Conn> c);
    void do_write(std::shared_ptr<Conn> c);
    void send_via(std::shared_ptr<Conn> c, Frame&& f);
    NackReason store(const FrameHeader& hdr, std::vector<uint8_t>&& payload);
    std::string sector_path(const Key& k) const;

    asio::io_context& io_;
    HostConfig cfg_;
    tcp::acceptor acceptor_;

    struct Stored {
        uint64_t size{0};
        std::vector<uint8_t> data; // empty when kept on disk
    };

    mutable std::mutex mtx_;
    std::map<Key, Stored> sectors_;
    uint64_t used_{0};
};

} // namespace sectorcast
