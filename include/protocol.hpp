#pragma once
#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace sectorcast {

constexpr uint32_t kMagic = 0x53435354; // 'SCST'
constexpr uint8_t  kVersion = 1;
constexpr uint32_t kMaxPayload = 8u << 20;

enum FrameFlags : uint8_t {
    FF_SECTOR = 0x01,
    FF_ACK    = 0x02,
    FF_NACK   = 0x04
};

enum class NackReason : uint16_t {
    NONE = 0,
    BAD_CRC = 1,
    NO_SPACE = 2,
    TOO_LARGE = 3
};

#pragma pack(push, 1)
struct FrameHeader {
    uint32_t magic;
    uint8_t  version;
    uint8_t  flags;
    uint16_t reserved;
    uint64_t file_id;
    uint64_t segment_index;
    uint16_t sector_index;
    uint16_t status;
    uint32_t payload_len;
    uint32_t payload_crc32;
    uint32_t header_crc32;
};
#pragma pack(pop)
static_assert(sizeof(FrameHeader) == 40, "FrameHeader must be 40 bytes");

struct Frame {
    FrameHeader hdr{};
    std::vector<uint8_t> payload;
};

uint32_t crc32(const uint8_t* data, size_t len);

Frame make_sector_frame(uint64_t file_id, uint64_t segment_index,
                        uint16_t sector_index, std::vector<uint8_t> payload);
Frame make_reply_frame(const FrameHeader& req, bool ok, NackReason reason);

// Fills in the header CRC. Must be the last change to the header.
void seal_header(FrameHeader& h);
bool header_valid(const FrameHeader& h);
bool payload_valid(const FrameHeader& h, const std::vector<uint8_t>& payload);

std::vector<uint8_t> serialize(const Frame& f);

} // namespace sectorcast
