#include "protocol.hpp"
#include <array>
#include <cstring>

namespace sectorcast {

uint32_t crc32(const uint8_t *data, size_t len) {
  static const std::array<uint32_t, 256> table = [] {
    std::array<uint32_t, 256> t{};
    for (uint32_t i = 0; i < 256; i++) {
      uint32_t c = i;
      for (int j = 0; j < 8; j++)
        c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
      t[i] = c;
    }
    return t;
  }();
  uint32_t c = ~0u;
  for (size_t i = 0; i < len; i++)
    c = table[(c ^ data[i]) & 0xFF] ^ (c >> 8);
  return ~c;
}

void seal_header(FrameHeader &h) {
  h.header_crc32 = crc32((const uint8_t *)&h, sizeof(h) - 4);
}

bool header_valid(const FrameHeader &h) {
  if (h.magic != kMagic || h.version != kVersion)
    return false;
  if (h.payload_len > kMaxPayload)
    return false;
  return h.header_crc32 == crc32((const uint8_t *)&h, sizeof(h) - 4);
}

bool payload_valid(const FrameHeader &h, const std::vector<uint8_t> &payload) {
  if (payload.size() != h.payload_len)
    return false;
  return h.payload_crc32 == crc32(payload.data(), payload.size());
}

Frame make_sector_frame(uint64_t file_id, uint64_t segment_index,
                        uint16_t sector_index, std::vector<uint8_t> payload) {
  Frame f;
  FrameHeader &h = f.hdr;
  h.magic = kMagic;
  h.version = kVersion;
  h.flags = FF_SECTOR;
  h.file_id = file_id;
  h.segment_index = segment_index;
  h.sector_index = sector_index;
  h.payload_len = (uint32_t)payload.size();
  h.payload_crc32 = crc32(payload.data(), payload.size());
  seal_header(h);
  f.payload = std::move(payload);
  return f;
}

Frame make_reply_frame(const FrameHeader &req, bool ok, NackReason reason) {
  Frame f;
  FrameHeader &h = f.hdr;
  h.magic = kMagic;
  h.version = kVersion;
  h.flags = ok ? FF_ACK : FF_NACK;
  h.file_id = req.file_id;
  h.segment_index = req.segment_index;
  h.sector_index = req.sector_index;
  h.status = static_cast<uint16_t>(reason);
  h.payload_len = 0;
  h.payload_crc32 = crc32(nullptr, 0);
  seal_header(h);
  return f;
}

std::vector<uint8_t> serialize(const Frame &f) {
  std::vector<uint8_t> buf(sizeof(FrameHeader) + f.payload.size());
  std::memcpy(buf.data(), &f.hdr, sizeof(FrameHeader));
  if (!f.payload.empty())
    std::memcpy(buf.data() + sizeof(FrameHeader), f.payload.data(),
                f.payload.size());
  return buf;
}

} // namespace sectorcast
