#include "upload_segment.hpp"
#include <cstdio>

namespace sectorcast {

const char *segment_state_str(SegmentState s) {
  switch (s) {
  case SegmentState::Created:
    return "created";
  case SegmentState::RetrievingData:
    return "retrieving";
  case SegmentState::Encoding:
    return "encoding";
  case SegmentState::Encrypting:
    return "encrypting";
  case SegmentState::Dispatched:
    return "dispatched";
  case SegmentState::Completing:
    return "completing";
  case SegmentState::Stuck:
    return "stuck";
  case SegmentState::Released:
    return "released";
  }
  return "unknown";
}

UnfinishedSegment::UnfinishedSegment(SegmentId id,
                                     std::unique_ptr<FileHandle> file,
                                     uint64_t offset, uint64_t length,
                                     int min_sectors, int total_sectors,
                                     uint64_t sector_size)
    : id(id), file(std::move(file)), offset(offset), length(length),
      min_sectors(min_sectors), total_sectors(total_sectors),
      sector_size(sector_size), sector_encrypted(total_sectors, false),
      sector_slots(total_sectors, false) {}

bool UnfinishedSegment::upload_complete() const {
  if (sectors_completed == total_sectors && sectors_uploading == 0)
    return true;
  return workers_remaining == 0 && sectors_uploading == 0;
}

int UnfinishedSegment::slots_claimed() const {
  int n = 0;
  for (bool s : sector_slots)
    n += s ? 1 : 0;
  return n;
}

SegmentState UnfinishedSegment::state() const {
  std::lock_guard<std::mutex> lk(mu);
  return state_;
}

void UnfinishedSegment::set_state(SegmentState s) {
  std::lock_guard<std::mutex> lk(mu);
  state_ = s;
}

std::string UnfinishedSegment::describe() const {
  char buf[64];
  std::snprintf(buf, sizeof(buf), "%llu/%llu", (unsigned long long)id.fid,
                (unsigned long long)id.index);
  return buf;
}

bool repair_successful(int sectors_completed, int total_sectors,
                       double threshold) {
  return (1 - threshold) * (double)total_sectors <= (double)sectors_completed;
}

bool needs_download(int sectors_completed, int min_sectors, int total_sectors,
                    double threshold) {
  double redundant = (double)(total_sectors - min_sectors);
  int min_missing = (int)(redundant * threshold);
  return sectors_completed + min_missing < total_sectors;
}

} // namespace sectorcast
